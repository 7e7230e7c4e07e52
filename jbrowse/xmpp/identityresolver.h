/*
 * libjingle
 * Copyright 2004--2005, Google Inc.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  1. Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *  2. Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *  3. The name of the author may not be used to endorse or promote products
 *     derived from this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE AUTHOR ``AS IS'' AND ANY EXPRESS OR IMPLIED
 * WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO
 * EVENT SHALL THE AUTHOR BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef JBROWSE_XMPP_IDENTITYRESOLVER_H_
#define JBROWSE_XMPP_IDENTITYRESOLVER_H_

#include <set>
#include <string>
#include <vector>

#include "jbrowse/base/maybe.h"
#include "jbrowse/xmpp/discogateway.h"

namespace jbrowse {

class BrowseVocabulary;

// Maps the identities and features of a disco#info reply onto the browse
// category, type, name and namespaces of XEP-0011.
//
// Attribute values are trimmed and blank ones ignored. When several distinct
// values survive they are joined in lexical order. With |concat| false only
// the leading identities are considered; see ResolveCategory and
// ResolveType for where each scan stops.
class IdentityResolver {
 public:
  // |vocabulary| must outlive the resolver.
  explicit IdentityResolver(const BrowseVocabulary& vocabulary);

  // Scans identities until one with a category has been seen (all of them
  // when |concat| is set), collecting categories and types. A single
  // category is mapped through the vocabulary:
  //   gateway                    -> service
  //   server, types {im}         -> service
  //   collaboration, {whiteboard} -> application
  //   known category             -> itself
  //   anything else              -> "x-" + category
  // Several categories give "x-" followed by them joined with "_and_".
  jbrowse_base::Maybe<std::string> ResolveCategory(
      const std::vector<DiscoIdentity>& identities, bool concat) const;

  // Scans identities on its own, stopping after the first one with a type
  // unless |concat| is set. A category starting with "x-" passes the types
  // through joined with "_and_", possibly empty. Otherwise a single type is
  // kept when the vocabulary allows it for |category| ("im" under service
  // becomes "jabber") and prefixed with "x-" when not; several types give
  // "x-" followed by them joined with "_and_". An absent category gives an
  // absent type.
  jbrowse_base::Maybe<std::string> ResolveType(
      const jbrowse_base::Maybe<std::string>& category,
      const std::vector<DiscoIdentity>& identities,
      bool concat) const;

  // Every distinct name, joined with ", ".
  static jbrowse_base::Maybe<std::string> ResolveName(
      const std::vector<DiscoIdentity>& identities);

  static std::set<std::string> ResolveNamespaces(
      const std::vector<std::string>& features);

 private:
  const BrowseVocabulary& vocabulary_;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_IDENTITYRESOLVER_H_
