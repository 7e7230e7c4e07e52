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

#include "jbrowse/xmpp/browsetreebuilder.h"

#include <string>
#include <vector>

#include "jbrowse/base/logging.h"
#include "jbrowse/base/stringutils.h"
#include "jbrowse/xmpp/discogateway.h"
#include "jbrowse/xmpp/identityresolver.h"
#include "jbrowse/xmpp/jid.h"

using jbrowse_base::Maybe;

namespace jbrowse {

BrowseTreeBuilder::BrowseTreeBuilder(DiscoGateway* gateway,
                                     const IdentityResolver* resolver)
    : gateway_(gateway),
      resolver_(resolver) {
}

BrowseTreeBuilder::~BrowseTreeBuilder() {
}

BrowseResult BrowseTreeBuilder::ResolveEntity(const Jid& jid,
                                              const Jid& requester,
                                              bool concat_identities) {
  BrowseResult result(jid);

  DiscoInfo info;
  if (gateway_->QueryInfo(jid, requester, &info)) {
    Maybe<std::string> category =
        resolver_->ResolveCategory(info.identities, concat_identities);
    result.set_type(
        resolver_->ResolveType(category, info.identities, concat_identities));
    result.set_category(category);
    result.set_name(IdentityResolver::ResolveName(info.identities));
    result.set_namespaces(IdentityResolver::ResolveNamespaces(info.features));
  } else {
    LOG(LS_VERBOSE) << "No disco#info for " << jid.Str();
  }

  std::string version;
  if (gateway_->QueryVersion(jid, requester, &version)) {
    version = jbrowse_base::string_trim(version);
    if (!version.empty())
      result.set_version(Maybe<std::string>(version));
  }

  return result;
}

BrowseResult BrowseTreeBuilder::Browse(const Jid& target,
                                       const Jid& requester,
                                       bool concat_identities) {
  LOG(LS_VERBOSE) << "Browse Jabber entity " << target.Str() << " for "
                  << requester.Str();

  BrowseResult root = ResolveEntity(target, requester, concat_identities);

  std::vector<DiscoItem> items;
  if (!gateway_->QueryItems(target, requester, &items)) {
    LOG(LS_VERBOSE) << "No disco#items for " << target.Str();
    return root;
  }

  std::vector<DiscoItem>::const_iterator it;
  for (it = items.begin(); it != items.end(); ++it) {
    Jid child_jid(it->jid);
    if (!child_jid.IsValid()) {
      LOG(LS_VERBOSE) << "Ignoring disco item of " << target.Str()
                      << " with invalid jid '" << it->jid << "'";
      continue;
    }
    root.AddChild(ResolveEntity(child_jid, requester, concat_identities));
  }

  return root;
}

}  // namespace jbrowse
