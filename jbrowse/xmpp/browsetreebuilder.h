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

#ifndef JBROWSE_XMPP_BROWSETREEBUILDER_H_
#define JBROWSE_XMPP_BROWSETREEBUILDER_H_

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmpp/browseresult.h"

namespace jbrowse {

class DiscoGateway;
class IdentityResolver;
class Jid;

// Builds the two-level browse tree of an entity from service discovery.
// Every query is made on behalf of the requester so the discovery handlers
// can apply their own access rules. A failed query only leaves the fields it
// would have filled empty; it never fails the browse.
class BrowseTreeBuilder {
 public:
  // |gateway| and |resolver| must outlive the builder.
  BrowseTreeBuilder(DiscoGateway* gateway, const IdentityResolver* resolver);
  ~BrowseTreeBuilder();

  // Describes |jid| from its disco#info and version replies. The result has
  // no children.
  BrowseResult ResolveEntity(const Jid& jid,
                             const Jid& requester,
                             bool concat_identities);

  // Describes |target| and each of its disco#items. Items whose address is
  // not a valid jid are skipped. Items are not browsed any further.
  BrowseResult Browse(const Jid& target,
                      const Jid& requester,
                      bool concat_identities);

 private:
  DiscoGateway* gateway_;
  const IdentityResolver* resolver_;

  DISALLOW_COPY_AND_ASSIGN(BrowseTreeBuilder);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_BROWSETREEBUILDER_H_
