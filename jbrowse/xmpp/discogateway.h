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

#ifndef JBROWSE_XMPP_DISCOGATEWAY_H_
#define JBROWSE_XMPP_DISCOGATEWAY_H_

#include <string>
#include <vector>

namespace jbrowse {

class Jid;

// One <identity/> of a disco#info reply. Attributes are kept as received.
struct DiscoIdentity {
  DiscoIdentity() {}
  DiscoIdentity(const std::string& category,
                const std::string& type,
                const std::string& name)
      : category(category), type(type), name(name) {}

  std::string category;
  std::string type;
  std::string name;
};

struct DiscoInfo {
  std::vector<DiscoIdentity> identities;
  // The var of every <feature/>.
  std::vector<std::string> features;
};

struct DiscoItem {
  std::string jid;
  std::string node;
  std::string name;
};

// Queries the host's service discovery and version handlers on behalf of a
// requester. Every query returns false on an error reply, a timeout or a
// payload of the wrong shape; the out-parameter is then left untouched.
class DiscoGateway {
 public:
  virtual ~DiscoGateway() {}

  virtual bool QueryInfo(const Jid& target,
                         const Jid& requester,
                         DiscoInfo* info) = 0;
  virtual bool QueryItems(const Jid& target,
                          const Jid& requester,
                          std::vector<DiscoItem>* items) = 0;
  // Also false when the reply carries no <version/> element.
  virtual bool QueryVersion(const Jid& target,
                            const Jid& requester,
                            std::string* version) = 0;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_DISCOGATEWAY_H_
