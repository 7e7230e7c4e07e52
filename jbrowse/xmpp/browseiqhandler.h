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

// Answers XEP-0011 browse requests, such as the following example:
//
//      <iq type='get'
//          from='romeo@montague.net/orchard'
//          to='montague.net'
//          id='browse1'>
//          <query xmlns='jabber:iq:browse'/>
//      </iq>
//
// Sample response:
//
//      <iq type='result'
//          from='montague.net'
//          to='romeo@montague.net/orchard'
//          id='browse1'>
//          <query xmlns='jabber:iq:browse' jid='montague.net'
//                 category='service' type='jabber' name='Montague'>
//              <ns>jabber:iq:version</ns>
//              <item jid='conference.montague.net' category='conference'
//                    type='x-text' name='Chatrooms'>
//                  <ns>http://jabber.org/protocol/muc</ns>
//              </item>
//          </query>
//      </iq>

#ifndef JBROWSE_XMPP_BROWSEIQHANDLER_H_
#define JBROWSE_XMPP_BROWSEIQHANDLER_H_

#include <string>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmpp/browseresult.h"
#include "jbrowse/xmpp/browsetreebuilder.h"
#include "jbrowse/xmpp/identityresolver.h"
#include "jbrowse/xmpp/iqhandler.h"

namespace jbrowse_base {
class OptionsFile;
}

namespace jbrowse {

class DiscoGateway;

class BrowseIqHandler : public IqHandler {
 public:
  // |options| holds the plugin properties and may be NULL, in which case
  // the defaults apply. |gateway| and |options| must outlive the handler.
  BrowseIqHandler(DiscoGateway* gateway,
                  const jbrowse_base::OptionsFile* options);
  virtual ~BrowseIqHandler();

  // IqHandler implementation. Results and errors are ignored, a set is
  // refused with feature-not-implemented and a get is answered with the
  // browse tree of its recipient. A get with no 'to' browses the sender's
  // server.
  virtual QName GetQueryName() const;
  virtual XmlElement* HandleIq(const XmlElement* iq);
  virtual void GetFeatures(std::vector<std::string>* features) const;

  // Browses |target| for |requester| with the current plugin properties.
  BrowseResult Browse(const Jid& target, const Jid& requester);

 private:
  const jbrowse_base::OptionsFile* options_;
  IdentityResolver resolver_;
  BrowseTreeBuilder builder_;

  DISALLOW_COPY_AND_ASSIGN(BrowseIqHandler);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_BROWSEIQHANDLER_H_
