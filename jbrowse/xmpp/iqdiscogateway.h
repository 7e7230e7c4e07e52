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

// Realizes DiscoGateway as synchronous iq round trips through the host's
// router, such as:
//
//      <iq type='get'
//          from='romeo@montague.net/orchard'
//          to='conference.montague.net'
//          id='jbrowse_1'>
//          <query xmlns='http://jabber.org/protocol/disco#info'/>
//      </iq>
//
// Sample response:
//
//      <iq type='result'
//          from='conference.montague.net'
//          to='romeo@montague.net/orchard'
//          id='jbrowse_1'>
//          <query xmlns='http://jabber.org/protocol/disco#info'>
//              <identity category='conference' type='text' name='Chatrooms'/>
//              <feature var='http://jabber.org/protocol/muc'/>
//          </query>
//      </iq>

#ifndef JBROWSE_XMPP_IQDISCOGATEWAY_H_
#define JBROWSE_XMPP_IQDISCOGATEWAY_H_

#include <string>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmpp/discogateway.h"

namespace jbrowse {

class IqRouter;
class QName;
class XmlElement;

class IqDiscoGateway : public DiscoGateway {
 public:
  // |router| must outlive the gateway.
  explicit IqDiscoGateway(IqRouter* router);
  virtual ~IqDiscoGateway();

  // DiscoGateway implementation.
  virtual bool QueryInfo(const Jid& target,
                         const Jid& requester,
                         DiscoInfo* info);
  virtual bool QueryItems(const Jid& target,
                          const Jid& requester,
                          std::vector<DiscoItem>* items);
  virtual bool QueryVersion(const Jid& target,
                            const Jid& requester,
                            std::string* version);

 private:
  // Sends an empty |query_name| get to |target| and returns the reply, or
  // NULL unless it is a result whose payload is a |query_name| element.
  XmlElement* SendQuery(const Jid& target,
                        const Jid& requester,
                        const QName& query_name);
  // Unique across threads browsing through the same gateway.
  std::string NextId();

  static bool ParseItem(const XmlElement* element, DiscoItem* item);

  IqRouter* router_;
  volatile int next_id_;

  DISALLOW_COPY_AND_ASSIGN(IqDiscoGateway);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_IQDISCOGATEWAY_H_
