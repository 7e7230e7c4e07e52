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

// A fake IqHandler for use in unit tests. It stands in for the host's
// disco#info, disco#items and version handlers.

#ifndef JBROWSE_XMPP_FAKEIQHANDLER_H_
#define JBROWSE_XMPP_FAKEIQHANDLER_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/iqhandler.h"
#include "jbrowse/xmpp/xmppstanza.h"

namespace jbrowse {

class FakeIqHandler : public IqHandler {
 public:
  explicit FakeIqHandler(const QName& query_name)
      : query_name_(query_name) {}

  virtual ~FakeIqHandler() {
    for (std::vector<XmlElement*>::iterator it = received_.begin();
         it != received_.end(); ++it) {
      delete *it;
    }
  }

  // As IqHandler. Targets without a configured reply get item-not-found.
  virtual QName GetQueryName() const {
    return query_name_;
  }

  // Safe to call from several threads once the replies are configured.
  virtual XmlElement* HandleIq(const XmlElement* iq) {
    std::lock_guard<std::mutex> lock(lock_);
    received_.push_back(new XmlElement(*iq));
    const std::string to = iq->Attr(QN_TO);

    std::map<std::string, XmppStanzaError>::const_iterator error =
        errors_.find(to);
    if (error != errors_.end())
      return MakeIqError(iq, error->second);

    std::map<std::string, std::string>::const_iterator payload =
        payloads_.find(to);
    if (payload == payloads_.end())
      return MakeIqError(iq, XSE_ITEM_NOT_FOUND);

    XmlElement* reply = MakeIqResult(iq);
    if (!payload->second.empty())
      reply->AddElement(XmlElement::ForStr(payload->second));
    return reply;
  }

  virtual void GetFeatures(std::vector<std::string>* features) const {
    features->push_back(query_name_.Namespace());
  }

  // |payload| is the XML placed in the result, or empty for none.
  void SetReply(const std::string& to, const std::string& payload) {
    payloads_[to] = payload;
  }

  void SetError(const std::string& to, XmppStanzaError error) {
    errors_[to] = error;
  }

  const std::vector<XmlElement*>& received() const { return received_; }

 private:
  QName query_name_;
  std::map<std::string, std::string> payloads_;
  std::map<std::string, XmppStanzaError> errors_;
  std::vector<XmlElement*> received_;
  std::mutex lock_;

  DISALLOW_COPY_AND_ASSIGN(FakeIqHandler);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_FAKEIQHANDLER_H_
