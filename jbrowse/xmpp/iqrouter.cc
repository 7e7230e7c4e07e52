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

#include "jbrowse/xmpp/iqrouter.h"

#include <set>

#include "jbrowse/base/logging.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/iqhandler.h"
#include "jbrowse/xmpp/xmppstanza.h"

namespace jbrowse {

IqRouter::IqRouter() {
}

IqRouter::~IqRouter() {
  if (!handlers_.empty()) {
    LOG(LS_WARNING) << "IqRouter destroyed with " << handlers_.size()
                    << " handler(s) still registered";
  }
}

bool IqRouter::AddHandler(IqHandler* handler) {
  QName query_name = handler->GetQueryName();
  if (handlers_.count(query_name) != 0) {
    LOG(LS_WARNING) << "Handler for " << query_name
                    << " already registered";
    return false;
  }
  handlers_[query_name] = handler;
  LOG(LS_INFO) << "Registered iq handler for " << query_name;
  return true;
}

bool IqRouter::RemoveHandler(IqHandler* handler) {
  HandlerMap::iterator it = handlers_.find(handler->GetQueryName());
  if (it == handlers_.end() || it->second != handler)
    return false;
  LOG(LS_INFO) << "Removed iq handler for " << it->first;
  handlers_.erase(it);
  return true;
}

bool IqRouter::HasHandler(const QName& query_name) const {
  return handlers_.count(query_name) != 0;
}

XmlElement* IqRouter::Route(const XmlElement* iq) {
  LOG(LS_SENSITIVE) << "Routing " << iq->Str();
  if (iq->Name() != QN_IQ) {
    LOG(LS_WARNING) << "Not an iq stanza: " << iq->Name();
    return NULL;
  }

  const std::string type = iq->Attr(QN_TYPE);
  if (type == STR_RESULT || type == STR_ERROR) {
    LOG(LS_VERBOSE) << "Discarding iq " << type << " from "
                    << iq->Attr(QN_FROM);
    return NULL;
  }
  if (type != STR_GET && type != STR_SET) {
    LOG(LS_INFO) << "Rejecting iq of unknown type '" << type << "' from "
                 << iq->Attr(QN_FROM);
    return MakeIqError(iq, XSE_BAD_REQUEST);
  }

  const XmlElement* query = iq->FirstElement();
  if (query == NULL) {
    LOG(LS_INFO) << "Rejecting iq " << type << " without payload from "
                 << iq->Attr(QN_FROM);
    return MakeIqError(iq, XSE_BAD_REQUEST);
  }

  HandlerMap::iterator it = handlers_.find(query->Name());
  if (it == handlers_.end()) {
    LOG(LS_VERBOSE) << "No handler for " << query->Name();
    return MakeIqError(iq, XSE_SERVICE_UNAVAILABLE);
  }
  return it->second->HandleIq(iq);
}

std::vector<std::string> IqRouter::GetFeatures() const {
  std::set<std::string> features;
  for (HandlerMap::const_iterator it = handlers_.begin();
       it != handlers_.end(); ++it) {
    std::vector<std::string> handler_features;
    it->second->GetFeatures(&handler_features);
    features.insert(handler_features.begin(), handler_features.end());
  }
  return std::vector<std::string>(features.begin(), features.end());
}

}  // namespace jbrowse
