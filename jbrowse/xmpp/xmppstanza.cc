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

#include "jbrowse/xmpp/xmppstanza.h"

#include "jbrowse/base/checks.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"

namespace jbrowse {

namespace {

XmlElement* MakeReply(const XmlElement* request, const std::string& type) {
  XmlElement* reply = new XmlElement(QN_IQ, true);
  reply->AddAttr(QN_TYPE, type);
  if (request->HasAttr(QN_FROM))
    reply->AddAttr(QN_TO, request->Attr(QN_FROM));
  if (request->HasAttr(QN_TO))
    reply->AddAttr(QN_FROM, request->Attr(QN_TO));
  if (request->HasAttr(QN_ID))
    reply->AddAttr(QN_ID, request->Attr(QN_ID));
  return reply;
}

}  // namespace

XmlElement* MakeIq(const std::string& type,
                   const Jid& to,
                   const Jid& from,
                   const std::string& id) {
  XmlElement* iq = new XmlElement(QN_IQ, true);
  iq->AddAttr(QN_TYPE, type);
  if (to.IsValid())
    iq->AddAttr(QN_TO, to.Str());
  if (from.IsValid())
    iq->AddAttr(QN_FROM, from.Str());
  if (!id.empty())
    iq->AddAttr(QN_ID, id);
  return iq;
}

XmlElement* MakeIqResult(const XmlElement* request) {
  return MakeReply(request, STR_RESULT);
}

XmlElement* MakeIqError(const XmlElement* request, XmppStanzaError error) {
  XmlElement* reply = MakeReply(request, STR_ERROR);

  const XmlElement* payload = request->FirstElement();
  if (payload != NULL)
    reply->AddElement(new XmlElement(*payload));

  XmlElement* error_element = new XmlElement(QN_ERROR);
  error_element->AddAttr(QN_TYPE, StanzaErrorType(error));
  error_element->AddElement(
      new XmlElement(QName(NS_STANZA, StanzaErrorCondition(error)), true));
  reply->AddElement(error_element);
  return reply;
}

const char* StanzaErrorCondition(XmppStanzaError error) {
  switch (error) {
    case XSE_BAD_REQUEST:
      return QN_STANZA_BAD_REQUEST.local;
    case XSE_FEATURE_NOT_IMPLEMENTED:
      return QN_STANZA_FEATURE_NOT_IMPLEMENTED.local;
    case XSE_ITEM_NOT_FOUND:
      return QN_STANZA_ITEM_NOT_FOUND.local;
    case XSE_JID_MALFORMED:
      return QN_STANZA_JID_MALFORMED.local;
    case XSE_SERVICE_UNAVAILABLE:
      return QN_STANZA_SERVICE_UNAVAILABLE.local;
    case XSE_INTERNAL_SERVER_ERROR:
      return QN_STANZA_INTERNAL_SERVER_ERROR.local;
  }
  FATAL_ERROR("Unknown stanza error");
  return NULL;
}

const char* StanzaErrorType(XmppStanzaError error) {
  switch (error) {
    case XSE_BAD_REQUEST:
    case XSE_JID_MALFORMED:
      return STR_MODIFY;
    case XSE_FEATURE_NOT_IMPLEMENTED:
    case XSE_ITEM_NOT_FOUND:
    case XSE_SERVICE_UNAVAILABLE:
    case XSE_INTERNAL_SERVER_ERROR:
      return STR_CANCEL;
  }
  FATAL_ERROR("Unknown stanza error");
  return NULL;
}

}  // namespace jbrowse
