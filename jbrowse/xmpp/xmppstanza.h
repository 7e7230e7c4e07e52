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

#ifndef JBROWSE_XMPP_XMPPSTANZA_H_
#define JBROWSE_XMPP_XMPPSTANZA_H_

#include <string>

#include "jbrowse/xmpp/jid.h"

namespace jbrowse {

class XmlElement;

// Defined conditions of RFC 6120 section 8.3.3 that the component emits.
enum XmppStanzaError {
  XSE_BAD_REQUEST,
  XSE_FEATURE_NOT_IMPLEMENTED,
  XSE_ITEM_NOT_FOUND,
  XSE_JID_MALFORMED,
  XSE_SERVICE_UNAVAILABLE,
  XSE_INTERNAL_SERVER_ERROR,
};

// Builds an empty iq stanza. Empty or invalid |to| and |from| and an empty
// |id| are left off. The caller owns the result.
XmlElement* MakeIq(const std::string& type,
                   const Jid& to,
                   const Jid& from,
                   const std::string& id);

// Result iq answering |request|: addressed back to its sender, from its
// recipient, with the same id. The caller owns the result.
XmlElement* MakeIqResult(const XmlElement* request);

// Error iq answering |request|. The request's payload is echoed back ahead
// of the error element. The caller owns the result.
XmlElement* MakeIqError(const XmlElement* request, XmppStanzaError error);

// The condition element name and error type for |error|.
const char* StanzaErrorCondition(XmppStanzaError error);
const char* StanzaErrorType(XmppStanzaError error);

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_XMPPSTANZA_H_
