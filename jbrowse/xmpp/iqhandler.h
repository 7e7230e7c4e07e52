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

#ifndef JBROWSE_XMPP_IQHANDLER_H_
#define JBROWSE_XMPP_IQHANDLER_H_

#include <string>
#include <vector>

#include "jbrowse/xmllite/qname.h"

namespace jbrowse {

class XmlElement;

// Answers iq stanzas whose payload is a single query element. Handlers are
// registered with an IqRouter under the QName of that element.
class IqHandler {
 public:
  virtual ~IqHandler() {}

  // The payload QName this handler is registered under.
  virtual QName GetQueryName() const = 0;

  // Returns the reply stanza, owned by the caller, or NULL if no reply
  // should be sent.
  virtual XmlElement* HandleIq(const XmlElement* iq) = 0;

  // Namespaces the handler advertises through feature discovery.
  virtual void GetFeatures(std::vector<std::string>* features) const = 0;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_IQHANDLER_H_
