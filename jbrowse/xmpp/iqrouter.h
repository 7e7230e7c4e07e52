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

#ifndef JBROWSE_XMPP_IQROUTER_H_
#define JBROWSE_XMPP_IQROUTER_H_

#include <map>
#include <string>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/qname.h"

namespace jbrowse {

class IqHandler;
class XmlElement;

// Hands iq stanzas to the handler registered for their payload. The router
// does not own its handlers; a handler must be removed before it is
// destroyed.
class IqRouter {
 public:
  IqRouter();
  ~IqRouter();

  // Fails if another handler already serves the same payload.
  bool AddHandler(IqHandler* handler);
  bool RemoveHandler(IqHandler* handler);
  bool HasHandler(const QName& query_name) const;

  // Returns the reply to |iq|, owned by the caller, or NULL when nothing is
  // sent back. Responses are never answered. A get or set with no handler
  // gets service-unavailable; an iq of unknown type gets bad-request.
  XmlElement* Route(const XmlElement* iq);

  // Sorted, de-duplicated union of every handler's features.
  std::vector<std::string> GetFeatures() const;

 private:
  typedef std::map<QName, IqHandler*> HandlerMap;

  HandlerMap handlers_;

  DISALLOW_COPY_AND_ASSIGN(IqRouter);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_IQROUTER_H_
