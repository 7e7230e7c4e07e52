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

#include "jbrowse/xmpp/browseiqhandler.h"

#include "jbrowse/base/logging.h"
#include "jbrowse/base/optionsfile.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/browsesettings.h"
#include "jbrowse/xmpp/browsevocabulary.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/jid.h"
#include "jbrowse/xmpp/xmppstanza.h"

namespace jbrowse {

BrowseIqHandler::BrowseIqHandler(DiscoGateway* gateway,
                                 const jbrowse_base::OptionsFile* options)
    : options_(options),
      resolver_(BrowseVocabulary::Default()),
      builder_(gateway, &resolver_) {
}

BrowseIqHandler::~BrowseIqHandler() {
}

QName BrowseIqHandler::GetQueryName() const {
  return QN_BROWSE_QUERY;
}

void BrowseIqHandler::GetFeatures(std::vector<std::string>* features) const {
  features->push_back(NS_BROWSE);
}

XmlElement* BrowseIqHandler::HandleIq(const XmlElement* iq) {
  const std::string type = iq->Attr(QN_TYPE);
  const std::string from = iq->Attr(QN_FROM);
  LOG(LS_VERBOSE) << "Processing Jabber Browsing request from " << from;

  if (type == STR_RESULT || type == STR_ERROR) {
    LOG(LS_VERBOSE) << "Silently ignoring iq " << type << " from " << from;
    return NULL;
  }

  if (type == STR_SET) {
    LOG(LS_INFO) << "Returning error to " << from
                 << ": request is of incorrect iq type";
    return MakeIqError(iq, XSE_FEATURE_NOT_IMPLEMENTED);
  }

  if (type != STR_GET) {
    LOG(LS_INFO) << "Returning error to " << from
                 << ": unknown iq type '" << type << "'";
    return MakeIqError(iq, XSE_BAD_REQUEST);
  }

  // A get without a 'to' is addressed to the sender's own server.
  Jid target;
  if (iq->HasAttr(QN_TO)) {
    target = Jid(iq->Attr(QN_TO));
  } else {
    target = Jid(std::string(), Jid(from).domain(), std::string());
    LOG(LS_VERBOSE) << "No addressee from " << from << ", browsing '"
                    << target.Str() << "'";
  }
  if (!target.IsValid()) {
    LOG(LS_INFO) << "Returning error to " << from << ": cannot browse '"
                 << iq->Attr(QN_TO) << "'";
    return MakeIqError(iq, XSE_JID_MALFORMED);
  }

  BrowseResult result = Browse(target, Jid(from));
  XmlElement* reply = MakeIqResult(iq);
  reply->AddElement(result.ToElement());
  return reply;
}

BrowseResult BrowseIqHandler::Browse(const Jid& target, const Jid& requester) {
  BrowseSettings settings;
  if (options_ != NULL)
    settings.Load(*options_);
  return builder_.Browse(target, requester, settings.concat_identities());
}

}  // namespace jbrowse
