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

#include "jbrowse/xmpp/iqdiscogateway.h"

#include <memory>
#include <sstream>

#include "jbrowse/base/atomicops.h"
#include "jbrowse/base/logging.h"
#include "jbrowse/base/stringutils.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/iqrouter.h"
#include "jbrowse/xmpp/jid.h"
#include "jbrowse/xmpp/xmppstanza.h"

namespace jbrowse {

namespace {

const char kIdPrefix[] = "jbrowse_";

}  // namespace

IqDiscoGateway::IqDiscoGateway(IqRouter* router)
    : router_(router),
      next_id_(0) {
}

IqDiscoGateway::~IqDiscoGateway() {
}

std::string IqDiscoGateway::NextId() {
  std::ostringstream ss;
  ss << kIdPrefix << jbrowse_base::AtomicOps::Increment(&next_id_);
  return ss.str();
}

XmlElement* IqDiscoGateway::SendQuery(const Jid& target,
                                      const Jid& requester,
                                      const QName& query_name) {
  std::unique_ptr<XmlElement> request(
      MakeIq(STR_GET, target, requester, NextId()));
  request->AddElement(new XmlElement(query_name, true));

  std::unique_ptr<XmlElement> response(router_->Route(request.get()));
  if (!response) {
    LOG(LS_WARNING) << "No reply to " << query_name.Namespace()
                    << " query on " << target.Str();
    return NULL;
  }
  if (response->Attr(QN_TYPE) != STR_RESULT) {
    LOG(LS_VERBOSE) << query_name.Namespace() << " query on " << target.Str()
                    << " returned " << response->Attr(QN_TYPE);
    return NULL;
  }
  if (response->FirstElementName() != query_name) {
    LOG(LS_WARNING) << "Unexpected payload "
                    << response->FirstElementName() << " in "
                    << query_name.Namespace() << " reply from "
                    << target.Str();
    return NULL;
  }
  return response.release();
}

bool IqDiscoGateway::QueryInfo(const Jid& target,
                               const Jid& requester,
                               DiscoInfo* info) {
  LOG(LS_VERBOSE) << "Perform disco#info request on " << target.Str()
                  << " on behalf of " << requester.Str();

  std::unique_ptr<XmlElement> response(
      SendQuery(target, requester, QN_DISCO_INFO_QUERY));
  if (!response)
    return false;

  const XmlElement* query = response->FirstNamed(QN_DISCO_INFO_QUERY);
  DiscoInfo result;
  for (const XmlElement* child = query->FirstNamed(QN_DISCO_IDENTITY); child;
       child = child->NextNamed(QN_DISCO_IDENTITY)) {
    result.identities.push_back(DiscoIdentity(child->Attr(QN_CATEGORY),
                                              child->Attr(QN_TYPE),
                                              child->Attr(QN_NAME)));
  }
  for (const XmlElement* child = query->FirstNamed(QN_DISCO_FEATURE); child;
       child = child->NextNamed(QN_DISCO_FEATURE)) {
    result.features.push_back(child->Attr(QN_VAR));
  }

  *info = result;
  return true;
}

bool IqDiscoGateway::QueryItems(const Jid& target,
                                const Jid& requester,
                                std::vector<DiscoItem>* items) {
  LOG(LS_VERBOSE) << "Perform disco#items request on " << target.Str()
                  << " on behalf of " << requester.Str();

  std::unique_ptr<XmlElement> response(
      SendQuery(target, requester, QN_DISCO_ITEMS_QUERY));
  if (!response)
    return false;

  const XmlElement* query = response->FirstNamed(QN_DISCO_ITEMS_QUERY);
  std::vector<DiscoItem> result;
  for (const XmlElement* child = query->FirstNamed(QN_DISCO_ITEM); child;
       child = child->NextNamed(QN_DISCO_ITEM)) {
    DiscoItem item;
    if (ParseItem(child, &item))
      result.push_back(item);
  }

  items->swap(result);
  return true;
}

bool IqDiscoGateway::QueryVersion(const Jid& target,
                                  const Jid& requester,
                                  std::string* version) {
  LOG(LS_VERBOSE) << "Perform version request on " << target.Str()
                  << " on behalf of " << requester.Str();

  std::unique_ptr<XmlElement> response(
      SendQuery(target, requester, QN_VERSION_QUERY));
  if (!response)
    return false;

  const XmlElement* query = response->FirstNamed(QN_VERSION_QUERY);
  const XmlElement* version_element = query->FirstNamed(QN_VERSION_VERSION);
  if (version_element == NULL)
    return false;

  *version = jbrowse_base::string_trim(version_element->BodyText());
  return true;
}

bool IqDiscoGateway::ParseItem(const XmlElement* element, DiscoItem* item) {
  // Items without an address carry nothing to browse.
  if (!element->HasAttr(QN_JID))
    return false;

  item->jid = element->Attr(QN_JID);
  item->name = element->Attr(QN_NAME);
  item->node = element->Attr(QN_NODE);
  return true;
}

}  // namespace jbrowse
