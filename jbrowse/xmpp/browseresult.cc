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

#include "jbrowse/xmpp/browseresult.h"

#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"

using jbrowse_base::Maybe;

namespace jbrowse {

namespace {

void AddOptionalAttr(XmlElement* element, const QName& name,
                     const Maybe<std::string>& value) {
  if (value)
    element->AddAttr(name, *value);
}

}  // namespace

BrowseResult::BrowseResult() {
}

BrowseResult::BrowseResult(const Jid& jid) : jid_(jid) {
}

BrowseResult::~BrowseResult() {
}

bool BrowseResult::AddChild(const BrowseResult& child) {
  std::vector<BrowseResult>::const_iterator it;
  for (it = children_.begin(); it != children_.end(); ++it) {
    if (it->jid() == child.jid())
      return false;
  }

  children_.push_back(child);
  children_.back().children_.clear();
  return true;
}

void BrowseResult::Describe(XmlElement* element) const {
  if (jid_.IsValid())
    element->AddAttr(QN_JID, jid_.Str());
  AddOptionalAttr(element, QN_CATEGORY, category_);
  AddOptionalAttr(element, QN_TYPE, type_);
  AddOptionalAttr(element, QN_NAME, name_);
  AddOptionalAttr(element, QN_VERSION, version_);

  std::set<std::string>::const_iterator it;
  for (it = namespaces_.begin(); it != namespaces_.end(); ++it) {
    XmlElement* ns = new XmlElement(QN_BROWSE_NS);
    ns->SetBodyText(*it);
    element->AddElement(ns);
  }
}

XmlElement* BrowseResult::ToElement() const {
  XmlElement* query = new XmlElement(QN_BROWSE_QUERY, true);
  Describe(query);

  std::vector<BrowseResult>::const_iterator it;
  for (it = children_.begin(); it != children_.end(); ++it) {
    XmlElement* item = new XmlElement(QN_BROWSE_ITEM);
    it->Describe(item);
    query->AddElement(item);
  }
  return query;
}

bool BrowseResult::operator==(const BrowseResult& other) const {
  return jid_ == other.jid_ &&
         category_ == other.category_ &&
         type_ == other.type_ &&
         name_ == other.name_ &&
         version_ == other.version_ &&
         namespaces_ == other.namespaces_ &&
         children_ == other.children_;
}

}  // namespace jbrowse
