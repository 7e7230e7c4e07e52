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

#include "jbrowse/xmllite/xmlbuilder.h"

#include <set>

#include "jbrowse/xmllite/xmlelement.h"

namespace jbrowse {

XmlBuilder::XmlBuilder() : current_(NULL) {
}

XmlBuilder::~XmlBuilder() {
}

void XmlBuilder::Reset() {
  root_.reset();
  current_ = NULL;
  parents_.clear();
}

XmlElement* XmlBuilder::BuildElement(XmlParseContext* pctx,
                                     const char* name, const char** atts) {
  QName tag_name(pctx->ResolveQName(name, false));
  if (tag_name.IsEmpty())
    return NULL;

  std::unique_ptr<XmlElement> element(new XmlElement(tag_name));
  std::set<QName> seen_namespaced;

  for (; *atts; atts += 2) {
    QName att_name(pctx->ResolveQName(*atts, true));
    if (att_name.IsEmpty())
      return NULL;

    // Two prefixes bound to one namespace can still collide.
    if (!att_name.Namespace().empty()) {
      if (seen_namespaced.count(att_name))
        return NULL;
      seen_namespaced.insert(att_name);
    }

    element->AddAttr(att_name, std::string(*(atts + 1)));
  }

  return element.release();
}

void XmlBuilder::StartElement(XmlParseContext* pctx,
                              const char* name, const char** atts) {
  XmlElement* element = BuildElement(pctx, name, atts);
  if (element == NULL) {
    pctx->RaiseError(XML_ERROR_SYNTAX);
    return;
  }

  if (current_ == NULL) {
    root_.reset(element);
  } else {
    current_->AddElement(element);
  }
  parents_.push_back(current_);
  current_ = element;
}

void XmlBuilder::EndElement(XmlParseContext* pctx, const char* name) {
  if (parents_.empty())
    return;
  current_ = parents_.back();
  parents_.pop_back();
}

void XmlBuilder::CharacterData(XmlParseContext* pctx,
                               const char* text, int len) {
  if (current_ != NULL)
    current_->AddParsedText(text, len);
}

void XmlBuilder::Error(XmlParseContext* pctx, XML_Error err) {
  Reset();
}

XmlElement* XmlBuilder::CreateElement() {
  return root_.release();
}

XmlElement* XmlBuilder::BuiltElement() {
  return root_.get();
}

}  // namespace jbrowse
