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

#include "jbrowse/xmllite/xmlelement.h"

#include <sstream>
#include <string>

#include "jbrowse/xmllite/xmlbuilder.h"
#include "jbrowse/xmllite/xmlconstants.h"
#include "jbrowse/xmllite/xmlparser.h"
#include "jbrowse/xmllite/xmlprinter.h"

namespace jbrowse {

XmlChild::~XmlChild() {
}

XmlElement* XmlChild::AsElement() {
  return IsText() ? NULL : static_cast<XmlElement*>(this);
}

const XmlElement* XmlChild::AsElement() const {
  return IsText() ? NULL : static_cast<const XmlElement*>(this);
}

XmlText* XmlChild::AsText() {
  return IsText() ? static_cast<XmlText*>(this) : NULL;
}

const XmlText* XmlChild::AsText() const {
  return IsText() ? static_cast<const XmlText*>(this) : NULL;
}

XmlText::~XmlText() {
}

XmlElement::XmlElement(const QName& name)
    : name_(name),
      first_attr_(NULL),
      last_attr_(NULL),
      first_child_(NULL),
      last_child_(NULL) {
}

XmlElement::XmlElement(const QName& name, bool use_default_ns)
    : name_(name),
      first_attr_(NULL),
      last_attr_(NULL),
      first_child_(NULL),
      last_child_(NULL) {
  if (use_default_ns) {
    AddAttr(QN_XMLNS, name.Namespace());
  }
}

XmlElement::XmlElement(const XmlElement& elt)
    : XmlChild(),
      name_(elt.name_),
      first_attr_(NULL),
      last_attr_(NULL),
      first_child_(NULL),
      last_child_(NULL) {
  for (const XmlAttr* attr = elt.first_attr_; attr; attr = attr->NextAttr()) {
    XmlAttr* copy = new XmlAttr(*attr);
    if (last_attr_ == NULL) {
      first_attr_ = copy;
    } else {
      last_attr_->next_attr_ = copy;
    }
    last_attr_ = copy;
  }

  for (const XmlChild* child = elt.first_child_; child;
       child = child->NextChild()) {
    if (child->IsText()) {
      AddChild(new XmlText(*child->AsText()));
    } else {
      AddChild(new XmlElement(*child->AsElement()));
    }
  }
}

XmlElement::~XmlElement() {
  XmlAttr* attr = first_attr_;
  while (attr) {
    XmlAttr* next = attr->NextAttr();
    delete attr;
    attr = next;
  }
  ClearChildren();
}

const std::string XmlElement::BodyText() const {
  std::string text;
  for (const XmlChild* child = first_child_; child;
       child = child->NextChild()) {
    if (child->IsText())
      text += child->AsText()->Text();
  }
  return text;
}

void XmlElement::SetBodyText(const std::string& text) {
  if (text.empty()) {
    ClearChildren();
  } else if (first_child_ == NULL) {
    AddText(text);
  } else if (first_child_->IsText() && first_child_ == last_child_) {
    first_child_->AsText()->SetText(text);
  } else {
    ClearChildren();
    AddText(text);
  }
}

const QName XmlElement::FirstElementName() const {
  const XmlElement* element = FirstElement();
  if (element == NULL)
    return QName();
  return element->Name();
}

const std::string XmlElement::Attr(const StaticQName& name) const {
  for (const XmlAttr* attr = first_attr_; attr; attr = attr->NextAttr()) {
    if (attr->name_ == name)
      return attr->value_;
  }
  return std::string();
}

const std::string XmlElement::Attr(const QName& name) const {
  for (const XmlAttr* attr = first_attr_; attr; attr = attr->NextAttr()) {
    if (attr->name_ == name)
      return attr->value_;
  }
  return std::string();
}

bool XmlElement::HasAttr(const StaticQName& name) const {
  for (const XmlAttr* attr = first_attr_; attr; attr = attr->NextAttr()) {
    if (attr->name_ == name)
      return true;
  }
  return false;
}

bool XmlElement::HasAttr(const QName& name) const {
  for (const XmlAttr* attr = first_attr_; attr; attr = attr->NextAttr()) {
    if (attr->name_ == name)
      return true;
  }
  return false;
}

void XmlElement::SetAttr(const QName& name, const std::string& value) {
  for (XmlAttr* attr = first_attr_; attr; attr = attr->next_attr_) {
    if (attr->name_ == name) {
      attr->value_ = value;
      return;
    }
  }
  XmlAttr* attr = new XmlAttr(name, value);
  if (last_attr_ == NULL) {
    first_attr_ = attr;
  } else {
    last_attr_->next_attr_ = attr;
  }
  last_attr_ = attr;
}

void XmlElement::AddAttr(const QName& name, const std::string& value) {
  SetAttr(name, value);
}

void XmlElement::ClearAttr(const QName& name) {
  XmlAttr* previous = NULL;
  for (XmlAttr* attr = first_attr_; attr; attr = attr->next_attr_) {
    if (attr->name_ == name) {
      if (previous == NULL) {
        first_attr_ = attr->next_attr_;
      } else {
        previous->next_attr_ = attr->next_attr_;
      }
      if (last_attr_ == attr)
        last_attr_ = previous;
      delete attr;
      return;
    }
    previous = attr;
  }
}

XmlElement* XmlElement::FirstElement() {
  for (XmlChild* child = first_child_; child; child = child->NextChild()) {
    if (!child->IsText())
      return child->AsElement();
  }
  return NULL;
}

const XmlElement* XmlElement::FirstElement() const {
  return const_cast<XmlElement*>(this)->FirstElement();
}

XmlElement* XmlElement::NextElement() {
  for (XmlChild* child = NextChild(); child; child = child->NextChild()) {
    if (!child->IsText())
      return child->AsElement();
  }
  return NULL;
}

const XmlElement* XmlElement::NextElement() const {
  return const_cast<XmlElement*>(this)->NextElement();
}

XmlElement* XmlElement::FirstNamed(const QName& name) {
  for (XmlChild* child = first_child_; child; child = child->NextChild()) {
    if (!child->IsText() && child->AsElement()->Name() == name)
      return child->AsElement();
  }
  return NULL;
}

const XmlElement* XmlElement::FirstNamed(const QName& name) const {
  return const_cast<XmlElement*>(this)->FirstNamed(name);
}

XmlElement* XmlElement::NextNamed(const QName& name) {
  for (XmlChild* child = NextChild(); child; child = child->NextChild()) {
    if (!child->IsText() && child->AsElement()->Name() == name)
      return child->AsElement();
  }
  return NULL;
}

const XmlElement* XmlElement::NextNamed(const QName& name) const {
  return const_cast<XmlElement*>(this)->NextNamed(name);
}

const std::string XmlElement::TextNamed(const QName& name) const {
  const XmlElement* child = FirstNamed(name);
  if (child == NULL)
    return std::string();
  return child->BodyText();
}

void XmlElement::AddChild(XmlChild* child) {
  child->next_child_ = NULL;
  if (last_child_ == NULL) {
    first_child_ = child;
  } else {
    last_child_->next_child_ = child;
  }
  last_child_ = child;
}

void XmlElement::AddElement(XmlElement* child) {
  if (child == NULL)
    return;
  AddChild(child);
}

void XmlElement::AddText(const std::string& text) {
  if (text.empty())
    return;
  if (last_child_ && last_child_->IsText()) {
    last_child_->AsText()->AddText(text);
  } else {
    AddChild(new XmlText(text));
  }
}

void XmlElement::AddParsedText(const char* buf, int len) {
  if (len == 0)
    return;
  if (last_child_ && last_child_->IsText()) {
    last_child_->AsText()->AddParsedText(buf, len);
  } else {
    AddChild(new XmlText(buf, len));
  }
}

void XmlElement::ClearChildren() {
  XmlChild* child = first_child_;
  while (child) {
    XmlChild* next = child->NextChild();
    delete child;
    child = next;
  }
  first_child_ = NULL;
  last_child_ = NULL;
}

std::string XmlElement::Str() const {
  std::stringstream ss;
  Print(&ss);
  return ss.str();
}

void XmlElement::Print(std::ostream* pout) const {
  XmlPrinter::PrintXml(pout, this);
}

XmlElement* XmlElement::ForStr(const std::string& str) {
  XmlBuilder builder;
  if (!XmlParser::ParseXml(&builder, str))
    return NULL;
  return builder.CreateElement();
}

}  // namespace jbrowse
