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

#ifndef JBROWSE_XMLLITE_XMLELEMENT_H_
#define JBROWSE_XMLLITE_XMLELEMENT_H_

#include <iosfwd>
#include <string>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/qname.h"

namespace jbrowse {

class XmlChild;
class XmlText;
class XmlElement;
class XmlAttr;

// A node in an element's child list. Children are chained in document order
// and owned by the parent element.
class XmlChild {
 public:
  XmlChild* NextChild() { return next_child_; }
  const XmlChild* NextChild() const { return next_child_; }

  bool IsText() const { return IsTextImpl(); }

  XmlElement* AsElement();
  const XmlElement* AsElement() const;
  XmlText* AsText();
  const XmlText* AsText() const;

 protected:
  XmlChild() : next_child_(NULL) {}

  virtual bool IsTextImpl() const = 0;
  virtual ~XmlChild();

 private:
  friend class XmlElement;

  XmlChild* next_child_;

  DISALLOW_COPY_AND_ASSIGN(XmlChild);
};

class XmlText : public XmlChild {
 public:
  explicit XmlText(const std::string& text) : text_(text) {}
  XmlText(const XmlText& t) : XmlChild(), text_(t.text_) {}
  explicit XmlText(const char* cstr, size_t len) : text_(cstr, len) {}
  virtual ~XmlText();

  const std::string& Text() const { return text_; }
  void SetText(const std::string& text) { text_ = text; }
  void AddParsedText(const char* buf, int len) { text_.append(buf, len); }
  void AddText(const std::string& text) { text_ += text; }

 protected:
  virtual bool IsTextImpl() const { return true; }

 private:
  std::string text_;
};

class XmlAttr {
 public:
  XmlAttr* NextAttr() const { return next_attr_; }
  const QName& Name() const { return name_; }
  const std::string& Value() const { return value_; }

 private:
  friend class XmlElement;

  explicit XmlAttr(const QName& name, const std::string& value)
      : next_attr_(NULL), name_(name), value_(value) {}
  XmlAttr(const XmlAttr& att)
      : next_attr_(NULL), name_(att.name_), value_(att.value_) {}

  XmlAttr* next_attr_;
  QName name_;
  std::string value_;
};

// An element with its attributes and children. The element owns every
// attribute and child added to it. Stanzas travel through the component as
// XmlElement trees; functions returning an XmlElement* hand ownership to the
// caller unless documented otherwise.
class XmlElement : public XmlChild {
 public:
  explicit XmlElement(const QName& name);
  // With |use_default_ns| the element carries an explicit xmlns attribute
  // for its own namespace.
  explicit XmlElement(const QName& name, bool use_default_ns);
  XmlElement(const XmlElement& elt);

  virtual ~XmlElement();

  const QName& Name() const { return name_; }
  void SetName(const QName& name) { name_ = name; }

  // Concatenation of the direct text children.
  const std::string BodyText() const;
  void SetBodyText(const std::string& text);

  const QName FirstElementName() const;

  XmlAttr* FirstAttr() { return first_attr_; }
  const XmlAttr* FirstAttr() const { return first_attr_; }

  // Attr will return an empty string if the attribute isn't there:
  // use HasAttr to test presence of an attribute.
  const std::string Attr(const StaticQName& name) const;
  const std::string Attr(const QName& name) const;
  bool HasAttr(const StaticQName& name) const;
  bool HasAttr(const QName& name) const;
  void SetAttr(const QName& name, const std::string& value);
  void ClearAttr(const QName& name);

  XmlChild* FirstChild() { return first_child_; }
  const XmlChild* FirstChild() const { return first_child_; }

  // Element children only, skipping text.
  XmlElement* FirstElement();
  const XmlElement* FirstElement() const;
  XmlElement* NextElement();
  const XmlElement* NextElement() const;

  XmlElement* FirstNamed(const QName& name);
  const XmlElement* FirstNamed(const QName& name) const;
  XmlElement* NextNamed(const QName& name);
  const XmlElement* NextNamed(const QName& name) const;

  // Body text of the first child element named |name|, or empty.
  const std::string TextNamed(const QName& name) const;

  // Takes ownership of |child|.
  void AddElement(XmlElement* child);
  void AddText(const std::string& text);
  void AddParsedText(const char* buf, int len);
  void AddAttr(const QName& name, const std::string& value);

  void ClearChildren();

  std::string Str() const;
  void Print(std::ostream* pout) const;

  // Parses |str| into a new element, or returns NULL if it is not well-formed
  // XML. The caller owns the result.
  static XmlElement* ForStr(const std::string& str);

 protected:
  virtual bool IsTextImpl() const { return false; }

 private:
  void AddChild(XmlChild* child);

  QName name_;
  XmlAttr* first_attr_;
  XmlAttr* last_attr_;
  XmlChild* first_child_;
  XmlChild* last_child_;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMLLITE_XMLELEMENT_H_
