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

#include <memory>
#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/xmlconstants.h"
#include "jbrowse/xmllite/xmlelement.h"

using jbrowse::QName;
using jbrowse::XmlAttr;
using jbrowse::XmlChild;
using jbrowse::XmlElement;

TEST(XmlElementTest, TestConstructors) {
  XmlElement elt(QName("google:test", "first"));
  EXPECT_EQ("<first xmlns=\"google:test\"/>", elt.Str());

  XmlElement elt2(QName("google:test", "first"), true);
  EXPECT_EQ("<first xmlns=\"google:test\"/>", elt2.Str());
  EXPECT_TRUE(elt2.HasAttr(jbrowse::QN_XMLNS));
}

TEST(XmlElementTest, TestAdd) {
  XmlElement elt(QName("google:test", "root"), true);
  elt.AddElement(new XmlElement(QName("google:test", "first")));
  elt.AddElement(new XmlElement(QName("google:test", "nested")));
  elt.FirstNamed(QName("google:test", "nested"))
      ->AddElement(new XmlElement(QName("google:test", "third")));
  elt.AddText("nested-value");
  elt.AddText("between-");
  elt.AddElement(new XmlElement(QName("google:test", "last")));
  elt.AddAttr(QName("", "a"), "b");

  EXPECT_EQ("<root xmlns=\"google:test\" a=\"b\"><first/><nested><third/>"
            "</nested>nested-valuebetween-<last/></root>", elt.Str());
}

TEST(XmlElementTest, TestAttrs) {
  XmlElement elt(QName("", "root"));
  elt.SetAttr(QName("", "a"), "avalue");
  EXPECT_EQ("<root a=\"avalue\"/>", elt.Str());

  elt.SetAttr(QName("", "b"), "bvalue");
  EXPECT_EQ("<root a=\"avalue\" b=\"bvalue\"/>", elt.Str());

  elt.SetAttr(QName("", "a"), "avalue2");
  EXPECT_EQ("<root a=\"avalue2\" b=\"bvalue\"/>", elt.Str());

  elt.ClearAttr(QName("", "a"));
  EXPECT_EQ("<root b=\"bvalue\"/>", elt.Str());
  EXPECT_FALSE(elt.HasAttr(QName("", "a")));
  EXPECT_EQ("", elt.Attr(QName("", "a")));

  elt.ClearAttr(QName("", "b"));
  EXPECT_EQ("<root/>", elt.Str());

  elt.SetAttr(QName("", "c"), "cvalue");
  EXPECT_EQ("<root c=\"cvalue\"/>", elt.Str());
}

TEST(XmlElementTest, TestBodyText) {
  XmlElement elt(QName("", "root"));
  EXPECT_EQ("", elt.BodyText());

  elt.AddText("body text text.");
  EXPECT_EQ("body text text.", elt.BodyText());

  elt.SetBodyText("more body");
  EXPECT_EQ("more body", elt.BodyText());

  elt.AddElement(new XmlElement(QName("", "version")));
  elt.FirstNamed(QName("", "version"))->SetBodyText(" 1.0 ");
  EXPECT_EQ(" 1.0 ", elt.TextNamed(QName("", "version")));
  EXPECT_EQ("", elt.TextNamed(QName("", "missing")));

  elt.SetBodyText("");
  EXPECT_TRUE(elt.FirstChild() == NULL);
}

TEST(XmlElementTest, TestCopyConstructor) {
  std::unique_ptr<XmlElement> element(XmlElement::ForStr(
      "<root xmlns='test-foo'>This is a <em a='avalue' b='bvalue'>"
      "little <b>little</b></em> test</root>"));
  ASSERT_TRUE(element.get() != NULL);

  XmlElement* pelCopy = new XmlElement(*element);
  EXPECT_EQ("<root xmlns=\"test-foo\">This is a <em a=\"avalue\" b=\"bvalue\">"
            "little <b>little</b></em> test</root>", pelCopy->Str());
  element.reset();
  EXPECT_EQ("<root xmlns=\"test-foo\">This is a <em a=\"avalue\" b=\"bvalue\">"
            "little <b>little</b></em> test</root>", pelCopy->Str());
  delete pelCopy;
}

TEST(XmlElementTest, TestNameSearch) {
  std::unique_ptr<XmlElement> element(XmlElement::ForStr(
      "<root xmlns='disco-foo'>"
      "<item jid='a'/>"
      "text"
      "<feature var='f'/>"
      "<item jid='b'/>"
      "<item xmlns='other' jid='c'/>"
      "</root>"));
  ASSERT_TRUE(element.get() != NULL);

  const QName item("disco-foo", "item");
  XmlElement* child = element->FirstNamed(item);
  ASSERT_TRUE(child != NULL);
  EXPECT_EQ("a", child->Attr(QName("", "jid")));
  child = child->NextNamed(item);
  ASSERT_TRUE(child != NULL);
  EXPECT_EQ("b", child->Attr(QName("", "jid")));
  EXPECT_TRUE(child->NextNamed(item) == NULL);

  int count = 0;
  for (const XmlElement* e = element->FirstElement(); e;
       e = e->NextElement()) {
    ++count;
  }
  EXPECT_EQ(4, count);
  EXPECT_EQ(item, element->FirstElementName());
}

TEST(XmlElementTest, TestForStrRejectsMalformed) {
  EXPECT_TRUE(XmlElement::ForStr("<root><unclosed></root>") == NULL);
  EXPECT_TRUE(XmlElement::ForStr("<p:root/>") == NULL);
  EXPECT_TRUE(XmlElement::ForStr("") == NULL);
}
