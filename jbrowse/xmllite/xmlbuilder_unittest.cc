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
#include "jbrowse/xmllite/xmlbuilder.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmllite/xmlparser.h"

using jbrowse::QName;
using jbrowse::XmlBuilder;
using jbrowse::XmlElement;
using jbrowse::XmlParser;

TEST(XmlBuilderTest, TestTrivial) {
  XmlBuilder builder;
  EXPECT_TRUE(XmlParser::ParseXml(&builder, "<testing/>"));
  EXPECT_EQ("<testing/>", builder.BuiltElement()->Str());
}

TEST(XmlBuilderTest, TestAttributes) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder, "<testing e='' long='some text'/>");
  EXPECT_EQ("<testing e=\"\" long=\"some text\"/>",
            builder.BuiltElement()->Str());
}

TEST(XmlBuilderTest, TestNesting) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder,
      "<top><first/><second><third></third></second></top>");
  EXPECT_EQ("<top><first/><second><third/></second></top>",
            builder.BuiltElement()->Str());
}

TEST(XmlBuilderTest, TestQuoting) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder,
      "<testing a='&lt;what is &quot;important&quot;&gt;'/>");
  EXPECT_EQ("<testing a=\"&lt;what is &quot;important&quot;&gt;\"/>",
            builder.BuiltElement()->Str());
}

TEST(XmlBuilderTest, TestText) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder, "<testing>&lt;>&amp;&quot;</testing>");
  EXPECT_EQ("<testing>&lt;&gt;&amp;\"</testing>",
            builder.BuiltElement()->Str());
}

TEST(XmlBuilderTest, TestNamespaces) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder,
      "<iq xmlns='jabber:client' type='get'>"
      "<query xmlns='jabber:iq:browse'/></iq>");
  XmlElement* iq = builder.BuiltElement();
  ASSERT_TRUE(iq != NULL);
  EXPECT_EQ(QName("jabber:client", "iq"), iq->Name());
  EXPECT_EQ(QName("jabber:iq:browse", "query"), iq->FirstElementName());
  EXPECT_EQ("get", iq->Attr(QName("", "type")));
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"get\">"
            "<query xmlns=\"jabber:iq:browse\"/></iq>", iq->Str());
}

TEST(XmlBuilderTest, TestPrefixedNamespaces) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder,
      "<a:root xmlns:a='urn:a' xmlns:b='urn:b' b:att='v'><a:child/></a:root>");
  XmlElement* root = builder.BuiltElement();
  ASSERT_TRUE(root != NULL);
  EXPECT_EQ(QName("urn:a", "root"), root->Name());
  EXPECT_EQ("v", root->Attr(QName("urn:b", "att")));
  EXPECT_EQ(QName("urn:a", "child"), root->FirstElementName());
}

TEST(XmlBuilderTest, TestUnboundPrefixFails) {
  XmlBuilder builder;
  EXPECT_FALSE(XmlParser::ParseXml(&builder, "<a:root/>"));
  EXPECT_TRUE(builder.BuiltElement() == NULL);
}

TEST(XmlBuilderTest, TestDuplicateNamespacedAttributeFails) {
  XmlBuilder builder;
  EXPECT_FALSE(XmlParser::ParseXml(&builder,
      "<root xmlns:a='urn:x' xmlns:b='urn:x' a:att='1' b:att='2'/>"));
  EXPECT_TRUE(builder.BuiltElement() == NULL);
}

TEST(XmlBuilderTest, TestMalformedFails) {
  XmlBuilder builder;
  EXPECT_FALSE(XmlParser::ParseXml(&builder, "<root><child></root>"));
  EXPECT_TRUE(builder.CreateElement() == NULL);
}

TEST(XmlBuilderTest, TestNonUtf8DeclarationFails) {
  XmlBuilder builder;
  EXPECT_FALSE(XmlParser::ParseXml(&builder,
      "<?xml version='1.0' encoding='ISO-8859-1'?><root/>"));
}

TEST(XmlBuilderTest, TestReusedAfterReset) {
  XmlBuilder builder;
  XmlParser::ParseXml(&builder, "<first/>");
  std::unique_ptr<XmlElement> first(builder.CreateElement());
  ASSERT_TRUE(first.get() != NULL);
  EXPECT_TRUE(builder.BuiltElement() == NULL);

  builder.Reset();
  XmlParser::ParseXml(&builder, "<second/>");
  EXPECT_EQ("<second/>", builder.BuiltElement()->Str());
}
