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

#include <sstream>
#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/qname.h"

using jbrowse::QName;
using jbrowse::StaticQName;

TEST(QNameTest, Empty) {
  EXPECT_TRUE(QName().IsEmpty());
  EXPECT_FALSE(QName("", "query").IsEmpty());
  EXPECT_FALSE(QName("jabber:iq:browse", "").IsEmpty());
}

TEST(QNameTest, StrUsesClarkNotation) {
  QName name("jabber:iq:browse", "query");
  EXPECT_EQ("query", name.LocalPart());
  EXPECT_EQ("jabber:iq:browse", name.Namespace());
  EXPECT_EQ("{jabber:iq:browse}query", name.Str());
  EXPECT_EQ("item", QName("", "item").Str());

  std::ostringstream ss;
  ss << QName("http://jabber.org/protocol/disco#info", "identity");
  EXPECT_EQ("{http://jabber.org/protocol/disco#info}identity", ss.str());
}

TEST(QNameTest, Equality) {
  QName name("jabber:iq:browse", "query");
  QName name2("jabber:iq:browse", "query");
  QName name3("jabber:iq:version", "query");
  EXPECT_TRUE(name == name2);
  EXPECT_FALSE(name == name3);
  EXPECT_TRUE(name != name3);
}

TEST(QNameTest, CompareOrdersLocalPartFirst) {
  QName name("", "a");
  QName name2("nsa", "a");
  QName name3("nsa", "b");
  QName name4("nsb", "b");

  EXPECT_TRUE(name < name2);
  EXPECT_FALSE(name2 < name);
  EXPECT_FALSE(name2 < name2);
  EXPECT_TRUE(name2 < name3);
  EXPECT_TRUE(name3 < name4);
  EXPECT_FALSE(name4 < name3);
  EXPECT_TRUE(QName("nsb", "a") < name3);
}

TEST(QNameTest, StaticQName) {
  const StaticQName browse_query = { "jabber:iq:browse", "query" };
  const StaticQName browse_item = { "jabber:iq:browse", "item" };
  const QName name("jabber:iq:browse", "query");
  const QName converted = browse_query;

  EXPECT_TRUE(name == browse_query);
  EXPECT_TRUE(browse_query == name);
  EXPECT_FALSE(name != browse_query);
  EXPECT_FALSE(browse_query != name);
  EXPECT_TRUE(name == converted);

  EXPECT_FALSE(name == browse_item);
  EXPECT_TRUE(browse_item != name);
}
