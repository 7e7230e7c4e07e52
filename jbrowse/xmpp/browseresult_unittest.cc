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
#include <set>
#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/browseresult.h"
#include "jbrowse/xmpp/constants.h"

using jbrowse_base::Maybe;

namespace jbrowse {

namespace {

BrowseResult MakeConference() {
  BrowseResult result(Jid("conference.example.com"));
  result.set_category(Maybe<std::string>("conference"));
  result.set_type(Maybe<std::string>("public"));
  result.set_name(Maybe<std::string>("Public Chatrooms"));
  result.set_version(Maybe<std::string>("4.7.5"));
  std::set<std::string> namespaces;
  namespaces.insert("http://jabber.org/protocol/muc");
  namespaces.insert("jabber:iq:version");
  result.set_namespaces(namespaces);
  return result;
}

}  // namespace

TEST(BrowseResultTest, OnlyJidWhenNothingResolved) {
  BrowseResult result(Jid("example.com"));
  std::unique_ptr<XmlElement> query(result.ToElement());
  EXPECT_EQ("<query xmlns=\"jabber:iq:browse\" jid=\"example.com\"/>",
            query->Str());
}

TEST(BrowseResultTest, EveryAttributeAndNamespaceIsWritten) {
  std::unique_ptr<XmlElement> query(MakeConference().ToElement());
  EXPECT_EQ(QName(QN_BROWSE_QUERY), query->Name());
  EXPECT_EQ("conference.example.com", query->Attr(QN_JID));
  EXPECT_EQ("conference", query->Attr(QN_CATEGORY));
  EXPECT_EQ("public", query->Attr(QN_TYPE));
  EXPECT_EQ("Public Chatrooms", query->Attr(QN_NAME));
  EXPECT_EQ("4.7.5", query->Attr(QN_VERSION));

  std::set<std::string> namespaces;
  int ns_count = 0;
  for (const XmlElement* ns = query->FirstNamed(QN_BROWSE_NS); ns;
       ns = ns->NextNamed(QN_BROWSE_NS)) {
    namespaces.insert(ns->BodyText());
    ++ns_count;
  }
  EXPECT_EQ(2, ns_count);
  EXPECT_EQ(MakeConference().namespaces(), namespaces);
  EXPECT_TRUE(query->FirstNamed(QN_BROWSE_ITEM) == NULL);
}

TEST(BrowseResultTest, EmptyTypeIsWrittenWhenPresent) {
  BrowseResult result(Jid("pubsub.example.com"));
  result.set_category(Maybe<std::string>("x-pubsub"));
  result.set_type(Maybe<std::string>(""));
  std::unique_ptr<XmlElement> query(result.ToElement());
  EXPECT_TRUE(query->HasAttr(QN_TYPE));
  EXPECT_EQ("", query->Attr(QN_TYPE));
  EXPECT_FALSE(query->HasAttr(QN_NAME));
}

TEST(BrowseResultTest, ChildrenBecomeItems) {
  BrowseResult root(Jid("example.com"));
  root.set_category(Maybe<std::string>("service"));
  root.set_type(Maybe<std::string>("jabber"));
  EXPECT_TRUE(root.AddChild(MakeConference()));
  EXPECT_TRUE(root.AddChild(BrowseResult(Jid("search.example.com"))));

  std::unique_ptr<XmlElement> query(root.ToElement());
  EXPECT_EQ("<query xmlns=\"jabber:iq:browse\" jid=\"example.com\""
            " category=\"service\" type=\"jabber\">"
            "<item jid=\"conference.example.com\" category=\"conference\""
            " type=\"public\" name=\"Public Chatrooms\" version=\"4.7.5\">"
            "<ns>http://jabber.org/protocol/muc</ns>"
            "<ns>jabber:iq:version</ns>"
            "</item>"
            "<item jid=\"search.example.com\"/>"
            "</query>", query->Str());
}

TEST(BrowseResultTest, ChildrenAreUniqueByJid) {
  BrowseResult root(Jid("example.com"));
  EXPECT_TRUE(root.AddChild(MakeConference()));
  BrowseResult duplicate(Jid("Conference.Example.com"));
  EXPECT_FALSE(root.AddChild(duplicate));
  ASSERT_EQ(1u, root.children().size());
  EXPECT_EQ(MakeConference(), root.children()[0]);
}

TEST(BrowseResultTest, GrandchildrenAreDropped) {
  BrowseResult child(Jid("conference.example.com"));
  child.AddChild(BrowseResult(Jid("room@conference.example.com")));
  ASSERT_EQ(1u, child.children().size());

  BrowseResult root(Jid("example.com"));
  root.AddChild(child);
  ASSERT_EQ(1u, root.children().size());
  EXPECT_TRUE(root.children()[0].children().empty());

  std::unique_ptr<XmlElement> query(root.ToElement());
  const XmlElement* item = query->FirstNamed(QN_BROWSE_ITEM);
  ASSERT_TRUE(item != NULL);
  EXPECT_TRUE(item->FirstNamed(QN_BROWSE_ITEM) == NULL);
}

TEST(BrowseResultTest, Equality) {
  EXPECT_EQ(MakeConference(), MakeConference());

  BrowseResult other = MakeConference();
  other.set_version(Maybe<std::string>());
  EXPECT_NE(MakeConference(), other);

  BrowseResult with_child = MakeConference();
  with_child.AddChild(BrowseResult(Jid("a.example.com")));
  EXPECT_NE(MakeConference(), with_child);
}

}  // namespace jbrowse
