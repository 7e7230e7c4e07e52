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

#include <set>
#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmpp/browsetreebuilder.h"
#include "jbrowse/xmpp/browsevocabulary.h"
#include "jbrowse/xmpp/fakediscogateway.h"
#include "jbrowse/xmpp/identityresolver.h"

using jbrowse_base::Maybe;

namespace jbrowse {

namespace {

const char kServer[] = "example.com";
const char kConference[] = "conference.example.com";
const char kSearch[] = "search.example.com";
const char kRequester[] = "romeo@example.com/orchard";

}  // namespace

class BrowseTreeBuilderTest : public testing::Test {
 public:
  BrowseTreeBuilderTest()
      : resolver_(BrowseVocabulary::Default()),
        builder_(&gateway_, &resolver_) {
  }

  virtual void SetUp() {
    gateway_.AddIdentity(kServer, "server", "im", "Example Server");
    gateway_.AddFeature(kServer, "http://jabber.org/protocol/disco#info");
    gateway_.AddFeature(kServer, "jabber:iq:version");
    gateway_.SetVersion(kServer, " 4.7.5 ");
    gateway_.AddItem(kServer, kConference);
    gateway_.AddItem(kServer, kSearch);

    gateway_.AddIdentity(kConference, "conference", "text", "Chatrooms");
    gateway_.AddFeature(kConference, "http://jabber.org/protocol/muc");
    gateway_.AddItem(kConference, "room@conference.example.com");

    gateway_.AddIdentity(kSearch, "directory", "user", "User Search");
    gateway_.AddFeature(kSearch, "jabber:iq:search");
  }

  BrowseResult Browse(const std::string& target) {
    return builder_.Browse(Jid(target), Jid(kRequester), false);
  }

  FakeDiscoGateway gateway_;
  IdentityResolver resolver_;
  BrowseTreeBuilder builder_;
};

TEST_F(BrowseTreeBuilderTest, ResolvesRoot) {
  BrowseResult root = Browse(kServer);
  EXPECT_EQ(Jid(kServer), root.jid());
  EXPECT_EQ("service", *root.category());
  EXPECT_EQ("jabber", *root.type());
  EXPECT_EQ("Example Server", *root.name());
  EXPECT_EQ("4.7.5", *root.version());

  std::set<std::string> namespaces;
  namespaces.insert("http://jabber.org/protocol/disco#info");
  namespaces.insert("jabber:iq:version");
  EXPECT_EQ(namespaces, root.namespaces());
}

TEST_F(BrowseTreeBuilderTest, ResolvesChildrenOneLevelDeep) {
  BrowseResult root = Browse(kServer);
  ASSERT_EQ(2u, root.children().size());

  const BrowseResult& conference = root.children()[0];
  EXPECT_EQ(Jid(kConference), conference.jid());
  EXPECT_EQ("conference", *conference.category());
  EXPECT_EQ("x-text", *conference.type());
  EXPECT_EQ("Chatrooms", *conference.name());
  EXPECT_FALSE(conference.version());
  EXPECT_TRUE(conference.children().empty());

  const BrowseResult& search = root.children()[1];
  EXPECT_EQ(Jid(kSearch), search.jid());
  EXPECT_EQ("x-directory", *search.category());
  EXPECT_EQ("user", *search.type());

  // The conference's own items are never asked for.
  EXPECT_EQ(1u, gateway_.CountQueries(FakeDiscoGateway::QUERY_ITEMS));
}

TEST_F(BrowseTreeBuilderTest, QueriesOnBehalfOfRequester) {
  Browse(kServer);
  const std::vector<FakeDiscoGateway::Query>& queries = gateway_.queries();
  ASSERT_EQ(7u, queries.size());
  for (size_t i = 0; i < queries.size(); ++i)
    EXPECT_EQ(kRequester, queries[i].requester);

  EXPECT_EQ(FakeDiscoGateway::QUERY_INFO, queries[0].kind);
  EXPECT_EQ(kServer, queries[0].target);
  EXPECT_EQ(FakeDiscoGateway::QUERY_VERSION, queries[1].kind);
  EXPECT_EQ(FakeDiscoGateway::QUERY_ITEMS, queries[2].kind);
  EXPECT_EQ(kServer, queries[2].target);
  EXPECT_EQ(kConference, queries[3].target);
  EXPECT_EQ(kSearch, queries[5].target);
}

TEST_F(BrowseTreeBuilderTest, FailedInfoLeavesOnlyJid) {
  gateway_.FailQuery(FakeDiscoGateway::QUERY_INFO, kServer);
  gateway_.FailQuery(FakeDiscoGateway::QUERY_VERSION, kServer);
  BrowseResult root = Browse(kServer);

  EXPECT_EQ(Jid(kServer), root.jid());
  EXPECT_FALSE(root.category());
  EXPECT_FALSE(root.type());
  EXPECT_FALSE(root.name());
  EXPECT_FALSE(root.version());
  EXPECT_TRUE(root.namespaces().empty());
  // Children are still resolved.
  EXPECT_EQ(2u, root.children().size());
}

TEST_F(BrowseTreeBuilderTest, FailedItemsLeavesNoChildren) {
  gateway_.FailQuery(FakeDiscoGateway::QUERY_ITEMS, kServer);
  BrowseResult root = Browse(kServer);
  EXPECT_EQ("service", *root.category());
  EXPECT_TRUE(root.children().empty());
}

TEST_F(BrowseTreeBuilderTest, FailedChildInfoKeepsSiblings) {
  gateway_.FailQuery(FakeDiscoGateway::QUERY_INFO, kConference);
  BrowseResult root = Browse(kServer);
  ASSERT_EQ(2u, root.children().size());
  EXPECT_FALSE(root.children()[0].category());
  EXPECT_EQ(Jid(kConference), root.children()[0].jid());
  EXPECT_EQ("x-directory", *root.children()[1].category());
}

TEST_F(BrowseTreeBuilderTest, MalformedItemIsDropped) {
  gateway_.SetEmptyItems("muc.example.com");
  gateway_.AddItem("muc.example.com", "bad jid@@example..com");
  gateway_.AddItem("muc.example.com", kSearch);

  BrowseResult root = Browse("muc.example.com");
  ASSERT_EQ(1u, root.children().size());
  EXPECT_EQ(Jid(kSearch), root.children()[0].jid());
}

TEST_F(BrowseTreeBuilderTest, IpLiteralItemIsKept) {
  gateway_.SetEmptyItems("muc.example.com");
  gateway_.AddItem("muc.example.com", "[2001:db8::1]");
  gateway_.AddIdentity("[2001:db8::1]", "server", "im", "Peer");

  BrowseResult root = Browse("muc.example.com");
  ASSERT_EQ(1u, root.children().size());
  EXPECT_EQ("[2001:db8::1]", root.children()[0].jid().Str());
  EXPECT_EQ("service", *root.children()[0].category());
}

TEST_F(BrowseTreeBuilderTest, DuplicateItemsAppearOnce) {
  gateway_.AddItem(kServer, "Search.Example.com");
  BrowseResult root = Browse(kServer);
  EXPECT_EQ(2u, root.children().size());
}

TEST_F(BrowseTreeBuilderTest, BlankVersionIsAbsent) {
  gateway_.SetVersion(kSearch, "   ");
  BrowseResult entity =
      builder_.ResolveEntity(Jid(kSearch), Jid(kRequester), false);
  EXPECT_FALSE(entity.version());
  EXPECT_TRUE(entity.children().empty());
}

TEST_F(BrowseTreeBuilderTest, ConcatIdentitiesIsPassedThrough) {
  gateway_.AddIdentity(kSearch, "pubsub", "service", "");
  BrowseResult entity =
      builder_.ResolveEntity(Jid(kSearch), Jid(kRequester), true);
  EXPECT_EQ("x-directory_and_pubsub", *entity.category());
  EXPECT_EQ("service_and_user", *entity.type());

  entity = builder_.ResolveEntity(Jid(kSearch), Jid(kRequester), false);
  EXPECT_EQ("x-directory", *entity.category());
}

TEST_F(BrowseTreeBuilderTest, UnknownTargetStillAnswers) {
  BrowseResult root = Browse("nowhere.example.com");
  EXPECT_EQ(Jid("nowhere.example.com"), root.jid());
  EXPECT_FALSE(root.category());
  EXPECT_TRUE(root.children().empty());
}

TEST_F(BrowseTreeBuilderTest, RepeatedBrowseIsStable) {
  EXPECT_EQ(Browse(kServer), Browse(kServer));
}

}  // namespace jbrowse
