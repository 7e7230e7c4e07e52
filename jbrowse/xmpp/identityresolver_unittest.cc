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
#include <vector>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmpp/browsevocabulary.h"
#include "jbrowse/xmpp/identityresolver.h"

using jbrowse_base::Maybe;

namespace jbrowse {

class IdentityResolverTest : public testing::Test {
 public:
  IdentityResolverTest() : resolver_(BrowseVocabulary::Default()) {}

  void AddIdentity(const std::string& category,
                   const std::string& type,
                   const std::string& name) {
    identities_.push_back(DiscoIdentity(category, type, name));
  }

  Maybe<std::string> Category(bool concat) {
    return resolver_.ResolveCategory(identities_, concat);
  }

  Maybe<std::string> Type(bool concat) {
    return resolver_.ResolveType(resolver_.ResolveCategory(identities_, concat),
                                 identities_, concat);
  }

  IdentityResolver resolver_;
  std::vector<DiscoIdentity> identities_;
};

TEST_F(IdentityResolverTest, NoIdentities) {
  EXPECT_FALSE(Category(false));
  EXPECT_FALSE(Category(true));
  EXPECT_FALSE(Type(false));
  EXPECT_FALSE(Type(true));
  EXPECT_FALSE(IdentityResolver::ResolveName(identities_));
}

TEST_F(IdentityResolverTest, GatewayBecomesService) {
  AddIdentity("gateway", "icq", "");
  EXPECT_EQ("service", *Category(false));
  EXPECT_EQ("icq", *Type(false));
}

TEST_F(IdentityResolverTest, GatewayOfUnknownTypeBecomesService) {
  AddIdentity("gateway", "telegram", "");
  EXPECT_EQ("service", *Category(false));
  EXPECT_EQ("x-telegram", *Type(false));
}

TEST_F(IdentityResolverTest, ImServerBecomesJabberService) {
  AddIdentity("server", "im", "Openfire Server");
  EXPECT_EQ("service", *Category(false));
  EXPECT_EQ("jabber", *Type(false));
}

TEST_F(IdentityResolverTest, ServerOfOtherTypeIsExtension) {
  AddIdentity("server", "chat", "");
  EXPECT_EQ("x-server", *Category(false));
  // Types pass through untouched under an extension category.
  EXPECT_EQ("chat", *Type(false));
}

TEST_F(IdentityResolverTest, WhiteboardCollaborationBecomesApplication) {
  AddIdentity("collaboration", "whiteboard", "");
  EXPECT_EQ("application", *Category(false));
  EXPECT_EQ("whiteboard", *Type(false));
}

TEST_F(IdentityResolverTest, CollaborationOfOtherTypeIsExtension) {
  AddIdentity("collaboration", "bot", "");
  EXPECT_EQ("x-collaboration", *Category(false));
}

TEST_F(IdentityResolverTest, KnownCategoryAndType) {
  AddIdentity("conference", "public", "");
  EXPECT_EQ("conference", *Category(false));
  EXPECT_EQ("public", *Type(false));
}

TEST_F(IdentityResolverTest, KnownCategoryWithForeignType) {
  AddIdentity("conference", "text", "Public Chatrooms");
  EXPECT_EQ("conference", *Category(false));
  EXPECT_EQ("x-text", *Type(false));
}

TEST_F(IdentityResolverTest, UnknownCategoryIsExtension) {
  AddIdentity("pubsub", "service", "");
  EXPECT_EQ("x-pubsub", *Category(false));
  EXPECT_EQ("service", *Type(false));
}

TEST_F(IdentityResolverTest, ExtensionCategoryWithoutTypesGivesEmptyType) {
  AddIdentity("pubsub", "", "");
  EXPECT_EQ("x-pubsub", *Category(false));
  Maybe<std::string> type = Type(false);
  ASSERT_TRUE(type);
  EXPECT_EQ("", *type);
}

TEST_F(IdentityResolverTest, KnownCategoryWithoutTypesGivesNoType) {
  AddIdentity("user", "", "");
  EXPECT_EQ("user", *Category(false));
  EXPECT_FALSE(Type(false));
}

TEST_F(IdentityResolverTest, ServiceWithImType) {
  Maybe<std::string> service("service");
  AddIdentity("", "im", "");
  EXPECT_EQ("jabber", *resolver_.ResolveType(service, identities_, false));
}

TEST_F(IdentityResolverTest, AbsentCategoryGivesAbsentType) {
  AddIdentity("", "im", "");
  EXPECT_FALSE(Category(false));
  EXPECT_FALSE(resolver_.ResolveType(Maybe<std::string>(), identities_, true));
}

TEST_F(IdentityResolverTest, ValuesAreTrimmed) {
  AddIdentity("  conference\t", " public\n", "  Rooms ");
  EXPECT_EQ("conference", *Category(false));
  EXPECT_EQ("public", *Type(false));
  EXPECT_EQ("Rooms", *IdentityResolver::ResolveName(identities_));
}

TEST_F(IdentityResolverTest, BlankValuesAreIgnored) {
  AddIdentity("   ", "  ", " ");
  EXPECT_FALSE(Category(true));
  EXPECT_FALSE(IdentityResolver::ResolveName(identities_));
}

TEST_F(IdentityResolverTest, ControlCharactersAreTrimmed) {
  AddIdentity("\fconference\v", "\x1ftext", "Rooms\f");
  EXPECT_EQ("conference", *Category(false));
  EXPECT_EQ("x-text", *Type(false));
  EXPECT_EQ("Rooms", *IdentityResolver::ResolveName(identities_));
}

TEST_F(IdentityResolverTest, FirstCategoryWinsWithoutConcat) {
  AddIdentity("conference", "text", "");
  AddIdentity("directory", "chatroom", "");
  EXPECT_EQ("conference", *Category(false));
  EXPECT_EQ("x-text", *Type(false));
}

TEST_F(IdentityResolverTest, ConcatJoinsDistinctCategories) {
  AddIdentity("conference", "text", "");
  AddIdentity("directory", "chatroom", "");
  EXPECT_EQ("x-conference_and_directory", *Category(true));
  EXPECT_EQ("chatroom_and_text", *Type(true));
}

TEST_F(IdentityResolverTest, ConcatOfRepeatedCategoryStaysSingle) {
  AddIdentity("conference", "public", "");
  AddIdentity("conference", "private", "");
  EXPECT_EQ("conference", *Category(true));
  EXPECT_EQ("x-private_and_public", *Type(true));
}

TEST_F(IdentityResolverTest, ConcatJoinsInLexicalOrder) {
  AddIdentity("store", "file", "");
  AddIdentity("account", "registered", "");
  AddIdentity("pubsub", "pep", "");
  EXPECT_EQ("x-account_and_pubsub_and_store", *Category(true));
}

// Identities without a category keep the category scan going, and their
// types are recorded along the way.
TEST_F(IdentityResolverTest, CategoryScanSkipsIdentitiesWithoutCategory) {
  AddIdentity("", "whiteboard", "");
  AddIdentity("collaboration", "", "");
  AddIdentity("collaboration", "bot", "");
  EXPECT_EQ("application", *Category(false));
}

// The type scan runs on its own and stops at the first type, even when the
// category scan stopped elsewhere.
TEST_F(IdentityResolverTest, TypeScanIsIndependentOfCategoryScan) {
  AddIdentity("", "im", "");
  AddIdentity("server", "", "");
  AddIdentity("server", "chat", "");
  EXPECT_EQ("service", *Category(false));
  EXPECT_EQ("jabber", *Type(false));
}

TEST_F(IdentityResolverTest, TypeScanStopsAtFirstType) {
  AddIdentity("server", "", "");
  AddIdentity("server", "im", "");
  AddIdentity("server", "chat", "");
  EXPECT_EQ("x-server", *Category(false));
  EXPECT_EQ("im", *Type(false));
}

TEST_F(IdentityResolverTest, NamesUseEveryIdentity) {
  AddIdentity("conference", "text", "Rooms");
  AddIdentity("directory", "chatroom", "Directory");
  AddIdentity("directory", "chatroom", "Rooms");
  EXPECT_EQ("Directory, Rooms", *IdentityResolver::ResolveName(identities_));
}

TEST(IdentityResolverNamespacesTest, TrimsAndDeduplicates) {
  std::vector<std::string> features;
  features.push_back("http://jabber.org/protocol/muc");
  features.push_back(" http://jabber.org/protocol/muc ");
  features.push_back("");
  features.push_back("  ");
  features.push_back("jabber:iq:version");

  std::set<std::string> expected;
  expected.insert("http://jabber.org/protocol/muc");
  expected.insert("jabber:iq:version");
  EXPECT_EQ(expected, IdentityResolver::ResolveNamespaces(features));
  EXPECT_TRUE(IdentityResolver::ResolveNamespaces(
      std::vector<std::string>()).empty());
}

TEST(IdentityResolverVocabularyTest, UsesInjectedVocabulary) {
  BrowseVocabulary::CategoryMap categories;
  categories["pubsub"].insert("pep");
  BrowseVocabulary vocabulary(categories);
  IdentityResolver resolver(vocabulary);

  std::vector<DiscoIdentity> identities;
  identities.push_back(DiscoIdentity("pubsub", "pep", ""));
  Maybe<std::string> category = resolver.ResolveCategory(identities, false);
  EXPECT_EQ("pubsub", *category);
  EXPECT_EQ("pep", *resolver.ResolveType(category, identities, false));

  identities[0].category = "conference";
  EXPECT_EQ("x-conference", *resolver.ResolveCategory(identities, false));
}

TEST(BrowseVocabularyTest, DefaultTable) {
  const BrowseVocabulary& vocabulary = BrowseVocabulary::Default();
  EXPECT_EQ(8u, vocabulary.categories().size());
  EXPECT_TRUE(vocabulary.IsCategory("headline"));
  EXPECT_FALSE(vocabulary.IsCategory("gateway"));
  EXPECT_TRUE(vocabulary.IsType("render", "*2*"));
  EXPECT_TRUE(vocabulary.IsType("service", "yahoo"));
  EXPECT_FALSE(vocabulary.IsType("service", "im"));
  EXPECT_FALSE(vocabulary.IsType("unknown", "bot"));
  EXPECT_EQ(11u, vocabulary.categories().find("service")->second.size());
}

}  // namespace jbrowse
