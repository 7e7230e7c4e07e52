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
#include <thread>
#include <vector>

#include "jbrowse/base/gunit.h"
#include "jbrowse/base/optionsfile.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/browseiqhandler.h"
#include "jbrowse/xmpp/browseplugin.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/fakeiqhandler.h"
#include "jbrowse/xmpp/iqrouter.h"

namespace jbrowse {

namespace {

const char kBrowseRequest[] =
    "<iq xmlns='jabber:client' type='get' id='b1'"
    " from='romeo@montague.net/orchard' to='montague.net'>"
    "<query xmlns='jabber:iq:browse'/></iq>";

// Browses montague.net |times| times and counts the answers that differ from
// the configured tree.
void BrowseRepeatedly(BrowseIqHandler* handler, int times, int* mismatches) {
  for (int i = 0; i < times; ++i) {
    BrowseResult result = handler->Browse(Jid("montague.net"),
                                          Jid("romeo@montague.net/orchard"));
    if (!result.category() || *result.category() != "service" ||
        !result.version() || *result.version() != "4.7.5" ||
        result.children().size() != 2) {
      ++*mismatches;
    }
  }
}

void CollectIds(const FakeIqHandler& handler, std::set<std::string>* ids,
                size_t* count) {
  const std::vector<XmlElement*>& received = handler.received();
  for (size_t i = 0; i < received.size(); ++i)
    ids->insert(received[i]->Attr(QN_ID));
  *count += received.size();
}

}  // namespace

// Runs the plugin against disco and version handlers registered with the
// same router, the way a host server wires it up.
class BrowsePluginTest : public testing::Test {
 public:
  BrowsePluginTest()
      : info_handler_(QN_DISCO_INFO_QUERY),
        items_handler_(QN_DISCO_ITEMS_QUERY),
        version_handler_(QN_VERSION_QUERY),
        options_(GetTestScratchFile("browseplugin_options")),
        plugin_(&router_, &options_) {
  }

  virtual void SetUp() {
    ASSERT_TRUE(router_.AddHandler(&info_handler_));
    ASSERT_TRUE(router_.AddHandler(&items_handler_));
    ASSERT_TRUE(router_.AddHandler(&version_handler_));

    info_handler_.SetReply("montague.net",
        "<query xmlns='http://jabber.org/protocol/disco#info'>"
        "<identity category='server' type='im' name='Montague'/>"
        "<feature var='http://jabber.org/protocol/disco#info'/>"
        "<feature var='jabber:iq:browse'/>"
        "</query>");
    items_handler_.SetReply("montague.net",
        "<query xmlns='http://jabber.org/protocol/disco#items'>"
        "<item jid='conference.montague.net'/>"
        "<item jid='in valid'/>"
        "<item jid='users.montague.net'/>"
        "</query>");
    version_handler_.SetReply("montague.net",
        "<query xmlns='jabber:iq:version'>"
        "<name>Openfire</name><version>4.7.5</version>"
        "</query>");

    info_handler_.SetReply("conference.montague.net",
        "<query xmlns='http://jabber.org/protocol/disco#info'>"
        "<identity category='conference' type='text' name='Chatrooms'/>"
        "<identity category='directory' type='chatroom' name='Rooms'/>"
        "<feature var='http://jabber.org/protocol/muc'/>"
        "</query>");
    items_handler_.SetReply("conference.montague.net",
        "<query xmlns='http://jabber.org/protocol/disco#items'>"
        "<item jid='balcony@conference.montague.net'/>"
        "</query>");
    version_handler_.SetError("conference.montague.net",
                              XSE_SERVICE_UNAVAILABLE);

    info_handler_.SetError("users.montague.net", XSE_ITEM_NOT_FOUND);
  }

  virtual void TearDown() {
    plugin_.Destroy();
    router_.RemoveHandler(&info_handler_);
    router_.RemoveHandler(&items_handler_);
    router_.RemoveHandler(&version_handler_);
  }

  XmlElement* Route(const char* xml) {
    std::unique_ptr<XmlElement> iq(XmlElement::ForStr(xml));
    EXPECT_TRUE(iq.get() != NULL);
    return router_.Route(iq.get());
  }

  IqRouter router_;
  FakeIqHandler info_handler_;
  FakeIqHandler items_handler_;
  FakeIqHandler version_handler_;
  jbrowse_base::OptionsFile options_;
  BrowsePlugin plugin_;
};

TEST_F(BrowsePluginTest, UnavailableBeforeInitialize) {
  EXPECT_FALSE(plugin_.initialized());
  std::unique_ptr<XmlElement> reply(Route(kBrowseRequest));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_SERVICE_UNAVAILABLE) != NULL);
}

TEST_F(BrowsePluginTest, BrowsesThroughRouter) {
  ASSERT_TRUE(plugin_.Initialize());
  std::unique_ptr<XmlElement> reply(Route(kBrowseRequest));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"result\""
            " to=\"romeo@montague.net/orchard\" from=\"montague.net\""
            " id=\"b1\">"
            "<query xmlns=\"jabber:iq:browse\" jid=\"montague.net\""
            " category=\"service\" type=\"jabber\" name=\"Montague\""
            " version=\"4.7.5\">"
            "<ns>http://jabber.org/protocol/disco#info</ns>"
            "<ns>jabber:iq:browse</ns>"
            "<item jid=\"conference.montague.net\" category=\"conference\""
            " type=\"x-text\" name=\"Chatrooms, Rooms\">"
            "<ns>http://jabber.org/protocol/muc</ns>"
            "</item>"
            "<item jid=\"users.montague.net\"/>"
            "</query></iq>", reply->Str());

  // Nested items of children are never requested.
  ASSERT_EQ(1u, items_handler_.received().size());
  EXPECT_EQ("montague.net", items_handler_.received()[0]->Attr(QN_TO));
}

TEST_F(BrowsePluginTest, ConcatIdentitiesFromOptions) {
  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, true));
  ASSERT_TRUE(plugin_.Initialize());
  std::unique_ptr<XmlElement> reply(Route(kBrowseRequest));
  ASSERT_TRUE(reply.get() != NULL);

  const XmlElement* item =
      reply->FirstNamed(QN_BROWSE_QUERY)->FirstNamed(QN_BROWSE_ITEM);
  ASSERT_TRUE(item != NULL);
  EXPECT_EQ("x-conference_and_directory", item->Attr(QN_CATEGORY));
  EXPECT_EQ("chatroom_and_text", item->Attr(QN_TYPE));
}

TEST_F(BrowsePluginTest, SetIsRefused) {
  ASSERT_TRUE(plugin_.Initialize());
  std::unique_ptr<XmlElement> reply(Route(
      "<iq xmlns='jabber:client' type='set' id='b2'"
      " from='romeo@montague.net/orchard' to='montague.net'>"
      "<query xmlns='jabber:iq:browse'/></iq>"));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_FEATURE_NOT_IMPLEMENTED) != NULL);
  EXPECT_TRUE(info_handler_.received().empty());
}

TEST_F(BrowsePluginTest, AdvertisesBrowseFeature) {
  std::vector<std::string> features = router_.GetFeatures();
  EXPECT_EQ(3u, features.size());

  ASSERT_TRUE(plugin_.Initialize());
  features = router_.GetFeatures();
  ASSERT_EQ(4u, features.size());
  EXPECT_EQ("http://jabber.org/protocol/disco#info", features[0]);
  EXPECT_EQ("http://jabber.org/protocol/disco#items", features[1]);
  EXPECT_EQ(NS_BROWSE, features[2]);
  EXPECT_EQ("jabber:iq:version", features[3]);
}

TEST_F(BrowsePluginTest, InitializeAndDestroyAreIdempotent) {
  ASSERT_TRUE(plugin_.Initialize());
  BrowseIqHandler* handler = plugin_.handler();
  EXPECT_TRUE(plugin_.Initialize());
  EXPECT_EQ(handler, plugin_.handler());

  plugin_.Destroy();
  EXPECT_FALSE(plugin_.initialized());
  EXPECT_FALSE(router_.HasHandler(QN_BROWSE_QUERY));
  plugin_.Destroy();

  ASSERT_TRUE(plugin_.Initialize());
  EXPECT_TRUE(router_.HasHandler(QN_BROWSE_QUERY));
}

TEST_F(BrowsePluginTest, SecondPluginCannotRegister) {
  ASSERT_TRUE(plugin_.Initialize());
  BrowsePlugin other(&router_, NULL);
  EXPECT_FALSE(other.Initialize());
  EXPECT_FALSE(other.initialized());
  EXPECT_TRUE(plugin_.initialized());
}

TEST_F(BrowsePluginTest, ConcurrentBrowsesUseDistinctRequestIds) {
  const int kBrowses = 200;
  ASSERT_TRUE(plugin_.Initialize());

  int first_mismatches = 0;
  int second_mismatches = 0;
  std::thread first(BrowseRepeatedly, plugin_.handler(), kBrowses,
                    &first_mismatches);
  std::thread second(BrowseRepeatedly, plugin_.handler(), kBrowses,
                     &second_mismatches);
  first.join();
  second.join();
  EXPECT_EQ(0, first_mismatches);
  EXPECT_EQ(0, second_mismatches);

  std::set<std::string> ids;
  size_t count = 0;
  CollectIds(info_handler_, &ids, &count);
  CollectIds(items_handler_, &ids, &count);
  CollectIds(version_handler_, &ids, &count);
  // Root info, version and items, then info and version for each child.
  EXPECT_EQ(2u * kBrowses * 7, count);
  EXPECT_EQ(count, ids.size());
}

}  // namespace jbrowse
