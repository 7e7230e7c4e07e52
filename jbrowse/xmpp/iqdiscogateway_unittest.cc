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

#include <string>
#include <vector>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/fakeiqhandler.h"
#include "jbrowse/xmpp/iqdiscogateway.h"
#include "jbrowse/xmpp/iqrouter.h"
#include "jbrowse/xmpp/jid.h"

namespace jbrowse {

namespace {

const char kTarget[] = "conference.example.com";
const char kRequester[] = "romeo@example.com/orchard";

}  // namespace

class IqDiscoGatewayTest : public testing::Test {
 public:
  IqDiscoGatewayTest()
      : info_handler_(QN_DISCO_INFO_QUERY),
        items_handler_(QN_DISCO_ITEMS_QUERY),
        version_handler_(QN_VERSION_QUERY),
        gateway_(&router_) {
  }

  virtual void SetUp() {
    ASSERT_TRUE(router_.AddHandler(&info_handler_));
    ASSERT_TRUE(router_.AddHandler(&items_handler_));
    ASSERT_TRUE(router_.AddHandler(&version_handler_));
  }

  virtual void TearDown() {
    router_.RemoveHandler(&info_handler_);
    router_.RemoveHandler(&items_handler_);
    router_.RemoveHandler(&version_handler_);
  }

  IqRouter router_;
  FakeIqHandler info_handler_;
  FakeIqHandler items_handler_;
  FakeIqHandler version_handler_;
  IqDiscoGateway gateway_;
};

TEST_F(IqDiscoGatewayTest, QueryInfo) {
  info_handler_.SetReply(kTarget,
      "<query xmlns='http://jabber.org/protocol/disco#info'>"
      "<identity category='conference' type='text' name='Chatrooms'/>"
      "<identity category='directory' type='chatroom'/>"
      "<feature var='http://jabber.org/protocol/muc'/>"
      "<feature var=' jabber:iq:version '/>"
      "</query>");

  DiscoInfo info;
  ASSERT_TRUE(gateway_.QueryInfo(Jid(kTarget), Jid(kRequester), &info));
  ASSERT_EQ(2u, info.identities.size());
  EXPECT_EQ("conference", info.identities[0].category);
  EXPECT_EQ("text", info.identities[0].type);
  EXPECT_EQ("Chatrooms", info.identities[0].name);
  EXPECT_EQ("directory", info.identities[1].category);
  EXPECT_EQ("", info.identities[1].name);
  ASSERT_EQ(2u, info.features.size());
  EXPECT_EQ("http://jabber.org/protocol/muc", info.features[0]);
  // Values are passed on untrimmed.
  EXPECT_EQ(" jabber:iq:version ", info.features[1]);
}

TEST_F(IqDiscoGatewayTest, RequestIsAddressedOnBehalfOfRequester) {
  info_handler_.SetReply(kTarget,
      "<query xmlns='http://jabber.org/protocol/disco#info'/>");
  DiscoInfo info;
  ASSERT_TRUE(gateway_.QueryInfo(Jid(kTarget), Jid(kRequester), &info));
  ASSERT_EQ(1u, info_handler_.received().size());

  const XmlElement* request = info_handler_.received()[0];
  EXPECT_EQ(STR_GET, request->Attr(QN_TYPE));
  EXPECT_EQ(kTarget, request->Attr(QN_TO));
  EXPECT_EQ(kRequester, request->Attr(QN_FROM));
  EXPECT_FALSE(request->Attr(QN_ID).empty());
  EXPECT_EQ(QName(QN_DISCO_INFO_QUERY), request->FirstElementName());
}

TEST_F(IqDiscoGatewayTest, RequestIdsAreUnique) {
  version_handler_.SetReply(kTarget,
      "<query xmlns='jabber:iq:version'><version>1.0</version></query>");
  std::string version;
  EXPECT_TRUE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
  EXPECT_TRUE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
  ASSERT_EQ(2u, version_handler_.received().size());
  EXPECT_NE(version_handler_.received()[0]->Attr(QN_ID),
            version_handler_.received()[1]->Attr(QN_ID));
}

TEST_F(IqDiscoGatewayTest, ErrorReplyFails) {
  info_handler_.SetError(kTarget, XSE_SERVICE_UNAVAILABLE);
  DiscoInfo info;
  info.features.push_back("untouched");
  EXPECT_FALSE(gateway_.QueryInfo(Jid(kTarget), Jid(kRequester), &info));
  ASSERT_EQ(1u, info.features.size());
  EXPECT_EQ("untouched", info.features[0]);
}

TEST_F(IqDiscoGatewayTest, UnknownTargetFails) {
  std::vector<DiscoItem> items;
  EXPECT_FALSE(gateway_.QueryItems(Jid("nowhere.example.com"),
                                   Jid(kRequester), &items));
}

TEST_F(IqDiscoGatewayTest, WrongPayloadFails) {
  info_handler_.SetReply(kTarget,
      "<query xmlns='http://jabber.org/protocol/disco#items'/>");
  DiscoInfo info;
  EXPECT_FALSE(gateway_.QueryInfo(Jid(kTarget), Jid(kRequester), &info));

  items_handler_.SetReply(kTarget, "");
  std::vector<DiscoItem> items;
  EXPECT_FALSE(gateway_.QueryItems(Jid(kTarget), Jid(kRequester), &items));

  version_handler_.SetReply(kTarget,
      "<info xmlns='jabber:iq:version'><version>1.0</version></info>");
  std::string version;
  EXPECT_FALSE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
}

TEST_F(IqDiscoGatewayTest, MissingHandlerFails) {
  router_.RemoveHandler(&version_handler_);
  std::string version;
  EXPECT_FALSE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
}

TEST_F(IqDiscoGatewayTest, QueryItems) {
  items_handler_.SetReply(kTarget,
      "<query xmlns='http://jabber.org/protocol/disco#items'>"
      "<item jid='room1@conference.example.com' name='Room 1'/>"
      "<item jid='not a jid'/>"
      "<item name='no address'/>"
      "<item jid='conference.example.com' node='rooms'/>"
      "</query>");

  std::vector<DiscoItem> items;
  ASSERT_TRUE(gateway_.QueryItems(Jid(kTarget), Jid(kRequester), &items));
  ASSERT_EQ(3u, items.size());
  EXPECT_EQ("room1@conference.example.com", items[0].jid);
  EXPECT_EQ("Room 1", items[0].name);
  EXPECT_EQ("not a jid", items[1].jid);
  EXPECT_EQ("rooms", items[2].node);
}

TEST_F(IqDiscoGatewayTest, QueryVersion) {
  version_handler_.SetReply(kTarget,
      "<query xmlns='jabber:iq:version'>"
      "<name>Openfire</name><version>\n  4.7.5 \n</version>"
      "</query>");
  std::string version;
  ASSERT_TRUE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
  EXPECT_EQ("4.7.5", version);
}

TEST_F(IqDiscoGatewayTest, VersionWithoutVersionElementFails) {
  version_handler_.SetReply(kTarget,
      "<query xmlns='jabber:iq:version'><name>Openfire</name></query>");
  std::string version = "untouched";
  EXPECT_FALSE(gateway_.QueryVersion(Jid(kTarget), Jid(kRequester), &version));
  EXPECT_EQ("untouched", version);
}

}  // namespace jbrowse
