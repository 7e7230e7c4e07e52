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
#include <vector>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/fakeiqhandler.h"
#include "jbrowse/xmpp/iqrouter.h"

namespace jbrowse {

namespace {

XmlElement* Stanza(const std::string& xml) {
  XmlElement* stanza = XmlElement::ForStr(xml);
  EXPECT_TRUE(stanza != NULL) << xml;
  return stanza;
}

}  // namespace

class IqRouterTest : public testing::Test {
 public:
  IqRouterTest()
      : info_handler_(QN_DISCO_INFO_QUERY),
        version_handler_(QN_VERSION_QUERY) {
  }

  virtual void SetUp() {
    ASSERT_TRUE(router_.AddHandler(&info_handler_));
    ASSERT_TRUE(router_.AddHandler(&version_handler_));
    version_handler_.SetReply("example.com",
        "<query xmlns='jabber:iq:version'><version>1.0</version></query>");
  }

  virtual void TearDown() {
    router_.RemoveHandler(&info_handler_);
    router_.RemoveHandler(&version_handler_);
  }

  IqRouter router_;
  FakeIqHandler info_handler_;
  FakeIqHandler version_handler_;
};

TEST_F(IqRouterTest, RoutesByPayload) {
  std::unique_ptr<XmlElement> iq(Stanza(
      "<iq xmlns='jabber:client' type='get' to='example.com' id='1'>"
      "<query xmlns='jabber:iq:version'/></iq>"));
  std::unique_ptr<XmlElement> reply(router_.Route(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_RESULT, reply->Attr(QN_TYPE));
  EXPECT_EQ(1u, version_handler_.received().size());
  EXPECT_TRUE(info_handler_.received().empty());
}

TEST_F(IqRouterTest, UnhandledPayloadIsServiceUnavailable) {
  std::unique_ptr<XmlElement> iq(Stanza(
      "<iq xmlns='jabber:client' type='get' to='example.com' id='2'>"
      "<query xmlns='jabber:iq:last'/></iq>"));
  std::unique_ptr<XmlElement> reply(router_.Route(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_ERROR, reply->Attr(QN_TYPE));
  const XmlElement* error = reply->FirstNamed(QN_ERROR);
  ASSERT_TRUE(error != NULL);
  EXPECT_TRUE(error->FirstNamed(QN_STANZA_SERVICE_UNAVAILABLE) != NULL);
}

TEST_F(IqRouterTest, ResponsesAreNotAnswered) {
  std::unique_ptr<XmlElement> result(Stanza(
      "<iq xmlns='jabber:client' type='result' id='3'>"
      "<query xmlns='jabber:iq:version'/></iq>"));
  EXPECT_TRUE(router_.Route(result.get()) == NULL);

  std::unique_ptr<XmlElement> error(Stanza(
      "<iq xmlns='jabber:client' type='error' id='4'>"
      "<query xmlns='jabber:iq:last'/></iq>"));
  EXPECT_TRUE(router_.Route(error.get()) == NULL);
  EXPECT_TRUE(version_handler_.received().empty());
}

TEST_F(IqRouterTest, UnknownTypeIsBadRequest) {
  std::unique_ptr<XmlElement> iq(Stanza(
      "<iq xmlns='jabber:client' type='query' id='5'>"
      "<query xmlns='jabber:iq:version'/></iq>"));
  std::unique_ptr<XmlElement> reply(router_.Route(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_BAD_REQUEST) != NULL);
}

TEST_F(IqRouterTest, MissingPayloadIsBadRequest) {
  std::unique_ptr<XmlElement> iq(Stanza(
      "<iq xmlns='jabber:client' type='get' id='6'/>"));
  std::unique_ptr<XmlElement> reply(router_.Route(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_ERROR, reply->Attr(QN_TYPE));
}

TEST_F(IqRouterTest, NonIqIsIgnored) {
  std::unique_ptr<XmlElement> message(Stanza(
      "<message xmlns='jabber:client' type='chat'><body>hi</body></message>"));
  EXPECT_TRUE(router_.Route(message.get()) == NULL);
}

TEST_F(IqRouterTest, OneHandlerPerPayload) {
  FakeIqHandler duplicate(QN_VERSION_QUERY);
  EXPECT_FALSE(router_.AddHandler(&duplicate));
  EXPECT_FALSE(router_.RemoveHandler(&duplicate));
  EXPECT_TRUE(router_.HasHandler(QN_VERSION_QUERY));

  EXPECT_TRUE(router_.RemoveHandler(&version_handler_));
  EXPECT_FALSE(router_.HasHandler(QN_VERSION_QUERY));
  EXPECT_FALSE(router_.RemoveHandler(&version_handler_));
}

TEST_F(IqRouterTest, FeaturesAreMerged) {
  FakeIqHandler second_info(QN_DISCO_ITEMS_QUERY);
  ASSERT_TRUE(router_.AddHandler(&second_info));

  std::vector<std::string> features = router_.GetFeatures();
  ASSERT_EQ(3u, features.size());
  EXPECT_EQ(NS_DISCO_INFO, features[0]);
  EXPECT_EQ(NS_DISCO_ITEMS, features[1]);
  EXPECT_EQ(NS_VERSION, features[2]);

  EXPECT_TRUE(router_.RemoveHandler(&second_info));
}

}  // namespace jbrowse
