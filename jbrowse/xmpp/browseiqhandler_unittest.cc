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
#include "jbrowse/base/optionsfile.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/browseiqhandler.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/fakediscogateway.h"

namespace jbrowse {

namespace {

const char kServer[] = "example.com";
const char kChild[] = "pubsub.example.com";

}  // namespace

class BrowseIqHandlerTest : public testing::Test {
 public:
  BrowseIqHandlerTest()
      : options_(GetTestScratchFile("browseiqhandler_options")),
        handler_(&gateway_, &options_) {
  }

  virtual void SetUp() {
    gateway_.AddIdentity(kServer, "server", "im", "Example");
    gateway_.AddFeature(kServer, "jabber:iq:version");
    gateway_.SetVersion(kServer, "4.7.5");
    gateway_.AddItem(kServer, kChild);
    gateway_.AddIdentity(kChild, "pubsub", "service", "Publish-Subscribe");
    gateway_.AddIdentity(kChild, "pubsub", "pep", "");
  }

  XmlElement* Handle(const std::string& type, const std::string& to) {
    std::unique_ptr<XmlElement> iq(XmlElement::ForStr(
        "<iq xmlns='jabber:client' type='" + type + "' id='b1'"
        " from='romeo@example.com/orchard' to='" + to + "'>"
        "<query xmlns='jabber:iq:browse'/></iq>"));
    EXPECT_TRUE(iq.get() != NULL);
    return handler_.HandleIq(iq.get());
  }

  FakeDiscoGateway gateway_;
  jbrowse_base::OptionsFile options_;
  BrowseIqHandler handler_;
};

TEST_F(BrowseIqHandlerTest, AnswersGetWithBrowseTree) {
  std::unique_ptr<XmlElement> reply(Handle(STR_GET, kServer));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"result\""
            " to=\"romeo@example.com/orchard\" from=\"example.com\" id=\"b1\">"
            "<query xmlns=\"jabber:iq:browse\" jid=\"example.com\""
            " category=\"service\" type=\"jabber\" name=\"Example\""
            " version=\"4.7.5\">"
            "<ns>jabber:iq:version</ns>"
            "<item jid=\"pubsub.example.com\" category=\"x-pubsub\""
            " type=\"service\" name=\"Publish-Subscribe\"/>"
            "</query></iq>", reply->Str());
}

TEST_F(BrowseIqHandlerTest, QueriesOnBehalfOfSender) {
  std::unique_ptr<XmlElement> reply(Handle(STR_GET, kServer));
  ASSERT_FALSE(gateway_.queries().empty());
  EXPECT_EQ(kServer, gateway_.queries()[0].target);
  EXPECT_EQ("romeo@example.com/orchard", gateway_.queries()[0].requester);
}

TEST_F(BrowseIqHandlerTest, RefusesSet) {
  std::unique_ptr<XmlElement> reply(Handle(STR_SET, kServer));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_ERROR, reply->Attr(QN_TYPE));
  EXPECT_EQ("b1", reply->Attr(QN_ID));

  // The request's query comes back ahead of the error.
  const XmlElement* query = reply->FirstElement();
  ASSERT_TRUE(query != NULL);
  EXPECT_EQ(QName(QN_BROWSE_QUERY), query->Name());
  const XmlElement* error = query->NextElement();
  ASSERT_TRUE(error != NULL);
  EXPECT_EQ(QName(QN_ERROR), error->Name());
  EXPECT_TRUE(error->FirstNamed(QN_STANZA_FEATURE_NOT_IMPLEMENTED) != NULL);
  EXPECT_TRUE(error->NextElement() == NULL);

  EXPECT_TRUE(gateway_.queries().empty());
}

TEST_F(BrowseIqHandlerTest, IgnoresResponses) {
  std::unique_ptr<XmlElement> result(Handle(STR_RESULT, kServer));
  EXPECT_TRUE(result.get() == NULL);
  std::unique_ptr<XmlElement> error(Handle(STR_ERROR, kServer));
  EXPECT_TRUE(error.get() == NULL);
  EXPECT_TRUE(gateway_.queries().empty());
}

TEST_F(BrowseIqHandlerTest, RejectsUnknownType) {
  std::unique_ptr<XmlElement> reply(Handle("subscribe", kServer));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_BAD_REQUEST) != NULL);
  EXPECT_TRUE(gateway_.queries().empty());
}

TEST_F(BrowseIqHandlerTest, RejectsMalformedTarget) {
  std::unique_ptr<XmlElement> reply(Handle(STR_GET, "bad@@example..com"));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_ERROR, reply->Attr(QN_TYPE));
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_JID_MALFORMED) != NULL);
  EXPECT_TRUE(gateway_.queries().empty());
}

TEST_F(BrowseIqHandlerTest, MissingToBrowsesSendersServer) {
  std::unique_ptr<XmlElement> iq(XmlElement::ForStr(
      "<iq xmlns='jabber:client' type='get' id='b2'"
      " from='romeo@example.com/orchard'>"
      "<query xmlns='jabber:iq:browse'/></iq>"));
  ASSERT_TRUE(iq.get() != NULL);
  std::unique_ptr<XmlElement> reply(handler_.HandleIq(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_EQ(STR_RESULT, reply->Attr(QN_TYPE));
  EXPECT_EQ("b2", reply->Attr(QN_ID));

  const XmlElement* query = reply->FirstNamed(QN_BROWSE_QUERY);
  ASSERT_TRUE(query != NULL);
  EXPECT_EQ(kServer, query->Attr(QN_JID));
  EXPECT_EQ("service", query->Attr(QN_CATEGORY));
  ASSERT_FALSE(gateway_.queries().empty());
  EXPECT_EQ(kServer, gateway_.queries()[0].target);
}

TEST_F(BrowseIqHandlerTest, MissingToAndFromIsMalformed) {
  std::unique_ptr<XmlElement> iq(XmlElement::ForStr(
      "<iq xmlns='jabber:client' type='get' id='b3'>"
      "<query xmlns='jabber:iq:browse'/></iq>"));
  ASSERT_TRUE(iq.get() != NULL);
  std::unique_ptr<XmlElement> reply(handler_.HandleIq(iq.get()));
  ASSERT_TRUE(reply.get() != NULL);
  EXPECT_TRUE(reply->FirstNamed(QN_ERROR)->FirstNamed(
      QN_STANZA_JID_MALFORMED) != NULL);
  EXPECT_TRUE(gateway_.queries().empty());
}

TEST_F(BrowseIqHandlerTest, ConcatIdentitiesOptionIsReadPerRequest) {
  BrowseResult result = handler_.Browse(Jid(kChild), Jid());
  EXPECT_EQ("x-pubsub", *result.category());
  EXPECT_EQ("service", *result.type());

  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, true));
  result = handler_.Browse(Jid(kChild), Jid());
  EXPECT_EQ("x-pubsub", *result.category());
  EXPECT_EQ("pep_and_service", *result.type());

  ASSERT_TRUE(options_.SetStringValue(CONFIG_CONCAT_IDENTITIES, "maybe"));
  result = handler_.Browse(Jid(kChild), Jid());
  EXPECT_EQ("service", *result.type());
}

TEST_F(BrowseIqHandlerTest, WorksWithoutOptions) {
  BrowseIqHandler handler(&gateway_, NULL);
  BrowseResult result = handler.Browse(Jid(kServer), Jid());
  EXPECT_EQ("service", *result.category());
  EXPECT_EQ(1u, result.children().size());
}

TEST_F(BrowseIqHandlerTest, AdvertisesBrowseNamespace) {
  EXPECT_EQ(QName(QN_BROWSE_QUERY), handler_.GetQueryName());
  std::vector<std::string> features;
  handler_.GetFeatures(&features);
  ASSERT_EQ(1u, features.size());
  EXPECT_EQ(NS_BROWSE, features[0]);
}

}  // namespace jbrowse
