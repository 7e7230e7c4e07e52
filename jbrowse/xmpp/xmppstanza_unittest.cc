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
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmpp/constants.h"
#include "jbrowse/xmpp/xmppstanza.h"

namespace jbrowse {

TEST(XmppStanzaTest, MakeIq) {
  std::unique_ptr<XmlElement> iq(MakeIq(STR_GET, Jid("example.com"),
                                        Jid("romeo@example.com/orchard"),
                                        "q1"));
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"get\" to=\"example.com\""
            " from=\"romeo@example.com/orchard\" id=\"q1\"/>", iq->Str());
}

TEST(XmppStanzaTest, MakeIqLeavesOutMissingAddresses) {
  std::unique_ptr<XmlElement> iq(MakeIq(STR_GET, Jid(), Jid("bad@"), ""));
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"get\"/>", iq->Str());
}

TEST(XmppStanzaTest, MakeIqResultSwapsAddresses) {
  std::unique_ptr<XmlElement> request(XmlElement::ForStr(
      "<iq xmlns='jabber:client' type='get' id='b1'"
      " from='romeo@example.com/orchard' to='example.com'>"
      "<query xmlns='jabber:iq:browse'/></iq>"));
  ASSERT_TRUE(request.get() != NULL);

  std::unique_ptr<XmlElement> result(MakeIqResult(request.get()));
  EXPECT_EQ(STR_RESULT, result->Attr(QN_TYPE));
  EXPECT_EQ("romeo@example.com/orchard", result->Attr(QN_TO));
  EXPECT_EQ("example.com", result->Attr(QN_FROM));
  EXPECT_EQ("b1", result->Attr(QN_ID));
  EXPECT_TRUE(result->FirstElement() == NULL);
}

TEST(XmppStanzaTest, MakeIqErrorEchoesPayload) {
  std::unique_ptr<XmlElement> request(XmlElement::ForStr(
      "<iq xmlns='jabber:client' type='set' id='b2'"
      " from='romeo@example.com/orchard' to='example.com'>"
      "<query xmlns='jabber:iq:browse'/></iq>"));
  ASSERT_TRUE(request.get() != NULL);

  std::unique_ptr<XmlElement> error(
      MakeIqError(request.get(), XSE_FEATURE_NOT_IMPLEMENTED));
  EXPECT_EQ("<iq xmlns=\"jabber:client\" type=\"error\""
            " to=\"romeo@example.com/orchard\" from=\"example.com\""
            " id=\"b2\">"
            "<query xmlns=\"jabber:iq:browse\"/>"
            "<error type=\"cancel\">"
            "<feature-not-implemented"
            " xmlns=\"urn:ietf:params:xml:ns:xmpp-stanzas\"/>"
            "</error></iq>", error->Str());
}

TEST(XmppStanzaTest, MakeIqErrorWithoutPayload) {
  std::unique_ptr<XmlElement> request(
      MakeIq(STR_GET, Jid("example.com"), Jid(), "b3"));
  std::unique_ptr<XmlElement> error(
      MakeIqError(request.get(), XSE_BAD_REQUEST));
  const XmlElement* first = error->FirstElement();
  ASSERT_TRUE(first != NULL);
  EXPECT_EQ(QName(QN_ERROR), first->Name());
  EXPECT_EQ(STR_MODIFY, first->Attr(QN_TYPE));
  EXPECT_TRUE(first->FirstNamed(QN_STANZA_BAD_REQUEST) != NULL);
  EXPECT_FALSE(error->HasAttr(QN_TO));
}

TEST(XmppStanzaTest, ErrorConditions) {
  EXPECT_STREQ("bad-request", StanzaErrorCondition(XSE_BAD_REQUEST));
  EXPECT_STREQ("item-not-found", StanzaErrorCondition(XSE_ITEM_NOT_FOUND));
  EXPECT_STREQ("jid-malformed", StanzaErrorCondition(XSE_JID_MALFORMED));
  EXPECT_STREQ("service-unavailable",
               StanzaErrorCondition(XSE_SERVICE_UNAVAILABLE));
  EXPECT_STREQ("internal-server-error",
               StanzaErrorCondition(XSE_INTERNAL_SERVER_ERROR));
  EXPECT_STREQ("modify", StanzaErrorType(XSE_JID_MALFORMED));
  EXPECT_STREQ("cancel", StanzaErrorType(XSE_SERVICE_UNAVAILABLE));
}

}  // namespace jbrowse
