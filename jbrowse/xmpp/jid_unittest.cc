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

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmpp/jid.h"

using jbrowse::Jid;

TEST(JidTest, TestDomain) {
  Jid jid("dude");
  EXPECT_EQ("", jid.node());
  EXPECT_EQ("dude", jid.domain());
  EXPECT_EQ("", jid.resource());
  EXPECT_EQ("dude", jid.Str());
  EXPECT_TRUE(jid.IsValid());
  EXPECT_TRUE(jid.IsBare());
  EXPECT_FALSE(jid.IsFull());
}

TEST(JidTest, TestFullJid) {
  Jid jid("Romeo@Montague.NET/Orchard Balcony");
  EXPECT_EQ("romeo", jid.node());
  EXPECT_EQ("montague.net", jid.domain());
  EXPECT_EQ("Orchard Balcony", jid.resource());
  EXPECT_EQ("romeo@montague.net/Orchard Balcony", jid.Str());
  EXPECT_TRUE(jid.IsFull());
  EXPECT_FALSE(jid.IsBare());
}

TEST(JidTest, TestResourceMayContainSlashAndAt) {
  Jid jid("conference.example.com/room@x/y");
  EXPECT_EQ("", jid.node());
  EXPECT_EQ("conference.example.com", jid.domain());
  EXPECT_EQ("room@x/y", jid.resource());
}

TEST(JidTest, TestFromParts) {
  Jid jid("juliet", "capulet.com", "");
  EXPECT_EQ("juliet@capulet.com", jid.Str());
  EXPECT_TRUE(jid.IsBare());
  EXPECT_EQ(Jid("JULIET@capulet.com"), jid);
}

TEST(JidTest, TestBareJid) {
  Jid jid("juliet@capulet.com/balcony");
  EXPECT_EQ("juliet@capulet.com", jid.BareJid().Str());
  EXPECT_TRUE(jid.BareEquals(Jid("juliet@capulet.com")));
  EXPECT_FALSE(jid == Jid("juliet@capulet.com"));
  EXPECT_TRUE(Jid().BareJid().IsEmpty());
}

TEST(JidTest, TestMalformed) {
  const char* const kMalformed[] = {
    "",
    "@capulet.com",
    "juliet@",
    "juliet@capulet.com/",
    "jul\"iet@capulet.com",
    "jul iet@capulet.com",
    "juliet@capu let.com",
    "juliet@capulet..com",
    "juliet@capulet.com.",
    "juliet@-capulet.com",
    "juliet@capulet-.com",
    "juliet@capulet_house.com",
    "juliet@capulet.com/bal\tcony",
    "[::1",
    "[]",
    "[capulet.com]",
    "juliet@[::1]x",
    "[fe80::1%eth0]",
  };
  for (size_t i = 0; i < sizeof(kMalformed) / sizeof(kMalformed[0]); ++i) {
    Jid jid(kMalformed[i]);
    EXPECT_FALSE(jid.IsValid()) << kMalformed[i];
    EXPECT_TRUE(jid.IsEmpty()) << kMalformed[i];
    EXPECT_EQ("", jid.Str()) << kMalformed[i];
  }
}

TEST(JidTest, TestIpLiteralDomains) {
  Jid loopback("[::1]");
  EXPECT_TRUE(loopback.IsValid());
  EXPECT_EQ("[::1]", loopback.domain());
  EXPECT_EQ("[::1]", loopback.Str());

  Jid full("juliet@[2001:DB8::A]/balcony");
  EXPECT_TRUE(full.IsValid());
  EXPECT_EQ("juliet", full.node());
  EXPECT_EQ("[2001:db8::a]", full.domain());
  EXPECT_EQ("balcony", full.resource());
  EXPECT_EQ(Jid("juliet@[2001:db8::a]/balcony"), full);

  Jid ipv4("192.168.0.1");
  EXPECT_TRUE(ipv4.IsValid());
  EXPECT_EQ("192.168.0.1", ipv4.Str());
}

TEST(JidTest, TestLengthLimits) {
  std::string label(63, 'a');
  EXPECT_TRUE(Jid(label + ".com").IsValid());
  EXPECT_FALSE(Jid(label + "a.com").IsValid());

  std::string node(1023, 'n');
  EXPECT_TRUE(Jid(node + "@example.com").IsValid());
  EXPECT_FALSE(Jid(node + "n@example.com").IsValid());
}

TEST(JidTest, TestCompare) {
  Jid a("a@example.com");
  Jid b("b@example.com");
  Jid a_res("a@example.com/res");
  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_TRUE(a < a_res);
  EXPECT_EQ(0, a.Compare(Jid("A@EXAMPLE.COM")));
  EXPECT_TRUE(a != b);
}
