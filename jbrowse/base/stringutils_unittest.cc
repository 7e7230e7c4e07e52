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

#include "jbrowse/base/gunit.h"
#include "jbrowse/base/stringutils.h"

namespace jbrowse_base {

TEST(string_trim_Test, Trimming) {
  EXPECT_EQ("temp", string_trim("\n\r\t temp \n\r\t"));
  EXPECT_EQ("temp\n\r\t temp", string_trim(" temp\n\r\t temp "));
  EXPECT_EQ("temp temp", string_trim("temp temp"));
  EXPECT_EQ("", string_trim(" \r\n\t"));
  EXPECT_EQ("", string_trim(""));
}

TEST(string_trim_Test, TrimsControlCharacters) {
  EXPECT_EQ("temp", string_trim("\f\vtemp\x1f\x01"));
  EXPECT_EQ("te\fmp", string_trim("\vte\fmp\f"));
  EXPECT_EQ("temp", string_trim(std::string("\0temp\0", 6)));
  EXPECT_EQ("", string_trim("\f\v\x1b"));
  EXPECT_EQ("\x7ftemp", string_trim(" \x7ftemp"));
}

TEST(string_startsTest, StartsWith) {
  EXPECT_TRUE(starts_with("x-gateway", "x-"));
  EXPECT_TRUE(starts_with("foobar", "foobar"));
  EXPECT_TRUE(starts_with("foobar", ""));
  EXPECT_FALSE(starts_with("service", "x-"));
  EXPECT_FALSE(starts_with("x", "x-"));
  EXPECT_FALSE(starts_with("", "x"));
}

TEST(string_joinTest, Join) {
  std::set<std::string> values;
  EXPECT_EQ("", join(values, "_and_"));
  values.insert("server");
  EXPECT_EQ("server", join(values, "_and_"));
  values.insert("pubsub");
  values.insert("conference");
  // std::set iterates in lexical order.
  EXPECT_EQ("conference_and_pubsub_and_server", join(values, "_and_"));
  EXPECT_EQ("conference, pubsub, server", join(values, ", "));
}

TEST(string_ignoreCaseTest, Equals) {
  EXPECT_TRUE(ascii_equals_ignore_case("TRUE", "true"));
  EXPECT_TRUE(ascii_equals_ignore_case("", ""));
  EXPECT_FALSE(ascii_equals_ignore_case("true", "truth"));
  EXPECT_FALSE(ascii_equals_ignore_case("yes", "true"));
}

}  // namespace jbrowse_base
