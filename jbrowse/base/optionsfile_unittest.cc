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

#include <stdio.h>

#include <fstream>

#include "jbrowse/base/gunit.h"
#include "jbrowse/base/optionsfile.h"

namespace jbrowse_base {

static const std::string kLabelOption = "plugin.jabberbrowsing.label";
static const std::string kOwnerOption = "plugin.jabberbrowsing.owner";
static const std::string kConcatOption =
    "plugin.jabberbrowsing.concat-identities";
static const std::string kLabel = "Jabber Browsing";
static const std::string kOwner = "admin@example.com";
static const std::string kOptionWithEquals = "plugin=label";
static const std::string kOptionWithNewline = "plugin\nlabel";
static const std::string kValueWithEquals = "category=service";
static const std::string kValueWithNewline = "service\njabber";
static const std::string kEmptyString = "";
static const int kMaxItems = 250;
static const int kNegative = -634;

class OptionsFileTest : public testing::Test {
 public:
  OptionsFileTest() : path_(GetTestScratchFile(".jbrowse_optionsfile_test")) {
  }

  virtual void TearDown() {
    remove(path_.c_str());
  }

 protected:
  std::string path_;
};

TEST_F(OptionsFileTest, GetSetString) {
  OptionsFile store(path_);
  // Clear contents of the file on disk.
  EXPECT_TRUE(store.Save());
  std::string label, owner;
  EXPECT_FALSE(store.GetStringValue(kLabelOption, &label));
  EXPECT_FALSE(store.GetStringValue(kOwnerOption, &owner));
  EXPECT_TRUE(store.SetStringValue(kLabelOption, kLabel));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_TRUE(store.SetStringValue(kOwnerOption, kOwner));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_TRUE(store.GetStringValue(kLabelOption, &label));
  EXPECT_TRUE(store.GetStringValue(kOwnerOption, &owner));
  EXPECT_EQ(kLabel, label);
  EXPECT_EQ(kOwner, owner);
  EXPECT_TRUE(store.RemoveValue(kLabelOption));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_FALSE(store.GetStringValue(kLabelOption, &label));
}

TEST_F(OptionsFileTest, GetSetInt) {
  OptionsFile store(path_);
  int out;
  EXPECT_FALSE(store.GetIntValue(kLabelOption, &out));
  EXPECT_TRUE(store.SetIntValue(kLabelOption, kMaxItems));
  EXPECT_TRUE(store.SetIntValue(kOwnerOption, kNegative));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_TRUE(store.GetIntValue(kLabelOption, &out));
  EXPECT_EQ(kMaxItems, out);
  EXPECT_TRUE(store.GetIntValue(kOwnerOption, &out));
  EXPECT_EQ(kNegative, out);
  EXPECT_TRUE(store.SetStringValue(kLabelOption, kLabel));
  EXPECT_FALSE(store.GetIntValue(kLabelOption, &out));
}

TEST_F(OptionsFileTest, GetSetBool) {
  OptionsFile store(path_);
  bool out = false;
  EXPECT_FALSE(store.GetBoolValue(kConcatOption, &out));
  EXPECT_TRUE(store.SetBoolValue(kConcatOption, true));
  EXPECT_TRUE(store.GetBoolValue(kConcatOption, &out));
  EXPECT_TRUE(out);
  EXPECT_TRUE(store.SetStringValue(kConcatOption, "FALSE"));
  EXPECT_TRUE(store.GetBoolValue(kConcatOption, &out));
  EXPECT_FALSE(out);
  EXPECT_TRUE(store.SetStringValue(kConcatOption, "1"));
  EXPECT_TRUE(store.GetBoolValue(kConcatOption, &out));
  EXPECT_TRUE(out);
  EXPECT_TRUE(store.SetStringValue(kConcatOption, "sometimes"));
  out = true;
  EXPECT_FALSE(store.GetBoolValue(kConcatOption, &out));
  EXPECT_TRUE(out);
}

TEST_F(OptionsFileTest, ValuesSurviveReload) {
  {
    OptionsFile store(path_);
    EXPECT_TRUE(store.SetStringValue(kLabelOption, kLabel));
    EXPECT_TRUE(store.SetBoolValue(kConcatOption, true));
    EXPECT_TRUE(store.Save());
  }
  {
    OptionsFile store(path_);
    EXPECT_TRUE(store.Load());
    std::string out1;
    bool out2 = false;
    EXPECT_TRUE(store.GetStringValue(kLabelOption, &out1));
    EXPECT_TRUE(store.GetBoolValue(kConcatOption, &out2));
    EXPECT_EQ(kLabel, out1);
    EXPECT_TRUE(out2);
  }
}

TEST_F(OptionsFileTest, MissingFileLoadsEmpty) {
  OptionsFile store(path_ + ".does-not-exist");
  EXPECT_TRUE(store.Load());
  std::string out;
  EXPECT_FALSE(store.GetStringValue(kLabelOption, &out));
}

TEST_F(OptionsFileTest, MalformedLinesAreSkipped) {
  {
    std::ofstream file(path_.c_str());
    file << "no equals sign here\n" << kLabelOption << "=" << kLabel
         << "\n";
  }
  OptionsFile store(path_);
  EXPECT_TRUE(store.Load());
  std::string out;
  EXPECT_TRUE(store.GetStringValue(kLabelOption, &out));
  EXPECT_EQ(kLabel, out);
  EXPECT_FALSE(store.GetStringValue("no equals sign here", &out));
}

TEST_F(OptionsFileTest, IllegalCharactersAreRejected) {
  OptionsFile store(path_);
  std::string out;
  EXPECT_FALSE(store.SetStringValue(kOptionWithEquals, kLabel));
  EXPECT_FALSE(store.GetStringValue(kOptionWithEquals, &out));
  EXPECT_FALSE(store.SetStringValue(kOptionWithNewline, kLabel));
  EXPECT_FALSE(store.GetStringValue(kOptionWithNewline, &out));
  EXPECT_TRUE(store.SetStringValue(kLabelOption, kLabel));
  EXPECT_FALSE(store.SetStringValue(kLabelOption, kValueWithNewline));
  EXPECT_TRUE(store.GetStringValue(kLabelOption, &out));
  EXPECT_EQ(kLabel, out);
  EXPECT_TRUE(store.SetStringValue(kLabelOption, kValueWithEquals));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_TRUE(store.GetStringValue(kLabelOption, &out));
  EXPECT_EQ(kValueWithEquals, out);
  EXPECT_TRUE(store.SetStringValue(kOwnerOption, kEmptyString));
  EXPECT_TRUE(store.Save());
  EXPECT_TRUE(store.Load());
  EXPECT_TRUE(store.GetStringValue(kOwnerOption, &out));
  EXPECT_EQ(kEmptyString, out);
}

}  // namespace jbrowse_base
