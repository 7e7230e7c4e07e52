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

#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/base/optionsfile.h"
#include "jbrowse/xmpp/browsesettings.h"
#include "jbrowse/xmpp/constants.h"

namespace jbrowse {

class BrowseSettingsTest : public testing::Test {
 public:
  BrowseSettingsTest()
      : path_(GetTestScratchFile("browsesettings_options")),
        options_(path_) {
  }

  virtual void TearDown() {
    remove(path_.c_str());
  }

  std::string path_;
  jbrowse_base::OptionsFile options_;
};

TEST_F(BrowseSettingsTest, DefaultsToFirstIdentity) {
  BrowseSettings settings;
  EXPECT_FALSE(settings.concat_identities());
  settings.Load(options_);
  EXPECT_FALSE(settings.concat_identities());
}

TEST_F(BrowseSettingsTest, ReadsConcatIdentities) {
  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, true));
  BrowseSettings settings;
  settings.Load(options_);
  EXPECT_TRUE(settings.concat_identities());

  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, false));
  settings.Load(options_);
  EXPECT_FALSE(settings.concat_identities());
}

TEST_F(BrowseSettingsTest, MalformedValueResetsToDefault) {
  BrowseSettings settings;
  settings.set_concat_identities(true);
  ASSERT_TRUE(options_.SetStringValue(CONFIG_CONCAT_IDENTITIES, "sometimes"));
  settings.Load(options_);
  EXPECT_FALSE(settings.concat_identities());
}

TEST_F(BrowseSettingsTest, RemovedValueResetsToDefault) {
  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, true));
  BrowseSettings settings;
  settings.Load(options_);
  ASSERT_TRUE(settings.concat_identities());

  ASSERT_TRUE(options_.RemoveValue(CONFIG_CONCAT_IDENTITIES));
  settings.Load(options_);
  EXPECT_FALSE(settings.concat_identities());
}

TEST_F(BrowseSettingsTest, LoadsFromPropertiesFile) {
  ASSERT_TRUE(options_.SetBoolValue(CONFIG_CONCAT_IDENTITIES, true));
  ASSERT_TRUE(options_.Save());

  jbrowse_base::OptionsFile reloaded(path_);
  ASSERT_TRUE(reloaded.Load());
  BrowseSettings settings;
  settings.Load(reloaded);
  EXPECT_TRUE(settings.concat_identities());
}

}  // namespace jbrowse
