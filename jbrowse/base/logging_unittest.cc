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
#include "jbrowse/base/logging.h"

namespace jbrowse_base {

class LoggingTest : public testing::Test {
 public:
  virtual void SetUp() {
    saved_debug_sev_ = LogMessage::GetLogToDebug();
  }

  virtual void TearDown() {
    LogMessage::LogToDebug(saved_debug_sev_);
  }

 private:
  int saved_debug_sev_;
};

TEST_F(LoggingTest, ParseLogSeverity) {
  EXPECT_EQ(LS_SENSITIVE, LogMessage::ParseLogSeverity("LS_SENSITIVE"));
  EXPECT_EQ(LS_VERBOSE, LogMessage::ParseLogSeverity("LS_VERBOSE"));
  EXPECT_EQ(LS_WARNING, LogMessage::ParseLogSeverity("LS_WARNING"));
  EXPECT_EQ(LS_ERROR, LogMessage::ParseLogSeverity("4"));
  EXPECT_EQ(LogMessage::NO_LOGGING, LogMessage::ParseLogSeverity("loud"));
}

TEST_F(LoggingTest, ConfigureLoggingSetsThreshold) {
  LogMessage::ConfigureLogging("warning");
  EXPECT_EQ(LS_WARNING, LogMessage::GetLogToDebug());
  EXPECT_FALSE(LogMessage::Loggable(LS_INFO));
  EXPECT_TRUE(LogMessage::Loggable(LS_ERROR));

  LogMessage::ConfigureLogging("verbose");
  EXPECT_EQ(LS_VERBOSE, LogMessage::GetLogToDebug());
  EXPECT_TRUE(LogMessage::Loggable(LS_VERBOSE));

  LogMessage::ConfigureLogging("none");
  EXPECT_FALSE(LogMessage::Loggable(LS_ERROR));
}

TEST_F(LoggingTest, SensitiveIsOnlyLoggedOnRequest) {
  LogMessage::ConfigureLogging("verbose");
  EXPECT_FALSE(LogMessage::Loggable(LS_SENSITIVE));
  LogMessage::ConfigureLogging("sensitive");
  EXPECT_TRUE(LogMessage::Loggable(LS_SENSITIVE));
}

TEST_F(LoggingTest, MessagesBelowThresholdAreNotFormatted) {
  LogMessage::LogToDebug(LS_WARNING);
  int evaluated = 0;
  LOG(LS_INFO) << ++evaluated;
  EXPECT_EQ(0, evaluated);
  LOG_V(LS_ERROR) << ++evaluated;
  EXPECT_EQ(1, evaluated);
}

TEST_F(LoggingTest, UnknownTokensLeaveThresholdAlone) {
  LogMessage::LogToDebug(LS_INFO);
  LogMessage::ConfigureLogging("loud quiet");
  EXPECT_EQ(LS_INFO, LogMessage::GetLogToDebug());
}

}  // namespace jbrowse_base
