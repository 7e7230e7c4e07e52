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

// A reuseable entry point for gunit tests.

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/base/logging.h"

std::string GetTestScratchFile(const std::string& name) {
  const char* tmp = getenv("TMPDIR");
  std::string path = (tmp && *tmp) ? tmp : "/tmp";
  if (path[path.length() - 1] != '/')
    path += '/';
  return path + name;
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);

  // Whatever gtest left over is ours. --log=<params> configures logging, e.g.
  // --log="verbose tstamp".
  std::string log_params;
  bool help = false;
  for (int i = 1; i < argc; ++i) {
    if (strncmp(argv[i], "--log=", 6) == 0) {
      log_params = argv[i] + 6;
    } else if (strcmp(argv[i], "--help") == 0) {
      help = true;
    }
  }
  if (help) {
    printf("  --log=<params>  logging options to use\n");
    return 0;
  }

  // Default to LS_INFO, even for release builds to provide better test logging.
  if (jbrowse_base::LogMessage::GetLogToDebug() > jbrowse_base::LS_INFO)
    jbrowse_base::LogMessage::LogToDebug(jbrowse_base::LS_INFO);

  // Log timestamps - useful when tests are run in parallel.
  jbrowse_base::LogMessage::LogTimestamps();

  if (!log_params.empty()) {
    jbrowse_base::LogMessage::ConfigureLogging(log_params.c_str());
  }

  return RUN_ALL_TESTS();
}
