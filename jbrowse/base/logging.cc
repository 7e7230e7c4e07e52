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

#include "jbrowse/base/logging.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <chrono>
#include <iomanip>
#include <mutex>
#include <thread>

namespace jbrowse_base {

namespace {

// Serializes writes to stderr so lines from different threads don't interleave.
std::mutex& OutputLock() {
  static std::mutex* lock = new std::mutex;
  return *lock;
}

uint32_t TimeMillis() {
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now().time_since_epoch()).count());
}

}  // namespace

/////////////////////////////////////////////////////////////////////////////
// LogMessage
/////////////////////////////////////////////////////////////////////////////

const int LogMessage::NO_LOGGING = LS_ERROR + 1;

#if !defined(NDEBUG)
static const int LOG_DEFAULT = LS_INFO;
#else
static const int LOG_DEFAULT = LogMessage::NO_LOGGING;
#endif

int LogMessage::min_sev_ = LOG_DEFAULT;
int LogMessage::dbg_sev_ = LOG_DEFAULT;
int LogMessage::ctx_sev_ = LS_SENSITIVE;

bool LogMessage::thread_ = false;
bool LogMessage::timestamp_ = false;

LogMessage::LogMessage(const char* file, int line, LoggingSeverity sev)
    : severity_(sev) {
  // Make sure the start time is set on the first message.
  LogStartTime();

  if (timestamp_) {
    uint32_t time = TimeMillis() - LogStartTime();
    print_stream_ << "[" << std::setfill('0') << std::setw(3) << (time / 1000)
                  << ":" << std::setw(3) << (time % 1000) << std::setfill(' ')
                  << "] ";
  }

  if (thread_) {
    print_stream_ << "[" << std::this_thread::get_id() << "] ";
  }

  if (severity_ >= ctx_sev_ && file != NULL) {
    print_stream_ << Describe(sev) << "(" << DescribeFile(file)
                  << ":" << line << "): ";
  }
}

LogMessage::~LogMessage() {
  print_stream_ << std::endl;

  if (severity_ >= dbg_sev_) {
    OutputToDebug(print_stream_.str());
  }
}

uint32_t LogMessage::LogStartTime() {
  static const uint32_t g_start = TimeMillis();
  return g_start;
}

void LogMessage::LogContext(int min_sev) {
  ctx_sev_ = min_sev;
}

void LogMessage::LogThreads(bool on) {
  thread_ = on;
}

void LogMessage::LogTimestamps(bool on) {
  timestamp_ = on;
}

void LogMessage::LogToDebug(int min_sev) {
  dbg_sev_ = min_sev;
  min_sev_ = min_sev;
}

void LogMessage::ConfigureLogging(const char* params) {
  int debug_level = GetLogToDebug();

  std::istringstream in(params ? params : "");
  std::string token;
  while (in >> token) {
    // Logging features
    if (token == "tstamp") {
      LogTimestamps();
    } else if (token == "thread") {
      LogThreads();

    // Logging levels
    } else if (token == "sensitive") {
      debug_level = LS_SENSITIVE;
    } else if (token == "verbose") {
      debug_level = LS_VERBOSE;
    } else if (token == "info") {
      debug_level = LS_INFO;
    } else if (token == "warning") {
      debug_level = LS_WARNING;
    } else if (token == "error") {
      debug_level = LS_ERROR;
    } else if (token == "none") {
      debug_level = NO_LOGGING;
    } else {
      int level = ParseLogSeverity(token);
      if (level != NO_LOGGING)
        debug_level = level;
    }
  }

  LogToDebug(debug_level);
}

int LogMessage::ParseLogSeverity(const std::string& value) {
  int level = NO_LOGGING;
  if (value == "LS_SENSITIVE") {
    level = LS_SENSITIVE;
  } else if (value == "LS_VERBOSE") {
    level = LS_VERBOSE;
  } else if (value == "LS_INFO") {
    level = LS_INFO;
  } else if (value == "LS_WARNING") {
    level = LS_WARNING;
  } else if (value == "LS_ERROR") {
    level = LS_ERROR;
  } else if (!value.empty() && isdigit(static_cast<unsigned char>(value[0]))) {
    level = atoi(value.c_str());  // NOLINT
  }
  return level;
}

const char* LogMessage::Describe(LoggingSeverity sev) {
  switch (sev) {
  case LS_SENSITIVE: return "Sensitive";
  case LS_VERBOSE:   return "Verbose";
  case LS_INFO:      return "Info";
  case LS_WARNING:   return "Warning";
  case LS_ERROR:     return "Error";
  default:           return "<unknown>";
  }
}

const char* LogMessage::DescribeFile(const char* file) {
  const char* end1 = ::strrchr(file, '/');
  const char* end2 = ::strrchr(file, '\\');
  if (!end1 && !end2)
    return file;
  else
    return (end1 > end2) ? end1 + 1 : end2 + 1;
}

void LogMessage::OutputToDebug(const std::string& str) {
  std::lock_guard<std::mutex> lock(OutputLock());
  fprintf(stderr, "%s", str.c_str());
  fflush(stderr);
}

}  // namespace jbrowse_base
