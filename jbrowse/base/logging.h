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

// Stream-style logging to stderr.
//
//   LOG(LS_INFO) << "Browsing " << jid.Str();
//
// LOG(sev) takes a LoggingSeverity without its namespace and compiles to
// nothing when LOGGING is 0. A message is only formatted if its severity
// passes the threshold set with LogMessage::LogToDebug or ConfigureLogging.
// LOG_V(sev) takes a severity held in a variable. LOG_F(sev) prefixes the
// message with the calling function.

#ifndef JBROWSE_BASE_LOGGING_H_
#define JBROWSE_BASE_LOGGING_H_

#include <stdint.h>

#include <sstream>
#include <string>

#include "jbrowse/base/constructormagic.h"

namespace jbrowse_base {

//  LS_SENSITIVE: Whole stanzas. They carry user addresses, so they are only
//   logged when asked for explicitly.
//  LS_VERBOSE: Every disco query made while browsing, and every stanza that
//   is dropped without a reply.
//  LS_INFO: Handler registration and refused requests. The default in debug
//   builds.
//  LS_WARNING: Replies of an unexpected shape and malformed input.
//  LS_ERROR: Something that should not have occurred.
enum LoggingSeverity {
  LS_SENSITIVE,
  LS_VERBOSE,
  LS_INFO,
  LS_WARNING,
  LS_ERROR,
};

class LogMessage {
 public:
  static const int NO_LOGGING;

  LogMessage(const char* file, int line, LoggingSeverity sev);
  ~LogMessage();

  static bool Loggable(LoggingSeverity sev) { return sev >= min_sev_; }
  std::ostream& stream() { return print_stream_; }

  // Milliseconds on a monotonic clock when the first message was created.
  static uint32_t LogStartTime();

  // Prefix messages at |min_sev| and above with "Severity(file:line): ".
  static void LogContext(int min_sev);
  // Prefix messages with the id of the logging thread.
  static void LogThreads(bool on = true);
  // Prefix messages with the time elapsed since LogStartTime().
  static void LogTimestamps(bool on = true);

  // Messages below |min_sev| are dropped.
  static void LogToDebug(int min_sev);
  static int GetLogToDebug() { return dbg_sev_; }
  static int GetMinLogSeverity() { return min_sev_; }

  // Applies a space separated option string such as "verbose tstamp".
  // Recognized: sensitive, verbose, info, warning, error, none, tstamp,
  // thread, and anything ParseLogSeverity accepts.
  static void ConfigureLogging(const char* params);

  // Maps "LS_INFO" and the like, or a number, to a severity. Returns
  // NO_LOGGING for anything else.
  static int ParseLogSeverity(const std::string& value);

 private:
  static const char* Describe(LoggingSeverity sev);
  static const char* DescribeFile(const char* file);

  static void OutputToDebug(const std::string& msg);

  std::ostringstream print_stream_;
  LoggingSeverity severity_;

  // min_sev_ short-circuits the macros; dbg_sev_ gates stderr output;
  // ctx_sev_ gates the file and line prefix.
  static int min_sev_, dbg_sev_, ctx_sev_;
  static bool thread_, timestamp_;

  DISALLOW_COPY_AND_ASSIGN(LogMessage);
};

#if !defined(LOGGING)
#if !defined(NDEBUG)
#define LOGGING 1
#else
#define LOGGING 0
#endif
#endif  // !defined(LOGGING)

#ifndef LOG
#if LOGGING

// Swallows the stream so the conditional in LOG_SEVERITY_PRECONDITION has
// type void on both branches. operator& binds looser than << and tighter
// than ?:.
class LogMessageVoidify {
 public:
  LogMessageVoidify() {}
  void operator&(std::ostream&) {}
};

#define LOG_SEVERITY_PRECONDITION(sev) \
  !(jbrowse_base::LogMessage::Loggable(sev)) \
    ? (void) 0 \
    : jbrowse_base::LogMessageVoidify() &

#define LOG(sev) \
  LOG_SEVERITY_PRECONDITION(jbrowse_base::sev) \
    jbrowse_base::LogMessage(__FILE__, __LINE__, jbrowse_base::sev).stream()

#define LOG_V(sev) \
  LOG_SEVERITY_PRECONDITION(sev) \
    jbrowse_base::LogMessage(__FILE__, __LINE__, sev).stream()

#else  // !LOGGING

#define LOG(sev) \
  while (false) jbrowse_base::LogMessage(NULL, 0, jbrowse_base::sev).stream()
#define LOG_V(sev) \
  while (false) jbrowse_base::LogMessage(NULL, 0, sev).stream()

#endif  // !LOGGING

#define LOG_F(sev) LOG(sev) << __FUNCTION__ << ": "

#endif  // LOG

}  // namespace jbrowse_base

#endif  // JBROWSE_BASE_LOGGING_H_
