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

#ifndef JBROWSE_BASE_CHECKS_H_
#define JBROWSE_BASE_CHECKS_H_

// Checks for conditions that can only fail through a programming error.
// Never use these to validate input that comes off the wire; a failed check
// logs the location and aborts the process.
//
// JBROWSE_CHECK is always on. JBROWSE_DCHECK compiles to nothing in release
// builds (NDEBUG defined).

namespace jbrowse_base {

void Fatal(const char* file, int line, const char* format, ...);

}  // namespace jbrowse_base

#define FATAL_ERROR(msg) \
  do { jbrowse_base::Fatal(__FILE__, __LINE__, "%s", msg); } while (0)

#define UNREACHABLE() FATAL_ERROR("unreachable code")

#define JBROWSE_CHECK(condition) \
  do { \
    if (!(condition)) { \
      jbrowse_base::Fatal(__FILE__, __LINE__, "Check failed: %s", \
                          #condition); \
    } \
  } while (0)

#if !defined(NDEBUG)
#define JBROWSE_DCHECK(condition) JBROWSE_CHECK(condition)
#else
#define JBROWSE_DCHECK(condition) \
  while (false) JBROWSE_CHECK(condition)
#endif

#endif  // JBROWSE_BASE_CHECKS_H_
