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

#include "jbrowse/base/stringutils.h"

#include <ctype.h>

namespace jbrowse_base {

// Space and every control character below it, NUL included.
static bool IsTrimmable(char ch) {
  return static_cast<unsigned char>(ch) <= 0x20;
}

bool starts_with(const std::string& s1, const std::string& s2) {
  return s1.compare(0, s2.length(), s2) == 0;
}

std::string string_trim(const std::string& s) {
  std::string::size_type first = 0;
  while (first < s.length() && IsTrimmable(s[first]))
    ++first;

  std::string::size_type last = s.length();
  while (last > first && IsTrimmable(s[last - 1]))
    --last;

  return s.substr(first, last - first);
}

bool ascii_equals_ignore_case(const std::string& s1, const std::string& s2) {
  if (s1.length() != s2.length())
    return false;
  for (size_t i = 0; i < s1.length(); ++i) {
    if (tolower(static_cast<unsigned char>(s1[i])) !=
        tolower(static_cast<unsigned char>(s2[i]))) {
      return false;
    }
  }
  return true;
}

std::string join(const std::set<std::string>& values,
                 const std::string& separator) {
  std::string result;
  for (std::set<std::string>::const_iterator it = values.begin();
       it != values.end(); ++it) {
    if (it != values.begin())
      result += separator;
    result += *it;
  }
  return result;
}

}  // namespace jbrowse_base
