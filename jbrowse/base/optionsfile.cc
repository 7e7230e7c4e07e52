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

#include "jbrowse/base/optionsfile.h"

#include <errno.h>
#include <stdlib.h>

#include <fstream>
#include <sstream>

#include "jbrowse/base/logging.h"
#include "jbrowse/base/stringutils.h"

namespace jbrowse_base {

OptionsFile::OptionsFile(const std::string& path) : path_(path) {
}

bool OptionsFile::Load() {
  options_.clear();
  std::ifstream stream(path_.c_str());
  if (!stream.is_open()) {
    LOG_F(LS_WARNING) << "Could not open " << path_ << ", err=" << errno;
    // We do not consider this an error because we expect there to be no file
    // until somebody saves a setting.
    return true;
  }
  std::string line;
  while (std::getline(stream, line)) {
    size_t equals_pos = line.find('=');
    if (equals_pos == std::string::npos) {
      // Not an error either. Ignore the line and keep going.
      LOG_F(LS_WARNING) << "Ignoring malformed line in " << path_;
      continue;
    }
    std::string key(line, 0, equals_pos);
    std::string value(line, equals_pos + 1, line.length() - (equals_pos + 1));
    options_[key] = value;
  }
  if (stream.bad()) {
    LOG_F(LS_ERROR) << "Error when reading from " << path_;
    return false;
  }
  return true;
}

bool OptionsFile::Save() {
  std::ofstream stream(path_.c_str(), std::ios::out | std::ios::trunc);
  if (!stream.is_open()) {
    LOG_F(LS_ERROR) << "Could not open " << path_ << ", err=" << errno;
    return false;
  }
  for (OptionsMap::const_iterator i = options_.begin(); i != options_.end();
       ++i) {
    stream << i->first << '=' << i->second << '\n';
  }
  stream.flush();
  if (!stream.good()) {
    LOG_F(LS_ERROR) << "Unable to write to " << path_;
    return false;
  }
  return true;
}

bool OptionsFile::IsLegalName(const std::string& name) {
  for (size_t pos = 0; pos < name.length(); ++pos) {
    if (name[pos] == '\n' || name[pos] == '\\' || name[pos] == '=') {
      LOG(LS_WARNING) << "Ignoring operation for illegal option " << name;
      return false;
    }
  }
  return true;
}

bool OptionsFile::IsLegalValue(const std::string& value) {
  for (size_t pos = 0; pos < value.length(); ++pos) {
    if (value[pos] == '\n' || value[pos] == '\\') {
      LOG(LS_WARNING) << "Ignoring operation for illegal value " << value;
      return false;
    }
  }
  return true;
}

bool OptionsFile::GetStringValue(const std::string& option,
                                 std::string* out_val) const {
  LOG(LS_VERBOSE) << "OptionsFile::GetStringValue " << option;
  if (!IsLegalName(option)) {
    return false;
  }
  OptionsMap::const_iterator i = options_.find(option);
  if (i == options_.end()) {
    return false;
  }
  *out_val = i->second;
  return true;
}

bool OptionsFile::GetIntValue(const std::string& option,
                              int* out_val) const {
  std::string value;
  if (!GetStringValue(option, &value)) {
    return false;
  }
  const char* begin = value.c_str();
  char* end = NULL;
  errno = 0;
  long parsed = strtol(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE ||
      parsed != static_cast<int>(parsed)) {
    LOG(LS_WARNING) << "Option " << option << " is not an integer: " << value;
    return false;
  }
  *out_val = static_cast<int>(parsed);
  return true;
}

bool OptionsFile::GetBoolValue(const std::string& option,
                               bool* out_val) const {
  std::string value;
  if (!GetStringValue(option, &value)) {
    return false;
  }
  value = string_trim(value);
  if (ascii_equals_ignore_case(value, "true") || value == "1") {
    *out_val = true;
  } else if (ascii_equals_ignore_case(value, "false") || value == "0") {
    *out_val = false;
  } else {
    LOG(LS_WARNING) << "Option " << option << " is not a boolean: " << value;
    return false;
  }
  return true;
}

bool OptionsFile::SetStringValue(const std::string& option,
                                 const std::string& value) {
  LOG(LS_VERBOSE) << "OptionsFile::SetStringValue " << option << ":" << value;
  if (!IsLegalName(option) || !IsLegalValue(value)) {
    return false;
  }
  options_[option] = value;
  return true;
}

bool OptionsFile::SetIntValue(const std::string& option, int value) {
  std::ostringstream ost;
  ost << value;
  return SetStringValue(option, ost.str());
}

bool OptionsFile::SetBoolValue(const std::string& option, bool value) {
  return SetStringValue(option, value ? "true" : "false");
}

bool OptionsFile::RemoveValue(const std::string& option) {
  LOG(LS_VERBOSE) << "OptionsFile::RemoveValue " << option;
  if (!IsLegalName(option)) {
    return false;
  }
  options_.erase(option);
  return true;
}

}  // namespace jbrowse_base
