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

#ifndef JBROWSE_BASE_MAYBE_H_
#define JBROWSE_BASE_MAYBE_H_

#include <utility>

#include "jbrowse/base/checks.h"

namespace jbrowse_base {

// A value that is either present or absent. Browse results need it to tell
// an absent attribute apart from one that is present but empty.
//
// The contained T is default-constructed while the Maybe is empty.
template <typename T>
class Maybe {
 public:
  Maybe() : has_value_(false) {}

  explicit Maybe(const T& val) : value_(val), has_value_(true) {}
  explicit Maybe(T&& val) : value_(std::move(val)), has_value_(true) {}

  Maybe(const Maybe&) = default;
  Maybe(Maybe&& m) : value_(std::move(m.value_)), has_value_(m.has_value_) {}

  Maybe& operator=(const Maybe&) = default;
  Maybe& operator=(Maybe&& m) {
    value_ = std::move(m.value_);
    has_value_ = m.has_value_;
    return *this;
  }

  friend void swap(Maybe& m1, Maybe& m2) {
    using std::swap;
    swap(m1.value_, m2.value_);
    swap(m1.has_value_, m2.has_value_);
  }

  explicit operator bool() const { return has_value_; }

  const T* operator->() const {
    JBROWSE_DCHECK(has_value_);
    return &value_;
  }
  T* operator->() {
    JBROWSE_DCHECK(has_value_);
    return &value_;
  }
  const T& operator*() const {
    JBROWSE_DCHECK(has_value_);
    return value_;
  }
  T& operator*() {
    JBROWSE_DCHECK(has_value_);
    return value_;
  }

  const T& value_or(const T& default_val) const {
    return has_value_ ? value_ : default_val;
  }

  void reset() {
    value_ = T();
    has_value_ = false;
  }

  // Two Maybes are equal if they hold equal values or are both empty.
  friend bool operator==(const Maybe& m1, const Maybe& m2) {
    return m1.has_value_ && m2.has_value_ ? m1.value_ == m2.value_
                                          : m1.has_value_ == m2.has_value_;
  }
  friend bool operator!=(const Maybe& m1, const Maybe& m2) {
    return !(m1 == m2);
  }

 private:
  T value_;
  bool has_value_;
};

}  // namespace jbrowse_base

#endif  // JBROWSE_BASE_MAYBE_H_
