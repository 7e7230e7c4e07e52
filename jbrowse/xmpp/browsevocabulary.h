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

#ifndef JBROWSE_XMPP_BROWSEVOCABULARY_H_
#define JBROWSE_XMPP_BROWSEVOCABULARY_H_

#include <map>
#include <set>
#include <string>

#include "jbrowse/base/constructormagic.h"

namespace jbrowse {

// The categories of XEP-0011 section 4 and the types legal within each.
// Instances are immutable once built.
class BrowseVocabulary {
 public:
  typedef std::map<std::string, std::set<std::string> > CategoryMap;

  explicit BrowseVocabulary(const CategoryMap& categories);
  ~BrowseVocabulary();

  // The table published with XEP-0011. Built on first use and shared.
  static const BrowseVocabulary& Default();

  bool IsCategory(const std::string& category) const;
  // False when |category| is unknown.
  bool IsType(const std::string& category, const std::string& type) const;

  const CategoryMap& categories() const { return categories_; }

 private:
  const CategoryMap categories_;

  DISALLOW_COPY_AND_ASSIGN(BrowseVocabulary);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_BROWSEVOCABULARY_H_
