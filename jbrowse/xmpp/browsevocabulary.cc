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

#include "jbrowse/xmpp/browsevocabulary.h"

namespace jbrowse {

namespace {

struct CategoryTypes {
  const char* category;
  const char* types[12];
};

// Each type list ends at the first NULL.
const CategoryTypes kXepCategories[] = {
  { "application",
    { "bot", "calendar", "editor", "fileserver", "game", "whiteboard" } },
  { "conference",
    { "irc", "list", "private", "public", "topic", "url" } },
  { "headline",
    { "logger", "notice", "rss", "stock" } },
  { "keyword",
    { "dictionary", "dns", "software", "thesaurus", "web", "whois" } },
  { "render",
    { "en2fr", "*2*", "tts" } },
  { "service",
    { "aim", "icq", "irc", "jabber", "jud", "msn", "pager", "serverlist",
      "sms", "smtp", "yahoo" } },
  { "user",
    { "client", "forward", "inbox", "portable", "voice" } },
  { "validate",
    { "grammar", "spell", "xml" } },
};

BrowseVocabulary::CategoryMap BuildXepCategories() {
  BrowseVocabulary::CategoryMap categories;
  for (size_t i = 0; i < sizeof(kXepCategories) / sizeof(kXepCategories[0]);
       ++i) {
    std::set<std::string>& types = categories[kXepCategories[i].category];
    for (const char* const* type = kXepCategories[i].types; *type; ++type)
      types.insert(*type);
  }
  return categories;
}

}  // namespace

BrowseVocabulary::BrowseVocabulary(const CategoryMap& categories)
    : categories_(categories) {
}

BrowseVocabulary::~BrowseVocabulary() {
}

const BrowseVocabulary& BrowseVocabulary::Default() {
  static const BrowseVocabulary vocabulary(BuildXepCategories());
  return vocabulary;
}

bool BrowseVocabulary::IsCategory(const std::string& category) const {
  return categories_.count(category) != 0;
}

bool BrowseVocabulary::IsType(const std::string& category,
                              const std::string& type) const {
  CategoryMap::const_iterator it = categories_.find(category);
  return it != categories_.end() && it->second.count(type) != 0;
}

}  // namespace jbrowse
