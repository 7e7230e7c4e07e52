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

#include "jbrowse/xmpp/identityresolver.h"

#include "jbrowse/base/stringutils.h"
#include "jbrowse/xmpp/browsevocabulary.h"

using jbrowse_base::Maybe;

namespace jbrowse {

namespace {

const char kExtensionPrefix[] = "x-";
const char kTokenSeparator[] = "_and_";
const char kNameSeparator[] = ", ";

// Adds |value| to |values| unless it is blank.
bool AddTrimmed(const std::string& value, std::set<std::string>* values) {
  std::string trimmed = jbrowse_base::string_trim(value);
  if (trimmed.empty())
    return false;
  values->insert(trimmed);
  return true;
}

std::string Extension(const std::set<std::string>& tokens) {
  return kExtensionPrefix + jbrowse_base::join(tokens, kTokenSeparator);
}

bool IsOnly(const std::set<std::string>& values, const char* value) {
  return values.size() == 1 && *values.begin() == value;
}

}  // namespace

IdentityResolver::IdentityResolver(const BrowseVocabulary& vocabulary)
    : vocabulary_(vocabulary) {
}

Maybe<std::string> IdentityResolver::ResolveCategory(
    const std::vector<DiscoIdentity>& identities, bool concat) const {
  std::set<std::string> categories;
  std::set<std::string> types;

  std::vector<DiscoIdentity>::const_iterator it;
  for (it = identities.begin(); it != identities.end(); ++it) {
    AddTrimmed(it->category, &categories);
    AddTrimmed(it->type, &types);
    // An identity without a category does not end the scan, but its type
    // still counts.
    if (!categories.empty() && !concat)
      break;
  }

  if (categories.empty())
    return Maybe<std::string>();
  if (categories.size() > 1)
    return Maybe<std::string>(Extension(categories));

  const std::string& category = *categories.begin();
  if (category == "gateway")
    return Maybe<std::string>("service");
  if (category == "server" && IsOnly(types, "im"))
    return Maybe<std::string>("service");
  if (category == "collaboration" && IsOnly(types, "whiteboard"))
    return Maybe<std::string>("application");
  if (vocabulary_.IsCategory(category))
    return Maybe<std::string>(category);
  return Maybe<std::string>(kExtensionPrefix + category);
}

Maybe<std::string> IdentityResolver::ResolveType(
    const Maybe<std::string>& category,
    const std::vector<DiscoIdentity>& identities,
    bool concat) const {
  if (!category)
    return Maybe<std::string>();

  std::set<std::string> types;
  std::vector<DiscoIdentity>::const_iterator it;
  for (it = identities.begin(); it != identities.end(); ++it) {
    if (AddTrimmed(it->type, &types) && !concat)
      break;
  }

  if (jbrowse_base::starts_with(*category, kExtensionPrefix))
    return Maybe<std::string>(jbrowse_base::join(types, kTokenSeparator));

  if (types.empty())
    return Maybe<std::string>();
  if (types.size() > 1)
    return Maybe<std::string>(Extension(types));

  const std::string& type = *types.begin();
  if (*category == "service" && type == "im")
    return Maybe<std::string>("jabber");
  if (vocabulary_.IsType(*category, type))
    return Maybe<std::string>(type);
  return Maybe<std::string>(kExtensionPrefix + type);
}

// static
Maybe<std::string> IdentityResolver::ResolveName(
    const std::vector<DiscoIdentity>& identities) {
  std::set<std::string> names;
  std::vector<DiscoIdentity>::const_iterator it;
  for (it = identities.begin(); it != identities.end(); ++it)
    AddTrimmed(it->name, &names);

  if (names.empty())
    return Maybe<std::string>();
  return Maybe<std::string>(jbrowse_base::join(names, kNameSeparator));
}

// static
std::set<std::string> IdentityResolver::ResolveNamespaces(
    const std::vector<std::string>& features) {
  std::set<std::string> namespaces;
  std::vector<std::string>::const_iterator it;
  for (it = features.begin(); it != features.end(); ++it)
    AddTrimmed(*it, &namespaces);
  return namespaces;
}

}  // namespace jbrowse
