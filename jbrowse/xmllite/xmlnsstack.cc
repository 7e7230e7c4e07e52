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

#include "jbrowse/xmllite/xmlnsstack.h"

#include <sstream>

#include "jbrowse/base/stringutils.h"
#include "jbrowse/xmllite/xmlconstants.h"

namespace jbrowse {

namespace {

const char kGeneratedPrefix[] = "ns";

}  // namespace

XmlnsStack::XmlnsStack() {
}

XmlnsStack::~XmlnsStack() {
}

void XmlnsStack::PushFrame() {
  frames_.push_back(bindings_.size());
}

void XmlnsStack::PopFrame() {
  if (frames_.empty())
    return;
  size_t prev_size = frames_.back();
  frames_.pop_back();
  if (prev_size < bindings_.size())
    bindings_.resize(prev_size);
}

void XmlnsStack::Reset() {
  bindings_.clear();
  frames_.clear();
}

void XmlnsStack::AddXmlns(const std::string& prefix, const std::string& ns) {
  bindings_.push_back(Binding(prefix, ns));
}

std::pair<std::string, bool> XmlnsStack::NsForPrefix(
    const std::string& prefix) const {
  if (prefix == STR_XML)
    return std::make_pair(std::string(NS_XML), true);
  if (prefix == STR_XMLNS)
    return std::make_pair(std::string(NS_XMLNS), true);
  // Any other name starting with "xml" is reserved.
  if (prefix.size() >= 3 &&
      jbrowse_base::ascii_equals_ignore_case(prefix.substr(0, 3), STR_XML)) {
    return std::make_pair(std::string(), false);
  }

  std::vector<Binding>::const_reverse_iterator it;
  for (it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
    if (it->first == prefix)
      return std::make_pair(it->second, true);
  }

  if (prefix.empty())
    return std::make_pair(std::string(), true);
  return std::make_pair(std::string(), false);
}

bool XmlnsStack::PrefixMatchesNs(const std::string& prefix,
                                 const std::string& ns) const {
  std::pair<std::string, bool> match = NsForPrefix(prefix);
  return match.second && match.first == ns;
}

std::pair<std::string, bool> XmlnsStack::PrefixForNs(const std::string& ns,
                                                     bool is_attr) const {
  if (ns == NS_XML)
    return std::make_pair(std::string(STR_XML), true);
  if (ns == NS_XMLNS)
    return std::make_pair(std::string(STR_XMLNS), true);
  // Unprefixed attributes are never in the default namespace.
  if (is_attr ? ns.empty() : PrefixMatchesNs(STR_EMPTY, ns))
    return std::make_pair(std::string(), true);

  std::vector<Binding>::const_reverse_iterator it;
  for (it = bindings_.rbegin(); it != bindings_.rend(); ++it) {
    if (it->second == ns && !it->first.empty() &&
        PrefixMatchesNs(it->first, ns)) {
      return std::make_pair(it->first, true);
    }
  }
  return std::make_pair(std::string(), false);
}

std::pair<std::string, bool> XmlnsStack::AddNewPrefix(const std::string& ns,
                                                      bool is_attr) {
  if (PrefixForNs(ns, is_attr).second)
    return std::make_pair(std::string(), false);

  if (!is_attr) {
    AddXmlns(STR_EMPTY, ns);
    return std::make_pair(std::string(), true);
  }

  std::string prefix;
  int i = 1;
  do {
    std::ostringstream ss;
    ss << kGeneratedPrefix << i++;
    prefix = ss.str();
  } while (NsForPrefix(prefix).second);
  AddXmlns(prefix, ns);
  return std::make_pair(prefix, true);
}

std::string XmlnsStack::FormatQName(const QName& name, bool is_attr) const {
  std::string prefix = PrefixForNs(name.Namespace(), is_attr).first;
  if (prefix.empty())
    return name.LocalPart();
  return prefix + ':' + name.LocalPart();
}

}  // namespace jbrowse
