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

#include "jbrowse/xmpp/jid.h"

#include <arpa/inet.h>
#include <ctype.h>
#include <netinet/in.h>

#include <string>

namespace jbrowse {

namespace {

const size_t kMaxPartLength = 1023;
const size_t kMaxLabelLength = 63;

}  // namespace

Jid::Jid() {
}

Jid::Jid(const std::string& jid_string) {
  if (jid_string.empty())
    return;

  // First find the slash and slice off that part.
  size_t slash = jid_string.find('/');
  if (slash != std::string::npos)
    resource_name_ = jid_string.substr(slash + 1);

  // Now look for the node.
  size_t at = jid_string.find('@');
  size_t domain_begin = 0;
  if (at != std::string::npos && at < slash) {
    node_name_ = jid_string.substr(0, at);
    domain_begin = at + 1;
  }

  // Whatever is left is the domain.
  size_t domain_end = (slash == std::string::npos) ? jid_string.length()
                                                   : slash;
  domain_name_ = jid_string.substr(domain_begin, domain_end - domain_begin);

  // An explicit but empty node or resource is malformed.
  if ((at != std::string::npos && at < slash && node_name_.empty()) ||
      (slash != std::string::npos && resource_name_.empty())) {
    node_name_.clear();
    domain_name_.clear();
    resource_name_.clear();
    return;
  }

  ValidateOrReset();
}

Jid::Jid(const std::string& node_name,
         const std::string& domain_name,
         const std::string& resource_name)
    : node_name_(node_name),
      domain_name_(domain_name),
      resource_name_(resource_name) {
  ValidateOrReset();
}

Jid::~Jid() {
}

void Jid::ValidateOrReset() {
  bool valid_node;
  bool valid_domain;
  bool valid_resource;

  node_name_ = PrepNode(node_name_, &valid_node);
  domain_name_ = PrepDomain(domain_name_, &valid_domain);
  resource_name_ = PrepResource(resource_name_, &valid_resource);

  if (!valid_node || !valid_domain || !valid_resource) {
    node_name_.clear();
    domain_name_.clear();
    resource_name_.clear();
  }
}

std::string Jid::Str() const {
  if (!IsValid())
    return std::string();

  std::string ret;
  if (!node_name_.empty())
    ret = node_name_ + "@";
  ret += domain_name_;
  if (!resource_name_.empty())
    ret += "/" + resource_name_;
  return ret;
}

Jid Jid::BareJid() const {
  if (!IsValid())
    return Jid();
  if (!IsFull())
    return *this;
  return Jid(node_name_, domain_name_, std::string());
}

bool Jid::IsEmpty() const {
  return node_name_.empty() && domain_name_.empty() &&
         resource_name_.empty();
}

bool Jid::IsValid() const {
  return !domain_name_.empty();
}

bool Jid::IsBare() const {
  return IsValid() && resource_name_.empty();
}

bool Jid::IsFull() const {
  return IsValid() && !resource_name_.empty();
}

bool Jid::BareEquals(const Jid& other) const {
  return other.node_name_ == node_name_ &&
         other.domain_name_ == domain_name_;
}

bool Jid::operator==(const Jid& other) const {
  return other.node_name_ == node_name_ &&
         other.domain_name_ == domain_name_ &&
         other.resource_name_ == resource_name_;
}

int Jid::Compare(const Jid& other) const {
  int compare_result = node_name_.compare(other.node_name_);
  if (compare_result != 0)
    return compare_result;
  compare_result = domain_name_.compare(other.domain_name_);
  if (compare_result != 0)
    return compare_result;
  return resource_name_.compare(other.resource_name_);
}

std::string Jid::PrepNode(const std::string& node, bool* valid) {
  *valid = false;
  std::string result;

  for (std::string::const_iterator i = node.begin(); i < node.end(); ++i) {
    bool char_valid = true;
    unsigned char ch = *i;
    if (ch <= 0x7F) {
      result += PrepNodeAscii(ch, &char_valid);
    } else {
      // TODO: apply the full nodeprep profile to non-ASCII input.
      result += tolower(ch);
    }

    if (!char_valid)
      return std::string();
  }

  if (result.length() > kMaxPartLength)
    return std::string();

  *valid = true;
  return result;
}

char Jid::PrepNodeAscii(char ch, bool* valid) {
  *valid = true;
  if (ch >= 'A' && ch <= 'Z')
    return ch + ('a' - 'A');
  if (ch <= 0x20 || ch == 0x7F)
    *valid = false;
  switch (ch) {
    case '"':
    case '&':
    case '\'':
    case '/':
    case ':':
    case '<':
    case '>':
    case '@':
      *valid = false;
      break;
  }
  return *valid ? ch : 0;
}

std::string Jid::PrepResource(const std::string& resource, bool* valid) {
  *valid = false;
  std::string result;

  for (std::string::const_iterator i = resource.begin();
       i < resource.end(); ++i) {
    bool char_valid = true;
    unsigned char ch = *i;
    if (ch <= 0x7F) {
      result += PrepResourceAscii(ch, &char_valid);
    } else {
      result += ch;
    }

    if (!char_valid)
      return std::string();
  }

  if (result.length() > kMaxPartLength)
    return std::string();

  *valid = true;
  return result;
}

char Jid::PrepResourceAscii(char ch, bool* valid) {
  *valid = !(ch >= 0 && ch < 0x20) && ch != 0x7F;
  return *valid ? ch : 0;
}

std::string Jid::PrepDomain(const std::string& domain, bool* valid) {
  *valid = false;
  if (!domain.empty() && domain[0] == '[')
    return PrepIpLiteral(domain, valid);

  std::string result;

  std::string::const_iterator last = domain.begin();
  for (std::string::const_iterator i = domain.begin(); i < domain.end(); ++i) {
    if (*i != '.')
      continue;
    bool label_valid = false;
    PrepDomainLabel(last, i, &result, &label_valid);
    if (!label_valid)
      return std::string();
    result += '.';
    last = i + 1;
  }

  bool label_valid = false;
  PrepDomainLabel(last, domain.end(), &result, &label_valid);
  if (!label_valid || result.length() > kMaxPartLength)
    return std::string();

  *valid = true;
  return result;
}

// An IPv6 address in brackets. Dotted IPv4 addresses pass as ordinary labels.
std::string Jid::PrepIpLiteral(const std::string& domain, bool* valid) {
  *valid = false;
  if (domain.length() < 3 || domain[domain.length() - 1] != ']')
    return std::string();

  std::string address = domain.substr(1, domain.length() - 2);
  in6_addr addr;
  if (inet_pton(AF_INET6, address.c_str(), &addr) != 1)
    return std::string();

  std::string result;
  for (std::string::const_iterator i = domain.begin(); i < domain.end(); ++i)
    result += tolower(static_cast<unsigned char>(*i));

  *valid = true;
  return result;
}

void Jid::PrepDomainLabel(std::string::const_iterator start,
                          std::string::const_iterator end,
                          std::string* buf, bool* valid) {
  *valid = false;

  size_t start_len = buf->length();
  for (std::string::const_iterator i = start; i < end; ++i) {
    bool char_valid = true;
    unsigned char ch = *i;
    if (ch <= 0x7F) {
      *buf += PrepDomainLabelAscii(ch, &char_valid);
    } else {
      *buf += tolower(ch);
    }

    if (!char_valid)
      return;
  }

  size_t count = buf->length() - start_len;
  if (count == 0 || count > kMaxLabelLength)
    return;

  // Labels may not start or end with a hyphen.
  if ((*buf)[start_len] == '-' || (*buf)[buf->length() - 1] == '-')
    return;

  *valid = true;
}

char Jid::PrepDomainLabelAscii(char ch, bool* valid) {
  *valid = true;
  if (ch >= 'A' && ch <= 'Z')
    return ch + ('a' - 'A');
  if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-')
    return ch;
  *valid = false;
  return 0;
}

}  // namespace jbrowse
