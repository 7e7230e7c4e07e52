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

#ifndef JBROWSE_XMPP_BROWSERESULT_H_
#define JBROWSE_XMPP_BROWSERESULT_H_

#include <set>
#include <string>
#include <vector>

#include "jbrowse/base/maybe.h"
#include "jbrowse/xmpp/jid.h"

namespace jbrowse {

class XmlElement;

// The XEP-0011 description of one entity and, for the root of a browse, its
// direct children. Children never have children of their own.
class BrowseResult {
 public:
  BrowseResult();
  explicit BrowseResult(const Jid& jid);
  ~BrowseResult();

  const Jid& jid() const { return jid_; }
  void set_jid(const Jid& jid) { jid_ = jid; }

  const jbrowse_base::Maybe<std::string>& category() const { return category_; }
  void set_category(const jbrowse_base::Maybe<std::string>& category) {
    category_ = category;
  }
  const jbrowse_base::Maybe<std::string>& type() const { return type_; }
  void set_type(const jbrowse_base::Maybe<std::string>& type) { type_ = type; }
  const jbrowse_base::Maybe<std::string>& name() const { return name_; }
  void set_name(const jbrowse_base::Maybe<std::string>& name) { name_ = name; }
  const jbrowse_base::Maybe<std::string>& version() const { return version_; }
  void set_version(const jbrowse_base::Maybe<std::string>& version) {
    version_ = version;
  }

  const std::set<std::string>& namespaces() const { return namespaces_; }
  void set_namespaces(const std::set<std::string>& namespaces) {
    namespaces_ = namespaces;
  }

  // In the order they were added.
  const std::vector<BrowseResult>& children() const { return children_; }

  // Adds |child| stripped of its own children. Returns false, leaving the
  // existing entry alone, if a child with the same jid is already present.
  bool AddChild(const BrowseResult& child);

  // The <query xmlns='jabber:iq:browse'/> element for this result, with an
  // <item/> per child. The caller owns the result.
  XmlElement* ToElement() const;

  bool operator==(const BrowseResult& other) const;
  bool operator!=(const BrowseResult& other) const {
    return !operator==(other);
  }

 private:
  // Sets the jid, category, type, name and version attributes and appends
  // the <ns/> children.
  void Describe(XmlElement* element) const;

  Jid jid_;
  jbrowse_base::Maybe<std::string> category_;
  jbrowse_base::Maybe<std::string> type_;
  jbrowse_base::Maybe<std::string> name_;
  jbrowse_base::Maybe<std::string> version_;
  std::set<std::string> namespaces_;
  std::vector<BrowseResult> children_;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_BROWSERESULT_H_
