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

// A fake DiscoGateway for use in unit tests.

#ifndef JBROWSE_XMPP_FAKEDISCOGATEWAY_H_
#define JBROWSE_XMPP_FAKEDISCOGATEWAY_H_

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "jbrowse/xmpp/discogateway.h"
#include "jbrowse/xmpp/jid.h"

namespace jbrowse {

class FakeDiscoGateway : public DiscoGateway {
 public:
  enum QueryKind {
    QUERY_INFO,
    QUERY_ITEMS,
    QUERY_VERSION,
  };

  struct Query {
    QueryKind kind;
    std::string target;
    std::string requester;
  };

  // As DiscoGateway. Unknown targets fail like an item-not-found reply.
  virtual bool QueryInfo(const Jid& target,
                         const Jid& requester,
                         DiscoInfo* info) {
    Record(QUERY_INFO, target, requester);
    std::map<std::string, DiscoInfo>::const_iterator it =
        infos_.find(target.Str());
    if (it == infos_.end() || Fails(QUERY_INFO, target))
      return false;
    *info = it->second;
    return true;
  }

  virtual bool QueryItems(const Jid& target,
                          const Jid& requester,
                          std::vector<DiscoItem>* items) {
    Record(QUERY_ITEMS, target, requester);
    std::map<std::string, std::vector<DiscoItem> >::const_iterator it =
        items_.find(target.Str());
    if (it == items_.end() || Fails(QUERY_ITEMS, target))
      return false;
    *items = it->second;
    return true;
  }

  virtual bool QueryVersion(const Jid& target,
                            const Jid& requester,
                            std::string* version) {
    Record(QUERY_VERSION, target, requester);
    std::map<std::string, std::string>::const_iterator it =
        versions_.find(target.Str());
    if (it == versions_.end() || Fails(QUERY_VERSION, target))
      return false;
    *version = it->second;
    return true;
  }

  // Canned replies, keyed by the target jid string.
  void AddIdentity(const std::string& jid,
                   const std::string& category,
                   const std::string& type,
                   const std::string& name) {
    infos_[jid].identities.push_back(DiscoIdentity(category, type, name));
  }

  void AddFeature(const std::string& jid, const std::string& var) {
    infos_[jid].features.push_back(var);
  }

  // Makes |jid| answer disco#info even with no identities or features.
  void SetEmptyInfo(const std::string& jid) {
    infos_[jid];
  }

  void AddItem(const std::string& jid, const std::string& item_jid) {
    DiscoItem item;
    item.jid = item_jid;
    items_[jid].push_back(item);
  }

  void SetEmptyItems(const std::string& jid) {
    items_[jid];
  }

  void SetVersion(const std::string& jid, const std::string& version) {
    versions_[jid] = version;
  }

  // Makes every |kind| query on |jid| fail, whatever is configured.
  void FailQuery(QueryKind kind, const std::string& jid) {
    failures_.insert(std::make_pair(kind, jid));
  }

  const std::vector<Query>& queries() const { return queries_; }

  size_t CountQueries(QueryKind kind) const {
    size_t count = 0;
    for (std::vector<Query>::const_iterator it = queries_.begin();
         it != queries_.end(); ++it) {
      if (it->kind == kind)
        ++count;
    }
    return count;
  }

  void ClearQueries() {
    queries_.clear();
  }

 private:
  void Record(QueryKind kind, const Jid& target, const Jid& requester) {
    Query query;
    query.kind = kind;
    query.target = target.Str();
    query.requester = requester.Str();
    queries_.push_back(query);
  }

  bool Fails(QueryKind kind, const Jid& target) const {
    return failures_.count(std::make_pair(kind, target.Str())) != 0;
  }

  std::map<std::string, DiscoInfo> infos_;
  std::map<std::string, std::vector<DiscoItem> > items_;
  std::map<std::string, std::string> versions_;
  std::set<std::pair<QueryKind, std::string> > failures_;
  std::vector<Query> queries_;
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_FAKEDISCOGATEWAY_H_
