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

#include "jbrowse/xmpp/browseplugin.h"

#include "jbrowse/base/logging.h"
#include "jbrowse/xmpp/browseiqhandler.h"
#include "jbrowse/xmpp/iqdiscogateway.h"
#include "jbrowse/xmpp/iqrouter.h"

namespace jbrowse {

BrowsePlugin::BrowsePlugin(IqRouter* router,
                           const jbrowse_base::OptionsFile* options)
    : router_(router),
      options_(options) {
}

BrowsePlugin::~BrowsePlugin() {
  Destroy();
}

bool BrowsePlugin::Initialize() {
  if (initialized())
    return true;

  std::unique_ptr<IqDiscoGateway> gateway(new IqDiscoGateway(router_));
  std::unique_ptr<BrowseIqHandler> handler(
      new BrowseIqHandler(gateway.get(), options_));
  if (!router_->AddHandler(handler.get())) {
    LOG(LS_ERROR) << "Could not register the Jabber Browsing handler";
    return false;
  }

  gateway_.swap(gateway);
  handler_.swap(handler);
  LOG(LS_INFO) << "Jabber Browsing plugin initialized";
  return true;
}

void BrowsePlugin::Destroy() {
  if (!initialized())
    return;

  if (!router_->RemoveHandler(handler_.get()))
    LOG(LS_WARNING) << "Jabber Browsing handler was not registered";
  handler_.reset();
  gateway_.reset();
  LOG(LS_INFO) << "Jabber Browsing plugin destroyed";
}

}  // namespace jbrowse
