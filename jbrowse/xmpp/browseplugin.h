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

#ifndef JBROWSE_XMPP_BROWSEPLUGIN_H_
#define JBROWSE_XMPP_BROWSEPLUGIN_H_

#include <memory>

#include "jbrowse/base/constructormagic.h"

namespace jbrowse_base {
class OptionsFile;
}

namespace jbrowse {

class BrowseIqHandler;
class IqDiscoGateway;
class IqRouter;

// Installs the jabber:iq:browse handler into a host's iq router. The
// handler answers from the disco#info, disco#items and version handlers
// registered with the same router.
class BrowsePlugin {
 public:
  // |router| and |options| must outlive the plugin. |options| may be NULL.
  BrowsePlugin(IqRouter* router, const jbrowse_base::OptionsFile* options);
  ~BrowsePlugin();

  // Registers the handler. Does nothing if already initialized. Fails if
  // the router already has a browse handler.
  bool Initialize();
  // Deregisters and releases the handler. Safe to call more than once.
  void Destroy();

  bool initialized() const { return handler_.get() != NULL; }
  BrowseIqHandler* handler() { return handler_.get(); }

 private:
  IqRouter* router_;
  const jbrowse_base::OptionsFile* options_;
  std::unique_ptr<IqDiscoGateway> gateway_;
  std::unique_ptr<BrowseIqHandler> handler_;

  DISALLOW_COPY_AND_ASSIGN(BrowsePlugin);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_BROWSEPLUGIN_H_
