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

#ifndef JBROWSE_XMLLITE_XMLNSSTACK_H_
#define JBROWSE_XMLLITE_XMLNSSTACK_H_

#include <string>
#include <utility>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/qname.h"

namespace jbrowse {

// Scoped prefix to namespace bindings. The parser pushes a frame for every
// start tag and the printer for every element it writes; bindings added
// inside a frame vanish when it is popped.
class XmlnsStack {
 public:
  XmlnsStack();
  ~XmlnsStack();

  void PushFrame();
  void PopFrame();
  void Reset();

  // Binds |prefix| in the current frame. The empty prefix is the default
  // namespace.
  void AddXmlns(const std::string& prefix, const std::string& ns);

  // The bool is false when |prefix| is unbound.
  std::pair<std::string, bool> NsForPrefix(const std::string& prefix) const;
  bool PrefixMatchesNs(const std::string& prefix, const std::string& ns) const;
  std::pair<std::string, bool> PrefixForNs(const std::string& ns,
                                           bool is_attr) const;

  // Binds a fresh prefix for |ns| unless one is already in scope. Element
  // names take the default namespace; attributes get a generated prefix.
  // Returns the prefix that was added and true, or false if nothing was
  // needed.
  std::pair<std::string, bool> AddNewPrefix(const std::string& ns,
                                            bool is_attr);

  std::string FormatQName(const QName& name, bool is_attr) const;

 private:
  typedef std::pair<std::string, std::string> Binding;

  std::vector<Binding> bindings_;
  std::vector<size_t> frames_;

  DISALLOW_COPY_AND_ASSIGN(XmlnsStack);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMLLITE_XMLNSSTACK_H_
