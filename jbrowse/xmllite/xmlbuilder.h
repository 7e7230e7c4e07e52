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

#ifndef JBROWSE_XMLLITE_XMLBUILDER_H_
#define JBROWSE_XMLLITE_XMLBUILDER_H_

#include <memory>
#include <string>
#include <vector>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/xmlparser.h"

namespace jbrowse {

class XmlElement;

// Parse handler that assembles the document into an XmlElement tree.
class XmlBuilder : public XmlParseHandler {
 public:
  XmlBuilder();
  virtual ~XmlBuilder();

  virtual void StartElement(XmlParseContext* pctx,
                            const char* name, const char** atts);
  virtual void EndElement(XmlParseContext* pctx, const char* name);
  virtual void CharacterData(XmlParseContext* pctx,
                             const char* text, int len);
  virtual void Error(XmlParseContext* pctx, XML_Error err);

  // Releases the document root to the caller, or NULL after an error.
  XmlElement* CreateElement();
  // The document root, still owned by the builder.
  XmlElement* BuiltElement();
  void Reset();

 private:
  XmlElement* BuildElement(XmlParseContext* pctx,
                           const char* name, const char** atts);

  XmlElement* current_;
  std::unique_ptr<XmlElement> root_;
  std::vector<XmlElement*> parents_;

  DISALLOW_COPY_AND_ASSIGN(XmlBuilder);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMLLITE_XMLBUILDER_H_
