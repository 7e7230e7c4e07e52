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

#ifndef JBROWSE_XMLLITE_XMLPARSER_H_
#define JBROWSE_XMLLITE_XMLPARSER_H_

#include <expat.h>

#include <string>

#include "jbrowse/base/constructormagic.h"
#include "jbrowse/xmllite/xmlnsstack.h"

namespace jbrowse {

// What a parse handler may ask of the parser while it is being called back.
class XmlParseContext {
 public:
  virtual ~XmlParseContext() {}
  // Maps a raw "prefix:local" name to a QName using the bindings in scope.
  // Returns an empty QName if the prefix is unbound.
  virtual QName ResolveQName(const char* qname, bool is_attr) = 0;
  virtual void RaiseError(XML_Error err) = 0;
  virtual void GetPosition(unsigned long* line, unsigned long* column,
                           unsigned long* byte_index) = 0;
};

class XmlParseHandler {
 public:
  virtual ~XmlParseHandler() {}
  virtual void StartElement(XmlParseContext* pctx,
                            const char* name, const char** atts) = 0;
  virtual void EndElement(XmlParseContext* pctx, const char* name) = 0;
  virtual void CharacterData(XmlParseContext* pctx,
                             const char* text, int len) = 0;
  virtual void Error(XmlParseContext* pctx, XML_Error error_code) = 0;
};

// Push parser over expat. Namespace declarations are tracked here rather
// than by expat so that xmlns attributes reach the handler unchanged.
class XmlParser {
 public:
  // Parses a complete document. Returns false if it is not well-formed, in
  // which case |pxph| has seen Error().
  static bool ParseXml(XmlParseHandler* pxph, const std::string& text);

  explicit XmlParser(XmlParseHandler* pxph);
  virtual ~XmlParser();

  bool Parse(const char* data, size_t len, bool is_final);
  void Reset();

  // expat callbacks
  void ExpatStartElement(const char* name, const char** atts);
  void ExpatEndElement(const char* name);
  void ExpatCharacterData(const char* text, int len);
  void ExpatXmlDecl(const char* ver, const char* enc, int standalone);

 private:
  class ParseContext : public XmlParseContext {
   public:
    ParseContext();
    virtual ~ParseContext();

    virtual QName ResolveQName(const char* qname, bool is_attr);
    virtual void RaiseError(XML_Error err) {
      if (!raised_)
        raised_ = err;
    }
    virtual void GetPosition(unsigned long* line, unsigned long* column,
                             unsigned long* byte_index);

    XML_Error RaisedError() const { return raised_; }
    void Reset();

    void StartElement();
    void EndElement();
    void StartNamespace(const char* prefix, const char* ns);
    void SetPosition(XML_Size line, XML_Size column, XML_Index byte_index);

   private:
    XmlnsStack xmlnsstack_;
    XML_Error raised_;
    XML_Size line_number_;
    XML_Size column_number_;
    XML_Index byte_index_;
  };

  void CreateExpat();
  void UpdatePosition();

  ParseContext context_;
  XML_Parser expat_;
  XmlParseHandler* pxph_;
  bool sent_error_;

  DISALLOW_COPY_AND_ASSIGN(XmlParser);
};

}  // namespace jbrowse

#endif  // JBROWSE_XMLLITE_XMLPARSER_H_
