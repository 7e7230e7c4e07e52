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

#include "jbrowse/xmllite/xmlparser.h"

#include <string.h>

#include <string>

#include "jbrowse/base/logging.h"
#include "jbrowse/base/stringutils.h"
#include "jbrowse/xmllite/xmlconstants.h"

namespace jbrowse {

namespace {

void StartElementCallback(void* user_data, const char* name,
                          const char** atts) {
  static_cast<XmlParser*>(user_data)->ExpatStartElement(name, atts);
}

void EndElementCallback(void* user_data, const char* name) {
  static_cast<XmlParser*>(user_data)->ExpatEndElement(name);
}

void CharacterDataCallback(void* user_data, const char* text, int len) {
  static_cast<XmlParser*>(user_data)->ExpatCharacterData(text, len);
}

void XmlDeclCallback(void* user_data, const char* ver, const char* enc,
                     int standalone) {
  static_cast<XmlParser*>(user_data)->ExpatXmlDecl(ver, enc, standalone);
}

}  // namespace

XmlParser::XmlParser(XmlParseHandler* pxph)
    : expat_(NULL),
      pxph_(pxph),
      sent_error_(false) {
  CreateExpat();
}

XmlParser::~XmlParser() {
  XML_ParserFree(expat_);
}

void XmlParser::CreateExpat() {
  expat_ = XML_ParserCreate(NULL);
  XML_SetUserData(expat_, this);
  XML_SetElementHandler(expat_, StartElementCallback, EndElementCallback);
  XML_SetCharacterDataHandler(expat_, CharacterDataCallback);
  XML_SetXmlDeclHandler(expat_, XmlDeclCallback);
}

void XmlParser::Reset() {
  XML_ParserFree(expat_);
  CreateExpat();
  context_.Reset();
  sent_error_ = false;
}

void XmlParser::UpdatePosition() {
  context_.SetPosition(XML_GetCurrentLineNumber(expat_),
                       XML_GetCurrentColumnNumber(expat_),
                       XML_GetCurrentByteIndex(expat_));
}

void XmlParser::ExpatStartElement(const char* name, const char** atts) {
  if (context_.RaisedError() != XML_ERROR_NONE)
    return;
  context_.StartElement();
  for (const char** att = atts; *att; att += 2) {
    if (strncmp(*att, STR_XMLNS, 5) != 0)
      continue;
    if ((*att)[5] == '\0') {
      context_.StartNamespace(STR_EMPTY, *(att + 1));
    } else if ((*att)[5] == ':') {
      // A prefix may not be bound to the empty namespace in XML 1.0.
      if (**(att + 1) == '\0') {
        context_.RaiseError(XML_ERROR_SYNTAX);
        return;
      }
      context_.StartNamespace(*att + 6, *(att + 1));
    }
  }
  UpdatePosition();
  pxph_->StartElement(&context_, name, atts);
}

void XmlParser::ExpatEndElement(const char* name) {
  if (context_.RaisedError() != XML_ERROR_NONE)
    return;
  context_.EndElement();
  UpdatePosition();
  pxph_->EndElement(&context_, name);
}

void XmlParser::ExpatCharacterData(const char* text, int len) {
  if (context_.RaisedError() != XML_ERROR_NONE)
    return;
  UpdatePosition();
  pxph_->CharacterData(&context_, text, len);
}

void XmlParser::ExpatXmlDecl(const char* ver, const char* enc,
                             int standalone) {
  if (context_.RaisedError() != XML_ERROR_NONE)
    return;

  if (ver && std::string("1.0") != ver) {
    context_.RaiseError(XML_ERROR_SYNTAX);
    return;
  }

  if (standalone == 0) {
    context_.RaiseError(XML_ERROR_SYNTAX);
    return;
  }

  if (enc && !jbrowse_base::ascii_equals_ignore_case(enc, "UTF-8")) {
    context_.RaiseError(XML_ERROR_INCORRECT_ENCODING);
    return;
  }
}

bool XmlParser::Parse(const char* data, size_t len, bool is_final) {
  if (sent_error_)
    return false;

  if (XML_Parse(expat_, data, static_cast<int>(len), is_final) !=
      XML_STATUS_OK) {
    UpdatePosition();
    context_.RaiseError(XML_GetErrorCode(expat_));
  }

  if (context_.RaisedError() != XML_ERROR_NONE) {
    sent_error_ = true;
    unsigned long line = 0;
    unsigned long column = 0;
    unsigned long byte_index = 0;
    context_.GetPosition(&line, &column, &byte_index);
    LOG(LS_WARNING) << "XML parse error at " << line << ":" << column
                    << ": " << XML_ErrorString(context_.RaisedError());
    pxph_->Error(&context_, context_.RaisedError());
    return false;
  }

  return true;
}

bool XmlParser::ParseXml(XmlParseHandler* pxph, const std::string& text) {
  XmlParser parser(pxph);
  return parser.Parse(text.c_str(), text.length(), true);
}

XmlParser::ParseContext::ParseContext()
    : raised_(XML_ERROR_NONE),
      line_number_(0),
      column_number_(0),
      byte_index_(0) {
}

XmlParser::ParseContext::~ParseContext() {
}

void XmlParser::ParseContext::StartNamespace(const char* prefix,
                                             const char* ns) {
  xmlnsstack_.AddXmlns(*prefix ? prefix : STR_EMPTY, ns);
}

void XmlParser::ParseContext::StartElement() {
  xmlnsstack_.PushFrame();
}

void XmlParser::ParseContext::EndElement() {
  xmlnsstack_.PopFrame();
}

QName XmlParser::ParseContext::ResolveQName(const char* qname, bool is_attr) {
  const char* c = strchr(qname, ':');
  if (c == NULL) {
    // Unprefixed attributes carry no namespace.
    if (is_attr)
      return QName(STR_EMPTY, qname);
    return QName(xmlnsstack_.NsForPrefix(STR_EMPTY).first, qname);
  }

  std::pair<std::string, bool> result =
      xmlnsstack_.NsForPrefix(std::string(qname, c - qname));
  if (!result.second)
    return QName();
  return QName(result.first, c + 1);
}

void XmlParser::ParseContext::Reset() {
  xmlnsstack_.Reset();
  raised_ = XML_ERROR_NONE;
  line_number_ = 0;
  column_number_ = 0;
  byte_index_ = 0;
}

void XmlParser::ParseContext::GetPosition(unsigned long* line,
                                          unsigned long* column,
                                          unsigned long* byte_index) {
  if (line != NULL)
    *line = static_cast<unsigned long>(line_number_);
  if (column != NULL)
    *column = static_cast<unsigned long>(column_number_);
  if (byte_index != NULL)
    *byte_index = static_cast<unsigned long>(byte_index_);
}

void XmlParser::ParseContext::SetPosition(XML_Size line, XML_Size column,
                                          XML_Index byte_index) {
  line_number_ = line;
  column_number_ = column;
  byte_index_ = byte_index;
}

}  // namespace jbrowse
