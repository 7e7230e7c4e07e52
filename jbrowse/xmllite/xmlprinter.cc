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

#include "jbrowse/xmllite/xmlprinter.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "jbrowse/xmllite/xmlconstants.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmllite/xmlnsstack.h"

namespace jbrowse {

namespace {

class XmlPrinterImpl {
 public:
  XmlPrinterImpl(std::ostream* pout, XmlnsStack* ns_stack)
      : pout_(pout), ns_stack_(ns_stack) {}

  void PrintElement(const XmlElement* element);

 private:
  void PrintEscaped(const std::string& text, const char* unsafe_chars);

  std::ostream* pout_;
  XmlnsStack* ns_stack_;
};

void XmlPrinterImpl::PrintElement(const XmlElement* element) {
  ns_stack_->PushFrame();

  // Declarations the element already carries.
  const XmlAttr* attr;
  for (attr = element->FirstAttr(); attr; attr = attr->NextAttr()) {
    if (attr->Name() == QN_XMLNS) {
      ns_stack_->AddXmlns(STR_EMPTY, attr->Value());
    } else if (attr->Name().Namespace() == NS_XMLNS) {
      ns_stack_->AddXmlns(attr->Name().LocalPart(), attr->Value());
    }
  }

  // Declarations the names still need.
  std::vector<std::pair<std::string, std::string> > new_ns;
  std::pair<std::string, bool> prefix =
      ns_stack_->AddNewPrefix(element->Name().Namespace(), false);
  if (prefix.second)
    new_ns.push_back(std::make_pair(prefix.first, element->Name().Namespace()));

  for (attr = element->FirstAttr(); attr; attr = attr->NextAttr()) {
    prefix = ns_stack_->AddNewPrefix(attr->Name().Namespace(), true);
    if (prefix.second)
      new_ns.push_back(std::make_pair(prefix.first, attr->Name().Namespace()));
  }

  const std::string tag = ns_stack_->FormatQName(element->Name(), false);
  *pout_ << '<' << tag;

  for (attr = element->FirstAttr(); attr; attr = attr->NextAttr()) {
    *pout_ << ' ' << ns_stack_->FormatQName(attr->Name(), true) << "=\"";
    PrintEscaped(attr->Value(), "<>&\"");
    *pout_ << '"';
  }

  std::vector<std::pair<std::string, std::string> >::const_iterator it;
  for (it = new_ns.begin(); it != new_ns.end(); ++it) {
    if (it->first.empty()) {
      *pout_ << " xmlns=\"";
    } else {
      *pout_ << " xmlns:" << it->first << "=\"";
    }
    PrintEscaped(it->second, "<>&\"");
    *pout_ << '"';
  }

  const XmlChild* child = element->FirstChild();
  if (child == NULL) {
    *pout_ << "/>";
  } else {
    *pout_ << '>';
    for (; child; child = child->NextChild()) {
      if (child->IsText()) {
        PrintEscaped(child->AsText()->Text(), "<>&");
      } else {
        PrintElement(child->AsElement());
      }
    }
    *pout_ << "</" << tag << '>';
  }

  ns_stack_->PopFrame();
}

void XmlPrinterImpl::PrintEscaped(const std::string& text,
                                  const char* unsafe_chars) {
  size_t safe = 0;
  while (safe < text.length()) {
    size_t unsafe = text.find_first_of(unsafe_chars, safe);
    if (unsafe == std::string::npos) {
      *pout_ << text.substr(safe);
      return;
    }
    *pout_ << text.substr(safe, unsafe - safe);
    switch (text[unsafe]) {
      case '<': *pout_ << "&lt;"; break;
      case '>': *pout_ << "&gt;"; break;
      case '&': *pout_ << "&amp;"; break;
      case '"': *pout_ << "&quot;"; break;
    }
    safe = unsafe + 1;
  }
}

}  // namespace

void XmlPrinter::PrintXml(std::ostream* pout, const XmlElement* element) {
  XmlnsStack ns_stack;
  PrintXml(pout, element, &ns_stack);
}

void XmlPrinter::PrintXml(std::ostream* pout, const XmlElement* element,
                          XmlnsStack* ns_stack) {
  XmlPrinterImpl printer(pout, ns_stack);
  printer.PrintElement(element);
}

}  // namespace jbrowse
