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

#include <sstream>
#include <string>

#include "jbrowse/base/gunit.h"
#include "jbrowse/xmllite/qname.h"
#include "jbrowse/xmllite/xmlelement.h"
#include "jbrowse/xmllite/xmlnsstack.h"

using jbrowse::QName;
using jbrowse::XmlElement;
using jbrowse::XmlnsStack;
using jbrowse::XmlPrinter;

TEST(XmlPrinterTest, TestBasicPrinting) {
  XmlElement elt(QName("jabber:iq:browse", "query"));
  std::stringstream ss;
  XmlPrinter::PrintXml(&ss, &elt);
  EXPECT_EQ("<query xmlns=\"jabber:iq:browse\"/>", ss.str());
}

TEST(XmlPrinterTest, TestNestedNamespaces) {
  XmlElement elt(QName("jabber:client", "iq"));
  elt.AddElement(new XmlElement(QName("jabber:iq:browse", "query")));
  elt.AddElement(new XmlElement(QName("jabber:client", "error")));
  std::stringstream ss;
  XmlPrinter::PrintXml(&ss, &elt);
  EXPECT_EQ("<iq xmlns=\"jabber:client\"><query xmlns=\"jabber:iq:browse\"/>"
            "<error/></iq>", ss.str());
}

TEST(XmlPrinterTest, TestInheritedBindings) {
  XmlElement elt(QName("google:test", "first"));
  elt.AddElement(new XmlElement(QName("nested:test", "second")));
  std::stringstream ss;

  XmlnsStack ns_stack;
  ns_stack.AddXmlns("gg", "google:test");
  ns_stack.AddXmlns("", "nested:test");

  XmlPrinter::PrintXml(&ss, &elt, &ns_stack);
  EXPECT_EQ("<gg:first><second/></gg:first>", ss.str());
}

TEST(XmlPrinterTest, TestNamespacedAttribute) {
  XmlElement elt(QName("", "root"));
  elt.AddAttr(QName("urn:x", "att"), "v");
  std::stringstream ss;
  XmlPrinter::PrintXml(&ss, &elt);
  EXPECT_EQ("<root ns1:att=\"v\" xmlns:ns1=\"urn:x\"/>", ss.str());
}

TEST(XmlPrinterTest, TestEscaping) {
  XmlElement elt(QName("", "root"));
  elt.AddAttr(QName("", "name"), "a<b>&\"c\"");
  elt.AddText("1 < 2 & \"3\" > 0");
  std::stringstream ss;
  XmlPrinter::PrintXml(&ss, &elt);
  EXPECT_EQ("<root name=\"a&lt;b&gt;&amp;&quot;c&quot;\">"
            "1 &lt; 2 &amp; \"3\" &gt; 0</root>", ss.str());
}
