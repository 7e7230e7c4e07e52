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

#ifndef JBROWSE_XMPP_CONSTANTS_H_
#define JBROWSE_XMPP_CONSTANTS_H_

#include <string>

#include "jbrowse/xmllite/qname.h"

namespace jbrowse {

extern const char NS_CLIENT[];
extern const char NS_STANZA[];

extern const char STR_GET[];
extern const char STR_SET[];
extern const char STR_RESULT[];
extern const char STR_ERROR[];

extern const char STR_CANCEL[];
extern const char STR_MODIFY[];

extern const StaticQName QN_IQ;
extern const StaticQName QN_ERROR;

extern const StaticQName QN_STANZA_BAD_REQUEST;
extern const StaticQName QN_STANZA_FEATURE_NOT_IMPLEMENTED;
extern const StaticQName QN_STANZA_ITEM_NOT_FOUND;
extern const StaticQName QN_STANZA_JID_MALFORMED;
extern const StaticQName QN_STANZA_SERVICE_UNAVAILABLE;
extern const StaticQName QN_STANZA_INTERNAL_SERVER_ERROR;

// Unqualified attributes.
extern const StaticQName QN_TYPE;
extern const StaticQName QN_ID;
extern const StaticQName QN_TO;
extern const StaticQName QN_FROM;
extern const StaticQName QN_JID;
extern const StaticQName QN_NAME;
extern const StaticQName QN_NODE;
extern const StaticQName QN_CATEGORY;
extern const StaticQName QN_VAR;
extern const StaticQName QN_VERSION;

// Service discovery (XEP-0030).
extern const char NS_DISCO_INFO[];
extern const char NS_DISCO_ITEMS[];
extern const StaticQName QN_DISCO_INFO_QUERY;
extern const StaticQName QN_DISCO_IDENTITY;
extern const StaticQName QN_DISCO_FEATURE;
extern const StaticQName QN_DISCO_ITEMS_QUERY;
extern const StaticQName QN_DISCO_ITEM;

// Software version (XEP-0092).
extern const char NS_VERSION[];
extern const StaticQName QN_VERSION_QUERY;
extern const StaticQName QN_VERSION_NAME;
extern const StaticQName QN_VERSION_VERSION;

// Jabber Browsing (XEP-0011).
extern const char NS_BROWSE[];
extern const StaticQName QN_BROWSE_QUERY;
extern const StaticQName QN_BROWSE_ITEM;
extern const StaticQName QN_BROWSE_NS;

// Plugin properties.
extern const char CONFIG_CONCAT_IDENTITIES[];

}  // namespace jbrowse

#endif  // JBROWSE_XMPP_CONSTANTS_H_
