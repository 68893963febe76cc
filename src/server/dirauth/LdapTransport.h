/*
 * DO NOT ALTER OR REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Copyright 2008 Sun Microsystems, Inc. All rights reserved.
 *
 * THE BSD LICENSE
 *
 * Redistribution and use in source and binary forms, with or without 
 * modification, are permitted provided that the following conditions are met:
 *
 * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer. 
 * Redistributions in binary form must reproduce the above copyright notice, 
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution. 
 *
 * Neither the name of the  nor the names of its contributors may be
 * used to endorse or promote products derived from this software without 
 * specific prior written permission. 
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER 
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, 
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; 
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, 
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR 
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF 
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef _DIRAUTH_LDAPTRANSPORT_H
#define _DIRAUTH_LDAPTRANSPORT_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"

class LdapReferralHandler;
class LdapSearchResult;

/**
 * One connection to a directory server at the protocol level. Every call
 * returns an LDAP result code; LdapConnection turns those into status codes.
 */
class DIRAUTH_PUBLIC LdapTransport {
public:
    virtual ~LdapTransport(void) { }

    /**
     * Prepares a session to host:port. With TLS_MODE_SSL the connection is
     * made over TLS; verifyCert selects whether the server certificate must
     * validate. timeout (seconds) bounds connecting and every operation.
     */
    virtual int open(const char *host, int port, tlsmode_t mode, PRBool verifyCert, int timeout) = 0;

    virtual int startTLS(void) = 0;

    /** Simple bind. An empty dn binds anonymously. */
    virtual int simpleBind(const char *dn, const char *password) = 0;

    /**
     * Runs a search and returns every entry in res, which the caller
     * deletes. Referrals are followed only when referrals is non-NULL,
     * binding to each referred server with the identity it supplies.
     */
    virtual int search(const char *base, int scope, const char *filter,
                       const char **attrs, int attrsonly,
                       LdapReferralHandler *referrals,
                       LdapSearchResult *&res) = 0;

    virtual void close(void) = 0;

    /** Description of the last failure, including the server's diagnostic. */
    virtual const char *getErrorMessage(void) = 0;
};

class DIRAUTH_PUBLIC LdapTransportFactory {
public:
    virtual ~LdapTransportFactory(void) { }
    virtual LdapTransport *create(void) = 0;
};

#endif /* _DIRAUTH_LDAPTRANSPORT_H */
