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

#ifndef _DIRAUTH_OPENLDAPTRANSPORT_H
#define _DIRAUTH_OPENLDAPTRANSPORT_H

#include <ldap.h>

#include "dirauth/LdapTransport.h"

/**
 * LdapTransport on top of libldap. Referral chasing is left to libldap,
 * which calls back into rebindProc for the identity to present to each
 * referred server.
 */
class DIRAUTH_PUBLIC OpenLdapTransport : public LdapTransport {
public:
    OpenLdapTransport(void);
    virtual ~OpenLdapTransport(void);

    virtual int open(const char *host, int port, tlsmode_t mode, PRBool verifyCert, int timeout);
    virtual int startTLS(void);
    virtual int simpleBind(const char *dn, const char *password);
    virtual int search(const char *base, int scope, const char *filter,
                       const char **attrs, int attrsonly,
                       LdapReferralHandler *referrals,
                       LdapSearchResult *&res);
    virtual void close(void);
    virtual const char *getErrorMessage(void);

    /**
     * Status of a search that may have chased referrals. A rejected rebind
     * at a referred server replaces whatever error the chase left behind.
     */
    static int chaseResult(int searchrv, int rebindrv);

private:
    static int rebindProc(LDAP *ld, LDAP_CONST char *url, ber_tag_t request,
                          ber_int_t msgid, void *params);
    int setOption(int option, const void *value, const char *name);
    void setError(int rv, const char *what);

    LDAP *_session;
    int _timeout;
    LdapReferralHandler *_referrals;
    int _rebindResult;
    char _errbuf[512];

    // not implemented:
    OpenLdapTransport(const OpenLdapTransport &copy_me);
    void operator=(const OpenLdapTransport &assign_me);
};

class DIRAUTH_PUBLIC OpenLdapTransportFactory : public LdapTransportFactory {
public:
    virtual LdapTransport *create(void);
};

#endif /* _DIRAUTH_OPENLDAPTRANSPORT_H */
