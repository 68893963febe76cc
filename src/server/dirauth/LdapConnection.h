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

#ifndef __DIRAUTH_LDAPCONNECTION_H__
#define __DIRAUTH_LDAPCONNECTION_H__

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/LdapTransport.h"

class LdapReferralHandler;
class LdapSearchResult;

/**
 * A connection to the directory described by a DirectoryConfig. The
 * connection owns its transport and closes it when it goes away, when
 * close() is called, and whenever connecting or binding fails. Results of
 * the underlying LDAP calls are logged here and returned as DIRAUTH_ codes.
 */
class DIRAUTH_PUBLIC LdapConnection {
public:
    LdapConnection(const DirectoryConfig& config, LdapTransportFactory& factory);
    ~LdapConnection(void);

    // Opens the transport, applying implicit TLS, certificate policy and
    // timeouts. Does not negotiate StartTLS.
    int connect(void);

    // StartTLS on a connected transport
    int startTLS(void);

    // Simple bind; an empty dn binds anonymously
    int bind(const char *dn, const char *password);

    // connect(), StartTLS when configured, then bind()
    int open(const char *dn, const char *password);

    int search(const char *base, int scope, const char *filter,
               const char **attrs, int attrsonly,
               LdapReferralHandler *referrals, LdapSearchResult *&res);

    void close(void);

    PRBool isConnected(void) const { return _transport != NULL; }
    PRBool isBound(void) const { return _boundto == AUTHENTICATED; }
    PRBool isAnonymous(void) const { return _boundto == ANONYMOUS; }

    int get_error_code(void) const { return _lastrv; }
    const char *get_error_message(void) const { return _errmsg; }

    static PRBool serverDown(int statusCode);

private:
    int fail(int rv, int status, const char *what, const char *dn);

    const DirectoryConfig& _config;
    LdapTransportFactory& _factory;
    LdapTransport *_transport;
    enum { NONE, ANONYMOUS, AUTHENTICATED } _boundto;
    int _lastrv;
    char _errmsg[512];

    // not implemented:
    LdapConnection(const LdapConnection &copy_me);
    void operator=(const LdapConnection &assign_me);
};

#endif /* __DIRAUTH_LDAPCONNECTION_H__ */
