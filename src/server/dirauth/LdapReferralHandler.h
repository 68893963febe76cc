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

#ifndef _DIRAUTH_LDAPREFERRALHANDLER_H
#define _DIRAUTH_LDAPREFERRALHANDLER_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"

/**
 * Supplies the identity used to bind to a server a search was referred to.
 */
class DIRAUTH_PUBLIC LdapReferralHandler {
public:
    virtual ~LdapReferralHandler(void) { }

    /**
     * Called once per referral hop with the URL of the referred server.
     * Returns DIRAUTH_SUCCESS with dn and password set, or an error code to
     * refuse the referral. The strings stay owned by the handler.
     */
    virtual int getCredentials(const char *url, const char *&dn, const char *&password) = 0;
};

/**
 * Replays one identity, captured when an authentication phase starts, for
 * every referral of that phase.
 */
class DIRAUTH_PUBLIC LdapBindCredentials : public LdapReferralHandler {
public:
    LdapBindCredentials(const char *dn, const char *password);
    virtual ~LdapBindCredentials(void);

    virtual int getCredentials(const char *url, const char *&dn, const char *&password);

    const char *getBindName(void) const { return _dn; }
    int getReferralCount(void) const { return _referrals; }

private:
    char *_dn;
    char *_password;
    int _referrals;

    // not implemented:
    LdapBindCredentials(const LdapBindCredentials &copy_me);
    void operator=(const LdapBindCredentials &assign_me);
};

#endif /* _DIRAUTH_LDAPREFERRALHANDLER_H */
