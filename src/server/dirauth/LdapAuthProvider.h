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

#ifndef _DIRAUTH_LDAPAUTHPROVIDER_H
#define _DIRAUTH_LDAPAUTHPROVIDER_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/LdapTransport.h"
#include "dirauth/IdentityStore.h"
#include "dirauth/AuthOutcome.h"
#include "dirauth/UserLocator.h"
#include "dirauth/AdminCheck.h"

class LdapEntry;

/**
 * Authenticates logins against a directory and keeps the local identity
 * store in step with it.
 *
 * A login runs in two phases, each on its own connection. The service
 * account locates the user's entry; then a connection bound as that entry
 * with the supplied password proves the password and, if an administrator
 * filter is configured, tells whether the user is an administrator.
 * Referrals met during a phase are followed with that phase's identity.
 *
 * The provider holds no connection between calls and may be used from
 * several threads at once, given a thread-safe IdentityStore.
 */
class DIRAUTH_PUBLIC LdapAuthProvider {
public:
    LdapAuthProvider(const DirectoryConfig& config, IdentityStore& store,
                     LdapTransportFactory& factory);
    ~LdapAuthProvider(void);

    const char *getName(void) const { return DIRAUTH_PROVIDER_NAME; }

    /**
     * Returns DIRAUTH_SUCCESS and fills outcome, or one of
     * DIRAUTH_ERR_USER_NOT_FOUND, DIRAUTH_ERR_INVALID_CREDENTIALS,
     * DIRAUTH_ERR_USER_CONNECT_FAILED, DIRAUTH_ERR_MISSING_UID_ATTR,
     * DIRAUTH_ERR_PROVISIONING_DISABLED, a connection error of the service
     * phase, or an identity store error.
     */
    int authenticate(const char *username, const char *password, AuthOutcome& outcome);

    // Directory users always have a password, held by the directory
    PRBool hasPassword(const Identity& identity) const;

    // Passwords are changed in the directory, never through this provider
    int changePassword(Identity& identity, const char *newPassword);

    /** DNs of every entry below the base DN matching filter. */
    int getFilteredUsers(const char *filter, StringList& dns);

private:
    int locateUser(const char *username, LdapEntry *&entry);
    int verifyUser(const char *userdn, const char *password, PRBool& admin);
    int reconcile(const char *username, PRBool admin, Identity *&identity);
    int provision(const char *username, PRBool admin, Identity *&identity);
    int syncAdministrator(Identity& identity, PRBool admin);

    const DirectoryConfig& _config;
    IdentityStore& _store;
    LdapTransportFactory& _factory;
    UserLocator _locator;
    AdminCheck _admin;

    // not implemented:
    LdapAuthProvider(const LdapAuthProvider &copy_me);
    void operator=(const LdapAuthProvider &assign_me);
};

#endif /* _DIRAUTH_LDAPAUTHPROVIDER_H */
