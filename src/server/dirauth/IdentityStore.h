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

#ifndef _DIRAUTH_IDENTITYSTORE_H
#define _DIRAUTH_IDENTITYSTORE_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/StringList.h"

/**
 * The local record of a user. Only the fields directory authentication
 * maintains are modelled.
 */
class DIRAUTH_PUBLIC Identity {
public:
    Identity(const char *username);
    Identity(const Identity& copy_me);
    ~Identity(void);

    const char *getUsername(void) const { return _username; }

    PRBool isAdministrator(void) const { return _admin; }
    void setAdministrator(PRBool admin) { _admin = admin; }

    PRBool getEnableAllFolders(void) const { return _allFolders; }
    void setEnableAllFolders(PRBool all) { _allFolders = all; }

    const StringList& getEnabledFolders(void) const { return _folders; }
    void setEnabledFolders(const StringList& folders) { _folders = folders; }

    const char *getAuthProviderId(void) const { return _providerId; }
    void setAuthProviderId(const char *id);

private:
    char *_username;
    PRBool _admin;
    PRBool _allFolders;
    StringList _folders;
    char *_providerId;

    // not implemented:
    void operator=(const Identity &assign_me);
};

/**
 * Where local user records live. Implementations must be safe to call from
 * concurrent authentication attempts.
 */
class DIRAUTH_PUBLIC IdentityStore {
public:
    virtual ~IdentityStore(void) { }

    /**
     * DIRAUTH_SUCCESS with a copy of the record, owned by the caller, or
     * DIRAUTH_FAILED when there is no record for username.
     */
    virtual int findByUsername(const char *username, Identity *&identity) = 0;

    /**
     * Creates an empty record. Returns DIRAUTH_ERR_IDENTITY_EXISTS when
     * the name is already taken.
     *
     * A new record is filled in by a following updateIdentity(). If that
     * update fails the empty record stays behind and later logins treat it
     * as an existing user; a store that cannot accept that must roll the
     * record back itself.
     */
    virtual int createUsername(const char *username, Identity *&identity) = 0;

    /** Persists the fields of identity into the record of the same name. */
    virtual int updateIdentity(const Identity& identity) = 0;
};

#endif /* _DIRAUTH_IDENTITYSTORE_H */
