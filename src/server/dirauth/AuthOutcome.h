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

#ifndef _DIRAUTH_AUTHOUTCOME_H
#define _DIRAUTH_AUTHOUTCOME_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/StringList.h"

/**
 * What a successful login resolved to. Empty until
 * LdapAuthProvider::authenticate succeeds.
 */
class DIRAUTH_PUBLIC AuthOutcome {
public:
    AuthOutcome(void);
    ~AuthOutcome(void);

    PRBool isSet(void) const { return _username != NULL; }
    const char *getUsername(void) const { return _username; }
    PRBool isAdministrator(void) const { return _admin; }
    PRBool getEnableAllFolders(void) const { return _allFolders; }
    const StringList& getEnabledFolders(void) const { return _folders; }

    void set(const char *username, PRBool admin, PRBool allFolders, const StringList& folders);
    void clear(void);

private:
    char *_username;
    PRBool _admin;
    PRBool _allFolders;
    StringList _folders;

    // not implemented:
    AuthOutcome(const AuthOutcome &copy_me);
    void operator=(const AuthOutcome &assign_me);
};

#endif /* _DIRAUTH_AUTHOUTCOME_H */
