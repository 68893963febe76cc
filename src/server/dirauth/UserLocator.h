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

#ifndef _DIRAUTH_USERLOCATOR_H
#define _DIRAUTH_USERLOCATOR_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/StringList.h"

class LdapConnection;
class LdapEntry;
class LdapReferralHandler;

/**
 * Finds the directory entry a login name refers to. The configured filter
 * selects candidate entries below the base DN; an entry matches when one of
 * the configured username attributes holds the login name.
 */
class DIRAUTH_PUBLIC UserLocator {
public:
    UserLocator(const DirectoryConfig& config);
    ~UserLocator(void);

    /**
     * Searches on a bound connection. Returns DIRAUTH_SUCCESS with entry
     * set to a copy owned by the caller, DIRAUTH_FAILED if no entry
     * matches, or the connection's error code.
     */
    int locate(LdapConnection& ld, const char *username,
               LdapReferralHandler *referrals, LdapEntry *&entry) const;

    /**
     * Search attributes followed by the username attribute, once each, as
     * currently configured.
     */
    int getAttributes(StringList& attrs) const;

    PRBool matches(const char *value, const char *username) const;

    /**
     * The configured filter with each {username} replaced by the escaped
     * username. Allocated with PR_smprintf.
     */
    char *buildFilter(const char *username) const;

    /** RFC 4515 escaping of an assertion value. Allocated with PR_smprintf. */
    static char *escapeFilterValue(const char *value);

private:
    const DirectoryConfig& _config;

    // not implemented:
    UserLocator(const UserLocator &copy_me);
    void operator=(const UserLocator &assign_me);
};

#endif /* _DIRAUTH_USERLOCATOR_H */
