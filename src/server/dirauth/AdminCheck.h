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

#ifndef _DIRAUTH_ADMINCHECK_H
#define _DIRAUTH_ADMINCHECK_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"

class LdapConnection;
class LdapReferralHandler;

/**
 * Decides whether a user is an administrator: the user's own entry must
 * match the administrator filter. The search runs on a connection bound as
 * that user, so the directory's access rules for the user apply.
 */
class DIRAUTH_PUBLIC AdminCheck {
public:
    AdminCheck(const DirectoryConfig& config);

    PRBool isEnabled(void) const { return _config.isAdminFilterEnabled(); }

    int isAdmin(LdapConnection& ld, const char *userdn,
                LdapReferralHandler *referrals, PRBool& admin) const;

private:
    const DirectoryConfig& _config;

    // not implemented:
    AdminCheck(const AdminCheck &copy_me);
    void operator=(const AdminCheck &assign_me);
};

#endif /* _DIRAUTH_ADMINCHECK_H */
