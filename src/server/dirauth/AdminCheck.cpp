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

#include <ldap.h>

#include "base/ereport.h"
#include "dirauth/AdminCheck.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/errors.h"

// No attributes, only the entry itself
static const char *_noAttrs[] = { LDAP_NO_ATTRS, NULL };

AdminCheck::AdminCheck(const DirectoryConfig& config)
: _config(config)
{
}

int
AdminCheck::isAdmin(LdapConnection& ld, const char *userdn,
                    LdapReferralHandler *referrals, PRBool& admin) const
{
    admin = PR_FALSE;

    if (!isEnabled())
        return DIRAUTH_SUCCESS;

    LdapSearchResult_var res;
    int rv = ld.search(userdn, LDAP_SCOPE_BASE, _config.getAdminFilter(),
                       _noAttrs, 1, referrals, res.out());
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    admin = (res->entries() > 0) ? PR_TRUE : PR_FALSE;

    ereport(LOG_VERBOSE, "ldap authdb: [%s] %s the administrator filter",
            userdn, admin ? "matches" : "does not match");

    return DIRAUTH_SUCCESS;
}
