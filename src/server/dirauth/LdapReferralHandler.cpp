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

#include <string.h>

#include "plstr.h"

#include "base/ereport.h"
#include "dirauth/LdapReferralHandler.h"
#include "dirauth/errors.h"

LdapBindCredentials::LdapBindCredentials(const char *dn, const char *password)
: _dn(PL_strdup(dn ? dn : "")), _password(PL_strdup(password ? password : "")),
  _referrals(0)
{
}

LdapBindCredentials::~LdapBindCredentials(void)
{
    PL_strfree(_dn);
    if (_password) {
        memset(_password, 0, strlen(_password));
        PL_strfree(_password);
    }
}

int
LdapBindCredentials::getCredentials(const char *url, const char *&dn, const char *&password)
{
    if (!_dn || !_password)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    _referrals++;
    ereport(LOG_VERBOSE, "ldap referral: binding as [%s] to %s",
            _dn, url ? url : "(unknown server)");

    dn = _dn;
    password = _password;
    return DIRAUTH_SUCCESS;
}
