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

#include "prprf.h"

#include "base/ereport.h"
#include "dirauth/LdapDiagnostics.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapReferralHandler.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/errors.h"

static const char *_noAttrs[] = { LDAP_NO_ATTRS, NULL };

LdapDiagnostics::LdapDiagnostics(const DirectoryConfig& config, LdapTransportFactory& factory)
: _config(config), _factory(factory)
{
}

static char *
_append_error(char *report, int rv, LdapConnection& ld)
{
    const char *detail = ld.get_error_message();
    if (detail && *detail)
        return PR_sprintf_append(report, "Error: %s: %s)", dirauth_err2string(rv), detail);
    return PR_sprintf_append(report, "Error: %s)", dirauth_err2string(rv));
}

char *
LdapDiagnostics::testServerBind(void)
{
    LdapConnection ld(_config, _factory);
    char *report = NULL;

    report = PR_sprintf_append(report, "Connect (");
    int rv = ld.connect();
    if (rv != DIRAUTH_SUCCESS)
        return _append_error(report, rv, ld);
    report = PR_sprintf_append(report, "Success); ");

    if (_config.getTlsMode() == TLS_MODE_STARTTLS) {
        report = PR_sprintf_append(report, "Set StartTLS (");
        rv = ld.startTLS();
        if (rv != DIRAUTH_SUCCESS)
            return _append_error(report, rv, ld);
        report = PR_sprintf_append(report, "Success); ");
    }

    report = PR_sprintf_append(report, "Bind (");
    rv = ld.bind(_config.getBindName(), _config.getBindPwd());
    if (rv != DIRAUTH_SUCCESS)
        return _append_error(report, rv, ld);
    report = PR_sprintf_append(report, "%s); ", ld.isBound() ? "Success" : "Anonymous");

    report = PR_sprintf_append(report, "Base Search (");
    LdapBindCredentials referrals(_config.getBindName(), _config.getBindPwd());
    LdapSearchResult_var res;
    rv = ld.search(_config.getBaseDN(), LDAP_SCOPE_SUBTREE, NULL, _noAttrs, 1,
                   &referrals, res.out());
    if (rv != DIRAUTH_SUCCESS)
        return _append_error(report, rv, ld);

    // Count by walking the entries
    unsigned long count = 0;
    res->reset();
    while (res->next())
        count++;
    report = PR_sprintf_append(report, "Found %lu Entities)", count);

    ereport(LOG_INFORM, "ldap diagnostics for %s:%d: %s",
            _config.getHost(), _config.getPort(), report ? report : "");

    return report;
}
