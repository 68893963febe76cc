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
#include <ldap.h>

#include "prprf.h"

#include "unit/dirunit.h"
#include "dirauth/LdapDiagnostics.h"
#include "dirauth/FakeLdapDirectory.h"
#include "dirauth/errors.h"

#define SERVICE_DN "cn=svc,dc=example,dc=com"

static void
_populate(DirectoryConfig& config, FakeLdapDirectory& directory)
{
    config.setHost("ldap.example.com");
    config.setBaseDN("ou=people,dc=example,dc=com");
    config.setBindName(SERVICE_DN);
    config.setBindPwd("svcpw");

    directory.setPassword(SERVICE_DN, "svcpw");
    directory.addEntry("ou=people,dc=example,dc=com");
    directory.addEntry("uid=alice,ou=people,dc=example,dc=com");
    directory.addEntry("uid=bob,ou=people,dc=example,dc=com");
    directory.addEntry("cn=admins,ou=groups,dc=example,dc=com");
}

static PRBool
_starts_with(const char *s, const char *prefix)
{
    return (s && !strncmp(s, prefix, strlen(prefix))) ? PR_TRUE : PR_FALSE;
}

static PRBool
_ends_with(const char *s, const char *suffix)
{
    if (!s || strlen(s) < strlen(suffix))
        return PR_FALSE;
    return !strcmp(s + strlen(s) - strlen(suffix), suffix) ? PR_TRUE : PR_FALSE;
}

DIRAUTH_UNIT_TEST(diagnostics_report_success)
{
    DirectoryConfig config;
    FakeLdapDirectory directory;
    _populate(config, directory);
    LdapDiagnostics diagnostics(config, directory);

    char *report = diagnostics.testServerBind();
    DIRAUTH_CHECK_STR("Connect (Success); Bind (Success); Base Search (Found 3 Entities)", report);
    PR_smprintf_free(report);

    // the count comes from the search, which asks for no attributes
    DIRAUTH_CHECK_STR("(objectclass=*)", directory.getFilters().item(0));
    DIRAUTH_CHECK_STR("1.1", directory.getLastAttrs().item(0));
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(diagnostics_report_starttls_and_anonymous)
{
    DirectoryConfig config;
    FakeLdapDirectory directory;
    _populate(config, directory);
    config.setTlsMode(TLS_MODE_STARTTLS);
    config.setBindName(NULL);
    config.setBindPwd(NULL);
    LdapDiagnostics diagnostics(config, directory);

    char *report = diagnostics.testServerBind();
    DIRAUTH_CHECK_STR("Connect (Success); Set StartTLS (Success); Bind (Anonymous); Base Search (Found 3 Entities)", report);
    PR_smprintf_free(report);
    DIRAUTH_CHECK_INT(1, directory.getStartTLSCount());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(diagnostics_report_stops_at_failure)
{
    DirectoryConfig config;
    FakeLdapDirectory directory;
    _populate(config, directory);
    config.setBindPwd("stale");
    LdapDiagnostics diagnostics(config, directory);

    char *report = diagnostics.testServerBind();
    DIRAUTH_CHECK(_starts_with(report, "Connect (Success); Bind (Error: couldn't bind to the ldap server"));
    DIRAUTH_CHECK(_ends_with(report, ")"));
    DIRAUTH_CHECK(strstr(report, "Base Search") == NULL);
    PR_smprintf_free(report);
    DIRAUTH_CHECK_INT(0, directory.getSearchCount());

    directory.setOpenResult(LDAP_CONNECT_ERROR);
    report = diagnostics.testServerBind();
    DIRAUTH_CHECK(_starts_with(report, "Connect (Error: couldn't connect to the ldap server"));
    DIRAUTH_CHECK(strstr(report, "Bind") == NULL);
    PR_smprintf_free(report);

    directory.setOpenResult(LDAP_SUCCESS);
    config.setTlsMode(TLS_MODE_STARTTLS);
    directory.setStartTLSResult(LDAP_PROTOCOL_ERROR);
    report = diagnostics.testServerBind();
    DIRAUTH_CHECK(_starts_with(report, "Connect (Success); Set StartTLS (Error: TLS negotiation with the ldap server failed"));
    PR_smprintf_free(report);

    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(diagnostics_report_empty_base)
{
    DirectoryConfig config;
    FakeLdapDirectory directory;
    _populate(config, directory);
    config.setBaseDN("ou=nowhere,dc=example,dc=com");
    LdapDiagnostics diagnostics(config, directory);

    char *report = diagnostics.testServerBind();
    DIRAUTH_CHECK(_ends_with(report, "Base Search (Found 0 Entities)"));
    PR_smprintf_free(report);

    return PR_SUCCESS;
}
