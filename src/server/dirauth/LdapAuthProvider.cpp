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
#include "dirauth/LdapAuthProvider.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapReferralHandler.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/LdapEntry.h"
#include "dirauth/errors.h"

static const char *_noAttrs[] = { LDAP_NO_ATTRS, NULL };

LdapAuthProvider::LdapAuthProvider(const DirectoryConfig& config, IdentityStore& store,
                                   LdapTransportFactory& factory)
: _config(config), _store(store), _factory(factory), _locator(config), _admin(config)
{
}

LdapAuthProvider::~LdapAuthProvider(void)
{
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::locateUser
//-----------------------------------------------------------------------------

int
LdapAuthProvider::locateUser(const char *username, LdapEntry *&entry)
{
    entry = NULL;

    LdapConnection ld(_config, _factory);
    int rv = ld.open(_config.getBindName(), _config.getBindPwd());
    if (rv != DIRAUTH_SUCCESS) {
        ereport(LOG_FAILURE, "ldap authdb: cannot look up [%s], bind as [%s] failed: %s",
                username, _config.getBindName(), dirauth_err2string(rv));
        return rv;
    }

    LdapBindCredentials referrals(_config.getBindName(), _config.getBindPwd());
    return _locator.locate(ld, username, &referrals, entry);
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::verifyUser
//-----------------------------------------------------------------------------

int
LdapAuthProvider::verifyUser(const char *userdn, const char *password, PRBool& admin)
{
    admin = PR_FALSE;

    LdapConnection ld(_config, _factory);
    int rv = ld.open(userdn, password);
    if (rv == DIRAUTH_ERR_BIND_FAILED)
        return DIRAUTH_ERR_INVALID_CREDENTIALS;
    if (rv != DIRAUTH_SUCCESS)
        return DIRAUTH_ERR_USER_CONNECT_FAILED;

    if (!_admin.isEnabled())
        return DIRAUTH_SUCCESS;

    // Failures on the user's connection belong to the user phase, referral
    // rebinds with the user's password included
    LdapBindCredentials referrals(userdn, password);
    rv = _admin.isAdmin(ld, userdn, &referrals, admin);
    if (rv == DIRAUTH_ERR_BIND_FAILED)
        return DIRAUTH_ERR_INVALID_CREDENTIALS;
    if (dirauth_is_connection_error(rv))
        return DIRAUTH_ERR_USER_CONNECT_FAILED;
    return rv;
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::syncAdministrator
//-----------------------------------------------------------------------------

int
LdapAuthProvider::syncAdministrator(Identity& identity, PRBool admin)
{
    // Without an administrator filter the local flag is managed elsewhere
    if (!_admin.isEnabled() || identity.isAdministrator() == admin)
        return DIRAUTH_SUCCESS;

    ereport(LOG_INFORM, "ldap authdb: %s administrator rights for [%s]",
            admin ? "granting" : "revoking", identity.getUsername());

    identity.setAdministrator(admin);
    return _store.updateIdentity(identity);
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::provision
//-----------------------------------------------------------------------------

int
LdapAuthProvider::provision(const char *username, PRBool admin, Identity *&identity)
{
    int rv = _store.createUsername(username, identity);

    if (rv == DIRAUTH_ERR_IDENTITY_EXISTS) {
        // Another login created the user first
        ereport(LOG_VERBOSE, "ldap authdb: user [%s] was created concurrently", username);
        rv = _store.findByUsername(username, identity);
        if (rv != DIRAUTH_SUCCESS)
            return DIRAUTH_ERR_IDENTITY_STORE;
        return syncAdministrator(*identity, admin);
    }

    if (rv != DIRAUTH_SUCCESS)
        return rv;

    identity->setAdministrator(admin);
    identity->setEnableAllFolders(_config.getEnableAllFolders());
    if (!_config.getEnableAllFolders())
        identity->setEnabledFolders(_config.getEnabledFolders());
    identity->setAuthProviderId(getName());

    rv = _store.updateIdentity(*identity);
    if (rv != DIRAUTH_SUCCESS) {
        ereport(LOG_FAILURE, "ldap authdb: local user [%s] was created but its settings could not be stored: %s",
                username, dirauth_err2string(rv == DIRAUTH_FAILED ? DIRAUTH_ERR_IDENTITY_STORE : rv));
        return rv;
    }

    ereport(LOG_INFORM, "ldap authdb: created local user [%s]", username);

    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::reconcile
//-----------------------------------------------------------------------------

int
LdapAuthProvider::reconcile(const char *username, PRBool admin, Identity *&identity)
{
    identity = NULL;

    int rv = _store.findByUsername(username, identity);
    if (rv == DIRAUTH_SUCCESS) {
        rv = syncAdministrator(*identity, admin);
    } else if (rv == DIRAUTH_FAILED) {
        if (_config.getCreateUsers()) {
            rv = provision(username, admin, identity);
        } else {
            ereport(LOG_INFORM, "ldap authdb: Automatic User Creation is disabled and there is no local user for authorized uid [%s]",
                    username);
            rv = DIRAUTH_ERR_PROVISIONING_DISABLED;
        }
    }

    if (rv == DIRAUTH_FAILED)
        rv = DIRAUTH_ERR_IDENTITY_STORE;

    if (rv != DIRAUTH_SUCCESS) {
        delete identity;
        identity = NULL;
    }

    return rv;
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::authenticate
//-----------------------------------------------------------------------------

int
LdapAuthProvider::authenticate(const char *username, const char *password, AuthOutcome& outcome)
{
    outcome.clear();

    if (!username || !*username)
        return DIRAUTH_ERR_USER_NOT_FOUND;

    ereport(LOG_VERBOSE, "ldap authdb: Authenticating user [%s]", username);

    // An empty password would turn the verification bind into an
    // unauthenticated bind, which directories accept
    if (!password || !*password) {
        ereport(LOG_VERBOSE, "ldap authdb: null password for [%s]", username);
        return DIRAUTH_ERR_INVALID_CREDENTIALS;
    }

    LdapEntry *entry = NULL;
    int rv = locateUser(username, entry);
    if (rv == DIRAUTH_FAILED) {
        ereport(LOG_VERBOSE, "ldap authdb: user [%s] not found", username);
        return DIRAUTH_ERR_USER_NOT_FOUND;
    }
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    ereport(LOG_VERBOSE, "ldap authdb: Matched [%s] belonging to userdn [%s]",
            username, entry->DN());

    const char *ldapUsername = entry->firstValue(_config.getUsernameAttr());
    if (!ldapUsername || !*ldapUsername) {
        ereport(LOG_MISCONFIG, "ldap authdb: userdn [%s] has no %s value",
                entry->DN(), _config.getUsernameAttr());
        delete entry;
        return DIRAUTH_ERR_MISSING_UID_ATTR;
    }

    PRBool admin = PR_FALSE;
    rv = verifyUser(entry->DN(), password, admin);
    if (rv != DIRAUTH_SUCCESS) {
        ereport(LOG_VERBOSE, "ldap authdb: Authentication failed for [%s] belonging to userdn [%s] (%s)",
                username, entry->DN(), dirauth_err2string(rv));
        delete entry;
        return rv;
    }

    ereport(LOG_VERBOSE, "ldap authdb: Authentication succeeded for [%s] belonging to userdn [%s]",
            username, entry->DN());

    Identity *identity = NULL;
    rv = reconcile(ldapUsername, admin, identity);
    if (rv == DIRAUTH_SUCCESS) {
        outcome.set(identity->getUsername(), identity->isAdministrator(),
                    identity->getEnableAllFolders(), identity->getEnabledFolders());
        delete identity;
    }

    delete entry;
    return rv;
}

PRBool
LdapAuthProvider::hasPassword(const Identity& identity) const
{
    return PR_TRUE;
}

int
LdapAuthProvider::changePassword(Identity& identity, const char *newPassword)
{
    ereport(LOG_WARN, "ldap authdb: password change for [%s] refused, passwords are managed by the directory",
            identity.getUsername());
    return DIRAUTH_ERR_NOT_IMPLEMENTED;
}

//-----------------------------------------------------------------------------
// LdapAuthProvider::getFilteredUsers
//-----------------------------------------------------------------------------

int
LdapAuthProvider::getFilteredUsers(const char *filter, StringList& dns)
{
    dns.clear();

    LdapConnection ld(_config, _factory);
    int rv = ld.open(_config.getBindName(), _config.getBindPwd());
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    LdapBindCredentials referrals(_config.getBindName(), _config.getBindPwd());
    LdapSearchResult_var res;
    rv = ld.search(_config.getBaseDN(), LDAP_SCOPE_SUBTREE, filter, _noAttrs, 1,
                   &referrals, res.out());
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    LdapEntry *entry;
    while ((entry = res->next()) != NULL) {
        rv = dns.add(entry->DN());
        if (rv != DIRAUTH_SUCCESS)
            return rv;
    }

    return DIRAUTH_SUCCESS;
}
