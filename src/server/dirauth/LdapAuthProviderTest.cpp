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

#include "unit/dirunit.h"
#include "base/ereport.h"
#include "dirauth/LdapAuthProvider.h"
#include "dirauth/MemoryIdentityStore.h"
#include "dirauth/FakeLdapDirectory.h"
#include "dirauth/errors.h"

#define SERVICE_DN "cn=svc,dc=example,dc=com"
#define ALICE_DN   "uid=alice,ou=people,dc=example,dc=com"
#define ADMINS     "(memberOf=cn=admins,ou=groups,dc=example,dc=com)"

static void
_configure(DirectoryConfig& config)
{
    config.setHost("ldap.example.com");
    config.setBaseDN("dc=example,dc=com");
    config.setBindName(SERVICE_DN);
    config.setBindPwd("svcpw");
    config.setSearchFilter("(objectclass=person)");
    config.setSearchAttrs("uid, mail");
    config.setCreateUsers(PR_TRUE);
}

static void
_populate(FakeLdapDirectory& directory)
{
    directory.setPassword(SERVICE_DN, "svcpw");

    LdapEntry *bob = directory.addEntry("uid=bob,ou=people,dc=example,dc=com");
    bob->addValue("uid", "bob");
    bob->addValue("mail", "bob@example.com");
    directory.setPassword("uid=bob,ou=people,dc=example,dc=com", "bobpw");

    LdapEntry *alice = directory.addEntry(ALICE_DN);
    alice->addValue("uid", "alice");
    alice->addValue("mail", "alice@example.com");
    directory.setPassword(ALICE_DN, "secret");
}

static int
_add_identity(MemoryIdentityStore& store, const char *username, PRBool admin)
{
    Identity *identity = NULL;
    int rv = store.createUsername(username, identity);
    if (rv != DIRAUTH_SUCCESS)
        return rv;
    identity->setAdministrator(admin);
    rv = store.updateIdentity(*identity);
    delete identity;
    return rv;
}

static PRBool
_stored_admin(MemoryIdentityStore& store, const char *username)
{
    Identity *identity = NULL;
    if (store.findByUsername(username, identity) != DIRAUTH_SUCCESS)
        return PR_FALSE;
    PRBool admin = identity->isAdministrator();
    delete identity;
    return admin;
}

DIRAUTH_UNIT_TEST(provider_login_creates_identity)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(outcome.isSet());
    DIRAUTH_CHECK_STR("alice", outcome.getUsername());
    DIRAUTH_CHECK(!outcome.isAdministrator());
    DIRAUTH_CHECK(outcome.getEnableAllFolders());

    // service bind to locate, then the user's own bind
    DIRAUTH_CHECK_INT(2, directory.getBinds().length());
    DIRAUTH_CHECK_STR(SERVICE_DN, directory.getBinds().item(0));
    DIRAUTH_CHECK_STR(ALICE_DN, directory.getBinds().item(1));
    DIRAUTH_CHECK_INT(2, directory.getOpened());
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    Identity *identity = NULL;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, store.findByUsername("alice", identity));
    DIRAUTH_CHECK(!identity->isAdministrator());
    DIRAUTH_CHECK(identity->getEnableAllFolders());
    DIRAUTH_CHECK_STR("LDAP-Authentication", identity->getAuthProviderId());
    delete identity;

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_wrong_password)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    int rv = provider.authenticate("alice", "wrong", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_INVALID_CREDENTIALS, rv);
    DIRAUTH_CHECK_STR("Error completing LDAP login. Invalid username or password.",
                      dirauth_auth_message(rv));
    DIRAUTH_CHECK(!outcome.isSet());
    DIRAUTH_CHECK_INT(0, store.count());
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_unknown_user)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    int rv = provider.authenticate("mallory", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_USER_NOT_FOUND, rv);
    DIRAUTH_CHECK_STR(dirauth_auth_message(DIRAUTH_ERR_INVALID_CREDENTIALS), dirauth_auth_message(rv));

    // the password was never presented to the directory
    DIRAUTH_CHECK_INT(1, directory.getBinds().length());
    DIRAUTH_CHECK_STR(SERVICE_DN, directory.getBinds().item(0));
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_empty_password_never_reaches_directory)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_ERR_INVALID_CREDENTIALS, provider.authenticate("alice", "", outcome));
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_INVALID_CREDENTIALS, provider.authenticate("alice", NULL, outcome));
    DIRAUTH_CHECK_INT(0, directory.getOpened());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_provisioning_disabled)
{
    DirectoryConfig config;
    _configure(config);
    config.setCreateUsers(PR_FALSE);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_ERR_PROVISIONING_DISABLED, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(!outcome.isSet());
    DIRAUTH_CHECK_INT(0, store.count());

    // an existing local user may still log in
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _add_identity(store, "alice", PR_FALSE));
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_INT(1, store.count());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_creates_identity_once)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice@example.com", "secret", outcome));

    DIRAUTH_CHECK_INT(1, store.getCreateCount());
    DIRAUTH_CHECK_INT(1, store.count());
    DIRAUTH_CHECK_STR("alice", outcome.getUsername());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_folder_access_on_creation)
{
    DirectoryConfig config;
    _configure(config);
    config.setEnableAllFolders(PR_FALSE);
    config.setEnabledFolders("movies, music");
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(!outcome.getEnableAllFolders());
    DIRAUTH_CHECK_INT(2, outcome.getEnabledFolders().length());
    DIRAUTH_CHECK_STR("music", outcome.getEnabledFolders().item(1));

    // the folder list is only written when all folders are off
    config.setEnableAllFolders(PR_TRUE);
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("bob", "bobpw", outcome));
    DIRAUTH_CHECK(outcome.getEnableAllFolders());
    DIRAUTH_CHECK_INT(0, outcome.getEnabledFolders().length());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_admin_filter)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(ADMINS);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch(ADMINS, ALICE_DN);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(outcome.isAdministrator());
    DIRAUTH_CHECK(_stored_admin(store, "alice"));

    // the check is a base search of the user's entry, made as the user
    DIRAUTH_CHECK_INT(2, directory.getSearchCount());
    DIRAUTH_CHECK_STR(ALICE_DN, directory.getBases().item(1));
    DIRAUTH_CHECK_STR(ADMINS, directory.getFilters().item(1));
    DIRAUTH_CHECK_INT(LDAP_SCOPE_BASE, directory.getLastScope());
    DIRAUTH_CHECK_STR("1.1", directory.getLastAttrs().item(0));
    DIRAUTH_CHECK_STR(ALICE_DN, directory.getBinds().item(1));

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("bob", "bobpw", outcome));
    DIRAUTH_CHECK(!outcome.isAdministrator());
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_admin_flag_follows_directory)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(ADMINS);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch(ADMINS, "cn=nobody");
    MemoryIdentityStore store;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _add_identity(store, "alice", PR_TRUE));
    int updates = store.getUpdateCount();
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(!outcome.isAdministrator());
    DIRAUTH_CHECK(!_stored_admin(store, "alice"));
    DIRAUTH_CHECK_INT(updates + 1, store.getUpdateCount());

    // unchanged flag, no write
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_INT(updates + 1, store.getUpdateCount());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_disabled_admin_filter_keeps_stored_flag)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(DIRAUTH_ADMIN_FILTER_DISABLED);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _add_identity(store, "alice", PR_TRUE));
    int updates = store.getUpdateCount();
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(outcome.isAdministrator());
    DIRAUTH_CHECK(_stored_admin(store, "alice"));
    DIRAUTH_CHECK_INT(updates, store.getUpdateCount());

    // only the locate search ran
    DIRAUTH_CHECK_INT(1, directory.getSearchCount());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_referrals_use_phase_credentials)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(ADMINS);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch(ADMINS, ALICE_DN);
    directory.setReferral("ldap://replica.example.com/dc=example,dc=com");
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK(outcome.isAdministrator());

    const StringList& rebinds = directory.getReferralBinds();
    DIRAUTH_CHECK_INT(2, rebinds.length());
    DIRAUTH_CHECK_STR(SERVICE_DN, rebinds.item(0));
    DIRAUTH_CHECK_STR(ALICE_DN, rebinds.item(1));

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_connection_failures_by_phase)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    // user phase
    directory.setBindResult(ALICE_DN, LDAP_SERVER_DOWN);
    int rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_USER_CONNECT_FAILED, rv);
    DIRAUTH_CHECK(!dirauth_is_connection_error(rv));
    DIRAUTH_CHECK_STR(dirauth_auth_message(DIRAUTH_ERR_INVALID_CREDENTIALS), dirauth_auth_message(rv));

    // service phase
    directory.setBindResult(SERVICE_DN, LDAP_SERVER_DOWN);
    rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_CONNECT_FAILED, rv);
    DIRAUTH_CHECK(dirauth_is_connection_error(rv));
    DIRAUTH_CHECK_STR("Failed to Connect or Bind to server.", dirauth_auth_message(rv));

    directory.setOpenResult(LDAP_CONNECT_ERROR);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_CONNECT_FAILED, provider.authenticate("alice", "secret", outcome));

    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());
    DIRAUTH_CHECK_INT(0, store.count());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_service_account_rejected)
{
    DirectoryConfig config;
    _configure(config);
    config.setBindPwd("stale");
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    int rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_BIND_FAILED, rv);
    DIRAUTH_CHECK(dirauth_is_connection_error(rv));
    DIRAUTH_CHECK_INT(1, directory.getBinds().length());

    return PR_SUCCESS;
}

class RacingIdentityStore : public MemoryIdentityStore {
public:
    // Another login creates the user between our lookup and our create
    virtual int createUsername(const char *username, Identity *&identity)
    {
        Identity *other = NULL;
        int rv = MemoryIdentityStore::createUsername(username, other);
        delete other;
        identity = NULL;
        return (rv == DIRAUTH_SUCCESS) ? DIRAUTH_ERR_IDENTITY_EXISTS : rv;
    }
};

DIRAUTH_UNIT_TEST(provider_concurrent_creation)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    RacingIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_STR("alice", outcome.getUsername());
    DIRAUTH_CHECK_INT(1, store.count());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_username_from_primary_attribute)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("bob@example.com", "bobpw", outcome));
    DIRAUTH_CHECK_STR("bob", outcome.getUsername());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_username_attribute_outside_search_attributes)
{
    DirectoryConfig config;
    _configure(config);
    config.setUsernameAttr("employeeNumber");
    FakeLdapDirectory directory;
    _populate(directory);
    LdapEntry *carol = directory.addEntry("uid=carol,ou=people,dc=example,dc=com");
    carol->addValue("uid", "carol");
    carol->addValue("employeeNumber", "3003");
    directory.setPassword("uid=carol,ou=people,dc=example,dc=com", "carolpw");
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    // the username attribute is fetched even though nobody logs in with it
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.authenticate("carol", "carolpw", outcome));
    DIRAUTH_CHECK_STR("3003", outcome.getUsername());
    DIRAUTH_CHECK_STR("employeeNumber", directory.getLastAttrs().item(2));

    // an entry without the username attribute cannot become a local user
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_MISSING_UID_ATTR, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_STR(SERVICE_DN, directory.getBinds().item(directory.getBinds().length() - 1));
    DIRAUTH_CHECK_INT(1, store.count());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_password_management)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    Identity identity("alice");

    DIRAUTH_CHECK_STR("LDAP-Authentication", provider.getName());
    DIRAUTH_CHECK(provider.hasPassword(identity));
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_NOT_IMPLEMENTED, provider.changePassword(identity, "newpw"));
    DIRAUTH_CHECK_INT(0, directory.getOpened());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_filtered_users)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch("(mail=alice*)", ALICE_DN);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    StringList dns;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.getFilteredUsers("(objectclass=person)", dns));
    DIRAUTH_CHECK_INT(2, dns.length());
    DIRAUTH_CHECK_STR("uid=bob,ou=people,dc=example,dc=com", dns.item(0));

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, provider.getFilteredUsers("(mail=alice*)", dns));
    DIRAUTH_CHECK_INT(1, dns.length());
    DIRAUTH_CHECK_STR(ALICE_DN, dns.item(0));
    DIRAUTH_CHECK_STR(SERVICE_DN, directory.getBinds().item(1));
    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_admin_check_failure_fails_login_in_user_phase)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(ADMINS);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch(ADMINS, ALICE_DN);
    directory.setSearchResult(ALICE_DN, LDAP_SERVER_DOWN);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    int rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_USER_CONNECT_FAILED, rv);
    DIRAUTH_CHECK(!dirauth_is_connection_error(rv));
    DIRAUTH_CHECK_STR(dirauth_auth_message(DIRAUTH_ERR_INVALID_CREDENTIALS), dirauth_auth_message(rv));
    DIRAUTH_CHECK(!outcome.isSet());
    DIRAUTH_CHECK_INT(0, store.count());

    // the stored flag is not revoked when the check cannot be made
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _add_identity(store, "alice", PR_TRUE));
    int updates = store.getUpdateCount();
    directory.setSearchResult(ALICE_DN, LDAP_OPERATIONS_ERROR);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_USER_CONNECT_FAILED, provider.authenticate("alice", "secret", outcome));
    DIRAUTH_CHECK_INT(updates, store.getUpdateCount());
    DIRAUTH_CHECK(_stored_admin(store, "alice"));

    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(provider_referral_rebind_rejected_by_phase)
{
    DirectoryConfig config;
    _configure(config);
    config.setAdminFilter(ADMINS);
    FakeLdapDirectory directory;
    _populate(directory);
    directory.addFilterMatch(ADMINS, ALICE_DN);
    directory.setReferral("ldap://replica.example.com/dc=example,dc=com");
    directory.setReferralBindResult(ALICE_DN, LDAP_INVALID_CREDENTIALS);
    MemoryIdentityStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    // the user's password is refused at the referred server
    int rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_INVALID_CREDENTIALS, rv);
    DIRAUTH_CHECK(!dirauth_is_connection_error(rv));
    DIRAUTH_CHECK_INT(2, directory.getReferralBinds().length());
    DIRAUTH_CHECK_STR(ALICE_DN, directory.getReferralBinds().item(1));
    DIRAUTH_CHECK_INT(0, store.count());

    // the service account is refused at the referred server
    directory.setReferralBindResult(SERVICE_DN, LDAP_INVALID_CREDENTIALS);
    rv = provider.authenticate("alice", "secret", outcome);
    DIRAUTH_CHECK_INT(DIRAUTH_ERR_BIND_FAILED, rv);
    DIRAUTH_CHECK(dirauth_is_connection_error(rv));

    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

class FailingUpdateStore : public MemoryIdentityStore {
public:
    virtual int updateIdentity(const Identity& identity)
    {
        return DIRAUTH_FAILED;
    }
};

struct LoggedFailures {
    int count;
    char last[512];
};

static int
_log_failures(int degree, const char *formatted, int formattedlen, const char *raw, int rawlen, void *data)
{
    if (degree != LOG_FAILURE)
        return 0;
    LoggedFailures *logged = (LoggedFailures *)data;
    logged->count++;
    PR_snprintf(logged->last, sizeof(logged->last), "%.*s", rawlen, raw);
    return 1;
}

static int
_enabled_degree(void)
{
    int degrees[] = { LOG_FINEST, LOG_FINER, LOG_VERBOSE, LOG_INFORM, LOG_WARN,
                      LOG_FAILURE, LOG_MISCONFIG, LOG_SECURITY };
    for (int i = 0; i < (int)(sizeof(degrees) / sizeof(degrees[0])); i++) {
        if (ereport_can_log(degrees[i]))
            return degrees[i];
    }
    return LOG_CATASTROPHE;
}

DIRAUTH_UNIT_TEST(provider_reports_half_created_user)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    _populate(directory);
    FailingUpdateStore store;
    LdapAuthProvider provider(config, store, directory);
    AuthOutcome outcome;

    static LoggedFailures logged;
    memset(&logged, 0, sizeof(logged));
    int saved = _enabled_degree();
    if (!ereport_can_log(LOG_FAILURE))
        ereport_set_degree(LOG_FAILURE);
    DIRAUTH_CHECK_INT(0, ereport_register_cb(_log_failures, &logged));

    int rv = provider.authenticate("alice", "secret", outcome);

    ereport_unregister_cb(_log_failures, &logged);
    ereport_set_degree(saved);

    DIRAUTH_CHECK_INT(DIRAUTH_ERR_IDENTITY_STORE, rv);
    DIRAUTH_CHECK(!outcome.isSet());
    DIRAUTH_CHECK_INT(1, store.count());
    DIRAUTH_CHECK_INT(1, logged.count);
    DIRAUTH_CHECK(strstr(logged.last, "[alice] was created") != NULL);

    return PR_SUCCESS;
}
