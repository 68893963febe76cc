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

#include "unit/dirunit.h"
#include "dirauth/UserLocator.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapEntry.h"
#include "dirauth/FakeLdapDirectory.h"
#include "dirauth/errors.h"

static void
_configure(DirectoryConfig& config)
{
    config.setHost("ldap.example.com");
    config.setBaseDN("dc=example,dc=com");
    config.setSearchFilter("(objectclass=person)");
    config.setSearchAttrs("uid, mail");
}

static int
_locate(DirectoryConfig& config, FakeLdapDirectory& directory, const char *username, LdapEntry *&entry)
{
    LdapConnection ld(config, directory);
    int rv = ld.open("", "");
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    UserLocator locator(config);
    return locator.locate(ld, username, NULL, entry);
}

DIRAUTH_UNIT_TEST(locator_case_sensitivity)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    directory.addEntry("uid=Alice,ou=people,dc=example,dc=com")->addValue("uid", "Alice");

    LdapEntry *entry = NULL;

    DIRAUTH_CHECK_INT(DIRAUTH_FAILED, _locate(config, directory, "alice", entry));
    DIRAUTH_CHECK(entry == NULL);

    config.setCaseInsensitive(PR_TRUE);
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "alice", entry));
    DIRAUTH_CHECK_STR("uid=Alice,ou=people,dc=example,dc=com", entry->DN());
    delete entry;

    DIRAUTH_CHECK_INT(0, directory.getOpenConnections());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_scans_past_non_matching_entries)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    LdapEntry *first = directory.addEntry("uid=alicia,ou=people,dc=example,dc=com");
    first->addValue("uid", "alicia");
    first->addValue("mail", "alicia@example.com");
    LdapEntry *second = directory.addEntry("uid=alice,ou=people,dc=example,dc=com");
    second->addValue("uid", "alice");
    second->addValue("mail", "alice@example.com");

    LdapEntry *entry = NULL;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "alice", entry));
    DIRAUTH_CHECK_STR("uid=alice,ou=people,dc=example,dc=com", entry->DN());
    DIRAUTH_CHECK_STR("alice@example.com", entry->firstValue("mail"));
    delete entry;

    // a match on a later attribute counts too
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "alicia@example.com", entry));
    DIRAUTH_CHECK_STR("uid=alicia,ou=people,dc=example,dc=com", entry->DN());
    delete entry;

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_entry_order_wins_over_attribute_order)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    // bob's mail address is the login name of another entry
    directory.addEntry("uid=robert,ou=people,dc=example,dc=com")->addValue("mail", "bob");
    directory.addEntry("uid=bob,ou=people,dc=example,dc=com")->addValue("uid", "bob");

    LdapEntry *entry = NULL;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "bob", entry));
    DIRAUTH_CHECK_STR("uid=robert,ou=people,dc=example,dc=com", entry->DN());
    delete entry;

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_search_request)
{
    DirectoryConfig config;
    _configure(config);
    config.setUsernameAttr("cn");
    config.setSearchFilter("(&(objectclass=person)(|(uid={username})(mail={username})))");
    FakeLdapDirectory directory;

    LdapEntry *entry = NULL;
    DIRAUTH_CHECK_INT(DIRAUTH_FAILED, _locate(config, directory, "a*b(c)\\", entry));

    DIRAUTH_CHECK_STR("dc=example,dc=com", directory.getBases().item(0));
    DIRAUTH_CHECK_INT(LDAP_SCOPE_SUBTREE, directory.getLastScope());
    DIRAUTH_CHECK_STR("(&(objectclass=person)(|(uid=a\\2ab\\28c\\29\\5c)(mail=a\\2ab\\28c\\29\\5c)))",
                      directory.getFilters().item(0));

    // search attributes, then the username attribute
    const StringList& attrs = directory.getLastAttrs();
    DIRAUTH_CHECK_INT(3, attrs.length());
    DIRAUTH_CHECK_STR("uid", attrs.item(0));
    DIRAUTH_CHECK_STR("mail", attrs.item(1));
    DIRAUTH_CHECK_STR("cn", attrs.item(2));

    // no duplicate when the username attribute is searched already
    config.setUsernameAttr("MAIL");
    UserLocator locator(config);
    StringList projected;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, locator.getAttributes(projected));
    DIRAUTH_CHECK_INT(2, projected.length());

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_filter_without_placeholder)
{
    DirectoryConfig config;
    _configure(config);
    UserLocator locator(config);

    char *filter = locator.buildFilter("alice");
    DIRAUTH_CHECK_STR("(objectclass=person)", filter);
    PR_smprintf_free(filter);

    char *escaped = UserLocator::escapeFilterValue("plain");
    DIRAUTH_CHECK_STR("plain", escaped);
    PR_smprintf_free(escaped);

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_case_folding_beyond_ascii)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    // "\xc3\xa9mile" is émile, "j\xc3\xbcrgen" is jürgen (UTF-8)
    directory.addEntry("uid=emile,ou=people,dc=example,dc=com")->addValue("uid", "\xc3\xa9mile");
    directory.addEntry("uid=juergen,ou=people,dc=example,dc=com")->addValue("mail", "j\xc3\xbcrgen@example.com");

    LdapEntry *entry = NULL;

    DIRAUTH_CHECK_INT(DIRAUTH_FAILED, _locate(config, directory, "\xc3\x89MILE", entry));

    config.setCaseInsensitive(PR_TRUE);
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "\xc3\x89MILE", entry));
    DIRAUTH_CHECK_STR("uid=emile,ou=people,dc=example,dc=com", entry->DN());
    delete entry;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, _locate(config, directory, "J\xc3\x9cRGEN@EXAMPLE.COM", entry));
    DIRAUTH_CHECK_STR("uid=juergen,ou=people,dc=example,dc=com", entry->DN());
    delete entry;

    UserLocator locator(config);
    DIRAUTH_CHECK(locator.matches("ALICE", "alice"));
    DIRAUTH_CHECK(locator.matches("stra\xc3\x9f" "e", "STRASSE"));
    DIRAUTH_CHECK(!locator.matches("\xc3\xa9mile", "emile"));

    // malformed UTF-8 still compares, byte for byte outside ASCII
    DIRAUTH_CHECK(locator.matches("\xff" "abc", "\xff" "ABC"));
    DIRAUTH_CHECK(!locator.matches("\xff" "abc", "\xfe" "abc"));

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(locator_follows_configuration_changes)
{
    DirectoryConfig config;
    _configure(config);
    FakeLdapDirectory directory;
    LdapEntry *alice = directory.addEntry("uid=alice,ou=people,dc=example,dc=com");
    alice->addValue("uid", "alice");
    alice->addValue("employeeNumber", "1001");

    LdapConnection ld(config, directory);
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, ld.open("", ""));
    UserLocator locator(config);

    config.setUsernameAttr("employeeNumber");
    LdapEntry *entry = NULL;
    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, locator.locate(ld, "alice", NULL, entry));
    DIRAUTH_CHECK_INT(3, directory.getLastAttrs().length());
    DIRAUTH_CHECK_STR("employeeNumber", directory.getLastAttrs().item(2));
    DIRAUTH_CHECK_STR("1001", entry->firstValue("employeeNumber"));
    delete entry;

    return PR_SUCCESS;
}
