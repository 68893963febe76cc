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
#include "plstr.h"

#include "dirauth/FakeLdapDirectory.h"
#include "dirauth/LdapReferralHandler.h"
#include "dirauth/errors.h"

class FakeLdapTransport : public LdapTransport {
public:
    FakeLdapTransport(FakeLdapDirectory& directory)
    : _directory(directory), _open(PR_FALSE)
    {
        _errbuf[0] = '\0';
    }

    virtual ~FakeLdapTransport(void)
    {
        close();
    }

    virtual int open(const char *host, int port, tlsmode_t mode, PRBool verifyCert, int timeout)
    {
        PL_strfree(_directory._lastHost);
        _directory._lastHost = PL_strdup(host);
        _directory._lastPort = port;
        _directory._lastTlsMode = mode;
        _directory._lastVerifyCert = verifyCert;
        _directory._lastTimeout = timeout;

        int rv = _directory._openResult;
        if (rv != LDAP_SUCCESS)
            return error(rv, "connect");

        _open = PR_TRUE;
        _directory._opened++;
        return LDAP_SUCCESS;
    }

    virtual int startTLS(void)
    {
        if (!_open)
            return error(LDAP_SERVER_DOWN, "StartTLS");
        _directory._startTLS++;
        int rv = _directory._startTLSResult;
        return (rv == LDAP_SUCCESS) ? rv : error(rv, "StartTLS");
    }

    virtual int simpleBind(const char *dn, const char *password)
    {
        if (!_open)
            return error(LDAP_SERVER_DOWN, "bind");
        int rv = _directory.bind(dn, password);
        return (rv == LDAP_SUCCESS) ? rv : error(rv, "bind");
    }

    virtual int search(const char *base, int scope, const char *filter,
                       const char **attrs, int attrsonly,
                       LdapReferralHandler *referrals,
                       LdapSearchResult *&res)
    {
        res = NULL;
        if (!_open)
            return error(LDAP_SERVER_DOWN, "search");
        int rv = _directory.search(base, scope, filter, attrs, referrals, res);
        return (rv == LDAP_SUCCESS) ? rv : error(rv, "search");
    }

    virtual void close(void)
    {
        if (_open) {
            _open = PR_FALSE;
            _directory._closed++;
        }
    }

    virtual const char *getErrorMessage(void)
    {
        return _errbuf;
    }

private:
    int error(int rv, const char *what)
    {
        PR_snprintf(_errbuf, sizeof(_errbuf), "%s failed: %s", what, ldap_err2string(rv));
        return rv;
    }

    FakeLdapDirectory& _directory;
    PRBool _open;
    char _errbuf[256];
};

FakeLdapDirectory::FakeLdapDirectory(void)
: _entries(LDAP_SUCCESS), _passwords(NULL), _bindResults(NULL),
  _filterMatches(NULL), _searchResults(NULL), _referralBindResults(NULL),
  _allowAnonymous(PR_TRUE), _openResult(LDAP_SUCCESS),
  _startTLSResult(LDAP_SUCCESS), _searchResult(LDAP_SUCCESS), _referral(NULL),
  _opened(0), _closed(0), _startTLS(0), _lastScope(-1), _lastHost(NULL),
  _lastPort(0), _lastTlsMode(TLS_MODE_NONE), _lastVerifyCert(PR_FALSE),
  _lastTimeout(0)
{
}

FakeLdapDirectory::~FakeLdapDirectory(void)
{
    freeForced(_passwords);
    freeForced(_bindResults);
    freeForced(_filterMatches);
    freeForced(_searchResults);
    freeForced(_referralBindResults);
    PL_strfree(_referral);
    PL_strfree(_lastHost);
}

void
FakeLdapDirectory::addForced(Forced *&list, const char *key, const char *value, int rv)
{
    Forced *forced = new Forced;
    forced->key = PL_strdup(key ? key : "");
    forced->value = PL_strdup(value ? value : "");
    forced->rv = rv;
    forced->next = list;
    list = forced;
}

void
FakeLdapDirectory::freeForced(Forced *&list)
{
    while (list) {
        Forced *forced = list;
        list = forced->next;
        PL_strfree(forced->key);
        PL_strfree(forced->value);
        delete forced;
    }
}

LdapTransport *
FakeLdapDirectory::create(void)
{
    return new FakeLdapTransport(*this);
}

LdapEntry *
FakeLdapDirectory::addEntry(const char *dn)
{
    LdapEntry *entry = new LdapEntry(dn);
    _entries.add(entry);
    return entry;
}

void
FakeLdapDirectory::setPassword(const char *dn, const char *password)
{
    addForced(_passwords, dn, password, LDAP_SUCCESS);
}

void
FakeLdapDirectory::addFilterMatch(const char *filter, const char *dn)
{
    addForced(_filterMatches, filter, dn, LDAP_SUCCESS);
}

void
FakeLdapDirectory::setBindResult(const char *dn, int rv)
{
    addForced(_bindResults, dn, NULL, rv);
}

void
FakeLdapDirectory::setSearchResult(const char *base, int rv)
{
    addForced(_searchResults, base, NULL, rv);
}

void
FakeLdapDirectory::setReferralBindResult(const char *dn, int rv)
{
    addForced(_referralBindResults, dn, NULL, rv);
}

int
FakeLdapDirectory::forcedResult(const Forced *list, const char *key, int defaultResult)
{
    for (const Forced *forced = list; forced; forced = forced->next) {
        if (!PL_strcasecmp(forced->key, key))
            return forced->rv;
    }
    return defaultResult;
}

void
FakeLdapDirectory::setReferral(const char *url)
{
    PL_strfree(_referral);
    _referral = url ? PL_strdup(url) : NULL;
}

int
FakeLdapDirectory::bind(const char *dn, const char *password)
{
    if (!dn)
        dn = "";
    if (!password)
        password = "";

    _binds.add(dn);
    return check(dn, password);
}

int
FakeLdapDirectory::check(const char *dn, const char *password)
{
    for (Forced *forced = _bindResults; forced; forced = forced->next) {
        if (!PL_strcasecmp(forced->key, dn))
            return forced->rv;
    }

    if (!*dn)
        return _allowAnonymous ? LDAP_SUCCESS : LDAP_UNWILLING_TO_PERFORM;

    for (Forced *forced = _passwords; forced; forced = forced->next) {
        if (!PL_strcasecmp(forced->key, dn))
            return strcmp(forced->value, password) ? LDAP_INVALID_CREDENTIALS : LDAP_SUCCESS;
    }

    return LDAP_INVALID_CREDENTIALS;
}

PRBool
FakeLdapDirectory::inScope(const char *dn, const char *base, int scope) const
{
    int dnlen = strlen(dn);
    int baselen = strlen(base);

    if (scope == LDAP_SCOPE_BASE)
        return PL_strcasecmp(dn, base) ? PR_FALSE : PR_TRUE;

    if (!baselen)
        return PR_TRUE;
    if (dnlen < baselen || PL_strcasecmp(dn + dnlen - baselen, base))
        return PR_FALSE;
    return (dnlen == baselen || dn[dnlen - baselen - 1] == ',') ? PR_TRUE : PR_FALSE;
}

PRBool
FakeLdapDirectory::filterMatches(const char *filter, const char *dn) const
{
    PRBool registered = PR_FALSE;
    for (Forced *forced = _filterMatches; forced; forced = forced->next) {
        if (!strcmp(forced->key, filter)) {
            registered = PR_TRUE;
            if (!PL_strcasecmp(forced->value, dn))
                return PR_TRUE;
        }
    }
    return !registered;
}

LdapEntry *
FakeLdapDirectory::project(const LdapEntry *entry, const char **attrs) const
{
    if (!attrs)
        return entry->clone();

    LdapEntry *copy = new LdapEntry(entry->DN());
    for (int i = 0; attrs[i]; i++) {
        const StringList *values = entry->values(attrs[i]);
        if (!values)
            continue;
        for (int j = 0; j < values->length(); j++)
            copy->addValue(attrs[i], values->item(j));
    }
    return copy;
}

int
FakeLdapDirectory::search(const char *base, int scope, const char *filter,
                          const char **attrs, LdapReferralHandler *referrals,
                          LdapSearchResult *&res)
{
    _bases.add(base);
    _filters.add(filter);
    _lastScope = scope;
    _lastAttrs.clear();
    for (int i = 0; attrs && attrs[i]; i++)
        _lastAttrs.add(attrs[i]);

    int forced = forcedResult(_searchResults, base, _searchResult);
    if (forced != LDAP_SUCCESS) {
        res = new LdapSearchResult(forced);
        return forced;
    }

    if (_referral) {
        if (!referrals) {
            res = new LdapSearchResult(LDAP_REFERRAL);
            return LDAP_REFERRAL;
        }

        const char *dn = NULL;
        const char *password = NULL;
        if (referrals->getCredentials(_referral, dn, password) != DIRAUTH_SUCCESS) {
            res = new LdapSearchResult(LDAP_INAPPROPRIATE_AUTH);
            return LDAP_INAPPROPRIATE_AUTH;
        }
        _referralBinds.add(dn);

        int rv = forcedResult(_referralBindResults, dn ? dn : "", LDAP_SUCCESS);
        if (rv == LDAP_SUCCESS)
            rv = check(dn ? dn : "", password ? password : "");
        if (rv != LDAP_SUCCESS) {
            res = new LdapSearchResult(rv);
            return rv;
        }
    }

    res = new LdapSearchResult(LDAP_SUCCESS);

    _entries.reset();
    LdapEntry *entry;
    while ((entry = _entries.next()) != NULL) {
        if (inScope(entry->DN(), base, scope) && filterMatches(filter, entry->DN()))
            res->add(project(entry, attrs));
    }

    return LDAP_SUCCESS;
}
