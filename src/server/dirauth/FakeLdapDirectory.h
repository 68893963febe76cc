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

#ifndef _DIRAUTH_FAKELDAPDIRECTORY_H
#define _DIRAUTH_FAKELDAPDIRECTORY_H

#include "dirauth/LdapTransport.h"
#include "dirauth/LdapEntry.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/StringList.h"

/**
 * An in-memory directory for unit tests. It hands out transports that
 * serve its entries, accept binds from its password table, follow scripted
 * failures and record what was asked of them.
 *
 * Filters are not evaluated. A filter registered with addFilterMatch()
 * matches only the DNs given for it; any other filter matches everything
 * in scope.
 */
class FakeLdapDirectory : public LdapTransportFactory {
public:
    FakeLdapDirectory(void);
    virtual ~FakeLdapDirectory(void);

    virtual LdapTransport *create(void);

    // Directory content. The returned entry stays owned by the directory.
    LdapEntry *addEntry(const char *dn);
    void setPassword(const char *dn, const char *password);
    void addFilterMatch(const char *filter, const char *dn);
    void setAllowAnonymous(PRBool allow) { _allowAnonymous = allow; }

    // Scripted behaviour
    void setOpenResult(int rv) { _openResult = rv; }
    void setStartTLSResult(int rv) { _startTLSResult = rv; }
    void setBindResult(const char *dn, int rv);
    void setSearchResult(int rv) { _searchResult = rv; }
    // Only searches based at base fail with rv
    void setSearchResult(const char *base, int rv);
    // Every search is referred to url and needs a rebind there
    void setReferral(const char *url);
    // The referred server answers a rebind as dn with rv
    void setReferralBindResult(const char *dn, int rv);

    // What happened
    int getOpened(void) const { return _opened; }
    int getClosed(void) const { return _closed; }
    int getOpenConnections(void) const { return _opened - _closed; }
    int getStartTLSCount(void) const { return _startTLS; }
    int getSearchCount(void) const { return _filters.length(); }
    const StringList& getBinds(void) const { return _binds; }
    const StringList& getReferralBinds(void) const { return _referralBinds; }
    const StringList& getFilters(void) const { return _filters; }
    const StringList& getBases(void) const { return _bases; }
    const StringList& getLastAttrs(void) const { return _lastAttrs; }
    int getLastScope(void) const { return _lastScope; }
    const char *getLastHost(void) const { return _lastHost; }
    int getLastPort(void) const { return _lastPort; }
    tlsmode_t getLastTlsMode(void) const { return _lastTlsMode; }
    PRBool getLastVerifyCert(void) const { return _lastVerifyCert; }
    int getLastTimeout(void) const { return _lastTimeout; }

private:
    friend class FakeLdapTransport;

    struct Forced {
        char *key;
        char *value;
        int rv;
        Forced *next;
    };

    static void addForced(Forced *&list, const char *key, const char *value, int rv);
    static void freeForced(Forced *&list);

    int bind(const char *dn, const char *password);
    int check(const char *dn, const char *password);
    int search(const char *base, int scope, const char *filter,
               const char **attrs, LdapReferralHandler *referrals,
               LdapSearchResult *&res);
    PRBool inScope(const char *dn, const char *base, int scope) const;
    PRBool filterMatches(const char *filter, const char *dn) const;
    static int forcedResult(const Forced *list, const char *key, int defaultResult);
    LdapEntry *project(const LdapEntry *entry, const char **attrs) const;

    LdapSearchResult _entries;
    Forced *_passwords;
    Forced *_bindResults;
    Forced *_filterMatches;
    Forced *_searchResults;
    Forced *_referralBindResults;
    PRBool _allowAnonymous;
    int _openResult;
    int _startTLSResult;
    int _searchResult;
    char *_referral;

    int _opened;
    int _closed;
    int _startTLS;
    StringList _binds;
    StringList _referralBinds;
    StringList _filters;
    StringList _bases;
    StringList _lastAttrs;
    int _lastScope;
    char *_lastHost;
    int _lastPort;
    tlsmode_t _lastTlsMode;
    PRBool _lastVerifyCert;
    int _lastTimeout;

    // not implemented:
    FakeLdapDirectory(const FakeLdapDirectory &copy_me);
    void operator=(const FakeLdapDirectory &assign_me);
};

#endif /* _DIRAUTH_FAKELDAPDIRECTORY_H */
