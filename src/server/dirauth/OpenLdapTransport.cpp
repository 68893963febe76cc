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
#include <sys/time.h>

#include "prprf.h"
#include "plstr.h"

#include "base/ereport.h"
#include "dirauth/OpenLdapTransport.h"
#include "dirauth/LdapReferralHandler.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/errors.h"

OpenLdapTransport::OpenLdapTransport(void)
: _session(NULL), _timeout(DIRAUTH_DEFAULT_TIMEOUT), _referrals(NULL),
  _rebindResult(LDAP_SUCCESS)
{
    _errbuf[0] = '\0';
}

OpenLdapTransport::~OpenLdapTransport(void)
{
    close();
}

void
OpenLdapTransport::setError(int rv, const char *what)
{
    char *diag = NULL;

    if (_session)
        ldap_get_option(_session, LDAP_OPT_DIAGNOSTIC_MESSAGE, &diag);

    if (diag && *diag) {
        PR_snprintf(_errbuf, sizeof(_errbuf), "%s: %s (%s)", what, ldap_err2string(rv), diag);
    } else {
        PR_snprintf(_errbuf, sizeof(_errbuf), "%s: %s", what, ldap_err2string(rv));
    }

    if (diag)
        ldap_memfree(diag);
}

const char *
OpenLdapTransport::getErrorMessage(void)
{
    return _errbuf;
}

int
OpenLdapTransport::setOption(int option, const void *value, const char *name)
{
    int rv = ldap_set_option(_session, option, value);
    if (rv != LDAP_OPT_SUCCESS) {
        PR_snprintf(_errbuf, sizeof(_errbuf), "ldap_set_option(%s) failed", name);
        return LDAP_LOCAL_ERROR;
    }
    return LDAP_SUCCESS;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::open
//-----------------------------------------------------------------------------

int
OpenLdapTransport::open(const char *host, int port, tlsmode_t mode, PRBool verifyCert, int timeout)
{
    close();

    _timeout = timeout;

    // IPv6 literals need brackets in an LDAP URL
    PRBool literal = (strchr(host, ':') != NULL);
    char *uri = PR_smprintf("%s://%s%s%s:%d",
                            (mode == TLS_MODE_SSL) ? "ldaps" : "ldap",
                            literal ? "[" : "", host, literal ? "]" : "", port);
    if (!uri) {
        PR_snprintf(_errbuf, sizeof(_errbuf), "out of memory");
        return LDAP_NO_MEMORY;
    }

    int rv = ldap_initialize(&_session, uri);
    if (rv != LDAP_SUCCESS) {
        setError(rv, "ldap_initialize failed");
        PR_smprintf_free(uri);
        _session = NULL;
        return rv;
    }
    PR_smprintf_free(uri);

    int version = LDAP_VERSION3;
    int deref = LDAP_DEREF_NEVER;
    struct timeval tv;
    tv.tv_sec = timeout;
    tv.tv_usec = 0;
    int certreqopt = verifyCert ? LDAP_OPT_X_TLS_DEMAND : LDAP_OPT_X_TLS_NEVER;
    int newctx = 0;

    if ((rv = setOption(LDAP_OPT_PROTOCOL_VERSION, &version, "LDAP_OPT_PROTOCOL_VERSION")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_DEREF, &deref, "LDAP_OPT_DEREF")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_REFERRALS, LDAP_OPT_OFF, "LDAP_OPT_REFERRALS")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_NETWORK_TIMEOUT, &tv, "LDAP_OPT_NETWORK_TIMEOUT")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_TIMEOUT, &tv, "LDAP_OPT_TIMEOUT")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_X_TLS_REQUIRE_CERT, &certreqopt, "LDAP_OPT_X_TLS_REQUIRE_CERT")) != LDAP_SUCCESS ||
        (rv = setOption(LDAP_OPT_X_TLS_NEWCTX, &newctx, "LDAP_OPT_X_TLS_NEWCTX")) != LDAP_SUCCESS)
    {
        close();
        return rv;
    }

    rv = ldap_set_rebind_proc(_session, rebindProc, this);
    if (rv != LDAP_SUCCESS) {
        setError(rv, "ldap_set_rebind_proc failed");
        close();
        return rv;
    }

    return LDAP_SUCCESS;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::startTLS
//-----------------------------------------------------------------------------

int
OpenLdapTransport::startTLS(void)
{
    if (!_session)
        return LDAP_SERVER_DOWN;

    int rv = ldap_start_tls_s(_session, NULL, NULL);
    if (rv != LDAP_SUCCESS)
        setError(rv, "StartTLS failed");
    return rv;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::simpleBind
//-----------------------------------------------------------------------------

int
OpenLdapTransport::simpleBind(const char *dn, const char *password)
{
    if (!_session)
        return LDAP_SERVER_DOWN;

    struct berval cred;
    cred.bv_val = (char *)(password ? password : "");
    cred.bv_len = strlen(cred.bv_val);

    int rv = ldap_sasl_bind_s(_session, (dn && *dn) ? dn : NULL, LDAP_SASL_SIMPLE,
                              &cred, NULL, NULL, NULL);
    if (rv != LDAP_SUCCESS)
        setError(rv, "bind failed");
    return rv;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::rebindProc
//-----------------------------------------------------------------------------

int
OpenLdapTransport::rebindProc(LDAP *ld, LDAP_CONST char *url, ber_tag_t request,
                              ber_int_t msgid, void *params)
{
    OpenLdapTransport *transport = (OpenLdapTransport *)params;

    if (!transport->_referrals) {
        transport->_rebindResult = LDAP_REFERRAL;
        return LDAP_REFERRAL;
    }

    const char *dn = NULL;
    const char *password = NULL;
    if (transport->_referrals->getCredentials(url, dn, password) != DIRAUTH_SUCCESS) {
        transport->_rebindResult = LDAP_INAPPROPRIATE_AUTH;
        return LDAP_INAPPROPRIATE_AUTH;
    }

    struct berval cred;
    cred.bv_val = (char *)(password ? password : "");
    cred.bv_len = strlen(cred.bv_val);

    int rv = ldap_sasl_bind_s(ld, (dn && *dn) ? dn : NULL, LDAP_SASL_SIMPLE,
                              &cred, NULL, NULL, NULL);
    if (rv != LDAP_SUCCESS) {
        ereport(LOG_VERBOSE, "ldap referral: bind as [%s] to %s failed: %s",
                dn ? dn : "", url, ldap_err2string(rv));
        transport->_rebindResult = rv;
    }

    return rv;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::chaseResult
//-----------------------------------------------------------------------------

int
OpenLdapTransport::chaseResult(int searchrv, int rebindrv)
{
    if (searchrv != LDAP_SUCCESS && rebindrv != LDAP_SUCCESS)
        return rebindrv;
    return searchrv;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::search
//-----------------------------------------------------------------------------

int
OpenLdapTransport::search(const char *base, int scope, const char *filter,
                          const char **attrs, int attrsonly,
                          LdapReferralHandler *referrals,
                          LdapSearchResult *&res)
{
    res = NULL;

    if (!_session)
        return LDAP_SERVER_DOWN;

    int rv = setOption(LDAP_OPT_REFERRALS, referrals ? LDAP_OPT_ON : LDAP_OPT_OFF,
                       "LDAP_OPT_REFERRALS");
    if (rv != LDAP_SUCCESS)
        return rv;

    _referrals = referrals;
    _rebindResult = LDAP_SUCCESS;

    struct timeval tv;
    tv.tv_sec = _timeout;
    tv.tv_usec = 0;

    LDAPMessage *message = NULL;
    rv = ldap_search_ext_s(_session, base, scope, filter, (char **)attrs, attrsonly,
                           NULL, NULL, &tv, LDAP_NO_LIMIT, &message);

    _referrals = NULL;

    rv = chaseResult(rv, _rebindResult);

    if (rv != LDAP_SUCCESS)
        setError(rv, "search failed");

    res = new LdapSearchResult(rv);

    if (message) {
        for (LDAPMessage *e = ldap_first_entry(_session, message); e;
             e = ldap_next_entry(_session, e))
        {
            char *dn = ldap_get_dn(_session, e);
            LdapEntry *entry = new LdapEntry(dn);
            if (dn)
                ldap_memfree(dn);

            BerElement *ber = NULL;
            for (char *attr = ldap_first_attribute(_session, e, &ber); attr;
                 attr = ldap_next_attribute(_session, e, ber))
            {
                struct berval **vals = ldap_get_values_len(_session, e, attr);
                if (vals) {
                    for (int i = 0; vals[i]; i++)
                        entry->addValue(attr, vals[i]->bv_val, vals[i]->bv_len);
                    ldap_value_free_len(vals);
                }
                ldap_memfree(attr);
            }
            if (ber)
                ber_free(ber, 0);

            res->add(entry);
        }
        ldap_msgfree(message);
    }

    return rv;
}

//-----------------------------------------------------------------------------
// OpenLdapTransport::close
//-----------------------------------------------------------------------------

void
OpenLdapTransport::close(void)
{
    if (_session) {
        ldap_unbind_ext_s(_session, NULL, NULL);
        _session = NULL;
    }
}

LdapTransport *
OpenLdapTransportFactory::create(void)
{
    return new OpenLdapTransport;
}
