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
#include "plstr.h"

#include "base/ereport.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/errors.h"

LdapConnection::LdapConnection(const DirectoryConfig& config, LdapTransportFactory& factory)
: _config(config), _factory(factory), _transport(NULL), _boundto(NONE),
  _lastrv(LDAP_SUCCESS)
{
    _errmsg[0] = '\0';
}

LdapConnection::~LdapConnection(void)
{
    close();
}

PRBool
LdapConnection::serverDown(int statusCode)
{
      return ((statusCode == LDAP_CONNECT_ERROR) ||
                (statusCode == LDAP_SERVER_DOWN) ||
                (statusCode == LDAP_TIMEOUT) ||
                (statusCode == LDAP_UNAVAILABLE));
}

//-----------------------------------------------------------------------------
// LdapConnection::fail
//-----------------------------------------------------------------------------

int
LdapConnection::fail(int rv, int status, const char *what, const char *dn)
{
    _lastrv = rv;
    PR_snprintf(_errmsg, sizeof(_errmsg), "%s",
                _transport ? _transport->getErrorMessage() : ldap_err2string(rv));

    int degree = (status == DIRAUTH_ERR_BIND_FAILED) ? LOG_VERBOSE : LOG_FAILURE;
    if (dn) {
        ereport(degree, "ldap: %s as [%s] on %s:%d failed: %s",
                what, dn, _config.getHost(), _config.getPort(), _errmsg);
    } else {
        ereport(degree, "ldap: %s on %s:%d failed: %s",
                what, _config.getHost(), _config.getPort(), _errmsg);
    }

    close();
    return status;
}

//-----------------------------------------------------------------------------
// LdapConnection::connect
//-----------------------------------------------------------------------------

int
LdapConnection::connect(void)
{
    close();

    if (!_config.getHost() || !*_config.getHost())
        return DIRAUTH_ERR_NO_SERVERNAME;

    _transport = _factory.create();
    if (!_transport)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    int rv = _transport->open(_config.getHost(), _config.getPort(),
                              _config.getTlsMode(), _config.getVerifyCert(),
                              _config.getTimeout());
    if (rv != LDAP_SUCCESS) {
        return fail(rv, serverDown(rv) ? DIRAUTH_ERR_CONNECT_FAILED : DIRAUTH_ERR_LDAP_INIT_FAILED,
                    "connect", NULL);
    }

    ereport(LOG_FINEST, "ldap: opened connection to %s:%d (%s)",
            _config.getHost(), _config.getPort(),
            _config.getTlsMode() == TLS_MODE_SSL ? "ldaps" : "ldap");

    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// LdapConnection::startTLS
//-----------------------------------------------------------------------------

int
LdapConnection::startTLS(void)
{
    if (!_transport)
        return DIRAUTH_ERR_NOT_CONNECTED;

    int rv = _transport->startTLS();
    if (rv != LDAP_SUCCESS)
        return fail(rv, serverDown(rv) ? DIRAUTH_ERR_CONNECT_FAILED : DIRAUTH_ERR_TLS_FAILED,
                    "StartTLS", NULL);

    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// LdapConnection::bind
//-----------------------------------------------------------------------------

int
LdapConnection::bind(const char *dn, const char *password)
{
    if (!_transport)
        return DIRAUTH_ERR_NOT_CONNECTED;

    _boundto = NONE;

    int rv = _transport->simpleBind(dn, password);
    _lastrv = rv;
    if (rv != LDAP_SUCCESS)
        return fail(rv, serverDown(rv) ? DIRAUTH_ERR_CONNECT_FAILED : DIRAUTH_ERR_BIND_FAILED,
                    "bind", dn ? dn : "");

    _boundto = (dn && *dn) ? AUTHENTICATED : ANONYMOUS;
    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// LdapConnection::open
//-----------------------------------------------------------------------------

int
LdapConnection::open(const char *dn, const char *password)
{
    int rv = connect();
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    if (_config.getTlsMode() == TLS_MODE_STARTTLS) {
        rv = startTLS();
        if (rv != DIRAUTH_SUCCESS)
            return rv;
    }

    return bind(dn, password);
}

//-----------------------------------------------------------------------------
// LdapConnection::search
//-----------------------------------------------------------------------------

int
LdapConnection::search(const char *base, int scope, const char *filter,
                       const char **attrs, int attrsonly,
                       LdapReferralHandler *referrals, LdapSearchResult *&res)
{
    res = NULL;

    if (!_transport)
        return DIRAUTH_ERR_NOT_CONNECTED;

    /* If base is NULL set it to null string */
    if (!base)
	base = "";

    if (!filter || !*filter)
	filter = DIRAUTH_DEFAULT_FILTER;

    ereport(LOG_FINEST, "ldap: search base [%s] scope %s filter [%s]%s",
            base,
            (scope == LDAP_SCOPE_SUBTREE ? "subtree"
             : (scope == LDAP_SCOPE_ONELEVEL ? "onelevel" : "base")),
            filter, referrals ? " following referrals" : "");

    LdapSearchResult *result = NULL;
    int rv = _transport->search(base, scope, filter, attrs, attrsonly, referrals, result);
    _lastrv = rv;

    switch (rv) {
    case LDAP_SUCCESS:
	break;
    case LDAP_SIZELIMIT_EXCEEDED:
	ereport(LOG_WARN, "ldap: search of [%s] on %s:%d hit the size limit, %lu entries returned",
		base, _config.getHost(), _config.getPort(),
		result ? result->entries() : 0UL);
	break;
    case LDAP_NO_SUCH_OBJECT:
	// nothing under that base: an empty result, not an error
	delete result;
	result = new LdapSearchResult(LDAP_SUCCESS);
	break;
    case LDAP_INVALID_CREDENTIALS:
    case LDAP_INAPPROPRIATE_AUTH:
	// a referred server refused the identity we presented
	delete result;
	PR_snprintf(_errmsg, sizeof(_errmsg), "%s", _transport->getErrorMessage());
	ereport(LOG_VERBOSE, "ldap: referral bind during search of [%s] failed: %s", base, _errmsg);
	return DIRAUTH_ERR_BIND_FAILED;
    default:
	delete result;
	PR_snprintf(_errmsg, sizeof(_errmsg), "%s", _transport->getErrorMessage());
	ereport(LOG_FAILURE, "ldap: search of [%s] with filter [%s] on %s:%d failed: %s",
		base, filter, _config.getHost(), _config.getPort(), _errmsg);
	return serverDown(rv) ? DIRAUTH_ERR_CONNECT_FAILED : DIRAUTH_ERR_SEARCH_FAILED;
    }

    if (!result)
	result = new LdapSearchResult(LDAP_SUCCESS);
    result->setResult(LDAP_SUCCESS);
    res = result;
    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// LdapConnection::close
//-----------------------------------------------------------------------------

void
LdapConnection::close(void)
{
    if (_transport) {
        _transport->close();
        delete _transport;
        _transport = NULL;
    }
    _boundto = NONE;
}
