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

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <ldap.h>

#include "prmem.h"
#include "plstr.h"
#include "plbase64.h"

#include "base/ereport.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/errors.h"

#define BIG_LINE 4096

DirectoryConfig::DirectoryConfig(void)
: _host(NULL), _port(0), _tlsMode(TLS_MODE_NONE), _verifyCert(PR_TRUE),
  _baseDN(NULL), _bindName(NULL), _bindPwd(NULL), _searchFilter(NULL),
  _usernameAttr(NULL), _adminFilter(NULL), _caseInsensitive(PR_FALSE),
  _createUsers(PR_FALSE), _enableAllFolders(PR_TRUE),
  _timeout(DIRAUTH_DEFAULT_TIMEOUT)
{
    _searchAttrs.split(DIRAUTH_DEFAULT_SEARCH_ATTRS);
}

DirectoryConfig::~DirectoryConfig(void)
{
    PL_strfree(_host);
    PL_strfree(_baseDN);
    PL_strfree(_bindName);
    if (_bindPwd) {
        memset(_bindPwd, 0, strlen(_bindPwd));
        PL_strfree(_bindPwd);
    }
    PL_strfree(_searchFilter);
    PL_strfree(_usernameAttr);
    PL_strfree(_adminFilter);
}

void
DirectoryConfig::replace(char *&field, const char *value)
{
    PL_strfree(field);
    field = value ? PL_strdup(value) : NULL;
}

//-----------------------------------------------------------------------------
// DirectoryConfig::parseBool
//-----------------------------------------------------------------------------

int
DirectoryConfig::parseBool(const char *value, PRBool& b)
{
    if (!value)
        return DIRAUTH_ERR_INVALID_ARGUMENT;

    if (!PL_strcasecmp(value, "on") || !PL_strcasecmp(value, "true") ||
        !PL_strcasecmp(value, "yes") || !strcmp(value, "1"))
    {
        b = PR_TRUE;
        return DIRAUTH_SUCCESS;
    }

    if (!PL_strcasecmp(value, "off") || !PL_strcasecmp(value, "false") ||
        !PL_strcasecmp(value, "no") || !strcmp(value, "0"))
    {
        b = PR_FALSE;
        return DIRAUTH_SUCCESS;
    }

    return DIRAUTH_ERR_INVALID_ARGUMENT;
}

//-----------------------------------------------------------------------------
// DirectoryConfig::setUrl
//-----------------------------------------------------------------------------

int
DirectoryConfig::setUrl(const char *url)
{
    if (!url || (PL_strncasecmp(url, "ldap://", 7) && PL_strncasecmp(url, "ldaps://", 8)))
        return DIRAUTH_ERR_URL_INVALID_PREFIX;

    LDAPURLDesc *ludp = 0;

    if (ldap_url_parse(url, &ludp) != LDAP_URL_SUCCESS) {
        if (ludp) ldap_free_urldesc(ludp);
        return DIRAUTH_ERR_URL_PARSE_FAILED;
    }

    if (!ludp->lud_host || !*ludp->lud_host) {
        ldap_free_urldesc(ludp);
        return DIRAUTH_ERR_NO_SERVERNAME;
    }

    PRBool ldapOverSSL = !PL_strcasecmp(ludp->lud_scheme, "ldaps");

    // StartTLS over an ldaps:// connection makes no sense, whichever came first
    if (ldapOverSSL && _tlsMode == TLS_MODE_STARTTLS) {
        ldap_free_urldesc(ludp);
        return DIRAUTH_ERR_INVALID_ARGUMENT;
    }

    replace(_host, ludp->lud_host);
    _port = ludp->lud_port;
    replace(_baseDN, ludp->lud_dn);
    if (ldapOverSSL)
        _tlsMode = TLS_MODE_SSL;
    else if (_tlsMode == TLS_MODE_SSL)
        _tlsMode = TLS_MODE_NONE;

    ldap_free_urldesc(ludp);

    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// DirectoryConfig::setProperty
//-----------------------------------------------------------------------------

int
DirectoryConfig::setProperty(const char *prop, const char *value)
{
    if (!prop || !*prop)
        return DIRAUTH_ERR_PROP_IS_MISSING;
    if (!value)
        return DIRAUTH_ERR_NOT_PROPVAL;

    int rv = DIRAUTH_SUCCESS;
    PRBool b = PR_FALSE;

    if (!PL_strcasecmp(prop, "binddn")) {
        setBindName(value);
    } else if (!PL_strcasecmp(prop, "bindpw")) {
        setBindPwd(value);
    } else if (!PL_strcasecmp(prop, "starttls")) {
        rv = parseBool(value, b);
        if (rv == DIRAUTH_SUCCESS) {
            if (b && _tlsMode == TLS_MODE_SSL) {
                // StartTLS over an ldaps:// connection makes no sense
                rv = DIRAUTH_ERR_INVALID_ARGUMENT;
            } else if (b) {
                _tlsMode = TLS_MODE_STARTTLS;
            } else if (_tlsMode == TLS_MODE_STARTTLS) {
                _tlsMode = TLS_MODE_NONE;
            }
        }
    } else if (!PL_strcasecmp(prop, "verifycert")) {
        rv = parseBool(value, b);
        if (rv == DIRAUTH_SUCCESS)
            setVerifyCert(b);
    } else if (!PL_strcasecmp(prop, "searchfilter")) {
        setSearchFilter(value);
    } else if (!PL_strcasecmp(prop, "searchattrs")) {
        rv = setSearchAttrs(value);
    } else if (!PL_strcasecmp(prop, "usernameattr")) {
        setUsernameAttr(value);
    } else if (!PL_strcasecmp(prop, "adminfilter")) {
        setAdminFilter(value);
    } else if (!PL_strcasecmp(prop, "caseinsensitive")) {
        rv = parseBool(value, b);
        if (rv == DIRAUTH_SUCCESS)
            setCaseInsensitive(b);
    } else if (!PL_strcasecmp(prop, "createusers")) {
        rv = parseBool(value, b);
        if (rv == DIRAUTH_SUCCESS)
            setCreateUsers(b);
    } else if (!PL_strcasecmp(prop, "enableallfolders")) {
        rv = parseBool(value, b);
        if (rv == DIRAUTH_SUCCESS)
            setEnableAllFolders(b);
    } else if (!PL_strcasecmp(prop, "enabledfolders")) {
        rv = setEnabledFolders(value);
    } else if (!PL_strcasecmp(prop, "timeout")) {
        char *end = NULL;
        long seconds = strtol(value, &end, 10);
        if (end == value || *end || seconds <= 0 || seconds > 3600) {
            rv = DIRAUTH_ERR_INVALID_ARGUMENT;
        } else {
            setTimeout((int)seconds);
        }
    } else {
        rv = DIRAUTH_ERR_UNKNOWN_PROP;
    }

    return rv;
}

//-----------------------------------------------------------------------------
// DirectoryConfig::validate
//-----------------------------------------------------------------------------

int
DirectoryConfig::validate(void) const
{
    if (!_host || !*_host)
        return DIRAUTH_ERR_NO_SERVERNAME;

    if (!getUsernameAttr())
        return DIRAUTH_ERR_INVALID_ARGUMENT;

    if (_timeout <= 0)
        return DIRAUTH_ERR_INVALID_ARGUMENT;

    return DIRAUTH_SUCCESS;
}

void
DirectoryConfig::setHost(const char *host)
{
    replace(_host, host);
}

void
DirectoryConfig::setPort(int port)
{
    _port = port;
}

int
DirectoryConfig::getPort(void) const
{
    if (_port)
        return _port;
    return (_tlsMode == TLS_MODE_SSL) ? DIRAUTH_DEFAULT_SSL_PORT : DIRAUTH_DEFAULT_PORT;
}

void
DirectoryConfig::setTlsMode(tlsmode_t mode)
{
    _tlsMode = mode;
}

void
DirectoryConfig::setVerifyCert(PRBool verify)
{
    _verifyCert = verify;
}

void
DirectoryConfig::setBaseDN(const char *basedn)
{
    replace(_baseDN, basedn);
}

void
DirectoryConfig::setBindName(const char *binddn)
{
    replace(_bindName, binddn);
}

void
DirectoryConfig::setBindPwd(const char *bindpw)
{
    if (_bindPwd)
        memset(_bindPwd, 0, strlen(_bindPwd));
    replace(_bindPwd, bindpw);
}

void
DirectoryConfig::setSearchFilter(const char *filter)
{
    replace(_searchFilter, filter);
}

const char *
DirectoryConfig::getSearchFilter(void) const
{
    return (_searchFilter && *_searchFilter) ? _searchFilter : DIRAUTH_DEFAULT_FILTER;
}

int
DirectoryConfig::setSearchAttrs(const char *list)
{
    return _searchAttrs.split(list);
}

void
DirectoryConfig::setUsernameAttr(const char *attr)
{
    replace(_usernameAttr, attr);
}

const char *
DirectoryConfig::getUsernameAttr(void) const
{
    if (_usernameAttr && *_usernameAttr)
        return _usernameAttr;
    return _searchAttrs.item(0);
}

void
DirectoryConfig::setAdminFilter(const char *filter)
{
    replace(_adminFilter, filter);
}

PRBool
DirectoryConfig::isAdminFilterEnabled(void) const
{
    if (!_adminFilter || !*_adminFilter)
        return PR_FALSE;
    return strcmp(_adminFilter, DIRAUTH_ADMIN_FILTER_DISABLED) ? PR_TRUE : PR_FALSE;
}

void
DirectoryConfig::setCaseInsensitive(PRBool ignoreCase)
{
    _caseInsensitive = ignoreCase;
}

void
DirectoryConfig::setCreateUsers(PRBool create)
{
    _createUsers = create;
}

void
DirectoryConfig::setEnableAllFolders(PRBool all)
{
    _enableAllFolders = all;
}

int
DirectoryConfig::setEnabledFolders(const char *list)
{
    return _enabledFolders.split(list);
}

void
DirectoryConfig::setTimeout(int seconds)
{
    _timeout = seconds;
}

//-----------------------------------------------------------------------------
// DirectoryConfig::read
//-----------------------------------------------------------------------------

static char *
_next_token(char *&ptr)
{
    while (*ptr && isspace((unsigned char)*ptr)) ptr++;
    char *token = ptr;
    while (*ptr && !isspace((unsigned char)*ptr)) ptr++;
    if (*ptr) *ptr++ = '\0';
    while (*ptr && isspace((unsigned char)*ptr)) ptr++;
    return token;
}

int
DirectoryConfig::read(const char *file, const char *dbname, DirectoryConfig *&config)
{
    FILE *fp;
    char buf[BIG_LINE];
    int lineno = 0;
    int rv = DIRAUTH_SUCCESS;
    PRBool found = PR_FALSE;

    config = NULL;

    if (!dbname || !*dbname)
        dbname = DIRAUTH_DEFAULT_DBNAME;

    if (!file || (fp = fopen(file, "r")) == NULL) {
        ereport(LOG_MISCONFIG, "dirauth: cannot open config file %s", file ? file : "(null)");
        return DIRAUTH_ERR_CANNOT_OPEN_FILE;
    }

    DirectoryConfig *cfg = new DirectoryConfig;

    while (rv == DIRAUTH_SUCCESS && fgets(buf, sizeof(buf), fp)) {
        lineno++;

        /* strip trailing whitespace, including the newline */
        int len = strlen(buf);
        while (len > 0 && isspace((unsigned char)buf[len - 1]))
            buf[--len] = '\0';

        char *ptr = buf;

        /* skip leading whitespace */
        while (*ptr && isspace((unsigned char)*ptr)) ++ptr;

        /* skip blank lines and comments */
        if (!*ptr || *ptr == '#')
            continue;

        char *directive = _next_token(ptr);

        if (!PL_strcasecmp(directive, "directory")) {
            char *name = _next_token(ptr);
            if (!*name) {
                rv = DIRAUTH_ERR_DBNAME_IS_MISSING;
            } else if (!strcmp(name, dbname)) {
                if (!*ptr) {
                    rv = DIRAUTH_ERR_NOT_PROPVAL;
                } else {
                    rv = cfg->setUrl(_next_token(ptr));
                    found = PR_TRUE;
                }
            }
            continue;
        }

        /* <dbname>:<prop> <value> */
        char *colon = strchr(directive, ':');
        if (!colon || colon == directive) {
            rv = DIRAUTH_ERR_NOT_PROPVAL;
            continue;
        }
        *colon = '\0';
        if (strcmp(directive, dbname))
            continue;

        char *prop = colon + 1;
        PRBool encoded = PR_FALSE;
        if (!PL_strcasecmp(prop, "encoded")) {
            encoded = PR_TRUE;
            prop = _next_token(ptr);
        }

        if (!*prop) {
            rv = DIRAUTH_ERR_PROP_IS_MISSING;
        } else if (encoded) {
            char *decoded = PL_Base64Decode(ptr, strlen(ptr), NULL);
            if (!decoded) {
                rv = DIRAUTH_ERR_INVALID_ARGUMENT;
            } else {
                rv = cfg->setProperty(prop, decoded);
                memset(decoded, 0, strlen(decoded));
                PR_Free(decoded);
            }
        } else {
            rv = cfg->setProperty(prop, ptr);
        }
    }

    fclose(fp);

    if (rv != DIRAUTH_SUCCESS) {
        ereport(LOG_MISCONFIG, "dirauth: error in config file %s, line %d: %s",
                file, lineno, dirauth_err2string(rv));
        delete cfg;
        return rv;
    }

    if (!found) {
        ereport(LOG_MISCONFIG, "dirauth: config file %s has no directory directive for database %s",
                file, dbname);
        delete cfg;
        return DIRAUTH_ERR_DIRECTIVE_IS_MISSING;
    }

    rv = cfg->validate();
    if (rv != DIRAUTH_SUCCESS) {
        ereport(LOG_MISCONFIG, "dirauth: database %s in config file %s is unusable: %s",
                dbname, file, dirauth_err2string(rv));
        delete cfg;
        return rv;
    }

    config = cfg;
    return DIRAUTH_SUCCESS;
}
