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

#include "dirauth/errors.h"

DIRAUTH_PUBLIC const char *dirauth_err2string(int err)
{
    const char *rv;

    switch(err) {

    case DIRAUTH_SUCCESS:
	rv = "success";
	break;
    case DIRAUTH_FAILED:
	rv = "ldap search didn't find an ldap entry";
	break;

	/* Common error codes */
    case DIRAUTH_ERR_NOT_IMPLEMENTED:
	rv = "operation is not supported by the directory provider";
	break;
    case DIRAUTH_ERR_INTERNAL:
	rv = "internal error";
	break;
    case DIRAUTH_ERR_INVALID:
	rv = "invalid argument";
	break;

	/* Configuration and connection errors */
    case DIRAUTH_ERR_OUT_OF_MEMORY:
	rv = "out of memory";
	break;
    case DIRAUTH_ERR_URL_INVALID_PREFIX:
	rv = "invalid prefix for the ldap url, must be ldap:// or ldaps://";
	break;
    case DIRAUTH_ERR_URL_PARSE_FAILED:
	rv = "ldap url parsing failed";
	break;
    case DIRAUTH_ERR_NO_SERVERNAME:
	rv = "ldap server name is missing";
	break;
    case DIRAUTH_ERR_LDAP_INIT_FAILED:
	rv = "initialization of the ldap session failed";
	break;
    case DIRAUTH_ERR_LDAP_SET_OPTION_FAILED:
	rv = "ldap_set_option failed";
	break;
    case DIRAUTH_ERR_BIND_FAILED:
	rv = "couldn't bind to the ldap server";
	break;
    case DIRAUTH_ERR_CONNECT_FAILED:
	rv = "couldn't connect to the ldap server";
	break;
    case DIRAUTH_ERR_TLS_FAILED:
	rv = "TLS negotiation with the ldap server failed";
	break;
    case DIRAUTH_ERR_SEARCH_FAILED:
	rv = "ldap search failed";
	break;
    case DIRAUTH_ERR_NOT_CONNECTED:
	rv = "no connection to the ldap server";
	break;

	/* Errors returned by DirectoryConfig::read */
    case DIRAUTH_ERR_CANNOT_OPEN_FILE:
	rv = "cannot open the config file";
	break;
    case DIRAUTH_ERR_DBNAME_IS_MISSING:
	rv = "database name is missing";
	break;
    case DIRAUTH_ERR_PROP_IS_MISSING:
	rv = "database property is missing";
	break;
    case DIRAUTH_ERR_UNKNOWN_PROP:
	rv = "unknown database property";
	break;
    case DIRAUTH_ERR_DIRECTIVE_IS_MISSING:
	rv = "no directory directive for the database in the config file";
	break;
    case DIRAUTH_ERR_NOT_PROPVAL:
	rv = "syntax error. Expecting property value";
	break;
    case DIRAUTH_ERR_INVALID_ARGUMENT:
	rv = "invalid property value";
	break;

	/* Errors returned by LdapAuthProvider */
    case DIRAUTH_ERR_MISSING_UID_ATTR:
	rv = "user entry has no value for the username attribute";
	break;
    case DIRAUTH_ERR_USER_NOT_FOUND:
	rv = "no directory entry matches the username";
	break;
    case DIRAUTH_ERR_INVALID_CREDENTIALS:
	rv = "directory rejected the user's password";
	break;
    case DIRAUTH_ERR_USER_CONNECT_FAILED:
	rv = "couldn't connect to the ldap server to verify the user's password";
	break;
    case DIRAUTH_ERR_PROVISIONING_DISABLED:
	rv = "automatic user creation is disabled and there is no local user";
	break;

	/* Errors returned by IdentityStore implementations */
    case DIRAUTH_ERR_IDENTITY_EXISTS:
	rv = "a local user with that name already exists";
	break;
    case DIRAUTH_ERR_IDENTITY_STORE:
	rv = "the local user store failed";
	break;

    default:
	rv = "internal error - unknown error code";
	break;
    }

    return rv;
}

DIRAUTH_PUBLIC const char *dirauth_auth_message(int err)
{
    if (err == DIRAUTH_SUCCESS)
        return "success";

    switch(err) {
    case DIRAUTH_ERR_USER_NOT_FOUND:
    case DIRAUTH_ERR_INVALID_CREDENTIALS:
    case DIRAUTH_ERR_USER_CONNECT_FAILED:
    case DIRAUTH_ERR_MISSING_UID_ATTR:
        return "Error completing LDAP login. Invalid username or password.";
    case DIRAUTH_ERR_PROVISIONING_DISABLED:
        return "Automatic User Creation is disabled and there is no local user for this account.";
    case DIRAUTH_ERR_NOT_IMPLEMENTED:
        return "Changing the password is not supported for directory users.";
    }

    if (dirauth_is_connection_error(err))
        return "Failed to Connect or Bind to server.";

    return "Error completing LDAP login.";
}

DIRAUTH_PUBLIC PRBool dirauth_is_connection_error(int err)
{
    switch(err) {
    case DIRAUTH_ERR_LDAP_INIT_FAILED:
    case DIRAUTH_ERR_LDAP_SET_OPTION_FAILED:
    case DIRAUTH_ERR_BIND_FAILED:
    case DIRAUTH_ERR_CONNECT_FAILED:
    case DIRAUTH_ERR_TLS_FAILED:
    case DIRAUTH_ERR_SEARCH_FAILED:
    case DIRAUTH_ERR_NOT_CONNECTED:
        return PR_TRUE;
    }

    return PR_FALSE;
}
