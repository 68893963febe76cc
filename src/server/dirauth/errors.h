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

#ifndef _DIRAUTH_ERRORS_H
#define _DIRAUTH_ERRORS_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"

/* Common error codes */
#define DIRAUTH_ERR_NOT_IMPLEMENTED	     -1000
#define DIRAUTH_ERR_INTERNAL		     -1001
#define DIRAUTH_ERR_INVALID		     -1002

#define DIRAUTH_SUCCESS	                      0
#define DIRAUTH_FAILED                       -1

/* Error codes returned by DirectoryConfig and LdapConnection */
#define DIRAUTH_ERR_OUT_OF_MEMORY	     -110
#define DIRAUTH_ERR_URL_INVALID_PREFIX	     -112
#define DIRAUTH_ERR_URL_PARSE_FAILED	     -114
#define DIRAUTH_ERR_NO_SERVERNAME 	     -115

#define DIRAUTH_ERR_LDAP_INIT_FAILED	     -120
#define DIRAUTH_ERR_LDAP_SET_OPTION_FAILED   -122
#define DIRAUTH_ERR_BIND_FAILED		     -124
#define DIRAUTH_ERR_CONNECT_FAILED	     -125
#define DIRAUTH_ERR_TLS_FAILED		     -126
#define DIRAUTH_ERR_SEARCH_FAILED	     -127
#define DIRAUTH_ERR_NOT_CONNECTED	     -128

/* Errors returned by DirectoryConfig::read */
#define DIRAUTH_ERR_CANNOT_OPEN_FILE	     -141
#define DIRAUTH_ERR_DBNAME_IS_MISSING	     -142
#define DIRAUTH_ERR_PROP_IS_MISSING	     -143
#define DIRAUTH_ERR_UNKNOWN_PROP	     -144
#define DIRAUTH_ERR_DIRECTIVE_IS_MISSING     -145
#define DIRAUTH_ERR_NOT_PROPVAL		     -146
#define DIRAUTH_ERR_INVALID_ARGUMENT	     -147

/* Errors returned by LdapAuthProvider */
#define DIRAUTH_ERR_MISSING_UID_ATTR	     -196
#define DIRAUTH_ERR_USER_NOT_FOUND	     -600
#define DIRAUTH_ERR_INVALID_CREDENTIALS	     -601
#define DIRAUTH_ERR_USER_CONNECT_FAILED	     -602
#define DIRAUTH_ERR_PROVISIONING_DISABLED    -603

/* Errors returned by IdentityStore implementations */
#define DIRAUTH_ERR_IDENTITY_EXISTS	     -610
#define DIRAUTH_ERR_IDENTITY_STORE	     -611

PR_BEGIN_EXTERN_C

/* Internal description of a status code, suitable for the error log */
DIRAUTH_PUBLIC extern const char *dirauth_err2string(int err);

/*
 * Message a host may show to the person logging in. Failures that would
 * tell an attacker whether a username exists share one message.
 */
DIRAUTH_PUBLIC extern const char *dirauth_auth_message(int err);

/* PR_TRUE for failures reaching or binding to the directory as the service */
DIRAUTH_PUBLIC extern PRBool dirauth_is_connection_error(int err);

PR_END_EXTERN_C

#endif /* _DIRAUTH_ERRORS_H */
