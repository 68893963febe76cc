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

#include "prmem.h"
#include "prprf.h"
#include "plstr.h"

#include "unicode/ustring.h"

#include "base/ereport.h"
#include "dirauth/UserLocator.h"
#include "dirauth/LdapConnection.h"
#include "dirauth/LdapSearchResult.h"
#include "dirauth/errors.h"

UserLocator::UserLocator(const DirectoryConfig& config)
: _config(config)
{
}

UserLocator::~UserLocator(void)
{
}

int
UserLocator::getAttributes(StringList& attrs) const
{
    attrs = _config.getSearchAttrs();
    const char *primary = _config.getUsernameAttr();
    if (primary && !attrs.contains(primary, PR_TRUE))
        return attrs.add(primary);
    return DIRAUTH_SUCCESS;
}

//-----------------------------------------------------------------------------
// _utf8_to_uchars
//-----------------------------------------------------------------------------

static UChar *
_utf8_to_uchars(const char *s, int32_t& len)
{
    UErrorCode status = U_ZERO_ERROR;
    u_strFromUTF8(NULL, 0, &len, s, -1, &status);
    if (U_FAILURE(status) && status != U_BUFFER_OVERFLOW_ERROR)
        return NULL;

    UChar *buf = (UChar *)PR_Malloc((len + 1) * sizeof(UChar));
    if (!buf)
        return NULL;

    status = U_ZERO_ERROR;
    u_strFromUTF8(buf, len + 1, &len, s, -1, &status);
    if (U_FAILURE(status)) {
        PR_Free(buf);
        return NULL;
    }

    return buf;
}

//-----------------------------------------------------------------------------
// _case_fold_equal
//-----------------------------------------------------------------------------

static PRBool
_case_fold_equal(const char *value, const char *username)
{
    int32_t valueLen = 0;
    int32_t usernameLen = 0;
    UChar *uvalue = _utf8_to_uchars(value, valueLen);
    UChar *uusername = _utf8_to_uchars(username, usernameLen);

    PRBool equal = PR_FALSE;
    if (uvalue && uusername) {
        UErrorCode status = U_ZERO_ERROR;
        int32_t cmp = u_strCaseCompare(uvalue, valueLen, uusername, usernameLen,
                                       U_FOLD_CASE_DEFAULT, &status);
        equal = (U_SUCCESS(status) && cmp == 0) ? PR_TRUE : PR_FALSE;
    }
    // Values that are not UTF-8 were compared with PL_strcasecmp already

    PR_Free(uvalue);
    PR_Free(uusername);
    return equal;
}

PRBool
UserLocator::matches(const char *value, const char *username) const
{
    if (!value || !username)
        return PR_FALSE;

    if (_config.isCaseInsensitive()) {
        if (!PL_strcasecmp(value, username))
            return PR_TRUE;
        return _case_fold_equal(value, username);
    }

    return strcmp(value, username) ? PR_FALSE : PR_TRUE;
}

char *
UserLocator::escapeFilterValue(const char *value)
{
    char *escaped = PR_smprintf("%s", "");

    for (const char *p = value ? value : ""; *p && escaped; p++) {
        switch (*p) {
        case '*':
        case '(':
        case ')':
        case '\\':
            escaped = PR_sprintf_append(escaped, "\\%02x", (unsigned char)*p);
            break;
        default:
            escaped = PR_sprintf_append(escaped, "%c", *p);
            break;
        }
    }

    return escaped;
}

char *
UserLocator::buildFilter(const char *username) const
{
    const char *filter = _config.getSearchFilter();
    const char *placeholder = DIRAUTH_USERNAME_PLACEHOLDER;
    int placeholderLen = strlen(placeholder);

    if (!strstr(filter, placeholder))
        return PR_smprintf("%s", filter);

    char *escaped = escapeFilterValue(username);
    if (!escaped)
        return NULL;

    char *built = PR_smprintf("%s", "");
    const char *p = filter;
    const char *hit;
    while (built && (hit = strstr(p, placeholder)) != NULL) {
        built = PR_sprintf_append(built, "%.*s%s", (int)(hit - p), p, escaped);
        p = hit + placeholderLen;
    }
    if (built)
        built = PR_sprintf_append(built, "%s", p);

    PR_smprintf_free(escaped);
    return built;
}

//-----------------------------------------------------------------------------
// UserLocator::locate
//-----------------------------------------------------------------------------

int
UserLocator::locate(LdapConnection& ld, const char *username,
                    LdapReferralHandler *referrals, LdapEntry *&entry) const
{
    entry = NULL;

    StringList attrs;
    int rv = getAttributes(attrs);
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    char *filter = buildFilter(username);
    if (!filter)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    LdapSearchResult_var res;
    rv = ld.search(_config.getBaseDN(), LDAP_SCOPE_SUBTREE, filter,
                   attrs.array(), 0, referrals, res.out());
    if (rv != DIRAUTH_SUCCESS) {
        PR_smprintf_free(filter);
        return rv;
    }

    ereport(LOG_VERBOSE, "ldap authdb: search for [%s] below [%s] with filter [%s] returned %lu entries",
            username, _config.getBaseDN(), filter, res->entries());
    PR_smprintf_free(filter);

    // Entries in server order, attributes in configured order: the first
    // value equal to the username selects its entry.
    const LdapEntry *found = NULL;
    LdapEntry *candidate;
    res->reset();
    while (!found && (candidate = res->next()) != NULL) {
        for (int i = 0; !found && i < _config.getSearchAttrs().length(); i++) {
            const char *attr = _config.getSearchAttrs().item(i);
            const StringList *values = candidate->values(attr);
            if (!values)
                continue;
            for (int j = 0; j < values->length(); j++) {
                if (matches(values->item(j), username)) {
                    ereport(LOG_FINEST, "ldap authdb: [%s] matches %s of [%s]",
                            username, attr, candidate->DN());
                    found = candidate;
                    break;
                }
            }
        }
    }

    if (!found)
        return DIRAUTH_FAILED;

    entry = found->clone();
    return DIRAUTH_SUCCESS;
}
