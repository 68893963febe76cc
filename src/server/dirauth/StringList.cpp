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
#include <string.h>

#include "prmem.h"
#include "prprf.h"
#include "plstr.h"

#include "dirauth/StringList.h"
#include "dirauth/errors.h"

static const char *_emptyArray[] = { NULL };

StringList::StringList(void)
: _items(NULL), _length(0), _capacity(0)
{
}

StringList::StringList(const StringList& copy_me)
: _items(NULL), _length(0), _capacity(0)
{
    append(copy_me);
}

StringList&
StringList::operator=(const StringList& assign_me)
{
    if (this != &assign_me) {
        clear();
        append(assign_me);
    }
    return *this;
}

StringList::~StringList(void)
{
    clear();
    PR_Free(_items);
}

int
StringList::grow(int required)
{
    // Room for the items plus the terminating NULL
    if (required + 1 <= _capacity)
        return DIRAUTH_SUCCESS;

    int capacity = _capacity ? _capacity * 2 : 8;
    while (capacity < required + 1)
        capacity *= 2;

    char **items = (char **)PR_Realloc(_items, capacity * sizeof(char *));
    if (!items)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    _items = items;
    _capacity = capacity;
    return DIRAUTH_SUCCESS;
}

int
StringList::add(const char *s)
{
    return add(s, s ? strlen(s) : 0);
}

int
StringList::add(const char *s, int len)
{
    int rv = grow(_length + 1);
    if (rv != DIRAUTH_SUCCESS)
        return rv;

    char *copy = PL_strndup(s ? s : "", len);
    if (!copy)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    _items[_length++] = copy;
    _items[_length] = NULL;
    return DIRAUTH_SUCCESS;
}

int
StringList::append(const StringList& from)
{
    for (int i = 0; i < from._length; i++) {
        int rv = add(from._items[i]);
        if (rv != DIRAUTH_SUCCESS)
            return rv;
    }
    return DIRAUTH_SUCCESS;
}

void
StringList::clear(void)
{
    for (int i = 0; i < _length; i++)
        PL_strfree(_items[i]);
    _length = 0;
    if (_items)
        _items[0] = NULL;
}

int
StringList::split(const char *list, char delim)
{
    clear();
    if (!list)
        return DIRAUTH_SUCCESS;

    char *buf = (char *)PR_Malloc(strlen(list) + 1);
    if (!buf)
        return DIRAUTH_ERR_OUT_OF_MEMORY;

    int rv = DIRAUTH_SUCCESS;
    int len = 0;
    for (const char *p = list; rv == DIRAUTH_SUCCESS; p++) {
        if (*p == delim || *p == '\0') {
            if (len > 0)
                rv = add(buf, len);
            len = 0;
            if (*p == '\0')
                break;
        } else if (!isspace((unsigned char)*p)) {
            buf[len++] = *p;
        }
    }

    PR_Free(buf);
    return rv;
}

char *
StringList::join(const char *sep) const
{
    char *joined = NULL;
    for (int i = 0; i < _length; i++)
        joined = PR_sprintf_append(joined, "%s%s", i ? sep : "", _items[i]);
    return joined;
}

const char *
StringList::item(int i) const
{
    if (i < 0 || i >= _length)
        return NULL;
    return _items[i];
}

PRBool
StringList::contains(const char *s, PRBool ignoreCase) const
{
    if (!s)
        return PR_FALSE;

    for (int i = 0; i < _length; i++) {
        if (ignoreCase ? !PL_strcasecmp(_items[i], s) : !strcmp(_items[i], s))
            return PR_TRUE;
    }
    return PR_FALSE;
}

const char **
StringList::array(void) const
{
    return _items ? (const char **)_items : _emptyArray;
}
