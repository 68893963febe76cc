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

#include "plstr.h"

#include "dirauth/LdapEntry.h"
#include "dirauth/errors.h"

LdapEntry::LdapEntry(const char *dn)
: _dn(PL_strdup(dn ? dn : "")), _attrs(NULL), _last(NULL), _count(0)
{
}

LdapEntry::~LdapEntry(void)
{
    while (_attrs) {
        Attribute *attr = _attrs;
        _attrs = attr->next;
        PL_strfree(attr->name);
        delete attr;
    }
    PL_strfree(_dn);
}

LdapEntry::Attribute *
LdapEntry::find(const char *attr) const
{
    if (!attr)
        return NULL;

    for (Attribute *a = _attrs; a; a = a->next) {
        if (!PL_strcasecmp(a->name, attr))
            return a;
    }
    return NULL;
}

int
LdapEntry::addValue(const char *attr, const char *value)
{
    return addValue(attr, value, value ? PL_strlen(value) : 0);
}

int
LdapEntry::addValue(const char *attr, const char *value, int len)
{
    if (!attr || !*attr)
        return DIRAUTH_ERR_INVALID;

    return addAttribute(attr)->values.add(value, len);
}

LdapEntry::Attribute *
LdapEntry::addAttribute(const char *attr)
{
    Attribute *a = find(attr);
    if (!a) {
        a = new Attribute;
        a->name = PL_strdup(attr);
        a->next = NULL;
        if (_last)
            _last->next = a;
        else
            _attrs = a;
        _last = a;
        _count++;
    }
    return a;
}

const StringList *
LdapEntry::values(const char *attr) const
{
    Attribute *a = find(attr);
    return a ? &a->values : NULL;
}

const char *
LdapEntry::firstValue(const char *attr) const
{
    Attribute *a = find(attr);
    return a ? a->values.item(0) : NULL;
}

PRBool
LdapEntry::hasAttribute(const char *attr) const
{
    return find(attr) ? PR_TRUE : PR_FALSE;
}

int
LdapEntry::attributeCount(void) const
{
    return _count;
}

const char *
LdapEntry::attributeName(int i) const
{
    for (Attribute *a = _attrs; a; a = a->next) {
        if (i-- == 0)
            return a->name;
    }
    return NULL;
}

LdapEntry *
LdapEntry::clone(void) const
{
    LdapEntry *copy = new LdapEntry(_dn);
    for (Attribute *a = _attrs; a; a = a->next)
        copy->addAttribute(a->name)->values = a->values;
    return copy;
}
