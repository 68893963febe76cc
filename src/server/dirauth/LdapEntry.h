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

#ifndef __DIRAUTH_LDAPENTRY_H__
#define __DIRAUTH_LDAPENTRY_H__

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/StringList.h"

/**
 * A directory entry copied out of a search result: its DN and the values of
 * each returned attribute. Attribute names compare case-insensitively.
 */
class DIRAUTH_PUBLIC LdapEntry {
public:
    LdapEntry(const char *dn);
    ~LdapEntry(void);

    const char *DN(void) const { return _dn; }

    int addValue(const char *attr, const char *value);
    int addValue(const char *attr, const char *value, int len);

    /** Values of attr, NULL if the entry has no such attribute. */
    const StringList *values(const char *attr) const;
    const char *firstValue(const char *attr) const;
    PRBool hasAttribute(const char *attr) const;

    int attributeCount(void) const;
    const char *attributeName(int i) const;

    LdapEntry *clone(void) const;

private:
    struct Attribute {
        char *name;
        StringList values;
        Attribute *next;
    };

    Attribute *find(const char *attr) const;
    Attribute *addAttribute(const char *attr);

    char *_dn;
    Attribute *_attrs;
    Attribute *_last;
    int _count;

    // not implemented:
    LdapEntry(const LdapEntry &copy_me);
    void operator=(const LdapEntry &assign_me);
};

#endif /* __DIRAUTH_LDAPENTRY_H__ */
