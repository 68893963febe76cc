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

#ifndef _DIRAUTH_STRINGLIST_H
#define _DIRAUTH_STRINGLIST_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"

/**
 * An ordered list of strings. The list keeps its items NULL-terminated so
 * it can be handed directly to LDAP calls expecting an attribute array.
 */
class DIRAUTH_PUBLIC StringList {
public:
    StringList(void);
    StringList(const StringList& copy_me);
    StringList& operator=(const StringList& assign_me);
    ~StringList(void);

    int add(const char *s);
    int add(const char *s, int len);
    int append(const StringList& from);
    void clear(void);

    /**
     * Replaces the contents with the items of a delimited list. Whitespace
     * is dropped wherever it appears and empty items are skipped, so
     * " uid , mail" yields "uid" and "mail".
     */
    int split(const char *list, char delim = ',');

    /** Joined items, allocated with PR_smprintf. NULL if the list is empty. */
    char *join(const char *sep) const;

    int length(void) const { return _length; }
    PRBool isEmpty(void) const { return _length == 0; }
    const char *item(int i) const;
    PRBool contains(const char *s, PRBool ignoreCase = PR_FALSE) const;

    /** NULL-terminated view, valid until the list is modified. */
    const char **array(void) const;

private:
    int grow(int required);

    char **_items;
    int _length;
    int _capacity;
};

#endif /* _DIRAUTH_STRINGLIST_H */
