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

#ifndef _DIRAUTH_MEMORYIDENTITYSTORE_H
#define _DIRAUTH_MEMORYIDENTITYSTORE_H

#include "prlock.h"
#include "dirauth/IdentityStore.h"

/**
 * IdentityStore kept in process memory, guarded by an NSPR lock. Used by
 * the command line tools and the unit tests.
 */
class DIRAUTH_PUBLIC MemoryIdentityStore : public IdentityStore {
public:
    MemoryIdentityStore(void);
    virtual ~MemoryIdentityStore(void);

    virtual int findByUsername(const char *username, Identity *&identity);
    virtual int createUsername(const char *username, Identity *&identity);
    virtual int updateIdentity(const Identity& identity);

    int count(void);
    int getCreateCount(void);
    int getUpdateCount(void);

private:
    struct Record {
        Identity *identity;
        Record *next;
    };

    Record *find(const char *username);

    PRLock *_lock;
    Record *_records;
    int _count;
    int _creates;
    int _updates;

    // not implemented:
    MemoryIdentityStore(const MemoryIdentityStore &copy_me);
    void operator=(const MemoryIdentityStore &assign_me);
};

#endif /* _DIRAUTH_MEMORYIDENTITYSTORE_H */
