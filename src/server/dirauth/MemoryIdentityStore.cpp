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

#include "base/ereport.h"
#include "dirauth/MemoryIdentityStore.h"
#include "dirauth/errors.h"

MemoryIdentityStore::MemoryIdentityStore(void)
: _lock(PR_NewLock()), _records(NULL), _count(0), _creates(0), _updates(0)
{
}

MemoryIdentityStore::~MemoryIdentityStore(void)
{
    while (_records) {
        Record *record = _records;
        _records = record->next;
        delete record->identity;
        delete record;
    }
    if (_lock)
        PR_DestroyLock(_lock);
}

MemoryIdentityStore::Record *
MemoryIdentityStore::find(const char *username)
{
    for (Record *record = _records; record; record = record->next) {
        if (!strcmp(record->identity->getUsername(), username))
            return record;
    }
    return NULL;
}

int
MemoryIdentityStore::findByUsername(const char *username, Identity *&identity)
{
    identity = NULL;
    if (!username)
        return DIRAUTH_ERR_INVALID;
    if (!_lock)
        return DIRAUTH_ERR_IDENTITY_STORE;

    PR_Lock(_lock);
    Record *record = find(username);
    if (record)
        identity = new Identity(*record->identity);
    PR_Unlock(_lock);

    return identity ? DIRAUTH_SUCCESS : DIRAUTH_FAILED;
}

int
MemoryIdentityStore::createUsername(const char *username, Identity *&identity)
{
    identity = NULL;
    if (!username || !*username)
        return DIRAUTH_ERR_INVALID;
    if (!_lock)
        return DIRAUTH_ERR_IDENTITY_STORE;

    int rv = DIRAUTH_SUCCESS;

    PR_Lock(_lock);
    if (find(username)) {
        rv = DIRAUTH_ERR_IDENTITY_EXISTS;
    } else {
        Record *record = new Record;
        record->identity = new Identity(username);
        record->next = _records;
        _records = record;
        _count++;
        _creates++;
        identity = new Identity(*record->identity);
    }
    PR_Unlock(_lock);

    if (rv == DIRAUTH_SUCCESS)
        ereport(LOG_VERBOSE, "identity store: created user %s", username);

    return rv;
}

int
MemoryIdentityStore::updateIdentity(const Identity& identity)
{
    if (!_lock)
        return DIRAUTH_ERR_IDENTITY_STORE;

    int rv = DIRAUTH_SUCCESS;

    PR_Lock(_lock);
    Record *record = find(identity.getUsername());
    if (record) {
        Identity *copy = new Identity(identity);
        delete record->identity;
        record->identity = copy;
        _updates++;
    } else {
        rv = DIRAUTH_FAILED;
    }
    PR_Unlock(_lock);

    return rv;
}

int
MemoryIdentityStore::count(void)
{
    PR_Lock(_lock);
    int n = _count;
    PR_Unlock(_lock);
    return n;
}

int
MemoryIdentityStore::getCreateCount(void)
{
    PR_Lock(_lock);
    int n = _creates;
    PR_Unlock(_lock);
    return n;
}

int
MemoryIdentityStore::getUpdateCount(void)
{
    PR_Lock(_lock);
    int n = _updates;
    PR_Unlock(_lock);
    return n;
}
