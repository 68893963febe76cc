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

#ifndef _DIRAUTH_LDAPDIAGNOSTICS_H
#define _DIRAUTH_LDAPDIAGNOSTICS_H

#include "dirauth/DirAuthCommon.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/LdapTransport.h"

/**
 * Walks through the steps of reaching the directory with the service
 * account and reports how far it got, for administrators checking their
 * settings.
 */
class DIRAUTH_PUBLIC LdapDiagnostics {
public:
    LdapDiagnostics(const DirectoryConfig& config, LdapTransportFactory& factory);

    /**
     * Returns a report such as
     * "Connect (Success); Set StartTLS (Success); Bind (Success); Base Search (Found 3 Entities)".
     * The first failing step ends with "Error: <reason>)". The string is
     * allocated with PR_smprintf; release it with PR_smprintf_free.
     */
    char *testServerBind(void);

private:
    const DirectoryConfig& _config;
    LdapTransportFactory& _factory;

    // not implemented:
    LdapDiagnostics(const LdapDiagnostics &copy_me);
    void operator=(const LdapDiagnostics &assign_me);
};

#endif /* _DIRAUTH_LDAPDIAGNOSTICS_H */
