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

#ifndef _DIRAUTH_DIRECTORYCONFIG_H
#define _DIRAUTH_DIRECTORYCONFIG_H

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/StringList.h"

typedef enum {
    TLS_MODE_NONE = 0,      /* plain LDAP */
    TLS_MODE_SSL = 1,       /* implicit TLS, ldaps:// */
    TLS_MODE_STARTTLS = 2   /* plain connection upgraded with StartTLS */
} tlsmode_t;

#define DIRAUTH_DEFAULT_DBNAME       "default"
#define DIRAUTH_DEFAULT_PORT         389
#define DIRAUTH_DEFAULT_SSL_PORT     636
#define DIRAUTH_DEFAULT_FILTER       "(objectclass=*)"
#define DIRAUTH_DEFAULT_SEARCH_ATTRS "uid"
#define DIRAUTH_DEFAULT_TIMEOUT      10

/**
 * Settings of one directory: where it is, how to reach it securely, the
 * service account, and how users are located and authorized. A
 * DirectoryConfig is built once, either through the setters or by read(),
 * and only read afterwards.
 */
class DIRAUTH_PUBLIC DirectoryConfig {
public:
    DirectoryConfig(void);
    ~DirectoryConfig(void);

    /**
     * Reads the settings of database dbname from a config file made of a
     * "directory <dbname> <ldap-url>" line and "<dbname>:<property> <value>"
     * lines. A property written as "<dbname>:encoded <property> <value>"
     * carries a base64 encoded value. On success config is a new object
     * owned by the caller.
     */
    static int read(const char *file, const char *dbname, DirectoryConfig *&config);

    /** Takes host, port, TLS mode and base DN from an ldap:// or ldaps:// URL. */
    int setUrl(const char *url);

    /** Applies one named property as found in the config file. */
    int setProperty(const char *prop, const char *value);

    /** Checks that the settings are usable for authentication. */
    int validate(void) const;

    void setHost(const char *host);
    const char *getHost(void) const { return _host; }

    // 0 selects the default port of the TLS mode
    void setPort(int port);
    int getPort(void) const;

    void setTlsMode(tlsmode_t mode);
    tlsmode_t getTlsMode(void) const { return _tlsMode; }

    void setVerifyCert(PRBool verify);
    PRBool getVerifyCert(void) const { return _verifyCert; }

    void setBaseDN(const char *basedn);
    const char *getBaseDN(void) const { return _baseDN ? _baseDN : ""; }

    void setBindName(const char *binddn);
    const char *getBindName(void) const { return _bindName ? _bindName : ""; }

    void setBindPwd(const char *bindpw);
    const char *getBindPwd(void) const { return _bindPwd ? _bindPwd : ""; }

    void setSearchFilter(const char *filter);
    const char *getSearchFilter(void) const;

    int setSearchAttrs(const char *list);
    const StringList& getSearchAttrs(void) const { return _searchAttrs; }

    // Attribute whose first value becomes the local username. Defaults to
    // the first search attribute.
    void setUsernameAttr(const char *attr);
    const char *getUsernameAttr(void) const;

    void setAdminFilter(const char *filter);
    const char *getAdminFilter(void) const { return _adminFilter ? _adminFilter : ""; }
    PRBool isAdminFilterEnabled(void) const;

    void setCaseInsensitive(PRBool ignoreCase);
    PRBool isCaseInsensitive(void) const { return _caseInsensitive; }

    void setCreateUsers(PRBool create);
    PRBool getCreateUsers(void) const { return _createUsers; }

    void setEnableAllFolders(PRBool all);
    PRBool getEnableAllFolders(void) const { return _enableAllFolders; }

    int setEnabledFolders(const char *list);
    const StringList& getEnabledFolders(void) const { return _enabledFolders; }

    void setTimeout(int seconds);
    int getTimeout(void) const { return _timeout; }

    static int parseBool(const char *value, PRBool& b);

private:
    static void replace(char *&field, const char *value);

    char *_host;
    int _port;
    tlsmode_t _tlsMode;
    PRBool _verifyCert;
    char *_baseDN;
    char *_bindName;
    char *_bindPwd;
    char *_searchFilter;
    StringList _searchAttrs;
    char *_usernameAttr;
    char *_adminFilter;
    PRBool _caseInsensitive;
    PRBool _createUsers;
    PRBool _enableAllFolders;
    StringList _enabledFolders;
    int _timeout;

    // not implemented:
    DirectoryConfig(const DirectoryConfig &copy_me);
    void operator=(const DirectoryConfig &assign_me);
};

#endif /* _DIRAUTH_DIRECTORYCONFIG_H */
