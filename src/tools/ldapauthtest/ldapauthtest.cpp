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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <nspr.h>
#include <unistd.h>
#if !defined(SOLARIS)
#include <getopt.h>
#endif

#include "base/ereport.h"
#include "dirauth/DirectoryConfig.h"
#include "dirauth/OpenLdapTransport.h"
#include "dirauth/MemoryIdentityStore.h"
#include "dirauth/LdapAuthProvider.h"
#include "dirauth/LdapDiagnostics.h"
#include "dirauth/AuthOutcome.h"
#include "dirauth/errors.h"

void
usage(void)
{
    fprintf(stderr, "usage: ldapauthtest [options] conffile [user password]\n");
    fprintf(stderr, "Options:\n");
    fprintf(stderr, " -d name    Directory name in conffile (default: %s)\n", DIRAUTH_DEFAULT_DBNAME);
    fprintf(stderr, " -t         Test the connection and service bind\n");
    fprintf(stderr, " -u filter  List the DNs of users matching filter\n");
    fprintf(stderr, " -l level   Log level (default: info)\n");
    fprintf(stderr, " -v         verbose, same as -l fine\n");
}

static int
test_bind(const DirectoryConfig& config, LdapTransportFactory& factory)
{
    LdapDiagnostics diagnostics(config, factory);
    char *report = diagnostics.testServerBind();
    if (!report) {
        fprintf(stderr, "Error: out of memory\n");
        return 1;
    }

    printf("%s\n", report);
    int failed = strstr(report, "Error: ") != NULL;
    PR_smprintf_free(report);

    return failed;
}

static int
list_users(LdapAuthProvider& provider, const char *filter)
{
    StringList dns;
    int rv = provider.getFilteredUsers(filter, dns);
    if (rv != DIRAUTH_SUCCESS) {
        fprintf(stderr, "Error listing users: %s\n", dirauth_err2string(rv));
        return 1;
    }

    for (int i = 0; i < dns.length(); i++)
        printf("%s\n", dns.item(i));
    printf("%d users match %s\n", dns.length(), filter);

    return 0;
}

static int
login(LdapAuthProvider& provider, const char *user, const char *password)
{
    AuthOutcome outcome;
    int rv = provider.authenticate(user, password, outcome);
    if (rv != DIRAUTH_SUCCESS) {
        printf("%s\n", dirauth_auth_message(rv));
        fprintf(stderr, " (%d: %s)\n", rv, dirauth_err2string(rv));
        return 1;
    }

    printf("Authenticated [%s] as local user [%s]\n", user, outcome.getUsername());
    printf(" administrator = %s\n", outcome.isAdministrator() ? "yes" : "no");
    if (outcome.getEnableAllFolders()) {
        printf(" folders = all\n");
    } else {
        char *folders = outcome.getEnabledFolders().join(", ");
        printf(" folders = %s\n", folders ? folders : "");
        if (folders)
            PR_smprintf_free(folders);
    }

    return 0;
}

int
main(int argc, char *argv[])
{
    int c;
    const char *dbname = NULL;
    const char *filter = NULL;
    const char *level = NULL;
    int testbind = 0;
    int verbose = 0;

    PR_Init(PR_USER_THREAD, PR_PRIORITY_NORMAL, 0);

    // process args
    while ((c = getopt(argc, argv, "d:tu:l:v")) != EOF) {
	switch (c) {
	case 'd':
	    dbname = optarg;
	    break;
	case 't':
	    testbind = 1;
	    break;
	case 'u':
	    filter = optarg;
	    break;
	case 'l':
	    level = optarg;
	    break;
	case 'v':
	    verbose = 1;
	    break;
	case '?':
	    usage();
	    exit(1);
	}
    }

    int nargs = argc - optind;
    if (nargs != 1 && nargs != 3) {
	usage();
	exit(2);
    }
    if (nargs == 1 && !testbind && !filter) {
	usage();
	exit(2);
    }

    int degree = ereport_level2degree(level, verbose ? LOG_VERBOSE : LOG_INFORM);
    if (level && ereport_level2degree(level, -1) == -1) {
	fprintf(stderr, "Unknown log level %s\n", level);
	exit(2);
    }
    ereport_set_degree(degree);

    DirectoryConfig *config = NULL;
    int rv = DirectoryConfig::read(argv[optind], dbname, config);
    if (rv != DIRAUTH_SUCCESS) {
	fprintf(stderr, "Error reading %s: %s\n", argv[optind], dirauth_err2string(rv));
	exit(1);
    }

    OpenLdapTransportFactory factory;
    MemoryIdentityStore store;
    LdapAuthProvider provider(*config, store, factory);

    int failed = 0;
    if (testbind)
	failed |= test_bind(*config, factory);
    if (filter)
	failed |= list_users(provider, filter);
    if (nargs == 3)
	failed |= login(provider, argv[optind + 1], argv[optind + 2]);

    delete config;
    ereport_terminate();
    PR_Cleanup();

    return failed;
}
