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

#include "prprf.h"

#include "unit/dirunit.h"
#include "dirauth/StringList.h"
#include "dirauth/errors.h"

DIRAUTH_UNIT_TEST(stringlist_split_ignores_whitespace)
{
    StringList list;

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, list.split(" uid ,mail,\tsAMAccountName ,, "));
    DIRAUTH_CHECK_INT(3, list.length());
    DIRAUTH_CHECK_STR("uid", list.item(0));
    DIRAUTH_CHECK_STR("mail", list.item(1));
    DIRAUTH_CHECK_STR("sAMAccountName", list.item(2));
    DIRAUTH_CHECK(list.item(3) == NULL);
    DIRAUTH_CHECK(list.array()[3] == NULL);

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, list.split("display name"));
    DIRAUTH_CHECK_INT(1, list.length());
    DIRAUTH_CHECK_STR("displayname", list.item(0));

    DIRAUTH_CHECK_INT(DIRAUTH_SUCCESS, list.split(NULL));
    DIRAUTH_CHECK(list.isEmpty());
    DIRAUTH_CHECK(list.array()[0] == NULL);

    return PR_SUCCESS;
}

DIRAUTH_UNIT_TEST(stringlist_contains_and_join)
{
    StringList list;
    list.add("uid");
    list.add("Mail");

    DIRAUTH_CHECK(list.contains("uid"));
    DIRAUTH_CHECK(!list.contains("mail"));
    DIRAUTH_CHECK(list.contains("mail", PR_TRUE));
    DIRAUTH_CHECK(!list.contains(NULL));

    char *joined = list.join(", ");
    DIRAUTH_CHECK_STR("uid, Mail", joined);
    PR_smprintf_free(joined);

    StringList copy(list);
    list.clear();
    DIRAUTH_CHECK_INT(0, list.length());
    DIRAUTH_CHECK_INT(2, copy.length());
    DIRAUTH_CHECK(list.join(",") == NULL);

    return PR_SUCCESS;
}
