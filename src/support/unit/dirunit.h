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

#ifndef _UNIT_DIRUNIT_H
#define _UNIT_DIRUNIT_H

/*
 * dirunit.h
 *
 * Declarations for the unit test framework.
 */

#include <string.h>
#include "prio.h"
#include "prprf.h"

PR_BEGIN_EXTERN_C
typedef PRStatus (_DirUnitTestFn)(PRFileDesc *);
PR_END_EXTERN_C

PRStatus _DIRAUTH_RegisterUnitTest(const char *, const char *, int, _DirUnitTestFn *);

/*
 * DIRAUTH_RunUnitTests
 *
 * Run the unit tests whose name contains filter, or all unit tests when
 * filter is NULL. Unit tests are defined with the DIRAUTH_UNIT_TEST macro.
 * Diagnostic messages are sent to the passed file descriptor. Returns the
 * number of unit tests that failed.
 */
int DIRAUTH_RunUnitTests(PRFileDesc *fd, const char *filter);

/*
 * DIRAUTH_UNIT_TEST
 *
 * Define a unit test. Unit tests may be defined in any module linked into
 * the test program and run in the order they were registered.
 *
 * The unit test body should return PR_SUCCESS if the unit test passes and
 * return PR_FAILURE if the unit test fails. On failure, the unit test body
 * should use the DIRAUTH_UNIT_TEST_FD PRFileDesc * to report diagnostic
 * messages; the DIRAUTH_CHECK macros do both.
 *
 * Example:
 *
 * DIRAUTH_UNIT_TEST(strcmp)
 * {
 *     DIRAUTH_CHECK_INT(0, strcmp("foo", "foo"));
 *
 *     return PR_SUCCESS;
 * }
 */
#define DIRAUTH_UNIT_TEST(name) \
        _DirUnitTestFn _DIRAUTH_UnitTestFn_##name; \
        static PRStatus _DIRAUTH_RegisterUnitTest_##name##_rv = _DIRAUTH_RegisterUnitTest(#name, __FILE__, __LINE__, &_DIRAUTH_UnitTestFn_##name); \
        PRStatus _DIRAUTH_UnitTestFn_##name(PRFileDesc *DIRAUTH_UNIT_TEST_FD)

#define DIRAUTH_CHECK(expr) \
        do { \
            if (!(expr)) { \
                PR_fprintf(DIRAUTH_UNIT_TEST_FD, "%s:%d: %s is false\n", __FILE__, __LINE__, #expr); \
                return PR_FAILURE; \
            } \
        } while (0)

#define DIRAUTH_CHECK_INT(expected, actual) \
        do { \
            long _e = (long)(expected); \
            long _a = (long)(actual); \
            if (_e != _a) { \
                PR_fprintf(DIRAUTH_UNIT_TEST_FD, "%s:%d: %s is %ld, expected %ld\n", __FILE__, __LINE__, #actual, _a, _e); \
                return PR_FAILURE; \
            } \
        } while (0)

#define DIRAUTH_CHECK_STR(expected, actual) \
        do { \
            const char *_e = (expected); \
            const char *_a = (actual); \
            if (!_e || !_a || strcmp(_e, _a)) { \
                PR_fprintf(DIRAUTH_UNIT_TEST_FD, "%s:%d: %s is \"%s\", expected \"%s\"\n", __FILE__, __LINE__, #actual, _a ? _a : "(null)", _e ? _e : "(null)"); \
                return PR_FAILURE; \
            } \
        } while (0)

#endif /* _UNIT_DIRUNIT_H */
