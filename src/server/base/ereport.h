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

#ifndef BASE_EREPORT_H
#define BASE_EREPORT_H

/*
 * ereport.h: Records authentication events, reports errors to administrators.
 */

#include <stdarg.h>
#include "prtypes.h"

/* NSAPI degrees */
#define LOG_WARN        0
#define LOG_MISCONFIG   1
#define LOG_SECURITY    2
#define LOG_FAILURE     3
#define LOG_CATASTROPHE 4
#define LOG_INFORM      5
#define LOG_VERBOSE     6
#define LOG_FINER       7
#define LOG_FINEST      8

/* --- Begin function prototypes --- */

PR_BEGIN_EXTERN_C

/*
 * ereport logs an error of the given degree and formats the arguments with
 * the printf() style fmt. Returns whether the log was successful. Records
 * the current date.
 */

int ereport(int degree, const char *fmt, ...);
int ereport_v(int degree, const char *fmt, va_list args);

/*
 * ereport_init opens the named error log. Until it is called, or when err_fn
 * is NULL, messages go to stderr. It returns NULL upon success and an error
 * string upon error.
 */

const char *ereport_init(const char *err_fn);

void ereport_terminate(void);

/*
 * A callback returning non-zero consumes the message: it is not written to
 * the error log.
 */
typedef int (EreportFunc)(int degree, const char *formatted, int formattedlen, const char *raw, int rawlen, void *data);

void ereport_set_degree(int degree);
int ereport_level2degree(const char *level, int defdegree);
const char *ereport_degree2level(int degree);
PRBool ereport_can_log(int degree);
int ereport_register_cb(EreportFunc *ereport_func, void *data);
void ereport_unregister_cb(EreportFunc *ereport_func, void *data);

PR_END_EXTERN_C

/* --- End function prototypes --- */

#endif /* !BASE_EREPORT_H */
