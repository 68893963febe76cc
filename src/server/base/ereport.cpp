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

/*
 * ereport.cpp: Records authentication events, reports errors to
 * administrators.
 */

#include <string.h>
#include <unistd.h>

#include "nspr.h"
#include "plstr.h"

#include "base/ereport.h"

#define MAX_ERROR_LEN 8192

struct ErrorCallback {
    struct ErrorCallback* next;
    EreportFunc* fn;
    void* data;
};

static PRFileDesc* _fdLog = NULL;
static ErrorCallback* _listCallbacks = NULL;
static PRLock* _lockLogs = NULL;
static PRCallOnceType _onceLogs;

static PRBool _canLog[] = {
    PR_TRUE,  // LOG_WARN
    PR_TRUE,  // LOG_MISCONFIG
    PR_TRUE,  // LOG_SECURITY
    PR_TRUE,  // LOG_FAILURE
    PR_TRUE,  // LOG_CATASTROPHE
    PR_TRUE,  // LOG_INFORM
    PR_FALSE, // LOG_VERBOSE
    PR_FALSE, // LOG_FINER
    PR_FALSE, // LOG_FINEST
};

static const char *_msgDegree[] = {
    "warning",     // LOG_WARN
    "config",      // LOG_MISCONFIG
    "security",    // LOG_SECURITY
    "failure",     // LOG_FAILURE
    "catastrophe", // LOG_CATASTROPHE
    "info",        // LOG_INFORM
    "fine",        // LOG_VERBOSE
    "finer",       // LOG_FINER
    "finest"       // LOG_FINEST
};

#define NUM_DEGREES ((int)(sizeof(_canLog) / sizeof(_canLog[0])))

//-----------------------------------------------------------------------------
// _ereport_create_lock
//-----------------------------------------------------------------------------

static PRStatus _ereport_create_lock(void)
{
    _lockLogs = PR_NewLock();
    return _lockLogs ? PR_SUCCESS : PR_FAILURE;
}

static inline PRBool _ereport_lock(void)
{
    if (PR_CallOnce(&_onceLogs, _ereport_create_lock) != PR_SUCCESS)
        return PR_FALSE;
    PR_Lock(_lockLogs);
    return PR_TRUE;
}

static inline void _ereport_unlock(void)
{
    PR_Unlock(_lockLogs);
}

//-----------------------------------------------------------------------------
// _ereport_call_callbacks
//-----------------------------------------------------------------------------

static inline int _ereport_call_callbacks(int degree, const char *formatted, int formattedlen, const char *raw, int rawlen)
{
    int rv = 0;

    ErrorCallback *callback = _listCallbacks;
    while (callback) {
        // Invoke this callback
        if (callback->fn)
            rv |= (*callback->fn)(degree, formatted, formattedlen, raw, rawlen, callback->data);
        callback = callback->next;
    }

    return rv;
}

//-----------------------------------------------------------------------------
// _ereport_log
//-----------------------------------------------------------------------------

static int _ereport_log(int degree, const char *errstr, int len, int posError)
{
    int rv = 0;

    if (!_ereport_lock()) {
        // No lock, console only
        PR_Write(PR_STDERR, errstr, len);
        return -1;
    }

    if (!_ereport_call_callbacks(degree, errstr, len, &errstr[posError], len - posError)) {
        PRFileDesc *fd = _fdLog ? _fdLog : PR_STDERR;
        if (PR_Write(fd, errstr, len) != len) {
            if (fd != PR_STDERR) {
                // Log file is unusable, fall back to the console
                PR_Close(_fdLog);
                _fdLog = NULL;
                PR_Write(PR_STDERR, errstr, len);
            }
            rv = -1;
        }
    }

    _ereport_unlock();

    return rv;
}

//-----------------------------------------------------------------------------
// ereport_v
//-----------------------------------------------------------------------------

int ereport_v(int degree, const char *fmt, va_list args)
{
    // Private interface: negative degrees force a message to be logged with
    // the corresponding positive degree number, even if that degree would
    // normally be suppressed
    if (degree < 0)
        degree = -degree;
    else if (!ereport_can_log(degree))
        return 0;

    if (degree >= NUM_DEGREES)
        degree = LOG_CATASTROPHE;

    // Logging must not disturb the caller's NSPR error state
    PRErrorCode prerr = PR_GetError();
    PRInt32 oserr = PR_GetOSError();

    char errstr[MAX_ERROR_LEN];
    int len = 0;

    // Format timestamp
    PRExplodedTime now;
    PR_ExplodeTime(PR_Now(), PR_LocalTimeParameters, &now);
    len += PR_FormatTimeUSEnglish(errstr, sizeof(errstr), "[%d/%b/%Y:%H:%M:%S] ", &now);

    // Format degree and pid
    len += PR_snprintf(&errstr[len], sizeof(errstr) - len, "%s (%d): ",
                       _msgDegree[degree], (int)getpid());

    // Format error message
    int posError = len;
    len += PR_vsnprintf(&errstr[len], sizeof(errstr) - len, fmt, args);

    // Terminate with a newline, truncating the message if necessary
    if (len > (int)sizeof(errstr) - 2)
        len = sizeof(errstr) - 2;
    errstr[len++] = '\n';
    errstr[len] = '\0';

    int rv = _ereport_log(degree, errstr, len, posError);

    PR_SetError(prerr, oserr);

    return rv;
}

//-----------------------------------------------------------------------------
// ereport
//-----------------------------------------------------------------------------

int ereport(int degree, const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    int rv = ereport_v(degree, fmt, args);
    va_end(args);

    return rv;
}

//-----------------------------------------------------------------------------
// ereport_init
//-----------------------------------------------------------------------------

const char *ereport_init(const char *err_fn)
{
    if (!_ereport_lock())
        return "cannot create error log lock";

    if (_fdLog) {
        PR_Close(_fdLog);
        _fdLog = NULL;
    }

    const char *err = NULL;
    if (err_fn) {
        _fdLog = PR_Open(err_fn, PR_WRONLY | PR_CREATE_FILE | PR_APPEND, 0600);
        if (!_fdLog)
            err = "cannot open error log";
    }

    _ereport_unlock();

    return err;
}

//-----------------------------------------------------------------------------
// ereport_terminate
//-----------------------------------------------------------------------------

void ereport_terminate(void)
{
    if (!_ereport_lock())
        return;

    if (_fdLog) {
        PR_Close(_fdLog);
        _fdLog = NULL;
    }

    while (_listCallbacks) {
        ErrorCallback *callback = _listCallbacks;
        _listCallbacks = callback->next;
        PR_Free(callback);
    }

    _ereport_unlock();
}

//-----------------------------------------------------------------------------
// ereport_register_cb
//-----------------------------------------------------------------------------

int ereport_register_cb(EreportFunc* ereport_func, void *data)
{
    ErrorCallback *callback;
    callback = (ErrorCallback*)PR_Malloc(sizeof(*callback));
    if (!callback)
        return -1;

    callback->fn = ereport_func;
    callback->data = data;

    if (!_ereport_lock()) {
        PR_Free(callback);
        return -1;
    }
    callback->next = _listCallbacks;
    _listCallbacks = callback;
    _ereport_unlock();

    return 0;
}

//-----------------------------------------------------------------------------
// ereport_unregister_cb
//-----------------------------------------------------------------------------

void ereport_unregister_cb(EreportFunc* ereport_func, void *data)
{
    if (!_ereport_lock())
        return;

    ErrorCallback **link = &_listCallbacks;
    while (*link) {
        ErrorCallback *callback = *link;
        if (callback->fn == ereport_func && callback->data == data) {
            *link = callback->next;
            PR_Free(callback);
        } else {
            link = &callback->next;
        }
    }

    _ereport_unlock();
}

//-----------------------------------------------------------------------------
// ereport_set_degree
//-----------------------------------------------------------------------------

void ereport_set_degree(int degree)
{
    // Log levels in order of increasing severity (decreasing verbosity)
    int degrees[] = {
        LOG_FINEST,
        LOG_FINER,
        LOG_VERBOSE,
        LOG_INFORM,
        LOG_WARN,
        LOG_FAILURE,
        LOG_MISCONFIG,
        LOG_SECURITY,
        LOG_CATASTROPHE
    };
    int n = sizeof(degrees) / sizeof(degrees[0]);

    for (int i = 0; i < n; i++) {
        // If this index corresponds to the specified degree...
        if (degrees[i] == degree) {
            // Enable/disable each NSAPI degree based on the specified degree
            for (int j = 0; j < n; j++)
                _canLog[degrees[j]] = (j >= i);
        }
    }
}

//-----------------------------------------------------------------------------
// ereport_level2degree
//-----------------------------------------------------------------------------

int ereport_level2degree(const char *level, int defdegree)
{
    if (level) {
        for (int i = 0; i < NUM_DEGREES; i++) {
            if (!PL_strcasecmp(_msgDegree[i], level))
                return i;
        }
    }

    return defdegree;
}

const char *ereport_degree2level(int degree)
{
    if (degree < 0 || degree >= NUM_DEGREES)
        degree = LOG_CATASTROPHE;

    return _msgDegree[degree];
}

//-----------------------------------------------------------------------------
// ereport_can_log
//-----------------------------------------------------------------------------

PRBool ereport_can_log(int degree)
{
    // Private interface: negative degrees force a message to be logged with
    // the corresponding positive degree number, even if that degree would
    // normally be suppressed
    if (degree < 0)
        return PR_TRUE;

    if (degree >= NUM_DEGREES)
        degree = LOG_CATASTROPHE;

    return _canLog[degree];
}
