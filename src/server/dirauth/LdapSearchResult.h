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

#ifndef __DIRAUTH_LDAPSEARCHRESULT_H__
#define __DIRAUTH_LDAPSEARCHRESULT_H__

#include "prtypes.h"
#include "dirauth/DirAuthCommon.h"
#include "dirauth/LdapEntry.h"

class LdapSearchResult;

typedef LdapSearchResult *LdapSearchResult_ptr;


// a container class
class DIRAUTH_PUBLIC LdapSearchResult_var {
public:
  LdapSearchResult_var(LdapSearchResult_ptr ownThis = NULL);
  ~LdapSearchResult_var(void);
  operator LdapSearchResult_ptr(void);
  LdapSearchResult_var& operator=(LdapSearchResult*);
  LdapSearchResult_ptr operator->(void);
  LdapSearchResult_ptr& out(void);
private:
  LdapSearchResult_ptr _p;

  // not implemented:
  LdapSearchResult_var(const LdapSearchResult_var &copy_me);
  void operator=(const LdapSearchResult_var &assign_me);
};


/**
 * The entries returned by one search, in the order the server sent them,
 * together with the LDAP result code of the search. The result owns its
 * entries; next() hands out borrowed pointers.
 */
class DIRAUTH_PUBLIC LdapSearchResult {
public:
  LdapSearchResult(int result);
  ~LdapSearchResult(void);
  PRBool bad(void) const;
  PRBool good(void) const;
  int ldapresult(void) const;
  void setResult(int result);

  // takes ownership of entry
  void add(LdapEntry *entry);

  void reset(void);
  LdapEntry *next(void);
  unsigned long entries(void) const;
private:
  struct Node {
    LdapEntry *entry;
    Node *next;
  };

  Node *_head;
  Node *_tail;
  Node *_iterator;
  PRBool _started;
  unsigned long _count;
  int _result;

  // not implemented:
  LdapSearchResult(const LdapSearchResult &copy_me);
  void operator=(const LdapSearchResult &assign_me);
};

#endif /* __DIRAUTH_LDAPSEARCHRESULT_H__ */
