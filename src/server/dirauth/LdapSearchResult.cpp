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

#include <ldap.h>

#include "dirauth/LdapSearchResult.h"

LdapSearchResult_var::LdapSearchResult_var(LdapSearchResult_ptr ownThis) {
  _p = ownThis;
}

LdapSearchResult_var::~LdapSearchResult_var(void) {
  delete _p;
}

LdapSearchResult_var::operator LdapSearchResult_ptr(void) {
  return _p;
}

LdapSearchResult_var& LdapSearchResult_var::operator=(LdapSearchResult* newPtr) {
  if (_p != newPtr)
    delete _p;
  _p = newPtr;
  return (*this);
}

LdapSearchResult_ptr LdapSearchResult_var::operator->(void) {
  return _p;
}

LdapSearchResult_ptr& LdapSearchResult_var::out(void) {
  delete _p;
  _p = NULL;
  return _p;
}

LdapSearchResult::LdapSearchResult(int result)
    : _head(NULL), _tail(NULL), _iterator(NULL), _started(PR_FALSE),
      _count(0), _result(result)
{
}

LdapSearchResult::~LdapSearchResult(void)
{
  while (_head) {
    Node *node = _head;
    _head = node->next;
    delete node->entry;
    delete node;
  }
}

PRBool
LdapSearchResult::good(void) const
{
    return (_result == LDAP_SUCCESS);
}

PRBool
LdapSearchResult::bad(void) const
{
    return (_result != LDAP_SUCCESS);
}

int
LdapSearchResult::ldapresult(void) const
{
    return _result;
}

void
LdapSearchResult::setResult(int result)
{
    _result = result;
}

void
LdapSearchResult::add(LdapEntry *entry)
{
  Node *node = new Node;
  node->entry = entry;
  node->next = NULL;
  if (_tail)
    _tail->next = node;
  else
    _head = node;
  _tail = node;
  _count++;
}

unsigned long
LdapSearchResult::entries(void) const
{
  return _count;
}

void
LdapSearchResult::reset(void)
{
  _iterator = NULL;
  _started = PR_FALSE;
  return;
}

LdapEntry *
LdapSearchResult::next(void)
{
  _iterator = _started ? (_iterator ? _iterator->next : NULL) : _head;
  _started = PR_TRUE;
  return (_iterator != NULL) ? _iterator->entry : NULL;
}
