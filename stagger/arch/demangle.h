/* demangle.h                                                      -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Interface to the C++ demangler.
*/

#pragma once


#include <string>
#include <typeinfo>

namespace STAGGER {

/* returns a null-terminated string allocated on the heap */
char * char_demangle(const char * name);

std::string demangle(const std::string & name);
std::string demangle(const std::type_info & type);

template<typename T>
std::string type_name()
{
    return demangle(typeid(T));
}

} // namespace STAGGER
