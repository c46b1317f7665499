/* demangle.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Demangler.  Just calls the ABI one, but does the memory management for
   us.
*/

#include <string.h>
#include <string>
#include <memory>
#include <cxxabi.h>
#include <stdlib.h>

#include "demangle.h"


using namespace std;

namespace STAGGER {

char * char_demangle(const char * name)
{
    int status;
    char * result = abi::__cxa_demangle(name, nullptr, 0, &status);

    if (status != 0)
        result = ::strdup(name);

    return result;
}

std::string demangle(const std::string & name)
{
    std::unique_ptr<char, decltype(&::free)>
        ptr(char_demangle(name.c_str()), &::free);

    if (ptr)
        return ptr.get();
    return name;
}

std::string demangle(const std::type_info & type)
{
    return demangle(type.name());
}

} // namespace STAGGER
