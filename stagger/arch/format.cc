/* format.cc                                                       -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Functions for the manipulation of strings.
*/

#include "format.h"
#include "exception.h"
#include <stdlib.h>
#include <stdint.h>
#include <errno.h>
#include <stdio.h>

using namespace std;

namespace STAGGER {

std::string formatImpl(const char * fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    try {
        string result = vformat(fmt, ap);
        va_end(ap);
        return result;
    }
    catch (...) {
        va_end(ap);
        throw;
    }
}

std::string vformat(const char * fmt, va_list ap)
{
    char * mem;
    string result;
    int res = vasprintf(&mem, fmt, ap);
    if (res < 0)
        throw Exception("format(): vasprintf error on %s", fmt);

    try {
        result = mem;
        free(mem);
        return result;
    }
    catch (...) {
        free(mem);
        throw;
    }
}

std::string formatBytes(uint64_t bytes)
{
    static const char * units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    double value = bytes;
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0)
        return format("%llu B", (unsigned long long)bytes);
    return format("%.2f %s", value, units[unit]);
}

} // namespace STAGGER
