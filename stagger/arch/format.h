/* format.h                                                        -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Functions for the manipulation of strings.
*/

#pragma once

#include <string>
#include <stdarg.h>
#include <stdint.h>
#include "stagger/compiler/compiler.h"

namespace STAGGER {

// This machinery allows us to use a std::string with %s via c++11
template<typename T>
STAGGER_ALWAYS_INLINE T forwardForPrintf(T t)
{
    return t;
}

STAGGER_ALWAYS_INLINE const char * forwardForPrintf(const std::string & s)
{
    return s.c_str();
}

std::string formatImpl(const char * fmt, ...) STAGGER_FORMAT_STRING(1, 2);

template<typename... Args>
STAGGER_ALWAYS_INLINE std::string format(const char * fmt, Args... args)
{
    return formatImpl(fmt, forwardForPrintf(args)...);
}

inline std::string format(const char * fmt)
{
    return fmt;
}

std::string vformat(const char * fmt, va_list ap) STAGGER_FORMAT_STRING(1, 0);

/** Human readable byte count ("1.50 MiB"), used in progress and log
    messages.
*/
std::string formatBytes(uint64_t bytes);

} // namespace STAGGER
