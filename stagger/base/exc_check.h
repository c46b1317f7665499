/* exc_check.h                                                    -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Quick and easy way to throw an exception on a failed condition.
*/


#pragma once

#include "stagger/arch/exception.h"
#include "stagger/arch/format.h"
#include <sstream>
#include <errno.h>
#include <string.h>

/// Throws a formatted exception if the condition is false.
#define ExcCheckImpl(condition, message, exc_type)                      \
    do {                                                                \
        if (!(condition)) {                                             \
            std::string msg__ =                                         \
                ::STAGGER::format("%s: %s", message, #condition);       \
            throw exc_type(msg__.c_str(), __PRETTY_FUNCTION__,          \
                    __FILE__, __LINE__);                                \
        }                                                               \
    } while (0)

/// Check that the two values meet the operand.
/// They must not have any side effects as they may be evaluated more than once.
#define ExcCheckOpImpl(op, value1, value2, message, exc_type)           \
    do {                                                                \
        if (!((value1) op (value2))) {                                  \
            std::ostringstream stream1__, stream2__;                    \
            stream1__ << value1;  stream2__ << value2;                  \
            std::string v1__ = stream1__.str();                         \
            std::string v2__ = stream2__.str();                         \
            std::string msg__ = ::STAGGER::format(                      \
                    "%s: !(%s " #op " %s) [!(%s " #op " %s)]",          \
                    message, #value1, #value2, v1__.c_str(),            \
                    v2__.c_str());                                      \
            throw exc_type(msg__.c_str(), __PRETTY_FUNCTION__,          \
                                        __FILE__, __LINE__);            \
        }                                                               \
    } while (0)

/// Throws a formatted exception if the condition is false.
#define ExcCheckErrnoImpl(condition, message, exc_type)                 \
    do {                                                                \
        if (!(condition)) {                                             \
            std::string msg__ = ::STAGGER::format("%s: %s(%d)",         \
                    message, strerror(errno), errno);                   \
            throw exc_type(msg__.c_str(), __PRETTY_FUNCTION__,          \
                    __FILE__, __LINE__);                                \
        }                                                               \
    } while (0)

