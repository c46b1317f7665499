/* exc_assert.h                                                    -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Simple functionality to include asserts that throw exceptions rather than
   abort the program.
*/

#pragma once

#include "stagger/arch/exception.h"
#include "stagger/base/exc_check.h"

/// Simple forwarders with the right exception type.
#define ExcAssert(condition)                    \
    ExcCheckImpl(condition, "Assert failure", ::STAGGER::AssertionFailure)

#define ExcAssertOp(op, value1, value2)         \
    ExcCheckOpImpl(op, value1, value2, "Assert failure", ::STAGGER::AssertionFailure)

#define ExcAssertErrno(condition)               \
    ExcCheckErrnoImpl(condition, "Assert failure", ::STAGGER::AssertionFailure)

/// see ExcCheckOpImpl for more details
#define ExcAssertEqual(value1, value2)          \
    ExcAssertOp(==, value1, value2)

#define ExcAssertNotEqual(value1, value2)       \
    ExcAssertOp(!=, value1, value2)

#define ExcAssertLessEqual(value1, value2)      \
    ExcAssertOp(<=, value1, value2)

#define ExcAssertLess(value1, value2)           \
    ExcAssertOp(<, value1, value2)

#define ExcAssertGreaterEqual(value1, value2)   \
    ExcAssertOp(>=, value1, value2)

#define ExcAssertGreater(value1, value2)        \
    ExcAssertOp(>, value1, value2)
