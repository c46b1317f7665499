/* compiler.h                                                      -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Compiler specific macros.
*/

#pragma once

#define STAGGER_ALWAYS_INLINE __attribute__((__always_inline__)) inline
#define STAGGER_NORETURN __attribute__((__noreturn__))
#define STAGGER_FORMAT_STRING(arg1, arg2) __attribute__((__format__ (printf, arg1, arg2)))
#define STAGGER_UNUSED __attribute__((__unused__))
