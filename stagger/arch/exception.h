/* exception.h                                                     -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Defines our exception class.
*/

#pragma once

#include <string>
#include <exception>
#include <stdarg.h>
#include "stagger/compiler/compiler.h"

namespace STAGGER {

class Exception : public std::exception {
public:
    Exception(const std::string & msg);
    Exception(std::string && msg);
    Exception(const char * msg, ...) STAGGER_FORMAT_STRING(2, 3);
    Exception(const char * msg, va_list ap);
    Exception(int errnum, const std::string & msg, const char * function = 0);
    virtual ~Exception() throw();

    virtual const char * what() const throw();

private:
    std::string message;
};

/** Return a string that represents the currently thrown exception. */
std::string getExceptionString();


/*****************************************************************************/
/* ASSERTION FAILURE                                                         */
/*****************************************************************************/

/** Exception thrown when an exception assert is made and fails. */

struct AssertionFailure: public Exception {
    AssertionFailure(const std::string & msg);
    AssertionFailure(const char * assertion,
                     const char * function,
                     const char * file,
                     int line);
};


/*****************************************************************************/
/* LOGIC ERROR                                                               */
/*****************************************************************************/

/** Thrown when the program reaches a state that its own invariants say is
    impossible.
*/

struct LogicError: public Exception {
    LogicError(const std::string & message);
    LogicError(const char * function,
               const char * file,
               int line,
               const std::string & msg);
};

[[noreturn]] void throwLogicError(const char * function, const char * file,
                                  int line, const std::string & msg = "");

#define STAGGER_THROW_LOGIC_ERROR(...) do { ::STAGGER::throwLogicError(__PRETTY_FUNCTION__, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__); } while (false)

} // namespace STAGGER
