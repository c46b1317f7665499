/* log.h                                                           -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   NOTE TO DEVELOPERS : Ideally this file should only be added to your
   implementation files (.cc). For declaration use the log_fwd.h.
*/

#pragma once

#include "log_fwd.h"
#include <spdlog/spdlog.h>
#include <sstream>

namespace STAGGER {

/** One log record under construction.  The stream parameters are
    accumulated and the record is handed to the logger when the temporary
    is destroyed at the end of the full expression.
*/
struct LogLine {
    LogLine(const std::shared_ptr<spdlog::logger> & logger,
            spdlog::level::level_enum level)
        : logger(logger), level(level)
    {
    }

    ~LogLine()
    {
        logger->log(level, "{}", stream.str());
    }

    template<typename T>
    LogLine & operator<<(const T & value)
    {
        stream << value;
        return *this;
    }

    std::shared_ptr<spdlog::logger> logger;
    spdlog::level::level_enum level;
    std::ostringstream stream;
};

/** Trick to create a void returning function with proper precedence.

    The operator & has a lower precedence than the stream operator.
    So the stream parameters are first pass to the logger and then the
    logger is passed to the dummy void returning function.
    Note that the void returning function is required so that both sides
    of the ternary operator have the same type.
*/
struct LogDummy {
    void operator&(const LogLine & line) {}
};

#define STAGGER_LOG_MSG(logger, level)                                  \
    !(logger)->should_log(level) ? (void) 0                             \
    : ::STAGGER::LogDummy() & ::STAGGER::LogLine(logger, level)

#define TRACE_MSG(logger)   STAGGER_LOG_MSG(logger, spdlog::level::trace)
#define DEBUG_MSG(logger)   STAGGER_LOG_MSG(logger, spdlog::level::debug)
#define INFO_MSG(logger)    STAGGER_LOG_MSG(logger, spdlog::level::info)
#define WARNING_MSG(logger) STAGGER_LOG_MSG(logger, spdlog::level::warn)
#define ERROR_MSG(logger)   STAGGER_LOG_MSG(logger, spdlog::level::err)

} // namespace STAGGER
