/* log.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Logging interface.
*/

#include "log.h"
#include "stagger/utils/config.h"
#include "stagger/arch/exception.h"
#include <spdlog/sinks/stdout_sinks.h>

namespace {
    spdlog::level::level_enum stringToLevel(const std::string & level) {
        if (level == "debug")
            return spdlog::level::debug;
        else if (level == "info")
            return spdlog::level::info;
        else if (level == "warn")
            return spdlog::level::warn;
        else if (level == "error")
            return spdlog::level::err;
        else if (level == "trace")
            return spdlog::level::trace;
        else if (level == "off")
            return spdlog::level::off;
        else
            throw STAGGER::Exception("Unknown level '" + level
                                     + "' expected one of \"trace\", \"debug\", "
                                     "\"info\", \"warn\", \"error\" or \"off\"");
    }
}

namespace STAGGER {

static constexpr char const * timestampFormat = "%Y-%m-%dT%T.%e%z";

std::shared_ptr<spdlog::logger>
getConfiguredLogger(const std::string & name, const std::string & format)
{
    /* Loggers are shared between the import loop and the tool's progress
       reporting, so pick a thread-safe (_mt) sink if this is replaced.
    */
    std::shared_ptr<spdlog::logger> logger = spdlog::stdout_logger_mt(name);
    logger->set_pattern(format);
    return logger;
}

std::shared_ptr<spdlog::logger> getStaggerLog(const std::string & loggerName)
{
    auto logger = spdlog::get(loggerName);
    if (!logger) {
        auto config = Config::get();

        std::string level = config ?
            config->getString("logging." + loggerName + ".level",
                              config->getString("logging.level", "info"))
            : "info";
        auto levelEnum = stringToLevel(level);
        std::string className
            = loggerName.substr(loggerName.find_last_of(':') + 1);
        logger = getConfiguredLogger(loggerName,
                                     className + std::string(" [")
                                     + timestampFormat + "] %l %v");
        logger->set_level(levelEnum);
    }
    return logger;
}

} // namespace STAGGER
