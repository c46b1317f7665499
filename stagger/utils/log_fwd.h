/* log_fwd.h                                                       -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Logging interface.
*/

#pragma once

#include "stagger/arch/demangle.h"
#include <memory>
#include <string>

namespace spdlog {
    class logger;
}

namespace STAGGER {

std::shared_ptr<spdlog::logger> getStaggerLog(const std::string & loggerName);

template <typename Class>
std::string
getLoggerNameFromClass() {
    return demangle(typeid(Class));
}

template <typename Class>
std::shared_ptr<spdlog::logger>
getStaggerLog() {
    return getStaggerLog(getLoggerNameFromClass<Class>());
}

} // namespace STAGGER
