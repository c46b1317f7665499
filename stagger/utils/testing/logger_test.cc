/* logger_test.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Test of logging interface.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "stagger/utils/log.h"
#include "stagger/utils/config.h"
#include "stagger/arch/exception.h"
#include <boost/test/unit_test.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace std;
using namespace STAGGER;

namespace {

std::shared_ptr<spdlog::logger>
captureLogger(const std::string & name, std::ostringstream & stream)
{
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern("%l %v");
    return logger;
}

} // file scope

BOOST_AUTO_TEST_CASE(test_macro_formats_stream)
{
    std::ostringstream stream;
    auto logger = captureLogger("capture", stream);
    logger->set_level(spdlog::level::info);

    INFO_MSG(logger) << "imported " << 42 << " lines";
    WARNING_MSG(logger) << "careful";

    BOOST_CHECK_EQUAL(stream.str(), "info imported 42 lines\nwarning careful\n");
}

BOOST_AUTO_TEST_CASE(test_disabled_level_does_not_evaluate)
{
    std::ostringstream stream;
    auto logger = captureLogger("disabled", stream);
    logger->set_level(spdlog::level::info);

    int evaluated = 0;
    auto expensive = [&] () { ++evaluated;  return std::string("value"); };

    DEBUG_MSG(logger) << expensive();
    TRACE_MSG(logger) << expensive();
    BOOST_CHECK_EQUAL(evaluated, 0);
    BOOST_CHECK_EQUAL(stream.str(), "");

    ERROR_MSG(logger) << expensive();
    BOOST_CHECK_EQUAL(evaluated, 1);
    BOOST_CHECK_EQUAL(stream.str(), "error value\n");
}

BOOST_AUTO_TEST_CASE(test_level_from_config)
{
    Config::createFromMap({ { "logging.level", "warn" },
                            { "logging.verbose.level", "trace" } });

    auto quiet = getStaggerLog("quiet");
    auto verbose = getStaggerLog("verbose");

    BOOST_CHECK_EQUAL(quiet->level(), spdlog::level::warn);
    BOOST_CHECK_EQUAL(verbose->level(), spdlog::level::trace);

    // Loggers are shared by name
    BOOST_CHECK_EQUAL(getStaggerLog("quiet"), quiet);

    Config::reset();
}

BOOST_AUTO_TEST_CASE(test_unknown_level)
{
    Config::createFromMap({ { "logging.level", "chatty" } });
    BOOST_CHECK_THROW(getStaggerLog("chatty"), Exception);
    Config::reset();
}
