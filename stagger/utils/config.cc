/* config.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Config interface.
*/

#include "config.h"
#include "stagger/arch/exception.h"
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace STAGGER {

struct BaseConfig : public Config {
    virtual bool getBool(const std::string & key, bool defaultValue)
    {
        std::string defaultStrValue = (defaultValue ? "true" : "false");
        std::string value = boost::algorithm::trim_copy(getString(key, defaultStrValue));
        return value == "1" || boost::algorithm::iequals(value, "true");
    }

    virtual int getInt(const std::string & key, int defaultValue)
    {
        std::string value = boost::algorithm::trim_copy(getString(key, ""));
        int result;
        if (value.empty() || !boost::conversion::try_lexical_convert(value, result))
            return defaultValue;
        return result;
    }
};

struct MapConfig : public BaseConfig {

    MapConfig(std::unordered_map<std::string, std::string> map)
        : map(std::move(map))
    {}

    virtual std::string getString(const std::string & key, const std::string & defaultValue)
    {
        auto value = map.find(key);
        if (value != map.end())
            return value->second;
        else
            return defaultValue;
    }

    std::unordered_map<std::string, std::string> map;
};

Config::ConfigPtr
Config::
createFromMap(const std::unordered_map<std::string,std::string> & map)
{
    config = std::make_shared<MapConfig>(map);
    return config;
}

struct ParsedOptionsConfig : public BaseConfig {

    ParsedOptionsConfig(const boost::program_options::parsed_options & options)
        : options(options)
    {}

    virtual std::string getString(const std::string & key, const std::string & defaultValue)
    {
        // linear, but configs are small and read once per import
        for (const auto & option : options.options) {
            if (option.string_key == key && !option.value.empty())
                return option.value[0];
        }
        return defaultValue;
    }

    boost::program_options::parsed_options options;
};

Config::ConfigPtr
Config::
createFromProgramOptions(const boost::program_options::parsed_options & map)
{
    config = std::make_shared<ParsedOptionsConfig>(map);
    return config;
}

struct VariablesMapConfig : public BaseConfig {

    VariablesMapConfig(const boost::program_options::variables_map & map)
        : map(map)
    {}

    virtual std::string getString(const std::string & key, const std::string & defaultValue)
    {
        if (!map.count(key))
            return defaultValue;
        const auto & value = map[key].value();
        if (auto str = boost::any_cast<std::string>(&value))
            return *str;
        if (auto i = boost::any_cast<int>(&value))
            return boost::lexical_cast<std::string>(*i);
        if (auto b = boost::any_cast<bool>(&value))
            return *b ? "true" : "false";
        throw Exception("config value for '" + key
                        + "' is not a string, int or bool");
    }

    boost::program_options::variables_map map;
};

Config::ConfigPtr
Config::
createFromProgramOptions(const boost::program_options::variables_map & map)
{
    config = std::make_shared<VariablesMapConfig>(map);
    return config;
}

Config::ConfigPtr
Config::
get()
{
    return config;
}

void
Config::
reset()
{
    config.reset();
}

Config::ConfigPtr Config::config;

} // namespace STAGGER
