/* import_config.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

*/

#include "import_config.h"
#include "stagger/utils/config.h"
#include "stagger/utils/log.h"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("config");
    return result;
}

uint64_t getCount(Config & config, const std::string & key, uint64_t def)
{
    int value = config.getInt(key, static_cast<int>(def));
    if (value < 0) {
        WARNING_MSG(logger()) << key << " cannot be negative; using " << def;
        return def;
    }
    return value;
}

/** Split a list on sep, trimming the items and dropping empty ones. */
std::vector<std::string>
getList(Config & config, const std::string & key, char sep)
{
    std::string value = config.getString(key, "");
    std::vector<std::string> items;
    boost::algorithm::split(items, value, [=] (char c) { return c == sep; });

    std::vector<std::string> result;
    for (auto & item: items) {
        boost::algorithm::trim(item);
        if (!item.empty())
            result.emplace_back(std::move(item));
    }
    return result;
}

char getChar(Config & config, const std::string & key, char def)
{
    std::string value = config.getString(key, std::string(1, def));
    if (value.size() != 1) {
        WARNING_MSG(logger()) << key << " must be a single character; using "
                              << def;
        return def;
    }
    return value[0];
}

} // file scope

ImportConfig
ImportConfig::
fromConfig(Config & config)
{
    ImportConfig result;

    result.linesPerSession
        = getCount(config, "import.lines_per_session", result.linesPerSession);
    result.maxExecutionSeconds
        = getCount(config, "import.max_execution_seconds", 0);
    result.insertBatching
        = config.getBool("import.insert_batching", result.insertBatching);
    result.insertBatchSize
        = getCount(config, "import.insert_batch_size", result.insertBatchSize);
    result.maxBatchBytes
        = getCount(config, "import.max_batch_bytes", result.maxBatchBytes);
    result.bufferSize = StreamReader::clampBufferSize
        (getCount(config, "import.buffer_size", result.bufferSize));
    result.maxQueryLines
        = getCount(config, "import.max_query_lines", result.maxQueryLines);
    result.maxQueryMemory
        = getCount(config, "import.max_query_memory", result.maxQueryMemory);

    std::string profile
        = config.getString("import.performance_profile", "conservative");
    try {
        result.profile = parsePerformanceProfile(profile);
    } catch (const InvalidProfileError & exc) {
        WARNING_MSG(logger()) << exc.what() << "; using conservative";
        result.profile = PerformanceProfile::CONSERVATIVE;
    }

    result.autoTuning = config.getBool("import.auto_tuning", result.autoTuning);
    result.minBatchSize
        = getCount(config, "import.min_batch_size", result.minBatchSize);
    result.forceBatchSize
        = getCount(config, "import.force_batch_size", result.forceBatchSize);
    result.fileAwareTuning
        = config.getBool("import.file_aware_tuning", result.fileAwareTuning);
    result.memoryLimitMb
        = getCount(config, "import.memory_limit_mb", result.memoryLimitMb);

    result.preQueries = getList(config, "import.pre_queries", ';');
    result.testMode = config.getBool("import.test_mode", result.testMode);
    result.commentMarkers = getList(config, "import.comment_markers", ',');

    result.csvInsertTable = boost::algorithm::trim_copy
        (config.getString("import.csv_insert_table", ""));
    result.csvPreemptyTable
        = config.getBool("import.csv_preempty_table", result.csvPreemptyTable);
    result.csvDelimiter
        = getChar(config, "import.csv_delimiter", result.csvDelimiter);
    result.csvEnclosure
        = getChar(config, "import.csv_enclosure", result.csvEnclosure);
    result.csvAddQuotes
        = config.getBool("import.csv_add_quotes", result.csvAddQuotes);
    result.csvAddSlashes
        = config.getBool("import.csv_add_slashes", result.csvAddSlashes);

    return result;
}

bool
ImportConfig::
defaultInsertBatching() const
{
    ImportConfig defaults;
    return insertBatchSize == defaults.insertBatchSize
        && maxBatchBytes == defaults.maxBatchBytes;
}

InsertBatcherOptions
ImportConfig::
batcherOptions() const
{
    InsertBatcherOptions result;
    result.enabled = insertBatching;
    result.batchSize = insertBatchSize;
    result.maxBatchBytes = maxBatchBytes;
    return result;
}

StatementParserOptions
ImportConfig::
parserOptions() const
{
    StatementParserOptions result;
    result.maxStatementLines = maxQueryLines;
    result.maxStatementBytes = maxQueryMemory;
    result.commentMarkers = commentMarkers;
    return result;
}

StreamReaderOptions
ImportConfig::
readerOptions() const
{
    StreamReaderOptions result;
    result.bufferSize = bufferSize;
    return result;
}

AutoTunerOptions
ImportConfig::
tunerOptions() const
{
    AutoTunerOptions result;
    result.profile = profile;
    result.enabled = autoTuning;
    result.minBatchSize = minBatchSize;
    result.initialBatchSize = linesPerSession;
    result.forcedBatchSize = forceBatchSize;
    result.fileAwareTuning = fileAwareTuning;
    result.memoryLimit = memoryLimitMb * 1024 * 1024;
    return result;
}

CsvOptions
ImportConfig::
csvOptions() const
{
    CsvOptions result;
    result.delimiter = csvDelimiter;
    result.enclosure = csvEnclosure;
    result.addQuotes = csvAddQuotes;
    result.addSlashes = csvAddSlashes;
    return result;
}

} // namespace STAGGER
