/* import_config.h                                                 -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Knobs of an import, read from the process configuration.
*/

#pragma once

#include "stagger/import/auto_tuner.h"
#include "stagger/sql/csv_row.h"
#include "stagger/sql/insert_batcher.h"
#include "stagger/sql/statement_parser.h"
#include "stagger/vfs/stream_reader.h"
#include <string>
#include <vector>
#include <stdint.h>

namespace STAGGER {

struct Config;


/*****************************************************************************/
/* IMPORT CONFIG                                                             */
/*****************************************************************************/

struct ImportConfig {
    /// Lines read per invocation; 0 for no limit
    uint64_t linesPerSession = 3000;

    /// Wall time per invocation in seconds; 0 for no limit
    double maxExecutionSeconds = 0;

    bool insertBatching = true;
    size_t insertBatchSize = 1000;
    size_t maxBatchBytes = 16 * 1024 * 1024;

    size_t bufferSize = StreamReader::DEFAULT_BUFFER_SIZE;

    uint64_t maxQueryLines = 10000;
    uint64_t maxQueryMemory = 10 * 1024 * 1024;

    PerformanceProfile profile = PerformanceProfile::CONSERVATIVE;
    bool autoTuning = true;
    uint64_t minBatchSize = 10000;
    uint64_t forceBatchSize = 0;
    bool fileAwareTuning = true;
    uint64_t memoryLimitMb = 0;

    /// Files larger than this use the aggressive insert batching limits
    /// when the batching limits were left at their defaults
    uint64_t autoAggressiveThreshold = 100 * 1024 * 1024;

    /// Statements run at the start of every invocation, such as
    /// SET FOREIGN_KEY_CHECKS=0
    std::vector<std::string> preQueries;

    /// Parse and batch without executing anything
    bool testMode = false;

    /// Extra line prefixes that mark comments
    std::vector<std::string> commentMarkers;

    /// Table that rows of *.csv files are inserted into
    std::string csvInsertTable;

    /// Empty the CSV table before the first row is inserted
    bool csvPreemptyTable = false;

    char csvDelimiter = ',';
    char csvEnclosure = '"';
    bool csvAddQuotes = true;
    bool csvAddSlashes = true;

    /** Read the import.* keys.  An unknown performance profile falls back
        to conservative with a warning.
    */
    static ImportConfig fromConfig(Config & config);

    bool defaultInsertBatching() const;

    InsertBatcherOptions batcherOptions() const;
    StatementParserOptions parserOptions() const;
    StreamReaderOptions readerOptions() const;
    AutoTunerOptions tunerOptions() const;
    CsvOptions csvOptions() const;
};

} // namespace STAGGER
