/* import_session.h                                                -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Everything needed to resume an import where the previous invocation
   stopped.
*/

#pragma once

#include "stagger/import/file_analysis.h"
#include "stagger/sql/statement_parser.h"
#include "stagger/sql/insert_batcher.h"
#include "stagger/vfs/stream_reader.h"
#include <map>
#include <optional>
#include <string>
#include <stdint.h>

namespace Json {
class Value;
}

namespace STAGGER {


/*****************************************************************************/
/* IMPORT STATUS                                                             */
/*****************************************************************************/

enum class ImportStatus {
    NOT_STARTED,
    RUNNING,
    FINISHED,
    ERROR,
    STOPPED
};

std::string statusName(ImportStatus status);
ImportStatus parseImportStatus(const std::string & name);


/*****************************************************************************/
/* IMPORT ERROR                                                              */
/*****************************************************************************/

enum class ImportErrorKind {
    EXECUTION,   ///< the database rejected a statement
    PARSE,       ///< the input could not be split into statements
    IO           ///< the input could not be read
};

std::string errorKindName(ImportErrorKind kind);
ImportErrorKind parseErrorKind(const std::string & name);

struct ImportError {
    ImportErrorKind kind = ImportErrorKind::EXECUTION;
    std::string message;
    std::string statement;
    uint64_t line = 0;
    std::string databaseError;
    int errorCode = 0;
    bool targetExists = false;
    std::string targetTable;

    /** Multi line description for display, with the statement cut to 500
        characters.
    */
    std::string format() const;

    Json::Value toJson() const;
    static ImportError fromJson(const Json::Value & value);
};


/*****************************************************************************/
/* IMPORT SESSION                                                            */
/*****************************************************************************/

struct ImportSession {
    ImportSession() = default;
    explicit ImportSession(const std::string & filename);

    std::string filename;

    // Position.  currentOffset is always the start of line currentLine + 1
    // in the decompressed stream.
    uint64_t currentLine = 0;
    uint64_t currentOffset = 0;

    // Statements completed on line currentLine + 1 that have already been
    // executed; they are skipped when the line is read again
    uint64_t lineStatementsDone = 0;

    uint64_t totalStatementsExecuted = 0;

    uint64_t fileSize = 0;
    Codec codec = Codec::NONE;

    // Parser state at currentOffset
    ParserState parser;

    // Row size sample of the insert batcher at currentOffset
    RowSizeSample rowSample;

    ImportStatus status = ImportStatus::NOT_STARTED;
    std::optional<ImportError> error;

    // Diagnostics of the last invocation
    uint64_t invocations = 0;
    uint64_t batchSize = 0;
    uint64_t memoryUsage = 0;
    double memoryPercentage = 0.0;
    double speedLps = 0.0;
    std::string autoTuneAdjustment;
    std::optional<FileAnalysisResult> fileAnalysis;

    bool finished() const { return status == ImportStatus::FINISHED; }
    bool failed() const { return status == ImportStatus::ERROR; }

    /** Fraction of the file consumed, from the decompressed offset.  Only
        meaningful for uncompressed files; 0 when the size is unknown.
    */
    double percentDone() const;

    typedef std::map<std::string, std::string> Fields;

    /** Flat string form for key/value session storage. */
    Fields toFields() const;
    static ImportSession fromFields(const Fields & fields);

    Json::Value toJson() const;
    static ImportSession fromJson(const Json::Value & value);
};

} // namespace STAGGER
