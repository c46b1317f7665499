/* import_orchestrator.h                                           -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Drives an import: reads lines, assembles statements, batches INSERTs and
   executes them, stopping when the budget of the invocation is spent and
   recording where to pick up again.
*/

#pragma once

#include "stagger/import/import_config.h"
#include "stagger/import/import_session.h"
#include "stagger/sql/insert_batcher.h"
#include "stagger/vfs/stream_reader.h"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace STAGGER {

struct AutoTuner;
struct SessionStore;
struct StatementExecutor;


/*****************************************************************************/
/* INVOCATION RESULT                                                         */
/*****************************************************************************/

struct InvocationStatistics {
    uint64_t linesThisInvocation = 0;
    uint64_t queriesThisInvocation = 0;
    uint64_t bytesThisInvocation = 0;
    uint64_t linesDone = 0;
    uint64_t queriesDone = 0;
    bool finished = false;
    std::string error;

    Json::Value toJson() const;
};

struct InvocationResult {
    ImportSession session;
    InvocationStatistics statistics;

    /// Statistics of the insert batcher over this invocation
    InsertBatcherStatistics batching;

    Json::Value toJson() const;
};


/*****************************************************************************/
/* IMPORT PROGRESS                                                           */
/*****************************************************************************/

struct ImportProgress {
    uint64_t line = 0;                  ///< lines consumed
    uint64_t offset = 0;                ///< uncompressed bytes consumed
    uint64_t compressedBytesRead = 0;   ///< bytes read from the file on disk
    uint64_t fileSize = 0;              ///< size of the file on disk
    uint64_t statementsExecuted = 0;
    double elapsed = 0.0;               ///< seconds into this invocation
};

typedef std::function<void (const ImportProgress & progress)> OnImportProgress;


/*****************************************************************************/
/* IMPORT ORCHESTRATOR                                                       */
/*****************************************************************************/

/** Runs imports one invocation at a time.

    An invocation restores the reader, parser and batcher from the session,
    processes lines until the end of the file, a failure, a stop request or
    the end of its budget, and writes the position to resume from back into
    the session.  The position saved on a pause never counts a row that is
    still sitting unexecuted in the insert batcher: either the open batch is
    dropped and its lines are read again next time, or the invocation runs
    on until the batch is complete.  Running an import in many invocations
    therefore executes the same statements as running it in one.

    A position is the start of a line plus the number of statements on that
    line that are already done; those are skipped when the line is read
    again, so a pause or a failure in the middle of a line never runs a
    statement twice.

    On a failed statement the position is left before the statement so that
    retrying the invocation executes it again.

    Every invocation first runs the configured pre-queries.  In test mode
    statements are parsed, batched and counted but not executed.  Files
    named *.csv (optionally compressed) are read as CSV rows, each turned
    into an INSERT into the configured table.
*/

struct ImportOrchestrator {
    /// Lines between memory checks when running against a budget
    static constexpr uint64_t MEMORY_CHECK_INTERVAL = 100;

    ImportOrchestrator(ImportConfig config,
                       StatementExecutor & executor,
                       std::shared_ptr<AutoTuner> tuner = nullptr);
    ~ImportOrchestrator();

    /** One invocation with the budget from the configuration, or from the
        tuner when there is one.
    */
    InvocationResult run(ImportSession & session);

    /** One invocation with an explicit budget.  Zero means no limit. */
    InvocationResult run(ImportSession & session,
                         uint64_t lineBudget,
                         double timeBudgetSeconds);

    /** Load the session for filename from the store (or start a new one),
        run one invocation and save the session back.
    */
    InvocationResult runInvocation(SessionStore & store,
                                   const std::string & filename);

    /** Import the whole file with no budget and no persistence.  Throws
        StatementExecutionError if a statement fails and Exception for any
        other failure.
    */
    InvocationResult runToCompletion(const std::string & filename);

    /** Ask the running invocation to stop at the start of its next line.
        Safe to call from another thread.
    */
    void requestStop();
    bool stopRequested() const { return stopRequested_; }

    /** Analysis to attach to sessions that do not have one yet.  Without
        it, sessions get an analysis derived from the file size alone.
    */
    void setFileAnalysis(const FileAnalysisResult & analysis);

    /** Called during replay seeks when resuming a bzip2 file. */
    void setSeekProgress(SeekProgress onProgress);

    /** Called between lines at most once every interval seconds. */
    void setProgress(OnImportProgress onProgress, double intervalSeconds);

    const ImportConfig & config() const { return config_; }
    const std::shared_ptr<AutoTuner> & tuner() const { return tuner_; }

private:
    struct Invocation;

    /** No line budget means the tuner (or configuration) decides once the
        file is open.
    */
    InvocationResult runImpl(ImportSession & session,
                             std::optional<uint64_t> lineBudget,
                             double timeBudgetSeconds);

    InsertBatcherOptions batcherOptionsFor(const ImportSession & session) const;

    ImportConfig config_;
    StatementExecutor & executor_;
    std::shared_ptr<AutoTuner> tuner_;
    std::atomic<bool> stopRequested_;
    std::optional<FileAnalysisResult> fileAnalysis_;
    SeekProgress seekProgress_;
    OnImportProgress onProgress_;
    double progressInterval_ = 0.0;
};

} // namespace STAGGER
