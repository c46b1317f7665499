/* import_orchestrator.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   The import loop.
*/

#include "import_orchestrator.h"
#include "auto_tuner.h"
#include "session_store.h"
#include "statement_executor.h"
#include "stagger/sql/csv_row.h"
#include "stagger/sql/statement.h"
#include "stagger/sql/statement_parser.h"
#include "stagger/arch/format.h"
#include "stagger/arch/timers.h"
#include "stagger/base/exc_assert.h"
#include "stagger/utils/log.h"
#include <json/json.h>
#include <boost/algorithm/string/predicate.hpp>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("import");
    return result;
}

/** Everything needed to continue from a statement boundary: the start of
    a line, and how many of the statements completed on that line are
    already done.
*/
struct Position {
    uint64_t line = 0;
    uint64_t offset = 0;
    uint64_t skip = 0;
    ParserState parser;
    RowSizeSample sample;
};

/** Is this a CSV file, optionally compressed? */
bool isCsvFile(const std::string & filename)
{
    std::string name = filename;
    for (const std::string & ext: { ".gz", ".bz2" }) {
        if (boost::algorithm::iends_with(name, ext)) {
            name.resize(name.size() - ext.size());
            break;
        }
    }
    return boost::algorithm::iends_with(name, ".csv");
}

} // file scope


/*****************************************************************************/
/* INVOCATION RESULT                                                         */
/*****************************************************************************/

Json::Value
InvocationStatistics::
toJson() const
{
    Json::Value result;
    result["lines_this_invocation"] = Json::UInt64(linesThisInvocation);
    result["queries_this_invocation"] = Json::UInt64(queriesThisInvocation);
    result["bytes_this_invocation"] = Json::UInt64(bytesThisInvocation);
    result["lines_done"] = Json::UInt64(linesDone);
    result["queries_done"] = Json::UInt64(queriesDone);
    result["finished"] = finished;
    result["error"] = error;
    return result;
}

Json::Value
InvocationResult::
toJson() const
{
    Json::Value result;
    result["session"] = session.toJson();
    result["statistics"] = statistics.toJson();
    result["batching"] = batching.toJson();
    return result;
}


/*****************************************************************************/
/* INVOCATION                                                                */
/*****************************************************************************/

/** State of one pass through the import loop. */

struct ImportOrchestrator::Invocation {
    Invocation(ImportOrchestrator & owner, ImportSession & session,
               double timeBudget)
        : owner(owner),
          session(session),
          reader(owner.config_.readerOptions()),
          parser(owner.config_.parserOptions()),
          timeBudget(timeBudget),
          startLine(session.currentLine),
          startOffset(session.currentOffset),
          startSkip(session.lineStatementsDone),
          line(session.currentLine),
          resumeSkip(session.lineStatementsDone)
    {
    }

    ImportOrchestrator & owner;
    ImportSession & session;
    StreamReader reader;
    StatementParser parser;
    std::unique_ptr<InsertBatcher> batcher;

    uint64_t lineBudget = 0;
    double timeBudget = 0;
    Timer timer;

    const uint64_t startLine;
    const uint64_t startOffset;
    const uint64_t startSkip;

    uint64_t line;                       ///< lines consumed so far
    uint64_t linesThisInvocation = 0;
    uint64_t queriesThisInvocation = 0;

    // Statements to skip on the next line read, which were done by an
    // earlier invocation
    uint64_t resumeSkip;

    // Where the rows in the open batch started
    Position batchStart;
    uint64_t batchFirstLine = 0;

    // Budget spent but the open batch started where this invocation did
    bool draining = false;

    // Rows of a CSV file instead of SQL statements
    bool csv = false;
    CsvOptions csvOptions;

    uint64_t linesSinceAdapt = 0;
    uint64_t offsetAtAdapt = 0;

    double lastProgress = 0.0;

    bool done = false;

    Position snapshot() const
    {
        Position result;
        result.line = line;
        result.offset = reader.tell();
        result.parser = parser.exportState();
        result.sample = batcher->exportSample();
        return result;
    }

    /** Snapshot without the pending statement text, which can be large
        and is only needed when the line has to be read again.
    */
    Position partialSnapshot(size_t & pendingLength) const
    {
        const ParserState & state = parser.exportState();
        pendingLength = state.pending.size();

        Position result;
        result.line = line;
        result.offset = reader.tell();
        result.parser.delimiter = state.delimiter;
        result.parser.inString = state.inString;
        result.parser.activeQuote = state.activeQuote;
        result.parser.escapePending = state.escapePending;
        result.parser.pendingLines = state.pendingLines;
        result.sample = batcher->exportSample();
        return result;
    }

    /** Fill in the pending text of a partial snapshot taken before the line
        that produced parsed.  Text pending before a line is either carried
        into the first statement completed on it or is still at the start of
        the pending text.
    */
    void completeSnapshot(Position & lineStart, size_t pendingLength,
                          const ParseResult & parsed) const
    {
        if (pendingLength == 0)
            return;
        if (!parsed.carriedOver.empty())
            lineStart.parser.pending = parsed.carriedOver;
        else lineStart.parser.pending
                 = parser.exportState().pending.substr(0, pendingLength);
    }

    /** Make pos the resume point of the session. */
    void commit(const Position & pos)
    {
        ExcAssertGreaterEqual(pos.offset, session.currentOffset);
        session.currentLine = pos.line;
        session.currentOffset = pos.offset;
        session.lineStatementsDone = pos.skip;
        session.parser = pos.parser;
        session.rowSample = pos.sample;
    }

    /** Is pos past the point this invocation started from?  Pausing there
        keeps the work done before it.
    */
    bool afterStart(const Position & pos) const
    {
        return pos.line > startLine
            || (pos.line == startLine && pos.skip > startSkip);
    }

    void open()
    {
        reader.open(session.filename);
        session.fileSize = reader.fileSize();
        session.codec = reader.codec();

        if (isCsvFile(session.filename)) {
            const std::string & table = owner.config_.csvInsertTable;
            if (table.empty())
                throw Exception("%s is a CSV file but import.csv_insert_table "
                                "is not configured", session.filename.c_str());
            if (!isSafeTableName(table))
                throw Exception("invalid table name for CSV import: '%s'",
                                table.c_str());
            csv = true;
            csvOptions = owner.config_.csvOptions();
        }

        if (!session.fileAnalysis) {
            if (owner.fileAnalysis_)
                session.fileAnalysis = owner.fileAnalysis_;
            else session.fileAnalysis = FileAnalysisResult::fromSize
                     (session.fileSize, session.codec != Codec::NONE);
        }

        if (session.currentOffset > 0) {
            DEBUG_MSG(logger()) << "resuming " << session.filename
                                << " at line " << session.currentLine
                                << " offset " << session.currentOffset;
            auto onProgress = owner.seekProgress_;
            if (!onProgress) {
                onProgress = [&] (uint64_t bytesRead, uint64_t target)
                    {
                        DEBUG_MSG(logger())
                            << "seeking " << session.filename << ": "
                            << formatBytes(bytesRead) << " of "
                            << formatBytes(target);
                    };
            }
            reader.seek(session.currentOffset, onProgress);
        }

        restoreParser();

        batcher.reset(new InsertBatcher(owner.batcherOptionsFor(session)));
        batcher->restoreSample(session.rowSample);

        offsetAtAdapt = reader.tell();
    }

    void restoreParser()
    {
        if (session.currentOffset == 0) {
            parser.reset();
            return;
        }

        ParserState state = session.parser;
        if (!state.pending.empty()
            && !looksLikeStatement(state.pending)) {
            WARNING_MSG(logger())
                << "discarding saved partial statement for "
                << session.filename << " that does not start like SQL: "
                << state.pending.substr(0, 100);
            state.pending.clear();
            state.pendingLines = 0;
            state.inString = false;
            state.activeQuote = 0;
            state.escapePending = false;
        }
        parser.restoreState(std::move(state));
    }

    bool budgetExhausted()
    {
        if (lineBudget > 0 && linesThisInvocation >= lineBudget)
            return true;
        if (timeBudget > 0 && timer.elapsed_wall() >= timeBudget)
            return true;
        if (owner.tuner_ && lineBudget > 0 && linesThisInvocation > 0
            && linesThisInvocation % MEMORY_CHECK_INTERVAL == 0
            && owner.tuner_->memoryLimitReached()) {
            INFO_MSG(logger()) << "pausing " << session.filename
                               << " at line " << line
                               << ": memory limit of the profile reached";
            return true;
        }
        return false;
    }

    static ImportError executionError(const std::string & statement,
                                      uint64_t statementLine,
                                      const ExecutionResult & result)
    {
        ImportError error;
        error.kind = ImportErrorKind::EXECUTION;
        error.statement = statement;
        error.line = statementLine;
        error.databaseError = result.error;
        error.errorCode = result.errorCode;
        error.targetExists = isTargetExistsError(result.error,
                                                 result.errorCode,
                                                 error.targetTable);
        error.message = error.format();
        return error;
    }

    void failExecution(const std::string & statement, uint64_t statementLine,
                       const ExecutionResult & result,
                       const Position & resumeFrom)
    {
        ImportError error = executionError(statement, statementLine, result);

        ERROR_MSG(logger()) << session.filename << ": " << error.message;

        commit(resumeFrom);
        session.status = ImportStatus::ERROR;
        session.error = std::move(error);
        done = true;
    }

    /** Run a statement that precedes the lines of the file.  On failure
        the session keeps its position.
    */
    bool runSetupQuery(const std::string & query, const char * what)
    {
        if (owner.config_.testMode) {
            DEBUG_MSG(logger()) << "test mode; not running " << query;
            return true;
        }

        DEBUG_MSG(logger()) << "running " << what << " " << query;
        ExecutionResult result = owner.executor_.execute(query);
        if (result.success)
            return true;

        ImportError error = executionError(query, 0, result);
        error.message = std::string(what) + " failed: " + error.message;
        ERROR_MSG(logger()) << session.filename << ": " << error.message;
        session.status = ImportStatus::ERROR;
        session.error = std::move(error);
        done = true;
        return false;
    }

    /** Run the pre-queries, which are not counted as statements of the
        import, and empty the CSV table when nothing has been imported yet.
    */
    bool runPreQueries()
    {
        for (auto & query: owner.config_.preQueries) {
            if (!runSetupQuery(query, "pre-query"))
                return false;
        }

        if (csv && owner.config_.csvPreemptyTable
            && session.currentOffset == 0 && session.currentLine == 0
            && session.lineStatementsDone == 0) {
            std::string query
                = "DELETE FROM `" + owner.config_.csvInsertTable + "`";
            if (!runSetupQuery(query, "emptying table"))
                return false;
            ++session.totalStatementsExecuted;
            ++queriesThisInvocation;
        }

        return true;
    }

    void fail(ImportErrorKind kind, const std::string & message,
              const Position & resumeFrom)
    {
        ImportError error;
        error.kind = kind;
        error.message = message;
        error.line = resumeFrom.line + 1;

        ERROR_MSG(logger()) << session.filename << ": " << message;

        commit(resumeFrom);
        session.status = ImportStatus::ERROR;
        session.error = std::move(error);
        done = true;
    }

    /** Rows already batched are complete statements; execute them before
        reporting the error so that the position stays consistent.
    */
    void failParse(const std::string & message, const Position & resumeFrom)
    {
        if (!flushBatcher())
            return;
        fail(ImportErrorKind::PARSE, message, resumeFrom);
    }

    bool execute(const std::string & statement, uint64_t statementLine,
                 const Position & resumeFrom)
    {
        if (!owner.config_.testMode) {
            ExecutionResult result = owner.executor_.execute(statement);
            if (!result.success) {
                failExecution(statement, statementLine, result, resumeFrom);
                return false;
            }
        }
        ++session.totalStatementsExecuted;
        ++queriesThisInvocation;
        return true;
    }

    void startBatch(const ParsedStatement & statement, const Position & here)
    {
        batchStart = here;
        batchFirstLine = statement.line;
    }

    /** Run one statement through the batcher and execute what comes out.
        here is the position just before the statement.  Returns false on a
        failed statement.
    */
    bool process(const ParsedStatement & statement, const Position & here)
    {
        bool wasEmpty = batcher->empty();

        BatchResult result = batcher->process(statement);
        size_t n = result.statements.size();

        if (!result.wasBatched) {
            // Optionally the batch that was open, then the statement itself
            for (size_t i = 0;  i < n;  ++i) {
                bool isBatch = i + 1 < n;
                if (!execute(result.statements[i],
                             isBatch ? batchFirstLine : statement.line,
                             isBatch ? batchStart : here))
                    return false;
            }
            return true;
        }

        // The batch that was open, if any, then possibly the batch that
        // this row completed on its own
        for (size_t i = 0;  i < n;  ++i) {
            if (wasEmpty || i > 0)
                startBatch(statement, here);
            if (!execute(result.statements[i], batchFirstLine, batchStart))
                return false;
        }

        if (!batcher->empty() && (wasEmpty || n > 0))
            startBatch(statement, here);

        return true;
    }

    bool flushBatcher()
    {
        BatchResult result = batcher->flush();
        for (auto & statement: result.statements) {
            if (!execute(statement, batchFirstLine, batchStart))
                return false;
        }
        return true;
    }

    void adapt(bool force)
    {
        auto & tuner = owner.tuner_;
        if (!tuner || linesSinceAdapt == 0)
            return;
        if (!force && linesSinceAdapt < tuner->currentBatchSize())
            return;

        uint64_t offset = reader.tell();
        tuner->adaptBatchSize(offset - offsetAtAdapt, linesSinceAdapt);
        linesSinceAdapt = 0;
        offsetAtAdapt = offset;
    }

    void pause(const Position & at)
    {
        commit(at);
        adapt(true);
        done = true;
        DEBUG_MSG(logger()) << "pausing " << session.filename << " at line "
                            << at.line << " offset " << at.offset;
    }

    void finishFile(const Position & lineStart)
    {
        if (parser.isInString()) {
            failParse(format("unexpected end of file inside a string "
                             "literal opened with %c",
                             parser.getActiveQuote()),
                      lineStart);
            return;
        }

        uint64_t pendingLines = parser.exportState().pendingLines;
        std::optional<std::string> pending = parser.takePendingStatement();
        if (pending) {
            if (looksLikeStatement(*pending)) {
                uint64_t first = line >= pendingLines && pendingLines > 0
                    ? line - pendingLines + 1 : line;
                if (!process(classifyStatement(*pending, first), lineStart))
                    return;
            }
            else {
                WARNING_MSG(logger())
                    << "discarding text at the end of " << session.filename
                    << " that is not a statement: " << pending->substr(0, 100);
            }
        }

        if (!flushBatcher())
            return;

        commit(snapshot());
        session.status = ImportStatus::FINISHED;
        done = true;

        INFO_MSG(logger()) << "finished " << session.filename << ": "
                           << session.currentLine << " lines, "
                           << session.totalStatementsExecuted << " statements";
    }

    void step()
    {
        if (owner.stopRequested_) {
            if (flushBatcher()) {
                commit(snapshot());
                session.status = ImportStatus::STOPPED;
                done = true;
                INFO_MSG(logger()) << "stopped " << session.filename
                                   << " at line " << line;
            }
            return;
        }

        if (!draining && budgetExhausted())
            draining = true;

        if (draining) {
            if (batcher->empty()) {
                pause(snapshot());
                return;
            }
            if (afterStart(batchStart)) {
                // Read the rows of the open batch again next time
                batcher->discard();
                pause(batchStart);
                return;
            }
            // Pausing at the start of the open batch would make no progress;
            // run on until the next batch opens or the batcher empties
        }

        size_t pendingLength = 0;
        Position lineStart = partialSnapshot(pendingLength);

        std::optional<std::string> text = reader.readLine();
        if (!text) {
            lineStart.parser.pending = parser.exportState().pending;
            finishFile(lineStart);
            return;
        }

        ++line;
        ++linesThisInvocation;
        ++linesSinceAdapt;

        uint64_t skip = resumeSkip;
        resumeSkip = 0;

        if (csv) {
            if (!processCsvRow(*text, lineStart, skip))
                return;
        }
        else if (!processLine(*text, std::move(lineStart), pendingLength,
                              skip))
            return;

        if (batcher->empty())
            adapt(false);

        reportProgress();
    }

    /** Statements completed by one line of SQL.  Returns false when the
        invocation is over.
    */
    bool processLine(const std::string & text, Position lineStart,
                     size_t pendingLength, uint64_t skip)
    {
        ParseResult parsed = parser.parseLine(text, line);
        completeSnapshot(lineStart, pendingLength, parsed);

        if (parsed.hasError()) {
            lineStart.skip = skip;
            failParse(parsed.error, lineStart);
            return false;
        }

        if (skip > parsed.statements.size()) {
            WARNING_MSG(logger())
                << session.filename << ": line " << line << " completes "
                << parsed.statements.size() << " statements but " << skip
                << " were recorded as done";
            skip = parsed.statements.size();
        }

        Position here = std::move(lineStart);
        for (size_t i = skip;  i < parsed.statements.size();  ++i) {
            here.skip = i;
            here.sample = batcher->exportSample();
            if (!process(parsed.statements[i], here))
                return false;
        }

        return true;
    }

    /** One line of a CSV file becomes one INSERT into the configured
        table.  Blank and # lines are skipped.
    */
    bool processCsvRow(const std::string & text, const Position & here,
                       uint64_t skip)
    {
        if (skip > 0 || !isCsvDataLine(text))
            return true;

        std::string insert;
        try {
            insert = csvToInsert(text, owner.config_.csvInsertTable,
                                 csvOptions);
        } catch (const CsvUnclosedEnclosure & exc) {
            failParse(format("line %llu: %s", (unsigned long long)line,
                             exc.what()),
                      here);
            return false;
        }

        return process(classifyStatement(std::move(insert), line), here);
    }

    void reportProgress()
    {
        if (!owner.onProgress_)
            return;
        double elapsed = timer.elapsed_wall();
        if (elapsed - lastProgress < owner.progressInterval_)
            return;
        lastProgress = elapsed;

        ImportProgress progress;
        progress.line = line;
        progress.offset = reader.tell();
        progress.compressedBytesRead = reader.compressedBytesRead();
        progress.fileSize = reader.fileSize();
        progress.statementsExecuted = session.totalStatementsExecuted;
        progress.elapsed = elapsed;
        owner.onProgress_(progress);
    }

    void run()
    {
        if (!runPreQueries())
            return;
        while (!done)
            step();
    }
};


/*****************************************************************************/
/* IMPORT ORCHESTRATOR                                                       */
/*****************************************************************************/

ImportOrchestrator::
ImportOrchestrator(ImportConfig config,
                   StatementExecutor & executor,
                   std::shared_ptr<AutoTuner> tuner)
    : config_(std::move(config)),
      executor_(executor),
      tuner_(std::move(tuner)),
      stopRequested_(false)
{
}

ImportOrchestrator::
~ImportOrchestrator()
{
}

void
ImportOrchestrator::
requestStop()
{
    stopRequested_ = true;
}

void
ImportOrchestrator::
setFileAnalysis(const FileAnalysisResult & analysis)
{
    fileAnalysis_ = analysis;
}

void
ImportOrchestrator::
setSeekProgress(SeekProgress onProgress)
{
    seekProgress_ = std::move(onProgress);
}

void
ImportOrchestrator::
setProgress(OnImportProgress onProgress, double intervalSeconds)
{
    onProgress_ = std::move(onProgress);
    progressInterval_ = intervalSeconds;
}

InsertBatcherOptions
ImportOrchestrator::
batcherOptionsFor(const ImportSession & session) const
{
    InsertBatcherOptions result = config_.batcherOptions();
    if (!config_.defaultInsertBatching())
        return result;

    if (session.fileSize > config_.autoAggressiveThreshold) {
        const ProfileSettings & aggressive
            = getProfileSettings(PerformanceProfile::AGGRESSIVE);
        result.batchSize = aggressive.insertBatchSize;
        result.maxBatchBytes = aggressive.maxBatchBytes;
        DEBUG_MSG(logger()) << session.filename << " is larger than "
                            << formatBytes(config_.autoAggressiveThreshold)
                            << "; using aggressive insert batching";
    }
    else if (tuner_) {
        result.batchSize = tuner_->recommendedInsertBatchSize();
        result.maxBatchBytes = tuner_->recommendedMaxBatchBytes();
    }

    return result;
}

InvocationResult
ImportOrchestrator::
run(ImportSession & session)
{
    return runImpl(session, std::nullopt, config_.maxExecutionSeconds);
}

InvocationResult
ImportOrchestrator::
run(ImportSession & session, uint64_t lineBudget, double timeBudgetSeconds)
{
    return runImpl(session, lineBudget, timeBudgetSeconds);
}

InvocationResult
ImportOrchestrator::
runImpl(ImportSession & session,
        std::optional<uint64_t> lineBudget,
        double timeBudgetSeconds)
{
    InvocationResult result;

    if (session.status == ImportStatus::FINISHED) {
        result.session = session;
        result.statistics.linesDone = session.currentLine;
        result.statistics.queriesDone = session.totalStatementsExecuted;
        result.statistics.finished = true;
        return result;
    }

    if (session.status == ImportStatus::ERROR) {
        INFO_MSG(logger()) << "retrying " << session.filename
                           << " from line " << session.currentLine + 1;
        session.error.reset();
    }

    session.status = ImportStatus::RUNNING;
    ++session.invocations;

    Invocation invocation(*this, session, timeBudgetSeconds);

    try {
        invocation.open();

        if (tuner_) {
            tuner_->setCompressionType(codecName(session.codec));
            if (session.fileAnalysis)
                tuner_->setFileAnalysis(*session.fileAnalysis);
        }

        if (lineBudget)
            invocation.lineBudget = *lineBudget;
        else if (tuner_)
            invocation.lineBudget = tuner_->calculateOptimalBatchSize();
        else invocation.lineBudget = config_.linesPerSession;

        session.batchSize = invocation.lineBudget;

        invocation.run();
    } catch (const std::exception & exc) {
        // Reader and executor failures; the session keeps its last
        // committed position
        invocation.done = true;
        session.status = ImportStatus::ERROR;
        ImportError error;
        error.kind = ImportErrorKind::IO;
        error.line = session.currentLine + 1;
        error.message = format("error importing %s near line %llu "
                               "(offset %llu): %s",
                               session.filename.c_str(),
                               (unsigned long long)invocation.line,
                               (unsigned long long)invocation.reader.tell(),
                               exc.what());
        ERROR_MSG(logger()) << error.message;
        session.error = std::move(error);
    }

    stopRequested_ = false;

    double elapsed = invocation.timer.elapsed_wall();
    session.speedLps = elapsed > 0
        ? invocation.linesThisInvocation / elapsed : 0.0;

    if (tuner_) {
        MemoryPressure pressure = tuner_->checkMemoryPressure();
        session.memoryUsage = pressure.usage;
        session.memoryPercentage = pressure.percentage;
        session.autoTuneAdjustment = tuner_->lastAdjustment();
    }

    InvocationStatistics & stats = result.statistics;
    stats.linesThisInvocation = invocation.linesThisInvocation;
    stats.queriesThisInvocation = invocation.queriesThisInvocation;
    stats.bytesThisInvocation = session.currentOffset - invocation.startOffset;
    stats.linesDone = session.currentLine;
    stats.queriesDone = session.totalStatementsExecuted;
    stats.finished = session.finished();
    if (session.error)
        stats.error = session.error->format();

    if (invocation.batcher)
        result.batching = invocation.batcher->getStatistics();

    result.session = session;
    return result;
}

InvocationResult
ImportOrchestrator::
runInvocation(SessionStore & store, const std::string & filename)
{
    std::optional<ImportSession> loaded = store.load(filename);
    ImportSession session = loaded ? std::move(*loaded) : ImportSession(filename);

    InvocationResult result = run(session);
    store.save(session);
    return result;
}

InvocationResult
ImportOrchestrator::
runToCompletion(const std::string & filename)
{
    ImportSession session(filename);
    InvocationResult result;

    do {
        result = run(session, 0, 0);
    } while (session.status == ImportStatus::RUNNING);

    if (session.status == ImportStatus::ERROR) {
        const ImportError & error = *session.error;
        if (error.kind == ImportErrorKind::EXECUTION)
            throw StatementExecutionError(error);
        throw Exception(error.message);
    }

    return result;
}

} // namespace STAGGER
