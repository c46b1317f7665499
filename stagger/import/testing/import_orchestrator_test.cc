/* import_orchestrator_test.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Test of the import loop: staggered imports, failures and resumption.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "stagger/import/import_orchestrator.h"
#include "stagger/import/auto_tuner.h"
#include "stagger/import/memory_probe.h"
#include "stagger/import/session_store.h"
#include "stagger/import/statement_executor.h"
#include "stagger/vfs/compressor.h"
#include <boost/test/unit_test.hpp>
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <errno.h>
#include <stdlib.h>

using namespace std;
using namespace STAGGER;

namespace {

struct TempDir {
    TempDir()
    {
        std::string tmpl = (std::filesystem::temp_directory_path()
                            / "import_orchestrator_test_XXXXXX").string();
        if (!mkdtemp(tmpl.data()))
            throw Exception(errno, "mkdtemp", "TempDir");
        path = tmpl;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string & name) const
    {
        return (path / name).string();
    }

    std::filesystem::path path;
};

/** Write contents to filename, compressed according to its extension. */
void writeFile(const std::string & filename, const std::string & contents)
{
    std::string compression = Compressor::filenameToCompression(filename);
    if (compression.empty())
        compression = "none";
    auto compressor = Compressor::create(compression);

    std::ofstream stream(filename, std::ios::binary);
    auto onData = [&] (const char * data, size_t len)
        {
            stream.write(data, len);
            return len;
        };
    compressor->compress(contents.data(), contents.size(), onData);
    compressor->finish(onData);
    BOOST_REQUIRE(stream);
}

std::string readFile(const std::string & filename)
{
    std::ifstream stream(filename, std::ios::binary);
    std::ostringstream result;
    result << stream.rdbuf();
    return result.str();
}

bool canWrite(const std::string & filename)
{
    Codec codec = codecForFilename(filename);
    return codec == Codec::NONE
        || Decompressor::isRegistered(codecName(codec));
}

/** Records every statement; fails those containing failOn, at most
    failures times.
*/
struct RecordingExecutor: public StatementExecutor {
    virtual ExecutionResult execute(const std::string & statement) override
    {
        if (!failOn.empty() && failures > 0
            && statement.find(failOn) != string::npos) {
            --failures;
            return ExecutionResult::failure(failMessage, failCode);
        }
        executed.push_back(statement);
        return ExecutionResult();
    }

    std::vector<std::string> executed;
    std::string failOn;
    int failures = 0;
    std::string failMessage = "rejected";
    int failCode = 0;
};

const std::string DUMP
    = "-- dump header\n"
      "CREATE TABLE t (id int);\n"
      "INSERT INTO t VALUES (1);\n"
      "INSERT INTO t VALUES (2);\n"
      "INSERT INTO t VALUES (3);\n"
      "INSERT INTO t VALUES (4);\n"
      "INSERT INTO t VALUES (5);\n"
      "INSERT INTO t VALUES (6);\n"
      "INSERT INTO t VALUES (7);\n"
      "CREATE TABLE u (\n"
      "  name text\n"
      ");\n"
      "INSERT INTO u VALUES ('multi\n"
      "line; text');\n"
      "INSERT INTO u VALUES ('x'); INSERT INTO u VALUES ('y');\n"
      "INSERT INTO t VALUES (8),(9);\n"
      "INSERT INTO t VALUES (10);\n"
      "DROP TABLE x";

const std::vector<std::string> EXPECTED = {
    "CREATE TABLE t (id int)",
    "INSERT INTO t VALUES (1), (2), (3);",
    "INSERT INTO t VALUES (4), (5), (6);",
    "INSERT INTO t VALUES (7);",
    "CREATE TABLE u (\n  name text\n)",
    "INSERT INTO u VALUES ('multi\nline; text'), ('x'), ('y');",
    "INSERT INTO t VALUES (8),(9)",
    "INSERT INTO t VALUES (10);",
    "DROP TABLE x"
};

ImportConfig testConfig(uint64_t linesPerSession = 0)
{
    ImportConfig result;
    result.insertBatchSize = 3;
    result.linesPerSession = linesPerSession;
    return result;
}

/** Import filename one invocation at a time through store, with a new
    orchestrator for each invocation as separate requests would have.  The
    line budget is config.linesPerSession.
*/
std::vector<std::string>
importStaggered(const std::string & filename, const ImportConfig & config,
                SessionStore & store, int & invocations,
                uint64_t totalLines = 18)
{
    RecordingExecutor executor;
    invocations = 0;

    for (;;) {
        ImportOrchestrator orchestrator(config, executor);
        InvocationResult result = orchestrator.runInvocation(store, filename);
        ++invocations;
        BOOST_REQUIRE_MESSAGE(!result.session.failed(), result.statistics.error);
        BOOST_CHECK_LE(result.statistics.linesThisInvocation,
                       config.linesPerSession + config.insertBatchSize);
        if (result.statistics.finished)
            break;
        BOOST_REQUIRE_LT(invocations, 1000);
    }

    auto session = store.load(filename);
    BOOST_REQUIRE(session);
    BOOST_CHECK(session->finished());
    BOOST_CHECK_EQUAL(session->currentLine, totalLines);
    BOOST_CHECK_EQUAL(session->lineStatementsDone, 0);
    BOOST_CHECK_EQUAL(session->totalStatementsExecuted, executor.executed.size());
    BOOST_CHECK_EQUAL(session->invocations, invocations);

    return executor.executed;
}

std::vector<std::string>
importStaggered(const std::string & filename, uint64_t linesPerSession,
                SessionStore & store, int & invocations)
{
    return importStaggered(filename, testConfig(linesPerSession), store,
                           invocations);
}

void checkStatements(const std::vector<std::string> & got,
                     const std::vector<std::string> & expected)
{
    BOOST_REQUIRE_EQUAL(got.size(), expected.size());
    for (size_t i = 0;  i < got.size();  ++i)
        BOOST_CHECK_EQUAL(got[i], expected[i]);
}

void checkStaggeredMatchesUnbounded(const std::string & filename)
{
    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    InvocationResult result = orchestrator.runToCompletion(filename);
    BOOST_CHECK(result.statistics.finished);
    BOOST_CHECK_EQUAL(result.statistics.queriesDone, EXPECTED.size());
    checkStatements(executor.executed, EXPECTED);

    for (uint64_t budget: { 1, 2, 3, 4, 5, 7, 11, 100 }) {
        BOOST_TEST_CONTEXT("lines per session " << budget) {
            InMemorySessionStore store;
            int invocations = 0;
            checkStatements(importStaggered(filename, budget, store,
                                            invocations),
                            EXPECTED);
            if (budget < 18)
                BOOST_CHECK_GT(invocations, 1);
        }
    }
}

/** Every budget executes the same statements as one unbounded run. */
std::vector<std::string>
checkEveryBudgetMatches(const std::string & filename, ImportConfig config,
                        uint64_t totalLines)
{
    RecordingExecutor executor;
    config.linesPerSession = 0;
    ImportOrchestrator orchestrator(config, executor);
    orchestrator.runToCompletion(filename);

    for (uint64_t budget: { 1, 2, 3, 5 }) {
        BOOST_TEST_CONTEXT("lines per session " << budget) {
            config.linesPerSession = budget;
            InMemorySessionStore store;
            int invocations = 0;
            checkStatements(importStaggered(filename, config, store,
                                            invocations, totalLines),
                            executor.executed);
            BOOST_CHECK_GT(invocations, 1);
        }
    }

    return executor.executed;
}

} // file scope

BOOST_AUTO_TEST_CASE(test_staggered_matches_unbounded)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);
    checkStaggeredMatchesUnbounded(filename);
}

BOOST_AUTO_TEST_CASE(test_interleaved_prefixes_are_staggered)
{
    TempDir dir;
    std::string filename = dir.file("interleaved.sql");
    std::string dump;
    for (int i = 1;  i <= 6;  ++i) {
        dump += "INSERT INTO a VALUES (" + std::to_string(i) + ");\n";
        dump += "INSERT INTO b VALUES (" + std::to_string(i) + ");\n";
    }
    writeFile(filename, dump);

    auto executed = checkEveryBudgetMatches(filename, testConfig(), 12);
    BOOST_REQUIRE_EQUAL(executed.size(), 12);
    BOOST_CHECK_EQUAL(executed[0], "INSERT INTO a VALUES (1);");
    BOOST_CHECK_EQUAL(executed[11], "INSERT INTO b VALUES (6);");

    // Each invocation stops once the batch it started with is complete
    InMemorySessionStore store;
    int invocations = 0;
    importStaggered(filename, testConfig(1), store, invocations, 12);
    BOOST_CHECK_GE(invocations, 12);
}

BOOST_AUTO_TEST_CASE(test_statements_sharing_a_line_are_staggered)
{
    TempDir dir;
    std::string filename = dir.file("shared.sql");
    std::string dump;
    for (int i = 1;  i <= 6;  ++i) {
        dump += "INSERT INTO a VALUES (" + std::to_string(i) + "); "
            + "INSERT INTO b VALUES (" + std::to_string(i) + ");\n";
    }
    dump += "CREATE TABLE c (id int); CREATE TABLE d (id int);\n";
    writeFile(filename, dump);

    auto executed = checkEveryBudgetMatches(filename, testConfig(), 7);
    BOOST_CHECK_EQUAL(executed.size(), 14);

    // Pausing between the two statements of a line resumes after the first
    InMemorySessionStore store;
    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(1), executor);
    orchestrator.runInvocation(store, filename);
    auto session = store.load(filename);
    BOOST_REQUIRE(session);
    BOOST_CHECK_EQUAL(session->currentLine, 0);
    BOOST_CHECK_EQUAL(session->lineStatementsDone, 1);
    checkStatements(executor.executed, { "INSERT INTO a VALUES (1);" });
}

BOOST_AUTO_TEST_CASE(test_batch_size_one)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    ImportConfig config = testConfig();
    config.insertBatchSize = 1;
    auto executed = checkEveryBudgetMatches(filename, config, 18);
    BOOST_CHECK_EQUAL(executed.size(), 15);
}

BOOST_AUTO_TEST_CASE(test_staggered_gzip)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql.gz");
    writeFile(filename, DUMP);
    checkStaggeredMatchesUnbounded(filename);
}

BOOST_AUTO_TEST_CASE(test_staggered_bzip2)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql.bz2");
    if (!canWrite(filename)) {
        BOOST_TEST_MESSAGE("bzip2 support not built; skipping");
        return;
    }
    writeFile(filename, DUMP);
    checkStaggeredMatchesUnbounded(filename);
}

BOOST_AUTO_TEST_CASE(test_sessions_survive_json_store)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    JsonFileSessionStore store(dir.file("sessions.json"));
    int invocations = 0;
    checkStatements(importStaggered(filename, 2, store, invocations), EXPECTED);
    BOOST_CHECK_GE(invocations, 5);
}

BOOST_AUTO_TEST_CASE(test_failed_statement_is_retried)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    RecordingExecutor executor;
    executor.failOn = "CREATE TABLE u";
    executor.failures = 1;
    executor.failMessage = "Table 'u' already exists";
    executor.failCode = ER_TABLE_EXISTS_ERROR;

    ImportOrchestrator orchestrator(testConfig(), executor);
    ImportSession session(filename);

    InvocationResult first = orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.failed());
    BOOST_CHECK(!first.statistics.finished);
    BOOST_REQUIRE(session.error);
    BOOST_CHECK(session.error->kind == ImportErrorKind::EXECUTION);
    BOOST_CHECK_EQUAL(session.error->line, 10);
    BOOST_CHECK_EQUAL(session.error->statement, "CREATE TABLE u (\n  name text\n)");
    BOOST_CHECK(session.error->targetExists);
    BOOST_CHECK_EQUAL(session.error->targetTable, "u");
    BOOST_CHECK(first.statistics.error.find("SQL Error at line 10:") == 0);

    // Resume point is the start of the line that completed the statement
    BOOST_CHECK_EQUAL(session.currentLine, 11);
    BOOST_CHECK_EQUAL(session.totalStatementsExecuted, 4);

    InvocationResult second = orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.finished());
    BOOST_CHECK(!session.error);
    BOOST_CHECK(second.statistics.finished);
    BOOST_CHECK_EQUAL(session.totalStatementsExecuted, EXPECTED.size());
    checkStatements(executor.executed, EXPECTED);
}

BOOST_AUTO_TEST_CASE(test_failure_in_middle_of_line_is_not_repeated)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename,
              "CREATE TABLE a (id int); CREATE TABLE b (id int);\n"
              "SELECT 1;\n");

    RecordingExecutor executor;
    executor.failOn = "CREATE TABLE b";
    executor.failures = 1;

    JsonFileSessionStore store(dir.file("sessions.json"));
    ImportOrchestrator orchestrator(testConfig(), executor);

    InvocationResult first = orchestrator.runInvocation(store, filename);
    BOOST_REQUIRE(first.session.failed());
    BOOST_CHECK_EQUAL(first.session.error->line, 1);
    BOOST_CHECK_EQUAL(first.session.currentLine, 0);
    BOOST_CHECK_EQUAL(first.session.lineStatementsDone, 1);
    BOOST_CHECK_EQUAL(store.load(filename)->lineStatementsDone, 1);

    InvocationResult second = orchestrator.runInvocation(store, filename);
    BOOST_CHECK(second.session.finished());
    BOOST_CHECK_EQUAL(second.session.totalStatementsExecuted, 3);
    checkStatements(executor.executed, {
            "CREATE TABLE a (id int)",
            "CREATE TABLE b (id int)",
            "SELECT 1" });
}

BOOST_AUTO_TEST_CASE(test_failed_batch_is_read_again)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    RecordingExecutor executor;
    executor.failOn = "(4), (5), (6)";
    executor.failures = 1;

    ImportOrchestrator orchestrator(testConfig(), executor);
    ImportSession session(filename);

    orchestrator.run(session, 0, 0);
    BOOST_REQUIRE(session.failed());
    BOOST_CHECK_EQUAL(session.error->line, 6);
    BOOST_CHECK(!session.error->targetExists);
    BOOST_CHECK_EQUAL(session.currentLine, 5);

    orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.finished());
    checkStatements(executor.executed, EXPECTED);
}

BOOST_AUTO_TEST_CASE(test_run_to_completion_throws)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    RecordingExecutor executor;
    executor.failOn = "DROP TABLE";
    executor.failures = 1000;
    executor.failMessage = "Unknown table 'x'";
    executor.failCode = 1051;

    ImportOrchestrator orchestrator(testConfig(), executor);
    try {
        orchestrator.runToCompletion(filename);
        BOOST_ERROR("expected a statement execution error");
    } catch (const StatementExecutionError & exc) {
        BOOST_CHECK_EQUAL(exc.line, 18);
        BOOST_CHECK_EQUAL(exc.statement, "DROP TABLE x");
        BOOST_CHECK_EQUAL(exc.errorCode, 1051);
        BOOST_CHECK(!exc.targetExists);
    }
}

BOOST_AUTO_TEST_CASE(test_unterminated_string_is_parse_error)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\nINSERT INTO t VALUES ('oops);\n");

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    ImportSession session(filename);
    orchestrator.run(session, 0, 0);

    BOOST_CHECK(session.failed());
    BOOST_REQUIRE(session.error);
    BOOST_CHECK(session.error->kind == ImportErrorKind::PARSE);
    BOOST_CHECK(session.error->message.find("string literal") != string::npos);
    BOOST_REQUIRE_EQUAL(executor.executed.size(), 1);

    RecordingExecutor again;
    ImportOrchestrator other(testConfig(), again);
    BOOST_CHECK_THROW(other.runToCompletion(filename), Exception);
}

BOOST_AUTO_TEST_CASE(test_oversized_statement_is_parse_error)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\nSELECT 'a\nb\nc\nd\n';\n");

    ImportConfig config = testConfig();
    config.maxQueryLines = 3;

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(config, executor);
    ImportSession session(filename);
    orchestrator.run(session, 0, 0);

    BOOST_REQUIRE(session.failed());
    BOOST_CHECK(session.error->kind == ImportErrorKind::PARSE);
    BOOST_CHECK(session.error->message.find("longer than 3 lines") != string::npos);
}

BOOST_AUTO_TEST_CASE(test_trailing_garbage_is_discarded)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\n) garbage");

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    ImportSession session(filename);
    orchestrator.run(session, 0, 0);

    BOOST_CHECK(session.finished());
    checkStatements(executor.executed, { "SELECT 1" });
}

BOOST_AUTO_TEST_CASE(test_restored_garbage_is_discarded)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\nSELECT 2;\n");

    ImportSession session(filename);
    session.status = ImportStatus::RUNNING;
    session.currentLine = 1;
    session.currentOffset = 10;
    session.parser.pending = "xyz ('";
    session.parser.inString = true;
    session.parser.activeQuote = '\'';
    session.parser.pendingLines = 1;

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    orchestrator.run(session, 0, 0);

    BOOST_CHECK(session.finished());
    checkStatements(executor.executed, { "SELECT 2" });
}

BOOST_AUTO_TEST_CASE(test_stop_request)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    std::string dump;
    for (int i = 1;  i <= 10;  ++i)
        dump += "INSERT INTO t VALUES (" + std::to_string(i) + ");\n";
    writeFile(filename, dump);

    ImportConfig config = testConfig();
    config.insertBatchSize = 4;

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(config, executor);

    std::vector<uint64_t> lines;
    orchestrator.setProgress([&] (const ImportProgress & progress)
                             {
                                 lines.push_back(progress.line);
                                 if (progress.line == 3)
                                     orchestrator.requestStop();
                             },
                             0.0);

    ImportSession session(filename);
    orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.status == ImportStatus::STOPPED);
    BOOST_CHECK_EQUAL(session.currentLine, 3);
    BOOST_CHECK(!orchestrator.stopRequested());
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[2], 3);

    orchestrator.setProgress(nullptr, 0.0);
    orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.finished());
    BOOST_CHECK_EQUAL(session.invocations, 2);

    checkStatements(executor.executed, {
            "INSERT INTO t VALUES (1), (2), (3);",
            "INSERT INTO t VALUES (4), (5), (6), (7);",
            "INSERT INTO t VALUES (8), (9), (10);" });
}

BOOST_AUTO_TEST_CASE(test_missing_file_is_io_error)
{
    TempDir dir;
    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);

    ImportSession session(dir.file("missing.sql"));
    InvocationResult result = orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.failed());
    BOOST_REQUIRE(session.error);
    BOOST_CHECK(session.error->kind == ImportErrorKind::IO);
    BOOST_CHECK(!result.statistics.error.empty());
    BOOST_CHECK(executor.executed.empty());
}

BOOST_AUTO_TEST_CASE(test_finished_session_is_left_alone)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\n");

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    ImportSession session(filename);
    orchestrator.run(session, 0, 0);
    BOOST_REQUIRE(session.finished());

    InvocationResult again = orchestrator.run(session, 0, 0);
    BOOST_CHECK(again.statistics.finished);
    BOOST_CHECK_EQUAL(again.statistics.linesThisInvocation, 0);
    BOOST_CHECK_EQUAL(session.invocations, 1);
    BOOST_CHECK_EQUAL(executor.executed.size(), 1);

    Json::Value json = again.toJson();
    BOOST_CHECK(json["statistics"]["finished"].asBool());
    BOOST_CHECK_EQUAL(json["session"]["status"].asString(), "finished");
}

BOOST_AUTO_TEST_CASE(test_tuner_sets_line_budget)
{
    struct QuietMachine: public MemoryProbe {
        virtual MemoryReading read() override
        {
            MemoryReading result;
            result.processUsage = 10 * 1024 * 1024;
            result.totalRam = 8ULL * 1024 * 1024 * 1024;
            result.availableRam = 4ULL * 1024 * 1024 * 1024;
            return result;
        }
    };

    TempDir dir;
    std::string filename = dir.file("dump.sql");
    std::string dump;
    for (int i = 1;  i <= 10;  ++i)
        dump += "SELECT " + std::to_string(i) + ";\n";
    writeFile(filename, dump);

    AutoTunerOptions options;
    options.forcedBatchSize = 3;
    auto tuner = std::make_shared<AutoTuner>(options,
                                             std::make_shared<QuietMachine>());

    RecordingExecutor executor;
    ImportOrchestrator orchestrator(ImportConfig(), executor, tuner);

    ImportSession session(filename);
    InvocationResult result = orchestrator.run(session);
    BOOST_CHECK_EQUAL(session.batchSize, 3);
    BOOST_CHECK_EQUAL(result.statistics.linesThisInvocation, 3);
    BOOST_CHECK_EQUAL(session.currentLine, 3);
    BOOST_CHECK(session.status == ImportStatus::RUNNING);
    BOOST_CHECK_EQUAL(session.memoryUsage, 10 * 1024 * 1024);
    BOOST_REQUIRE(session.fileAnalysis);
    BOOST_CHECK(session.fileAnalysis->category == SizeCategory::TINY);
    BOOST_CHECK_EQUAL(tuner->compressionType(), "none");

    while (!session.finished())
        orchestrator.run(session);
    BOOST_CHECK_EQUAL(executor.executed.size(), 10);
    BOOST_CHECK_EQUAL(session.invocations, 4);
}

BOOST_AUTO_TEST_CASE(test_sql_file_writer)
{
    TempDir dir;
    std::string output = dir.file("out.sql");

    {
        SqlFileWriter writer(output);
        BOOST_CHECK_EQUAL(writer.compression(), "none");
        BOOST_CHECK(writer.execute("SELECT 1").success);
        BOOST_CHECK(writer.execute("  SELECT 2;  ").success);
        BOOST_CHECK(writer.execute("   ").success);
        writer.finish();
        BOOST_CHECK_EQUAL(writer.statementsWritten(), 2);
        BOOST_CHECK_EQUAL(writer.bytesWritten(), 20);
    }
    BOOST_CHECK_EQUAL(readFile(output), "SELECT 1;\nSELECT 2;\n");

    BOOST_CHECK_THROW(SqlFileWriter writer(output), Exception);

    {
        SqlFileWriter writer(output, true /* overwrite */);
        writer.execute("SELECT 3");
        writer.abandon();
    }
    BOOST_CHECK(!std::filesystem::exists(output));
}

BOOST_AUTO_TEST_CASE(test_sql_file_writer_line_comments)
{
    TempDir dir;
    std::string output = dir.file("out.sql");

    {
        SqlFileWriter writer(output);
        writer.execute("INSERT INTO t VALUES (1) -- one");
        writer.execute("SELECT 2 # two;");
        writer.execute("SELECT '-- 3'");
        writer.finish();
    }
    BOOST_CHECK_EQUAL(readFile(output),
                      "INSERT INTO t VALUES (1) -- one\n;\n"
                      "SELECT 2 # two;\n;\n"
                      "SELECT '-- 3';\n");

    // The output reads back as the same three statements
    RecordingExecutor executor;
    ImportOrchestrator orchestrator(testConfig(), executor);
    orchestrator.runToCompletion(output);
    BOOST_CHECK_EQUAL(executor.executed.size(), 3);
}

BOOST_AUTO_TEST_CASE(test_optimize_into_compressed_file)
{
    TempDir dir;
    std::string input = dir.file("dump.sql");
    std::string output = dir.file("optimized.sql.gz");
    writeFile(input, DUMP);

    ImportConfig config = testConfig();
    SqlFileWriter writer(output);
    BOOST_CHECK_EQUAL(writer.compression(), "gzip");
    ImportOrchestrator orchestrator(config, writer);
    orchestrator.runToCompletion(input);
    writer.finish();

    // Importing the optimized output passes the merged INSERTs through
    RecordingExecutor executor;
    ImportOrchestrator reimport(config, executor);
    reimport.runToCompletion(output);

    checkStatements(executor.executed, {
            "CREATE TABLE t (id int)",
            "INSERT INTO t VALUES (1), (2), (3)",
            "INSERT INTO t VALUES (4), (5), (6)",
            "INSERT INTO t VALUES (7);",
            "CREATE TABLE u (\n  name text\n)",
            "INSERT INTO u VALUES ('multi\nline; text'), ('x'), ('y')",
            "INSERT INTO t VALUES (8),(9)",
            "INSERT INTO t VALUES (10);",
            "DROP TABLE x" });
}

BOOST_AUTO_TEST_CASE(test_pre_queries_run_every_invocation)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\nSELECT 2;\nSELECT 3;\nSELECT 4;\n");

    ImportConfig config = testConfig(2);
    config.preQueries = { "SET FOREIGN_KEY_CHECKS=0" };

    InMemorySessionStore store;
    RecordingExecutor executor;
    InvocationResult result;
    do {
        ImportOrchestrator orchestrator(config, executor);
        result = orchestrator.runInvocation(store, filename);
        BOOST_REQUIRE(!result.session.failed());
    } while (!result.statistics.finished);

    BOOST_CHECK_EQUAL(result.session.invocations, 3);
    BOOST_CHECK_EQUAL(result.session.totalStatementsExecuted, 4);
    checkStatements(executor.executed, {
            "SET FOREIGN_KEY_CHECKS=0", "SELECT 1", "SELECT 2",
            "SET FOREIGN_KEY_CHECKS=0", "SELECT 3", "SELECT 4",
            "SET FOREIGN_KEY_CHECKS=0" });
}

BOOST_AUTO_TEST_CASE(test_failed_pre_query_keeps_position)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, "SELECT 1;\nSELECT 2;\n");

    ImportConfig config = testConfig();
    config.preQueries = { "SET sql_mode=''" };

    RecordingExecutor executor;
    executor.failOn = "SET sql_mode";
    executor.failures = 1;

    ImportOrchestrator orchestrator(config, executor);
    ImportSession session(filename);
    orchestrator.run(session, 0, 0);
    BOOST_REQUIRE(session.failed());
    BOOST_CHECK(session.error->kind == ImportErrorKind::EXECUTION);
    BOOST_CHECK_EQUAL(session.error->statement, "SET sql_mode=''");
    BOOST_CHECK(session.error->message.find("pre-query failed") == 0);
    BOOST_CHECK_EQUAL(session.currentLine, 0);
    BOOST_CHECK(executor.executed.empty());

    orchestrator.run(session, 0, 0);
    BOOST_CHECK(session.finished());
    checkStatements(executor.executed,
                    { "SET sql_mode=''", "SELECT 1", "SELECT 2" });
}

BOOST_AUTO_TEST_CASE(test_test_mode_executes_nothing)
{
    TempDir dir;
    std::string filename = dir.file("dump.sql");
    writeFile(filename, DUMP);

    ImportConfig config = testConfig();
    config.testMode = true;
    config.preQueries = { "SET FOREIGN_KEY_CHECKS=0" };

    RecordingExecutor executor;
    executor.failOn = "DROP TABLE";
    executor.failures = 1000;

    ImportOrchestrator orchestrator(config, executor);
    InvocationResult result = orchestrator.runToCompletion(filename);
    BOOST_CHECK(result.statistics.finished);
    BOOST_CHECK_EQUAL(result.statistics.queriesDone, EXPECTED.size());
    BOOST_CHECK_EQUAL(result.statistics.linesDone, 18);
    BOOST_CHECK(executor.executed.empty());
    BOOST_CHECK_EQUAL(executor.failures, 1000);
}

BOOST_AUTO_TEST_CASE(test_csv_import)
{
    const std::string rows
        = "1,Alice\n"
          "# exported rows\n"
          "\n"
          "2,\"O'Brien, Pat\"\n"
          "3,Carol\n"
          "4,Dan\n";

    const std::vector<std::string> expected = {
        "DELETE FROM `people`",
        "INSERT INTO `people` VALUES ('1','Alice'), "
        "('2','O\\'Brien, Pat'), ('3','Carol');",
        "INSERT INTO `people` VALUES ('4','Dan');"
    };

    ImportConfig config = testConfig();
    config.csvInsertTable = "people";
    config.csvPreemptyTable = true;

    TempDir dir;
    for (std::string name: { "people.csv", "people.CSV.gz" }) {
        BOOST_TEST_CONTEXT(name) {
            std::string filename = dir.file(name);
            writeFile(filename, rows);

            RecordingExecutor executor;
            ImportOrchestrator orchestrator(config, executor);
            orchestrator.runToCompletion(filename);
            checkStatements(executor.executed, expected);

            // The table is only emptied by the first invocation
            config.linesPerSession = 2;
            InMemorySessionStore store;
            int invocations = 0;
            checkStatements(importStaggered(filename, config, store,
                                            invocations, 6),
                            expected);
            BOOST_CHECK_GT(invocations, 1);
            config.linesPerSession = 0;
        }
    }
}

BOOST_AUTO_TEST_CASE(test_csv_errors)
{
    TempDir dir;
    std::string filename = dir.file("people.csv");
    writeFile(filename, "1,Alice\n2,\"unclosed\n");

    RecordingExecutor executor;
    {
        ImportOrchestrator orchestrator(testConfig(), executor);
        ImportSession session(filename);
        orchestrator.run(session, 0, 0);
        BOOST_REQUIRE(session.failed());
        BOOST_CHECK(session.error->message.find("csv_insert_table")
                    != string::npos);
    }

    ImportConfig config = testConfig();
    config.csvInsertTable = "people";
    {
        ImportOrchestrator orchestrator(config, executor);
        ImportSession session(filename);
        orchestrator.run(session, 0, 0);
        BOOST_REQUIRE(session.failed());
        BOOST_CHECK(session.error->kind == ImportErrorKind::PARSE);
        BOOST_CHECK_EQUAL(session.error->line, 2);
        BOOST_CHECK_EQUAL(session.currentLine, 1);
    }

    // The row read before the error is not lost
    checkStatements(executor.executed,
                    { "INSERT INTO `people` VALUES ('1','Alice');" });
}
