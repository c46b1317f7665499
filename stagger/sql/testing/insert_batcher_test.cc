/* insert_batcher_test.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Test of the rewriting of single-row INSERTs into multi-row INSERTs.
*/

#define BOOST_TEST_MAIN
#define BOOST_TEST_DYN_LINK

#include "stagger/sql/insert_batcher.h"
#include <boost/test/unit_test.hpp>
#include <json/json.h>

using namespace std;
using namespace STAGGER;

namespace {

InsertBatcherOptions withBatchSize(size_t batchSize)
{
    InsertBatcherOptions result;
    result.batchSize = batchSize;
    return result;
}

} // file scope

BOOST_AUTO_TEST_CASE(test_rows_are_merged)
{
    InsertBatcher batcher(withBatchSize(10));

    for (int i = 1;  i <= 3;  ++i) {
        auto r = batcher.process("INSERT INTO t VALUES ("
                                 + std::to_string(i) + ");");
        BOOST_CHECK(r.wasBatched);
        BOOST_CHECK(r.statements.empty());
    }

    BOOST_CHECK_EQUAL(batcher.bufferedRows(), 3);
    BOOST_CHECK_EQUAL(batcher.currentPrefix(), "INSERT INTO t VALUES");

    auto flushed = batcher.flush();
    BOOST_REQUIRE_EQUAL(flushed.statements.size(), 1);
    BOOST_CHECK_EQUAL(flushed.statements[0],
                      "INSERT INTO t VALUES (1), (2), (3);");
    BOOST_CHECK(batcher.empty());
    BOOST_CHECK(batcher.flush().statements.empty());
}

BOOST_AUTO_TEST_CASE(test_batch_size_emits_full_batches)
{
    InsertBatcher batcher(withBatchSize(2));

    BOOST_CHECK(batcher.process("INSERT INTO t VALUES (1)").statements.empty());
    auto r = batcher.process("INSERT INTO t VALUES (2)");
    BOOST_CHECK(r.wasBatched);
    BOOST_REQUIRE_EQUAL(r.statements.size(), 1);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1), (2);");

    batcher.process("INSERT INTO t VALUES (3)");
    batcher.process("INSERT INTO t VALUES (4)");

    auto stats = batcher.getStatistics();
    BOOST_CHECK_EQUAL(stats.rowsBatched, 4);
    BOOST_CHECK_EQUAL(stats.statementsEmitted, 2);
    BOOST_CHECK_EQUAL(stats.bytesProcessed, 12);
    BOOST_CHECK_EQUAL(stats.reductionRatio, 2.0);
    BOOST_CHECK_EQUAL(stats.efficiency, 0.5);
    BOOST_CHECK_EQUAL(stats.avgRowSize, 3);

    Json::Value json = stats.toJson();
    BOOST_CHECK_EQUAL(json["rowsBatched"].asUInt64(), 4);
    BOOST_CHECK_EQUAL(json["statementsEmitted"].asUInt64(), 2);
}

BOOST_AUTO_TEST_CASE(test_other_statements_flush_first)
{
    InsertBatcher batcher(withBatchSize(100));

    batcher.process("INSERT INTO t VALUES (1)");
    batcher.process("INSERT INTO t VALUES (2)");

    auto r = batcher.process("UPDATE t SET a = 1");
    BOOST_CHECK(!r.wasBatched);
    BOOST_REQUIRE_EQUAL(r.statements.size(), 2);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1), (2);");
    BOOST_CHECK_EQUAL(r.statements[1], "UPDATE t SET a = 1");

    // Nothing open: passed through alone
    auto r2 = batcher.process("DROP TABLE u");
    BOOST_REQUIRE_EQUAL(r2.statements.size(), 1);
    BOOST_CHECK_EQUAL(r2.statements[0], "DROP TABLE u");

    BOOST_CHECK_EQUAL(batcher.getStatistics().passthroughCount, 2);
}

BOOST_AUTO_TEST_CASE(test_prefix_change_starts_new_batch)
{
    InsertBatcher batcher(withBatchSize(100));

    batcher.process("INSERT INTO t VALUES (1)");
    auto r = batcher.process("INSERT INTO u VALUES (2)");
    BOOST_CHECK(r.wasBatched);
    BOOST_REQUIRE_EQUAL(r.statements.size(), 1);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1);");

    // INSERT IGNORE is never merged with a plain INSERT
    auto r2 = batcher.process("INSERT IGNORE INTO u VALUES (3)");
    BOOST_REQUIRE_EQUAL(r2.statements.size(), 1);
    BOOST_CHECK_EQUAL(r2.statements[0], "INSERT INTO u VALUES (2);");

    auto r3 = batcher.flush();
    BOOST_REQUIRE_EQUAL(r3.statements.size(), 1);
    BOOST_CHECK_EQUAL(r3.statements[0], "INSERT IGNORE INTO u VALUES (3);");
}

BOOST_AUTO_TEST_CASE(test_extended_and_unsplittable_pass_through)
{
    InsertBatcher batcher(withBatchSize(100));

    batcher.process("INSERT INTO t VALUES (1)");

    auto r = batcher.process("INSERT INTO t VALUES (2),(3)");
    BOOST_CHECK(!r.wasBatched);
    BOOST_REQUIRE_EQUAL(r.statements.size(), 2);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1);");
    BOOST_CHECK_EQUAL(r.statements[1], "INSERT INTO t VALUES (2),(3)");

    auto r2 = batcher.process
        ("INSERT INTO t VALUES (4) ON DUPLICATE KEY UPDATE a = 1");
    BOOST_CHECK(!r2.wasBatched);
    BOOST_REQUIRE_EQUAL(r2.statements.size(), 1);

    auto stats = batcher.getStatistics();
    BOOST_CHECK_EQUAL(stats.extendedInsertCount, 1);
    BOOST_CHECK_EQUAL(stats.passthroughCount, 1);
    BOOST_CHECK_EQUAL(stats.rowsBatched, 1);
}

BOOST_AUTO_TEST_CASE(test_inline_comment_is_not_merged)
{
    InsertBatcher batcher(withBatchSize(100));

    auto r1 = batcher.process("INSERT INTO t VALUES (1) -- note (x)");
    BOOST_CHECK(!r1.wasBatched);
    BOOST_REQUIRE_EQUAL(r1.statements.size(), 1);
    BOOST_CHECK_EQUAL(r1.statements[0], "INSERT INTO t VALUES (1) -- note (x)");

    batcher.process("INSERT INTO t VALUES (2)");
    batcher.process("INSERT INTO t VALUES (3)");

    // A commented row flushes the rows before it and stays on its own
    auto r2 = batcher.process("INSERT INTO t VALUES (4) # (5)");
    BOOST_REQUIRE_EQUAL(r2.statements.size(), 2);
    BOOST_CHECK_EQUAL(r2.statements[0], "INSERT INTO t VALUES (2), (3);");
    BOOST_CHECK_EQUAL(r2.statements[1], "INSERT INTO t VALUES (4) # (5)");

    BOOST_CHECK(batcher.flush().statements.empty());
    BOOST_CHECK_EQUAL(batcher.getStatistics().rowsBatched, 2);
    BOOST_CHECK_EQUAL(batcher.getStatistics().passthroughCount, 2);
}

BOOST_AUTO_TEST_CASE(test_disabled_passes_everything)
{
    InsertBatcherOptions options;
    options.enabled = false;
    InsertBatcher batcher(options);

    auto r = batcher.process("  INSERT INTO t VALUES (1)  ");
    BOOST_CHECK(!r.wasBatched);
    BOOST_REQUIRE_EQUAL(r.statements.size(), 1);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1)");
    BOOST_CHECK(batcher.empty());

    auto stats = batcher.getStatistics();
    BOOST_CHECK(!stats.enabled);
    BOOST_CHECK_EQUAL(stats.passthroughCount, 1);
    BOOST_CHECK_EQUAL(stats.reductionRatio, 0.0);
}

BOOST_AUTO_TEST_CASE(test_byte_limit_caps_rows_per_statement)
{
    InsertBatcherOptions options;
    options.batchSize = 1000;
    options.maxBatchBytes = 12;
    InsertBatcher batcher(options);

    BOOST_CHECK(batcher.process("INSERT INTO t VALUES (1)").statements.empty());
    auto r = batcher.process("INSERT INTO t VALUES (2)");
    BOOST_REQUIRE_EQUAL(r.statements.size(), 1);
    BOOST_CHECK_EQUAL(r.statements[0], "INSERT INTO t VALUES (1), (2);");

    BOOST_CHECK_EQUAL(batcher.averageRowSize(), 3);
    BOOST_CHECK_EQUAL(batcher.effectiveBatchSize(), 2);
    BOOST_CHECK_EQUAL(batcher.getStatistics().effectiveBatchSize, 2);
}

BOOST_AUTO_TEST_CASE(test_discard_undoes_open_batch)
{
    InsertBatcher batcher(withBatchSize(100));
    batcher.process("INSERT INTO t VALUES (1)");
    batcher.process("INSERT INTO t VALUES (22)");
    BOOST_CHECK_EQUAL(batcher.bufferedRows(), 2);

    batcher.discard();
    BOOST_CHECK(batcher.empty());
    BOOST_CHECK_EQUAL(batcher.bufferedBytes(), 0);
    BOOST_CHECK(batcher.flush().statements.empty());

    auto stats = batcher.getStatistics();
    BOOST_CHECK_EQUAL(stats.rowsBatched, 0);
    BOOST_CHECK_EQUAL(stats.bytesProcessed, 0);

    // The row size sample is kept
    BOOST_CHECK_EQUAL(batcher.exportSample().count, 2);
}

BOOST_AUTO_TEST_CASE(test_row_size_sample_restore)
{
    InsertBatcherOptions options;
    options.batchSize = 1000;
    options.maxBatchBytes = 10000;

    InsertBatcher batcher(options);
    BOOST_CHECK_EQUAL(batcher.effectiveBatchSize(), 1000);

    RowSizeSample sample;
    sample.count = InsertBatcher::ROW_SIZE_SAMPLE_LIMIT;
    sample.totalBytes = sample.count * 1000;
    batcher.restoreSample(sample);

    BOOST_CHECK_EQUAL(batcher.averageRowSize(), 1000);
    BOOST_CHECK_EQUAL(batcher.effectiveBatchSize(), 9);

    // A full sample is not extended by further rows
    batcher.process("INSERT INTO t VALUES (1)");
    BOOST_CHECK(batcher.exportSample() == sample);

    batcher.setBatchSize(0);
    BOOST_CHECK_EQUAL(batcher.options().batchSize, 1);
}
