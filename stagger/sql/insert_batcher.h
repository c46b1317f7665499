/* insert_batcher.h                                                -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Rewrites runs of single-row INSERT statements into multi-row INSERTs.
*/

#pragma once

#include "statement.h"
#include <string>
#include <vector>
#include <stdint.h>

namespace Json {
class Value;
}

namespace STAGGER {


/*****************************************************************************/
/* INSERT BATCHER OPTIONS                                                    */
/*****************************************************************************/

struct InsertBatcherOptions {
    size_t batchSize = 1000;                  ///< rows per statement
    size_t maxBatchBytes = 16 * 1024 * 1024;  ///< bytes of values per statement
    bool enabled = true;                      ///< false: pass everything through
};


/*****************************************************************************/
/* BATCH RESULT                                                              */
/*****************************************************************************/

struct BatchResult {
    /// Statements to execute now, in order
    std::vector<std::string> statements;

    /// The input statement was absorbed into the batch buffer
    bool wasBatched = false;
};


/*****************************************************************************/
/* INSERT BATCHER STATISTICS                                                 */
/*****************************************************************************/

struct InsertBatcherStatistics {
    bool enabled = true;
    uint64_t batchSize = 0;
    uint64_t maxBatchBytes = 0;
    uint64_t rowsBatched = 0;           ///< single-row INSERTs absorbed
    uint64_t statementsEmitted = 0;     ///< multi-row INSERTs produced
    uint64_t bytesProcessed = 0;        ///< bytes of value tuples absorbed
    uint64_t extendedInsertCount = 0;   ///< extended INSERTs passed through
    uint64_t passthroughCount = 0;      ///< other statements passed through
    double reductionRatio = 0.0;        ///< rowsBatched / statementsEmitted
    double efficiency = 0.0;            ///< 1 - statementsEmitted / rowsBatched
    uint64_t avgRowSize = 0;
    uint64_t effectiveBatchSize = 0;

    Json::Value toJson() const;
};


/*****************************************************************************/
/* ROW SIZE SAMPLE                                                           */
/*****************************************************************************/

/** The row size sample drives the effective batch size, so it is part of
    the state that must survive between invocations.
*/
struct RowSizeSample {
    uint64_t count = 0;
    uint64_t totalBytes = 0;

    bool operator == (const RowSizeSample & other) const
    {
        return count == other.count && totalBytes == other.totalBytes;
    }
};


/*****************************************************************************/
/* INSERT BATCHER                                                            */
/*****************************************************************************/

/** Merges consecutive single-row INSERTs that share a prefix
    ("INSERT [IGNORE] INTO t [(cols)] VALUES") into one statement.

    Other statements flush the open batch and are returned after it, so
    that the order of effects on any table is unchanged.  INSERTs that
    already carry several tuples are assumed to be sized well by the tool
    that wrote them and are passed through in the same way.

    The number of rows per statement is the smaller of the configured batch
    size and maxBatchBytes divided by the average row size, which is sampled
    over the first rows seen.

    Never throws on malformed input: anything that cannot be split is
    passed through untouched.
*/

struct InsertBatcher {

    static constexpr uint64_t ROW_SIZE_SAMPLE_LIMIT = 100;

    InsertBatcher(InsertBatcherOptions options = InsertBatcherOptions());

    BatchResult process(const ParsedStatement & statement);
    BatchResult process(const std::string & statement);

    /** Emit the open batch as one statement, if there is one. */
    BatchResult flush();

    /** Drop the open batch without emitting it, undoing its effect on the
        statistics.  Used when the rows it holds will be read again.
    */
    void discard();

    InsertBatcherStatistics getStatistics() const;

    size_t bufferedRows() const { return values.size(); }
    size_t bufferedBytes() const { return currentBytes; }
    bool empty() const { return values.empty(); }
    const std::string & currentPrefix() const { return prefix; }

    size_t effectiveBatchSize() const;
    uint64_t averageRowSize() const;

    RowSizeSample exportSample() const { return sample; }
    void restoreSample(const RowSizeSample & newSample) { sample = newSample; }

    void setBatchSize(size_t batchSize);
    void setMaxBatchBytes(size_t maxBatchBytes);

    const InsertBatcherOptions & options() const { return options_; }

private:
    BatchResult passThrough(const std::string & text);
    void flushInto(BatchResult & result);

    InsertBatcherOptions options_;

    std::string prefix;
    std::vector<std::string> values;
    size_t currentBytes = 0;

    RowSizeSample sample;

    uint64_t rowsBatched = 0;
    uint64_t statementsEmitted = 0;
    uint64_t bytesProcessed = 0;
    uint64_t extendedInsertCount = 0;
    uint64_t passthroughCount = 0;
};

} // namespace STAGGER
