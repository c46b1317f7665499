/* insert_batcher.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Rewrites runs of single-row INSERT statements into multi-row INSERTs.
*/

#include "insert_batcher.h"
#include "stagger/utils/log.h"
#include <boost/algorithm/string/trim.hpp>
#include <json/json.h>
#include <algorithm>
#include <cmath>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("insert_batcher");
    return result;
}

} // file scope


/*****************************************************************************/
/* INSERT BATCHER STATISTICS                                                 */
/*****************************************************************************/

Json::Value
InsertBatcherStatistics::
toJson() const
{
    Json::Value result;
    result["enabled"] = enabled;
    result["batchSize"] = Json::UInt64(batchSize);
    result["maxBatchBytes"] = Json::UInt64(maxBatchBytes);
    result["rowsBatched"] = Json::UInt64(rowsBatched);
    result["statementsEmitted"] = Json::UInt64(statementsEmitted);
    result["bytesProcessed"] = Json::UInt64(bytesProcessed);
    result["extendedInsertCount"] = Json::UInt64(extendedInsertCount);
    result["passthroughCount"] = Json::UInt64(passthroughCount);
    result["reductionRatio"] = reductionRatio;
    result["efficiency"] = efficiency;
    result["avgRowSize"] = Json::UInt64(avgRowSize);
    result["effectiveBatchSize"] = Json::UInt64(effectiveBatchSize);
    return result;
}


/*****************************************************************************/
/* INSERT BATCHER                                                            */
/*****************************************************************************/

InsertBatcher::
InsertBatcher(InsertBatcherOptions options)
    : options_(std::move(options))
{
    options_.batchSize = std::max<size_t>(1, options_.batchSize);
    options_.maxBatchBytes = std::max<size_t>(1, options_.maxBatchBytes);
}

void
InsertBatcher::
setBatchSize(size_t batchSize)
{
    options_.batchSize = std::max<size_t>(1, batchSize);
}

void
InsertBatcher::
setMaxBatchBytes(size_t maxBatchBytes)
{
    options_.maxBatchBytes = std::max<size_t>(1, maxBatchBytes);
}

uint64_t
InsertBatcher::
averageRowSize() const
{
    if (sample.count == 0)
        return 0;
    return std::llround((double)sample.totalBytes / sample.count);
}

size_t
InsertBatcher::
effectiveBatchSize() const
{
    uint64_t avg = averageRowSize();
    if (avg == 0)
        return options_.batchSize;

    // Each row after the first costs its bytes plus ", "
    uint64_t byteLimited = options_.maxBatchBytes / (avg + 2);
    return std::max<uint64_t>(1, std::min<uint64_t>(options_.batchSize,
                                                     byteLimited));
}

BatchResult
InsertBatcher::
process(const std::string & statement)
{
    return process(classifyStatement(boost::algorithm::trim_copy(statement)));
}

BatchResult
InsertBatcher::
passThrough(const std::string & text)
{
    BatchResult result;
    flushInto(result);
    result.statements.push_back(text);
    return result;
}

BatchResult
InsertBatcher::
process(const ParsedStatement & statement)
{
    if (!options_.enabled) {
        ++passthroughCount;
        return passThrough(statement.text);
    }

    if (statement.isExtendedInsert()) {
        ++extendedInsertCount;
        return passThrough(statement.text);
    }

    std::optional<InsertParts> parts;
    if (statement.isInsert())
        parts = splitSimpleInsert(statement.text);

    if (!parts) {
        ++passthroughCount;
        return passThrough(statement.text);
    }

    BatchResult result;
    result.wasBatched = true;

    size_t rowBytes = parts->values.size();

    if (sample.count < ROW_SIZE_SAMPLE_LIMIT) {
        sample.totalBytes += rowBytes;
        ++sample.count;
    }

    if (!values.empty()
        && (parts->prefix != prefix
            || currentBytes + rowBytes + 2 > options_.maxBatchBytes))
        flushInto(result);

    if (values.empty())
        prefix = std::move(parts->prefix);
    values.emplace_back(std::move(parts->values));
    currentBytes += rowBytes + 2;
    ++rowsBatched;
    bytesProcessed += rowBytes;

    if (values.size() >= effectiveBatchSize()
        || currentBytes >= options_.maxBatchBytes)
        flushInto(result);

    return result;
}

void
InsertBatcher::
flushInto(BatchResult & result)
{
    if (values.empty())
        return;

    std::string statement;
    statement.reserve(prefix.size() + currentBytes + 2);
    statement += prefix;
    statement += ' ';
    for (size_t i = 0;  i < values.size();  ++i) {
        if (i != 0)
            statement += ", ";
        statement += values[i];
    }
    statement += ';';

    TRACE_MSG(logger()) << "flushing " << values.size() << " rows, "
                        << statement.size() << " bytes for " << prefix;

    result.statements.emplace_back(std::move(statement));
    ++statementsEmitted;

    prefix.clear();
    values.clear();
    currentBytes = 0;
}

BatchResult
InsertBatcher::
flush()
{
    BatchResult result;
    flushInto(result);
    return result;
}

void
InsertBatcher::
discard()
{
    rowsBatched -= values.size();
    for (auto & v: values)
        bytesProcessed -= v.size();

    prefix.clear();
    values.clear();
    currentBytes = 0;
}

InsertBatcherStatistics
InsertBatcher::
getStatistics() const
{
    InsertBatcherStatistics result;
    result.enabled = options_.enabled;
    result.batchSize = options_.batchSize;
    result.maxBatchBytes = options_.maxBatchBytes;
    result.rowsBatched = rowsBatched;
    result.statementsEmitted = statementsEmitted;
    result.bytesProcessed = bytesProcessed;
    result.extendedInsertCount = extendedInsertCount;
    result.passthroughCount = passthroughCount;
    if (statementsEmitted > 0)
        result.reductionRatio = (double)rowsBatched / statementsEmitted;
    if (rowsBatched > 0 && statementsEmitted > 0)
        result.efficiency = 1.0 - (double)statementsEmitted / rowsBatched;
    result.avgRowSize = averageRowSize();
    result.effectiveBatchSize = effectiveBatchSize();
    return result;
}

} // namespace STAGGER
