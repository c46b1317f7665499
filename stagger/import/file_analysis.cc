/* file_analysis.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   File size categories and the serialized form of an analysis result.
*/

#include "file_analysis.h"
#include <json/json.h>
#include <cmath>


using namespace std;


namespace STAGGER {

namespace {

constexpr uint64_t MB = 1024 * 1024;

const SizeCategoryInfo categories[] = {
    { SizeCategory::TINY,    "tiny",    "Tiny (<10MB)",    10 * MB,   0.15 },
    { SizeCategory::SMALL,   "small",   "Small (<50MB)",   50 * MB,   0.20 },
    { SizeCategory::MEDIUM,  "medium",  "Medium (<500MB)", 500 * MB,  0.40 },
    { SizeCategory::LARGE,   "large",   "Large (<2GB)",    2048 * MB, 0.60 },
    { SizeCategory::MASSIVE, "massive", "Massive (2GB+)",  UINT64_MAX, 0.75 },
};

} // file scope

const SizeCategoryInfo & getCategoryInfo(SizeCategory category)
{
    for (auto & info: categories) {
        if (info.category == category)
            return info;
    }
    return categories[2];
}

SizeCategory parseSizeCategory(const std::string & name)
{
    for (auto & info: categories) {
        if (name == info.name)
            return info.category;
    }
    return SizeCategory::MEDIUM;
}

SizeCategory categoryForSize(uint64_t fileSize, bool isCompressed)
{
    if (isCompressed || fileSize == 0)
        return SizeCategory::MEDIUM;

    for (auto & info: categories) {
        if (fileSize < info.maxBytes)
            return info.category;
    }
    return SizeCategory::MASSIVE;
}


/*****************************************************************************/
/* FILE ANALYSIS RESULT                                                      */
/*****************************************************************************/

FileAnalysisResult
FileAnalysisResult::
fromSize(uint64_t fileSize, bool isCompressed, double avgBytesPerLine,
         bool isBulkInsert)
{
    FileAnalysisResult result;
    const SizeCategoryInfo & info
        = getCategoryInfo(categoryForSize(fileSize, isCompressed));

    result.fileSize = fileSize;
    result.category = info.category;
    result.categoryLabel = info.label;
    if (avgBytesPerLine <= 0)
        avgBytesPerLine = 200.0;
    result.avgBytesPerLine = avgBytesPerLine;
    if (fileSize > 0 && !isCompressed)
        result.estimatedLines = std::ceil(fileSize / avgBytesPerLine);
    result.isBulkInsert = isBulkInsert;
    result.targetRamUsage = info.targetRamUsage;
    result.isGzip = isCompressed;
    result.isEstimate = isCompressed || fileSize == 0;
    return result;
}

Json::Value
FileAnalysisResult::
toJson() const
{
    Json::Value result;
    result["file_size"] = Json::UInt64(fileSize);
    result["category"] = getCategoryInfo(category).name;
    result["category_label"] = categoryLabel;
    if (estimatedLines)
        result["estimated_lines"] = Json::UInt64(*estimatedLines);
    else result["estimated_lines"] = Json::Value::null;
    result["avg_bytes_per_line"] = avgBytesPerLine;
    result["is_bulk_insert"] = isBulkInsert;
    result["target_ram_usage"] = targetRamUsage;
    result["is_gzip"] = isGzip;
    result["is_estimate"] = isEstimate;
    return result;
}

FileAnalysisResult
FileAnalysisResult::
fromJson(const Json::Value & value)
{
    FileAnalysisResult result;
    if (!value.isObject())
        return result;

    result.fileSize = value.get("file_size", Json::Value(Json::UInt64(0))).asUInt64();
    result.category = parseSizeCategory(value.get("category", "medium").asString());
    result.categoryLabel = value.get("category_label",
                                     getCategoryInfo(result.category).label)
        .asString();
    if (value.isMember("estimated_lines") && !value["estimated_lines"].isNull())
        result.estimatedLines = value["estimated_lines"].asUInt64();
    result.avgBytesPerLine = value.get("avg_bytes_per_line", 200.0).asDouble();
    result.isBulkInsert = value.get("is_bulk_insert", false).asBool();
    result.targetRamUsage = value.get("target_ram_usage", 0.40).asDouble();
    result.isGzip = value.get("is_gzip", false).asBool();
    result.isEstimate = value.get("is_estimate", true).asBool();
    return result;
}

} // namespace STAGGER
