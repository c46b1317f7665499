/* file_analysis.h                                                 -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Result of the file statistics pass that sizes up a dump before it is
   imported.  The pass itself lives outside of this library; the tuner and
   the orchestrator only read its result.
*/

#pragma once

#include <optional>
#include <string>
#include <stdint.h>

namespace Json {
class Value;
}

namespace STAGGER {


/*****************************************************************************/
/* SIZE CATEGORY                                                             */
/*****************************************************************************/

enum class SizeCategory {
    TINY,
    SMALL,
    MEDIUM,
    LARGE,
    MASSIVE
};

struct SizeCategoryInfo {
    SizeCategory category;
    const char * name;         ///< "tiny" ... "massive"
    const char * label;        ///< "Tiny (<10MB)" ...
    uint64_t maxBytes;         ///< exclusive upper bound on file size
    double targetRamUsage;     ///< fraction of RAM the import may use
};

const SizeCategoryInfo & getCategoryInfo(SizeCategory category);

/** Category from its name; medium for unknown names. */
SizeCategory parseSizeCategory(const std::string & name);

/** Category for a file of the given size.  Compressed files and files of
    unknown (zero) size are treated as medium since their real size is not
    known.
*/
SizeCategory categoryForSize(uint64_t fileSize, bool isCompressed);


/*****************************************************************************/
/* FILE ANALYSIS RESULT                                                      */
/*****************************************************************************/

struct FileAnalysisResult {
    uint64_t fileSize = 0;
    SizeCategory category = SizeCategory::MEDIUM;
    std::string categoryLabel = "Medium (<500MB)";
    std::optional<uint64_t> estimatedLines;
    double avgBytesPerLine = 200.0;
    bool isBulkInsert = false;
    double targetRamUsage = 0.40;
    bool isGzip = false;
    bool isEstimate = true;

    /** Result for a file whose only known property is its size, with the
        category derived from the size.
    */
    static FileAnalysisResult
    fromSize(uint64_t fileSize, bool isCompressed,
             double avgBytesPerLine = 200.0,
             bool isBulkInsert = false);

    Json::Value toJson() const;

    /** Missing fields take the defaults above. */
    static FileAnalysisResult fromJson(const Json::Value & value);
};

} // namespace STAGGER
