/* auto_tuner.h                                                    -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Chooses how many lines an import should process per chunk from the
   memory available, the shape of the file being imported and the speed
   observed so far.
*/

#pragma once

#include "stagger/arch/exception.h"
#include "stagger/arch/timers.h"
#include "stagger/import/file_analysis.h"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <stdint.h>

namespace Json {
class Value;
}

namespace STAGGER {

struct MemoryProbe;


/*****************************************************************************/
/* PERFORMANCE PROFILE                                                       */
/*****************************************************************************/

enum class PerformanceProfile {
    CONSERVATIVE,
    AGGRESSIVE
};

struct ProfileSettings {
    const char * name;
    double safetyMargin;        ///< fraction of free memory we allow ourselves
    uint64_t maxBatchSize;      ///< upper bound on lines per chunk
    double multiplier;          ///< scales every computed batch size
    size_t insertBatchSize;     ///< rows per merged INSERT
    size_t maxBatchBytes;       ///< bytes per merged INSERT
};

const ProfileSettings & getProfileSettings(PerformanceProfile profile);

/** Thrown when a profile name is not recognized. */
struct InvalidProfileError: public Exception {
    InvalidProfileError(const std::string & profile);

    std::string profile;
};

/** Parse "conservative" or "aggressive" (case insensitive, trimmed). */
PerformanceProfile parsePerformanceProfile(const std::string & name);

const char * profileName(PerformanceProfile profile);

/** Batch size multiplier for the compression codec of the input.  Unknown
    codecs get 1.0.
*/
double compressionMultiplier(const std::string & compressionType);


/*****************************************************************************/
/* AUTO TUNER OPTIONS                                                        */
/*****************************************************************************/

struct AutoTunerOptions {
    PerformanceProfile profile = PerformanceProfile::CONSERVATIVE;
    bool enabled = true;
    uint64_t minBatchSize = 10000;
    uint64_t initialBatchSize = 3000;   ///< returned when tuning is disabled
    uint64_t forcedBatchSize = 0;       ///< 0 means not forced
    bool fileAwareTuning = true;
    uint64_t memoryLimit = 0;           ///< 0 means total RAM
};


/*****************************************************************************/
/* MEMORY PRESSURE                                                           */
/*****************************************************************************/

struct MemoryPressure {
    uint64_t usage = 0;
    uint64_t limit = 0;
    uint64_t availableRam = 0;
    uint64_t totalRam = 0;
    double ratio = 0.0;
    double percentage = 0.0;
    bool cached = false;
};


/*****************************************************************************/
/* ADAPT RESULT                                                              */
/*****************************************************************************/

struct AdaptResult {
    uint64_t oldBatchSize = 0;
    uint64_t newBatchSize = 0;
    bool changed = false;
    std::string action = "stable";   ///< "increase", "decrease" or "stable"
    std::string reason;
    double speed = 0.0;
    double memoryPercentage = 0.0;
    size_t samples = 0;

    Json::Value toJson() const;
};


/*****************************************************************************/
/* AUTO TUNER                                                                */
/*****************************************************************************/

struct AutoTuner {
    static constexpr size_t HISTORY_SIZE = 5;
    static constexpr size_t MIN_SAMPLES = 3;
    static constexpr uint64_t MIN_DYNAMIC_BATCH = 50000;
    static constexpr uint64_t MAX_INCREASE = 100000;
    static constexpr uint64_t AGGRESSIVE_MIN_AVAILABLE = 128ULL * 1024 * 1024;
    static constexpr double BYTES_PER_LINE = 150.0;
    static constexpr double BULK_INSERT_BOOST = 1.3;
    static constexpr double REFERENCE_RAM_USAGE = 0.40;
    static constexpr double MEMORY_CACHE_TTL = 1.0;
    static constexpr double SYSTEM_CACHE_TTL = 60.0;

    AutoTuner(AutoTunerOptions options = AutoTunerOptions(),
              std::shared_ptr<MemoryProbe> probe = nullptr);

    /** Batch size for the next chunk.  A forced size wins over everything;
        a disabled tuner returns the current size unchanged.  Otherwise the
        size comes from the file analysis if there is one and file aware
        tuning is on, or from the available memory alone.
    */
    uint64_t calculateOptimalBatchSize();

    void setFileAnalysis(const FileAnalysisResult & analysis);
    void clearFileAnalysis();
    const std::optional<FileAnalysisResult> & fileAnalysis() const
    {
        return analysis_;
    }

    void setCompressionType(const std::string & compressionType);
    const std::string & compressionType() const { return compressionType_; }

    /** Current memory figures.  The process usage is cached for one second
        and the machine figures for a minute.
    */
    MemoryPressure checkMemoryPressure();

    /** Drop the cached figures so the next call reads the probe. */
    void clearCache();

    /** True when the process has reached the memory fraction the profile
        allows, at which point an import should stop and resume later.
    */
    bool memoryLimitReached();

    /** Feed back how a chunk went.  The speed is measured from the time
        since the previous call (or since construction) and the memory from
        the probe.
    */
    AdaptResult adaptBatchSize(uint64_t bytesProcessed,
                               uint64_t rowsProcessed);

    /** Feed back an explicit speed sample in lines per second along with
        the memory usage percentage at the time.
    */
    AdaptResult recordSample(double speed, double memoryPercentage);

    /** "increasing", "decreasing", "stable" or "calculating" when there
        are not enough samples.
    */
    std::string getSpeedTrend() const;

    Json::Value getMetrics();

    uint64_t currentBatchSize() const { return currentBatchSize_; }
    uint64_t minBatchSize() const { return options_.minBatchSize; }
    uint64_t maxBatchSize() const;
    const std::string & lastAdjustment() const { return lastAdjustment_; }

    PerformanceProfile requestedProfile() const { return options_.profile; }
    PerformanceProfile effectiveProfile() const { return effectiveProfile_; }
    bool profileDowngraded() const { return downgraded_; }
    const ProfileSettings & settings() const;

    size_t recommendedInsertBatchSize() const;
    size_t recommendedMaxBatchBytes() const;

    const AutoTunerOptions & options() const { return options_; }

private:
    uint64_t calculateFileAware(const FileAnalysisResult & analysis,
                                const MemoryPressure & pressure) const;
    uint64_t calculateFromRam(const MemoryPressure & pressure) const;
    uint64_t clamp(double size) const;

    AutoTunerOptions options_;
    std::shared_ptr<MemoryProbe> probe_;
    PerformanceProfile effectiveProfile_;
    bool downgraded_ = false;

    std::optional<FileAnalysisResult> analysis_;
    std::string compressionType_ = "none";

    uint64_t currentBatchSize_;
    std::string lastAdjustment_;
    double lastSpeed_ = 0.0;

    std::deque<double> speedHistory_;
    std::deque<double> memoryHistory_;
    Timer sampleTimer_;

    std::optional<MemoryPressure> cachedPressure_;
    double pressureReadAt_ = 0.0;
    double systemReadAt_ = 0.0;
};

} // namespace STAGGER
