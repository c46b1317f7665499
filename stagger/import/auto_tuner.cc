/* auto_tuner.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Batch size tuning from memory, file shape and observed speed.
*/

#include "auto_tuner.h"
#include "memory_probe.h"
#include "stagger/arch/format.h"
#include "stagger/base/exc_assert.h"
#include "stagger/utils/log.h"
#include <boost/algorithm/string.hpp>
#include <json/json.h>
#include <algorithm>
#include <cmath>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("tuner");
    return result;
}

constexpr uint64_t GiB = 1024ULL * 1024 * 1024;

const ProfileSettings PROFILE_SETTINGS[2] = {
    { "conservative", 0.8, 1500000, 1.0, 2000, 16 * 1024 * 1024 },
    { "aggressive",   0.7, 2000000, 1.3, 5000, 32 * 1024 * 1024 }
};

// Lines per chunk by RAM in GB (row) and size category (column)
struct BatchReference {
    uint64_t ramGb;
    uint64_t sizes[5];
};

const BatchReference BATCH_REFERENCE[] = {
    {  1, { 10000,  30000,  50000,  80000,  100000 } },
    {  2, { 20000,  50000,  80000, 150000,  250000 } },
    {  3, { 25000,  70000, 120000, 200000,  350000 } },
    {  4, { 30000,  80000, 150000, 250000,  400000 } },
    {  5, { 40000, 100000, 200000, 350000,  500000 } },
    {  6, { 45000, 120000, 250000, 400000,  600000 } },
    {  8, { 50000, 150000, 300000, 500000,  750000 } },
    { 12, { 50000, 175000, 350000, 575000,  875000 } },
    { 16, { 50000, 200000, 400000, 650000, 1000000 } }
};

// Lines per chunk by available RAM, for when there is no file analysis
struct RamProfile {
    uint64_t belowBytes;
    uint64_t lines;
};

const RamProfile RAM_PROFILES[] = {
    {  GiB / 2,   30000 },
    {  1 * GiB,   80000 },
    {  2 * GiB,  150000 },
    {  3 * GiB,  220000 },
    {  4 * GiB,  300000 },
    {  5 * GiB,  380000 },
    {  6 * GiB,  460000 },
    {  7 * GiB,  540000 },
    {  8 * GiB,  620000 },
    {  9 * GiB,  700000 },
    { 10 * GiB,  780000 },
    { 11 * GiB,  860000 },
    { 12 * GiB,  940000 },
    { 13 * GiB, 1020000 },
    { 14 * GiB, 1100000 },
    { 15 * GiB, 1180000 },
    { 16 * GiB, 1260000 }
};

constexpr uint64_t RAM_PROFILE_MAX = 1500000;

const BatchReference & referenceRow(uint64_t availableRam)
{
    uint64_t ramGb = std::max<uint64_t>(1, availableRam / GiB);
    for (auto & row: BATCH_REFERENCE) {
        if (row.ramGb >= ramGb)
            return row;
    }
    return std::end(BATCH_REFERENCE)[-1];
}

uint64_t ramProfileLines(uint64_t availableRam)
{
    for (auto & profile: RAM_PROFILES) {
        if (availableRam < profile.belowBytes)
            return profile.lines;
    }
    return RAM_PROFILE_MAX;
}

double average(const std::deque<double> & values,
               size_t first, size_t count)
{
    double total = 0.0;
    for (size_t i = first;  i < first + count;  ++i)
        total += values[i];
    return total / count;
}

} // file scope


/*****************************************************************************/
/* PERFORMANCE PROFILE                                                       */
/*****************************************************************************/

const ProfileSettings &
getProfileSettings(PerformanceProfile profile)
{
    switch (profile) {
    case PerformanceProfile::CONSERVATIVE: return PROFILE_SETTINGS[0];
    case PerformanceProfile::AGGRESSIVE:   return PROFILE_SETTINGS[1];
    }
    STAGGER_THROW_LOGIC_ERROR("unknown performance profile");
}

InvalidProfileError::
InvalidProfileError(const std::string & profile)
    : Exception("Invalid performance profile '" + profile
                + "': expected 'conservative' or 'aggressive'"),
      profile(profile)
{
}

PerformanceProfile
parsePerformanceProfile(const std::string & name)
{
    std::string lowered = boost::algorithm::to_lower_copy(
            boost::algorithm::trim_copy(name));
    if (lowered == "conservative")
        return PerformanceProfile::CONSERVATIVE;
    if (lowered == "aggressive")
        return PerformanceProfile::AGGRESSIVE;
    throw InvalidProfileError(name);
}

const char *
profileName(PerformanceProfile profile)
{
    return getProfileSettings(profile).name;
}

double
compressionMultiplier(const std::string & compressionType)
{
    if (compressionType == "none")
        return 1.5;
    if (compressionType == "gzip")
        return 1.0;
    if (compressionType == "bzip2")
        return 0.7;
    return 1.0;
}


/*****************************************************************************/
/* ADAPT RESULT                                                              */
/*****************************************************************************/

Json::Value
AdaptResult::
toJson() const
{
    Json::Value result;
    result["old_batch_size"] = Json::UInt64(oldBatchSize);
    result["new_batch_size"] = Json::UInt64(newBatchSize);
    result["changed"] = changed;
    result["action"] = action;
    result["reason"] = reason;
    result["speed"] = speed;
    result["memory_percentage"] = memoryPercentage;
    result["samples"] = Json::UInt64(samples);
    return result;
}


/*****************************************************************************/
/* AUTO TUNER                                                                */
/*****************************************************************************/

AutoTuner::
AutoTuner(AutoTunerOptions options,
          std::shared_ptr<MemoryProbe> probe)
    : options_(std::move(options)),
      probe_(std::move(probe)),
      effectiveProfile_(options_.profile),
      currentBatchSize_(options_.initialBatchSize)
{
    if (!probe_)
        probe_ = makeDefaultMemoryProbe();

    if (options_.profile == PerformanceProfile::AGGRESSIVE) {
        MemoryPressure pressure = checkMemoryPressure();
        uint64_t headroom = pressure.limit > pressure.usage
            ? pressure.limit - pressure.usage : 0;
        headroom = std::min(headroom, pressure.availableRam);
        if (headroom < AGGRESSIVE_MIN_AVAILABLE) {
            WARNING_MSG(logger())
                << "aggressive profile needs " << formatBytes(AGGRESSIVE_MIN_AVAILABLE)
                << " of free memory but only " << formatBytes(headroom)
                << " is available; using the conservative profile";
            effectiveProfile_ = PerformanceProfile::CONSERVATIVE;
            downgraded_ = true;
        }
    }
}

const ProfileSettings &
AutoTuner::
settings() const
{
    return getProfileSettings(effectiveProfile_);
}

uint64_t
AutoTuner::
maxBatchSize() const
{
    return settings().maxBatchSize;
}

size_t
AutoTuner::
recommendedInsertBatchSize() const
{
    return settings().insertBatchSize;
}

size_t
AutoTuner::
recommendedMaxBatchBytes() const
{
    return settings().maxBatchBytes;
}

void
AutoTuner::
setFileAnalysis(const FileAnalysisResult & analysis)
{
    analysis_ = analysis;
}

void
AutoTuner::
clearFileAnalysis()
{
    analysis_.reset();
}

void
AutoTuner::
setCompressionType(const std::string & compressionType)
{
    compressionType_ = compressionType;
}

uint64_t
AutoTuner::
clamp(double size) const
{
    if (!std::isfinite(size) || size < 0)
        size = 0;
    uint64_t result = static_cast<uint64_t>(std::floor(size));
    return std::clamp(result, options_.minBatchSize,
                      std::max(options_.minBatchSize, maxBatchSize()));
}

uint64_t
AutoTuner::
calculateFileAware(const FileAnalysisResult & analysis,
                   const MemoryPressure & pressure) const
{
    const BatchReference & row = referenceRow(pressure.availableRam);
    double size = row.sizes[static_cast<int>(analysis.category)];

    if (analysis.isBulkInsert)
        size *= BULK_INSERT_BOOST;

    size *= analysis.targetRamUsage / REFERENCE_RAM_USAGE;
    size *= settings().multiplier;
    size *= compressionMultiplier(compressionType_);

    return clamp(size);
}

uint64_t
AutoTuner::
calculateFromRam(const MemoryPressure & pressure) const
{
    uint64_t headroom = pressure.limit > pressure.usage
        ? pressure.limit - pressure.usage : 0;
    uint64_t effective = std::min(pressure.availableRam, headroom);

    double factor = settings().multiplier
        * compressionMultiplier(compressionType_);

    double lines = effective * settings().safetyMargin / BYTES_PER_LINE;
    lines *= factor;

    double profileLines = ramProfileLines(pressure.availableRam) * factor;

    return clamp(std::min(lines, profileLines));
}

uint64_t
AutoTuner::
calculateOptimalBatchSize()
{
    if (options_.forcedBatchSize > 0) {
        currentBatchSize_ = options_.forcedBatchSize;
        return currentBatchSize_;
    }

    if (!options_.enabled)
        return currentBatchSize_;

    MemoryPressure pressure = checkMemoryPressure();

    if (options_.fileAwareTuning && analysis_)
        currentBatchSize_ = calculateFileAware(*analysis_, pressure);
    else currentBatchSize_ = calculateFromRam(pressure);

    DEBUG_MSG(logger()) << "batch size " << currentBatchSize_
                        << " (profile " << settings().name
                        << ", compression " << compressionType_
                        << ", available " << formatBytes(pressure.availableRam)
                        << (analysis_ && options_.fileAwareTuning
                            ? ", file aware" : "")
                        << ")";

    return currentBatchSize_;
}

MemoryPressure
AutoTuner::
checkMemoryPressure()
{
    double now = wall_time();

    if (cachedPressure_ && now - pressureReadAt_ < MEMORY_CACHE_TTL) {
        MemoryPressure result = *cachedPressure_;
        result.cached = true;
        return result;
    }

    MemoryReading reading = probe_->read();

    MemoryPressure result;
    result.usage = reading.processUsage;

    // The machine figures change slowly; keep them for longer
    if (cachedPressure_ && now - systemReadAt_ < SYSTEM_CACHE_TTL) {
        result.totalRam = cachedPressure_->totalRam;
        result.availableRam = cachedPressure_->availableRam;
    }
    else {
        result.totalRam = reading.totalRam;
        result.availableRam = reading.availableRam;
        systemReadAt_ = now;
    }

    result.limit = options_.memoryLimit > 0
        ? options_.memoryLimit : result.totalRam;
    result.ratio = result.limit > 0
        ? double(result.usage) / result.limit : 0.0;
    result.percentage = result.ratio * 100.0;
    result.cached = false;

    cachedPressure_ = result;
    pressureReadAt_ = now;

    return result;
}

void
AutoTuner::
clearCache()
{
    cachedPressure_.reset();
    pressureReadAt_ = systemReadAt_ = 0.0;
}

bool
AutoTuner::
memoryLimitReached()
{
    return checkMemoryPressure().ratio >= settings().safetyMargin;
}

AdaptResult
AutoTuner::
adaptBatchSize(uint64_t bytesProcessed, uint64_t rowsProcessed)
{
    double elapsed = sampleTimer_.elapsed_wall();
    sampleTimer_.restart();

    double speed = elapsed > 0 ? rowsProcessed / elapsed : 0.0;
    MemoryPressure pressure = checkMemoryPressure();

    TRACE_MSG(logger()) << "chunk of " << rowsProcessed << " lines and "
                        << formatBytes(bytesProcessed) << " in "
                        << elapsed << "s";

    return recordSample(speed, pressure.percentage);
}

AdaptResult
AutoTuner::
recordSample(double speed, double memoryPercentage)
{
    AdaptResult result;
    result.oldBatchSize = result.newBatchSize = currentBatchSize_;
    result.speed = speed;
    result.memoryPercentage = memoryPercentage;

    lastSpeed_ = speed;
    speedHistory_.push_back(speed);
    memoryHistory_.push_back(memoryPercentage);
    while (speedHistory_.size() > HISTORY_SIZE)
        speedHistory_.pop_front();
    while (memoryHistory_.size() > HISTORY_SIZE)
        memoryHistory_.pop_front();

    result.samples = speedHistory_.size();

    if (!options_.enabled || options_.forcedBatchSize > 0
        || speedHistory_.size() < MIN_SAMPLES)
        return result;

    size_t n = speedHistory_.size();
    double avgSpeed = average(speedHistory_, 0, n);
    double avgMemory = average(memoryHistory_, 0, memoryHistory_.size());

    double variance = 0.0;
    for (double s: speedHistory_)
        variance += (s - avgSpeed) * (s - avgSpeed);
    variance /= (n - 1);

    double ceiling = maxBatchSize() * compressionMultiplier(compressionType_);
    double highMemory = settings().safetyMargin * 100.0 - 10.0;

    uint64_t old = currentBatchSize_;
    uint64_t proposed = old;

    if (avgMemory < 30.0 && variance < 0.1 * avgSpeed * avgSpeed) {
        double increased = std::min<double>(old * 1.5, old + MAX_INCREASE);
        increased = std::min(increased, ceiling);
        if (increased > old) {
            proposed = static_cast<uint64_t>(increased);
            result.action = "increase";
            result.reason = format("memory %.1f%%, stable speed", avgMemory);
        }
    }
    else if (avgMemory > highMemory) {
        uint64_t floor = std::min(old, std::max(MIN_DYNAMIC_BATCH,
                                                options_.minBatchSize));
        proposed = std::max<uint64_t>(old * 0.7, floor);
        proposed = std::max(proposed, options_.minBatchSize);
        if (proposed < old) {
            result.action = "decrease";
            result.reason = format("memory %.1f%% above %.0f%%",
                                   avgMemory, highMemory);
        }
    }
    else if (n >= 4) {
        double recent = average(speedHistory_, n - 2, 2);
        double earlier = average(speedHistory_, 0, 2);
        if (recent < 0.7 * earlier) {
            proposed = std::max<uint64_t>(old * 0.8, options_.minBatchSize);
            if (proposed < old) {
                result.action = "decrease";
                result.reason = format("speed fell from %.0f to %.0f lines/s",
                                       earlier, recent);
            }
        }
    }

    if (proposed != old) {
        currentBatchSize_ = proposed;
        result.newBatchSize = proposed;
        result.changed = true;
        lastAdjustment_ = format("Batch %s: %llu -> %llu (%s)",
                                 proposed > old ? "increased" : "decreased",
                                 (unsigned long long)old,
                                 (unsigned long long)proposed,
                                 result.reason.c_str());
        INFO_MSG(logger()) << lastAdjustment_;
    }

    return result;
}

std::string
AutoTuner::
getSpeedTrend() const
{
    size_t n = speedHistory_.size();
    if (n < MIN_SAMPLES)
        return "calculating";

    size_t half = std::min<size_t>(2, n / 2);
    double recent = average(speedHistory_, n - half, half);
    double earlier = average(speedHistory_, 0, half);

    if (earlier <= 0)
        return "stable";

    double ratio = recent / earlier;
    if (ratio > 1.1)
        return "increasing";
    if (ratio < 0.9)
        return "decreasing";
    return "stable";
}

Json::Value
AutoTuner::
getMetrics()
{
    MemoryPressure pressure = checkMemoryPressure();

    Json::Value result;
    result["enabled"] = options_.enabled;
    result["forced_batch_size"] = Json::UInt64(options_.forcedBatchSize);
    result["total_ram"] = Json::UInt64(pressure.totalRam);
    result["available_ram"] = Json::UInt64(pressure.availableRam);
    result["memory_usage"] = Json::UInt64(pressure.usage);
    result["memory_limit"] = Json::UInt64(pressure.limit);
    result["memory_percentage"] = std::round(pressure.percentage * 10) / 10;
    result["batch_size"] = Json::UInt64(currentBatchSize_);
    result["min_batch_size"] = Json::UInt64(options_.minBatchSize);
    result["max_batch_size"] = Json::UInt64(maxBatchSize());
    result["speed"] = lastSpeed_;
    result["speed_trend"] = getSpeedTrend();
    result["last_adjustment"] = lastAdjustment_;
    result["file_aware"] = options_.fileAwareTuning && analysis_.has_value();
    if (analysis_)
        result["file_analysis"] = analysis_->toJson();
    result["requested_profile"] = profileName(options_.profile);
    result["effective_profile"] = profileName(effectiveProfile_);
    result["profile_downgraded"] = downgraded_;
    result["profile_multiplier"] = settings().multiplier;
    result["safety_margin"] = settings().safetyMargin;
    result["compression_type"] = compressionType_;
    result["compression_multiplier"] = compressionMultiplier(compressionType_);
    return result;
}

} // namespace STAGGER
