/* memory_probe.h                                                  -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Reads the memory figures the auto tuner works from.
*/

#pragma once

#include <memory>
#include <string>
#include <stdint.h>

namespace STAGGER {


/*****************************************************************************/
/* MEMORY READING                                                            */
/*****************************************************************************/

struct MemoryReading {
    uint64_t processUsage = 0;   ///< resident bytes of this process
    uint64_t totalRam = 0;       ///< bytes of RAM on the machine
    uint64_t availableRam = 0;   ///< bytes the machine could still hand out
};


/*****************************************************************************/
/* MEMORY PROBE                                                              */
/*****************************************************************************/

struct MemoryProbe {
    virtual ~MemoryProbe() {}

    virtual MemoryReading read() = 0;
};


/*****************************************************************************/
/* PROC MEMORY PROBE                                                         */
/*****************************************************************************/

/** Probe that reads /proc/self/statm for the process and /proc/meminfo for
    the machine.  Never throws: where the process usage cannot be read it
    is reported as 0, and where /proc/meminfo cannot be read the machine is
    assumed to have 2GB, all of it available.
*/

struct ProcMemoryProbe: public MemoryProbe {
    ProcMemoryProbe(const std::string & statmPath = "/proc/self/statm",
                    const std::string & meminfoPath = "/proc/meminfo");
    ~ProcMemoryProbe();

    virtual MemoryReading read() override;

    static constexpr uint64_t FALLBACK_RAM = 2ULL * 1024 * 1024 * 1024;

private:
    bool readProcessUsage(uint64_t & usage);
    bool readMeminfo(uint64_t & total, uint64_t & available);

    std::string statmPath;
    std::string meminfoPath;
    int statmFd = -1;
    uint64_t pageSize;
    bool warnedUsage = false;
};

std::shared_ptr<MemoryProbe> makeDefaultMemoryProbe();

} // namespace STAGGER
