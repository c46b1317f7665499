/* memory_probe.cc
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Memory probe reading the Linux /proc filesystem.
*/

#include "memory_probe.h"
#include "stagger/utils/log.h"
#include <fstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <stdlib.h>


using namespace std;


namespace STAGGER {

namespace {

std::shared_ptr<spdlog::logger> logger()
{
    static auto result = getStaggerLog("memory");
    return result;
}

} // file scope


/*****************************************************************************/
/* PROC MEMORY PROBE                                                         */
/*****************************************************************************/

ProcMemoryProbe::
ProcMemoryProbe(const std::string & statmPath,
                const std::string & meminfoPath)
    : statmPath(statmPath),
      meminfoPath(meminfoPath),
      pageSize(sysconf(_SC_PAGESIZE))
{
    statmFd = ::open(statmPath.c_str(), O_RDONLY);
    if (statmFd == -1) {
        WARNING_MSG(logger()) << "could not open " << statmPath << ": "
                              << strerror(errno)
                              << "; process memory usage will read as 0";
    }
}

ProcMemoryProbe::
~ProcMemoryProbe()
{
    if (statmFd != -1)
        ::close(statmFd);
}

bool
ProcMemoryProbe::
readProcessUsage(uint64_t & usage)
{
    if (statmFd == -1)
        return false;

    if (lseek(statmFd, 0, SEEK_SET) == -1)
        return false;

    constexpr size_t NCHARS = 256;
    char buf[NCHARS];
    ssize_t res = ::read(statmFd, buf, NCHARS - 1);
    if (res <= 0)
        return false;
    buf[res] = 0;

    // size resident shared text lib data dirty; we want the second
    char * p = buf;
    char * e;
    strtoull(p, &e, 10);
    if (e == p)
        return false;
    p = e;
    uint64_t residentPages = strtoull(p, &e, 10);
    if (e == p)
        return false;

    usage = residentPages * pageSize;
    return true;
}

bool
ProcMemoryProbe::
readMeminfo(uint64_t & total, uint64_t & available)
{
    std::ifstream stream(meminfoPath);
    if (!stream)
        return false;

    bool haveTotal = false, haveAvailable = false;
    std::string key;
    uint64_t value;
    std::string unit;
    while (stream >> key >> value) {
        std::getline(stream, unit);
        if (key == "MemTotal:") {
            total = value * 1024;
            haveTotal = true;
        }
        else if (key == "MemAvailable:") {
            available = value * 1024;
            haveAvailable = true;
        }
        if (haveTotal && haveAvailable)
            return true;
    }

    return false;
}

MemoryReading
ProcMemoryProbe::
read()
{
    MemoryReading result;
    if (!readProcessUsage(result.processUsage)) {
        if (!warnedUsage) {
            WARNING_MSG(logger()) << "could not read " << statmPath
                                  << "; assuming no process memory usage";
            warnedUsage = true;
        }
        result.processUsage = 0;
    }

    if (!readMeminfo(result.totalRam, result.availableRam)) {
        WARNING_MSG(logger())
            << "could not read " << meminfoPath << "; assuming "
            << FALLBACK_RAM / (1024 * 1024) << "MB of RAM";
        result.totalRam = result.availableRam = FALLBACK_RAM;
    }

    return result;
}

std::shared_ptr<MemoryProbe>
makeDefaultMemoryProbe()
{
    return std::make_shared<ProcMemoryProbe>();
}

} // namespace STAGGER
