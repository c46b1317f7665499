/* timers.h                                                        -*- C++ -*-
   This file is part of Stagger. Copyright 2026 mldb.ai inc. All rights reserved.

   Different types of timers.
*/

#pragma once

#include <sys/time.h>
#include <time.h>
#include "format.h"
#include <string>
#include <cerrno>
#include <string.h>
#include "exception.h"


namespace STAGGER {

inline double cpu_time()
{
    clock_t clk = clock();
    return clk / (double)CLOCKS_PER_SEC;
}

inline double wall_time()
{
    struct timeval tv;
    int res = gettimeofday(&tv, nullptr);
    if (res != 0)
        throw Exception("gettimeofday() returned "
                        + std::string(strerror(errno)));

    return tv.tv_sec + (tv.tv_usec / 1000000.0);
}

struct Timer {
    double wall_, cpu_;
    bool enabled;

    explicit Timer(bool enable = true)
        : enabled(enable)
    {
        restart();
    }

    void restart()
    {
        if (!enabled)
            return;
        wall_ = wall_time();
        cpu_ = cpu_time();
    }

    std::string elapsed() const
    {
        if (!enabled)
            return "disabled";
        return format("elapsed: [%.2fs cpu, %.2fs wall, %.2f cores]",
                      elapsed_cpu(),
                      elapsed_wall(),
                      elapsed_cpu() / elapsed_wall());
    }

    double elapsed_cpu() const { return cpu_time() - cpu_; }
    double elapsed_wall() const { return wall_time() - wall_; }
};

} // namespace STAGGER
