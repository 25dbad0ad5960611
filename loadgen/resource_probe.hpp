#pragma once

#include "clock.hpp"

#include <chrono>
#include <string>

struct ResourceSample {
    double cpu_percent;
    double memory_used_mb;
};

/**
 * @brief Source of host CPU / memory readings.
 */
class IResourceProbe {
public:
    virtual ~IResourceProbe() = default;

    /**
     * @brief Takes one reading. May block while CPU usage is measured.
     * @throws std::runtime_error if the host counters cannot be read.
     */
    virtual ResourceSample sample() = 0;
};

/**
 * @brief Reads /proc/stat and /proc/meminfo.
 *
 * CPU utilization is the busy share of all jiffies between two reads of
 * /proc/stat taken `window` apart. Used memory is
 * MemTotal - MemFree - Buffers - (Cached + SReclaimable), or
 * MemTotal - MemFree when that comes out negative.
 */
class ProcResourceProbe : public IResourceProbe {
public:
    ProcResourceProbe(IClock& clock, std::chrono::seconds window,
                      std::string stat_path = "/proc/stat",
                      std::string meminfo_path = "/proc/meminfo");

    ResourceSample sample() override;

private:
    struct CpuTimes {
        unsigned long long idle;
        unsigned long long total;
    };

    CpuTimes read_cpu_times() const;
    double read_memory_used_mb() const;

    IClock& clock_;
    std::chrono::seconds window_;
    std::string stat_path_;
    std::string meminfo_path_;
};
