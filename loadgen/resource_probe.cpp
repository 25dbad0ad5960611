#include "resource_probe.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

ProcResourceProbe::ProcResourceProbe(IClock& clock, std::chrono::seconds window,
                                     std::string stat_path, std::string meminfo_path)
    : clock_(clock), window_(window),
      stat_path_(std::move(stat_path)), meminfo_path_(std::move(meminfo_path)) {}

ResourceSample ProcResourceProbe::sample() {
    CpuTimes before = read_cpu_times();
    clock_.sleep_for(window_);
    CpuTimes after = read_cpu_times();

    double cpu_percent = 0.0;
    if (after.total > before.total && after.idle >= before.idle) {
        unsigned long long delta_total = after.total - before.total;
        unsigned long long delta_idle = after.idle - before.idle;
        if (delta_idle <= delta_total) {
            cpu_percent = 100.0 * static_cast<double>(delta_total - delta_idle)
                          / static_cast<double>(delta_total);
        }
    }

    return ResourceSample{cpu_percent, read_memory_used_mb()};
}

ProcResourceProbe::CpuTimes ProcResourceProbe::read_cpu_times() const {
    std::ifstream f(stat_path_);
    if (!f.good()) {
        throw std::runtime_error("cannot open " + stat_path_);
    }
    std::string line;
    while (std::getline(f, line)) {
        std::istringstream ss(line);
        std::string label;
        if (!(ss >> label) || label != "cpu") continue;

        // user nice system idle iowait irq softirq steal
        unsigned long long user, nice, system, idle, iowait, irq, softirq, steal;
        if (!(ss >> user >> nice >> system >> idle >> iowait >> irq >> softirq)) {
            throw std::runtime_error("malformed cpu line in " + stat_path_);
        }
        // steal only exists on newer kernels
        if (!(ss >> steal)) steal = 0;

        unsigned long long idle_all = idle + iowait;
        unsigned long long total = user + nice + system + idle_all + irq + softirq + steal;
        return CpuTimes{idle_all, total};
    }
    throw std::runtime_error("no aggregate cpu line in " + stat_path_);
}

double ProcResourceProbe::read_memory_used_mb() const {
    std::ifstream f(meminfo_path_);
    if (!f.good()) {
        throw std::runtime_error("cannot open " + meminfo_path_);
    }
    std::map<std::string, long long> kb;

    std::string line;
    while (std::getline(f, line)) {
        std::istringstream ss(line);
        std::string key;
        long long value;
        if (!(ss >> key >> value)) continue;
        kb[key] = value;
    }
    for (const char* required : {"MemTotal:", "MemFree:", "Cached:"}) {
        if (kb.find(required) == kb.end()) {
            throw std::runtime_error(std::string(required) + " missing from " + meminfo_path_);
        }
    }

    // Page cache includes reclaimable slab, as the kernel's free(1) reports it
    long long total_kb = kb["MemTotal:"];
    long long free_kb = kb["MemFree:"];
    long long cached_kb = kb["Cached:"] + kb["SReclaimable:"];
    long long used_kb = total_kb - free_kb - kb["Buffers:"] - cached_kb;
    if (used_kb < 0) {
        used_kb = total_kb - free_kb;
    }
    if (used_kb < 0) return 0.0;
    return static_cast<double>(used_kb) / 1024.0;
}
