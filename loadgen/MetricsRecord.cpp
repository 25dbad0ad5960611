#include "MetricsRecord.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

const char* to_string(PercentileMethod method) {
    switch (method) {
        case PercentileMethod::IndexApprox: return "index_approx";
        case PercentileMethod::InterpolatedQuantile: return "interpolated_quantile";
    }
    return "unknown";
}

void ExperimentConfig::validate() const {
    if (concurrent_queries == 0) {
        throw std::invalid_argument("concurrent_queries must be greater than 0");
    }
    if (votes_per_minute == 0) {
        throw std::invalid_argument("votes_per_minute must be greater than 0");
    }
    if (duration_minutes == 0) {
        throw std::invalid_argument("duration_minutes must be greater than 0");
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}
