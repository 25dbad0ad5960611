#include "harness_profile.hpp"

#include <stdexcept>

HarnessProfile quick_profile() {
    HarnessProfile p;
    p.name = "quick";
    p.cooldown = std::chrono::seconds(10);
    p.sampling_interval = std::chrono::seconds(2);
    p.failure_probability = 0.02;
    p.percentile = PercentileMethod::IndexApprox;
    p.vote_latency_min_ms = 20.0;
    p.vote_latency_max_ms = 80.0;
    p.configurations = {
        // (concurrent queries, votes per minute, minutes)
        {5, 50, 1},
        {10, 100, 1},
        {20, 200, 2},
    };
    return p;
}

HarnessProfile performance_profile() {
    HarnessProfile p;
    p.name = "performance";
    p.cooldown = std::chrono::seconds(30);
    p.sampling_interval = std::chrono::seconds(5);
    p.failure_probability = 0.05;
    p.percentile = PercentileMethod::InterpolatedQuantile;
    p.vote_latency_min_ms = 50.0;
    p.vote_latency_max_ms = 50.0;
    p.configurations = {
        {10, 100, 5},
        {10, 500, 5},
        {50, 100, 5},
        {50, 500, 5},
        {100, 1000, 10},
        {100, 2000, 10},
        {200, 2000, 15},
        {200, 5000, 15},
        {500, 5000, 30},
    };
    return p;
}

HarnessProfile profile_by_name(const std::string& name) {
    if (name == "quick") return quick_profile();
    if (name == "performance") return performance_profile();
    throw std::invalid_argument("Unknown profile '" + name + "' (expected quick or performance)");
}
