#pragma once

#include "MetricsRecord.hpp"

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Whether operations sleep a simulated latency or hit the system
 * under test over HTTP.
 */
enum class TargetMode {
    Simulated,
    Http
};

struct HttpTarget {
    std::string base_url = "http://localhost:9090";   // scheme://host:port
    // One query reads the station and then the center; both answer on /metrics
    std::vector<std::string> query_paths{"/metrics", "/metrics"};
    std::string vote_path = "/votes";
    int timeout_sec = 5;
};

/**
 * @brief Constants that distinguish the quick and performance harnesses.
 *
 * One engine runs both; only these values change.
 */
struct HarnessProfile {
    std::string name;

    std::chrono::seconds cooldown{10};
    std::chrono::seconds sampling_interval{2};
    std::chrono::seconds cpu_window{1};
    double failure_probability = 0.02;
    PercentileMethod percentile = PercentileMethod::IndexApprox;

    std::chrono::milliseconds query_pause{100};
    double query_latency_min_ms = 10.0;
    double query_latency_max_ms = 50.0;
    double vote_latency_min_ms = 20.0;
    double vote_latency_max_ms = 80.0;
    unsigned candidate_count = 5;

    TargetMode mode = TargetMode::Simulated;
    HttpTarget target;

    // -1 seeds every worker from std::random_device
    int seed = -1;

    std::vector<ExperimentConfig> configurations;
};

// 2 s sampling, 10 s cooldown, 2% failures, index-based p95.
HarnessProfile quick_profile();

// 5 s sampling, 30 s cooldown, 5% failures, interpolated p95, fixed 50 ms votes.
HarnessProfile performance_profile();

/**
 * @brief Looks a profile up by name ("quick" or "performance").
 * @throws std::invalid_argument for unknown names.
 */
HarnessProfile profile_by_name(const std::string& name);
