#pragma once
#include <string>
#include <vector>
#include <chrono>

/**
 * @brief How the 95th latency percentile is reduced from the samples.
 *
 * IndexApprox:          sorted[floor(0.95 * n)] (quick harness).
 * InterpolatedQuantile: exclusive quantiles over 20 intervals, cut point 18
 *                       (performance harness).
 */
enum class PercentileMethod {
    IndexApprox,
    InterpolatedQuantile
};

const char* to_string(PercentileMethod method);

/**
 * @brief One load level under test. Immutable once built.
 */
struct ExperimentConfig {
    unsigned concurrent_queries = 0;
    unsigned votes_per_minute = 0;
    unsigned duration_minutes = 0;

    /**
     * @brief Rejects non-positive fields.
     * @throws std::invalid_argument naming the offending field.
     */
    void validate() const;

    std::chrono::seconds duration_seconds() const {
        return std::chrono::seconds(static_cast<long long>(duration_minutes) * 60);
    }

    // Pause between two vote attempts.
    std::chrono::duration<double> vote_interval_seconds() const {
        return std::chrono::duration<double>(60.0 / static_cast<double>(votes_per_minute));
    }
};

struct MetricsRecord {
    ExperimentConfig config;
    std::chrono::system_clock::time_point timestamp;

    std::vector<double> latencies_ms;
    long long votes_processed = 0;
    long long votes_failed = 0;
    std::vector<double> cpu_samples;        // percent
    std::vector<double> memory_samples;     // MB used
    std::vector<std::string> errors;

    // Derived once every worker of the run has joined
    PercentileMethod percentile_method = PercentileMethod::IndexApprox;
    double latency_mean = 0.0;
    double latency_p95 = 0.0;
    double latency_max = 0.0;
    double duration_actual_seconds = 0.0;
    double throughput_per_minute = 0.0;     // processed votes per minute
    double error_rate_percent = 0.0;
    double cpu_mean_percent = 0.0;
    double memory_mean_mb = 0.0;
};

using ExperimentResultSet = std::vector<MetricsRecord>;

// ISO-8601 local time, e.g. 2025-06-02T17:19:54
std::string format_timestamp(std::chrono::system_clock::time_point tp);
