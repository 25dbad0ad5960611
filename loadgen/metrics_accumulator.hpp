#pragma once

#include "MetricsRecord.hpp"
#include "clock.hpp"

#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Shared sink for the observations of a single run.
 *
 * Every public append method is thread-safe. Workers hold a Writer for
 * as long as they may append; finalize() refuses to reduce while any
 * Writer is still alive.
 */
class MetricsAccumulator {
public:
    /**
     * @brief RAII registration of one concurrent writer.
     */
    class Writer {
    public:
        explicit Writer(MetricsAccumulator& metrics);
        ~Writer();

        Writer(const Writer&) = delete;
        Writer& operator=(const Writer&) = delete;

        MetricsAccumulator* operator->() { return metrics_; }

    private:
        MetricsAccumulator* metrics_;
    };

    MetricsAccumulator(const ExperimentConfig& config,
                       std::chrono::system_clock::time_point timestamp);

    MetricsAccumulator(const MetricsAccumulator&) = delete;
    MetricsAccumulator& operator=(const MetricsAccumulator&) = delete;

    void add_latency(double ms);
    void add_processed_vote(double latency_ms);
    void add_failed_vote();
    void add_resource_sample(double cpu_percent, double memory_mb);
    void add_error(const std::string& description);

    size_t latency_count() const;

    /**
     * @brief Reduces the observations into a finished record.
     *
     * @param method  Percentile policy for latency_p95.
     * @param elapsed Measured wall time of the whole run.
     * @throws std::logic_error if a Writer is still attached.
     */
    MetricsRecord finalize(PercentileMethod method, IClock::duration elapsed);

private:
    void attach();
    void detach();

    mutable std::mutex mutex_;
    int writers_ = 0;
    bool finalized_ = false;
    MetricsRecord record_;
};
