#include "metrics_accumulator.hpp"
#include "stats.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

MetricsAccumulator::Writer::Writer(MetricsAccumulator& metrics) : metrics_(&metrics) {
    metrics_->attach();
}

MetricsAccumulator::Writer::~Writer() {
    metrics_->detach();
}

MetricsAccumulator::MetricsAccumulator(const ExperimentConfig& config,
                                       std::chrono::system_clock::time_point timestamp) {
    record_.config = config;
    record_.timestamp = timestamp;
}

void MetricsAccumulator::attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) {
        throw std::logic_error("Cannot attach a writer to finalized metrics");
    }
    ++writers_;
}

void MetricsAccumulator::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    --writers_;
}

void MetricsAccumulator::add_latency(double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.latencies_ms.push_back(ms);
}

void MetricsAccumulator::add_processed_vote(double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.votes_processed++;
    record_.latencies_ms.push_back(latency_ms);
}

void MetricsAccumulator::add_failed_vote() {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.votes_failed++;
}

void MetricsAccumulator::add_resource_sample(double cpu_percent, double memory_mb) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.cpu_samples.push_back(cpu_percent);
    record_.memory_samples.push_back(memory_mb);
}

void MetricsAccumulator::add_error(const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.errors.push_back(description);
}

size_t MetricsAccumulator::latency_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.latencies_ms.size();
}

MetricsRecord MetricsAccumulator::finalize(PercentileMethod method, IClock::duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (writers_ != 0) {
        throw std::logic_error("Cannot finalize metrics while " + std::to_string(writers_) +
                               " writer(s) are still running");
    }
    if (finalized_) {
        throw std::logic_error("Metrics already finalized");
    }
    finalized_ = true;

    MetricsRecord r = std::move(record_);

    // Reduce over a sorted copy so the result does not depend on the
    // order in which workers appended.
    std::vector<double> sorted = r.latencies_ms;
    std::sort(sorted.begin(), sorted.end());

    r.percentile_method = method;
    r.latency_mean = mean(sorted);
    r.latency_p95 = p95(sorted, method);
    r.latency_max = max_value(sorted);

    r.duration_actual_seconds = std::chrono::duration<double>(elapsed).count();
    r.throughput_per_minute = r.duration_actual_seconds > 0.0
        ? static_cast<double>(r.votes_processed) / (r.duration_actual_seconds / 60.0)
        : 0.0;

    long long total_votes = r.votes_processed + r.votes_failed;
    r.error_rate_percent = total_votes > 0
        ? static_cast<double>(r.votes_failed) / static_cast<double>(total_votes) * 100.0
        : 0.0;

    r.cpu_mean_percent = mean(r.cpu_samples);
    r.memory_mean_mb = mean(r.memory_samples);
    return r;
}
