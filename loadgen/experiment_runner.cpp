#include "experiment_runner.hpp"
#include "metrics_accumulator.hpp"
#include "workers.hpp"
#include "operations/http_query.hpp"
#include "operations/http_vote.hpp"
#include "operations/simulated_query.hpp"
#include "operations/simulated_vote.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::unique_ptr<IQueryOperation> make_query_template(const HarnessProfile& profile, IClock& clock) {
    if (profile.mode == TargetMode::Http) {
        return std::make_unique<HttpQuery>(profile.target);
    }
    return std::make_unique<SimulatedQuery>(clock, profile.query_latency_min_ms, profile.query_latency_max_ms);
}

std::unique_ptr<IVoteOperation> make_vote_template(const HarnessProfile& profile, IClock& clock) {
    if (profile.mode == TargetMode::Http) {
        return std::make_unique<HttpVote>(profile.target);
    }
    return std::make_unique<SimulatedVote>(clock, profile.vote_latency_min_ms, profile.vote_latency_max_ms);
}

// Worker seeds wrap modulo 2^32, so every base seed yields distinct fixed streams.
WorkerSeed worker_seed(int seed, unsigned index) {
    if (seed == -1) return std::nullopt;
    return static_cast<std::uint32_t>(seed) + static_cast<std::uint32_t>(index);
}

}  // namespace

ExperimentRunner::ExperimentRunner(const HarnessProfile& profile, IClock& clock, IResourceProbe& probe)
    : ExperimentRunner(profile, clock, probe,
                       make_query_template(profile, clock), make_vote_template(profile, clock)) {}

ExperimentRunner::ExperimentRunner(const HarnessProfile& profile, IClock& clock, IResourceProbe& probe,
                                   std::unique_ptr<IQueryOperation> query_template,
                                   std::unique_ptr<IVoteOperation> vote_template)
    : profile_(profile), clock_(clock), probe_(probe),
      query_template_(std::move(query_template)), vote_template_(std::move(vote_template)) {}

MetricsRecord ExperimentRunner::run(const ExperimentConfig& config) {
    config.validate();

    const auto duration = std::chrono::duration_cast<IClock::duration>(config.duration_seconds());
    const auto interval = config.vote_interval_seconds();

    // Workers are fully constructed before the first thread starts.
    ResourceSampler sampler(clock_, probe_, profile_.sampling_interval);
    std::vector<QueryWorker> queries;
    queries.reserve(config.concurrent_queries);
    for (unsigned i = 0; i < config.concurrent_queries; ++i) {
        queries.emplace_back(clock_, query_template_->clone(), profile_.query_pause,
                             worker_seed(profile_.seed, i));
    }
    VoteWorker voter(clock_, vote_template_->clone(), profile_.failure_probability,
                     profile_.candidate_count, worker_seed(profile_.seed, config.concurrent_queries));

    std::cout << "   Simulating workload: " << config.concurrent_queries << " query workers, "
              << config.votes_per_minute << " votes/min for " << config.duration_minutes << " min\n";

    MetricsAccumulator metrics(config, std::chrono::system_clock::now());
    const auto start = clock_.now();

    // Slot 0: sampler, 1..N: query workers, N+1: vote worker
    std::vector<IClock::time_point> stopped(config.concurrent_queries + 2, start);
    std::vector<std::thread> threads;
    threads.reserve(stopped.size());

    try {
        threads.emplace_back([&] {
            stopped[0] = sampler.run(metrics, start, duration);
        });
        for (unsigned i = 0; i < config.concurrent_queries; ++i) {
            threads.emplace_back([&, i] {
                stopped[i + 1] = queries[i].run(metrics, start, duration);
            });
        }
        threads.emplace_back([&] {
            stopped.back() = voter.run(metrics, start, interval, duration);
        });
    } catch (...) {
        // Could not spawn every thread; let the started ones finish before unwinding.
        for (auto& t : threads) t.join();
        throw;
    }

    for (auto& t : threads) t.join();

    // A worker may overrun the deadline by one operation.
    auto end = std::max(clock_.now(), *std::max_element(stopped.begin(), stopped.end()));
    MetricsRecord record = metrics.finalize(profile_.percentile, end - start);

    print_summary(record);
    return record;
}

void print_summary(const MetricsRecord& r) {
    std::cout << "\n--- Experiment Complete (" << r.config.concurrent_queries << " queries, "
              << r.config.votes_per_minute << " votes/min) ---\n"
              << std::fixed << std::setprecision(2)
              << "Votes processed: " << r.votes_processed << "\n"
              << "Votes failed:    " << r.votes_failed << "\n"
              << "Duration:        " << r.duration_actual_seconds << " s\n"
              << "Throughput:      " << r.throughput_per_minute << " votes/min\n"
              << "Error rate:      " << r.error_rate_percent << " %\n"
              << "Avg. latency:    " << r.latency_mean << " ms\n"
              << "P95 latency:     " << r.latency_p95 << " ms (" << to_string(r.percentile_method) << ")\n"
              << "Max latency:     " << r.latency_max << " ms\n"
              << "Avg. CPU:        " << r.cpu_mean_percent << " %\n"
              << "Avg. memory:     " << r.memory_mean_mb << " MB\n"
              << "Errors logged:   " << r.errors.size() << "\n";
}
