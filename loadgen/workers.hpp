#pragma once

#include "clock.hpp"
#include "metrics_accumulator.hpp"
#include "operation.hpp"
#include "resource_probe.hpp"

#include <chrono>
#include <memory>
#include <random>

/*
 * Concurrent units of one experiment run. Each one is driven by its own
 * thread, waits for the shared start instant, and keeps going until
 * start + duration has passed. An operation in flight at the deadline is
 * allowed to finish. run() returns the instant the worker stopped.
 */

/**
 * @brief Samples host CPU and memory at a fixed cadence.
 */
class ResourceSampler {
public:
    ResourceSampler(IClock& clock, IResourceProbe& probe, std::chrono::seconds interval);

    IClock::time_point run(MetricsAccumulator& metrics, IClock::time_point start,
                           IClock::duration duration);

private:
    IClock& clock_;
    IResourceProbe& probe_;
    std::chrono::seconds interval_;
};

/**
 * @brief One stream of read operations separated by a fixed pause.
 */
class QueryWorker {
public:
    QueryWorker(IClock& clock, std::unique_ptr<IQueryOperation> operation,
                std::chrono::milliseconds pause, WorkerSeed seed);

    IClock::time_point run(MetricsAccumulator& metrics, IClock::time_point start,
                           IClock::duration duration);

private:
    IClock& clock_;
    std::unique_ptr<IQueryOperation> operation_;
    std::chrono::milliseconds pause_;
    std::mt19937 gen_;
};

/**
 * @brief One stream of vote submissions paced at a target rate.
 *
 * Each attempt counts as exactly one processed or one failed vote. A
 * vote the target accepted is still marked failed with
 * `failure_probability`, simulating intermittent rejections.
 */
class VoteWorker {
public:
    VoteWorker(IClock& clock, std::unique_ptr<IVoteOperation> operation,
               double failure_probability, unsigned candidate_count, WorkerSeed seed);

    IClock::time_point run(MetricsAccumulator& metrics, IClock::time_point start,
                           std::chrono::duration<double> interval, IClock::duration duration);

    static Ballot make_ballot(long long counter, unsigned candidate_count);

private:
    IClock& clock_;
    std::unique_ptr<IVoteOperation> operation_;
    std::bernoulli_distribution failure_;
    unsigned candidate_count_;
    std::mt19937 gen_;
};
