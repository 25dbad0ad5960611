#include "workers.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

double elapsed_ms(IClock::time_point from, IClock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

}  // namespace

// --- ResourceSampler ---

ResourceSampler::ResourceSampler(IClock& clock, IResourceProbe& probe, std::chrono::seconds interval)
    : clock_(clock), probe_(probe), interval_(interval) {}

IClock::time_point ResourceSampler::run(MetricsAccumulator& metrics, IClock::time_point start,
                                        IClock::duration duration) {
    MetricsAccumulator::Writer out(metrics);
    clock_.sleep_until(start);
    const auto deadline = start + duration;

    while (clock_.now() < deadline) {
        try {
            ResourceSample s = probe_.sample();
            out->add_resource_sample(s.cpu_percent, s.memory_used_mb);
        } catch (const std::exception& e) {
            out->add_error(std::string("Resource sampling error: ") + e.what());
        }
        clock_.sleep_for(interval_);
    }
    return clock_.now();
}

// --- QueryWorker ---

QueryWorker::QueryWorker(IClock& clock, std::unique_ptr<IQueryOperation> operation,
                         std::chrono::milliseconds pause, WorkerSeed seed)
    : clock_(clock), operation_(std::move(operation)), pause_(pause), gen_(seeded_generator(seed)) {}

IClock::time_point QueryWorker::run(MetricsAccumulator& metrics, IClock::time_point start,
                                    IClock::duration duration) {
    MetricsAccumulator::Writer out(metrics);
    clock_.sleep_until(start);
    const auto deadline = start + duration;

    while (clock_.now() < deadline) {
        try {
            auto begin = clock_.now();
            OperationResult res = operation_->execute(gen_);
            auto end = clock_.now();

            // A non-200 answer still took that long; keep the latency.
            out->add_latency(elapsed_ms(begin, end));
            if (!res.ok) {
                out->add_error(res.detail);
            }
        } catch (const std::exception& e) {
            out->add_error(std::string("Query error: ") + e.what());
        }
        clock_.sleep_for(pause_);
    }
    return clock_.now();
}

// --- VoteWorker ---

VoteWorker::VoteWorker(IClock& clock, std::unique_ptr<IVoteOperation> operation,
                       double failure_probability, unsigned candidate_count, WorkerSeed seed)
    : clock_(clock), operation_(std::move(operation)), candidate_count_(candidate_count),
      gen_(seeded_generator(seed)) {
    if (failure_probability < 0.0 || failure_probability > 1.0) {
        throw std::invalid_argument("failure_probability must be within [0, 1]");
    }
    if (candidate_count_ == 0) {
        throw std::invalid_argument("candidate_count must be greater than 0");
    }
    failure_ = std::bernoulli_distribution(failure_probability);
}

Ballot VoteWorker::make_ballot(long long counter, unsigned candidate_count) {
    auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return Ballot{
        "VOTE_" + std::to_string(counter) + "_" + std::to_string(unix_seconds),
        "CAND_" + std::to_string(counter % candidate_count + 1)
    };
}

IClock::time_point VoteWorker::run(MetricsAccumulator& metrics, IClock::time_point start,
                                   std::chrono::duration<double> interval, IClock::duration duration) {
    MetricsAccumulator::Writer out(metrics);
    clock_.sleep_until(start);
    const auto deadline = start + duration;
    long long counter = 0;

    while (clock_.now() < deadline) {
        try {
            Ballot ballot = make_ballot(counter, candidate_count_);

            auto begin = clock_.now();
            OperationResult res = operation_->submit(ballot, gen_);
            auto end = clock_.now();

            if (!res.ok) {
                out->add_failed_vote();
                out->add_error("Vote error: " + res.detail);
            } else if (failure_(gen_)) {
                out->add_failed_vote();
            } else {
                out->add_processed_vote(elapsed_ms(begin, end));
            }
        } catch (const std::exception& e) {
            out->add_failed_vote();
            out->add_error(std::string("Vote error: ") + e.what());
        }
        counter++;
        clock_.sleep_for(interval);
    }
    return clock_.now();
}
