#pragma once

#include "../clock.hpp"
#include "../operation.hpp"

#include <chrono>

/**
 * @brief Vote submission that waits out a processing latency drawn
 * uniformly from [min_ms, max_ms] and always succeeds. Failures are
 * injected by the VoteWorker.
 */
class SimulatedVote : public IVoteOperation {
    IClock* clock;
    std::uniform_real_distribution<double> latency_ms;
public:
    SimulatedVote(IClock& clock, double min_ms, double max_ms)
        : clock(&clock), latency_ms(min_ms, max_ms) {}

    OperationResult submit(const Ballot& /*ballot*/, std::mt19937& gen) override {
        clock->sleep_for(std::chrono::duration<double, std::milli>(latency_ms(gen)));
        return {};
    }

    std::unique_ptr<IVoteOperation> clone() const override {
        return std::make_unique<SimulatedVote>(*this);
    }
};
