#pragma once

#include "../clock.hpp"
#include "../operation.hpp"

#include <chrono>

/**
 * @brief Read operation that only waits out a latency drawn uniformly
 * from [min_ms, max_ms]. Never fails.
 */
class SimulatedQuery : public IQueryOperation {
    IClock* clock;
    std::uniform_real_distribution<double> latency_ms;
public:
    SimulatedQuery(IClock& clock, double min_ms, double max_ms)
        : clock(&clock), latency_ms(min_ms, max_ms) {}

    OperationResult execute(std::mt19937& gen) override {
        clock->sleep_for(std::chrono::duration<double, std::milli>(latency_ms(gen)));
        return {};
    }

    std::unique_ptr<IQueryOperation> clone() const override {
        return std::make_unique<SimulatedQuery>(*this);
    }
};
