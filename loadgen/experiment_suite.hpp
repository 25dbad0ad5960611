#pragma once

#include "MetricsRecord.hpp"
#include "clock.hpp"
#include "experiment_runner.hpp"

#include <chrono>
#include <functional>
#include <vector>

/**
 * @brief Runs configurations one after another, never overlapping, with a
 * cooldown between consecutive runs so host load settles.
 */
class ExperimentSuite {
public:
    // Called with each record as soon as its run finishes.
    using RecordSink = std::function<void(const MetricsRecord&)>;

    ExperimentSuite(IExperimentRunner& runner, IClock& clock, std::chrono::seconds cooldown);

    /**
     * @brief Every configuration is validated before the first one runs.
     * @return One record per configuration, in input order.
     * @throws std::invalid_argument on the first invalid configuration.
     */
    ExperimentResultSet run(const std::vector<ExperimentConfig>& configs,
                            const RecordSink& on_record = {});

private:
    IExperimentRunner& runner_;
    IClock& clock_;
    std::chrono::seconds cooldown_;
};
