#pragma once

#include "MetricsRecord.hpp"
#include "clock.hpp"
#include "harness_profile.hpp"
#include "operation.hpp"
#include "resource_probe.hpp"

#include <memory>

/**
 * @brief Executes one configuration and returns its finished record.
 */
class IExperimentRunner {
public:
    virtual ~IExperimentRunner() = default;

    /**
     * @throws std::invalid_argument if the configuration is invalid; no
     * worker has been started in that case.
     */
    virtual MetricsRecord run(const ExperimentConfig& config) = 0;
};

/**
 * @brief Runs the resource sampler, `concurrent_queries` query workers and
 * one vote worker on their own threads for the configured duration, joins
 * them all, and reduces what they recorded.
 *
 * Every worker receives its own clone of the operation templates.
 */
class ExperimentRunner : public IExperimentRunner {
public:
    /**
     * @brief Builds simulated or HTTP operations according to profile.mode.
     */
    ExperimentRunner(const HarnessProfile& profile, IClock& clock, IResourceProbe& probe);

    ExperimentRunner(const HarnessProfile& profile, IClock& clock, IResourceProbe& probe,
                     std::unique_ptr<IQueryOperation> query_template,
                     std::unique_ptr<IVoteOperation> vote_template);

    MetricsRecord run(const ExperimentConfig& config) override;

private:
    HarnessProfile profile_;
    IClock& clock_;
    IResourceProbe& probe_;
    std::unique_ptr<IQueryOperation> query_template_;
    std::unique_ptr<IVoteOperation> vote_template_;
};

void print_summary(const MetricsRecord& record);
