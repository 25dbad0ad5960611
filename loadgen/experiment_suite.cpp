#include "experiment_suite.hpp"

#include <iostream>
#include <stdexcept>

ExperimentSuite::ExperimentSuite(IExperimentRunner& runner, IClock& clock, std::chrono::seconds cooldown)
    : runner_(runner), clock_(clock), cooldown_(cooldown) {}

ExperimentResultSet ExperimentSuite::run(const std::vector<ExperimentConfig>& configs,
                                         const RecordSink& on_record) {
    for (size_t i = 0; i < configs.size(); ++i) {
        try {
            configs[i].validate();
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("Configuration " + std::to_string(i + 1) + ": " + e.what());
        }
    }

    std::cout << "=== Starting experiments ===\n"
              << "Total configurations: " << configs.size() << "\n";

    ExperimentResultSet results;
    results.reserve(configs.size());

    for (size_t i = 0; i < configs.size(); ++i) {
        const ExperimentConfig& c = configs[i];
        std::cout << "\n--- Experiment " << (i + 1) << "/" << configs.size() << " ---\n"
                  << "Concurrent queries: " << c.concurrent_queries << "\n"
                  << "Votes per minute:   " << c.votes_per_minute << "\n"
                  << "Duration:           " << c.duration_minutes << " minutes\n";

        results.push_back(runner_.run(c));
        if (on_record) on_record(results.back());

        if (i + 1 < configs.size()) {
            std::cout << "Waiting " << cooldown_.count() << " seconds before the next experiment...\n";
            clock_.sleep_for(cooldown_);
        }
    }
    return results;
}
