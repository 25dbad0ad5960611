#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <iomanip>

#include "experiment_runner.hpp"
#include "experiment_suite.hpp"
#include "harness_profile.hpp"
#include "resource_probe.hpp"
#include "utils.h"

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <profile> [seed] [target_url]\n"
                  << "Profiles: quick, performance\n"
                  << "Without target_url every operation is simulated locally.\n"
                  << "Example: " << argv[0] << " quick\n"
                  << "Example (fixed seed, live target): " << argv[0]
                  << " performance 12345 http://localhost:9090\n";
        return 1;
    }

    HarnessProfile profile;
    try {
        profile = profile_by_name(argv[1]);

        if (argc >= 3) {
            profile.seed = std::stoi(argv[2]);
        }
        if (argc == 4) {
            profile.mode = TargetMode::Http;
            profile.target.base_url = argv[3];
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Starting load test...\n"
              << "   Profile:   " << profile.name << "\n"
              << "   Target:    "
              << (profile.mode == TargetMode::Http ? profile.target.base_url : std::string("simulated")) << "\n"
              << "   Cooldown:  " << profile.cooldown.count() << " s\n";
    if (profile.seed != -1) {
        std::cout << "   Seed:      " << profile.seed << " (Deterministic, varied per worker)\n\n";
    } else {
        std::cout << "   Seed:      Random\n\n";
    }

    const std::string results_path = "results.json";
    try {
        SteadyClock clock;
        ProcResourceProbe probe(clock, profile.cpu_window);
        ExperimentRunner runner(profile, clock, probe);
        ExperimentSuite suite(runner, clock, profile.cooldown);

        // Each record is appended as soon as its run finishes
        ExperimentResultSet results = suite.run(profile.configurations, [&](const MetricsRecord& r) {
            append_result_to_file(r, results_path);
            std::cout << "Result saved to " << results_path << "\n";
        });

        int saturated = find_saturation_point(results);
        std::cout << "\n=== Saturation point ===\n";
        if (saturated >= 0) {
            const auto& c = results[saturated].config;
            std::cout << "Detected at: " << c.concurrent_queries << " queries, "
                      << c.votes_per_minute << " votes/min ("
                      << std::fixed << std::setprecision(2)
                      << results[saturated].error_rate_percent << " % errors)\n";
        } else {
            std::cout << "Not reached in any configuration\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Load test aborted: " << e.what() << "\n";
        return 1;
    }

    std::cout << "All experiments complete. Results written to '" << results_path << "'\n";
    return 0;
}
