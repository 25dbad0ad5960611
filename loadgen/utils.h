#pragma once

#include "MetricsRecord.hpp"
#include <string>

// Serializes every field of the record, raw samples included.
std::string record_to_json(const MetricsRecord& r);

void append_result_to_file(const MetricsRecord& r, const std::string& path);

// Index of the first record, in run order, whose error rate exceeds
// threshold_percent; -1 if none does.
int find_saturation_point(const ExperimentResultSet& results, double threshold_percent = 5.0);
