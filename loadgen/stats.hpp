#pragma once

#include "MetricsRecord.hpp"
#include <vector>

// All functions return 0.0 for an empty input.

double mean(const std::vector<double>& values);

double max_value(const std::vector<double>& values);

/**
 * @brief sorted[floor(0.95 * n)], no interpolation.
 *
 * Biased toward the maximum at small n: with fewer than 20 samples this
 * is always the largest value.
 * @param sorted Samples in ascending order.
 */
double p95_index_approx(const std::vector<double>& sorted);

/**
 * @brief Cut point `index` (0-based) of `intervals`-quantiles using the
 * exclusive method (rank i * (n + 1) / intervals, linear interpolation,
 * rank clamped to [1, n - 1]).
 *
 * p95 is quantile_exclusive(sorted, 20, 18). A single sample is returned
 * unchanged.
 * @param sorted Samples in ascending order.
 */
double quantile_exclusive(const std::vector<double>& sorted, int intervals, int index);

double p95(const std::vector<double>& sorted, PercentileMethod method);
