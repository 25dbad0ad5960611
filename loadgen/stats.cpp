#include "stats.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double max_value(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return *std::max_element(values.begin(), values.end());
}

double p95_index_approx(const std::vector<double>& sorted) {
    if (sorted.empty()) return 0.0;
    size_t idx = static_cast<size_t>(static_cast<double>(sorted.size()) * 0.95);
    return sorted[idx];
}

double quantile_exclusive(const std::vector<double>& sorted, int intervals, int index) {
    if (intervals < 1 || index < 0 || index >= intervals - 1) {
        throw std::invalid_argument("quantile cut point out of range");
    }
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();

    const long long n = intervals;
    const long long ld = static_cast<long long>(sorted.size());
    const long long m = ld + 1;
    const long long i = index + 1;

    long long j = i * m / n;
    if (j < 1) j = 1;
    if (j > ld - 1) j = ld - 1;
    // delta may fall outside [0, n] after clamping; that extrapolates linearly
    const long long delta = i * m - j * n;

    return (sorted[j - 1] * static_cast<double>(n - delta)
            + sorted[j] * static_cast<double>(delta)) / static_cast<double>(n);
}

double p95(const std::vector<double>& sorted, PercentileMethod method) {
    switch (method) {
        case PercentileMethod::IndexApprox:
            return p95_index_approx(sorted);
        case PercentileMethod::InterpolatedQuantile:
            return quantile_exclusive(sorted, 20, 18);
    }
    throw std::invalid_argument("Unknown percentile method");
}
