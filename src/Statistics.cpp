#include "Statistics.h"

#include <algorithm>
#include <numeric>

namespace envdiag {
namespace stats {

namespace {
double sortedPercentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    if (sorted.size() == 1) return sorted.front();
    const double clamped_p = std::clamp(p, 0.0, 1.0);
    const double pos = clamped_p * static_cast<double>(sorted.size() - 1);
    const std::size_t idx = static_cast<std::size_t>(pos);
    const double frac = pos - static_cast<double>(idx);
    if (idx + 1 >= sorted.size()) return sorted.back();
    return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
}
} // namespace

double percentile(std::vector<double> values, double p) {
    std::sort(values.begin(), values.end());
    return sortedPercentile(values, p);
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double maxValue(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return *std::max_element(values.begin(), values.end());
}

Descriptive describe(const std::vector<double>& values) {
    Descriptive d{};
    if (values.empty()) {
        return d;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    d.n = sorted.size();
    d.mean = mean(sorted);
    d.median = sortedPercentile(sorted, 0.5);
    d.q1 = sortedPercentile(sorted, 0.25);
    d.q3 = sortedPercentile(sorted, 0.75);
    d.iqr = d.q3 - d.q1;
    d.max = sorted.back();
    return d;
}

} // namespace stats
} // namespace envdiag
