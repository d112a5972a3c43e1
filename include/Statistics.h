#pragma once

#include <cstddef>
#include <vector>

namespace envdiag {
namespace stats {

struct Descriptive {
    std::size_t n = 0;
    double mean = 0.0;
    double median = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double max = 0.0;
};

// Linear interpolation between closest ranks, p in [0,1].
// Empty input returns 0.
double percentile(std::vector<double> values, double p);

double mean(const std::vector<double>& values);
double maxValue(const std::vector<double>& values);

// All fields zero (n included) for empty input.
Descriptive describe(const std::vector<double>& values);

} // namespace stats
} // namespace envdiag
