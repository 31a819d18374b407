#pragma once

#include <cstddef>
#include <vector>

struct ColumnStats {
    double mean;
    double median;
    double variance;
    double stddev;
    double skewness;
    double kurtosis;
};

// Ordinary least squares of a series against its index 0..n-1.
struct LineFit {
    double slope = 0.0;
    double intercept = 0.0;
    double rSquared = 0.0;
};

namespace Statistics {
ColumnStats calculateStats(const std::vector<double>& col);
double mean(const std::vector<double>& values);
double populationVariance(const std::vector<double>& values);
double populationStdDev(const std::vector<double>& values);
LineFit fitLine(const std::vector<double>& series);
// Average unsuccessful-search path length of a BST over n keys, c(n).
double expectedPathLength(size_t n);
}
