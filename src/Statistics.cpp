#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats{0, 0, 0, 0, 0, 0};
    if (col.empty()) return stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    if (finite.empty()) return stats;

    const size_t n = finite.size();

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);

    std::vector<double> medianWork = finite;
    size_t mid = n / 2;
    std::nth_element(medianWork.begin(), medianWork.begin() + mid, medianWork.end());
    double upper = medianWork[mid];
    if (n % 2 == 0) {
        std::nth_element(medianWork.begin(), medianWork.begin() + (mid - 1), medianWork.begin() + mid);
        stats.median = (medianWork[mid - 1] + upper) / 2.0;
    } else {
        stats.median = upper;
    }

    if (n > 2 && stats.stddev > 0) {
        double m3 = 0, m4 = 0;
        for (double val : finite) {
            double diff = val - stats.mean;
            double diff2 = diff * diff;
            m3 += diff2 * diff;
            m4 += diff2 * diff2;
        }

        const double nd = static_cast<double>(n);
        double term1 = nd / ((nd - 1.0) * (nd - 2.0));
        double stddev2 = stats.stddev * stats.stddev;
        double stddev3 = stddev2 * stats.stddev;
        stats.skewness = term1 * (m3 / stddev3);

        if (n > 3) {
            double termK1 = (nd * (nd + 1.0)) / ((nd - 1.0) * (nd - 2.0) * (nd - 3.0));
            double nMinus1 = (nd - 1.0);
            double termK2 = (3.0 * nMinus1 * nMinus1) / ((nd - 2.0) * (nd - 3.0));
            double stddev4 = stddev2 * stddev2;
            stats.kurtosis = termK1 * (m4 / stddev4) - termK2;
        }
    }

    return stats;
}

double Statistics::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double Statistics::populationVariance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double mu = mean(values);
    double sum = 0.0;
    for (double v : values) sum += (v - mu) * (v - mu);
    return sum / static_cast<double>(values.size());
}

double Statistics::populationStdDev(const std::vector<double>& values) {
    return std::sqrt(populationVariance(values));
}

LineFit Statistics::fitLine(const std::vector<double>& series) {
    LineFit fit;
    const size_t n = series.size();
    if (n == 0) return fit;
    if (n == 1) {
        fit.intercept = series.front();
        return fit;
    }

    const double nd = static_cast<double>(n);
    double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumXX = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        sumX += x;
        sumY += series[i];
        sumXY += x * series[i];
        sumXX += x * x;
    }
    const double denom = nd * sumXX - sumX * sumX;
    fit.slope = (denom != 0.0) ? (nd * sumXY - sumX * sumY) / denom : 0.0;
    fit.intercept = (sumY - fit.slope * sumX) / nd;

    const double yMean = sumY / nd;
    double ssTot = 0.0;
    double ssRes = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double predicted = fit.slope * static_cast<double>(i) + fit.intercept;
        ssTot += (series[i] - yMean) * (series[i] - yMean);
        ssRes += (series[i] - predicted) * (series[i] - predicted);
    }
    // A flat series has no variance to explain.
    fit.rSquared = (ssTot > 0.0) ? std::max(0.0, 1.0 - ssRes / ssTot) : 0.0;
    return fit;
}

double Statistics::expectedPathLength(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    constexpr double kEulerMascheroni = 0.5772156649;
    const double nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + kEulerMascheroni) - 2.0 * (nd - 1.0) / nd;
}
