#include "OutlierDetection.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <utility>

namespace {
constexpr double kMadConsistency = 0.6745;
constexpr double kMeanAdConsistency = 1.253314;

std::vector<size_t> flagAbove(const std::vector<double>& scores, double threshold) {
    std::vector<size_t> out;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] > threshold) out.push_back(i);
    }
    return out;
}

double nonZeroOr(double value, double fallback) {
    return (std::abs(value) > MathUtils::getNumericEpsilon()) ? value : fallback;
}

// k nearest neighbours of data[i] on the line, excluding i itself.
std::vector<std::pair<double, size_t>> nearestOnLine(const std::vector<double>& data, size_t i, size_t k) {
    std::vector<std::pair<double, size_t>> dists;
    dists.reserve(data.size() - 1);
    for (size_t j = 0; j < data.size(); ++j) {
        if (j != i) dists.emplace_back(std::abs(data[i] - data[j]), j);
    }
    std::partial_sort(dists.begin(), dists.begin() + static_cast<std::ptrdiff_t>(k), dists.end());
    dists.resize(k);
    return dists;
}
} // namespace

OutlierDetection::OutlierDetection(OutlierOptions options) : m_options(options), m_rng(options.seed) {}

OutlierDetection::OutlierDetection(uint32_t seed) : m_rng(seed) {
    m_options.seed = seed;
}

OutlierResult OutlierDetection::zScore(const std::vector<double>& data) const {
    return zScore(data, m_options.zThreshold);
}

OutlierResult OutlierDetection::modifiedZScore(const std::vector<double>& data) const {
    return modifiedZScore(data, m_options.modifiedZThreshold);
}

OutlierResult OutlierDetection::iqr(const std::vector<double>& data) const {
    return iqr(data, m_options.iqrMultiplier);
}

OutlierResult OutlierDetection::isolationForest(const std::vector<double>& data) {
    return isolationForest(data,
                           m_options.isolationTrees,
                           m_options.isolationSampleSize,
                           m_options.isolationContamination,
                           m_options.isolationMaxDepth);
}

OutlierResult OutlierDetection::lof(const std::vector<double>& data) const {
    return lof(data, m_options.lofNeighbors, m_options.lofThreshold);
}

OutlierResult OutlierDetection::movingAverage(const std::vector<double>& data) const {
    return movingAverage(data, m_options.movingAverageWindow, m_options.movingAverageThreshold);
}

OutlierResult OutlierDetection::zScore(const std::vector<double>& data, double threshold) const {
    OutlierResult result;
    result.method = "Z-Score";
    result.threshold = threshold;
    if (data.empty()) return result;

    const double mean = Statistics::mean(data);
    const double sd = nonZeroOr(Statistics::populationStdDev(data), 1.0);
    result.scores.reserve(data.size());
    for (double v : data) result.scores.push_back(std::abs((v - mean) / sd));
    result.outliers = flagAbove(result.scores, threshold);
    return result;
}

OutlierResult OutlierDetection::modifiedZScore(const std::vector<double>& data, double threshold) const {
    OutlierResult result;
    result.method = "Modified Z-Score (MAD)";
    result.threshold = threshold;
    if (data.empty()) return result;

    const double median = CommonUtils::medianByNth(data);
    std::vector<double> deviations;
    deviations.reserve(data.size());
    for (double v : data) deviations.push_back(std::abs(v - median));
    const double mad = CommonUtils::medianByNth(deviations);
    const double meanAd = Statistics::mean(deviations);
    const double eps = MathUtils::getNumericEpsilon();

    result.scores.reserve(data.size());
    for (double d : deviations) {
        if (mad > eps) {
            result.scores.push_back(kMadConsistency * d / mad);
        } else if (meanAd > eps) {
            result.scores.push_back(d / (kMeanAdConsistency * meanAd));
        } else {
            result.scores.push_back(0.0);
        }
    }
    result.outliers = flagAbove(result.scores, threshold);
    return result;
}

OutlierResult OutlierDetection::iqr(const std::vector<double>& data, double multiplier) const {
    OutlierResult result;
    result.method = "IQR";
    result.threshold = multiplier;
    if (data.empty()) return result;

    const double q1 = CommonUtils::quantileByNth(data, 0.25);
    const double q3 = CommonUtils::quantileByNth(data, 0.75);
    const double spread = q3 - q1;
    const double lower = q1 - multiplier * spread;
    const double upper = q3 + multiplier * spread;
    const double unit = nonZeroOr(spread, 1.0);

    result.scores.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        const double v = data[i];
        if (v < lower) {
            result.scores.push_back((lower - v) / unit);
            result.outliers.push_back(i);
        } else if (v > upper) {
            result.scores.push_back((v - upper) / unit);
            result.outliers.push_back(i);
        } else {
            result.scores.push_back(0.0);
        }
    }
    return result;
}

OutlierResult OutlierDetection::isolationForest(const std::vector<double>& data,
                                                size_t numTrees,
                                                size_t sampleSize,
                                                double contamination,
                                                size_t maxDepth) {
    OutlierResult result;
    result.method = "Isolation Forest";
    if (data.empty()) return result;
    if (numTrees == 0) throw Circadia::ConfigurationException("isolation forest needs at least one tree");
    if (contamination < 0.0 || contamination >= 1.0) {
        throw Circadia::ConfigurationException("contamination must be within [0,1)");
    }

    const size_t n = data.size();
    const size_t subsample = std::min(n, sampleSize == 0 ? std::min<size_t>(256, n) : sampleSize);
    std::vector<size_t> indices(n);
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<double> pathSums(n, 0.0);
    std::vector<double> partition;
    std::vector<double> side;
    for (size_t t = 0; t < numTrees; ++t) {
        std::shuffle(indices.begin(), indices.end(), m_rng);
        std::vector<double> sample;
        sample.reserve(subsample);
        for (size_t s = 0; s < subsample; ++s) sample.push_back(data[indices[s]]);

        // One random split sequence per tree, replayed for every value.
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        std::vector<double> splitDraws(maxDepth);
        for (double& d : splitDraws) d = unit(m_rng);

        for (size_t i = 0; i < n; ++i) {
            partition = sample;
            size_t depth = 0;
            while (partition.size() > 1 && depth < maxDepth) {
                const auto [loIt, hiIt] = std::minmax_element(partition.begin(), partition.end());
                const double lo = *loIt;
                const double hi = *hiIt;
                if (hi <= lo) break;
                const double split = lo + splitDraws[depth] * (hi - lo);
                ++depth;
                const bool goLeft = data[i] < split;
                side.clear();
                for (double v : partition) {
                    if ((v < split) == goLeft) side.push_back(v);
                }
                partition.swap(side);
            }
            pathSums[i] += static_cast<double>(depth) + Statistics::expectedPathLength(partition.size());
        }
    }

    const double normalizer = Statistics::expectedPathLength(subsample);
    result.scores.reserve(n);
    for (double sum : pathSums) {
        const double avgPath = sum / static_cast<double>(numTrees);
        result.scores.push_back(normalizer > 0.0 ? std::pow(2.0, -avgPath / normalizer) : 0.5);
    }

    std::vector<double> sortedScores = result.scores;
    std::sort(sortedScores.begin(), sortedScores.end(), std::greater<double>());
    const size_t thresholdIndex = std::min(n - 1, static_cast<size_t>(std::floor(static_cast<double>(n) * contamination)));
    result.threshold = sortedScores[thresholdIndex];
    for (size_t i = 0; i < n; ++i) {
        if (result.scores[i] >= result.threshold) result.outliers.push_back(i);
    }
    return result;
}

OutlierResult OutlierDetection::lof(const std::vector<double>& data, size_t k, double threshold) const {
    OutlierResult result;
    result.method = "Local Outlier Factor";
    result.threshold = threshold;
    if (data.empty()) return result;
    if (k == 0) throw Circadia::ConfigurationException("LOF needs k >= 1");
    if (data.size() < 2) {
        result.scores.assign(data.size(), 1.0);
        return result;
    }

    const size_t n = data.size();
    const size_t kk = std::min(k, n - 1);
    std::vector<std::vector<std::pair<double, size_t>>> neighbors(n);
    std::vector<double> kDistance(n);
    for (size_t i = 0; i < n; ++i) {
        neighbors[i] = nearestOnLine(data, i, kk);
        kDistance[i] = neighbors[i].back().first;
    }

    std::vector<double> lrd(n);
    for (size_t i = 0; i < n; ++i) {
        double reach = 0.0;
        for (const auto& [dist, j] : neighbors[i]) reach += std::max(dist, kDistance[j]);
        lrd[i] = 1.0 / std::max(reach / static_cast<double>(kk), MathUtils::getNumericEpsilon());
    }

    result.scores.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double neighborLrd = 0.0;
        for (const auto& entry : neighbors[i]) neighborLrd += lrd[entry.second];
        result.scores.push_back((neighborLrd / static_cast<double>(kk)) / lrd[i]);
    }
    result.outliers = flagAbove(result.scores, threshold);
    return result;
}

OutlierResult OutlierDetection::dbscan(const std::vector<double>& data, double epsilon, size_t minPoints) const {
    constexpr int kUnvisited = -1;
    constexpr int kNoise = -2;

    OutlierResult result;
    result.method = "DBSCAN";
    result.threshold = epsilon;
    if (!(epsilon >= 0.0)) throw Circadia::ConfigurationException("DBSCAN epsilon must be >= 0");

    const size_t n = data.size();
    const auto neighborsOf = [&](size_t index) {
        std::vector<size_t> out;
        for (size_t j = 0; j < n; ++j) {
            if (j != index && std::abs(data[j] - data[index]) <= epsilon) out.push_back(j);
        }
        return out;
    };

    std::vector<int> labels(n, kUnvisited);
    int clusterId = 0;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] != kUnvisited) continue;
        const std::vector<size_t> seeds = neighborsOf(i);
        if (seeds.size() < minPoints) {
            labels[i] = kNoise;
            continue;
        }

        labels[i] = clusterId;
        std::vector<size_t> queue(seeds.begin(), seeds.end());
        for (size_t head = 0; head < queue.size(); ++head) {
            const size_t q = queue[head];
            if (labels[q] == kNoise) labels[q] = clusterId;
            if (labels[q] != kUnvisited) continue;
            labels[q] = clusterId;
            const std::vector<size_t> qNeighbors = neighborsOf(q);
            if (qNeighbors.size() >= minPoints) {
                for (size_t nb : qNeighbors) {
                    if (labels[nb] == kUnvisited || labels[nb] == kNoise) queue.push_back(nb);
                }
            }
        }
        ++clusterId;
    }

    result.scores.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const bool noise = labels[i] == kNoise;
        result.scores.push_back(noise ? 1.0 : 0.0);
        if (noise) result.outliers.push_back(i);
    }
    return result;
}

std::vector<AnomalyScore> OutlierDetection::movingAverageScores(const std::vector<double>& data,
                                                                size_t window,
                                                                double threshold) const {
    if (window == 0) throw Circadia::ConfigurationException("moving-average window must be >= 1");
    std::vector<AnomalyScore> out;
    for (size_t i = window; i < data.size(); ++i) {
        const std::vector<double> trailing(data.begin() + static_cast<std::ptrdiff_t>(i - window),
                                           data.begin() + static_cast<std::ptrdiff_t>(i));
        const double mean = Statistics::mean(trailing);
        const double sd = nonZeroOr(Statistics::populationStdDev(trailing), 1.0);
        AnomalyScore entry;
        entry.index = i;
        entry.value = data[i];
        entry.score = std::abs((data[i] - mean) / sd);
        entry.isAnomaly = entry.score > threshold;
        out.push_back(entry);
    }
    return out;
}

OutlierResult OutlierDetection::movingAverage(const std::vector<double>& data, size_t window, double threshold) const {
    OutlierResult result;
    result.method = "Moving Average";
    result.threshold = threshold;
    result.scores.assign(data.size(), 0.0);
    for (const AnomalyScore& entry : movingAverageScores(data, window, threshold)) {
        result.scores[entry.index] = entry.score;
        if (entry.isAnomaly) result.outliers.push_back(entry.index);
    }
    return result;
}
