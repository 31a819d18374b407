#include "PatternRecognition.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

PatternRecognizer::PatternRecognizer(double threshold) : m_threshold(threshold) {}

void PatternRecognizer::addPattern(Pattern pattern) {
    m_patterns.push_back(std::move(pattern));
}

std::optional<Pattern> PatternRecognizer::recognize(const std::vector<double>& features) const {
    std::optional<Pattern> best;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (const Pattern& pattern : m_patterns) {
        if (pattern.features.size() != features.size()) {
            throw Circadia::ConfigurationException(
                "pattern '" + pattern.id + "' has " + std::to_string(pattern.features.size()) +
                " features, query has " + std::to_string(features.size()));
        }
        const double similarity = MathUtils::cosineSimilarity(features, pattern.features);
        if (similarity > bestScore && similarity >= m_threshold) {
            bestScore = similarity;
            best = pattern;
            best->confidence = similarity;
        }
    }
    return best;
}

std::optional<Pattern> PatternRecognizer::recognizeSequence(const std::vector<double>& sequence) const {
    const Pattern* closest = nullptr;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (const Pattern& pattern : m_patterns) {
        const double distance = dtwDistance(sequence, pattern.features);
        if (distance < bestDistance) {
            bestDistance = distance;
            closest = &pattern;
        }
    }
    if (closest == nullptr) return std::nullopt;

    const double confidence = 1.0 / (1.0 + bestDistance);
    if (confidence < m_threshold) return std::nullopt;
    Pattern match = *closest;
    match.confidence = confidence;
    return match;
}

double PatternRecognizer::dtwDistance(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t n = a.size();
    const size_t m = b.size();
    const double inf = std::numeric_limits<double>::infinity();

    // Two rolling rows of the (n+1) x (m+1) cost table.
    std::vector<double> prev(m + 1, inf);
    std::vector<double> cur(m + 1, inf);
    prev[0] = 0.0;
    for (size_t i = 1; i <= n; ++i) {
        cur[0] = inf;
        for (size_t j = 1; j <= m; ++j) {
            const double cost = std::abs(a[i - 1] - b[j - 1]);
            cur[j] = cost + std::min({prev[j], cur[j - 1], prev[j - 1]});
        }
        std::swap(prev, cur);
    }
    return prev[m];
}

AnomalyDetector::AnomalyDetector(double threshold, uint32_t seed) : m_rng(seed) {
    m_options.threshold = threshold;
    m_options.seed = seed;
}

AnomalyDetector::AnomalyDetector(AnomalyDetectorOptions options) : m_options(options), m_rng(options.seed) {}

void AnomalyDetector::train(const std::vector<std::vector<double>>& data) {
    const size_t dim = CommonUtils::requireRectangular(data, "AnomalyDetector::train");
    m_data = data;
    m_mean.assign(dim, 0.0);
    m_std.assign(dim, 0.0);
    for (size_t j = 0; j < dim; ++j) {
        std::vector<double> column;
        column.reserve(data.size());
        for (const auto& row : data) column.push_back(row[j]);
        m_mean[j] = Statistics::mean(column);
        m_std[j] = Statistics::populationStdDev(column);
    }
}

void AnomalyDetector::requireTrainedFor(const std::vector<double>& point, const char* operation) const {
    if (!trained()) {
        throw Circadia::ConfigurationException(std::string("AnomalyDetector::") + operation + " called before train");
    }
    if (point.size() != m_mean.size()) {
        throw Circadia::ConfigurationException(
            std::string("AnomalyDetector::") + operation + " expects " + std::to_string(m_mean.size()) +
            " features, got " + std::to_string(point.size()));
    }
}

AnomalyResult AnomalyDetector::detect(const std::vector<double>& point) const {
    requireTrainedFor(point, "detect");
    AnomalyResult result;
    result.zScores.resize(point.size());
    for (size_t i = 0; i < point.size(); ++i) {
        const double sd = (m_std[i] > 0.0) ? m_std[i] : 1.0;
        result.zScores[i] = std::abs((point[i] - m_mean[i]) / sd);
        if (result.zScores[i] > m_options.threshold) result.dimensions.push_back(i);
    }
    result.score = *std::max_element(result.zScores.begin(), result.zScores.end());
    result.isAnomaly = result.score > m_options.threshold;
    return result;
}

double AnomalyDetector::isolationScore(const std::vector<double>& point) {
    return isolationScore(point, m_options.isolationTrees, m_options.isolationMaxDepth);
}

double AnomalyDetector::isolationScore(const std::vector<double>& point, size_t numTrees, size_t maxDepth) {
    requireTrainedFor(point, "isolationScore");
    if (numTrees == 0) throw Circadia::ConfigurationException("isolationScore needs at least one tree");

    const double normalizer = Statistics::expectedPathLength(m_data.size());
    if (normalizer <= 0.0) return 0.5;

    std::uniform_int_distribution<size_t> pickDim(0, point.size() - 1);
    std::vector<size_t> all(m_data.size());
    std::iota(all.begin(), all.end(), 0);

    double totalPath = 0.0;
    for (size_t t = 0; t < numTrees; ++t) {
        std::vector<size_t> partition = all;
        size_t depth = 0;
        while (partition.size() > 1 && depth < maxDepth) {
            const size_t dim = pickDim(m_rng);
            double lo = std::numeric_limits<double>::infinity();
            double hi = -std::numeric_limits<double>::infinity();
            for (size_t idx : partition) {
                lo = std::min(lo, m_data[idx][dim]);
                hi = std::max(hi, m_data[idx][dim]);
            }
            ++depth;
            if (hi <= lo) {
                if (point[dim] != lo) {
                    partition.clear();
                    break;
                }
                continue;
            }

            std::uniform_real_distribution<double> pickSplit(lo, hi);
            const double split = pickSplit(m_rng);
            const bool goLeft = point[dim] < split;
            std::vector<size_t> side;
            for (size_t idx : partition) {
                if ((m_data[idx][dim] < split) == goLeft) side.push_back(idx);
            }
            partition = std::move(side);
        }
        // Unresolved partitions contribute the expected depth of their remaining subtree.
        totalPath += static_cast<double>(depth) + Statistics::expectedPathLength(partition.size());
    }

    const double avgPath = totalPath / static_cast<double>(numTrees);
    return std::pow(2.0, -avgPath / normalizer);
}

double AnomalyDetector::kDistance(size_t index, size_t k) const {
    std::vector<double> dists;
    dists.reserve(m_data.size());
    for (size_t j = 0; j < m_data.size(); ++j) {
        if (j == index) continue;
        dists.push_back(MathUtils::euclideanDistance(m_data[index], m_data[j]));
    }
    std::nth_element(dists.begin(), dists.begin() + static_cast<std::ptrdiff_t>(k - 1), dists.end());
    return dists[k - 1];
}

double AnomalyDetector::localReachabilityDensity(const std::vector<double>& point,
                                                 size_t k,
                                                 std::optional<size_t> self) const {
    std::vector<std::pair<double, size_t>> neighbors;
    neighbors.reserve(m_data.size());
    for (size_t j = 0; j < m_data.size(); ++j) {
        if (self && *self == j) continue;
        neighbors.emplace_back(MathUtils::euclideanDistance(point, m_data[j]), j);
    }
    std::partial_sort(neighbors.begin(), neighbors.begin() + static_cast<std::ptrdiff_t>(k), neighbors.end());

    double reachSum = 0.0;
    for (size_t i = 0; i < k; ++i) {
        reachSum += std::max(neighbors[i].first, kDistance(neighbors[i].second, k));
    }
    const double meanReach = reachSum / static_cast<double>(k);
    return 1.0 / std::max(meanReach, MathUtils::getNumericEpsilon());
}

double AnomalyDetector::lof(const std::vector<double>& point) const {
    return lof(point, m_options.lofNeighbors);
}

double AnomalyDetector::lof(const std::vector<double>& point, size_t k) const {
    requireTrainedFor(point, "lof");
    if (m_data.size() < 2) {
        throw Circadia::InsufficientDataException("LOF needs a baseline of at least two points", 2, m_data.size());
    }
    const size_t kk = std::clamp<size_t>(k, 1, m_data.size() - 1);

    std::vector<std::pair<double, size_t>> neighbors;
    neighbors.reserve(m_data.size());
    for (size_t j = 0; j < m_data.size(); ++j) {
        neighbors.emplace_back(MathUtils::euclideanDistance(point, m_data[j]), j);
    }
    std::partial_sort(neighbors.begin(), neighbors.begin() + static_cast<std::ptrdiff_t>(kk), neighbors.end());

    const double lrdPoint = localReachabilityDensity(point, kk, std::nullopt);
    double neighborDensity = 0.0;
    for (size_t i = 0; i < kk; ++i) {
        const size_t idx = neighbors[i].second;
        neighborDensity += localReachabilityDensity(m_data[idx], kk, idx);
    }
    return (neighborDensity / static_cast<double>(kk)) / lrdPoint;
}

const char* toString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::INCREASING: return "increasing";
        case TrendDirection::DECREASING: return "decreasing";
        case TrendDirection::STABLE: return "stable";
    }
    return "stable";
}

TrendAnalyzer::TrendAnalyzer(double stableSlope, double changeThreshold, size_t changePointWindow)
    : m_stableSlope(stableSlope), m_changeThreshold(changeThreshold), m_changePointWindow(changePointWindow) {}

double TrendAnalyzer::slope(const std::vector<double>& series) const {
    return Statistics::fitLine(series).slope;
}

TrendDirection TrendAnalyzer::detectTrend(const std::vector<double>& series) const {
    const double s = slope(series);
    if (std::abs(s) < m_stableSlope) return TrendDirection::STABLE;
    return s > 0.0 ? TrendDirection::INCREASING : TrendDirection::DECREASING;
}

double TrendAnalyzer::trendStrength(const std::vector<double>& series) const {
    return Statistics::fitLine(series).rSquared;
}

std::vector<size_t> TrendAnalyzer::detectChangePoints(const std::vector<double>& series) const {
    return detectChangePoints(series, m_changePointWindow);
}

std::vector<size_t> TrendAnalyzer::detectChangePoints(const std::vector<double>& series, size_t minSegmentLength) const {
    if (minSegmentLength == 0) throw Circadia::ConfigurationException("change-point window must be >= 1");
    std::vector<size_t> changePoints;
    if (series.size() < 2 * minSegmentLength + 1) return changePoints;

    const double w = static_cast<double>(minSegmentLength);
    for (size_t i = minSegmentLength; i + minSegmentLength < series.size(); ++i) {
        const auto at = series.begin() + static_cast<std::ptrdiff_t>(i);
        const double meanBefore = std::accumulate(at - static_cast<std::ptrdiff_t>(minSegmentLength), at, 0.0) / w;
        const double meanAfter = std::accumulate(at, at + static_cast<std::ptrdiff_t>(minSegmentLength), 0.0) / w;
        // A zero baseline has no meaningful relative shift.
        if (std::abs(meanBefore) <= MathUtils::getNumericEpsilon()) continue;
        if (std::abs(meanAfter - meanBefore) / std::abs(meanBefore) > m_changeThreshold) {
            changePoints.push_back(i);
        }
    }
    return changePoints;
}
