#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct Pattern {
    std::string id;
    std::vector<double> features;
    std::string label;
    double confidence = 0.0;
};

// Session-scoped library of named reference vectors.
class PatternRecognizer {
public:
    explicit PatternRecognizer(double threshold = 0.8);

    void addPattern(Pattern pattern);

    /**
     * @brief Best cosine match at or above the threshold.
     * @post The returned copy carries the similarity in `confidence`.
     * @throws Circadia::ConfigurationException when a stored pattern has a different length.
     */
    std::optional<Pattern> recognize(const std::vector<double>& features) const;

    /**
     * @brief Closest pattern by DTW; confidence is 1 / (1 + distance).
     */
    std::optional<Pattern> recognizeSequence(const std::vector<double>& sequence) const;

    // O(n*m) dynamic time warping with absolute-difference cost.
    static double dtwDistance(const std::vector<double>& a, const std::vector<double>& b);

    const std::vector<Pattern>& getPatterns() const noexcept { return m_patterns; }
    double threshold() const noexcept { return m_threshold; }

private:
    std::vector<Pattern> m_patterns;
    double m_threshold;
};

struct AnomalyResult {
    bool isAnomaly = false;
    double score = 0.0;
    std::vector<size_t> dimensions;
    std::vector<double> zScores;
};

struct AnomalyDetectorOptions {
    double threshold = 2.5;
    size_t isolationTrees = 100;
    size_t isolationMaxDepth = 10;
    size_t lofNeighbors = 5;
    uint32_t seed = 1337;
};

class AnomalyDetector {
public:
    explicit AnomalyDetector(double threshold = 2.5, uint32_t seed = 1337);
    explicit AnomalyDetector(AnomalyDetectorOptions options);

    /**
     * @brief Records the baseline and its per-dimension mean and population deviation.
     * @throws Circadia::InsufficientDataException on an empty baseline.
     * @throws Circadia::ConfigurationException on ragged rows.
     */
    void train(const std::vector<std::vector<double>>& data);

    /**
     * @brief Absolute z-score per dimension against the baseline; zero deviation divides by 1.
     * @throws Circadia::ConfigurationException before train() or on a dimension mismatch.
     */
    AnomalyResult detect(const std::vector<double>& point) const;

    /**
     * @brief Isolation-forest style score in (0,1]; values near 1 isolate quickly.
     * @post Path lengths are capped at maxDepth and normalized by c(n) of the baseline.
     */
    double isolationScore(const std::vector<double>& point);
    double isolationScore(const std::vector<double>& point, size_t numTrees, size_t maxDepth);

    /**
     * @brief Local outlier factor of point against the baseline; about 1 for inliers.
     * @throws Circadia::InsufficientDataException when the baseline has fewer than two points.
     */
    double lof(const std::vector<double>& point) const;
    double lof(const std::vector<double>& point, size_t k) const;

    bool trained() const noexcept { return !m_data.empty(); }
    const std::vector<double>& means() const noexcept { return m_mean; }
    const std::vector<double>& stdDevs() const noexcept { return m_std; }
    double threshold() const noexcept { return m_options.threshold; }
    const AnomalyDetectorOptions& options() const noexcept { return m_options; }

private:
    void requireTrainedFor(const std::vector<double>& point, const char* operation) const;
    double localReachabilityDensity(const std::vector<double>& point, size_t k, std::optional<size_t> self) const;
    double kDistance(size_t index, size_t k) const;

    std::vector<std::vector<double>> m_data;
    std::vector<double> m_mean;
    std::vector<double> m_std;
    AnomalyDetectorOptions m_options;
    std::mt19937 m_rng;
};

enum class TrendDirection { INCREASING, DECREASING, STABLE };

const char* toString(TrendDirection direction);

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(double stableSlope = 0.01, double changeThreshold = 0.2, size_t changePointWindow = 5);

    double slope(const std::vector<double>& series) const;
    TrendDirection detectTrend(const std::vector<double>& series) const;
    // R^2 of the index regression; 0 for flat or too-short series.
    double trendStrength(const std::vector<double>& series) const;

    /**
     * @brief Indices i in [w, n-w) where the mean of [i, i+w) departs from the mean of [i-w, i)
     *        by more than changeThreshold relative to the earlier mean.
     * @throws Circadia::ConfigurationException when minSegmentLength == 0.
     */
    std::vector<size_t> detectChangePoints(const std::vector<double>& series, size_t minSegmentLength) const;
    std::vector<size_t> detectChangePoints(const std::vector<double>& series) const;

    size_t changePointWindow() const noexcept { return m_changePointWindow; }

private:
    double m_stableSlope;
    double m_changeThreshold;
    size_t m_changePointWindow;
};
