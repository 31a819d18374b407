#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// Uniform output of every detector so callers can swap methods freely.
struct OutlierResult {
    std::vector<size_t> outliers;
    std::vector<double> scores;
    double threshold = 0.0;
    std::string method;
};

struct AnomalyScore {
    size_t index = 0;
    double value = 0.0;
    double score = 0.0;
    bool isAnomaly = false;
};

// Per-method defaults used by the single-argument overloads.
struct OutlierOptions {
    double zThreshold = 3.0;
    double modifiedZThreshold = 3.5;
    double iqrMultiplier = 1.5;
    size_t isolationTrees = 100;
    size_t isolationSampleSize = 0;
    double isolationContamination = 0.1;
    size_t isolationMaxDepth = 10;
    size_t lofNeighbors = 5;
    double lofThreshold = 1.5;
    size_t movingAverageWindow = 10;
    double movingAverageThreshold = 3.0;
    uint32_t seed = 1337;
};

class OutlierDetection {
public:
    explicit OutlierDetection(OutlierOptions options = OutlierOptions{});
    explicit OutlierDetection(uint32_t seed);

    // |x - mean| / population stddev.
    OutlierResult zScore(const std::vector<double>& data) const;
    OutlierResult zScore(const std::vector<double>& data, double threshold) const;

    /**
     * @brief 0.6745 * |x - median| / MAD.
     * @post When MAD is zero the mean absolute deviation scaled by 1.253314 is used instead.
     */
    OutlierResult modifiedZScore(const std::vector<double>& data) const;
    OutlierResult modifiedZScore(const std::vector<double>& data, double threshold) const;

    // Tukey fences; scores are the fence overshoot in IQR units.
    OutlierResult iqr(const std::vector<double>& data) const;
    OutlierResult iqr(const std::vector<double>& data, double multiplier) const;

    /**
     * @brief Isolation forest over 1-D data.
     * @param sampleSize Per-tree subsample; 0 means min(256, n).
     * @post Flags every score at or above the floor(n * contamination)-th highest score.
     * @throws Circadia::ConfigurationException on zero trees or contamination outside [0,1).
     */
    OutlierResult isolationForest(const std::vector<double>& data);
    OutlierResult isolationForest(const std::vector<double>& data,
                                  size_t numTrees,
                                  size_t sampleSize,
                                  double contamination,
                                  size_t maxDepth);

    OutlierResult lof(const std::vector<double>& data) const;
    OutlierResult lof(const std::vector<double>& data, size_t k, double threshold) const;

    /**
     * @brief Density clustering on the line; noise points score 1 and are the outliers.
     * @post Neighborhoods exclude the point itself.
     */
    OutlierResult dbscan(const std::vector<double>& data, double epsilon, size_t minPoints = 3) const;

    // Uniform-shape wrapper of movingAverageScores; indices before the first full window score 0.
    OutlierResult movingAverage(const std::vector<double>& data) const;
    OutlierResult movingAverage(const std::vector<double>& data, size_t window, double threshold) const;

    /**
     * @brief Z-score of each point against the trailing window [i - window, i).
     * @throws Circadia::ConfigurationException when window == 0.
     */
    std::vector<AnomalyScore> movingAverageScores(const std::vector<double>& data,
                                                  size_t window,
                                                  double threshold) const;

    const OutlierOptions& options() const noexcept { return m_options; }

private:
    OutlierOptions m_options;
    std::mt19937 m_rng;
};
