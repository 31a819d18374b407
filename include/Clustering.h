#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Lloyd's K-Means over Euclidean distance with k-means++ seeding.
class KMeans {
public:
    struct Options {
        size_t maxIterations = 100;
        double tolerance = 1e-3;
        uint32_t seed = 1337;
        bool verbose = false;
    };

    explicit KMeans(size_t k);
    KMeans(size_t k, Options options);

    /**
     * @brief Seeds and iterates until no centroid moves more than tolerance or maxIterations.
     * @pre data is rectangular and k <= data.size().
     * @post Returns one label in [0,k) per row; centroids stay available to predict().
     * @throws Circadia::ConfigurationException on k == 0, k > n or ragged rows.
     * @throws Circadia::InsufficientDataException on empty input.
     */
    std::vector<int> fit(const std::vector<std::vector<double>>& data);

    /**
     * @brief Index of the nearest centroid; the lowest index wins ties.
     * @throws Circadia::ConfigurationException before fit() or on a dimension mismatch.
     */
    int predict(const std::vector<double>& point) const;

    const std::vector<std::vector<double>>& getCentroids() const noexcept { return m_centroids; }
    size_t iterations() const noexcept { return m_iterations; }
    double inertia() const noexcept { return m_inertia; }
    size_t k() const noexcept { return m_k; }

private:
    void seedCentroids(const std::vector<std::vector<double>>& data);

    size_t m_k;
    Options m_options;
    std::mt19937 m_rng;
    std::vector<std::vector<double>> m_centroids;
    size_t m_iterations = 0;
    double m_inertia = 0.0;
};

// Density-based clustering; unreachable points are labelled kNoise.
class DBSCAN {
public:
    static constexpr int kNoise = -1;

    DBSCAN(double epsilon, size_t minPoints);

    /**
     * @brief Labels every row with a cluster id >= 0 or kNoise.
     * @post A point is a core point when at least minPoints rows (itself included) lie within epsilon.
     * @throws Circadia::ConfigurationException on ragged rows, epsilon < 0 or minPoints == 0.
     */
    std::vector<int> fit(const std::vector<std::vector<double>>& data) const;

    double epsilon() const noexcept { return m_epsilon; }
    size_t minPoints() const noexcept { return m_minPoints; }

private:
    std::vector<size_t> regionQuery(const std::vector<std::vector<double>>& data, size_t index) const;

    double m_epsilon;
    size_t m_minPoints;
};

// Internal validation of a labelling and elbow-based selection of k for K-Means.
namespace ClusterQuality {
struct ElbowResult {
    size_t k = 1;
    // inertias[i] is the lowest inertia seen for k = i + 1 across the trials.
    std::vector<double> inertias;
    // Normalized distance of each k below the chord joining k = 1 and k = maxK.
    std::vector<double> elbowScores;
};

/**
 * @brief Mean silhouette over every row with a label >= 0.
 * @post Result lies in [-1, 1]; negative labels (DBSCAN noise) are skipped, singleton clusters
 *       score 0, and fewer than two clusters give 0.
 * @throws Circadia::ConfigurationException on ragged rows or a label count that differs from the row count.
 */
double silhouetteScore(const std::vector<std::vector<double>>& data, const std::vector<int>& labels);

/**
 * @brief Fits K-Means for k = 1..maxK and picks the k whose inertia sits furthest below the
 *        straight line from the k = 1 inertia to the k = maxK inertia.
 * @post maxK is capped at the row count; each k keeps its best inertia over trials seeded
 *       options.seed, options.seed + 1, ...; k = 1 is returned when fewer than three candidates
 *       exist or the inertia never drops.
 * @throws Circadia::ConfigurationException on maxK == 0, trials == 0 or ragged rows.
 * @throws Circadia::InsufficientDataException on empty input.
 */
ElbowResult findOptimalK(const std::vector<std::vector<double>>& data,
                         size_t maxK,
                         size_t trials = 3,
                         KMeans::Options options = KMeans::Options{});
}
