#include "Clustering.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <deque>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <utility>

namespace {
constexpr int kUnvisited = -2;

std::pair<size_t, double> nearestCentroid(const std::vector<double>& point,
                                          const std::vector<std::vector<double>>& centroids) {
    size_t best = 0;
    double bestDist = std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < centroids.size(); ++c) {
        const double d = MathUtils::squaredDistance(point, centroids[c]);
        if (d < bestDist) {
            bestDist = d;
            best = c;
        }
    }
    return {best, bestDist};
}
} // namespace

KMeans::KMeans(size_t k) : KMeans(k, Options{}) {}

KMeans::KMeans(size_t k, Options options)
    : m_k(k), m_options(options), m_rng(options.seed) {
    if (m_k == 0) throw Circadia::ConfigurationException("KMeans requires k >= 1");
}

void KMeans::seedCentroids(const std::vector<std::vector<double>>& data) {
    m_centroids.clear();
    std::vector<bool> used(data.size(), false);
    const auto take = [&](size_t index) {
        used[index] = true;
        m_centroids.push_back(data[index]);
    };

    std::uniform_int_distribution<size_t> pick(0, data.size() - 1);
    take(pick(m_rng));

    std::vector<double> minSq(data.size());
    while (m_centroids.size() < m_k) {
        double total = 0.0;
        for (size_t i = 0; i < data.size(); ++i) {
            minSq[i] = nearestCentroid(data[i], m_centroids).second;
            total += minSq[i];
        }

        // Every point already coincides with a centroid; pick uniformly among rows not yet taken.
        if (total <= 0.0) {
            std::vector<size_t> unused;
            for (size_t i = 0; i < data.size(); ++i) {
                if (!used[i]) unused.push_back(i);
            }
            std::uniform_int_distribution<size_t> pickUnused(0, unused.size() - 1);
            take(unused[pickUnused(m_rng)]);
            continue;
        }

        std::uniform_real_distribution<double> draw(0.0, total);
        const double target = draw(m_rng);
        double cumulative = 0.0;
        size_t chosen = 0;
        for (size_t i = 0; i < data.size(); ++i) {
            if (minSq[i] > 0.0) chosen = i;
        }
        for (size_t i = 0; i < data.size(); ++i) {
            cumulative += minSq[i];
            if (cumulative >= target && minSq[i] > 0.0) {
                chosen = i;
                break;
            }
        }
        take(chosen);
    }
}

std::vector<int> KMeans::fit(const std::vector<std::vector<double>>& data) {
    const size_t dim = CommonUtils::requireRectangular(data, "KMeans::fit");
    if (m_k > data.size()) {
        throw Circadia::ConfigurationException(
            "KMeans k=" + std::to_string(m_k) + " exceeds the " + std::to_string(data.size()) + " available points");
    }

    seedCentroids(data);
    m_iterations = 0;

    std::vector<size_t> assignment(data.size(), 0);
    for (size_t iter = 0; iter < m_options.maxIterations; ++iter) {
        ++m_iterations;
        for (size_t i = 0; i < data.size(); ++i) {
            assignment[i] = nearestCentroid(data[i], m_centroids).first;
        }

        std::vector<std::vector<double>> sums(m_k, std::vector<double>(dim, 0.0));
        std::vector<size_t> counts(m_k, 0);
        for (size_t i = 0; i < data.size(); ++i) {
            ++counts[assignment[i]];
            for (size_t j = 0; j < dim; ++j) sums[assignment[i]][j] += data[i][j];
        }

        bool converged = true;
        for (size_t c = 0; c < m_k; ++c) {
            // Empty clusters keep their previous position.
            if (counts[c] == 0) continue;
            for (double& v : sums[c]) v /= static_cast<double>(counts[c]);
            if (MathUtils::euclideanDistance(sums[c], m_centroids[c]) > m_options.tolerance) {
                converged = false;
            }
            m_centroids[c] = std::move(sums[c]);
        }

        if (converged) {
            if (m_options.verbose) {
                std::cout << "[Circadia] K-Means converged after " << m_iterations << " iterations\n";
            }
            break;
        }
    }

    std::vector<int> labels(data.size(), 0);
    m_inertia = 0.0;
    for (size_t i = 0; i < data.size(); ++i) {
        const auto [c, d] = nearestCentroid(data[i], m_centroids);
        labels[i] = static_cast<int>(c);
        m_inertia += d;
    }
    return labels;
}

int KMeans::predict(const std::vector<double>& point) const {
    if (m_centroids.empty()) throw Circadia::ConfigurationException("KMeans::predict called before fit");
    if (point.size() != m_centroids.front().size()) {
        throw Circadia::ConfigurationException(
            "KMeans::predict expects " + std::to_string(m_centroids.front().size()) +
            " features, got " + std::to_string(point.size()));
    }
    return static_cast<int>(nearestCentroid(point, m_centroids).first);
}

DBSCAN::DBSCAN(double epsilon, size_t minPoints) : m_epsilon(epsilon), m_minPoints(minPoints) {
    if (!(m_epsilon >= 0.0)) throw Circadia::ConfigurationException("DBSCAN epsilon must be >= 0");
    if (m_minPoints == 0) throw Circadia::ConfigurationException("DBSCAN minPoints must be >= 1");
}

std::vector<size_t> DBSCAN::regionQuery(const std::vector<std::vector<double>>& data, size_t index) const {
    std::vector<size_t> out;
    const double epsSq = m_epsilon * m_epsilon;
    for (size_t j = 0; j < data.size(); ++j) {
        if (MathUtils::squaredDistance(data[index], data[j]) <= epsSq) out.push_back(j);
    }
    return out;
}

std::vector<int> DBSCAN::fit(const std::vector<std::vector<double>>& data) const {
    if (data.empty()) return {};
    CommonUtils::requireRectangular(data, "DBSCAN::fit");

    std::vector<int> labels(data.size(), kUnvisited);
    int clusterId = 0;

    for (size_t i = 0; i < data.size(); ++i) {
        if (labels[i] != kUnvisited) continue;

        const std::vector<size_t> neighbors = regionQuery(data, i);
        if (neighbors.size() < m_minPoints) {
            labels[i] = kNoise;
            continue;
        }

        labels[i] = clusterId;
        std::deque<size_t> frontier(neighbors.begin(), neighbors.end());
        while (!frontier.empty()) {
            const size_t q = frontier.front();
            frontier.pop_front();

            // Noise reached from a core point becomes a border point.
            if (labels[q] == kNoise) labels[q] = clusterId;
            if (labels[q] != kUnvisited) continue;

            labels[q] = clusterId;
            const std::vector<size_t> qNeighbors = regionQuery(data, q);
            if (qNeighbors.size() >= m_minPoints) {
                for (size_t n : qNeighbors) {
                    if (labels[n] == kUnvisited || labels[n] == kNoise) frontier.push_back(n);
                }
            }
        }
        ++clusterId;
    }
    return labels;
}

double ClusterQuality::silhouetteScore(const std::vector<std::vector<double>>& data, const std::vector<int>& labels) {
    if (labels.size() != data.size()) {
        throw Circadia::ConfigurationException(
            "silhouetteScore got " + std::to_string(labels.size()) + " labels for " +
            std::to_string(data.size()) + " rows");
    }
    if (data.empty()) return 0.0;
    CommonUtils::requireRectangular(data, "silhouetteScore");

    std::map<int, size_t> clusterSizes;
    for (int label : labels) {
        if (label >= 0) ++clusterSizes[label];
    }
    if (clusterSizes.size() < 2) return 0.0;

    double total = 0.0;
    size_t counted = 0;
    for (size_t i = 0; i < data.size(); ++i) {
        if (labels[i] < 0) continue;
        ++counted;
        if (clusterSizes[labels[i]] == 1) continue;

        std::map<int, double> distanceSums;
        for (size_t j = 0; j < data.size(); ++j) {
            if (j == i || labels[j] < 0) continue;
            distanceSums[labels[j]] += MathUtils::euclideanDistance(data[i], data[j]);
        }

        const double a = distanceSums[labels[i]] / static_cast<double>(clusterSizes[labels[i]] - 1);
        double b = std::numeric_limits<double>::infinity();
        for (const auto& [label, sum] : distanceSums) {
            if (label == labels[i]) continue;
            b = std::min(b, sum / static_cast<double>(clusterSizes[label]));
        }

        const double denom = std::max(a, b);
        if (denom > 0.0) total += (b - a) / denom;
    }
    return counted > 0 ? total / static_cast<double>(counted) : 0.0;
}

ClusterQuality::ElbowResult ClusterQuality::findOptimalK(const std::vector<std::vector<double>>& data,
                                                         size_t maxK,
                                                         size_t trials,
                                                         KMeans::Options options) {
    if (maxK == 0) throw Circadia::ConfigurationException("findOptimalK needs maxK >= 1");
    if (trials == 0) throw Circadia::ConfigurationException("findOptimalK needs at least one trial");
    CommonUtils::requireRectangular(data, "findOptimalK");
    maxK = std::min(maxK, data.size());

    ElbowResult result;
    const uint32_t baseSeed = options.seed;
    for (size_t k = 1; k <= maxK; ++k) {
        double best = std::numeric_limits<double>::infinity();
        for (size_t t = 0; t < trials; ++t) {
            options.seed = baseSeed + static_cast<uint32_t>(t);
            KMeans kmeans(k, options);
            kmeans.fit(data);
            best = std::min(best, kmeans.inertia());
        }
        result.inertias.push_back(best);
    }
    result.elbowScores.assign(maxK, 0.0);

    const double drop = result.inertias.front() - result.inertias.back();
    if (maxK < 3 || drop <= MathUtils::getNumericEpsilon()) return result;

    double bestScore = 0.0;
    for (size_t i = 1; i + 1 < maxK; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(maxK - 1);
        const double y = (result.inertias.front() - result.inertias[i]) / drop;
        result.elbowScores[i] = y - x;
        if (result.elbowScores[i] > bestScore) {
            bestScore = result.elbowScores[i];
            result.k = i + 1;
        }
    }

    if (options.verbose) {
        std::cout << "[Circadia] Elbow method selected k=" << result.k << " of " << maxK << "\n";
    }
    return result;
}
