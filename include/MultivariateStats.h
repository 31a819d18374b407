#pragma once

#include "MathUtils.h"

#include <cstddef>
#include <vector>

struct PCAResult {
    std::vector<std::vector<double>> components;   // k x p, one unit eigenvector per row
    std::vector<double> eigenvalues;
    std::vector<double> explainedVariance;         // percent of total variance
    std::vector<double> cumulativeVariance;
    std::vector<std::vector<double>> loadings;     // p x k
    std::vector<std::vector<double>> scores;       // n x k
    std::vector<double> means;
};

struct FactorAnalysisResult {
    std::vector<std::vector<double>> loadings;     // p x f
    std::vector<double> uniqueVariances;
    std::vector<double> communalities;
    std::vector<double> eigenvalues;
    size_t iterations = 0;
    bool converged = false;
};

struct CanonicalCorrelationResult {
    std::vector<double> correlations;
    std::vector<std::vector<double>> xCoefficients; // one weight vector per canonical pair
    std::vector<std::vector<double>> yCoefficients;
};

struct ManovaResult {
    double wilksLambda = 1.0;
    double pillaiTrace = 0.0;
    double hotellingLawleyTrace = 0.0;
    double fStatistic = 0.0;
    double df1 = 0.0;
    double df2 = 0.0;
    double pValue = 1.0;
    bool reject = false;
};

struct LDAResult {
    std::vector<std::vector<double>> scalings;     // p x k
    std::vector<std::vector<double>> means;        // per class, in first-seen order
    std::vector<double> priors;
    std::vector<int> classes;
    std::vector<double> explained;                 // percent of retained separation
};

struct MultivariateOptions {
    MathUtils::EigenOptions eigen;
    size_t factorMaxIterations = 100;
    double factorTolerance = 1e-6;
    // Significance level used when manova() is called without one.
    double manovaAlpha = 0.05;
    bool verbose = false;
};

class MultivariateStats {
public:
    explicit MultivariateStats(MultivariateOptions options = MultivariateOptions{});

    /**
     * @brief Principal components of the sample covariance, sorted by descending eigenvalue.
     * @param nComponents Retained components; 0 keeps all p.
     * @throws Circadia::InsufficientDataException with fewer than two observations.
     * @throws Circadia::ConfigurationException when nComponents > p or rows are ragged.
     */
    PCAResult pca(const std::vector<std::vector<double>>& data, size_t nComponents = 0) const;

    /**
     * @brief Iterative principal-axis factoring on the correlation matrix.
     * @pre 1 <= nFactors <= p.
     */
    FactorAnalysisResult factorAnalysis(const std::vector<std::vector<double>>& data, size_t nFactors) const;

    /**
     * @brief Canonical correlations between two standardized variable sets observed on the same rows.
     * @throws Circadia::NumericalDegeneracyException when Sxx or Syy is singular under the REPORT policy.
     */
    CanonicalCorrelationResult canonicalCorrelation(const std::vector<std::vector<double>>& X,
                                                    const std::vector<std::vector<double>>& Y) const;

    /**
     * @brief One-way MANOVA with Wilks' Lambda, Pillai and Hotelling-Lawley traces and Rao's F.
     * @pre At least two non-empty groups sharing one dimensionality p <= MathUtils::kMaxCofactorDimension.
     */
    ManovaResult manova(const std::vector<std::vector<std::vector<double>>>& groups, double alpha) const;
    ManovaResult manova(const std::vector<std::vector<std::vector<double>>>& groups) const;

    /**
     * @brief Fisher discriminant axes from the eigenvectors of Sw^-1 Sb.
     * @param nComponents Retained axes; 0 keeps min(classes - 1, p).
     */
    LDAResult lda(const std::vector<std::vector<double>>& X,
                  const std::vector<int>& y,
                  size_t nComponents = 0) const;

    const MultivariateOptions& options() const noexcept { return m_options; }

private:
    MultivariateOptions m_options;
};
