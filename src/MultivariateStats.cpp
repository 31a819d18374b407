#include "MultivariateStats.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

namespace {
using Matrix = MathUtils::Matrix;

struct EigenPair {
    double value;
    std::vector<double> vector;
};

std::vector<EigenPair> sortedDescending(const MathUtils::EigenResult& eig, bool clampNegative) {
    std::vector<EigenPair> pairs;
    pairs.reserve(eig.values.size());
    for (size_t i = 0; i < eig.values.size(); ++i) {
        const double v = clampNegative ? std::max(0.0, eig.values[i]) : eig.values[i];
        pairs.push_back({v, eig.vectors[i]});
    }
    std::stable_sort(pairs.begin(), pairs.end(), [](const EigenPair& a, const EigenPair& b) {
        return a.value > b.value;
    });
    return pairs;
}

Matrix substituteDiagonal(const Matrix& m, const std::vector<double>& diagonal) {
    Matrix out = m;
    for (size_t i = 0; i < out.rows; ++i) out.at(i, i) = diagonal[i];
    return out;
}

// Loadings p x f: column j is eigenvector j scaled by sqrt(lambda_j).
std::vector<std::vector<double>> factorLoadings(const std::vector<EigenPair>& factors, size_t p) {
    std::vector<std::vector<double>> loadings(p, std::vector<double>(factors.size(), 0.0));
    for (size_t j = 0; j < factors.size(); ++j) {
        const double scale = std::sqrt(factors[j].value);
        for (size_t i = 0; i < p; ++i) loadings[i][j] = factors[j].vector[i] * scale;
    }
    return loadings;
}

std::vector<double> rowSumsOfSquares(const std::vector<std::vector<double>>& m) {
    std::vector<double> out;
    out.reserve(m.size());
    for (const auto& row : m) {
        double s = 0.0;
        for (double v : row) s += v * v;
        out.push_back(s);
    }
    return out;
}

void addScatter(Matrix& target, const std::vector<double>& diff, double weight) {
    for (size_t i = 0; i < diff.size(); ++i) {
        for (size_t j = 0; j < diff.size(); ++j) {
            target.at(i, j) += weight * diff[i] * diff[j];
        }
    }
}

std::vector<double> difference(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> out(a.size());
    for (size_t i = 0; i < a.size(); ++i) out[i] = a[i] - b[i];
    return out;
}

std::vector<double> toPercentages(const std::vector<double>& values, double total) {
    std::vector<double> out(values.size(), 0.0);
    if (!(total > MathUtils::getNumericEpsilon())) return out;
    for (size_t i = 0; i < values.size(); ++i) out[i] = values[i] / total * 100.0;
    return out;
}
} // namespace

MultivariateStats::MultivariateStats(MultivariateOptions options) : m_options(options) {}

PCAResult MultivariateStats::pca(const std::vector<std::vector<double>>& data, size_t nComponents) const {
    const size_t p = CommonUtils::requireRectangular(data, "PCA");
    if (data.size() < 2) throw Circadia::InsufficientDataException("PCA needs at least two observations", 2, data.size());
    const size_t k = (nComponents == 0) ? p : nComponents;
    if (k > p) {
        throw Circadia::ConfigurationException(
            "PCA cannot retain " + std::to_string(k) + " components from " + std::to_string(p) + " features");
    }

    const Matrix raw = Matrix::fromRows(data);
    const Matrix centered = MathUtils::center(raw);
    const Matrix covariance = MathUtils::covarianceOfCentered(centered);
    const std::vector<EigenPair> sorted = sortedDescending(MathUtils::eigenDecomposition(covariance, m_options.eigen), false);

    PCAResult result;
    result.means = MathUtils::columnMeans(raw);
    double totalVariance = 0.0;
    for (const EigenPair& pair : sorted) totalVariance += pair.value;

    for (size_t c = 0; c < k; ++c) {
        result.components.push_back(sorted[c].vector);
        result.eigenvalues.push_back(sorted[c].value);
    }
    result.explainedVariance = toPercentages(result.eigenvalues, totalVariance);
    double running = 0.0;
    for (double v : result.explainedVariance) {
        running += v;
        result.cumulativeVariance.push_back(running);
    }

    result.scores.reserve(data.size());
    for (size_t r = 0; r < centered.rows; ++r) {
        const std::vector<double> row = centered.row(r);
        std::vector<double> score(k);
        for (size_t c = 0; c < k; ++c) score[c] = MathUtils::dot(row, result.components[c]);
        result.scores.push_back(std::move(score));
    }
    result.loadings = Matrix::fromRows(result.components).transpose().toRows();
    return result;
}

FactorAnalysisResult MultivariateStats::factorAnalysis(const std::vector<std::vector<double>>& data, size_t nFactors) const {
    const size_t p = CommonUtils::requireRectangular(data, "factor analysis");
    if (data.size() < 2) {
        throw Circadia::InsufficientDataException("factor analysis needs at least two observations", 2, data.size());
    }
    if (nFactors == 0 || nFactors > p) {
        throw Circadia::ConfigurationException(
            "factor analysis needs 1 <= factors <= " + std::to_string(p) + ", got " + std::to_string(nFactors));
    }

    const Matrix correlation = MathUtils::correlationMatrix(Matrix::fromRows(data));
    const auto extract = [&](const std::vector<double>& communalities) {
        std::vector<EigenPair> pairs = sortedDescending(
            MathUtils::eigenDecomposition(substituteDiagonal(correlation, communalities), m_options.eigen), true);
        pairs.resize(nFactors);
        return pairs;
    };

    FactorAnalysisResult result;
    std::vector<double> communalities(p, 0.5);
    for (size_t iter = 0; iter < m_options.factorMaxIterations; ++iter) {
        ++result.iterations;
        const std::vector<double> updated = rowSumsOfSquares(factorLoadings(extract(communalities), p));
        double maxChange = 0.0;
        for (size_t i = 0; i < p; ++i) maxChange = std::max(maxChange, std::abs(updated[i] - communalities[i]));
        communalities = updated;
        if (maxChange < m_options.factorTolerance) {
            result.converged = true;
            break;
        }
    }
    if (m_options.verbose) {
        std::cout << "[Circadia] Factor analysis " << (result.converged ? "converged" : "stopped")
                  << " after " << result.iterations << " iterations\n";
    }

    const std::vector<EigenPair> factors = extract(communalities);
    result.loadings = factorLoadings(factors, p);
    result.communalities = communalities;
    result.uniqueVariances.reserve(p);
    for (double c : communalities) result.uniqueVariances.push_back(1.0 - c);
    for (const EigenPair& f : factors) result.eigenvalues.push_back(f.value);
    return result;
}

CanonicalCorrelationResult MultivariateStats::canonicalCorrelation(const std::vector<std::vector<double>>& X,
                                                                   const std::vector<std::vector<double>>& Y) const {
    const size_t px = CommonUtils::requireRectangular(X, "canonical correlation X");
    const size_t py = CommonUtils::requireRectangular(Y, "canonical correlation Y");
    if (X.size() != Y.size()) {
        throw Circadia::ConfigurationException("canonical correlation needs the same observations in X and Y");
    }
    if (X.size() < 2) {
        throw Circadia::InsufficientDataException("canonical correlation needs at least two observations", 2, X.size());
    }

    const Matrix xs = MathUtils::standardize(Matrix::fromRows(X));
    const Matrix ys = MathUtils::standardize(Matrix::fromRows(Y));
    const Matrix sxx = MathUtils::covarianceOfCentered(xs);
    const Matrix syy = MathUtils::covarianceOfCentered(ys);
    const Matrix sxy = MathUtils::crossCovarianceOfCentered(xs, ys);
    const Matrix syx = sxy.transpose();

    const Matrix sxxInv = MathUtils::invert(sxx, "canonical correlation Sxx");
    const Matrix syyInv = MathUtils::invert(syy, "canonical correlation Syy");
    const Matrix m = sxxInv.multiply(sxy).multiply(syyInv).multiply(syx);
    const Matrix yProjection = syyInv.multiply(syx);

    const std::vector<EigenPair> pairs = sortedDescending(MathUtils::eigenDecomposition(m, m_options.eigen), false);
    const size_t count = std::min(px, py);

    CanonicalCorrelationResult result;
    for (size_t i = 0; i < count; ++i) {
        const double rho = std::sqrt(std::max(0.0, pairs[i].value));
        result.correlations.push_back(rho);
        result.xCoefficients.push_back(pairs[i].vector);

        std::vector<double> b = yProjection.multiply(pairs[i].vector);
        const double divisor = (rho > MathUtils::getNumericEpsilon()) ? rho : 1.0;
        for (double& v : b) v /= divisor;
        result.yCoefficients.push_back(std::move(b));
    }
    return result;
}

ManovaResult MultivariateStats::manova(const std::vector<std::vector<std::vector<double>>>& groups) const {
    return manova(groups, m_options.manovaAlpha);
}

ManovaResult MultivariateStats::manova(const std::vector<std::vector<std::vector<double>>>& groups, double alpha) const {
    if (groups.size() < 2) {
        throw Circadia::InsufficientDataException("MANOVA needs at least two groups", 2, groups.size());
    }
    std::vector<std::vector<double>> pooled;
    size_t p = 0;
    for (size_t gi = 0; gi < groups.size(); ++gi) {
        const size_t width = CommonUtils::requireRectangular(groups[gi], "MANOVA group " + std::to_string(gi));
        if (gi == 0) p = width;
        if (width != p) throw Circadia::ConfigurationException("MANOVA groups must share one dimensionality");
        pooled.insert(pooled.end(), groups[gi].begin(), groups[gi].end());
    }

    const double g = static_cast<double>(groups.size());
    const double n = static_cast<double>(pooled.size());
    const double pd = static_cast<double>(p);
    const std::vector<double> grandMean = MathUtils::columnMeans(Matrix::fromRows(pooled));

    Matrix between(p, p);
    Matrix within(p, p);
    for (const auto& group : groups) {
        const std::vector<double> groupMean = MathUtils::columnMeans(Matrix::fromRows(group));
        addScatter(between, difference(groupMean, grandMean), static_cast<double>(group.size()));
        for (const auto& obs : group) addScatter(within, difference(obs, groupMean), 1.0);
    }
    const Matrix total = between.add(within);

    ManovaResult result;
    const double detWithin = within.determinant();
    const double detTotal = total.determinant();
    if (std::abs(detTotal) <= MathUtils::getNumericEpsilon()) {
        if (MathUtils::getSingularPolicy() == MathUtils::SingularPolicy::REPORT) {
            throw Circadia::NumericalDegeneracyException("MANOVA total SSCP matrix is singular");
        }
        result.wilksLambda = detWithin;
    } else {
        result.wilksLambda = detWithin / detTotal;
    }
    result.wilksLambda = std::clamp(result.wilksLambda, 0.0, 1.0);

    result.pillaiTrace = between.multiply(MathUtils::invert(total, "MANOVA B+W")).trace();
    result.hotellingLawleyTrace = between.multiply(MathUtils::invert(within, "MANOVA W")).trace();

    // Rao's F approximation of Wilks' Lambda.
    const double q = g - 1.0;
    const double tDenominator = pd * pd + q * q - 5.0;
    const double t = (tDenominator > 0.0) ? std::sqrt((pd * pd * q * q - 4.0) / tDenominator) : 1.0;
    const double w = n - 1.0 - (pd + g) / 2.0;
    result.df1 = pd * q;
    result.df2 = w * t - (pd * q - 2.0) / 2.0;
    if (!(result.df2 > 0.0)) {
        throw Circadia::InsufficientDataException(
            "MANOVA has no error degrees of freedom", static_cast<size_t>(pd + g + 1.0), pooled.size());
    }

    const double root = std::pow(result.wilksLambda, 1.0 / t);
    result.fStatistic = (root > 0.0)
        ? ((1.0 - root) / root) * (result.df2 / result.df1)
        : std::numeric_limits<double>::infinity();
    result.pValue = std::clamp(1.0 - MathUtils::fCdf(result.fStatistic, result.df1, result.df2), 0.0, 1.0);
    result.reject = result.pValue < alpha;
    return result;
}

LDAResult MultivariateStats::lda(const std::vector<std::vector<double>>& X,
                                 const std::vector<int>& y,
                                 size_t nComponents) const {
    const size_t p = CommonUtils::requireRectangular(X, "LDA");
    if (X.size() != y.size()) {
        throw Circadia::ConfigurationException(
            "LDA got " + std::to_string(X.size()) + " rows but " + std::to_string(y.size()) + " labels");
    }

    LDAResult result;
    for (int label : y) {
        if (std::find(result.classes.begin(), result.classes.end(), label) == result.classes.end()) {
            result.classes.push_back(label);
        }
    }
    if (result.classes.size() < 2) {
        throw Circadia::InsufficientDataException("LDA needs at least two classes", 2, result.classes.size());
    }
    const size_t k = (nComponents == 0) ? std::min(result.classes.size() - 1, p) : nComponents;
    if (k > p) {
        throw Circadia::ConfigurationException("LDA cannot retain more axes than features");
    }

    std::vector<size_t> classIndex(y.size());
    std::vector<size_t> classCounts(result.classes.size(), 0);
    for (size_t i = 0; i < y.size(); ++i) {
        classIndex[i] = static_cast<size_t>(
            std::find(result.classes.begin(), result.classes.end(), y[i]) - result.classes.begin());
        ++classCounts[classIndex[i]];
    }

    for (size_t c = 0; c < result.classes.size(); ++c) {
        std::vector<std::vector<double>> members;
        for (size_t i = 0; i < X.size(); ++i) {
            if (classIndex[i] == c) members.push_back(X[i]);
        }
        result.means.push_back(MathUtils::columnMeans(Matrix::fromRows(members)));
        result.priors.push_back(static_cast<double>(classCounts[c]) / static_cast<double>(X.size()));
    }

    const std::vector<double> overallMean = MathUtils::columnMeans(Matrix::fromRows(X));
    Matrix sb(p, p);
    Matrix sw(p, p);
    for (size_t c = 0; c < result.classes.size(); ++c) {
        addScatter(sb, difference(result.means[c], overallMean), static_cast<double>(classCounts[c]));
    }
    for (size_t i = 0; i < X.size(); ++i) {
        addScatter(sw, difference(X[i], result.means[classIndex[i]]), 1.0);
    }

    const Matrix m = MathUtils::invert(sw, "LDA within-class scatter").multiply(sb);
    std::vector<EigenPair> axes = sortedDescending(MathUtils::eigenDecomposition(m, m_options.eigen), false);
    axes.resize(k);

    std::vector<std::vector<double>> vectors;
    std::vector<double> values;
    double retained = 0.0;
    for (const EigenPair& axis : axes) {
        vectors.push_back(axis.vector);
        values.push_back(axis.value);
        retained += axis.value;
    }
    result.scalings = Matrix::fromRows(vectors).transpose().toRows();
    result.explained = toPercentages(values, retained);
    return result;
}
