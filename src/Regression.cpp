#include "Regression.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace {
void requirePaired(const std::vector<std::vector<double>>& X, const std::vector<double>& y, const char* context) {
    if (X.size() != y.size()) {
        throw Circadia::ConfigurationException(
            std::string(context) + ": " + std::to_string(X.size()) + " rows but " +
            std::to_string(y.size()) + " targets");
    }
}

double sigmoid(double z) {
    const double clipped = std::clamp(z, -60.0, 60.0);
    return 1.0 / (1.0 + std::exp(-clipped));
}
} // namespace

void LinearRegression::fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y) {
    const size_t m = CommonUtils::requireRectangular(X, "LinearRegression::fit");
    requirePaired(X, y, "LinearRegression::fit");

    MathUtils::Matrix design(X.size(), m + 1);
    for (size_t i = 0; i < X.size(); ++i) {
        design.at(i, 0) = 1.0;
        for (size_t j = 0; j < m; ++j) design.at(i, j + 1) = X[i][j];
    }

    const MathUtils::Matrix designT = design.transpose();
    const MathUtils::Matrix xtxInv = MathUtils::invert(designT.multiply(design), "LinearRegression normal equation");
    const std::vector<double> beta = xtxInv.multiply(designT.multiply(y));

    m_intercept = beta[0];
    m_coefficients.assign(beta.begin() + 1, beta.end());
    m_fitted = true;

    const std::vector<double> fittedValues = predictRaw(X);
    double yMean = 0.0;
    for (double v : y) yMean += v;
    yMean /= static_cast<double>(y.size());
    double ssTot = 0.0;
    double ssRes = 0.0;
    for (size_t i = 0; i < y.size(); ++i) {
        ssTot += (y[i] - yMean) * (y[i] - yMean);
        ssRes += (y[i] - fittedValues[i]) * (y[i] - fittedValues[i]);
    }
    m_rSquared = (ssTot > 0.0) ? 1.0 - ssRes / ssTot : 1.0;
    computeSignificance(xtxInv, beta, ssRes, y.size());
}

void LinearRegression::computeSignificance(const MathUtils::Matrix& xtxInv,
                                           const std::vector<double>& beta,
                                           double ssRes,
                                           size_t n) {
    const size_t parameters = beta.size();
    m_residualDf = n > parameters ? n - parameters : 0;
    m_standardErrors.assign(parameters, 0.0);
    m_tStatistics.assign(parameters, 0.0);
    m_pValues.assign(parameters, 1.0);
    if (m_residualDf == 0) return;

    const double sigma2 = ssRes / static_cast<double>(m_residualDf);
    const double eps = MathUtils::getNumericEpsilon();
    for (size_t j = 0; j < parameters; ++j) {
        // Epsilon-substituted inverses can carry negative diagonals.
        m_standardErrors[j] = std::sqrt(std::max(0.0, sigma2 * xtxInv.at(j, j)));
        if (m_standardErrors[j] > eps) {
            m_tStatistics[j] = beta[j] / m_standardErrors[j];
        } else if (std::abs(beta[j]) > eps) {
            m_tStatistics[j] = std::copysign(std::numeric_limits<double>::infinity(), beta[j]);
        }
        m_pValues[j] = MathUtils::getPValueFromT(m_tStatistics[j], m_residualDf);
    }
}

std::vector<double> LinearRegression::predict(const std::vector<std::vector<double>>& X) const {
    return predictRaw(X);
}

std::vector<double> LinearRegression::predictRaw(const std::vector<std::vector<double>>& X) const {
    if (!m_fitted) throw Circadia::ConfigurationException("LinearRegression::predict called before fit");
    std::vector<double> out;
    out.reserve(X.size());
    for (const auto& row : X) {
        if (row.size() != m_coefficients.size()) {
            throw Circadia::ConfigurationException(
                "regression expects " + std::to_string(m_coefficients.size()) +
                " features, got " + std::to_string(row.size()));
        }
        out.push_back(m_intercept + MathUtils::dot(row, m_coefficients));
    }
    return out;
}

PolynomialRegression::PolynomialRegression(size_t degree) : m_degree(degree) {
    if (m_degree == 0) throw Circadia::ConfigurationException("PolynomialRegression degree must be >= 1");
}

std::vector<double> PolynomialRegression::expandFeatures(const std::vector<double>& row) const {
    std::vector<double> features;
    features.reserve(row.size() * m_degree);
    for (size_t d = 1; d <= m_degree; ++d) {
        for (double x : row) features.push_back(std::pow(x, static_cast<double>(d)));
    }
    return features;
}

std::vector<std::vector<double>> PolynomialRegression::expandAll(const std::vector<std::vector<double>>& X) const {
    std::vector<std::vector<double>> out;
    out.reserve(X.size());
    for (const auto& row : X) out.push_back(expandFeatures(row));
    return out;
}

void PolynomialRegression::fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y) {
    CommonUtils::requireRectangular(X, "PolynomialRegression::fit");
    LinearRegression::fit(expandAll(X), y);
}

std::vector<double> PolynomialRegression::predict(const std::vector<std::vector<double>>& X) const {
    return predictRaw(expandAll(X));
}

LogisticRegression::LogisticRegression(double learningRate, size_t iterations)
    : m_learningRate(learningRate), m_iterations(iterations) {
    if (!(m_learningRate > 0.0)) throw Circadia::ConfigurationException("LogisticRegression learning rate must be > 0");
}

double LogisticRegression::probability(const std::vector<double>& row) const {
    return sigmoid(m_intercept + MathUtils::dot(row, m_coefficients));
}

void LogisticRegression::fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y) {
    const size_t m = CommonUtils::requireRectangular(X, "LogisticRegression::fit");
    requirePaired(X, y, "LogisticRegression::fit");

    const double n = static_cast<double>(X.size());
    m_coefficients.assign(m, 0.0);
    m_intercept = 0.0;

    std::vector<double> errors(X.size(), 0.0);
    for (size_t iter = 0; iter < m_iterations; ++iter) {
        for (size_t i = 0; i < X.size(); ++i) errors[i] = probability(X[i]) - y[i];

        for (size_t j = 0; j < m; ++j) {
            double gradient = 0.0;
            for (size_t i = 0; i < X.size(); ++i) gradient += errors[i] * X[i][j];
            m_coefficients[j] -= m_learningRate * gradient / n;
        }
        double interceptGradient = 0.0;
        for (double e : errors) interceptGradient += e;
        m_intercept -= m_learningRate * interceptGradient / n;
    }
    m_fitted = true;
}

std::vector<double> LogisticRegression::predict(const std::vector<std::vector<double>>& X) const {
    if (!m_fitted) throw Circadia::ConfigurationException("LogisticRegression::predict called before fit");
    std::vector<double> out;
    out.reserve(X.size());
    for (const auto& row : X) {
        if (row.size() != m_coefficients.size()) {
            throw Circadia::ConfigurationException(
                "LogisticRegression expects " + std::to_string(m_coefficients.size()) +
                " features, got " + std::to_string(row.size()));
        }
        out.push_back(probability(row));
    }
    return out;
}

std::vector<int> LogisticRegression::predictClass(const std::vector<std::vector<double>>& X, double threshold) const {
    std::vector<int> out;
    for (double p : predict(X)) out.push_back(p >= threshold ? 1 : 0);
    return out;
}
