#pragma once

#include "MathUtils.h"

#include <cstddef>
#include <vector>

// Ordinary least squares through the normal equation with an intercept column.
class LinearRegression {
public:
    LinearRegression() = default;
    virtual ~LinearRegression() = default;

    /**
     * @brief Solves beta = (X^T X)^-1 X^T y.
     * @pre X is rectangular and X.size() == y.size().
     * @throws Circadia::ConfigurationException on shape mismatch.
     * @throws Circadia::NumericalDegeneracyException when X^T X is singular under the REPORT policy.
     */
    virtual void fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y);

    /**
     * @throws Circadia::ConfigurationException before fit() or on a feature-count mismatch.
     */
    virtual std::vector<double> predict(const std::vector<std::vector<double>>& X) const;

    double intercept() const noexcept { return m_intercept; }
    const std::vector<double>& coefficients() const noexcept { return m_coefficients; }
    // Coefficient of determination on the training set.
    double rSquared() const noexcept { return m_rSquared; }
    bool fitted() const noexcept { return m_fitted; }

    /**
     * @brief Per-parameter OLS inference; index 0 is the intercept, then one entry per coefficient.
     * @post Two-sided p-values use Student's t with residualDegreesOfFreedom(); with no residual
     *       degrees of freedom the errors and t statistics are 0 and every p-value is 1.
     */
    const std::vector<double>& standardErrors() const noexcept { return m_standardErrors; }
    const std::vector<double>& tStatistics() const noexcept { return m_tStatistics; }
    const std::vector<double>& pValues() const noexcept { return m_pValues; }
    size_t residualDegreesOfFreedom() const noexcept { return m_residualDf; }

protected:
    std::vector<double> predictRaw(const std::vector<std::vector<double>>& X) const;

private:
    void computeSignificance(const MathUtils::Matrix& xtxInv, const std::vector<double>& beta, double ssRes, size_t n);

    std::vector<double> m_coefficients;
    double m_intercept = 0.0;
    double m_rSquared = 0.0;
    std::vector<double> m_standardErrors;
    std::vector<double> m_tStatistics;
    std::vector<double> m_pValues;
    size_t m_residualDf = 0;
    bool m_fitted = false;
};

class PolynomialRegression : public LinearRegression {
public:
    explicit PolynomialRegression(size_t degree = 2);

    void fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y) override;
    std::vector<double> predict(const std::vector<std::vector<double>>& X) const override;

    // [x1..xm, x1^2..xm^2, ..., x1^d..xm^d]
    std::vector<double> expandFeatures(const std::vector<double>& row) const;
    size_t degree() const noexcept { return m_degree; }

private:
    std::vector<std::vector<double>> expandAll(const std::vector<std::vector<double>>& X) const;

    size_t m_degree;
};

// Binary classifier trained by full-batch gradient descent on the cross-entropy loss.
class LogisticRegression {
public:
    explicit LogisticRegression(double learningRate = 0.01, size_t iterations = 1000);

    /**
     * @brief Runs exactly `iterations` gradient steps from zero weights.
     * @pre y holds 0/1 labels, X.size() == y.size().
     */
    void fit(const std::vector<std::vector<double>>& X, const std::vector<double>& y);

    // Sigmoid probabilities of class 1.
    std::vector<double> predict(const std::vector<std::vector<double>>& X) const;
    std::vector<int> predictClass(const std::vector<std::vector<double>>& X, double threshold = 0.5) const;

    double intercept() const noexcept { return m_intercept; }
    const std::vector<double>& coefficients() const noexcept { return m_coefficients; }

private:
    double probability(const std::vector<double>& row) const;

    double m_learningRate;
    size_t m_iterations;
    std::vector<double> m_coefficients;
    double m_intercept = 0.0;
    bool m_fitted = false;
};
