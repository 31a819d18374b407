#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class MathUtils {
public:
    // How components that need an inverse react to a singular matrix.
    enum class SingularPolicy { REPORT, LEGACY_EPSILON };

    static constexpr size_t kMaxCofactorDimension = 10;
    static constexpr double kLegacyPivotEpsilon = 1e-10;

    static void setNumericTuning(double numericEpsilon,
                                 size_t betaIntervalsStart,
                                 size_t betaIntervalsMax,
                                 double betaTolerance);
    static double getNumericEpsilon() noexcept;
    static void setSingularPolicy(SingularPolicy policy) noexcept;
    static SingularPolicy getSingularPolicy() noexcept;

    // Dense row-major matrix over one contiguous buffer.
    struct Matrix {
        std::vector<double> data;
        size_t rows = 0;
        size_t cols = 0;

        Matrix() = default;
        Matrix(size_t r, size_t c) : data(r * c, 0.0), rows(r), cols(c) {}

        double& at(size_t r, size_t c) { return data[r * cols + c]; }
        double at(size_t r, size_t c) const { return data[r * cols + c]; }

        /**
         * @brief Copies a nested row list into contiguous storage.
         * @throws Circadia::ConfigurationException on ragged rows.
         */
        static Matrix fromRows(const std::vector<std::vector<double>>& rowsIn);
        std::vector<std::vector<double>> toRows() const;
        std::vector<double> row(size_t r) const;
        std::vector<double> column(size_t c) const;

        /**
         * @brief Builds identity matrix I(n).
         */
        static Matrix identity(size_t n);

        Matrix transpose() const;

        /**
         * @brief Matrix multiplication this * other.
         * @pre this->cols == other.rows.
         * @throws Circadia::ConfigurationException on shape mismatch.
         */
        Matrix multiply(const Matrix& other) const;
        std::vector<double> multiply(const std::vector<double>& v) const;

        Matrix add(const Matrix& other) const;
        Matrix subtract(const Matrix& other) const;
        Matrix scaled(double factor) const;
        double trace() const;

        /**
         * @brief Inverts a square matrix using partial-pivot Gauss-Jordan elimination.
         * @pre rows == cols.
         * @post Returns std::nullopt for singular/near-singular matrices.
         * @throws Circadia::ConfigurationException when matrix is not square.
         */
        std::optional<Matrix> inverse() const;

        /**
         * @brief Gauss-Jordan inverse that substitutes kLegacyPivotEpsilon for an exactly zero pivot.
         * @post Always returns a matrix; results on singular input are not meaningful.
         * @throws Circadia::ConfigurationException when matrix is not square.
         */
        Matrix inverseWithEpsilon() const;

        /**
         * @brief Recursive cofactor expansion.
         * @throws Circadia::ConfigurationException when not square or larger than kMaxCofactorDimension.
         */
        double determinant() const;
    };

    struct EigenOptions {
        EigenOptions() {}
        size_t maxIterations = 100;
        double tolerance = 1e-10;
        uint32_t seed = 1337;
    };

    // Eigenpairs in extraction order; vectors[i] is unit length.
    struct EigenResult {
        std::vector<double> values;
        std::vector<std::vector<double>> vectors;
    };

    /**
     * @brief Inverse under the current SingularPolicy.
     * @throws Circadia::NumericalDegeneracyException when singular and the policy is REPORT.
     */
    static Matrix invert(const Matrix& m, const std::string& context);

    /**
     * @brief Power iteration with deflation A -= lambda * v * v^T.
     * @pre m is square.
     * @post Extracts m.rows eigenpairs; iteration count per pair is capped by options.maxIterations.
     */
    static EigenResult eigenDecomposition(const Matrix& m, const EigenOptions& options = EigenOptions{});

    static double dot(const std::vector<double>& a, const std::vector<double>& b);
    static double squaredDistance(const std::vector<double>& a, const std::vector<double>& b);
    static double euclideanDistance(const std::vector<double>& a, const std::vector<double>& b);
    static double cosineSimilarity(const std::vector<double>& a, const std::vector<double>& b);
    static Matrix outer(const std::vector<double>& u, const std::vector<double>& v, double scalar = 1.0);

    static std::vector<double> columnMeans(const Matrix& data);
    // Sample (n-1) standard deviation per column.
    static std::vector<double> columnStdDevs(const Matrix& data);
    static Matrix center(const Matrix& data);
    // Centers each column and divides by its sample deviation; zero deviation divides by 1.
    static Matrix standardize(const Matrix& data);
    static Matrix covarianceOfCentered(const Matrix& centered);
    static Matrix crossCovarianceOfCentered(const Matrix& x, const Matrix& y);
    static Matrix correlationMatrix(const Matrix& data);

    /**
     * @brief Regularized incomplete beta I_x(a, b).
     * @post Returns NaN for x outside [0,1] or non-positive shape parameters.
     */
    static double betaRegularized(double a, double b, double x);

    /**
     * @brief CDF of the F distribution with (d1, d2) degrees of freedom.
     */
    static double fCdf(double f, double d1, double d2);

    /**
     * @brief Two-tailed p-value from t-statistic and degrees of freedom.
     * @pre df >= 0.
     */
    static double getPValueFromT(double t, size_t df);
};
