#include "MathUtils.h"
#include "CircadiaExceptions.h"

#include <algorithm>
#include <cstddef>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kVeryLargeTStatisticCutoff = 1e10;

struct RuntimeConfig {
    double numericEpsilon = 1e-12;
    size_t betaFallbackIntervalsStart = 4096;
    size_t betaFallbackIntervalsMax = 65536;
    double betaFallbackTolerance = 1e-8;
    MathUtils::SingularPolicy singularPolicy = MathUtils::SingularPolicy::REPORT;
};

RuntimeConfig& runtimeConfig() {
    thread_local RuntimeConfig cfg;
    return cfg;
}

double clamp01(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

void requireSquare(const MathUtils::Matrix& m, const char* operation) {
    if (m.rows != m.cols) {
        throw Circadia::ConfigurationException(
            std::string(operation) + " requires a square matrix, got " +
            std::to_string(m.rows) + "x" + std::to_string(m.cols));
    }
}

void requireSameShape(const MathUtils::Matrix& a, const MathUtils::Matrix& b, const char* operation) {
    if (a.rows != b.rows || a.cols != b.cols) {
        throw Circadia::ConfigurationException(std::string("Matrix dimensions mismatch for ") + operation);
    }
}

void requireSameLength(const std::vector<double>& a, const std::vector<double>& b, const char* operation) {
    if (a.size() != b.size()) {
        throw Circadia::ConfigurationException(
            std::string(operation) + " on vectors of length " + std::to_string(a.size()) +
            " and " + std::to_string(b.size()));
    }
}

double midpointIntegrateBetaRegularized(double a, double b, double x, size_t intervals) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double logBeta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double h = x / static_cast<double>(intervals);
    double sum = 0.0;

    for (size_t i = 0; i < intervals; ++i) {
        double t = (static_cast<double>(i) + 0.5) * h;
        t = std::clamp(t, 1e-15, 1.0 - 1e-15);
        double logPdf = (a - 1.0) * std::log(t) + (b - 1.0) * std::log(1.0 - t) - logBeta;
        sum += std::exp(logPdf);
    }

    return clamp01(sum * h);
}

double midpointIntegrateBetaAdaptive(double a, double b, double x) {
    const RuntimeConfig& cfg = runtimeConfig();
    size_t startIntervals = std::max<size_t>(256, cfg.betaFallbackIntervalsStart);
    size_t maxIntervals = std::max(startIntervals, cfg.betaFallbackIntervalsMax);

    double prev = midpointIntegrateBetaRegularized(a, b, x, startIntervals);
    for (size_t intervals = startIntervals * 2; intervals <= maxIntervals; intervals *= 2) {
        double cur = midpointIntegrateBetaRegularized(a, b, x, intervals);
        const double richardsonErr = std::abs(cur - prev) / 3.0;
        if (richardsonErr < cfg.betaFallbackTolerance) return cur;
        prev = cur;
    }
    return prev;
}

std::pair<double, bool> betaContinuedFraction(double a, double b, double x) {
    const int maxIter = std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 2000);
    constexpr double eps = 3e-14;
    constexpr double fpmin = 1e-300;

    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < fpmin) d = fpmin;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= maxIter; ++m) {
        const int m2 = 2 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < fpmin) d = fpmin;
        c = 1.0 + aa / c;
        if (std::abs(c) < fpmin) c = fpmin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) <= eps) {
            return {h, true};
        }
    }
    return {h, false};
}

double cofactorDeterminant(const MathUtils::Matrix& m) {
    const size_t n = m.rows;
    if (n == 0) return 1.0;
    if (n == 1) return m.at(0, 0);
    if (n == 2) return m.at(0, 0) * m.at(1, 1) - m.at(0, 1) * m.at(1, 0);

    double det = 0.0;
    MathUtils::Matrix minor(n - 1, n - 1);
    for (size_t j = 0; j < n; ++j) {
        const double pivot = m.at(0, j);
        if (pivot == 0.0) continue;
        for (size_t r = 1; r < n; ++r) {
            size_t mc = 0;
            for (size_t c = 0; c < n; ++c) {
                if (c == j) continue;
                minor.at(r - 1, mc++) = m.at(r, c);
            }
        }
        const double sign = (j % 2 == 0) ? 1.0 : -1.0;
        det += sign * pivot * cofactorDeterminant(minor);
    }
    return det;
}
} // namespace

void MathUtils::setNumericTuning(double numericEpsilon,
                                 size_t betaIntervalsStart,
                                 size_t betaIntervalsMax,
                                 double betaTolerance) {
    RuntimeConfig& cfg = runtimeConfig();
    if (numericEpsilon > 0.0) cfg.numericEpsilon = numericEpsilon;
    if (betaIntervalsStart >= 256) cfg.betaFallbackIntervalsStart = betaIntervalsStart;
    if (betaIntervalsMax >= cfg.betaFallbackIntervalsStart) cfg.betaFallbackIntervalsMax = betaIntervalsMax;
    if (betaTolerance > 0.0) cfg.betaFallbackTolerance = betaTolerance;
}

double MathUtils::getNumericEpsilon() noexcept {
    return runtimeConfig().numericEpsilon;
}

void MathUtils::setSingularPolicy(SingularPolicy policy) noexcept {
    runtimeConfig().singularPolicy = policy;
}

MathUtils::SingularPolicy MathUtils::getSingularPolicy() noexcept {
    return runtimeConfig().singularPolicy;
}

MathUtils::Matrix MathUtils::Matrix::fromRows(const std::vector<std::vector<double>>& rowsIn) {
    if (rowsIn.empty()) return Matrix();
    const size_t c = rowsIn.front().size();
    Matrix m(rowsIn.size(), c);
    for (size_t r = 0; r < rowsIn.size(); ++r) {
        if (rowsIn[r].size() != c) {
            throw Circadia::ConfigurationException(
                "Row " + std::to_string(r) + " has length " + std::to_string(rowsIn[r].size()) +
                ", expected " + std::to_string(c));
        }
        std::copy(rowsIn[r].begin(), rowsIn[r].end(), m.data.begin() + static_cast<std::ptrdiff_t>(r * c));
    }
    return m;
}

std::vector<std::vector<double>> MathUtils::Matrix::toRows() const {
    std::vector<std::vector<double>> out(rows);
    for (size_t r = 0; r < rows; ++r) out[r] = row(r);
    return out;
}

std::vector<double> MathUtils::Matrix::row(size_t r) const {
    const auto begin = data.begin() + static_cast<std::ptrdiff_t>(r * cols);
    return std::vector<double>(begin, begin + static_cast<std::ptrdiff_t>(cols));
}

std::vector<double> MathUtils::Matrix::column(size_t c) const {
    std::vector<double> out(rows);
    for (size_t r = 0; r < rows; ++r) out[r] = at(r, c);
    return out;
}

MathUtils::Matrix MathUtils::Matrix::identity(size_t n) {
    Matrix res(n, n);
    for (size_t i = 0; i < n; ++i) res.at(i, i) = 1.0;
    return res;
}

MathUtils::Matrix MathUtils::Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            result.at(c, r) = at(r, c);
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::multiply(const Matrix& other) const {
    if (cols != other.rows) throw Circadia::ConfigurationException("Matrix dimensions mismatch for multiplication.");
    Matrix result(rows, other.cols);
    const Matrix otherT = other.transpose();

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t r = 0; r < rows; ++r) {
        const double* leftRow = data.data() + r * cols;
        for (size_t c = 0; c < other.cols; ++c) {
            const double* rightRow = otherT.data.data() + c * otherT.cols;
            double sum = 0.0;
            #ifdef USE_OPENMP
            #pragma omp simd reduction(+:sum)
            #endif
            for (size_t k = 0; k < cols; ++k) {
                sum += leftRow[k] * rightRow[k];
            }
            result.at(r, c) = sum;
        }
    }
    return result;
}

std::vector<double> MathUtils::Matrix::multiply(const std::vector<double>& v) const {
    if (cols != v.size()) throw Circadia::ConfigurationException("Matrix/vector dimensions mismatch for multiplication.");
    std::vector<double> out(rows, 0.0);
    for (size_t r = 0; r < rows; ++r) {
        double sum = 0.0;
        for (size_t c = 0; c < cols; ++c) sum += at(r, c) * v[c];
        out[r] = sum;
    }
    return out;
}

MathUtils::Matrix MathUtils::Matrix::add(const Matrix& other) const {
    requireSameShape(*this, other, "addition");
    Matrix out = *this;
    for (size_t i = 0; i < out.data.size(); ++i) out.data[i] += other.data[i];
    return out;
}

MathUtils::Matrix MathUtils::Matrix::subtract(const Matrix& other) const {
    requireSameShape(*this, other, "subtraction");
    Matrix out = *this;
    for (size_t i = 0; i < out.data.size(); ++i) out.data[i] -= other.data[i];
    return out;
}

MathUtils::Matrix MathUtils::Matrix::scaled(double factor) const {
    Matrix out = *this;
    for (double& v : out.data) v *= factor;
    return out;
}

double MathUtils::Matrix::trace() const {
    requireSquare(*this, "trace");
    double sum = 0.0;
    for (size_t i = 0; i < rows; ++i) sum += at(i, i);
    return sum;
}

std::optional<MathUtils::Matrix> MathUtils::Matrix::inverse() const {
    requireSquare(*this, "inverse");
    const size_t n = rows;
    Matrix work = *this;
    Matrix inv = Matrix::identity(n);

    double scale = 0.0;
    for (double v : data) scale = std::max(scale, std::abs(v));
    const double eps = runtimeConfig().numericEpsilon;
    if (scale <= eps) return std::nullopt;
    const double pivotTolerance = std::max(eps, std::numeric_limits<double>::epsilon() * scale * static_cast<double>(n));

    for (size_t i = 0; i < n; ++i) {
        size_t pivotRow = i;
        double pivotAbs = std::abs(work.at(i, i));
        for (size_t r = i + 1; r < n; ++r) {
            const double v = std::abs(work.at(r, i));
            if (v > pivotAbs) {
                pivotAbs = v;
                pivotRow = r;
            }
        }
        if (pivotAbs <= pivotTolerance) return std::nullopt;

        if (pivotRow != i) {
            for (size_t c = 0; c < n; ++c) {
                std::swap(work.at(i, c), work.at(pivotRow, c));
                std::swap(inv.at(i, c), inv.at(pivotRow, c));
            }
        }

        const double pivot = work.at(i, i);
        for (size_t j = 0; j < n; ++j) {
            work.at(i, j) /= pivot;
            inv.at(i, j) /= pivot;
        }

        for (size_t r = 0; r < n; ++r) {
            if (r == i) continue;
            const double factor = work.at(r, i);
            if (factor == 0.0) continue;
            for (size_t c = 0; c < n; ++c) {
                work.at(r, c) -= factor * work.at(i, c);
                inv.at(r, c) -= factor * inv.at(i, c);
            }
            work.at(r, i) = 0.0;
        }
    }
    return inv;
}

MathUtils::Matrix MathUtils::Matrix::inverseWithEpsilon() const {
    requireSquare(*this, "inverse");
    const size_t n = rows;
    Matrix work = *this;
    Matrix inv = Matrix::identity(n);
    const auto pivotOrEpsilon = [](double v) { return v == 0.0 ? kLegacyPivotEpsilon : v; };

    for (size_t i = 0; i < n; ++i) {
        size_t pivotRow = i;
        for (size_t r = i + 1; r < n; ++r) {
            if (std::abs(work.at(r, i)) > std::abs(work.at(pivotRow, i))) pivotRow = r;
        }
        if (pivotRow != i) {
            for (size_t c = 0; c < n; ++c) {
                std::swap(work.at(i, c), work.at(pivotRow, c));
                std::swap(inv.at(i, c), inv.at(pivotRow, c));
            }
        }
        const double pivot = pivotOrEpsilon(work.at(i, i));
        for (size_t r = 0; r < n; ++r) {
            if (r == i) continue;
            const double factor = work.at(r, i) / pivot;
            for (size_t c = 0; c < n; ++c) {
                work.at(r, c) -= factor * work.at(i, c);
                inv.at(r, c) -= factor * inv.at(i, c);
            }
        }
    }

    for (size_t i = 0; i < n; ++i) {
        const double divisor = pivotOrEpsilon(work.at(i, i));
        for (size_t c = 0; c < n; ++c) inv.at(i, c) /= divisor;
    }
    return inv;
}

double MathUtils::Matrix::determinant() const {
    requireSquare(*this, "determinant");
    if (rows > kMaxCofactorDimension) {
        throw Circadia::ConfigurationException(
            "cofactor determinant is limited to " + std::to_string(kMaxCofactorDimension) +
            "x" + std::to_string(kMaxCofactorDimension) + " matrices, got " + std::to_string(rows));
    }
    return cofactorDeterminant(*this);
}

MathUtils::Matrix MathUtils::invert(const Matrix& m, const std::string& context) {
    if (auto inv = m.inverse()) return *inv;
    if (getSingularPolicy() == SingularPolicy::LEGACY_EPSILON) {
        return m.inverseWithEpsilon();
    }
    throw Circadia::NumericalDegeneracyException(context + ": matrix is singular or near-singular");
}

MathUtils::EigenResult MathUtils::eigenDecomposition(const Matrix& m, const EigenOptions& options) {
    requireSquare(m, "eigendecomposition");
    const size_t n = m.rows;
    EigenResult out;
    out.values.reserve(n);
    out.vectors.reserve(n);

    std::mt19937 rng(options.seed);
    std::uniform_real_distribution<double> start(0.0, 1.0);
    const double eps = runtimeConfig().numericEpsilon;
    Matrix a = m;

    for (size_t k = 0; k < n; ++k) {
        std::vector<double> v(n);
        for (double& x : v) x = start(rng);
        double norm = std::sqrt(dot(v, v));
        for (double& x : v) x /= norm;

        for (size_t iter = 0; iter < options.maxIterations; ++iter) {
            std::vector<double> av = a.multiply(v);
            norm = std::sqrt(dot(av, av));
            // Remaining matrix annihilates v: the residual spectrum is zero.
            if (norm <= eps) break;
            for (double& x : av) x /= norm;
            const double moved = euclideanDistance(v, av);
            v = std::move(av);
            if (moved < options.tolerance) break;
        }

        const double lambda = dot(a.multiply(v), v);
        out.values.push_back(lambda);
        out.vectors.push_back(v);
        a = a.subtract(outer(v, v, lambda));
    }
    return out;
}

double MathUtils::dot(const std::vector<double>& a, const std::vector<double>& b) {
    requireSameLength(a, b, "dot product");
    return std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
}

double MathUtils::squaredDistance(const std::vector<double>& a, const std::vector<double>& b) {
    requireSameLength(a, b, "distance");
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

double MathUtils::euclideanDistance(const std::vector<double>& a, const std::vector<double>& b) {
    return std::sqrt(squaredDistance(a, b));
}

double MathUtils::cosineSimilarity(const std::vector<double>& a, const std::vector<double>& b) {
    const double ab = dot(a, b);
    const double denom = std::sqrt(dot(a, a)) * std::sqrt(dot(b, b));
    if (denom <= runtimeConfig().numericEpsilon) return 0.0;
    return ab / denom;
}

MathUtils::Matrix MathUtils::outer(const std::vector<double>& u, const std::vector<double>& v, double scalar) {
    Matrix out(u.size(), v.size());
    for (size_t i = 0; i < u.size(); ++i) {
        for (size_t j = 0; j < v.size(); ++j) {
            out.at(i, j) = scalar * u[i] * v[j];
        }
    }
    return out;
}

std::vector<double> MathUtils::columnMeans(const Matrix& data) {
    std::vector<double> means(data.cols, 0.0);
    if (data.rows == 0) return means;
    for (size_t r = 0; r < data.rows; ++r) {
        for (size_t c = 0; c < data.cols; ++c) means[c] += data.at(r, c);
    }
    for (double& m : means) m /= static_cast<double>(data.rows);
    return means;
}

std::vector<double> MathUtils::columnStdDevs(const Matrix& data) {
    std::vector<double> stds(data.cols, 0.0);
    if (data.rows < 2) return stds;
    const std::vector<double> means = columnMeans(data);
    for (size_t r = 0; r < data.rows; ++r) {
        for (size_t c = 0; c < data.cols; ++c) {
            const double d = data.at(r, c) - means[c];
            stds[c] += d * d;
        }
    }
    for (double& s : stds) s = std::sqrt(s / static_cast<double>(data.rows - 1));
    return stds;
}

MathUtils::Matrix MathUtils::center(const Matrix& data) {
    const std::vector<double> means = columnMeans(data);
    Matrix out = data;
    for (size_t r = 0; r < out.rows; ++r) {
        for (size_t c = 0; c < out.cols; ++c) out.at(r, c) -= means[c];
    }
    return out;
}

MathUtils::Matrix MathUtils::standardize(const Matrix& data) {
    const std::vector<double> stds = columnStdDevs(data);
    Matrix out = center(data);
    for (size_t r = 0; r < out.rows; ++r) {
        for (size_t c = 0; c < out.cols; ++c) {
            const double s = stds[c] > runtimeConfig().numericEpsilon ? stds[c] : 1.0;
            out.at(r, c) /= s;
        }
    }
    return out;
}

MathUtils::Matrix MathUtils::covarianceOfCentered(const Matrix& centered) {
    return crossCovarianceOfCentered(centered, centered);
}

MathUtils::Matrix MathUtils::crossCovarianceOfCentered(const Matrix& x, const Matrix& y) {
    if (x.rows != y.rows) {
        throw Circadia::ConfigurationException("cross-covariance needs paired observations");
    }
    if (x.rows < 2) {
        throw Circadia::InsufficientDataException("covariance needs at least two observations", 2, x.rows);
    }
    Matrix cov = x.transpose().multiply(y);
    return cov.scaled(1.0 / static_cast<double>(x.rows - 1));
}

MathUtils::Matrix MathUtils::correlationMatrix(const Matrix& data) {
    return covarianceOfCentered(standardize(data));
}

double MathUtils::betaRegularized(double a, double b, double x) {
    if (x < 0.0 || x > 1.0) return std::numeric_limits<double>::quiet_NaN();
    if (x == 0.0) return 0.0;
    if (x == 1.0) return 1.0;

    if (a <= 0.0 || b <= 0.0 || !std::isfinite(a) || !std::isfinite(b)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const double lnBeta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
    const double bt = std::exp(a * std::log(x) + b * std::log(1.0 - x) - lnBeta);
    const bool useDirect = (x < (a + 1.0) / (a + b + 2.0));

    if (useDirect) {
        auto [cf, ok] = betaContinuedFraction(a, b, x);
        if (ok && std::isfinite(cf)) {
            return clamp01(bt * cf / a);
        }
    } else {
        auto [cf, ok] = betaContinuedFraction(b, a, 1.0 - x);
        if (ok && std::isfinite(cf)) {
            return clamp01(1.0 - bt * cf / b);
        }
    }

    return midpointIntegrateBetaAdaptive(a, b, x);
}

double MathUtils::fCdf(double f, double d1, double d2) {
    if (!std::isfinite(f)) return f > 0.0 ? 1.0 : 0.0;
    if (f <= 0.0 || d1 <= 0.0 || d2 <= 0.0) return 0.0;
    const double x = (d1 * f) / (d1 * f + d2);
    const double cdf = betaRegularized(d1 / 2.0, d2 / 2.0, x);
    return std::isfinite(cdf) ? cdf : 0.0;
}

double MathUtils::getPValueFromT(double t, size_t df) {
    if (df == 0) return 1.0;
    const double nu = static_cast<double>(df);
    const double tAbs = std::abs(t);

    if (!std::isfinite(tAbs) || tAbs > kVeryLargeTStatisticCutoff) return 0.0;

    const double x = nu / (nu + tAbs * tAbs);
    return betaRegularized(nu / 2.0, 0.5, x);
}
