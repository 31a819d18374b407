#include <catch2/catch.hpp>

#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"

#include <cmath>
#include <limits>
#include <vector>

using Matrix = MathUtils::Matrix;

namespace {
// Restores the thread's singular policy when a test section exits.
struct SingularPolicyGuard {
    MathUtils::SingularPolicy saved = MathUtils::getSingularPolicy();
    ~SingularPolicyGuard() { MathUtils::setSingularPolicy(saved); }
};
} // namespace

TEST_CASE("Matrix basic algebra", "[math][matrix]") {
    const Matrix a = Matrix::fromRows({{1, 2}, {3, 4}});

    SECTION("identity is neutral for multiply") {
        const Matrix product = a.multiply(Matrix::identity(2));
        REQUIRE(product.toRows() == a.toRows());
    }

    SECTION("transpose swaps indices") {
        const Matrix t = a.transpose();
        REQUIRE(t.at(0, 1) == 3.0);
        REQUIRE(t.at(1, 0) == 2.0);
    }

    SECTION("matrix-vector product and trace") {
        const std::vector<double> v = a.multiply(std::vector<double>{1.0, 1.0});
        REQUIRE(v[0] == Approx(3.0));
        REQUIRE(v[1] == Approx(7.0));
        REQUIRE(a.trace() == Approx(5.0));
    }

    SECTION("shape mismatch is a configuration error") {
        const Matrix b = Matrix::fromRows({{1, 2, 3}});
        REQUIRE_THROWS_AS(a.multiply(b), Circadia::ConfigurationException);
    }

    SECTION("ragged rows are rejected") {
        REQUIRE_THROWS_AS(Matrix::fromRows({{1, 2}, {3}}), Circadia::ConfigurationException);
    }
}

TEST_CASE("Matrix inverse and singular policy", "[math][inverse]") {
    SingularPolicyGuard guard;

    SECTION("well-conditioned 2x2 inverse") {
        const auto inv = Matrix::fromRows({{4, 7}, {2, 6}}).inverse();
        REQUIRE(inv.has_value());
        REQUIRE(inv->at(0, 0) == Approx(0.6));
        REQUIRE(inv->at(0, 1) == Approx(-0.7));
        REQUIRE(inv->at(1, 0) == Approx(-0.2));
        REQUIRE(inv->at(1, 1) == Approx(0.4));
    }

    SECTION("singular matrix has no inverse") {
        const Matrix singular = Matrix::fromRows({{1, 2}, {2, 4}});
        REQUIRE_FALSE(singular.inverse().has_value());

        MathUtils::setSingularPolicy(MathUtils::SingularPolicy::REPORT);
        REQUIRE_THROWS_AS(MathUtils::invert(singular, "test"), Circadia::NumericalDegeneracyException);

        MathUtils::setSingularPolicy(MathUtils::SingularPolicy::LEGACY_EPSILON);
        const Matrix legacy = MathUtils::invert(singular, "test");
        REQUIRE(legacy.rows == 2);
        REQUIRE(legacy.cols == 2);
    }

    SECTION("non-square inverse is a configuration error") {
        REQUIRE_THROWS_AS(Matrix::fromRows({{1, 2, 3}, {4, 5, 6}}).inverse(), Circadia::ConfigurationException);
    }
}

TEST_CASE("Cofactor determinant", "[math][determinant]") {
    REQUIRE(Matrix::fromRows({{6, 1, 1}, {4, -2, 5}, {2, 8, 7}}).determinant() == Approx(-306.0));
    REQUIRE(Matrix::identity(MathUtils::kMaxCofactorDimension).determinant() == Approx(1.0));
    REQUIRE_THROWS_AS(Matrix::identity(MathUtils::kMaxCofactorDimension + 1).determinant(),
                      Circadia::ConfigurationException);
}

TEST_CASE("Power-iteration eigen decomposition", "[math][eigen]") {
    const Matrix m = Matrix::fromRows({{2, 1}, {1, 2}});
    const MathUtils::EigenResult eig = MathUtils::eigenDecomposition(m);

    REQUIRE(eig.values.size() == 2);
    REQUIRE(eig.values[0] == Approx(3.0).margin(1e-6));
    REQUIRE(eig.values[1] == Approx(1.0).margin(1e-6));
    for (const auto& v : eig.vectors) {
        REQUIRE(MathUtils::dot(v, v) == Approx(1.0).margin(1e-9));
    }
    REQUIRE(std::abs(eig.vectors[0][0]) == Approx(std::sqrt(0.5)).margin(1e-5));
}

TEST_CASE("Vector helpers", "[math][vector]") {
    REQUIRE(MathUtils::dot({1, 2, 3}, {4, 5, 6}) == Approx(32.0));
    REQUIRE(MathUtils::euclideanDistance({0, 0}, {3, 4}) == Approx(5.0));
    REQUIRE(MathUtils::cosineSimilarity({1, 0}, {0, 1}) == Approx(0.0));
    REQUIRE(MathUtils::cosineSimilarity({0, 0}, {1, 1}) == 0.0);
    REQUIRE_THROWS_AS(MathUtils::dot({1, 2}, {1}), Circadia::ConfigurationException);
}

TEST_CASE("Covariance and correlation", "[math][covariance]") {
    const Matrix data = Matrix::fromRows({{1, 2}, {2, 4}, {3, 6}, {4, 8}});
    const Matrix cov = MathUtils::covarianceOfCentered(MathUtils::center(data));
    REQUIRE(cov.at(0, 0) == Approx(5.0 / 3.0));
    REQUIRE(cov.at(0, 1) == Approx(10.0 / 3.0));

    const Matrix corr = MathUtils::correlationMatrix(data);
    REQUIRE(corr.at(0, 1) == Approx(1.0));
    REQUIRE(corr.at(1, 1) == Approx(1.0));

    REQUIRE_THROWS_AS(MathUtils::covarianceOfCentered(Matrix::fromRows({{1, 2}})),
                      Circadia::InsufficientDataException);
}

TEST_CASE("Distribution helpers", "[math][distribution]") {
    REQUIRE(MathUtils::betaRegularized(1.0, 1.0, 0.3) == Approx(0.3).margin(1e-9));
    REQUIRE(MathUtils::fCdf(1.0, 2.0, 2.0) == Approx(0.5).margin(1e-9));
    REQUIRE(MathUtils::fCdf(std::numeric_limits<double>::infinity(), 3.0, 10.0) == 1.0);
    REQUIRE(MathUtils::fCdf(0.0, 3.0, 10.0) == 0.0);
    REQUIRE(MathUtils::getPValueFromT(0.0, 10) == Approx(1.0));
    REQUIRE(MathUtils::getPValueFromT(50.0, 10) < 1e-6);
    REQUIRE(std::isnan(MathUtils::betaRegularized(1.0, 1.0, 1.5)));
}

TEST_CASE("Descriptive statistics", "[stats]") {
    const std::vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};
    REQUIRE(Statistics::mean(values) == Approx(5.0));
    REQUIRE(Statistics::populationStdDev(values) == Approx(2.0));

    const ColumnStats stats = Statistics::calculateStats(values);
    REQUIRE(stats.median == Approx(4.5));
    REQUIRE(stats.variance == Approx(32.0 / 7.0));

    const LineFit fit = Statistics::fitLine({1, 3, 5, 7});
    REQUIRE(fit.slope == Approx(2.0));
    REQUIRE(fit.intercept == Approx(1.0));
    REQUIRE(fit.rSquared == Approx(1.0));
    REQUIRE(Statistics::fitLine({4, 4, 4}).rSquared == 0.0);

    REQUIRE(Statistics::expectedPathLength(1) == 0.0);
    REQUIRE(Statistics::expectedPathLength(2) == 1.0);
    REQUIRE(CommonUtils::quantileByNth({1, 2, 3, 4, 5}, 0.25) == Approx(2.0));
    REQUIRE(CommonUtils::toFixed(2.345, 1) == "2.3");
}
