#include <catch2/catch.hpp>

#include "CircadiaExceptions.h"
#include "PatternRecognition.h"

#include <cmath>
#include <string>
#include <vector>

namespace {
// 10 x 10 grid over [0, 0.9]^2.
std::vector<std::vector<double>> gridBaseline() {
    std::vector<std::vector<double>> rows;
    for (int i = 0; i < 100; ++i) {
        rows.push_back({(i % 10) * 0.1, (i / 10) * 0.1});
    }
    return rows;
}
} // namespace

TEST_CASE("PatternRecognizer cosine matching", "[pattern][recognizer]") {
    PatternRecognizer recognizer(0.8);
    recognizer.addPattern({"rest", {1.0, 0.0, 0.0}, "restful", 0.0});
    recognizer.addPattern({"strain", {0.0, 1.0, 0.0}, "strained", 0.0});
    REQUIRE(recognizer.getPatterns().size() == 2);

    SECTION("close query returns the best pattern with its similarity") {
        const auto match = recognizer.recognize({0.9, 0.1, 0.0});
        REQUIRE(match.has_value());
        REQUIRE(match->id == "rest");
        REQUIRE(match->label == "restful");
        REQUIRE(match->confidence > 0.8);
        REQUIRE(match->confidence <= 1.0);
    }

    SECTION("ambiguous query stays below threshold") {
        REQUIRE_FALSE(recognizer.recognize({1.0, 1.0, 0.0}).has_value());
    }

    SECTION("length mismatch is a configuration error") {
        REQUIRE_THROWS_AS(recognizer.recognize({1.0, 0.0}), Circadia::ConfigurationException);
    }
}

TEST_CASE("Dynamic time warping", "[pattern][dtw]") {
    REQUIRE(PatternRecognizer::dtwDistance({1, 2, 3}, {1, 2, 3}) == 0.0);
    REQUIRE(PatternRecognizer::dtwDistance({1, 2, 3}, {1, 2, 2, 3}) == 0.0);
    REQUIRE(PatternRecognizer::dtwDistance({0, 0}, {1, 1}) == Approx(2.0));
    REQUIRE(std::isinf(PatternRecognizer::dtwDistance({}, {1.0})));

    PatternRecognizer recognizer(0.5);
    recognizer.addPattern({"ramp", {1, 2, 3}, "ramp", 0.0});
    recognizer.addPattern({"drop", {3, 2, 1}, "drop", 0.0});

    const auto match = recognizer.recognizeSequence({1, 2, 2, 3});
    REQUIRE(match.has_value());
    REQUIRE(match->id == "ramp");
    REQUIRE(match->confidence == Approx(1.0));

    REQUIRE_FALSE(recognizer.recognizeSequence({10, 10, 10}).has_value());
}

TEST_CASE("AnomalyDetector z-score detection", "[pattern][anomaly]") {
    AnomalyDetector detector(2.5);
    REQUIRE_THROWS_AS(detector.detect({0.0, 0.0}), Circadia::ConfigurationException);

    detector.train(gridBaseline());
    REQUIRE(detector.trained());
    REQUIRE(detector.means()[0] == Approx(0.45));

    const AnomalyResult inlier = detector.detect({0.45, 0.5});
    REQUIRE_FALSE(inlier.isAnomaly);
    REQUIRE(inlier.dimensions.empty());

    const AnomalyResult outlier = detector.detect({5.0, 0.5});
    REQUIRE(outlier.isAnomaly);
    REQUIRE(outlier.dimensions == std::vector<size_t>{0});
    REQUIRE(outlier.score == Approx(outlier.zScores[0]));

    REQUIRE_THROWS_AS(detector.detect({1.0}), Circadia::ConfigurationException);
}

TEST_CASE("AnomalyDetector constant dimension divides by one", "[pattern][anomaly]") {
    AnomalyDetector detector(2.5);
    detector.train({{1.0, 3.0}, {2.0, 3.0}, {3.0, 3.0}});
    const AnomalyResult result = detector.detect({2.0, 7.0});
    REQUIRE(result.zScores[1] == Approx(4.0));
    REQUIRE(result.isAnomaly);
}

TEST_CASE("AnomalyDetector isolation and density scores", "[pattern][anomaly]") {
    AnomalyDetector detector(2.5, 42);
    detector.train(gridBaseline());

    SECTION("isolation score ranks the far point higher") {
        const double inlier = detector.isolationScore({0.45, 0.45});
        const double outlier = detector.isolationScore({5.0, 5.0});
        REQUIRE(inlier > 0.0);
        REQUIRE(outlier <= 1.0);
        REQUIRE(outlier > inlier);
    }

    SECTION("local outlier factor is near one inside the grid") {
        REQUIRE(detector.lof({0.45, 0.45}) < 1.5);
        REQUIRE(detector.lof({5.0, 5.0}) > 2.0);
    }

    SECTION("LOF needs two baseline points") {
        AnomalyDetector tiny;
        tiny.train({{1.0, 1.0}});
        REQUIRE_THROWS_AS(tiny.lof({1.0, 1.0}), Circadia::InsufficientDataException);
    }
}

TEST_CASE("TrendAnalyzer direction and strength", "[pattern][trend]") {
    const TrendAnalyzer analyzer;
    const std::vector<double> rising = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    const std::vector<double> falling = {10, 9, 8, 7, 6, 5, 4, 3, 2, 1};
    const std::vector<double> flat(10, 4.0);

    REQUIRE(analyzer.detectTrend(rising) == TrendDirection::INCREASING);
    REQUIRE(analyzer.detectTrend(falling) == TrendDirection::DECREASING);
    REQUIRE(analyzer.detectTrend(flat) == TrendDirection::STABLE);
    REQUIRE(std::string(toString(TrendDirection::STABLE)) == "stable");

    REQUIRE(analyzer.slope(rising) == Approx(1.0));
    REQUIRE(analyzer.trendStrength(rising) == Approx(1.0));
    REQUIRE(analyzer.trendStrength(flat) == 0.0);
}

TEST_CASE("TrendAnalyzer change points", "[pattern][trend]") {
    const TrendAnalyzer analyzer(0.01, 0.2);
    std::vector<double> series(10, 10.0);
    series.insert(series.end(), 10, 20.0);

    const std::vector<size_t> points = analyzer.detectChangePoints(series, 5);
    REQUIRE(points == std::vector<size_t>{7, 8, 9, 10, 11, 12, 13});

    REQUIRE(analyzer.detectChangePoints(std::vector<double>(20, 0.0), 5).empty());
    REQUIRE(analyzer.detectChangePoints({1, 2, 3}, 5).empty());
    REQUIRE_THROWS_AS(analyzer.detectChangePoints(series, 0), Circadia::ConfigurationException);
}

TEST_CASE("TrendAnalyzer configured change-point window", "[pattern][trend]") {
    std::vector<double> series(10, 10.0);
    series.insert(series.end(), 10, 20.0);

    REQUIRE(TrendAnalyzer().detectChangePoints(series) == std::vector<size_t>{7, 8, 9, 10, 11, 12, 13});

    const TrendAnalyzer narrow(0.01, 0.2, 2);
    REQUIRE(narrow.changePointWindow() == 2);
    REQUIRE(narrow.detectChangePoints(series) == std::vector<size_t>{9, 10, 11});
}

TEST_CASE("AnomalyDetector options feed the default overloads", "[pattern][anomaly]") {
    AnomalyDetectorOptions options;
    options.threshold = 10.0;
    options.isolationTrees = 7;
    options.isolationMaxDepth = 3;
    options.lofNeighbors = 200;
    options.seed = 42;

    AnomalyDetector configured(options);
    configured.train(gridBaseline());
    REQUIRE(configured.threshold() == 10.0);
    REQUIRE_FALSE(configured.detect({3.0, 0.5}).isAnomaly);

    AnomalyDetector strict(2.5);
    strict.train(gridBaseline());
    REQUIRE(strict.detect({3.0, 0.5}).isAnomaly);

    AnomalyDetector explicitArgs(2.5, 42);
    explicitArgs.train(gridBaseline());
    REQUIRE(configured.isolationScore({5.0, 5.0}) == explicitArgs.isolationScore({5.0, 5.0}, 7, 3));

    // Neighbourhoods larger than the baseline clamp to n - 1.
    REQUIRE(configured.lof({5.0, 5.0}) == Approx(explicitArgs.lof({5.0, 5.0}, 99)));
}
