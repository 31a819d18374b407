#include <catch2/catch.hpp>

#include "CircadiaExceptions.h"
#include "EngineConfig.h"

#include <sstream>
#include <string>
#include <vector>

namespace {
EngineConfig parse(const std::string& text) {
    std::istringstream in(text);
    return EngineConfig::fromStream(in);
}

// Restores the calling thread's kernel settings after apply().
struct KernelSettingsGuard {
    ~KernelSettingsGuard() { EngineConfig().apply(); }
};
} // namespace

TEST_CASE("Defaults mirror the component defaults", "[config]") {
    const EngineConfig config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.seed == 1337);
    REQUIRE(config.singularPolicy() == MathUtils::SingularPolicy::REPORT);
    REQUIRE(config.neuralActivation() == NeuralActivation::SIGMOID);

    const SleepDebtOptions sleep = config.sleepDebtOptions();
    REQUIRE(sleep.minimumDays == 7);
    REQUIRE(sleep.historyWindow == 30);
    REQUIRE(config.chronotypeOptions().minimumNights == 14);
    REQUIRE(config.kMeansOptions().maxIterations == 100);
}

TEST_CASE("Loose YAML and JSON lines", "[config][parse]") {
    const EngineConfig config = parse(
        "# tuning for the nightly job\n"
        "seed: 42\n"
        "Verbose: yes\n"
        "\n"
        "{ \"isolation-trees\": \"250\",\n"
        "  \"dbscan_epsilon\": 0.25,\n"
        "  \"neural_activation\": \"TANH\" }\n"
        "singular_policy: legacy_epsilon\n"
        "sleep_history_window: 14\n"
        "seasonality: 24\n");

    REQUIRE(config.seed == 42);
    REQUIRE(config.verbose);
    REQUIRE(config.detection.isolationTrees == 250);
    REQUIRE(config.detection.dbscanEpsilon == Approx(0.25));
    REQUIRE(config.learning.neuralActivation == "tanh");
    REQUIRE(config.neuralActivation() == NeuralActivation::TANH);
    REQUIRE(config.singularPolicy() == MathUtils::SingularPolicy::LEGACY_EPSILON);
    REQUIRE(config.sleep.historyWindow == 14);
    REQUIRE(config.forecast.seasonality == 24);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Parsing starts from the supplied base", "[config][parse]") {
    EngineConfig base;
    base.seed = 7;
    base.learning.polynomialDegree = 3;
    std::istringstream in("polynomial_degree: 4\n");
    const EngineConfig config = EngineConfig::fromStream(in, base);
    REQUIRE(config.seed == 7);
    REQUIRE(config.learning.polynomialDegree == 4);
}

TEST_CASE("Parse errors name the offending line", "[config][parse]") {
    using Catch::Matchers::Contains;

    REQUIRE_THROWS_WITH(parse("seed: 1\nbedtime_hour: 22\n"),
                        Contains("line 2") && Contains("Unknown config key: bedtime_hour"));
    REQUIRE_THROWS_WITH(parse("isolation_trees: many\n"), Contains("Invalid unsigned integer"));
    REQUIRE_THROWS_WITH(parse("isolation_trees: 0\n"), Contains("must be >= 1"));
    REQUIRE_THROWS_WITH(parse("lof_threshold: -2\n"), Contains("must be >= 0"));
    REQUIRE_THROWS_WITH(parse("verbose: maybe\n"), Contains("Invalid boolean"));
    REQUIRE_THROWS_WITH(parse("seed 12\n"), Contains("missing ':' separator"));
    REQUIRE_THROWS_AS(parse("seed: -3\n"), Circadia::ConfigurationException);
}

TEST_CASE("Validation rejects out-of-range settings", "[config][validate]") {
    EngineConfig config;

    SECTION("unknown singular policy") {
        config.numeric.singularPolicy = "ignore";
        REQUIRE_THROWS_AS(config.validate(), Circadia::ConfigurationException);
        REQUIRE_THROWS_AS(config.singularPolicy(), Circadia::ConfigurationException);
    }

    SECTION("unknown activation") {
        config.learning.neuralActivation = "softmax";
        REQUIRE_THROWS_AS(config.validate(), Circadia::ConfigurationException);
    }

    SECTION("decay of a full day") {
        config.sleep.dailyDecay = 1.0;
        REQUIRE_THROWS_AS(config.validate(), Circadia::ConfigurationException);
    }

    SECTION("smoothing factor above one") {
        config.forecast.holtGamma = 1.5;
        REQUIRE_THROWS_AS(config.validate(), Circadia::ConfigurationException);
    }

    SECTION("contamination of everything") {
        config.detection.isolationContamination = 1.0;
        REQUIRE_THROWS_AS(config.validate(), Circadia::ConfigurationException);
    }
}

TEST_CASE("apply() pushes kernel settings", "[config][apply]") {
    KernelSettingsGuard guard;
    EngineConfig config;
    config.numeric.numericEpsilon = 1e-9;
    config.numeric.singularPolicy = "legacy_epsilon";
    config.apply();

    REQUIRE(MathUtils::getNumericEpsilon() == Approx(1e-9));
    REQUIRE(MathUtils::getSingularPolicy() == MathUtils::SingularPolicy::LEGACY_EPSILON);
}

TEST_CASE("Factories carry the configured values", "[config][factories]") {
    EngineConfig config;
    config.seed = 99;
    config.detection.dbscanEpsilon = 0.75;
    config.detection.dbscanMinPoints = 4;
    config.detection.patternThreshold = 0.6;
    config.detection.anomalyZThreshold = 3.0;
    config.learning.polynomialDegree = 3;
    config.learning.neuralLearningRate = 0.05;
    config.learning.neuralActivation = "relu";
    config.forecast.seasonality = 24;
    config.sleep.dailyDecay = 0.1;

    const DBSCAN dbscan = config.makeDbscan();
    REQUIRE(dbscan.epsilon() == 0.75);
    REQUIRE(dbscan.minPoints() == 4);

    REQUIRE(config.makePatternRecognizer().threshold() == 0.6);
    REQUIRE(config.makeAnomalyDetector().threshold() == 3.0);
    REQUIRE(config.makePolynomialRegression().degree() == 3);
    REQUIRE(config.makeTimeSeriesForecast().seasonality() == 24);
    REQUIRE(config.makeKMeans(3).k() == 3);
    REQUIRE(config.kMeansOptions().seed == 99);
    REQUIRE(config.eigenOptions().seed == 99);
    REQUIRE(config.makeMultivariateStats().options().eigen.seed == 99);
    REQUIRE(config.sleepDebtOptions().dailyDecay == 0.1);

    const NetworkConfig net = config.neuralConfig(3, {5}, 1);
    REQUIRE(net.inputSize == 3);
    REQUIRE(net.hiddenLayers == std::vector<size_t>{5});
    REQUIRE(net.learningRate == 0.05);
    REQUIRE(net.activation == NeuralActivation::RELU);
    REQUIRE(net.seed == 99);
    REQUIRE(NeuralNet(net).topology() == std::vector<size_t>{3, 5, 1});
}

TEST_CASE("Detection and forecast tunables reach the components", "[config][factories]") {
    const EngineConfig config = parse(
        "outlier_z_threshold: 10\n"
        "outlier_modified_z_threshold: 4.5\n"
        "outlier_iqr_multiplier: 3\n"
        "isolation_trees: 40\n"
        "isolation_max_depth: 6\n"
        "isolation_sample_size: 32\n"
        "isolation_contamination: 0.05\n"
        "lof_neighbors: 8\n"
        "lof_threshold: 2.5\n"
        "moving_average_window: 20\n"
        "moving_average_threshold: 4\n"
        "change_point_window: 2\n"
        "neural_epochs: 12\n"
        "manova_alpha: 0.01\n"
        "ema_alpha: 0.5\n"
        "holt_alpha: 0.6\n"
        "holt_beta: 0.2\n"
        "holt_gamma: 0.3\n"
        "forecast_anomaly_threshold: 5\n");
    REQUIRE_NOTHROW(config.validate());

    const OutlierOptions outliers = config.makeOutlierDetection().options();
    REQUIRE(outliers.zThreshold == 10.0);
    REQUIRE(outliers.modifiedZThreshold == 4.5);
    REQUIRE(outliers.iqrMultiplier == 3.0);
    REQUIRE(outliers.isolationTrees == 40);
    REQUIRE(outliers.isolationMaxDepth == 6);
    REQUIRE(outliers.isolationSampleSize == 32);
    REQUIRE(outliers.isolationContamination == 0.05);
    REQUIRE(outliers.lofNeighbors == 8);
    REQUIRE(outliers.lofThreshold == 2.5);
    REQUIRE(outliers.movingAverageWindow == 20);
    REQUIRE(outliers.movingAverageThreshold == 4.0);

    const AnomalyDetectorOptions anomaly = config.makeAnomalyDetector().options();
    REQUIRE(anomaly.isolationTrees == 40);
    REQUIRE(anomaly.isolationMaxDepth == 6);
    REQUIRE(anomaly.lofNeighbors == 8);

    // A population z-score over n = 10 points never exceeds sqrt(n - 1) = 3.
    std::vector<double> spike(9, 1.0);
    spike.push_back(50.0);
    REQUIRE(config.makeOutlierDetection().zScore(spike).outliers.empty());
    REQUIRE(EngineConfig().makeOutlierDetection().zScore(spike, 2.0).outliers == std::vector<size_t>{9});

    std::vector<double> step(10, 10.0);
    step.insert(step.end(), 10, 20.0);
    REQUIRE(config.makeTrendAnalyzer().detectChangePoints(step) == std::vector<size_t>{9, 10, 11});

    NeuralNet net(config.neuralConfig(2, {3}, 1));
    REQUIRE(net.train({{0, 0}, {1, 1}}, {{0}, {1}}).size() == 12);

    REQUIRE(config.makeMultivariateStats().options().manovaAlpha == 0.01);

    const ForecastOptions forecast = config.makeTimeSeriesForecast().options();
    REQUIRE(forecast.emaAlpha == 0.5);
    REQUIRE(forecast.holtAlpha == 0.6);
    REQUIRE(forecast.holtBeta == 0.2);
    REQUIRE(forecast.holtGamma == 0.3);
    REQUIRE(forecast.anomalyThreshold == 5.0);
}
