#pragma once

#include "ChronotypeAnalyzer.h"
#include "Clustering.h"
#include "MultivariateStats.h"
#include "NeuralNet.h"
#include "OutlierDetection.h"
#include "PatternRecognition.h"
#include "Regression.h"
#include "SleepDebtCalculator.h"
#include "TimeSeriesForecast.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

struct NumericTuningConfig {
    // Near-zero cutoff shared by pivots, deviations and cosine denominators.
    double numericEpsilon = 1e-12;
    size_t betaFallbackIntervalsStart = 4096;
    size_t betaFallbackIntervalsMax = 65536;
    double betaFallbackTolerance = 1e-8;
    // "report" raises on singular matrices, "legacy_epsilon" substitutes a 1e-10 pivot.
    std::string singularPolicy = "report";
    size_t eigenMaxIterations = 100;
    double eigenTolerance = 1e-10;
};

struct DetectionTuningConfig {
    double patternThreshold = 0.8;
    double anomalyZThreshold = 2.5;
    size_t isolationTrees = 100;
    size_t isolationMaxDepth = 10;
    size_t isolationSampleSize = 0;
    double isolationContamination = 0.1;
    size_t lofNeighbors = 5;
    double lofThreshold = 1.5;
    double outlierZThreshold = 3.0;
    double outlierModifiedZThreshold = 3.5;
    double outlierIqrMultiplier = 1.5;
    size_t movingAverageWindow = 10;
    double movingAverageThreshold = 3.0;
    double dbscanEpsilon = 0.5;
    size_t dbscanMinPoints = 3;
    double trendStableSlope = 0.01;
    double changePointThreshold = 0.2;
    size_t changePointWindow = 5;
};

struct LearningTuningConfig {
    size_t kmeansMaxIterations = 100;
    double kmeansTolerance = 1e-3;
    size_t polynomialDegree = 2;
    double logisticLearningRate = 0.01;
    size_t logisticIterations = 1000;
    double neuralLearningRate = 0.1;
    std::string neuralActivation = "sigmoid";
    size_t neuralEpochs = 1000;
    size_t neuralLogEvery = 100;
    size_t factorMaxIterations = 100;
    double factorTolerance = 1e-6;
    double manovaAlpha = 0.05;
};

struct SleepModelConfig {
    size_t minimumDays = 7;
    double dailyDecay = 0.05;
    double recoveryRate = 0.25;
    double maxUsefulExtraHours = 2.0;
    size_t historyWindow = 30;
    size_t chronotypeMinimumNights = 14;
    size_t readinessWindow = 14;
};

struct ForecastTuningConfig {
    size_t seasonality = 7;
    double emaAlpha = 0.3;
    double holtAlpha = 0.3;
    double holtBeta = 0.1;
    double holtGamma = 0.1;
    double anomalyThreshold = 2.0;
};

// Every tunable of the engine; the defaults reproduce the documented component defaults.
struct EngineConfig {
    EngineConfig() {}
    uint32_t seed = 1337;
    bool verbose = false;

    NumericTuningConfig numeric;
    DetectionTuningConfig detection;
    LearningTuningConfig learning;
    SleepModelConfig sleep;
    ForecastTuningConfig forecast;

    /**
     * @brief Parses loose YAML/JSON-ish "key: value" lines on top of base.
     * @post Keys are case-insensitive and accept '-' for '_'; '#' starts a comment line.
     * @throws Circadia::ConfigurationException naming the line of an unknown key or bad value.
     */
    static EngineConfig fromStream(std::istream& in, const EngineConfig& base = EngineConfig());

    /**
     * @throws Circadia::ConfigurationException on out-of-range values or unknown enum names.
     */
    void validate() const;

    // Pushes numeric tuning and the singular policy into the calling thread's matrix kernel.
    void apply() const;

    MathUtils::SingularPolicy singularPolicy() const;
    NeuralActivation neuralActivation() const;

    MathUtils::EigenOptions eigenOptions() const;
    KMeans::Options kMeansOptions() const;
    MultivariateOptions multivariateOptions() const;
    OutlierOptions outlierOptions() const;
    AnomalyDetectorOptions anomalyDetectorOptions() const;
    ForecastOptions forecastOptions() const;
    NetworkConfig neuralConfig(size_t inputSize, const std::vector<size_t>& hiddenLayers, size_t outputSize) const;
    SleepDebtOptions sleepDebtOptions() const;
    ChronotypeOptions chronotypeOptions() const;

    KMeans makeKMeans(size_t k) const;
    DBSCAN makeDbscan() const;
    PolynomialRegression makePolynomialRegression() const;
    LogisticRegression makeLogisticRegression() const;
    PatternRecognizer makePatternRecognizer() const;
    AnomalyDetector makeAnomalyDetector() const;
    TrendAnalyzer makeTrendAnalyzer() const;
    OutlierDetection makeOutlierDetection() const;
    MultivariateStats makeMultivariateStats() const;
    TimeSeriesForecast makeTimeSeriesForecast() const;
};
