#include "EngineConfig.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Circadia::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Circadia::CircadiaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Circadia::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value.front() == '-') {
        throw Circadia::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw Circadia::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Circadia::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Circadia::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!(parsed >= minValue)) {
        throw Circadia::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Circadia::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

template <typename Section>
struct SizeRule {
    size_t Section::*member;
    size_t minValue;
};

template <typename Section>
struct DoubleRule {
    double Section::*member;
    double minValue;
};

template <typename Section>
bool assignSectionField(Section& section,
                        const std::unordered_map<std::string, SizeRule<Section>>& sizeFields,
                        const std::unordered_map<std::string, DoubleRule<Section>>& doubleFields,
                        const std::string& key,
                        const std::string& value) {
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        section.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return true;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        section.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return true;
    }
    return false;
}

void assignKeyValue(EngineConfig& config, const std::string& key, const std::string& value) {
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }
    if (key == "verbose") {
        config.verbose = parseBoolStrict(value, key);
        return;
    }
    if (key == "singular_policy") {
        config.numeric.singularPolicy = CommonUtils::toLower(value);
        return;
    }
    if (key == "neural_activation") {
        config.learning.neuralActivation = CommonUtils::toLower(value);
        return;
    }

    static const std::unordered_map<std::string, SizeRule<NumericTuningConfig>> numericSizeFields = {
        {"beta_fallback_intervals_start", {&NumericTuningConfig::betaFallbackIntervalsStart, 256}},
        {"beta_fallback_intervals_max", {&NumericTuningConfig::betaFallbackIntervalsMax, 256}},
        {"eigen_max_iterations", {&NumericTuningConfig::eigenMaxIterations, 1}},
    };
    static const std::unordered_map<std::string, DoubleRule<NumericTuningConfig>> numericDoubleFields = {
        {"numeric_epsilon", {&NumericTuningConfig::numericEpsilon, 0.0}},
        {"beta_fallback_tolerance", {&NumericTuningConfig::betaFallbackTolerance, 0.0}},
        {"eigen_tolerance", {&NumericTuningConfig::eigenTolerance, 0.0}},
    };
    static const std::unordered_map<std::string, SizeRule<DetectionTuningConfig>> detectionSizeFields = {
        {"isolation_trees", {&DetectionTuningConfig::isolationTrees, 1}},
        {"isolation_max_depth", {&DetectionTuningConfig::isolationMaxDepth, 1}},
        {"isolation_sample_size", {&DetectionTuningConfig::isolationSampleSize, 0}},
        {"lof_neighbors", {&DetectionTuningConfig::lofNeighbors, 1}},
        {"moving_average_window", {&DetectionTuningConfig::movingAverageWindow, 1}},
        {"dbscan_min_points", {&DetectionTuningConfig::dbscanMinPoints, 1}},
        {"change_point_window", {&DetectionTuningConfig::changePointWindow, 1}},
    };
    static const std::unordered_map<std::string, DoubleRule<DetectionTuningConfig>> detectionDoubleFields = {
        {"pattern_threshold", {&DetectionTuningConfig::patternThreshold, -1.0}},
        {"anomaly_z_threshold", {&DetectionTuningConfig::anomalyZThreshold, 0.0}},
        {"isolation_contamination", {&DetectionTuningConfig::isolationContamination, 0.0}},
        {"lof_threshold", {&DetectionTuningConfig::lofThreshold, 0.0}},
        {"outlier_z_threshold", {&DetectionTuningConfig::outlierZThreshold, 0.0}},
        {"outlier_modified_z_threshold", {&DetectionTuningConfig::outlierModifiedZThreshold, 0.0}},
        {"outlier_iqr_multiplier", {&DetectionTuningConfig::outlierIqrMultiplier, 0.0}},
        {"moving_average_threshold", {&DetectionTuningConfig::movingAverageThreshold, 0.0}},
        {"dbscan_epsilon", {&DetectionTuningConfig::dbscanEpsilon, 0.0}},
        {"trend_stable_slope", {&DetectionTuningConfig::trendStableSlope, 0.0}},
        {"change_point_threshold", {&DetectionTuningConfig::changePointThreshold, 0.0}},
    };
    static const std::unordered_map<std::string, SizeRule<LearningTuningConfig>> learningSizeFields = {
        {"kmeans_max_iterations", {&LearningTuningConfig::kmeansMaxIterations, 1}},
        {"polynomial_degree", {&LearningTuningConfig::polynomialDegree, 1}},
        {"logistic_iterations", {&LearningTuningConfig::logisticIterations, 1}},
        {"neural_epochs", {&LearningTuningConfig::neuralEpochs, 1}},
        {"neural_log_every", {&LearningTuningConfig::neuralLogEvery, 1}},
        {"factor_max_iterations", {&LearningTuningConfig::factorMaxIterations, 1}},
    };
    static const std::unordered_map<std::string, DoubleRule<LearningTuningConfig>> learningDoubleFields = {
        {"kmeans_tolerance", {&LearningTuningConfig::kmeansTolerance, 0.0}},
        {"logistic_learning_rate", {&LearningTuningConfig::logisticLearningRate, 0.0}},
        {"neural_learning_rate", {&LearningTuningConfig::neuralLearningRate, 0.0}},
        {"factor_tolerance", {&LearningTuningConfig::factorTolerance, 0.0}},
        {"manova_alpha", {&LearningTuningConfig::manovaAlpha, 0.0}},
    };
    static const std::unordered_map<std::string, SizeRule<SleepModelConfig>> sleepSizeFields = {
        {"sleep_minimum_days", {&SleepModelConfig::minimumDays, 1}},
        {"sleep_history_window", {&SleepModelConfig::historyWindow, 0}},
        {"chronotype_minimum_nights", {&SleepModelConfig::chronotypeMinimumNights, 1}},
        {"readiness_window", {&SleepModelConfig::readinessWindow, 1}},
    };
    static const std::unordered_map<std::string, DoubleRule<SleepModelConfig>> sleepDoubleFields = {
        {"sleep_daily_decay", {&SleepModelConfig::dailyDecay, 0.0}},
        {"sleep_recovery_rate", {&SleepModelConfig::recoveryRate, 0.0}},
        {"sleep_max_extra_hours", {&SleepModelConfig::maxUsefulExtraHours, 0.0}},
    };
    static const std::unordered_map<std::string, SizeRule<ForecastTuningConfig>> forecastSizeFields = {
        {"seasonality", {&ForecastTuningConfig::seasonality, 1}},
    };
    static const std::unordered_map<std::string, DoubleRule<ForecastTuningConfig>> forecastDoubleFields = {
        {"ema_alpha", {&ForecastTuningConfig::emaAlpha, 0.0}},
        {"holt_alpha", {&ForecastTuningConfig::holtAlpha, 0.0}},
        {"holt_beta", {&ForecastTuningConfig::holtBeta, 0.0}},
        {"holt_gamma", {&ForecastTuningConfig::holtGamma, 0.0}},
        {"forecast_anomaly_threshold", {&ForecastTuningConfig::anomalyThreshold, 0.0}},
    };

    if (assignSectionField(config.numeric, numericSizeFields, numericDoubleFields, key, value)) return;
    if (assignSectionField(config.detection, detectionSizeFields, detectionDoubleFields, key, value)) return;
    if (assignSectionField(config.learning, learningSizeFields, learningDoubleFields, key, value)) return;
    if (assignSectionField(config.sleep, sleepSizeFields, sleepDoubleFields, key, value)) return;
    if (assignSectionField(config.forecast, forecastSizeFields, forecastDoubleFields, key, value)) return;

    throw Circadia::ConfigurationException("Unknown config key: " + key);
}
} // namespace

EngineConfig EngineConfig::fromStream(std::istream& in, const EngineConfig& base) {
    EngineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Accept loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Circadia::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> missing ':' separator");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Circadia::CircadiaException& ex) {
            throw Circadia::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    if (in.bad()) throw Circadia::IOException("failed while reading configuration stream");
    return config;
}

void EngineConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(numeric.singularPolicy, {"report", "legacy_epsilon"})) {
        throw Circadia::ConfigurationException("singular_policy must be one of: report, legacy_epsilon");
    }
    if (!isIn(learning.neuralActivation, {"sigmoid", "relu", "tanh"})) {
        throw Circadia::ConfigurationException("neural_activation must be one of: sigmoid, relu, tanh");
    }
    if (numeric.numericEpsilon <= 0.0 || numeric.eigenTolerance <= 0.0 || numeric.betaFallbackTolerance <= 0.0) {
        throw Circadia::ConfigurationException("numeric_epsilon, eigen_tolerance and beta_fallback_tolerance must be > 0");
    }
    if (numeric.betaFallbackIntervalsMax < numeric.betaFallbackIntervalsStart) {
        throw Circadia::ConfigurationException("beta_fallback_intervals_max must be >= beta_fallback_intervals_start");
    }
    if (detection.patternThreshold < -1.0 || detection.patternThreshold > 1.0) {
        throw Circadia::ConfigurationException("pattern_threshold must be within [-1,1]");
    }
    if (detection.isolationContamination >= 1.0) {
        throw Circadia::ConfigurationException("isolation_contamination must be within [0,1)");
    }
    if (learning.manovaAlpha <= 0.0 || learning.manovaAlpha >= 1.0) {
        throw Circadia::ConfigurationException("manova_alpha must be within (0,1)");
    }
    if (learning.neuralLearningRate <= 0.0 || learning.logisticLearningRate <= 0.0) {
        throw Circadia::ConfigurationException("learning rates must be > 0");
    }
    if (sleep.dailyDecay >= 1.0) {
        throw Circadia::ConfigurationException("sleep_daily_decay must be within [0,1)");
    }
    if (sleep.recoveryRate > 1.0) {
        throw Circadia::ConfigurationException("sleep_recovery_rate must be within [0,1]");
    }
    const auto isUnitRate = [](double v) { return v > 0.0 && v <= 1.0; };
    if (!isUnitRate(forecast.emaAlpha) || !isUnitRate(forecast.holtAlpha) ||
        !isUnitRate(forecast.holtBeta) || !isUnitRate(forecast.holtGamma)) {
        throw Circadia::ConfigurationException("ema_alpha and holt_alpha/beta/gamma must be within (0,1]");
    }
}

void EngineConfig::apply() const {
    MathUtils::setNumericTuning(numeric.numericEpsilon,
                                numeric.betaFallbackIntervalsStart,
                                numeric.betaFallbackIntervalsMax,
                                numeric.betaFallbackTolerance);
    MathUtils::setSingularPolicy(singularPolicy());
}

MathUtils::SingularPolicy EngineConfig::singularPolicy() const {
    if (numeric.singularPolicy == "report") return MathUtils::SingularPolicy::REPORT;
    if (numeric.singularPolicy == "legacy_epsilon") return MathUtils::SingularPolicy::LEGACY_EPSILON;
    throw Circadia::ConfigurationException("singular_policy must be one of: report, legacy_epsilon");
}

NeuralActivation EngineConfig::neuralActivation() const {
    if (learning.neuralActivation == "sigmoid") return NeuralActivation::SIGMOID;
    if (learning.neuralActivation == "relu") return NeuralActivation::RELU;
    if (learning.neuralActivation == "tanh") return NeuralActivation::TANH;
    throw Circadia::ConfigurationException("neural_activation must be one of: sigmoid, relu, tanh");
}

MathUtils::EigenOptions EngineConfig::eigenOptions() const {
    MathUtils::EigenOptions options;
    options.maxIterations = numeric.eigenMaxIterations;
    options.tolerance = numeric.eigenTolerance;
    options.seed = seed;
    return options;
}

KMeans::Options EngineConfig::kMeansOptions() const {
    KMeans::Options options;
    options.maxIterations = learning.kmeansMaxIterations;
    options.tolerance = learning.kmeansTolerance;
    options.seed = seed;
    options.verbose = verbose;
    return options;
}

MultivariateOptions EngineConfig::multivariateOptions() const {
    MultivariateOptions options;
    options.eigen = eigenOptions();
    options.factorMaxIterations = learning.factorMaxIterations;
    options.factorTolerance = learning.factorTolerance;
    options.manovaAlpha = learning.manovaAlpha;
    options.verbose = verbose;
    return options;
}

OutlierOptions EngineConfig::outlierOptions() const {
    OutlierOptions options;
    options.zThreshold = detection.outlierZThreshold;
    options.modifiedZThreshold = detection.outlierModifiedZThreshold;
    options.iqrMultiplier = detection.outlierIqrMultiplier;
    options.isolationTrees = detection.isolationTrees;
    options.isolationSampleSize = detection.isolationSampleSize;
    options.isolationContamination = detection.isolationContamination;
    options.isolationMaxDepth = detection.isolationMaxDepth;
    options.lofNeighbors = detection.lofNeighbors;
    options.lofThreshold = detection.lofThreshold;
    options.movingAverageWindow = detection.movingAverageWindow;
    options.movingAverageThreshold = detection.movingAverageThreshold;
    options.seed = seed;
    return options;
}

AnomalyDetectorOptions EngineConfig::anomalyDetectorOptions() const {
    AnomalyDetectorOptions options;
    options.threshold = detection.anomalyZThreshold;
    options.isolationTrees = detection.isolationTrees;
    options.isolationMaxDepth = detection.isolationMaxDepth;
    options.lofNeighbors = detection.lofNeighbors;
    options.seed = seed;
    return options;
}

ForecastOptions EngineConfig::forecastOptions() const {
    ForecastOptions options;
    options.seasonality = forecast.seasonality;
    options.emaAlpha = forecast.emaAlpha;
    options.holtAlpha = forecast.holtAlpha;
    options.holtBeta = forecast.holtBeta;
    options.holtGamma = forecast.holtGamma;
    options.anomalyThreshold = forecast.anomalyThreshold;
    return options;
}

NetworkConfig EngineConfig::neuralConfig(size_t inputSize, const std::vector<size_t>& hiddenLayers, size_t outputSize) const {
    NetworkConfig config;
    config.inputSize = inputSize;
    config.hiddenLayers = hiddenLayers;
    config.outputSize = outputSize;
    config.learningRate = learning.neuralLearningRate;
    config.activation = neuralActivation();
    config.seed = seed;
    config.verbose = verbose;
    config.logEvery = learning.neuralLogEvery;
    config.epochs = learning.neuralEpochs;
    return config;
}

SleepDebtOptions EngineConfig::sleepDebtOptions() const {
    SleepDebtOptions options;
    options.minimumDays = sleep.minimumDays;
    options.dailyDecay = sleep.dailyDecay;
    options.recoveryRate = sleep.recoveryRate;
    options.maxUsefulExtraHours = sleep.maxUsefulExtraHours;
    options.historyWindow = sleep.historyWindow;
    return options;
}

ChronotypeOptions EngineConfig::chronotypeOptions() const {
    ChronotypeOptions options;
    options.minimumNights = sleep.chronotypeMinimumNights;
    options.readinessWindow = sleep.readinessWindow;
    return options;
}

KMeans EngineConfig::makeKMeans(size_t k) const {
    return KMeans(k, kMeansOptions());
}

DBSCAN EngineConfig::makeDbscan() const {
    return DBSCAN(detection.dbscanEpsilon, detection.dbscanMinPoints);
}

PolynomialRegression EngineConfig::makePolynomialRegression() const {
    return PolynomialRegression(learning.polynomialDegree);
}

LogisticRegression EngineConfig::makeLogisticRegression() const {
    return LogisticRegression(learning.logisticLearningRate, learning.logisticIterations);
}

PatternRecognizer EngineConfig::makePatternRecognizer() const {
    return PatternRecognizer(detection.patternThreshold);
}

AnomalyDetector EngineConfig::makeAnomalyDetector() const {
    return AnomalyDetector(anomalyDetectorOptions());
}

TrendAnalyzer EngineConfig::makeTrendAnalyzer() const {
    return TrendAnalyzer(detection.trendStableSlope, detection.changePointThreshold, detection.changePointWindow);
}

OutlierDetection EngineConfig::makeOutlierDetection() const {
    return OutlierDetection(outlierOptions());
}

MultivariateStats EngineConfig::makeMultivariateStats() const {
    return MultivariateStats(multivariateOptions());
}

TimeSeriesForecast EngineConfig::makeTimeSeriesForecast() const {
    return TimeSeriesForecast(forecastOptions());
}
