#pragma once

#include "OutlierDetection.h"

#include <cstddef>
#include <vector>

struct TimePoint {
    double timestamp = 0.0;
    double value = 0.0;
};

struct SeasonalDecomposition {
    std::vector<double> trend;
    std::vector<double> seasonal;
    std::vector<double> residual;
};

struct ForecastOptions {
    size_t seasonality = 7;
    double emaAlpha = 0.3;
    double holtAlpha = 0.3;
    double holtBeta = 0.1;
    double holtGamma = 0.1;
    double anomalyThreshold = 2.0;
};

// Accumulating single-metric series with smoothing and seasonal forecasting.
class TimeSeriesForecast {
public:
    /**
     * @throws Circadia::ConfigurationException when seasonality is zero.
     */
    explicit TimeSeriesForecast(size_t seasonality = 7);
    explicit TimeSeriesForecast(ForecastOptions options);

    // Merges points into the series, kept ordered by timestamp (stable for ties).
    void addData(const std::vector<TimePoint>& points);

    // Trailing mean of each full window; n - window + 1 values.
    std::vector<double> movingAverage(size_t window) const;
    std::vector<double> exponentialMovingAverage() const;
    std::vector<double> exponentialMovingAverage(double alpha) const;

    // Extrapolates the least-squares line over the index for the next steps.
    std::vector<double> linearForecast(size_t steps) const;

    /**
     * @brief Additive decomposition with a centred moving-average trend.
     * @post Edges without a full window carry the raw value as trend.
     * @throws Circadia::InsufficientDataException with fewer points than one season.
     */
    SeasonalDecomposition decomposeSeasonality() const;

    /**
     * @brief Additive Holt-Winters seeded from the decomposition's first season.
     * @throws Circadia::InsufficientDataException with fewer points than one season.
     */
    std::vector<double> holtWintersForecast(size_t steps) const;
    std::vector<double> holtWintersForecast(size_t steps, double alpha, double beta, double gamma) const;

    // Points whose population z-score exceeds threshold.
    std::vector<AnomalyScore> detectAnomalies() const;
    std::vector<AnomalyScore> detectAnomalies(double threshold) const;

    const std::vector<TimePoint>& data() const noexcept { return m_data; }
    size_t seasonality() const noexcept { return m_seasonality; }
    const ForecastOptions& options() const noexcept { return m_options; }

private:
    std::vector<double> values() const;
    void requireData(size_t minimum, const char* operation) const;

    std::vector<TimePoint> m_data;
    ForecastOptions m_options;
    size_t m_seasonality;
};
