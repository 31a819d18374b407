#include <catch2/catch.hpp>

#include "CircadiaExceptions.h"
#include "TimeSeriesForecast.h"

#include <cmath>
#include <vector>

namespace {
std::vector<TimePoint> series(const std::vector<double>& values) {
    std::vector<TimePoint> points;
    for (size_t i = 0; i < values.size(); ++i) points.push_back({static_cast<double>(i), values[i]});
    return points;
}
} // namespace

TEST_CASE("Series stays ordered by timestamp", "[forecast]") {
    TimeSeriesForecast forecast;
    forecast.addData({{3.0, 30.0}, {1.0, 10.0}});
    forecast.addData({{2.0, 20.0}, {1.0, 11.0}});

    const std::vector<TimePoint>& data = forecast.data();
    REQUIRE(data.size() == 4);
    REQUIRE(data[0].value == 10.0);
    REQUIRE(data[1].value == 11.0);
    REQUIRE(data[2].value == 20.0);
    REQUIRE(data[3].value == 30.0);

    REQUIRE(forecast.seasonality() == 7);
    REQUIRE_THROWS_AS(TimeSeriesForecast(0), Circadia::ConfigurationException);
}

TEST_CASE("Smoothing", "[forecast][smoothing]") {
    TimeSeriesForecast forecast;
    forecast.addData(series({1, 2, 3, 4, 5}));

    REQUIRE(forecast.movingAverage(2) == std::vector<double>{1.5, 2.5, 3.5, 4.5});
    REQUIRE(forecast.movingAverage(6).empty());
    REQUIRE_THROWS_AS(forecast.movingAverage(0), Circadia::ConfigurationException);

    TimeSeriesForecast ema;
    ema.addData(series({2, 4, 6}));
    const std::vector<double> smoothed = ema.exponentialMovingAverage(0.5);
    REQUIRE(smoothed.size() == 3);
    REQUIRE(smoothed[1] == Approx(3.0));
    REQUIRE(smoothed[2] == Approx(4.5));
    REQUIRE_THROWS_AS(ema.exponentialMovingAverage(0.0), Circadia::ConfigurationException);

    const TimeSeriesForecast empty;
    REQUIRE_THROWS_AS(empty.exponentialMovingAverage(), Circadia::InsufficientDataException);
}

TEST_CASE("Linear extrapolation", "[forecast][linear]") {
    TimeSeriesForecast forecast;
    forecast.addData(series({0, 2, 4, 6}));
    const std::vector<double> ahead = forecast.linearForecast(2);
    REQUIRE(ahead.size() == 2);
    REQUIRE(ahead[0] == Approx(8.0));
    REQUIRE(ahead[1] == Approx(10.0));
}

TEST_CASE("Seasonal decomposition and Holt-Winters", "[forecast][seasonal]") {
    const std::vector<double> pattern = {3, -1, -1, -1, -1, -1, 2};
    std::vector<double> values;
    for (int i = 0; i < 28; ++i) values.push_back(10.0 + pattern[static_cast<size_t>(i % 7)]);

    TimeSeriesForecast forecast(7);
    forecast.addData(series(values));
    const SeasonalDecomposition parts = forecast.decomposeSeasonality();

    REQUIRE(parts.trend.size() == values.size());
    REQUIRE(parts.trend[0] == values[0]);
    REQUIRE(parts.trend[27] == values[27]);
    REQUIRE(parts.trend[10] == Approx(10.0));
    for (size_t i = 0; i < values.size(); ++i) {
        REQUIRE(parts.trend[i] + parts.seasonal[i] + parts.residual[i] == Approx(values[i]));
        REQUIRE(parts.seasonal[i] == Approx(parts.seasonal[i % 7]));
    }

    const std::vector<double> ahead = forecast.holtWintersForecast(7);
    REQUIRE(ahead.size() == 7);
    for (double v : ahead) REQUIRE(std::isfinite(v));

    TimeSeriesForecast flat(7);
    flat.addData(series(std::vector<double>(14, 5.0)));
    for (double v : flat.holtWintersForecast(3)) REQUIRE(v == Approx(5.0));

    TimeSeriesForecast shortSeries(7);
    shortSeries.addData(series({1, 2, 3}));
    REQUIRE_THROWS_AS(shortSeries.decomposeSeasonality(), Circadia::InsufficientDataException);
    REQUIRE_THROWS_AS(shortSeries.holtWintersForecast(3), Circadia::InsufficientDataException);
}

TEST_CASE("Series anomalies", "[forecast][anomalies]") {
    std::vector<double> values(20, 1.0);
    values.push_back(10.0);
    TimeSeriesForecast forecast;
    forecast.addData(series(values));

    const std::vector<AnomalyScore> anomalies = forecast.detectAnomalies();
    REQUIRE(anomalies.size() == 1);
    REQUIRE(anomalies[0].index == 20);
    REQUIRE(anomalies[0].value == 10.0);
    REQUIRE(anomalies[0].isAnomaly);
    REQUIRE(anomalies[0].score > 4.0);

    TimeSeriesForecast flat;
    flat.addData(series(std::vector<double>(10, 3.0)));
    REQUIRE(flat.detectAnomalies().empty());
}

TEST_CASE("Forecast options supply the default smoothing parameters", "[forecast][options]") {
    ForecastOptions options;
    options.seasonality = 3;
    options.emaAlpha = 0.5;
    options.holtAlpha = 0.6;
    options.holtBeta = 0.2;
    options.holtGamma = 0.3;
    options.anomalyThreshold = 5.0;

    TimeSeriesForecast configured(options);
    REQUIRE(configured.seasonality() == 3);
    configured.addData(series({2, 4, 6}));
    const std::vector<double> smoothed = configured.exponentialMovingAverage();
    REQUIRE(smoothed[1] == Approx(3.0));
    REQUIRE(smoothed[2] == Approx(4.5));

    TimeSeriesForecast seasonal(options);
    seasonal.addData(series({1, 5, 3, 2, 6, 4, 3, 7, 5}));
    REQUIRE(seasonal.holtWintersForecast(4) == seasonal.holtWintersForecast(4, 0.6, 0.2, 0.3));
    REQUIRE(seasonal.holtWintersForecast(4) != seasonal.holtWintersForecast(4, 0.3, 0.1, 0.1));

    // The spike scores about 4.47, between the default threshold and the configured one.
    std::vector<double> values(20, 1.0);
    values.push_back(10.0);
    TimeSeriesForecast spiky(options);
    spiky.addData(series(values));
    REQUIRE(spiky.detectAnomalies().empty());
    REQUIRE(spiky.detectAnomalies(2.0).size() == 1);

    options.seasonality = 0;
    REQUIRE_THROWS_AS(TimeSeriesForecast(options), Circadia::ConfigurationException);
}
