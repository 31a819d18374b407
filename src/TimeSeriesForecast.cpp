#include "TimeSeriesForecast.h"
#include "CircadiaExceptions.h"
#include "MathUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <string>

TimeSeriesForecast::TimeSeriesForecast(size_t seasonality) : m_seasonality(seasonality) {
    if (m_seasonality == 0) throw Circadia::ConfigurationException("seasonality must be >= 1");
    m_options.seasonality = seasonality;
}

TimeSeriesForecast::TimeSeriesForecast(ForecastOptions options)
    : m_options(options), m_seasonality(options.seasonality) {
    if (m_seasonality == 0) throw Circadia::ConfigurationException("seasonality must be >= 1");
}

void TimeSeriesForecast::addData(const std::vector<TimePoint>& points) {
    m_data.insert(m_data.end(), points.begin(), points.end());
    std::stable_sort(m_data.begin(), m_data.end(), [](const TimePoint& a, const TimePoint& b) {
        return a.timestamp < b.timestamp;
    });
}

std::vector<double> TimeSeriesForecast::values() const {
    std::vector<double> out;
    out.reserve(m_data.size());
    for (const TimePoint& p : m_data) out.push_back(p.value);
    return out;
}

void TimeSeriesForecast::requireData(size_t minimum, const char* operation) const {
    if (m_data.size() < minimum) {
        throw Circadia::InsufficientDataException(std::string(operation) + " needs more observations", minimum, m_data.size());
    }
}

std::vector<double> TimeSeriesForecast::movingAverage(size_t window) const {
    if (window == 0) throw Circadia::ConfigurationException("moving-average window must be >= 1");
    std::vector<double> out;
    if (m_data.size() < window) return out;
    out.reserve(m_data.size() - window + 1);

    double sum = 0.0;
    for (size_t i = 0; i < m_data.size(); ++i) {
        sum += m_data[i].value;
        if (i >= window) sum -= m_data[i - window].value;
        if (i + 1 >= window) out.push_back(sum / static_cast<double>(window));
    }
    return out;
}

std::vector<double> TimeSeriesForecast::exponentialMovingAverage() const {
    return exponentialMovingAverage(m_options.emaAlpha);
}

std::vector<double> TimeSeriesForecast::exponentialMovingAverage(double alpha) const {
    if (!(alpha > 0.0 && alpha <= 1.0)) throw Circadia::ConfigurationException("EMA alpha must be within (0,1]");
    requireData(1, "exponential moving average");
    std::vector<double> out;
    out.reserve(m_data.size());
    out.push_back(m_data.front().value);
    for (size_t i = 1; i < m_data.size(); ++i) {
        out.push_back(alpha * m_data[i].value + (1.0 - alpha) * out.back());
    }
    return out;
}

std::vector<double> TimeSeriesForecast::linearForecast(size_t steps) const {
    requireData(1, "linear forecast");
    const LineFit fit = Statistics::fitLine(values());
    std::vector<double> out;
    out.reserve(steps);
    const double n = static_cast<double>(m_data.size());
    for (size_t i = 0; i < steps; ++i) {
        out.push_back(fit.slope * (n + static_cast<double>(i)) + fit.intercept);
    }
    return out;
}

SeasonalDecomposition TimeSeriesForecast::decomposeSeasonality() const {
    requireData(m_seasonality, "seasonal decomposition");
    const size_t n = m_data.size();
    const std::vector<double> ma = movingAverage(m_seasonality);
    const size_t offset = m_seasonality / 2;

    SeasonalDecomposition out;
    out.trend.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const bool edge = i < offset || i >= n - offset || i - offset >= ma.size();
        out.trend.push_back(edge ? m_data[i].value : ma[i - offset]);
    }

    std::vector<double> seasonalSum(m_seasonality, 0.0);
    std::vector<size_t> seasonalCount(m_seasonality, 0);
    for (size_t i = 0; i < n; ++i) {
        seasonalSum[i % m_seasonality] += m_data[i].value - out.trend[i];
        ++seasonalCount[i % m_seasonality];
    }
    for (size_t s = 0; s < m_seasonality; ++s) {
        seasonalSum[s] /= static_cast<double>(seasonalCount[s]);
    }

    out.seasonal.reserve(n);
    out.residual.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.seasonal.push_back(seasonalSum[i % m_seasonality]);
        out.residual.push_back(m_data[i].value - out.trend[i] - out.seasonal[i]);
    }
    return out;
}

std::vector<double> TimeSeriesForecast::holtWintersForecast(size_t steps) const {
    return holtWintersForecast(steps, m_options.holtAlpha, m_options.holtBeta, m_options.holtGamma);
}

std::vector<double> TimeSeriesForecast::holtWintersForecast(size_t steps, double alpha, double beta, double gamma) const {
    const SeasonalDecomposition decomposition = decomposeSeasonality();
    std::vector<double> season(decomposition.seasonal.begin(),
                               decomposition.seasonal.begin() + static_cast<std::ptrdiff_t>(m_seasonality));

    double level = m_data.front().value;
    double trend = 0.0;
    for (size_t i = 1; i < m_data.size(); ++i) {
        const double previousLevel = level;
        const size_t s = i % m_seasonality;
        const double y = m_data[i].value;
        level = alpha * (y - season[s]) + (1.0 - alpha) * (previousLevel + trend);
        trend = beta * (level - previousLevel) + (1.0 - beta) * trend;
        season[s] = gamma * (y - level) + (1.0 - gamma) * season[s];
    }

    std::vector<double> out;
    out.reserve(steps);
    for (size_t i = 0; i < steps; ++i) {
        const size_t s = (m_data.size() + i) % m_seasonality;
        out.push_back(level + static_cast<double>(i + 1) * trend + season[s]);
    }
    return out;
}

std::vector<AnomalyScore> TimeSeriesForecast::detectAnomalies() const {
    return detectAnomalies(m_options.anomalyThreshold);
}

std::vector<AnomalyScore> TimeSeriesForecast::detectAnomalies(double threshold) const {
    std::vector<AnomalyScore> out;
    if (m_data.empty()) return out;
    const std::vector<double> series = values();
    const double mean = Statistics::mean(series);
    double sd = Statistics::populationStdDev(series);
    if (sd <= MathUtils::getNumericEpsilon()) sd = 1.0;

    for (size_t i = 0; i < series.size(); ++i) {
        const double z = std::abs((series[i] - mean) / sd);
        if (z > threshold) out.push_back({i, series[i], z, true});
    }
    return out;
}
