#pragma once

#include "Insight.h"
#include "SleepData.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class Chronotype { MORNING, INTERMEDIATE, EVENING };
enum class JetlagSeverity { NONE, MILD, MODERATE, SEVERE };

std::string toString(Chronotype chronotype);
std::string toString(JetlagSeverity severity);

struct ChronotypeOptions {
    size_t minimumNights = 14;
    size_t readinessWindow = 14;
};

struct ChronotypeClassification {
    Chronotype chronotype = Chronotype::INTERMEDIATE;
    double score = 0.0;
};

struct SleepTimingMetrics {
    double averageSleepMidpoint = 0.0;
    double weekdaySleepMidpoint = 0.0;
    double weekendSleepMidpoint = 0.0;
    double averageSleepDuration = 0.0;
    std::string averageBedtime;
    std::string averageWakeTime;
    // Free-day minus work-day duration; positive means weekend catch-up sleep.
    double sleepDebt = 0.0;
};

struct SocialJetlag {
    double magnitude = 0.0;
    JetlagSeverity severity = JetlagSeverity::NONE;
    bool weekdayRestriction = false;
    std::string recommendation;
};

struct CircadianPhase {
    double dlmoHour = 0.0;
    std::string estimatedDLMO;
    std::string optimalSleepOnset;
    std::string naturalWakeTime;
    double phaseAdvancement = 0.0;
};

struct PerformancePatterns {
    double morningReadiness = 0.0;
    double afternoonReadiness = 0.0;
    double eveningReadiness = 0.0;
    std::string peakPerformanceWindow;
};

// One timing recommendation; primary/secondary are e.g. bedtime/wake or optimal/avoid.
struct TimingAdvice {
    std::string topic;
    std::string primary;
    std::string secondary;
    std::string rationale;
};

struct ChronotypeAnalysis {
    Chronotype chronotype = Chronotype::INTERMEDIATE;
    double chronotypeScore = 0.0;
    double confidence = 60.0;
    double correctedMidpoint = 0.0;
    SleepTimingMetrics sleepMetrics;
    SocialJetlag socialJetlag;
    CircadianPhase circadianPhase;
    PerformancePatterns performance;
    std::vector<TimingAdvice> recommendations;
    std::vector<Insight> insights;
};

// Chronotype from the sleep-debt-corrected free-day sleep midpoint (MSFsc).
class ChronotypeAnalyzer {
public:
    /**
     * @brief Classifies the sleeper and derives phase markers and timing advice.
     * @pre Both work days and free days contain nights with bedtime hours.
     * @throws Circadia::InsufficientDataException below options.minimumNights nights
     * or when one day type has no timed night.
     * @throws Circadia::ConfigurationException on a malformed date.
     */
    static ChronotypeAnalysis analyze(const std::vector<SleepRecord>& sleep,
                                      const std::vector<ReadinessRecord>& readiness,
                                      const ChronotypeOptions& options = ChronotypeOptions());

    // Mean midpoint in hours after midnight over nights with both bedtime hours.
    static std::optional<double> sleepMidpoint(const std::vector<SleepRecord>& nights);

    /**
     * @brief Morning below 4.5 h, intermediate below 5.5 h, evening otherwise.
     * @post score lies in [-2, 2], rounded to two decimals; positive is earlier.
     */
    static ChronotypeClassification classify(double correctedMidpoint);

    static SocialJetlag assessSocialJetlag(double magnitude, double sleepDebt);

    // "h:mm AM/PM" of an hour value, wrapped into one day.
    static std::string formatTime(double hours);

private:
    static double confidenceFor(const std::vector<SleepRecord>& sleep, size_t workDays, size_t freeDays);
    static CircadianPhase estimatePhase(double midpoint, double averageDuration);
    static PerformancePatterns analyzePerformance(const std::vector<ReadinessRecord>& readiness, size_t window);
    static std::vector<TimingAdvice> buildRecommendations(Chronotype chronotype, double midpoint);
    static std::vector<Insight> buildInsights(const ChronotypeAnalysis& analysis, size_t nights);
};
