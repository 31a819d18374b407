#pragma once

#include "Insight.h"
#include "SleepData.h"
#include "Statistics.h"

#include <cstddef>
#include <string>
#include <vector>

enum class DebtSeverity { NONE, MILD, MODERATE, SEVERE, CRITICAL };
enum class DebtTrend { IMPROVING, WORSENING, STABLE };

std::string toString(DebtSeverity severity);
std::string toString(DebtTrend trend);

struct SleepDebtOptions {
    size_t minimumDays = 7;
    double dailyDecay = 0.05;
    double recoveryRate = 0.25;
    double maxUsefulExtraHours = 2.0;
    size_t historyWindow = 30;
};

struct SleepNeedEstimate {
    double hours = 8.0;
    double confidence = 40.0;
};

struct DebtEntry {
    std::string date;
    double debt = 0.0;
    double dailyDeficit = 0.0;
};

struct RecoveryEstimate {
    long daysToRecovery = 0;
    double hoursNeededTonight = 0.0;
    std::string weekendRecoveryPlan;
};

struct DebtImpact {
    double cognitiveImpairment = 0.0;
    double equivalentBAC = 0.0;
    double accidentRisk = 1.0;
    std::string description;
};

struct SleepRecommendations {
    std::vector<std::string> immediate;
    std::vector<std::string> weekly;
    std::vector<std::string> longTerm;
};

struct SleepDebtAnalysis {
    double currentDebt = 0.0;
    DebtSeverity severity = DebtSeverity::NONE;
    DebtTrend trend = DebtTrend::STABLE;
    std::vector<DebtEntry> debtHistory;
    double estimatedSleepNeed = 8.0;
    double confidence = 40.0;
    // Distribution of nightly sleep hours over every supplied night.
    ColumnStats durationStats{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    RecoveryEstimate recovery;
    DebtImpact impact;
    SleepRecommendations recommendations;
    std::vector<Insight> insights;
};

// Homeostatic sleep-debt model; every call recomputes from the full chronological series.
class SleepDebtCalculator {
public:
    /**
     * @brief Full debt analysis of nights ordered oldest first.
     * @pre sleep holds at least options.minimumDays records.
     * @post debtHistory keeps only the last options.historyWindow entries.
     * @throws Circadia::InsufficientDataException when too few nights are supplied.
     * @throws Circadia::ConfigurationException on a malformed date or negative duration.
     */
    static SleepDebtAnalysis analyzeSleepDebt(const std::vector<SleepRecord>& sleep,
                                              const SleepDebtOptions& options = SleepDebtOptions());

    /**
     * @brief Sleep need from the weekend extension, or from long-sleep days when
     * fewer than four weekend nights exist.
     * @post hours is rounded to one decimal; confidence is one of 85, 75, 60, 40.
     */
    static SleepNeedEstimate estimateSleepNeed(const std::vector<SleepRecord>& sleep);

    // debt_t = max(0, debt_{t-1} * (1 - decay) + need - actual)
    static std::vector<DebtEntry> calculateDebtHistory(const std::vector<SleepRecord>& sleep,
                                                       double sleepNeed,
                                                       double dailyDecay = 0.05);

    static DebtSeverity assessSeverity(double debt);
    static DebtTrend analyzeTrend(const std::vector<DebtEntry>& history);
    static DebtImpact calculateImpact(double debt);
    static RecoveryEstimate generateRecoveryPlan(double debt,
                                                 double sleepNeed,
                                                 const SleepDebtOptions& options = SleepDebtOptions());

    // Longest run of deficits above half an hour within the last 14 nights.
    static size_t findConsecutiveDeficits(const std::vector<DebtEntry>& history);

    // Bedtime for a 7 AM wake, e.g. "11:00 PM".
    static std::string formatRecommendedBedtime(double sleepNeed);

private:
    static SleepRecommendations generateRecommendations(double debt,
                                                        DebtSeverity severity,
                                                        double sleepNeed,
                                                        const std::vector<DebtEntry>& history);
    static std::vector<Insight> generateInsights(double debt,
                                                 DebtSeverity severity,
                                                 const std::vector<DebtEntry>& history,
                                                 double sleepNeed,
                                                 double needConfidence,
                                                 const ColumnStats& durationStats,
                                                 const SleepDebtOptions& options);
};
