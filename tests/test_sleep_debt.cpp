#include <catch2/catch.hpp>

#include "CircadiaExceptions.h"
#include "SleepDebtCalculator.h"

#include <cmath>
#include <string>
#include <vector>

namespace {
// January 2024 starts on a Monday.
std::string januaryDay(int dayOfMonth) {
    return std::string("2024-01-") + (dayOfMonth < 10 ? "0" : "") + std::to_string(dayOfMonth);
}

std::vector<SleepRecord> constantNights(int count, double hours) {
    std::vector<SleepRecord> nights;
    for (int d = 1; d <= count; ++d) {
        SleepRecord night;
        night.day = januaryDay(d);
        night.totalSleepSeconds = hours * 3600.0;
        nights.push_back(night);
    }
    return nights;
}

// Two weeks of 6.5 h weeknights and 8.5 h weekend nights.
std::vector<SleepRecord> weekendCatchUp() {
    std::vector<SleepRecord> nights;
    for (int d = 1; d <= 14; ++d) {
        SleepRecord night;
        night.day = januaryDay(d);
        night.totalSleepSeconds = (SleepCalendar::isWeekend(night.day) ? 8.5 : 6.5) * 3600.0;
        nights.push_back(night);
    }
    return nights;
}
} // namespace

TEST_CASE("Calendar helpers", "[sleep][calendar]") {
    REQUIRE(SleepCalendar::dayOfWeek("2024-01-01") == 1);
    REQUIRE(SleepCalendar::dayOfWeek("2024-02-29") == 4);
    REQUIRE(SleepCalendar::dayOfWeek("2000-01-01T00:00:00") == 6);
    REQUIRE(SleepCalendar::isWeekend("2024-01-06"));
    REQUIRE(SleepCalendar::isWeekend("2024-01-07"));
    REQUIRE_FALSE(SleepCalendar::isWeekend("2024-01-08"));

    REQUIRE_THROWS_AS(SleepCalendar::dayOfWeek("2023-02-29"), Circadia::ConfigurationException);
    REQUIRE_THROWS_AS(SleepCalendar::dayOfWeek("2024-13-01"), Circadia::ConfigurationException);
    REQUIRE_THROWS_AS(SleepCalendar::dayOfWeek("01/02/2024"), Circadia::ConfigurationException);
}

TEST_CASE("Sleep need estimation", "[sleep][need]") {
    SECTION("large weekend extension adds an hour to the weekday level") {
        const SleepNeedEstimate need = SleepDebtCalculator::estimateSleepNeed(weekendCatchUp());
        REQUIRE(need.hours == Approx(7.5));
        REQUIRE(need.confidence == 60.0);
    }

    SECTION("few weekends and no long nights default to eight hours") {
        const SleepNeedEstimate need = SleepDebtCalculator::estimateSleepNeed(constantNights(7, 7.0));
        REQUIRE(need.hours == 8.0);
        REQUIRE(need.confidence == 40.0);
    }

    SECTION("negative duration is rejected") {
        std::vector<SleepRecord> nights = constantNights(7, 7.0);
        nights[3].totalSleepSeconds = -1.0;
        REQUIRE_THROWS_AS(SleepDebtCalculator::estimateSleepNeed(nights), Circadia::ConfigurationException);
    }
}

TEST_CASE("Debt accumulates with daily decay", "[sleep][debt]") {
    const std::vector<DebtEntry> history =
        SleepDebtCalculator::calculateDebtHistory(constantNights(7, 5.0), 8.0, 0.05);
    const std::vector<double> expected = {3.0, 5.85, 8.56, 11.13, 13.57, 15.89, 18.1};

    REQUIRE(history.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(history[i].debt == Approx(expected[i]));
        REQUIRE(history[i].dailyDeficit == Approx(3.0));
    }
    REQUIRE(history.front().date == "2024-01-01");

    const std::vector<DebtEntry> rested =
        SleepDebtCalculator::calculateDebtHistory(constantNights(3, 9.0), 8.0, 0.05);
    for (const DebtEntry& entry : rested) REQUIRE(entry.debt == 0.0);
}

TEST_CASE("Severity, impact and bedtime mapping", "[sleep][severity]") {
    REQUIRE(SleepDebtCalculator::assessSeverity(1.9) == DebtSeverity::NONE);
    REQUIRE(SleepDebtCalculator::assessSeverity(2.0) == DebtSeverity::MILD);
    REQUIRE(SleepDebtCalculator::assessSeverity(7.0) == DebtSeverity::MODERATE);
    REQUIRE(SleepDebtCalculator::assessSeverity(12.0) == DebtSeverity::SEVERE);
    REQUIRE(SleepDebtCalculator::assessSeverity(15.0) == DebtSeverity::CRITICAL);
    REQUIRE(toString(DebtSeverity::MODERATE) == "moderate");
    REQUIRE(toString(DebtTrend::WORSENING) == "worsening");

    const DebtImpact impact = SleepDebtCalculator::calculateImpact(4.0);
    REQUIRE(impact.cognitiveImpairment == Approx(20.0));
    REQUIRE(impact.equivalentBAC == Approx(0.04));
    REQUIRE(impact.accidentRisk == 1.5);
    REQUIRE(SleepDebtCalculator::calculateImpact(30.0).cognitiveImpairment == Approx(50.0));

    REQUIRE(SleepDebtCalculator::formatRecommendedBedtime(8.0) == "11:00 PM");
    REQUIRE(SleepDebtCalculator::formatRecommendedBedtime(7.5) == "11:30 PM");
    REQUIRE(SleepDebtCalculator::formatRecommendedBedtime(7.0) == "12:00 AM");
}

TEST_CASE("Debt trend compares the last two weeks", "[sleep][trend]") {
    std::vector<DebtEntry> history;
    for (int i = 0; i < 14; ++i) history.push_back({januaryDay(i + 1), i < 7 ? 6.0 : 2.0, 0.0});
    REQUIRE(SleepDebtCalculator::analyzeTrend(history) == DebtTrend::IMPROVING);

    for (int i = 0; i < 14; ++i) history[i].debt = i < 7 ? 2.0 : 6.0;
    REQUIRE(SleepDebtCalculator::analyzeTrend(history) == DebtTrend::WORSENING);

    history.resize(7);
    REQUIRE(SleepDebtCalculator::analyzeTrend(history) == DebtTrend::STABLE);
}

TEST_CASE("Recovery plan and deficit streaks", "[sleep][recovery]") {
    const RecoveryEstimate mild = SleepDebtCalculator::generateRecoveryPlan(3.62, 7.5);
    REQUIRE(mild.hoursNeededTonight == Approx(0.9));
    REQUIRE(mild.daysToRecovery == 5);
    REQUIRE(mild.weekendRecoveryPlan == "Sleep 8.5 hours Fri-Sat and Sat-Sun to recover 2.0h of debt.");

    const RecoveryEstimate none = SleepDebtCalculator::generateRecoveryPlan(0.0, 8.0);
    REQUIRE(none.daysToRecovery == 0);
    REQUIRE(none.hoursNeededTonight == 0.0);

    std::vector<DebtEntry> history;
    const std::vector<double> deficits = {1.0, 1.0, 0.2, 1.0, 1.0, 1.0, 1.0, 0.0};
    for (size_t i = 0; i < deficits.size(); ++i) history.push_back({januaryDay(static_cast<int>(i) + 1), 0.0, deficits[i]});
    REQUIRE(SleepDebtCalculator::findConsecutiveDeficits(history) == 4);
}

TEST_CASE("Full analysis of weekday restriction", "[sleep][analysis]") {
    const SleepDebtAnalysis analysis = SleepDebtCalculator::analyzeSleepDebt(weekendCatchUp());

    REQUIRE(analysis.estimatedSleepNeed == Approx(7.5));
    REQUIRE(analysis.confidence == 60.0);
    REQUIRE(analysis.debtHistory.size() == 14);
    REQUIRE(analysis.currentDebt == Approx(3.62));
    REQUIRE(analysis.severity == DebtSeverity::MILD);
    REQUIRE(analysis.trend == DebtTrend::WORSENING);
    REQUIRE(analysis.recovery.daysToRecovery == 5);
    REQUIRE(analysis.impact.accidentRisk == 1.5);

    REQUIRE(analysis.insights.size() == 2);
    for (const Insight& insight : analysis.insights) {
        REQUIRE(insight.category == "sleep_debt");
        REQUIRE(insight.severity == "mild");
    }
    REQUIRE(analysis.insights[0].metrics.at("debt_hours") == Approx(3.62));
    REQUIRE(analysis.insights[1].metrics.at("consecutive_deficit_days") == 5.0);

    // Ten 6.5 h weeknights and four 8.5 h weekend nights.
    REQUIRE(analysis.durationStats.mean == Approx(99.0 / 14.0));
    REQUIRE(analysis.durationStats.median == Approx(6.5));
    REQUIRE(analysis.durationStats.variance == Approx(160.0 / 182.0));
    REQUIRE(analysis.durationStats.skewness > 0.0);
    REQUIRE(analysis.insights[0].metrics.at("duration_median_hours") == Approx(6.5));
    REQUIRE(analysis.insights[0].metrics.at("duration_stddev_hours") == Approx(std::sqrt(160.0 / 182.0)));

    REQUIRE_FALSE(analysis.recommendations.immediate.empty());
    REQUIRE(analysis.recommendations.weekly.front() == "Establish a consistent sleep schedule: Bed by 11:30 PM");

    SleepDebtOptions shortWindow;
    shortWindow.historyWindow = 10;
    const SleepDebtAnalysis trimmed = SleepDebtCalculator::analyzeSleepDebt(weekendCatchUp(), shortWindow);
    REQUIRE(trimmed.debtHistory.size() == 10);
    REQUIRE(trimmed.debtHistory.back().date == "2024-01-14");
    REQUIRE(trimmed.currentDebt == Approx(analysis.currentDebt));
}

TEST_CASE("Full analysis at the extremes", "[sleep][analysis]") {
    SECTION("well rested") {
        const SleepDebtAnalysis analysis = SleepDebtCalculator::analyzeSleepDebt(constantNights(7, 8.0));
        REQUIRE(analysis.currentDebt == 0.0);
        REQUIRE(analysis.severity == DebtSeverity::NONE);
        REQUIRE(analysis.trend == DebtTrend::STABLE);
        REQUIRE(analysis.recovery.daysToRecovery == 0);
        REQUIRE(analysis.insights.size() == 1);
    }

    SECTION("chronic short sleep") {
        const SleepDebtAnalysis analysis = SleepDebtCalculator::analyzeSleepDebt(constantNights(7, 5.0));
        REQUIRE(analysis.currentDebt == Approx(18.1));
        REQUIRE(analysis.severity == DebtSeverity::CRITICAL);
        REQUIRE(analysis.recovery.hoursNeededTonight == Approx(2.0));
        REQUIRE(analysis.recovery.daysToRecovery == 23);
        REQUIRE(analysis.impact.cognitiveImpairment == Approx(50.0));
        REQUIRE(analysis.insights.size() == 3);
        REQUIRE(analysis.recommendations.immediate.front().rfind("URGENT", 0) == 0);
    }

    SECTION("too few nights") {
        REQUIRE_THROWS_AS(SleepDebtCalculator::analyzeSleepDebt(constantNights(6, 8.0)),
                          Circadia::InsufficientDataException);
    }

    SECTION("decay outside its range") {
        SleepDebtOptions options;
        options.dailyDecay = 1.0;
        REQUIRE_THROWS_AS(SleepDebtCalculator::analyzeSleepDebt(constantNights(7, 8.0), options),
                          Circadia::ConfigurationException);
    }
}
