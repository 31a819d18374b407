#include <catch2/catch.hpp>

#include "ChronotypeAnalyzer.h"
#include "CircadiaExceptions.h"

#include <string>
#include <vector>

namespace {
std::string januaryDay(int dayOfMonth) {
    return std::string("2024-01-") + (dayOfMonth < 10 ? "0" : "") + std::to_string(dayOfMonth);
}

SleepRecord timedNight(const std::string& day, double bed, double wake, double hours) {
    SleepRecord night;
    night.day = day;
    night.totalSleepSeconds = hours * 3600.0;
    night.bedtimeStartHour = bed;
    night.bedtimeEndHour = wake;
    return night;
}

// Weeknights 23:00-07:00 (7 h asleep), weekend nights 01:00-10:00 (9 h asleep).
std::vector<SleepRecord> twoWeeks() {
    std::vector<SleepRecord> nights;
    for (int d = 1; d <= 14; ++d) {
        const std::string day = januaryDay(d);
        nights.push_back(SleepCalendar::isWeekend(day) ? timedNight(day, 1.0, 10.0, 9.0)
                                                       : timedNight(day, 23.0, 7.0, 7.0));
    }
    return nights;
}

std::vector<ReadinessRecord> fadingReadiness() {
    std::vector<ReadinessRecord> readiness;
    for (int d = 1; d <= 14; ++d) {
        readiness.push_back({januaryDay(d), d <= 5 ? 80.0 : (d <= 10 ? 70.0 : 60.0)});
    }
    return readiness;
}
} // namespace

TEST_CASE("Chronotype classification bands", "[chronotype][classify]") {
    REQUIRE(ChronotypeAnalyzer::classify(0.0).score == Approx(2.0));
    REQUIRE(ChronotypeAnalyzer::classify(3.0).chronotype == Chronotype::MORNING);
    REQUIRE(ChronotypeAnalyzer::classify(3.0).score == Approx(1.14));
    REQUIRE(ChronotypeAnalyzer::classify(4.0).score == Approx(0.5));
    REQUIRE(ChronotypeAnalyzer::classify(5.0).chronotype == Chronotype::INTERMEDIATE);
    REQUIRE(ChronotypeAnalyzer::classify(5.0).score == 0.0);
    REQUIRE(ChronotypeAnalyzer::classify(6.0).chronotype == Chronotype::EVENING);
    REQUIRE(ChronotypeAnalyzer::classify(6.0).score == Approx(-0.5));
    REQUIRE(ChronotypeAnalyzer::classify(9.0).score == Approx(-2.0));
    REQUIRE(toString(Chronotype::EVENING) == "evening");
}

TEST_CASE("Social jetlag bands", "[chronotype][jetlag]") {
    REQUIRE(ChronotypeAnalyzer::assessSocialJetlag(0.3, 0.0).severity == JetlagSeverity::NONE);
    REQUIRE(ChronotypeAnalyzer::assessSocialJetlag(0.7, 0.0).severity == JetlagSeverity::MILD);
    REQUIRE(ChronotypeAnalyzer::assessSocialJetlag(1.5, 0.0).severity == JetlagSeverity::MODERATE);

    const SocialJetlag severe = ChronotypeAnalyzer::assessSocialJetlag(2.5, 2.0);
    REQUIRE(severe.severity == JetlagSeverity::SEVERE);
    REQUIRE(severe.weekdayRestriction);
    REQUIRE(severe.recommendation.rfind("2.5 hours", 0) == 0);
    REQUIRE_FALSE(ChronotypeAnalyzer::assessSocialJetlag(2.5, 0.2).weekdayRestriction);
}

TEST_CASE("Clock formatting and midpoints", "[chronotype][time]") {
    REQUIRE(ChronotypeAnalyzer::formatTime(0.0) == "12:00 AM");
    REQUIRE(ChronotypeAnalyzer::formatTime(12.0) == "12:00 PM");
    REQUIRE(ChronotypeAnalyzer::formatTime(23.5) == "11:30 PM");
    REQUIRE(ChronotypeAnalyzer::formatTime(-1.0) == "11:00 PM");
    REQUIRE(ChronotypeAnalyzer::formatTime(25.25) == "1:15 AM");

    REQUIRE(ChronotypeAnalyzer::sleepMidpoint({timedNight("2024-01-01", 23.0, 7.0, 7.0)}) == Approx(3.0));
    REQUIRE(ChronotypeAnalyzer::sleepMidpoint({timedNight("2024-01-01", 1.0, 10.0, 9.0)}) == Approx(5.5));

    SleepRecord untimed;
    untimed.day = "2024-01-01";
    untimed.totalSleepSeconds = 7.0 * 3600.0;
    REQUIRE_FALSE(ChronotypeAnalyzer::sleepMidpoint({untimed}).has_value());
}

TEST_CASE("Full chronotype analysis", "[chronotype][analysis]") {
    const ChronotypeAnalysis analysis = ChronotypeAnalyzer::analyze(twoWeeks(), fadingReadiness());

    const SleepTimingMetrics& metrics = analysis.sleepMetrics;
    REQUIRE(metrics.weekdaySleepMidpoint == Approx(3.0));
    REQUIRE(metrics.weekendSleepMidpoint == Approx(5.5));
    REQUIRE(metrics.sleepDebt == Approx(2.0));
    REQUIRE(metrics.averageSleepDuration == Approx(106.0 / 14.0));
    REQUIRE(metrics.averageBedtime == "11:34 PM");
    REQUIRE(metrics.averageWakeTime == "7:51 AM");

    REQUIRE(analysis.correctedMidpoint == Approx(4.5));
    REQUIRE(analysis.chronotype == Chronotype::INTERMEDIATE);
    REQUIRE(analysis.chronotypeScore == 0.0);
    REQUIRE(analysis.confidence == Approx(80.0));

    REQUIRE(analysis.socialJetlag.magnitude == Approx(2.5));
    REQUIRE(analysis.socialJetlag.severity == JetlagSeverity::SEVERE);
    REQUIRE(analysis.circadianPhase.phaseAdvancement == Approx(0.0));

    REQUIRE(analysis.performance.morningReadiness == Approx(80.0));
    REQUIRE(analysis.performance.eveningReadiness == Approx(60.0));
    REQUIRE(analysis.performance.peakPerformanceWindow == "Morning (2-4h post-wake)");

    REQUIRE(analysis.recommendations.size() == 5);
    REQUIRE(analysis.recommendations.front().topic == "sleep_schedule");
    REQUIRE(analysis.recommendations.back().topic == "work_schedule");

    const std::vector<std::string> categories = {"circadian", "alignment", "sleep_debt", "optimization"};
    REQUIRE(analysis.insights.size() == categories.size());
    for (size_t i = 0; i < categories.size(); ++i) REQUIRE(analysis.insights[i].category == categories[i]);
}

TEST_CASE("Late sleeper is an evening type", "[chronotype][analysis]") {
    std::vector<SleepRecord> nights;
    for (int d = 1; d <= 14; ++d) {
        const std::string day = januaryDay(d);
        nights.push_back(SleepCalendar::isWeekend(day) ? timedNight(day, 3.0, 11.5, 8.5)
                                                       : timedNight(day, 1.0, 8.0, 7.0));
    }
    const ChronotypeAnalysis analysis = ChronotypeAnalyzer::analyze(nights, {});
    REQUIRE(analysis.correctedMidpoint == Approx(6.5));
    REQUIRE(analysis.chronotype == Chronotype::EVENING);
    REQUIRE(analysis.chronotypeScore == Approx(-1.0));
    REQUIRE(analysis.recommendations[1].primary.rfind("Critical", 0) == 0);
}

TEST_CASE("Chronotype input requirements", "[chronotype][errors]") {
    std::vector<SleepRecord> nights = twoWeeks();
    nights.pop_back();
    REQUIRE_THROWS_AS(ChronotypeAnalyzer::analyze(nights, {}), Circadia::InsufficientDataException);

    std::vector<SleepRecord> untimedWeekends = twoWeeks();
    for (SleepRecord& night : untimedWeekends) {
        if (SleepCalendar::isWeekend(night.day)) {
            night.bedtimeStartHour.reset();
            night.bedtimeEndHour.reset();
        }
    }
    REQUIRE_THROWS_AS(ChronotypeAnalyzer::analyze(untimedWeekends, {}), Circadia::InsufficientDataException);

    ChronotypeOptions relaxed;
    relaxed.minimumNights = 7;
    std::vector<SleepRecord> week = twoWeeks();
    week.resize(7);
    REQUIRE(ChronotypeAnalyzer::analyze(week, {}, relaxed).sleepMetrics.weekendSleepMidpoint == Approx(5.5));
}
