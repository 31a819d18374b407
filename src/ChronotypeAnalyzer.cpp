#include "ChronotypeAnalyzer.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace {
constexpr double kPopulationMidpoint = 4.5;

// Hours before noon belong to the night that started the previous evening.
double unwrapNightHour(double hour) {
    return hour < 12.0 ? hour + 24.0 : hour;
}

double wrapDay(double hours) {
    return std::fmod(std::fmod(hours, 24.0) + 24.0, 24.0);
}

bool isTimed(const SleepRecord& night) {
    return night.bedtimeStartHour.has_value() && night.bedtimeEndHour.has_value();
}

double averageDuration(const std::vector<SleepRecord>& nights) {
    double sum = 0.0;
    size_t count = 0;
    for (const SleepRecord& night : nights) {
        if (night.hours() > 0.0) {
            sum += night.hours();
            ++count;
        }
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

double meanScore(const std::vector<ReadinessRecord>& records, size_t begin, size_t end) {
    end = std::min(end, records.size());
    if (begin >= end) return 0.0;
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) sum += records[i].score;
    return sum / static_cast<double>(end - begin);
}
} // namespace

std::string toString(Chronotype chronotype) {
    switch (chronotype) {
        case Chronotype::MORNING: return "morning";
        case Chronotype::INTERMEDIATE: return "intermediate";
        case Chronotype::EVENING: return "evening";
    }
    return "intermediate";
}

std::string toString(JetlagSeverity severity) {
    switch (severity) {
        case JetlagSeverity::NONE: return "none";
        case JetlagSeverity::MILD: return "mild";
        case JetlagSeverity::MODERATE: return "moderate";
        case JetlagSeverity::SEVERE: return "severe";
    }
    return "none";
}

ChronotypeAnalysis ChronotypeAnalyzer::analyze(const std::vector<SleepRecord>& sleep,
                                               const std::vector<ReadinessRecord>& readiness,
                                               const ChronotypeOptions& options) {
    const size_t required = std::max<size_t>(1, options.minimumNights);
    if (sleep.size() < required) {
        throw Circadia::InsufficientDataException("chronotype analysis needs more nights", required, sleep.size());
    }

    std::vector<SleepRecord> workDays;
    std::vector<SleepRecord> freeDays;
    for (const SleepRecord& night : sleep) {
        (SleepCalendar::isWeekend(night.day) ? freeDays : workDays).push_back(night);
    }

    const std::optional<double> workMid = sleepMidpoint(workDays);
    const std::optional<double> freeMid = sleepMidpoint(freeDays);
    if (!workMid) throw Circadia::InsufficientDataException("no work-day night carries bedtime hours", 1, 0);
    if (!freeMid) throw Circadia::InsufficientDataException("no free-day night carries bedtime hours", 1, 0);

    ChronotypeAnalysis analysis;
    SleepTimingMetrics& metrics = analysis.sleepMetrics;
    metrics.weekdaySleepMidpoint = *workMid;
    metrics.weekendSleepMidpoint = *freeMid;
    metrics.averageSleepMidpoint = sleepMidpoint(sleep).value_or(0.0);
    metrics.averageSleepDuration = averageDuration(sleep);
    metrics.sleepDebt = averageDuration(freeDays) - averageDuration(workDays);

    double bedSum = 0.0;
    double wakeSum = 0.0;
    size_t timed = 0;
    for (const SleepRecord& night : sleep) {
        if (!isTimed(night)) continue;
        bedSum += unwrapNightHour(*night.bedtimeStartHour);
        wakeSum += *night.bedtimeEndHour;
        ++timed;
    }
    metrics.averageBedtime = formatTime(bedSum / static_cast<double>(timed));
    metrics.averageWakeTime = formatTime(wakeSum / static_cast<double>(timed));

    analysis.correctedMidpoint = *freeMid - metrics.sleepDebt / 2.0;
    analysis.socialJetlag = assessSocialJetlag(std::abs(*freeMid - *workMid), metrics.sleepDebt);

    const ChronotypeClassification classification = classify(analysis.correctedMidpoint);
    analysis.chronotype = classification.chronotype;
    analysis.chronotypeScore = classification.score;
    analysis.confidence = confidenceFor(sleep, workDays.size(), freeDays.size());
    analysis.circadianPhase = estimatePhase(analysis.correctedMidpoint, metrics.averageSleepDuration);
    analysis.performance = analyzePerformance(readiness, options.readinessWindow);
    analysis.recommendations = buildRecommendations(analysis.chronotype, analysis.correctedMidpoint);
    analysis.insights = buildInsights(analysis, workDays.size() + freeDays.size());
    return analysis;
}

std::optional<double> ChronotypeAnalyzer::sleepMidpoint(const std::vector<SleepRecord>& nights) {
    double sum = 0.0;
    size_t count = 0;
    for (const SleepRecord& night : nights) {
        if (!isTimed(night)) continue;
        const double start = unwrapNightHour(*night.bedtimeStartHour);
        const double end = unwrapNightHour(*night.bedtimeEndHour);
        sum += std::fmod((start + end) / 2.0, 24.0);
        ++count;
    }
    if (count == 0) return std::nullopt;
    return sum / static_cast<double>(count);
}

ChronotypeClassification ChronotypeAnalyzer::classify(double m) {
    ChronotypeClassification out;
    double score = 0.0;
    if (m < 3.5) {
        out.chronotype = Chronotype::MORNING;
        score = 2.0 - m / 3.5;
    } else if (m < 4.5) {
        out.chronotype = Chronotype::MORNING;
        score = 1.0 - (m - 3.5);
    } else if (m < 5.5) {
        out.chronotype = Chronotype::INTERMEDIATE;
        score = 0.0;
    } else if (m < 6.5) {
        out.chronotype = Chronotype::EVENING;
        score = -1.0 + (6.5 - m);
    } else {
        out.chronotype = Chronotype::EVENING;
        score = -2.0 + (7.5 - m);
    }
    out.score = CommonUtils::roundTo(std::clamp(score, -2.0, 2.0), 2);
    return out;
}

SocialJetlag ChronotypeAnalyzer::assessSocialJetlag(double magnitude, double sleepDebt) {
    SocialJetlag jetlag;
    jetlag.magnitude = magnitude;
    jetlag.weekdayRestriction = sleepDebt > 0.5;
    const std::string hours = CommonUtils::toFixed(magnitude);

    if (magnitude < 0.5) {
        jetlag.severity = JetlagSeverity::NONE;
        jetlag.recommendation = "Excellent circadian alignment. Your work schedule matches your natural rhythm.";
    } else if (magnitude < 1.0) {
        jetlag.severity = JetlagSeverity::MILD;
        jetlag.recommendation = hours + " hours misalignment. Consider gradually adjusting your sleep schedule to reduce circadian stress.";
    } else if (magnitude < 2.0) {
        jetlag.severity = JetlagSeverity::MODERATE;
        jetlag.recommendation = hours + " hours social jetlag indicates significant circadian misalignment. "
                                        "Prioritize sleep schedule consistency.";
    } else {
        jetlag.severity = JetlagSeverity::SEVERE;
        jetlag.recommendation = hours + " hours social jetlag is clinically significant and linked to metabolic and mood disorders. "
                                        "Consider adjusting your work schedule if possible.";
    }
    return jetlag;
}

std::string ChronotypeAnalyzer::formatTime(double hours) {
    const int totalMinutes = static_cast<int>(std::lround(wrapDay(hours) * 60.0)) % (24 * 60);
    const int h = totalMinutes / 60;
    const int m = totalMinutes % 60;
    const int displayHour = h > 12 ? h - 12 : (h == 0 ? 12 : h);
    return std::to_string(displayHour) + ":" + (m < 10 ? "0" : "") + std::to_string(m) + (h >= 12 ? " PM" : " AM");
}

double ChronotypeAnalyzer::confidenceFor(const std::vector<SleepRecord>& sleep, size_t workDays, size_t freeDays) {
    double confidence = 60.0;
    if (sleep.size() >= 21) confidence += 10.0;
    if (sleep.size() >= 30) confidence += 10.0;
    if (workDays >= 8 && freeDays >= 4) confidence += 10.0;

    std::vector<double> durations;
    for (const SleepRecord& night : sleep) {
        if (isTimed(night)) {
            durations.push_back(unwrapNightHour(*night.bedtimeEndHour) - unwrapNightHour(*night.bedtimeStartHour));
        }
    }
    if (!durations.empty() && Statistics::populationVariance(durations) < 1.0) confidence += 10.0;
    return std::min(95.0, confidence);
}

CircadianPhase ChronotypeAnalyzer::estimatePhase(double midpoint, double averageDuration) {
    CircadianPhase phase;
    const double onset = midpoint - averageDuration / 2.0;
    // Melatonin onset precedes habitual sleep onset by about two hours.
    phase.dlmoHour = wrapDay(onset - 2.0);
    phase.estimatedDLMO = formatTime(phase.dlmoHour);
    phase.optimalSleepOnset = formatTime(onset);
    phase.naturalWakeTime = formatTime(midpoint + averageDuration / 2.0);
    phase.phaseAdvancement = CommonUtils::roundTo(kPopulationMidpoint - midpoint, 2);
    return phase;
}

PerformancePatterns ChronotypeAnalyzer::analyzePerformance(const std::vector<ReadinessRecord>& readiness, size_t window) {
    const size_t start = readiness.size() > window ? readiness.size() - window : 0;
    const std::vector<ReadinessRecord> recent(readiness.begin() + static_cast<std::ptrdiff_t>(start), readiness.end());

    PerformancePatterns patterns;
    const double morning = meanScore(recent, 0, 5);
    const double afternoon = meanScore(recent, 5, 10);
    const double evening = meanScore(recent, 10, recent.size());
    patterns.morningReadiness = CommonUtils::roundTo(morning, 1);
    patterns.afternoonReadiness = CommonUtils::roundTo(afternoon, 1);
    patterns.eveningReadiness = CommonUtils::roundTo(evening, 1);

    const std::array<std::pair<const char*, double>, 3> windows = {{
        {"Morning (2-4h post-wake)", morning},
        {"Afternoon (6-8h post-wake)", afternoon},
        {"Evening (10-12h post-wake)", evening},
    }};
    size_t best = 0;
    for (size_t i = 1; i < windows.size(); ++i) {
        if (windows[i].second > windows[best].second) best = i;
    }
    patterns.peakPerformanceWindow = windows[best].first;
    return patterns;
}

std::vector<TimingAdvice> ChronotypeAnalyzer::buildRecommendations(Chronotype chronotype, double midpoint) {
    const double bedtime = midpoint - 4.0;
    const double wake = midpoint + 4.0;
    const bool morning = chronotype == Chronotype::MORNING;
    const bool evening = chronotype == Chronotype::EVENING;

    std::vector<TimingAdvice> advice;
    advice.push_back({"sleep_schedule",
                      formatTime(bedtime),
                      formatTime(wake),
                      "Centred on your corrected sleep midpoint of " + formatTime(midpoint) +
                          " to align with your circadian phase and minimize social jetlag."});
    advice.push_back({"light_exposure",
                      evening ? "Critical: bright light within 30 minutes of waking to advance circadian phase"
                              : "Beneficial: morning sunlight reinforces phase alignment",
                      morning ? "Dim lights 2-3 hours before bed; blue light can delay an already advanced phase"
                              : "Essential: avoid bright light 3 hours before bed to support melatonin onset",
                      "Morning light advances the circadian phase and evening light delays it."});
    advice.push_back({"meal_timing",
                      "Within 1-2 hours of waking (" + formatTime(wake + 1.0) + ")",
                      "3 hours before bed (" + formatTime(bedtime - 3.0) + ")",
                      "Meal timing entrains peripheral clocks."});
    advice.push_back({"exercise_timing",
                      morning ? "Morning or midday (evening exercise can delay phase)"
                              : (evening ? "Afternoon or early evening" : "Flexible: late morning through early evening"),
                      "Within 3 hours of bedtime (raises core temperature and delays sleep onset)",
                      "Exercise shifts circadian phase depending on its timing."});
    advice.push_back({"work_schedule",
                      morning ? "Early morning (peak cortisol awakening response)"
                              : (evening ? "Late morning through afternoon" : "Mid-morning through early afternoon"),
                      "Afternoon (avoid early morning for evening types)",
                      "Cognitive performance follows the circadian rhythm."});
    return advice;
}

std::vector<Insight> ChronotypeAnalyzer::buildInsights(const ChronotypeAnalysis& analysis, size_t nights) {
    std::vector<Insight> insights;
    const std::string type = toString(analysis.chronotype);

    Insight circadian;
    circadian.category = "circadian";
    circadian.severity = "info";
    circadian.confidence = analysis.confidence;
    circadian.finding = "You are a " + type + " chronotype (" +
                        (analysis.chronotype == Chronotype::INTERMEDIATE ? "50%" : "25%") + " of population)";
    circadian.evidence = "Sleep midpoint analysis of " + std::to_string(nights) + " nights split into work and free days";
    if (analysis.chronotype == Chronotype::EVENING) {
        circadian.recommendation = "Evening chronotypes often face social jetlag from work schedules. "
                                   "Prioritize light exposure and sleep hygiene.";
    } else if (analysis.chronotype == Chronotype::MORNING) {
        circadian.recommendation = "Morning chronotypes should avoid forcing late schedules.";
    } else {
        circadian.recommendation = "Intermediate chronotypes have the most scheduling flexibility but still benefit from consistency.";
    }
    circadian.metrics["corrected_midpoint"] = analysis.correctedMidpoint;
    circadian.metrics["chronotype_score"] = analysis.chronotypeScore;
    insights.push_back(std::move(circadian));

    const SocialJetlag& jetlag = analysis.socialJetlag;
    if (jetlag.magnitude > 0.5) {
        Insight alignment;
        alignment.category = "alignment";
        alignment.severity = toString(jetlag.severity);
        alignment.confidence = analysis.confidence;
        alignment.finding = CommonUtils::toFixed(jetlag.magnitude) + "-hour social jetlag detected";
        alignment.evidence = "Work-day and free-day sleep midpoints differ";
        alignment.recommendation = "Circadian misalignment carries health risk even with enough sleep. Adjust the schedule gradually.";
        alignment.metrics["social_jetlag_hours"] = jetlag.magnitude;
        insights.push_back(std::move(alignment));
    }

    const double debt = analysis.sleepMetrics.sleepDebt;
    if (std::abs(debt) > 0.5) {
        Insight sleepDebt;
        sleepDebt.category = "sleep_debt";
        sleepDebt.severity = "info";
        sleepDebt.confidence = analysis.confidence;
        if (debt > 0.0) {
            sleepDebt.finding = CommonUtils::toFixed(debt) + " hours weekend sleep extension indicates chronic sleep debt";
            sleepDebt.recommendation = "Weekend catch-up sleep points at weekday restriction. Extend weekday sleep duration.";
        } else {
            sleepDebt.finding = CommonUtils::toFixed(-debt) + " hours reduced weekend sleep suggests the weekday schedule may be too late";
            sleepDebt.recommendation = "Weekend obligations may be cutting into sleep that matches your natural preference.";
        }
        sleepDebt.evidence = "Comparison of work-day and free-day sleep duration";
        sleepDebt.metrics["weekend_extension_hours"] = debt;
        insights.push_back(std::move(sleepDebt));
    }

    const PerformancePatterns& perf = analysis.performance;
    const std::array<std::pair<const char*, double>, 3> peaks = {{
        {"morning", perf.morningReadiness},
        {"afternoon", perf.afternoonReadiness},
        {"evening", perf.eveningReadiness},
    }};
    size_t best = 0;
    for (size_t i = 1; i < peaks.size(); ++i) {
        if (peaks[i].second > peaks[best].second) best = i;
    }
    Insight optimization;
    optimization.category = "optimization";
    optimization.severity = "info";
    optimization.confidence = analysis.confidence;
    optimization.finding = std::string("Peak readiness occurs during ") + peaks[best].first +
                           " (score: " + CommonUtils::toFixed(peaks[best].second, 0) + ")";
    optimization.evidence = "Readiness scores across time-of-day windows";
    optimization.recommendation = std::string("Schedule demanding tasks during ") + peaks[best].first + " hours.";
    optimization.metrics["peak_readiness"] = peaks[best].second;
    insights.push_back(std::move(optimization));
    return insights;
}
