#include "SleepDebtCalculator.h"
#include "CircadiaExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace {
double averageHours(const std::vector<const SleepRecord*>& nights) {
    if (nights.empty()) return 0.0;
    double sum = 0.0;
    for (const SleepRecord* night : nights) sum += night->hours();
    return sum / static_cast<double>(nights.size());
}

double meanDebt(std::vector<DebtEntry>::const_iterator first, std::vector<DebtEntry>::const_iterator last) {
    double sum = 0.0;
    size_t count = 0;
    for (auto it = first; it != last; ++it, ++count) sum += it->debt;
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

std::vector<DebtEntry> lastEntries(const std::vector<DebtEntry>& history, size_t count) {
    const size_t start = history.size() > count ? history.size() - count : 0;
    return std::vector<DebtEntry>(history.begin() + static_cast<std::ptrdiff_t>(start), history.end());
}

long daysToFullRecovery(double debt, double sleepNeed) {
    const double perNight = sleepNeed * 0.1;
    if (perNight <= 0.0) return 0;
    return static_cast<long>(std::ceil(debt / perNight));
}
} // namespace

std::string toString(DebtSeverity severity) {
    switch (severity) {
        case DebtSeverity::NONE: return "none";
        case DebtSeverity::MILD: return "mild";
        case DebtSeverity::MODERATE: return "moderate";
        case DebtSeverity::SEVERE: return "severe";
        case DebtSeverity::CRITICAL: return "critical";
    }
    return "none";
}

std::string toString(DebtTrend trend) {
    switch (trend) {
        case DebtTrend::IMPROVING: return "improving";
        case DebtTrend::WORSENING: return "worsening";
        case DebtTrend::STABLE: return "stable";
    }
    return "stable";
}

SleepDebtAnalysis SleepDebtCalculator::analyzeSleepDebt(const std::vector<SleepRecord>& sleep,
                                                        const SleepDebtOptions& options) {
    const size_t required = std::max<size_t>(1, options.minimumDays);
    if (sleep.size() < required) {
        throw Circadia::InsufficientDataException("sleep-debt analysis needs more nights", required, sleep.size());
    }
    if (options.dailyDecay < 0.0 || options.dailyDecay >= 1.0) {
        throw Circadia::ConfigurationException("daily decay must be within [0,1)");
    }

    SleepDebtAnalysis analysis;
    const SleepNeedEstimate need = estimateSleepNeed(sleep);
    analysis.estimatedSleepNeed = need.hours;
    analysis.confidence = need.confidence;

    const std::vector<DebtEntry> history = calculateDebtHistory(sleep, need.hours, options.dailyDecay);
    analysis.currentDebt = history.empty() ? 0.0 : history.back().debt;
    analysis.severity = assessSeverity(analysis.currentDebt);
    analysis.trend = analyzeTrend(history);
    analysis.impact = calculateImpact(analysis.currentDebt);
    analysis.recovery = generateRecoveryPlan(analysis.currentDebt, need.hours, options);
    std::vector<double> nightlyHours;
    nightlyHours.reserve(sleep.size());
    for (const SleepRecord& night : sleep) nightlyHours.push_back(night.hours());
    analysis.durationStats = Statistics::calculateStats(nightlyHours);

    analysis.recommendations = generateRecommendations(analysis.currentDebt, analysis.severity, need.hours, history);
    analysis.insights = generateInsights(analysis.currentDebt, analysis.severity, history, need.hours, need.confidence,
                                         analysis.durationStats, options);
    analysis.debtHistory = options.historyWindow == 0 ? history : lastEntries(history, options.historyWindow);
    return analysis;
}

SleepNeedEstimate SleepDebtCalculator::estimateSleepNeed(const std::vector<SleepRecord>& sleep) {
    std::vector<const SleepRecord*> weekend;
    std::vector<const SleepRecord*> weekday;
    for (const SleepRecord& night : sleep) {
        if (!std::isfinite(night.totalSleepSeconds) || night.totalSleepSeconds < 0.0) {
            throw Circadia::ConfigurationException("sleep duration for " + night.day + " must be a non-negative number");
        }
        (SleepCalendar::isWeekend(night.day) ? weekend : weekday).push_back(&night);
    }

    SleepNeedEstimate estimate;
    if (weekend.size() < 4) {
        std::vector<const SleepRecord*> longNights;
        for (const SleepRecord& night : sleep) {
            if (night.hours() > 8.0) longNights.push_back(&night);
        }
        if (longNights.size() >= 3) {
            estimate.hours = CommonUtils::roundTo(averageHours(longNights), 1);
            estimate.confidence = 60.0;
        } else {
            estimate.hours = 8.0;
            estimate.confidence = 40.0;
        }
        return estimate;
    }

    const double weekendAvg = averageHours(weekend);
    const double weekdayAvg = weekday.empty() ? weekendAvg : averageHours(weekday);
    const double extension = weekendAvg - weekdayAvg;

    double hours = 0.0;
    if (extension < 0.5) {
        hours = weekdayAvg;
        estimate.confidence = 85.0;
    } else if (extension < 1.5) {
        hours = weekendAvg - extension * 0.3;
        estimate.confidence = 75.0;
    } else {
        // Large weekend rebound points at chronic debt; the true need sits above the weekday level.
        hours = weekdayAvg + 1.0;
        estimate.confidence = 60.0;
    }
    estimate.hours = CommonUtils::roundTo(hours, 1);
    return estimate;
}

std::vector<DebtEntry> SleepDebtCalculator::calculateDebtHistory(const std::vector<SleepRecord>& sleep,
                                                                 double sleepNeed,
                                                                 double dailyDecay) {
    std::vector<DebtEntry> history;
    history.reserve(sleep.size());
    double cumulative = 0.0;
    for (const SleepRecord& night : sleep) {
        const double deficit = sleepNeed - night.hours();
        cumulative = std::max(0.0, cumulative * (1.0 - dailyDecay) + deficit);
        history.push_back({night.day, CommonUtils::roundTo(cumulative, 2), CommonUtils::roundTo(deficit, 2)});
    }
    return history;
}

DebtSeverity SleepDebtCalculator::assessSeverity(double debt) {
    if (debt < 2.0) return DebtSeverity::NONE;
    if (debt < 5.0) return DebtSeverity::MILD;
    if (debt < 10.0) return DebtSeverity::MODERATE;
    if (debt < 15.0) return DebtSeverity::SEVERE;
    return DebtSeverity::CRITICAL;
}

DebtTrend SleepDebtCalculator::analyzeTrend(const std::vector<DebtEntry>& history) {
    if (history.size() < 8) return DebtTrend::STABLE;

    const auto recentBegin = history.end() - 7;
    const auto previousBegin = history.size() >= 14 ? history.end() - 14 : history.begin();
    const double change = meanDebt(recentBegin, history.end()) - meanDebt(previousBegin, recentBegin);

    if (std::abs(change) < 1.0) return DebtTrend::STABLE;
    return change < 0.0 ? DebtTrend::IMPROVING : DebtTrend::WORSENING;
}

DebtImpact SleepDebtCalculator::calculateImpact(double debt) {
    DebtImpact impact;
    impact.cognitiveImpairment = CommonUtils::roundTo(std::min(50.0, (debt / 2.0) * 10.0), 1);
    impact.equivalentBAC = CommonUtils::roundTo((debt / 2.0) * 0.02, 3);

    if (debt < 2.0) {
        impact.accidentRisk = 1.0;
        impact.description = "Minimal impairment. Normal cognitive and physical function.";
    } else if (debt < 5.0) {
        impact.accidentRisk = 1.5;
        impact.description = "Mild impairment. Slight decreases in attention, reaction time and mood. "
                             "Performance on complex tasks affected.";
    } else if (debt < 10.0) {
        impact.accidentRisk = 2.0;
        impact.description = "Moderate impairment. Significant deficits in attention, memory and executive function. "
                             "Equivalent to mild alcohol intoxication.";
    } else if (debt < 15.0) {
        impact.accidentRisk = 3.0;
        impact.description = "Severe impairment. Major cognitive deficits, emotional dysregulation and increased accident risk. "
                             "Equivalent to moderate alcohol intoxication.";
    } else {
        impact.accidentRisk = 4.0;
        impact.description = "Critical impairment. Profound cognitive dysfunction and microsleeps. "
                             "Operating a vehicle or machinery is dangerous.";
    }
    return impact;
}

RecoveryEstimate SleepDebtCalculator::generateRecoveryPlan(double debt,
                                                           double sleepNeed,
                                                           const SleepDebtOptions& options) {
    RecoveryEstimate plan;
    plan.hoursNeededTonight = CommonUtils::roundTo(std::min(options.maxUsefulExtraHours, debt * options.recoveryRate), 1);
    plan.daysToRecovery = daysToFullRecovery(debt, sleepNeed);

    const double perExtendedNight = options.maxUsefulExtraHours * options.recoveryRate;
    if (debt < 2.0) {
        plan.weekendRecoveryPlan = "No special recovery needed. Maintain your current schedule.";
    } else if (debt < 5.0) {
        plan.weekendRecoveryPlan = "Sleep " + CommonUtils::toFixed(sleepNeed + 1.0) +
                                   " hours Fri-Sat and Sat-Sun to recover " +
                                   CommonUtils::toFixed(perExtendedNight * 4.0) + "h of debt.";
    } else {
        plan.weekendRecoveryPlan = "Priority recovery: Sleep " + CommonUtils::toFixed(sleepNeed + 1.5) +
                                   " hours Fri-Sun. This weekend can recover ~" +
                                   CommonUtils::toFixed(perExtendedNight * 6.0) + "h. Full recovery requires " +
                                   std::to_string(plan.daysToRecovery) + " days of optimal sleep.";
    }
    return plan;
}

size_t SleepDebtCalculator::findConsecutiveDeficits(const std::vector<DebtEntry>& history) {
    size_t longest = 0;
    size_t streak = 0;
    for (const DebtEntry& entry : lastEntries(history, 14)) {
        if (entry.dailyDeficit > 0.5) {
            longest = std::max(longest, ++streak);
        } else {
            streak = 0;
        }
    }
    return longest;
}

std::string SleepDebtCalculator::formatRecommendedBedtime(double sleepNeed) {
    constexpr double kWakeHour = 7.0;
    const double bedtime = std::fmod(std::fmod(kWakeHour - sleepNeed, 24.0) + 24.0, 24.0);
    const int totalMinutes = static_cast<int>(std::lround(bedtime * 60.0)) % (24 * 60);
    const int h = totalMinutes / 60;
    const int m = totalMinutes % 60;
    const int displayHour = h > 12 ? h - 12 : (h == 0 ? 12 : h);
    return std::to_string(displayHour) + ":" + (m < 10 ? "0" : "") + std::to_string(m) + (h >= 12 ? " PM" : " AM");
}

SleepRecommendations SleepDebtCalculator::generateRecommendations(double debt,
                                                                  DebtSeverity severity,
                                                                  double sleepNeed,
                                                                  const std::vector<DebtEntry>& history) {
    SleepRecommendations rec;
    const std::string need = CommonUtils::toFixed(sleepNeed);

    switch (severity) {
        case DebtSeverity::SEVERE:
        case DebtSeverity::CRITICAL:
            rec.immediate.push_back("URGENT: Sleep " + CommonUtils::toFixed(sleepNeed + 2.0) +
                                    "+ hours tonight. Set bedtime " +
                                    std::to_string(static_cast<int>(std::ceil(sleepNeed + 2.0))) +
                                    " hours before wake time");
            rec.immediate.push_back("Cancel non-essential obligations today to prioritize sleep");
            rec.immediate.push_back("Avoid driving or operating machinery if possible");
            rec.immediate.push_back("No alcohol tonight (impairs recovery sleep quality)");
            break;
        case DebtSeverity::MODERATE:
            rec.immediate.push_back("Tonight: Target " + CommonUtils::toFixed(sleepNeed + 1.0) + "+ hours of sleep");
            rec.immediate.push_back("Minimize caffeine after 2 PM");
            rec.immediate.push_back("Dim lights and avoid screens 2 hours before bed");
            break;
        case DebtSeverity::MILD:
            rec.immediate.push_back("Aim for " + need + " hours of sleep tonight");
            rec.immediate.push_back("Consider an earlier bedtime tonight if possible");
            break;
        case DebtSeverity::NONE:
            rec.immediate.push_back("Maintain current schedule (" + need + " hours per night)");
            break;
    }

    rec.weekly.push_back("Establish a consistent sleep schedule: Bed by " + formatRecommendedBedtime(sleepNeed));
    rec.weekly.push_back("Protect weeknight sleep. Decline evening commitments if needed");
    if (debt > 3.0) {
        rec.weekly.push_back("Weekend recovery: Sleep 1-2 hours extra Friday and Saturday nights");
        rec.weekly.push_back("Get morning sunlight exposure to strengthen circadian rhythm");
    }
    rec.weekly.push_back("Track sleep daily to prevent debt accumulation");

    rec.longTerm.push_back("Identify and eliminate chronic sleep restrictors (work schedule, evening habits, environment)");
    rec.longTerm.push_back("Build a sleep buffer: Target " + need + " hours + 15 minutes to account for variability");
    const std::vector<DebtEntry> recent = lastEntries(history, 14);
    const auto heavyNights = std::count_if(recent.begin(), recent.end(), [](const DebtEntry& e) {
        return e.dailyDeficit > 1.0;
    });
    if (heavyNights > 7) {
        rec.longTerm.push_back("Chronic sleep restriction detected. Consider schedule restructuring or a sleep medicine consultation");
    }
    rec.longTerm.push_back("Develop an automated sleep hygiene routine");
    rec.longTerm.push_back("Optimize the bedroom: temperature, darkness and noise control");
    return rec;
}

std::vector<Insight> SleepDebtCalculator::generateInsights(double debt,
                                                           DebtSeverity severity,
                                                           const std::vector<DebtEntry>& history,
                                                           double sleepNeed,
                                                           double needConfidence,
                                                           const ColumnStats& durationStats,
                                                           const SleepDebtOptions& options) {
    std::vector<Insight> insights;
    const std::string severityName = toString(severity);

    Insight status;
    status.category = "sleep_debt";
    status.severity = severityName;
    status.confidence = needConfidence;
    status.finding = "Current sleep debt: " + CommonUtils::toFixed(debt) + " hours (" + severityName + " severity)";
    status.evidence = "Cumulative calculation over " + std::to_string(history.size()) +
                      " days of sleep data against an estimated need of " + CommonUtils::toFixed(sleepNeed) + "h/night";
    if (debt > 5.0) {
        status.recommendation = "Sleep debt above 5 hours significantly impairs cognitive function and metabolic health. "
                                "Prioritize recovery this week.";
    } else if (debt > 2.0) {
        status.recommendation = "Moderate sleep debt is recoverable with consistent optimal sleep this week.";
    } else {
        status.recommendation = "Minimal sleep debt. Focus on maintaining current sleep duration.";
    }
    status.metrics["debt_hours"] = debt;
    status.metrics["sleep_need_hours"] = sleepNeed;
    status.metrics["duration_mean_hours"] = durationStats.mean;
    status.metrics["duration_median_hours"] = durationStats.median;
    status.metrics["duration_stddev_hours"] = durationStats.stddev;
    insights.push_back(std::move(status));

    const size_t streak = findConsecutiveDeficits(history);
    if (streak >= 3) {
        Insight restriction;
        restriction.category = "sleep_debt";
        restriction.severity = severityName;
        restriction.confidence = needConfidence;
        restriction.finding = std::to_string(streak) + " consecutive days of sleep restriction detected";
        restriction.evidence = "Chronic restriction pattern in recent history";
        restriction.recommendation = "Consecutive deficits compound rapidly. Break the cycle tonight with an extended sleep opportunity.";
        restriction.metrics["consecutive_deficit_days"] = static_cast<double>(streak);
        insights.push_back(std::move(restriction));
    }

    std::vector<const DebtEntry*> weekends;
    for (const DebtEntry& entry : lastEntries(history, 30)) {
        if (SleepCalendar::isWeekend(entry.date)) weekends.push_back(&entry);
    }
    if (weekends.size() >= 4) {
        double deficitSum = 0.0;
        for (const DebtEntry* entry : weekends) deficitSum += entry->dailyDeficit;
        const double weekendDeficit = deficitSum / static_cast<double>(weekends.size());
        if (weekendDeficit > 0.5) {
            Insight weekend;
            weekend.category = "sleep_debt";
            weekend.severity = severityName;
            weekend.confidence = needConfidence;
            weekend.finding = "Weekend sleep restriction pattern";
            weekend.evidence = "Average " + CommonUtils::toFixed(weekendDeficit) + "h deficit even on weekends";
            weekend.recommendation = "Weekend restriction often means social obligations are interfering with recovery. "
                                     "Protect weekend morning sleep.";
            weekend.metrics["weekend_deficit_hours"] = weekendDeficit;
            insights.push_back(std::move(weekend));
        }
    }

    if (debt > 5.0) {
        const double recoverable = debt * options.recoveryRate;
        const long days = daysToFullRecovery(debt, sleepNeed);
        Insight capacity;
        capacity.category = "sleep_debt";
        capacity.severity = severityName;
        capacity.confidence = needConfidence;
        capacity.finding = "Optimal weekend can recover ~" + CommonUtils::toFixed(recoverable) + "h of debt";
        capacity.evidence = "Recovery sleep yields ~" + CommonUtils::toFixed(options.recoveryRate * 100.0, 0) +
                            "% debt reduction per extended night";
        capacity.recommendation = "Full recovery requires sustained optimal sleep, not just one weekend. Budget " +
                                  std::to_string(days) + " days for complete recovery.";
        capacity.metrics["recoverable_hours"] = recoverable;
        capacity.metrics["days_to_recovery"] = static_cast<double>(days);
        insights.push_back(std::move(capacity));
    }
    return insights;
}
