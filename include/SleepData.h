#pragma once

#include <optional>
#include <string>

// One night as delivered by the ring; day is the local calendar date "YYYY-MM-DD".
struct SleepRecord {
    std::string day;
    double totalSleepSeconds = 0.0;
    std::optional<double> bedtimeStartHour;
    std::optional<double> bedtimeEndHour;

    double hours() const noexcept { return totalSleepSeconds / 3600.0; }
};

struct ReadinessRecord {
    std::string day;
    double score = 0.0;
};

namespace SleepCalendar {
/**
 * @brief Day of week of a "YYYY-MM-DD" date (anything after the tenth character is ignored).
 * @return 0 for Sunday through 6 for Saturday.
 * @throws Circadia::ConfigurationException on a malformed or impossible date.
 */
int dayOfWeek(const std::string& day);
bool isWeekend(const std::string& day);
}
