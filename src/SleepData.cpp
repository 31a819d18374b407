#include "SleepData.h"
#include "CircadiaExceptions.h"

#include <array>
#include <cctype>

namespace {
int digitsAt(const std::string& s, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return -1;
        value = value * 10 + (s[i] - '0');
    }
    return value;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}
} // namespace

namespace SleepCalendar {

int dayOfWeek(const std::string& day) {
    if (day.size() < 10 || day[4] != '-' || day[7] != '-') {
        throw Circadia::ConfigurationException("expected a YYYY-MM-DD date, got '" + day + "'");
    }
    const int year = digitsAt(day, 0, 4);
    const int month = digitsAt(day, 5, 2);
    const int dom = digitsAt(day, 8, 2);
    static constexpr std::array<int, 12> kDaysInMonth = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || dom < 1) {
        throw Circadia::ConfigurationException("invalid calendar date '" + day + "'");
    }
    const int monthLength = kDaysInMonth[static_cast<size_t>(month - 1)] + ((month == 2 && isLeapYear(year)) ? 1 : 0);
    if (dom > monthLength) {
        throw Circadia::ConfigurationException("invalid calendar date '" + day + "'");
    }

    // Sakamoto's method.
    static constexpr std::array<int, 12> kOffsets = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    const int y = (month < 3) ? year - 1 : year;
    return (y + y / 4 - y / 100 + y / 400 + kOffsets[static_cast<size_t>(month - 1)] + dom) % 7;
}

bool isWeekend(const std::string& day) {
    const int dow = dayOfWeek(day);
    return dow == 0 || dow == 6;
}

} // namespace SleepCalendar
