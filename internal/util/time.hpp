#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roster::util {

/*
  Time utilities, single place to control clock source later.

  Event dates are civil dates in the server's local time zone and travel
  as ISO "YYYY-MM-DD" strings.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

std::chrono::year_month_day LocalDate(TimePoint tp);

// "monday".."sunday", case-insensitive. Empty yields nullopt.
std::optional<std::chrono::weekday> ParseWeekday(std::string_view name);

// Strictly after today: if today is already `day`, one week ahead.
std::chrono::year_month_day NextWeekdayDate(std::chrono::year_month_day today, std::chrono::weekday day);

std::string FormatIsoDate(std::chrono::year_month_day date);

std::optional<std::chrono::year_month_day> ParseIsoDate(std::string_view text);

inline bool IsIsoDate(std::string_view text) {
  return ParseIsoDate(text).has_value();
}

} // namespace roster::util
