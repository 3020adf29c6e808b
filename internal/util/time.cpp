#include "time.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace roster::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::year_month_day LocalDate(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);
  return std::chrono::year{local.tm_year + 1900} / std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)} /
         std::chrono::day{static_cast<unsigned>(local.tm_mday)};
}

std::optional<std::chrono::weekday> ParseWeekday(std::string_view name) {
  static constexpr std::array<std::string_view, 7> kNames = {"sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

  std::string lower;
  lower.reserve(name.size());
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  for (unsigned i = 0; i < kNames.size(); ++i) {
    if (kNames[i] == lower) return std::chrono::weekday{i};
  }
  return std::nullopt;
}

std::chrono::year_month_day NextWeekdayDate(std::chrono::year_month_day today, std::chrono::weekday day) {
  const std::chrono::sys_days base{today};
  auto                        ahead = day - std::chrono::weekday{base};
  if (ahead == std::chrono::days{0}) ahead = std::chrono::days{7};
  return std::chrono::year_month_day{base + ahead};
}

std::string FormatIsoDate(std::chrono::year_month_day date) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day());
  return out.str();
}

std::optional<std::chrono::year_month_day> ParseIsoDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

  auto field = [&](std::size_t pos, std::size_t len) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, value);
    if (ec != std::errc{} || ptr != text.data() + pos + len) return std::nullopt;
    return value;
  };

  auto y = field(0, 4);
  auto m = field(5, 2);
  auto d = field(8, 2);
  if (!y || !m || !d) return std::nullopt;

  std::chrono::year_month_day date{std::chrono::year{*y}, std::chrono::month{static_cast<unsigned>(*m)}, std::chrono::day{static_cast<unsigned>(*d)}};
  if (!date.ok()) return std::nullopt;
  return date;
}

} // namespace roster::util
