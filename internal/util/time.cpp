#include "time.hpp"

#include <ctime>
#include <stdexcept>

namespace pmm::util {

TimePoint MakeTimePoint(int year, int month, int day, int hour, int minute, int second) {
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
    throw std::invalid_argument("civil time field out of range");
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;
  return Clock::from_time_t(timegm(&tm));
}

std::string FormatTimePoint(TimePoint tp, const std::string& format) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  std::time_t t       = Clock::to_time_t(seconds);

  std::tm tm{};
  gmtime_r(&t, &tm);

  // strftime reports 0 both for "buffer too small" and for an empty result.
  std::string buffer(64 + format.size() * 4, '\0');
  const auto  written = std::strftime(buffer.data(), buffer.size(), format.c_str(), &tm);
  buffer.resize(written);
  return buffer;
}

std::optional<TimePoint> ParseTimePoint(const std::string& text, const std::string& format) {
  if (text.empty()) {
    return std::nullopt;
  }

  // Fields the format does not mention keep these values (day 1 of January 1900).
  std::tm tm{};
  tm.tm_mday = 1;

  const char* end = strptime(text.c_str(), format.c_str(), &tm);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  const auto parsed = Clock::from_time_t(timegm(&tm));

  // strptime accepts out-of-range dates such as Feb 31 and timegm rolls them
  // over; only a value that formats back to the same text is a real match.
  if (FormatTimePoint(parsed, format) != text) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace pmm::util
