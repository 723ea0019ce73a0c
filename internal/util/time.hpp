#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pmm::util {

/*
  Time utilities for date-valued tags.

  Timestamps are naive civil times: they are formatted and parsed as UTC
  and carry no zone information, matching the sidecar text form.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Builds a timestamp from civil UTC fields. Throws std::invalid_argument on
// out-of-range fields.
TimePoint MakeTimePoint(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

// strftime-style formatting; sub-second precision is dropped.
std::string FormatTimePoint(TimePoint tp, const std::string& format);

// strptime-style parsing. Returns nullopt unless the whole text matches and
// formatting the result with the same format gives the text back.
std::optional<TimePoint> ParseTimePoint(const std::string& text, const std::string& format);

} // namespace pmm::util
