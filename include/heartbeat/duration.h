#pragma once

#include <cstdint>
#include <string>

namespace heartbeat {

constexpr uint64_t kSecondsPerMinute = 60;
constexpr uint64_t kSecondsPerHour = 60 * kSecondsPerMinute;
constexpr uint64_t kSecondsPerDay = 24 * kSecondsPerHour;

struct DurationParts {
  uint64_t days = 0;
  uint64_t hours = 0;
  uint64_t minutes = 0;
  uint64_t seconds = 0;
};

DurationParts split_duration(uint64_t total_seconds);

// "1 day, 2 hours, 3 minutes and 4 seconds". Zero units are skipped; an
// all-zero duration renders as "0 seconds".
std::string humanize(uint64_t total_seconds);

} // namespace heartbeat
