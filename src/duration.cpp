#include "heartbeat/duration.h"

#include <string_view>
#include <vector>

namespace heartbeat {

namespace {

std::string format_count(uint64_t count, std::string_view single, std::string_view plural) {
  std::string out = std::to_string(count);
  out += ' ';
  out += count == 1 ? single : plural;
  return out;
}

} // namespace

DurationParts split_duration(uint64_t total_seconds) {
  DurationParts parts;
  parts.days = total_seconds / kSecondsPerDay;
  uint64_t remainder = total_seconds % kSecondsPerDay;
  parts.hours = remainder / kSecondsPerHour;
  remainder %= kSecondsPerHour;
  parts.minutes = remainder / kSecondsPerMinute;
  parts.seconds = remainder % kSecondsPerMinute;
  return parts;
}

std::string humanize(uint64_t total_seconds) {
  const DurationParts d = split_duration(total_seconds);

  std::vector<std::string> parts;
  if (d.days > 0) parts.push_back(format_count(d.days, "day", "days"));
  if (d.hours > 0) parts.push_back(format_count(d.hours, "hour", "hours"));
  if (d.minutes > 0) parts.push_back(format_count(d.minutes, "minute", "minutes"));
  if (d.seconds > 0) parts.push_back(format_count(d.seconds, "second", "seconds"));

  if (parts.empty()) {
    return format_count(0, "second", "seconds");
  }

  std::string out = parts.front();
  for (size_t i = 1; i < parts.size(); ++i) {
    out += (i + 1 == parts.size()) ? " and " : ", ";
    out += parts[i];
  }
  return out;
}

} // namespace heartbeat
