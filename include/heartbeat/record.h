#pragma once

#include "heartbeat/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace heartbeat {

using EpochSeconds = int64_t;

// Placeholder replaced by the humanized elapsed time in last_message_template.
constexpr std::string_view kDurationPlaceholder = "%s";

struct HeartbeatRecord {
  std::string code;
  std::string last_message_template;
  std::string never_message;
  uint64_t leniency_seconds = 0;
  std::optional<EpochSeconds> last_ping;

  bool operator==(const HeartbeatRecord& other) const = default;
};

// Input of RecordStore::add, built by the CLI from prompts or arguments.
struct HeartbeatSpec {
  std::string code;
  std::string last_message_template;
  std::string never_message;
  uint64_t leniency_seconds = 0;

  [[nodiscard]] Result<void> validate() const;
};

size_t count_placeholders(std::string_view message_template);
Result<void> validate_code(std::string_view code);
Result<void> validate_template(std::string_view code, std::string_view message_template);

} // namespace heartbeat
