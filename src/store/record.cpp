#include "heartbeat/record.h"

#include <algorithm>
#include <cctype>

namespace heartbeat {

size_t count_placeholders(std::string_view message_template) {
  size_t count = 0;
  size_t pos = message_template.find(kDurationPlaceholder);
  while (pos != std::string_view::npos) {
    ++count;
    pos = message_template.find(kDurationPlaceholder, pos + kDurationPlaceholder.size());
  }
  return count;
}

Result<void> validate_code(std::string_view code) {
  if (code.empty()) {
    return Result<void>::error(ErrorCode::MalformedRecord, "heartbeat code is empty");
  }
  bool has_space = std::any_of(code.begin(), code.end(),
                               [](unsigned char ch) { return std::isspace(ch); });
  if (has_space) {
    return Result<void>::error(ErrorCode::MalformedRecord,
                               "heartbeat code '" + std::string(code) + "' contains whitespace");
  }
  return Result<void>::success();
}

Result<void> validate_template(std::string_view code, std::string_view message_template) {
  size_t count = count_placeholders(message_template);
  if (count != 1) {
    return Result<void>::error(
        ErrorCode::MalformedRecord,
        "last line of '" + std::string(code) + "' must contain exactly one " +
            std::string(kDurationPlaceholder) + " placeholder, found " + std::to_string(count));
  }
  return Result<void>::success();
}

Result<void> HeartbeatSpec::validate() const {
  if (auto r = validate_code(code); !r) {
    return r;
  }
  return validate_template(code, last_message_template);
}

} // namespace heartbeat
