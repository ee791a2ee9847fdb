#pragma once

#include "heartbeat/record_store.h"

#include <ostream>
#include <string>
#include <string_view>

namespace heartbeat {

// Renders the MOTD block and the list view. Highlighting uses ANSI escapes
// and is only emitted when enabled.
class StatusReporter {
public:
  explicit StatusReporter(bool color) : color_(color) {}

  void motd(const RecordStore& store, EpochSeconds now, std::ostream& out) const;
  void list(const RecordStore& store, EpochSeconds now, std::ostream& out) const;

  [[nodiscard]] bool color() const { return color_; }

private:
  std::string highlight(const std::string& text, std::string_view ansi) const;
  std::string status_line(const HeartbeatRecord& record, EpochSeconds now) const;

  bool color_;
};

} // namespace heartbeat
