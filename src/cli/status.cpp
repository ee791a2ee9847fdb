#include "heartbeat/status.h"

namespace heartbeat {

namespace {

constexpr std::string_view kAnsiRed = "\033[31m";
constexpr std::string_view kAnsiYellow = "\033[33m";
constexpr std::string_view kAnsiReset = "\033[0m";

constexpr std::string_view kMotdTitle = "Heartbeats";
constexpr std::string_view kMotdRule = "==========";

} // namespace

std::string StatusReporter::highlight(const std::string& text, std::string_view ansi) const {
  if (!color_) {
    return text;
  }
  std::string out;
  out.reserve(text.size() + ansi.size() + kAnsiReset.size());
  out += ansi;
  out += text;
  out += kAnsiReset;
  return out;
}

std::string StatusReporter::status_line(const HeartbeatRecord& record, EpochSeconds now) const {
  std::string line = render_record(record, now);
  if (!record.last_ping || is_overdue(record, now)) {
    return highlight(line, kAnsiRed);
  }
  return line;
}

void StatusReporter::motd(const RecordStore& store, EpochSeconds now, std::ostream& out) const {
  if (store.empty()) {
    return;
  }

  out << highlight(std::string(kMotdTitle), kAnsiYellow) << "\n";
  out << highlight(std::string(kMotdRule), kAnsiYellow) << "\n\n";

  for (const auto& record : store.list()) {
    out << "* " << status_line(record, now) << "\n";
  }
}

void StatusReporter::list(const RecordStore& store, EpochSeconds now, std::ostream& out) const {
  for (const auto& record : store.list()) {
    out << record.code << ": " << status_line(record, now) << "\n";
  }
}

} // namespace heartbeat
