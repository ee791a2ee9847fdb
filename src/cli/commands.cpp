#include "heartbeat/commands.h"

#include <charconv>
#include <chrono>
#include <string>

namespace heartbeat {

namespace {

std::string_view trim(std::string_view s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

Result<std::string> ask(std::istream& in, std::ostream& out, std::string_view question) {
  out << question << std::flush;
  std::string answer;
  if (!std::getline(in, answer)) {
    return Result<std::string>::error(ErrorCode::InvalidArgument,
                                      "Input ended before '" +
                                          std::string(trim(question)) + "' was answered");
  }
  if (!answer.empty() && answer.back() == '\r') {
    answer.pop_back();
  }
  return Result<std::string>::ok(std::move(answer));
}

Result<uint64_t> parse_leniency(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return Result<uint64_t>::ok(0);
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return Result<uint64_t>::error(ErrorCode::MalformedRecord,
                                   "Leniency must be a non-negative number of seconds, got '" +
                                       std::string(text) + "'");
  }
  return Result<uint64_t>::ok(value);
}

} // namespace

EpochSeconds current_epoch_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

CommandRunner::CommandRunner(Logger& logger, bool color) : logger_(logger), reporter_(color) {}

Result<HeartbeatSpec> CommandRunner::prompt_spec(std::istream& in, std::ostream& out) {
  HeartbeatSpec spec;

  auto code = ask(in, out, "Code: ");
  if (!code) {
    return Result<HeartbeatSpec>::error(code.error());
  }
  spec.code = std::string(trim(code.value()));

  auto last_line = ask(in, out, "Last line: ");
  if (!last_line) {
    return Result<HeartbeatSpec>::error(last_line.error());
  }
  spec.last_message_template = last_line.value();

  auto never_line = ask(in, out, "Never line: ");
  if (!never_line) {
    return Result<HeartbeatSpec>::error(never_line.error());
  }
  spec.never_message = never_line.value();

  auto leniency_text = ask(in, out, "Leniency (seconds): ");
  if (!leniency_text) {
    return Result<HeartbeatSpec>::error(leniency_text.error());
  }
  auto leniency = parse_leniency(leniency_text.value());
  if (!leniency) {
    return Result<HeartbeatSpec>::error(leniency.error());
  }
  spec.leniency_seconds = leniency.value();

  if (auto valid = spec.validate(); !valid) {
    return Result<HeartbeatSpec>::error(valid.error());
  }
  return Result<HeartbeatSpec>::ok(std::move(spec));
}

Result<void> CommandRunner::run(const Config& config, RecordStore& store, EpochSeconds now,
                                std::istream& in, std::ostream& out) {
  switch (config.command) {
    case Command::Help:
      break;

    case Command::Motd:
      reporter_.motd(store, now, out);
      return Result<void>::success();

    case Command::List:
      reporter_.list(store, now, out);
      return Result<void>::success();

    case Command::Add: {
      auto spec = prompt_spec(in, out);
      if (!spec) {
        return Result<void>::error(spec.error());
      }
      auto added = store.add(spec.value());
      if (added) {
        logger_.info("added heartbeat " + spec.value().code);
      }
      return added;
    }

    case Command::Remove: {
      auto removed = store.remove(config.code);
      if (removed) {
        logger_.info("removed heartbeat " + std::string(config.code));
      }
      return removed;
    }

    case Command::Ping: {
      auto pinged = store.ping(config.code, now);
      if (pinged) {
        logger_.info("pinged heartbeat " + std::string(config.code));
      }
      return pinged;
    }
  }

  return Result<void>::error(ErrorCode::InvalidArgument, "No command given");
}

} // namespace heartbeat
