#pragma once

#include "heartbeat/logger.h"
#include "heartbeat/result.h"

#include <cstdint>
#include <string_view>

namespace heartbeat {

constexpr std::string_view kDefaultStorePath = "/opt/heartbeats";
constexpr const char* kStorePathEnv = "HEARTBEAT_STORE";

enum class Command : uint8_t {
  Help = 0,
  Motd,
  List,
  Add,
  Remove,
  Ping,
};

enum class ColorMode : uint8_t {
  Auto = 0,
  Always,
  Never,
};

struct Config {
  Command command = Command::Help;
  std::string_view code;  // --remove / --ping argument
  std::string_view store_path = kDefaultStorePath;
  std::string_view log_level = "warn";
  ColorMode color = ColorMode::Auto;
  bool show_version = false;
  bool show_help = false;
};

struct ConfigParser {
  static Result<Config> parse(int argc, char* argv[]);
  static std::string_view version();
  static std::string_view usage();
};

Result<LogLevel> parse_log_level(std::string_view name);

} // namespace heartbeat
