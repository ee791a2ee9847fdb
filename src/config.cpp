#include "heartbeat/config.h"

#include <cstdlib>
#include <string>
#include <string_view>

namespace heartbeat {

namespace {

constexpr std::string_view kVersion = "0.1.0";

constexpr std::string_view kUsage =
    "Usage: heartbeat [OPTIONS] COMMAND\n"
    "Commands:\n"
    "  --motd             Show the heartbeat summary\n"
    "  --list             List every heartbeat with its status\n"
    "  --add              Add a heartbeat (prompts for its fields)\n"
    "  --remove <code>    Remove a heartbeat\n"
    "  --ping <code>      Record that a heartbeat happened now\n"
    "Options:\n"
    "  --store <path>     Store file (default $HEARTBEAT_STORE or /opt/heartbeats)\n"
    "  --log-level <level>  Log level (debug, info, warn, error)\n"
    "  --color, --no-color  Force or disable highlighting\n"
    "  --version, -v      Show version\n"
    "  --help, -h         Show this help\n";

Result<Config> invalid(std::string msg) {
  return Result<Config>::error(ErrorCode::InvalidArgument, std::move(msg));
}

} // namespace

Result<Config> ConfigParser::parse(int argc, char* argv[]) {
  Config config;
  bool have_command = false;

  if (const char* env_store = std::getenv(kStorePathEnv)) {
    if (*env_store != '\0') {
      config.store_path = env_store;
    }
  }

  auto set_command = [&](Command command) {
    if (have_command && config.command != command) {
      return false;
    }
    config.command = command;
    have_command = true;
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      config.show_version = true;
    } else if (arg == "--motd") {
      if (!set_command(Command::Motd)) {
        return invalid("Only one command may be given");
      }
    } else if (arg == "--list") {
      if (!set_command(Command::List)) {
        return invalid("Only one command may be given");
      }
    } else if (arg == "--add") {
      if (!set_command(Command::Add)) {
        return invalid("Only one command may be given");
      }
    } else if (arg == "--remove" || arg == "--ping") {
      if (i + 1 >= argc) {
        return invalid("Missing code after " + std::string(arg));
      }
      if (!set_command(arg == "--remove" ? Command::Remove : Command::Ping)) {
        return invalid("Only one command may be given");
      }
      config.code = argv[++i];
    } else if (arg == "--store") {
      if (i + 1 >= argc) {
        return invalid("Missing path after --store");
      }
      config.store_path = argv[++i];
    } else if (arg == "--log-level") {
      if (i + 1 >= argc) {
        return invalid("Missing level after --log-level");
      }
      config.log_level = argv[++i];
      if (!parse_log_level(config.log_level)) {
        return invalid("Unknown log level: " + std::string(config.log_level));
      }
    } else if (arg == "--color") {
      config.color = ColorMode::Always;
    } else if (arg == "--no-color") {
      config.color = ColorMode::Never;
    } else {
      return invalid("Unknown argument: " + std::string(arg));
    }
  }

  return Result<Config>::ok(config);
}

std::string_view ConfigParser::version() {
  return kVersion;
}

std::string_view ConfigParser::usage() {
  return kUsage;
}

Result<LogLevel> parse_log_level(std::string_view name) {
  if (name == "debug") {
    return Result<LogLevel>::ok(LogLevel::Debug);
  } else if (name == "info") {
    return Result<LogLevel>::ok(LogLevel::Info);
  } else if (name == "warn") {
    return Result<LogLevel>::ok(LogLevel::Warn);
  } else if (name == "error") {
    return Result<LogLevel>::ok(LogLevel::Error);
  }
  return Result<LogLevel>::error(ErrorCode::InvalidArgument,
                                 "Unknown log level: " + std::string(name));
}

} // namespace heartbeat
