#include <iostream>
#include <string>
#include <unistd.h>

#include "heartbeat/commands.h"
#include "heartbeat/config.h"
#include "heartbeat/logger.h"
#include "heartbeat/result.h"
#include "heartbeat/store_file.h"

namespace {

int fail(heartbeat::Logger& logger, const heartbeat::Error& error) {
    logger.debug("exiting with " + std::string(heartbeat::error_code_name(error.code)));
    std::cerr << "Error: " << error.message << "\n";
    return static_cast<int>(error.code);
}

bool use_color(heartbeat::ColorMode mode) {
    switch (mode) {
        case heartbeat::ColorMode::Always: return true;
        case heartbeat::ColorMode::Never: return false;
        case heartbeat::ColorMode::Auto: break;
    }
    return ::isatty(STDOUT_FILENO) == 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config_result = heartbeat::ConfigParser::parse(argc, argv);
    if (!config_result) {
        std::cerr << "Error: " << config_result.error().message << "\n";
        return static_cast<int>(config_result.error().code);
    }

    auto& config = config_result.value();

    if (config.show_version) {
        std::cout << "heartbeat " << heartbeat::ConfigParser::version() << "\n";
        return 0;
    }

    if (config.show_help || config.command == heartbeat::Command::Help) {
        std::cout << heartbeat::ConfigParser::usage();
        return 0;
    }

    heartbeat::Logger logger;
    if (auto level = heartbeat::parse_log_level(config.log_level)) {
        logger.set_level(level.value());
    }

    heartbeat::StoreFile file{std::string(config.store_path)};
    auto loaded = file.load();
    if (!loaded) {
        logger.error("failed to load " + file.path());
        return fail(logger, loaded.error());
    }

    auto& store = loaded.value();
    logger.debug("loaded " + std::to_string(store.size()) + " heartbeats from " + file.path());

    heartbeat::CommandRunner runner(logger, use_color(config.color));
    auto ran = runner.run(config, store, heartbeat::current_epoch_seconds(), std::cin, std::cout);
    if (!ran) {
        return fail(logger, ran.error());
    }

    if (store.dirty()) {
        auto saved = file.save(store);
        if (!saved) {
            logger.error("changes were not saved to " + file.path());
            return fail(logger, saved.error());
        }
        store.mark_clean();
        logger.info("saved " + std::to_string(store.size()) + " heartbeats to " + file.path());
    }

    return 0;
}
