#pragma once

#include "heartbeat/config.h"
#include "heartbeat/logger.h"
#include "heartbeat/record_store.h"
#include "heartbeat/result.h"
#include "heartbeat/status.h"

#include <istream>
#include <ostream>

namespace heartbeat {

EpochSeconds current_epoch_seconds();

class CommandRunner {
public:
  CommandRunner(Logger& logger, bool color);

  // Runs the command named by config against store. The caller saves the
  // store afterwards if store.dirty(). Help is printed by the caller.
  Result<void> run(const Config& config, RecordStore& store, EpochSeconds now,
                   std::istream& in, std::ostream& out);

  // Interactive --add: asks for the four fields on out, reads answers from in.
  static Result<HeartbeatSpec> prompt_spec(std::istream& in, std::ostream& out);

private:
  Logger& logger_;
  StatusReporter reporter_;
};

} // namespace heartbeat
