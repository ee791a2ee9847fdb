#include "heartbeat/record_store.h"

#include "heartbeat/duration.h"

#include <algorithm>

namespace heartbeat {

namespace {

Result<void> not_found(std::string_view code) {
  return Result<void>::error(ErrorCode::NotFound,
                             "no heartbeat with code '" + std::string(code) + "'");
}

} // namespace

Result<void> RecordStore::add(const HeartbeatSpec& spec) {
  if (auto valid = spec.validate(); !valid) {
    return valid;
  }
  if (find(spec.code) != nullptr) {
    return Result<void>::error(ErrorCode::DuplicateCode,
                               "heartbeat '" + spec.code + "' already exists");
  }

  HeartbeatRecord record;
  record.code = spec.code;
  record.last_message_template = spec.last_message_template;
  record.never_message = spec.never_message;
  record.leniency_seconds = spec.leniency_seconds;
  records_.push_back(std::move(record));
  dirty_ = true;
  return Result<void>::success();
}

Result<void> RecordStore::remove(std::string_view code) {
  auto it = std::find_if(records_.begin(), records_.end(),
                         [code](const HeartbeatRecord& r) { return r.code == code; });
  if (it == records_.end()) {
    return not_found(code);
  }
  records_.erase(it);
  dirty_ = true;
  return Result<void>::success();
}

Result<void> RecordStore::ping(std::string_view code, EpochSeconds now) {
  HeartbeatRecord* record = find_mutable(code);
  if (record == nullptr) {
    return not_found(code);
  }
  record->last_ping = now;
  dirty_ = true;
  return Result<void>::success();
}

Result<std::string> RecordStore::render(std::string_view code, EpochSeconds now) const {
  const HeartbeatRecord* record = find(code);
  if (record == nullptr) {
    return Result<std::string>::error(not_found(code).error());
  }
  return Result<std::string>::ok(render_record(*record, now));
}

const HeartbeatRecord* RecordStore::find(std::string_view code) const {
  for (const auto& record : records_) {
    if (record.code == code) {
      return &record;
    }
  }
  return nullptr;
}

HeartbeatRecord* RecordStore::find_mutable(std::string_view code) {
  for (auto& record : records_) {
    if (record.code == code) {
      return &record;
    }
  }
  return nullptr;
}

Result<void> RecordStore::insert_loaded(HeartbeatRecord record) {
  if (auto r = validate_code(record.code); !r) {
    return r;
  }
  if (auto r = validate_template(record.code, record.last_message_template); !r) {
    return r;
  }
  if (find(record.code) != nullptr) {
    return Result<void>::error(ErrorCode::MalformedRecord,
                               "heartbeat '" + record.code + "' appears twice");
  }
  records_.push_back(std::move(record));
  return Result<void>::success();
}

uint64_t elapsed_seconds(const HeartbeatRecord& record, EpochSeconds now) {
  if (!record.last_ping || now <= *record.last_ping) {
    return 0;
  }
  // Unsigned subtraction: the gap between any two int64 values fits in uint64.
  return static_cast<uint64_t>(now) - static_cast<uint64_t>(*record.last_ping);
}

std::string render_record(const HeartbeatRecord& record, EpochSeconds now) {
  if (!record.last_ping) {
    return record.never_message;
  }

  std::string line = record.last_message_template;
  size_t pos = line.find(kDurationPlaceholder);
  if (pos != std::string::npos) {
    line.replace(pos, kDurationPlaceholder.size(), humanize(elapsed_seconds(record, now)));
  }
  return line;
}

bool is_overdue(const HeartbeatRecord& record, EpochSeconds now) {
  if (record.leniency_seconds == 0 || !record.last_ping) {
    return false;
  }
  return elapsed_seconds(record, now) > record.leniency_seconds;
}

} // namespace heartbeat
