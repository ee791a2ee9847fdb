#pragma once

#include "heartbeat/record.h"
#include "heartbeat/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace heartbeat {

// Ordered set of heartbeat records keyed by code. Owned by the caller for the
// length of one invocation; every mutation marks the store dirty.
class RecordStore {
public:
  RecordStore() = default;

  Result<void> add(const HeartbeatSpec& spec);
  Result<void> remove(std::string_view code);
  Result<void> ping(std::string_view code, EpochSeconds now);

  [[nodiscard]] const std::vector<HeartbeatRecord>& list() const { return records_; }
  [[nodiscard]] Result<std::string> render(std::string_view code, EpochSeconds now) const;

  [[nodiscard]] const HeartbeatRecord* find(std::string_view code) const;

  // Used by the store file loader. Rejects duplicates and invalid records.
  Result<void> insert_loaded(HeartbeatRecord record);

  [[nodiscard]] bool dirty() const { return dirty_; }
  void mark_clean() { dirty_ = false; }

  [[nodiscard]] size_t size() const { return records_.size(); }
  [[nodiscard]] bool empty() const { return records_.empty(); }

  bool operator==(const RecordStore& other) const { return records_ == other.records_; }

private:
  HeartbeatRecord* find_mutable(std::string_view code);

  std::vector<HeartbeatRecord> records_;
  bool dirty_ = false;
};

uint64_t elapsed_seconds(const HeartbeatRecord& record, EpochSeconds now);
std::string render_record(const HeartbeatRecord& record, EpochSeconds now);

// Advisory only: true when a leniency is configured and the last ping is older.
bool is_overdue(const HeartbeatRecord& record, EpochSeconds now);

} // namespace heartbeat
