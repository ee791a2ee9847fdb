#pragma once

#include "heartbeat/record_store.h"
#include "heartbeat/result.h"

#include <string>

namespace heartbeat {

constexpr int kStoreFormatVersion = 1;

class StoreFile {
public:
  explicit StoreFile(std::string path);

  // Missing or empty file loads as an empty store.
  Result<RecordStore> load() const;

  // Save atomically: temp file, fsync, rename over the target.
  Result<void> save(const RecordStore& store) const;

  [[nodiscard]] const std::string& path() const { return path_; }

  static std::string serialize(const RecordStore& store);
  static Result<RecordStore> deserialize(const std::string& content);

private:
  std::string path_;
};

} // namespace heartbeat
