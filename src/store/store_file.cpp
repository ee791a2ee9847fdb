#include "heartbeat/store_file.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <unistd.h>

namespace heartbeat {

namespace {

using json = nlohmann::ordered_json;

constexpr const char* kHeartbeatsKey = "heartbeats";
constexpr const char* kVersionKey = "version";
constexpr const char* kLastLineKey = "last_line";
constexpr const char* kNeverLineKey = "never_line";
constexpr const char* kLeniencyKey = "leniency";
constexpr const char* kLastBeatKey = "last_beat";

Result<RecordStore> malformed(const std::string& msg) {
    return Result<RecordStore>::error(ErrorCode::MalformedRecord, msg);
}

Result<void> persistence(const std::string& what, const std::string& path) {
    return Result<void>::error(ErrorCode::Persistence, what + " " + path);
}

// Only valid right after a failed POSIX call.
Result<void> persistence_errno(const std::string& what, const std::string& path) {
    return Result<void>::error(ErrorCode::Persistence,
                               what + " " + path + ": " + std::strerror(errno));
}

Result<void> write_store(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return persistence("cannot open for writing", path);
    }
    file << content;
    file.flush();
    if (!file) {
        return persistence("cannot write", path);
    }
    return Result<void>::success();
}

void sync_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

} // namespace

StoreFile::StoreFile(std::string path) : path_(std::move(path)) {}

std::string StoreFile::serialize(const RecordStore& store) {
    json heartbeats = json::object();
    for (const auto& record : store.list()) {
        json entry = json::object();
        entry[kLastLineKey] = record.last_message_template;
        entry[kNeverLineKey] = record.never_message;
        entry[kLeniencyKey] = record.leniency_seconds;
        if (record.last_ping) {
            entry[kLastBeatKey] = *record.last_ping;
        } else {
            entry[kLastBeatKey] = nullptr;
        }
        heartbeats[record.code] = std::move(entry);
    }

    json doc = json::object();
    doc[kVersionKey] = kStoreFormatVersion;
    doc[kHeartbeatsKey] = std::move(heartbeats);
    return doc.dump(2) + "\n";
}

Result<RecordStore> StoreFile::deserialize(const std::string& content) {
    json doc = json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
        return malformed("store file is not valid JSON");
    }
    if (!doc.is_object()) {
        return malformed("store file must contain a JSON object");
    }

    if (doc.contains(kVersionKey)) {
        const auto& version = doc[kVersionKey];
        if (!version.is_number_integer() || version.get<int>() != kStoreFormatVersion) {
            return malformed("unsupported store format version");
        }
    }

    RecordStore store;
    if (!doc.contains(kHeartbeatsKey)) {
        return Result<RecordStore>::ok(std::move(store));
    }

    const auto& heartbeats = doc[kHeartbeatsKey];
    if (!heartbeats.is_object()) {
        return malformed("'heartbeats' must be an object keyed by code");
    }

    for (const auto& item : heartbeats.items()) {
        const std::string& code = item.key();
        const auto& entry = item.value();
        if (!entry.is_object()) {
            return malformed("heartbeat '" + code + "' is not an object");
        }

        HeartbeatRecord record;
        record.code = code;

        auto last_line = entry.find(kLastLineKey);
        if (last_line == entry.end() || !last_line->is_string()) {
            return malformed("heartbeat '" + code + "' is missing string field 'last_line'");
        }
        record.last_message_template = last_line->get<std::string>();

        auto never_line = entry.find(kNeverLineKey);
        if (never_line == entry.end() || !never_line->is_string()) {
            return malformed("heartbeat '" + code + "' is missing string field 'never_line'");
        }
        record.never_message = never_line->get<std::string>();

        auto leniency = entry.find(kLeniencyKey);
        if (leniency == entry.end() || !leniency->is_number_unsigned()) {
            return malformed("heartbeat '" + code +
                             "' is missing non-negative integer field 'leniency'");
        }
        record.leniency_seconds = leniency->get<uint64_t>();

        auto last_beat = entry.find(kLastBeatKey);
        if (last_beat != entry.end() && !last_beat->is_null()) {
            if (!last_beat->is_number_integer()) {
                return malformed("heartbeat '" + code + "' has non-integer 'last_beat'");
            }
            if (last_beat->is_number_unsigned() &&
                last_beat->get<uint64_t>() >
                    static_cast<uint64_t>(std::numeric_limits<EpochSeconds>::max())) {
                return malformed("heartbeat '" + code + "' has out of range 'last_beat'");
            }
            record.last_ping = last_beat->get<EpochSeconds>();
        }

        if (auto r = store.insert_loaded(std::move(record)); !r) {
            return Result<RecordStore>::error(r.error());
        }
    }

    return Result<RecordStore>::ok(std::move(store));
}

Result<RecordStore> StoreFile::load() const {
    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return Result<RecordStore>::ok(RecordStore{});
    }
    if (ec) {
        return Result<RecordStore>::error(ErrorCode::Persistence,
                                          "cannot access " + path_ + ": " + ec.message());
    }
    if (std::filesystem::is_directory(status)) {
        return Result<RecordStore>::error(ErrorCode::Persistence, path_ + " is a directory");
    }

    std::ifstream file(path_);
    if (!file) {
        return Result<RecordStore>::error(persistence("cannot open", path_).error());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<RecordStore>::error(persistence("cannot read", path_).error());
    }

    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<RecordStore>::ok(RecordStore{});
    }

    return deserialize(content);
}

Result<void> StoreFile::save(const RecordStore& store) const {
    const std::string content = serialize(store);
    const std::string temp_path = path_ + ".tmp";

    std::ofstream temp(temp_path, std::ios::trunc);
    if (!temp) {
        // No temp file next to the store (e.g. /opt is root-owned but the
        // store itself is writable): rewrite in place, keeping owner and mode.
        if (auto r = write_store(path_, content); !r) {
            return r;
        }
        sync_file(path_);
        return Result<void>::success();
    }

    temp << content;
    temp.flush();
    if (!temp) {
        temp.close();
        std::remove(temp_path.c_str());
        return persistence("cannot write", temp_path);
    }
    temp.close();
    sync_file(temp_path);

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        auto err = persistence_errno("cannot replace", path_);
        std::remove(temp_path.c_str());
        return err;
    }

    return Result<void>::success();
}

} // namespace heartbeat
