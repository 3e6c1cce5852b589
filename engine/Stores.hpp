// Persistence interfaces consumed by the engine. Implementations live in
// SettingsStores.hpp; tests may provide their own.
#pragma once
#include "skiff/RemoteTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skiff {

struct HistoryRecord {
    std::string connection_name;
    std::string operation; // "upload" / "download"
    std::string local_path;
    std::string remote_path;
    std::string status; // transferStatusName()
    std::optional<std::string> error;
    std::uint64_t size = 0;
    double duration_seconds = 0.0;
    std::int64_t timestamp_ms = 0; // filled by the store when 0
};

enum class LogLevel { Debug, Info, Warning, Error };

const char *logLevelName(LogLevel level);

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string message;
    std::optional<std::string> connection_name;
    std::int64_t timestamp_ms = 0;
};

struct Bookmark {
    std::int64_t id = 0;
    std::string connection_name;
    std::string path;
    std::string name;
    std::int64_t created_at_ms = 0;
};

class ProfileStore {
public:
    virtual ~ProfileStore() = default;
    // Upsert by name; stamps last_used. False for an empty name or when the
    // backing store rejects the write.
    virtual bool save(const ConnectionProfile &profile) = 0;
    virtual std::optional<ConnectionProfile> get(const std::string &name) const = 0;
    // Most recently used first.
    virtual std::vector<ConnectionProfile> list(bool favoritesOnly = false) const = 0;
    virtual bool remove(const std::string &name) = 0;
};

class HistoryStore {
public:
    virtual ~HistoryStore() = default;
    virtual void appendHistory(const HistoryRecord &record) = 0;
    // Newest first.
    virtual std::vector<HistoryRecord>
    history(const std::optional<std::string> &connectionName = std::nullopt,
            int limit = 100) const = 0;
};

class LogStore {
public:
    virtual ~LogStore() = default;
    virtual void appendLog(LogLevel level,
                           const std::string &message,
                           const std::optional<std::string> &connectionName = std::nullopt) = 0;
    // Newest first.
    virtual std::vector<LogRecord>
    logs(const std::optional<LogLevel> &level = std::nullopt,
         const std::optional<std::string> &connectionName = std::nullopt,
         int limit = 1000) const = 0;
};

class BookmarkStore {
public:
    virtual ~BookmarkStore() = default;
    // False when (connection, path) is already bookmarked.
    virtual bool add(const std::string &connectionName,
                     const std::string &path,
                     const std::string &name) = 0;
    // Newest first.
    virtual std::vector<Bookmark>
    list(const std::optional<std::string> &connectionName = std::nullopt) const = 0;
    virtual bool remove(std::int64_t id) = 0;
};

} // namespace skiff
