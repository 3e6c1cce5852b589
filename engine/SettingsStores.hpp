// QSettings (INI file) backed stores. Each instance owns one file; every call
// opens its own QSettings so the stores can be used from worker threads.
#pragma once
#include "Stores.hpp"
#include <QString>
#include <mutex>

namespace skiff {

class SettingsProfileStore : public ProfileStore {
public:
    explicit SettingsProfileStore(const QString &iniPath);

    bool save(const ConnectionProfile &profile) override;
    std::optional<ConnectionProfile> get(const std::string &name) const override;
    std::vector<ConnectionProfile> list(bool favoritesOnly = false) const override;
    bool remove(const std::string &name) override;

private:
    std::vector<ConnectionProfile> loadAll() const;
    bool storeAll(const std::vector<ConnectionProfile> &all);

    QString path_;
    mutable std::mutex mtx_;
};

class SettingsHistoryStore : public HistoryStore {
public:
    explicit SettingsHistoryStore(const QString &iniPath);

    void appendHistory(const HistoryRecord &record) override;
    std::vector<HistoryRecord>
    history(const std::optional<std::string> &connectionName = std::nullopt,
            int limit = 100) const override;

private:
    QString path_;
    mutable std::mutex mtx_;
};

class SettingsLogStore : public LogStore {
public:
    explicit SettingsLogStore(const QString &iniPath);

    void appendLog(LogLevel level,
                   const std::string &message,
                   const std::optional<std::string> &connectionName = std::nullopt) override;
    std::vector<LogRecord>
    logs(const std::optional<LogLevel> &level = std::nullopt,
         const std::optional<std::string> &connectionName = std::nullopt,
         int limit = 1000) const override;

private:
    QString path_;
    mutable std::mutex mtx_;
};

class SettingsBookmarkStore : public BookmarkStore {
public:
    explicit SettingsBookmarkStore(const QString &iniPath);

    bool add(const std::string &connectionName,
             const std::string &path,
             const std::string &name) override;
    std::vector<Bookmark>
    list(const std::optional<std::string> &connectionName = std::nullopt) const override;
    bool remove(std::int64_t id) override;

private:
    std::vector<Bookmark> loadAll() const;

    QString path_;
    mutable std::mutex mtx_;
};

} // namespace skiff
