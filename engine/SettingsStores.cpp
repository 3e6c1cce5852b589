#include "SettingsStores.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QSettings>
#include <algorithm>

namespace skiff {

const char *logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

static QString qs(const std::string &s) {
    return QString::fromStdString(s);
}

static std::string ss(const QVariant &v) {
    return v.toString().toStdString();
}

// Secrets are kept Base64-encoded: reversible, not encrypted.
static QString encodeSecret(const std::string &secret) {
    return QString::fromLatin1(QByteArray::fromStdString(secret).toBase64());
}

static std::string decodeSecret(const QString &stored) {
    return QByteArray::fromBase64(stored.toLatin1()).toStdString();
}

// ---- Profiles ----

SettingsProfileStore::SettingsProfileStore(const QString &iniPath) : path_(iniPath) {}

std::vector<ConnectionProfile> SettingsProfileStore::loadAll() const {
    std::vector<ConnectionProfile> out;
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("profiles");
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        ConnectionProfile p;
        p.name = ss(s.value("name"));
        p.protocol = protocolFromName(ss(s.value("protocol", "FTP"))).value_or(ProtocolKind::Ftp);
        p.host = ss(s.value("host"));
        p.port = s.value("port", 0).toInt();
        p.username = ss(s.value("user"));
        p.secret = decodeSecret(s.value("secret").toString());
        p.use_tls = s.value("useTls", false).toBool();
        p.favorite = s.value("favorite", false).toBool();
        p.last_used = s.value("lastUsed", 0).toLongLong();
        const QString kh = s.value("knownHosts").toString();
        if (!kh.isEmpty())
            p.known_hosts_path = kh.toStdString();
        p.known_hosts_policy = static_cast<KnownHostsPolicy>(
            s.value("khPolicy", static_cast<int>(KnownHostsPolicy::AcceptNew)).toInt());
        if (!p.name.empty())
            out.push_back(std::move(p));
    }
    s.endArray();
    return out;
}

bool SettingsProfileStore::storeAll(const std::vector<ConnectionProfile> &all) {
    QSettings s(path_, QSettings::IniFormat);
    s.remove("profiles");
    s.beginWriteArray("profiles", static_cast<int>(all.size()));
    for (int i = 0; i < static_cast<int>(all.size()); ++i) {
        s.setArrayIndex(i);
        const ConnectionProfile &p = all[static_cast<std::size_t>(i)];
        s.setValue("name", qs(p.name));
        s.setValue("protocol", QString::fromLatin1(protocolName(p.protocol)));
        s.setValue("host", qs(p.host));
        s.setValue("port", p.port);
        s.setValue("user", qs(p.username));
        s.setValue("secret", encodeSecret(p.secret));
        s.setValue("useTls", p.use_tls);
        s.setValue("favorite", p.favorite);
        s.setValue("lastUsed", static_cast<qlonglong>(p.last_used));
        s.setValue("knownHosts", p.known_hosts_path ? qs(*p.known_hosts_path) : QString());
        s.setValue("khPolicy", static_cast<int>(p.known_hosts_policy));
    }
    s.endArray();
    s.sync();
    return s.status() == QSettings::NoError;
}

bool SettingsProfileStore::save(const ConnectionProfile &profile) {
    if (profile.name.empty())
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    auto all = loadAll();
    ConnectionProfile stamped = profile;
    stamped.last_used = QDateTime::currentSecsSinceEpoch();
    stamped.hostkey_confirm_cb = nullptr;
    auto it = std::find_if(all.begin(), all.end(), [&](const ConnectionProfile &p) {
        return p.name == profile.name;
    });
    if (it != all.end())
        *it = stamped;
    else
        all.push_back(stamped);
    return storeAll(all);
}

std::optional<ConnectionProfile> SettingsProfileStore::get(const std::string &name) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto &p : loadAll()) {
        if (p.name == name)
            return p;
    }
    return std::nullopt;
}

std::vector<ConnectionProfile> SettingsProfileStore::list(bool favoritesOnly) const {
    std::vector<ConnectionProfile> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        all = loadAll();
    }
    if (favoritesOnly) {
        all.erase(std::remove_if(all.begin(), all.end(),
                                 [](const ConnectionProfile &p) { return !p.favorite; }),
                  all.end());
    }
    std::stable_sort(all.begin(), all.end(), [](const ConnectionProfile &a, const ConnectionProfile &b) {
        return a.last_used > b.last_used;
    });
    return all;
}

bool SettingsProfileStore::remove(const std::string &name) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto all = loadAll();
    const auto before = all.size();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [&](const ConnectionProfile &p) { return p.name == name; }),
              all.end());
    if (all.size() == before)
        return false;
    return storeAll(all);
}

// ---- History ----

SettingsHistoryStore::SettingsHistoryStore(const QString &iniPath) : path_(iniPath) {}

void SettingsHistoryStore::appendHistory(const HistoryRecord &record) {
    std::lock_guard<std::mutex> lk(mtx_);
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("history");
    s.endArray();
    // Only the new element is written; the array size grows by one.
    s.beginWriteArray("history", n + 1);
    s.setArrayIndex(n);
    s.setValue("connection", qs(record.connection_name));
    s.setValue("operation", qs(record.operation));
    s.setValue("local", qs(record.local_path));
    s.setValue("remote", qs(record.remote_path));
    s.setValue("status", qs(record.status));
    s.setValue("error", record.error ? qs(*record.error) : QString());
    s.setValue("size", static_cast<qulonglong>(record.size));
    s.setValue("duration", record.duration_seconds);
    s.setValue("timestamp", static_cast<qlonglong>(record.timestamp_ms
                                                        ? record.timestamp_ms
                                                        : QDateTime::currentMSecsSinceEpoch()));
    s.endArray();
    s.sync();
}

std::vector<HistoryRecord>
SettingsHistoryStore::history(const std::optional<std::string> &connectionName,
                              int limit) const {
    std::vector<HistoryRecord> out;
    std::lock_guard<std::mutex> lk(mtx_);
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("history");
    for (int i = n - 1; i >= 0 && static_cast<int>(out.size()) < limit; --i) {
        s.setArrayIndex(i);
        HistoryRecord r;
        r.connection_name = ss(s.value("connection"));
        if (connectionName && r.connection_name != *connectionName)
            continue;
        r.operation = ss(s.value("operation"));
        r.local_path = ss(s.value("local"));
        r.remote_path = ss(s.value("remote"));
        r.status = ss(s.value("status"));
        const QString e = s.value("error").toString();
        if (!e.isEmpty())
            r.error = e.toStdString();
        r.size = s.value("size", 0).toULongLong();
        r.duration_seconds = s.value("duration", 0.0).toDouble();
        r.timestamp_ms = s.value("timestamp", 0).toLongLong();
        out.push_back(std::move(r));
    }
    s.endArray();
    return out;
}

// ---- Logs ----

SettingsLogStore::SettingsLogStore(const QString &iniPath) : path_(iniPath) {}

void SettingsLogStore::appendLog(LogLevel level,
                                 const std::string &message,
                                 const std::optional<std::string> &connectionName) {
    std::lock_guard<std::mutex> lk(mtx_);
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("logs");
    s.endArray();
    s.beginWriteArray("logs", n + 1);
    s.setArrayIndex(n);
    s.setValue("level", QString::fromLatin1(logLevelName(level)));
    s.setValue("message", qs(message));
    s.setValue("connection", connectionName ? qs(*connectionName) : QString());
    s.setValue("timestamp", static_cast<qlonglong>(QDateTime::currentMSecsSinceEpoch()));
    s.endArray();
    s.sync();
}

static LogLevel levelFromName(const QString &name) {
    if (name == QLatin1String("DEBUG"))
        return LogLevel::Debug;
    if (name == QLatin1String("WARNING"))
        return LogLevel::Warning;
    if (name == QLatin1String("ERROR"))
        return LogLevel::Error;
    return LogLevel::Info;
}

std::vector<LogRecord> SettingsLogStore::logs(const std::optional<LogLevel> &level,
                                              const std::optional<std::string> &connectionName,
                                              int limit) const {
    std::vector<LogRecord> out;
    std::lock_guard<std::mutex> lk(mtx_);
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("logs");
    for (int i = n - 1; i >= 0 && static_cast<int>(out.size()) < limit; --i) {
        s.setArrayIndex(i);
        LogRecord r;
        r.level = levelFromName(s.value("level").toString());
        if (level && r.level != *level)
            continue;
        const QString conn = s.value("connection").toString();
        if (!conn.isEmpty())
            r.connection_name = conn.toStdString();
        if (connectionName && r.connection_name != connectionName)
            continue;
        r.message = ss(s.value("message"));
        r.timestamp_ms = s.value("timestamp", 0).toLongLong();
        out.push_back(std::move(r));
    }
    s.endArray();
    return out;
}

// ---- Bookmarks ----

SettingsBookmarkStore::SettingsBookmarkStore(const QString &iniPath) : path_(iniPath) {}

std::vector<Bookmark> SettingsBookmarkStore::loadAll() const {
    std::vector<Bookmark> out;
    QSettings s(path_, QSettings::IniFormat);
    const int n = s.beginReadArray("bookmarks");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        Bookmark b;
        b.id = s.value("id", 0).toLongLong();
        b.connection_name = ss(s.value("connection"));
        b.path = ss(s.value("path"));
        b.name = ss(s.value("name"));
        b.created_at_ms = s.value("created", 0).toLongLong();
        out.push_back(std::move(b));
    }
    s.endArray();
    return out;
}

bool SettingsBookmarkStore::add(const std::string &connectionName,
                                const std::string &path,
                                const std::string &name) {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto all = loadAll();
    for (const auto &b : all) {
        if (b.connection_name == connectionName && b.path == path)
            return false;
    }
    QSettings s(path_, QSettings::IniFormat);
    const qlonglong id = s.value("meta/nextBookmarkId", 1).toLongLong();
    s.setValue("meta/nextBookmarkId", id + 1);
    const int n = static_cast<int>(all.size());
    s.beginWriteArray("bookmarks", n + 1);
    s.setArrayIndex(n);
    s.setValue("id", id);
    s.setValue("connection", qs(connectionName));
    s.setValue("path", qs(path));
    s.setValue("name", qs(name.empty() ? path : name));
    s.setValue("created", static_cast<qlonglong>(QDateTime::currentMSecsSinceEpoch()));
    s.endArray();
    s.sync();
    return s.status() == QSettings::NoError;
}

std::vector<Bookmark>
SettingsBookmarkStore::list(const std::optional<std::string> &connectionName) const {
    std::vector<Bookmark> all;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        all = loadAll();
    }
    std::vector<Bookmark> out;
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (connectionName && it->connection_name != *connectionName)
            continue;
        out.push_back(*it);
    }
    return out;
}

bool SettingsBookmarkStore::remove(std::int64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto all = loadAll();
    const auto before = all.size();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [id](const Bookmark &b) { return b.id == id; }),
              all.end());
    if (all.size() == before)
        return false;
    QSettings s(path_, QSettings::IniFormat);
    s.remove("bookmarks");
    s.beginWriteArray("bookmarks", static_cast<int>(all.size()));
    for (int i = 0; i < static_cast<int>(all.size()); ++i) {
        s.setArrayIndex(i);
        const Bookmark &b = all[static_cast<std::size_t>(i)];
        s.setValue("id", static_cast<qlonglong>(b.id));
        s.setValue("connection", qs(b.connection_name));
        s.setValue("path", qs(b.path));
        s.setValue("name", qs(b.name));
        s.setValue("created", static_cast<qlonglong>(b.created_at_ms));
    }
    s.endArray();
    s.sync();
    return s.status() == QSettings::NoError;
}

} // namespace skiff
