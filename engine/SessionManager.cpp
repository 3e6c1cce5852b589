#include "SessionManager.hpp"
#include "skiff/ErrorClassifier.hpp"
#include "skiff/FtpClient.hpp"
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/RuntimeLogging.hpp"
#include <QDateTime>
#include <QLoggingCategory>
#include <QMetaObject>
#include <exception>
Q_LOGGING_CATEGORY(skSession, "skiff.session")

namespace skiff {

SessionManager::SessionManager(QObject *parent)
    : SessionManager(&SessionManager::defaultClientFor, parent) {}

SessionManager::SessionManager(ClientFactory factory, QObject *parent)
    : QObject(parent), factory_(std::move(factory)) {}

SessionManager::~SessionManager() {
    std::vector<Background> pending;
    {
        std::lock_guard<std::mutex> lk(bgMtx_);
        pending.swap(background_);
    }
    // Connects and operations are bounded by the adapter timeouts.
    for (auto &b : pending) {
        if (b.thread.joinable())
            b.thread.join();
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (client_) {
        client_->disconnect();
        client_.reset();
    }
}

std::unique_ptr<RemoteClient> SessionManager::defaultClientFor(ProtocolKind protocol) {
    if (protocol == ProtocolKind::Sftp)
        return std::make_unique<Libssh2SftpClient>();
    return std::make_unique<FtpClient>();
}

void SessionManager::appendLog(LogLevel level, const std::string &message,
                               const std::optional<std::string> &connection) {
    if (logs_)
        logs_->appendLog(level, message, connection);
}

void SessionManager::startBackground(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(bgMtx_);
    // Reap finished threads
    for (auto it = background_.begin(); it != background_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable())
                it->thread.join();
            it = background_.erase(it);
        } else {
            ++it;
        }
    }
    Background b;
    b.done = std::make_shared<std::atomic<bool>>(false);
    auto done = b.done;
    b.thread = std::thread([fn = std::move(fn), done]() {
        fn();
        done->store(true);
    });
    background_.push_back(std::move(b));
}

RemoteError SessionManager::connectTo(const ConnectionProfile &profile) {
    std::lock_guard<std::mutex> connectLock(connectMtx_);
    RemoteError err;
    if (!validateProfile(profile, err)) {
        qCWarning(skSession) << "connect rejected:" << QString::fromStdString(err.message);
        return err;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (client_) {
            err.set(ErrorCategory::Unclassified, "Already connected; disconnect first");
            return err;
        }
    }

    const std::uint16_t port = effectivePort(profile);
    qCInfo(skSession) << "connecting" << protocolName(profile.protocol)
                      << "host=" << QString::fromStdString(profile.host) << "port=" << port;

    std::unique_ptr<RemoteClient> client;
    bool ok = false;
    try {
        client = factory_(profile.protocol);
        if (!client)
            err.set(ErrorCategory::Unclassified,
                    std::string("No adapter for protocol ") + protocolName(profile.protocol));
        else
            ok = client->connect(profile, err);
    } catch (const std::exception &e) {
        ok = false;
        err.set(ErrorCategory::Unclassified,
                describe(ErrorCategory::Unclassified, profile.host, port, e.what()));
    }
    if (!ok) {
        if (err.category == ErrorCategory::None)
            err.set(ErrorCategory::Unclassified, "Connection failed");
        qCWarning(skSession) << "connect failed" << categoryName(err.category)
                             << QString::fromStdString(err.message);
        appendLog(LogLevel::Error, "Connection failed: " + err.message,
                  profile.name.empty() ? std::nullopt : std::optional<std::string>(profile.name));
        return err;
    }

    ConnectionProfile stored = profile;
    stored.last_used = QDateTime::currentSecsSinceEpoch();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        client_ = std::move(client);
        profile_ = stored;
    }
    if (profiles_ && !stored.name.empty() && !profiles_->save(stored))
        qCWarning(skSession) << "profile could not be saved";
    appendLog(LogLevel::Info,
              std::string("Connected to ") + profile.host + " via " + protocolName(profile.protocol),
              profile.name.empty() ? std::nullopt : std::optional<std::string>(profile.name));
    qCInfo(skSession) << "connected" << QString::fromStdString(profile.name);
    err.clear();
    emit connected(QString::fromStdString(profile.name));
    return err;
}

bool SessionManager::connectAsync(const ConnectionProfile &profile) {
    bool expected = false;
    if (!connecting_.compare_exchange_strong(expected, true))
        return false;
    startBackground([this, profile]() {
        const RemoteError err = connectTo(profile);
        connecting_.store(false);
        const bool ok = err.category == ErrorCategory::None;
        const int category = static_cast<int>(err.category);
        const QString message = QString::fromStdString(err.message);
        QMetaObject::invokeMethod(
            this, [this, ok, category, message]() { emit connectFinished(ok, category, message); },
            Qt::QueuedConnection);
    });
    return true;
}

bool SessionManager::disconnect() {
    std::optional<std::string> name;
    bool tornDown = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (client_) {
            try {
                client_->disconnect();
            } catch (const std::exception &e) {
                qCWarning(skSession) << "disconnect error:" << e.what();
            }
            client_.reset();
            if (profile_)
                name = profile_->name;
            profile_.reset();
            tornDown = true;
        }
    }
    if (tornDown) {
        qCInfo(skSession) << "disconnected";
        appendLog(LogLevel::Info, "Disconnected", name);
        emit disconnected();
    }
    return true;
}

bool SessionManager::isConnected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return client_ != nullptr;
}

std::optional<ConnectionProfile> SessionManager::currentProfile() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return profile_;
}

bool SessionManager::withClient(const ClientFn &fn, std::string &err) {
    bool ok = false;
    bool lost = false;
    std::optional<std::string> name;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!client_) {
            err = "Not connected";
            return false;
        }
        try {
            ok = fn(*client_, err);
        } catch (const std::exception &e) {
            ok = false;
            err = e.what();
        }
        if (!ok && !client_->isConnected()) {
            lost = true;
            client_->disconnect();
            client_.reset();
            if (profile_)
                name = profile_->name;
            profile_.reset();
        }
    }
    if (lost) {
        qCWarning(skSession) << "Session lost:" << QString::fromStdString(err);
        appendLog(LogLevel::Error, "Session lost: " + err, name);
        emit sessionLost(QString::fromStdString(err));
        emit disconnected();
    }
    return ok;
}

std::unique_ptr<RemoteClient> SessionManager::openWorkerClient(RemoteError &err) {
    std::unique_ptr<RemoteClient> conn;
    ConnectionProfile profile;
    {
        // Only the clone happens under the session mutex; the handshake
        // below must not stall browsing.
        std::lock_guard<std::mutex> lk(mtx_);
        if (!client_ || !profile_) {
            err.set(ErrorCategory::Unclassified, "Not connected");
            return nullptr;
        }
        conn = client_->cloneUnconnected();
        profile = *profile_;
    }
    if (!conn) {
        err.set(ErrorCategory::Unclassified, "Could not open transfer connection");
        return nullptr;
    }
    try {
        if (!conn->connect(profile, err)) {
            if (err.category == ErrorCategory::None)
                err.set(ErrorCategory::Unclassified, "Could not open transfer connection");
            return nullptr;
        }
        return conn;
    } catch (const std::exception &e) {
        err.set(ErrorCategory::Unclassified, e.what());
        return nullptr;
    }
}

void SessionManager::runAsync(const QString &operation, ClientFn fn) {
    startBackground([this, operation, fn = std::move(fn)]() {
        std::string err;
        const bool ok = withClient(fn, err);
        if (!ok)
            qCWarning(skSession) << operation << "failed:"
                                 << QString::fromStdString(LogPolicy::fromEnvironment().detail(err));
        const QString message = QString::fromStdString(err);
        QMetaObject::invokeMethod(
            this,
            [this, operation, ok, message]() { emit operationFinished(operation, ok, message); },
            Qt::QueuedConnection);
    });
}

bool SessionManager::list(const std::string &path, std::vector<RemoteEntry> &out,
                          std::string &err) {
    return withClient([&](RemoteClient &c, std::string &e) { return c.list(path, out, e); }, err);
}

bool SessionManager::changeDir(const std::string &path, std::string &err) {
    return withClient([&](RemoteClient &c, std::string &e) { return c.changeDir(path, e); }, err);
}

std::string SessionManager::currentDir() {
    std::string dir = "/";
    std::string err;
    withClient(
        [&](RemoteClient &c, std::string &) {
            dir = c.currentDir();
            return true;
        },
        err);
    return dir;
}

bool SessionManager::createDir(const std::string &path, std::string &err) {
    return withClient([&](RemoteClient &c, std::string &e) { return c.createDir(path, e); }, err);
}

bool SessionManager::deleteFile(const std::string &path, std::string &err) {
    return withClient([&](RemoteClient &c, std::string &e) { return c.deleteFile(path, e); }, err);
}

bool SessionManager::deleteDirRecursive(const std::string &path, std::string &err) {
    return withClient(
        [&](RemoteClient &c, std::string &e) { return c.deleteDirRecursive(path, e); }, err);
}

bool SessionManager::rename(const std::string &from, const std::string &to, std::string &err) {
    return withClient([&](RemoteClient &c, std::string &e) { return c.rename(from, to, e); }, err);
}

bool SessionManager::getFileInfo(const std::string &path, RemoteEntry &info, std::string &err) {
    return withClient(
        [&](RemoteClient &c, std::string &e) { return c.getFileInfo(path, info, e); }, err);
}

bool SessionManager::setPermissions(const std::string &path, std::uint32_t mode,
                                    std::string &err) {
    return withClient(
        [&](RemoteClient &c, std::string &e) {
            PermissionsCapability *p = permissionsOf(&c);
            if (!p) {
                e = "Operation not supported by this protocol";
                return false;
            }
            return p->setPermissions(path, mode, e);
        },
        err);
}

bool SessionManager::setModificationTime(const std::string &path, std::uint64_t mtime,
                                         std::string &err) {
    return withClient(
        [&](RemoteClient &c, std::string &e) {
            TimesCapability *t = timesOf(&c);
            if (!t) {
                e = "Operation not supported by this protocol";
                return false;
            }
            return t->setModificationTime(path, mtime, e);
        },
        err);
}

} // namespace skiff
