// Owns the single live session: one connected adapter plus the profile it
// was opened with. All cursor-moving calls go through withClient(), which
// serializes them on the session mutex.
#pragma once
#include "Stores.hpp"
#include "skiff/RemoteClient.hpp"
#include <QObject>
#include <QString>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace skiff {

class SessionManager : public QObject {
    Q_OBJECT
public:
    using ClientFactory = std::function<std::unique_ptr<RemoteClient>(ProtocolKind)>;
    using ClientFn = std::function<bool(RemoteClient &, std::string &)>;

    explicit SessionManager(QObject *parent = nullptr);
    explicit SessionManager(ClientFactory factory, QObject *parent = nullptr);
    ~SessionManager() override;

    // FtpClient for FTP/FTPS, Libssh2SftpClient for SFTP.
    static std::unique_ptr<RemoteClient> defaultClientFor(ProtocolKind protocol);

    // Not owned.
    void setProfileStore(ProfileStore *store) { profiles_ = store; }
    void setLogStore(LogStore *store) { logs_ = store; }

    // Blocking; safe to call from a worker thread.
    RemoteError connectTo(const ConnectionProfile &profile);
    // Runs connectTo() on a background thread and reports connectFinished().
    // False when a connect is already in progress.
    bool connectAsync(const ConnectionProfile &profile);
    bool isConnecting() const { return connecting_.load(); }

    // Always true; a no-op when nothing is connected.
    bool disconnect();
    bool isConnected() const;
    std::optional<ConnectionProfile> currentProfile() const;

    // Runs fn on the live adapter under the session mutex. Fails fast with
    // "Not connected". A failure that leaves the adapter disconnected ends
    // the session (sessionLost).
    bool withClient(const ClientFn &fn, std::string &err);

    // Independent connection of the session's family for transfers.
    std::unique_ptr<RemoteClient> openWorkerClient(RemoteError &err);

    // Background variant of withClient(); reports operationFinished().
    void runAsync(const QString &operation, ClientFn fn);

    bool list(const std::string &path, std::vector<RemoteEntry> &out, std::string &err);
    bool changeDir(const std::string &path, std::string &err);
    std::string currentDir();
    bool createDir(const std::string &path, std::string &err);
    bool deleteFile(const std::string &path, std::string &err);
    bool deleteDirRecursive(const std::string &path, std::string &err);
    bool rename(const std::string &from, const std::string &to, std::string &err);
    bool getFileInfo(const std::string &path, RemoteEntry &info, std::string &err);
    bool setPermissions(const std::string &path, std::uint32_t mode, std::string &err);
    bool setModificationTime(const std::string &path, std::uint64_t mtime, std::string &err);

signals:
    void connected(const QString &name);
    void connectFinished(bool ok, int category, const QString &message);
    void disconnected();
    void sessionLost(const QString &message);
    void operationFinished(const QString &operation, bool ok, const QString &message);

private:
    struct Background {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    void startBackground(std::function<void()> fn);
    void appendLog(LogLevel level, const std::string &message,
                   const std::optional<std::string> &connection);

    ClientFactory factory_;
    ProfileStore *profiles_ = nullptr;
    LogStore *logs_ = nullptr;

    mutable std::mutex mtx_; // protects client_ and profile_
    std::unique_ptr<RemoteClient> client_;
    std::optional<ConnectionProfile> profile_;

    std::mutex connectMtx_; // one connectTo() at a time
    std::atomic<bool> connecting_{false};

    std::mutex bgMtx_;
    std::vector<Background> background_;
};

} // namespace skiff
