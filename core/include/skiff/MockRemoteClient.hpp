// In-memory stateless backend for tests and demos. Clones made through
// newConnectionLike() share the same filesystem, like real worker
// connections to one server.
#pragma once
#include "PathRemoteClient.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace skiff {

class MockFilesystem {
public:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint32_t mode = 0;
        std::uint64_t mtime = 0;
    };

    MockFilesystem();

    // Fixtures. Missing parents are created.
    void addDir(const std::string &path);
    void addFile(const std::string &path, const std::string &data);

    bool exists(const std::string &path) const;
    bool isDir(const std::string &path) const;
    std::string fileData(const std::string &path) const;

    // "<op> <path>" for every call that reached the filesystem.
    std::vector<std::string> journal() const;
    void clearJournal();

    // The next call of "op" on "path" fails with "message".
    void failOn(const std::string &op, const std::string &path, const std::string &message);
    // The next call of "op" drops the connection that made it.
    void loseConnectionOn(const std::string &op);

    int connectCount() const;
    // Every later connect() blocks this long, like a slow handshake.
    void setConnectDelay(int ms);

private:
    friend class MockRemoteClient;

    // Locked helpers: mtx_ held by the caller.
    bool takeFailure(const std::string &op, const std::string &path, std::string &err);
    bool takeDrop(const std::string &op);
    void ensureParentsLocked(const std::string &path);
    std::vector<std::string> childrenLocked(const std::string &dir) const;

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::vector<std::string> journal_;
    std::map<std::string, std::string> failures_; // "op path" -> message
    std::vector<std::string> drops_;
    int connects_ = 0;
    int connectDelayMs_ = 0;
};

class MockRemoteClient : public PathRemoteClient, public PermissionsCapability {
public:
    MockRemoteClient();
    explicit MockRemoteClient(std::shared_ptr<MockFilesystem> fs);

    ProtocolKind protocol() const override { return ProtocolKind::Sftp; }

    bool connect(const ConnectionProfile &profile, RemoteError &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string &remote_path,
              std::vector<RemoteEntry> &out,
              std::string &err) override;

    bool upload(const std::string &local,
                const std::string &remote,
                std::string &err,
                ProgressCB progress = {},
                CancelCB shouldCancel = {}) override;

    bool download(const std::string &remote,
                  const std::string &local,
                  std::string &err,
                  ProgressCB progress = {},
                  CancelCB shouldCancel = {}) override;

    bool deleteFile(const std::string &remote_path, std::string &err) override;
    bool createDir(const std::string &remote_dir, std::string &err) override;
    bool removeDir(const std::string &remote_dir, std::string &err) override;
    bool rename(const std::string &from,
                const std::string &to,
                std::string &err) override;

    bool getFileInfo(const std::string &remote_path,
                     RemoteEntry &info,
                     std::string &err) override;

    bool setPermissions(const std::string &remote_path,
                        std::uint32_t mode,
                        std::string &err) override;

    std::unique_ptr<RemoteClient> cloneUnconnected() const override;

    const std::shared_ptr<MockFilesystem> &filesystem() const { return fs_; }

private:
    // Common prologue: connection check, journal, injected failures.
    bool begin(const char *op, const std::string &path, std::string &err);

    std::shared_ptr<MockFilesystem> fs_;
    bool connected_ = false;
};

} // namespace skiff
