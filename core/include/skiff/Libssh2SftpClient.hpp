#pragma once
#include "PathRemoteClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace skiff {

class Libssh2SftpClient : public PathRemoteClient,
                          public PermissionsCapability,
                          public TimesCapability {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

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
    bool setModificationTime(const std::string &remote_path,
                             std::uint64_t mtime,
                             std::string &err) override;

    std::unique_ptr<RemoteClient> cloneUnconnected() const override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool sshHandshakeAuth(const ConnectionProfile &profile, RemoteError &err);
    bool ready(std::string &err) const;
    std::string lastSftpError(const char *what);
};

} // namespace skiff
