// FTP/FTPS backend. The server keeps a current directory for the session, so
// this is the stateful-cursor member of the adapter family.
#pragma once
#include "FtpTransport.hpp"
#include "RemoteClient.hpp"
#include <memory>
#include <string>

namespace skiff {

class FtpClient : public RemoteClient, public PermissionsCapability {
public:
    FtpClient();
    explicit FtpClient(std::unique_ptr<FtpTransport> transport);
    ~FtpClient() override;

    ProtocolKind protocol() const override { return protocol_; }

    bool connect(const ConnectionProfile &profile, RemoteError &err) override;
    void disconnect() override;
    bool isConnected() const override;

    // CWD into remote_path (when given) and LIST there. The cursor stays on
    // the listed directory.
    bool list(const std::string &remote_path,
              std::vector<RemoteEntry> &out,
              std::string &err) override;

    std::string currentDir() override;
    bool changeDir(const std::string &remote_path, std::string &err) override;

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

    // RMD first; only a "not empty" refusal triggers the walk. The cursor is
    // restored before every return.
    bool deleteDirRecursive(const std::string &remote_dir,
                            std::string &err) override;

    // SIZE + MDTM for files; directories are detected with a trial CWD.
    bool getFileInfo(const std::string &remote_path,
                     RemoteEntry &info,
                     std::string &err) override;

    // SITE CHMOD
    bool setPermissions(const std::string &remote_path,
                        std::uint32_t mode,
                        std::string &err) override;

    std::unique_ptr<RemoteClient> cloneUnconnected() const override;

    // Outcome text of the last recursive delete ("Directory deleted", ...).
    const std::string &lastMessage() const { return lastMessage_; }
    // Category of the last failure caused by a server reply.
    ErrorCategory lastErrorCategory() const { return lastError_; }

private:
    FtpReply cmd(const std::string &line);
    bool ensureConnected(std::string &err) const;
    std::string absolute(const std::string &path);
    bool readListing(const std::string &command, std::string &text, std::string &err);
    void restoreCursor(const std::string &saved, const std::string &fallback);
    bool deleteEntryFile(const std::string &dir,
                         const std::string &name,
                         const std::string &saved,
                         std::string &err);
    bool deleteTree(const std::string &target, std::string &err);
    void failConnect(ErrorCategory c, const std::string &raw, RemoteError &err);
    bool failReply(const FtpReply &r, const std::string &prefix, std::string &err);

    std::unique_ptr<FtpTransport> transport_;
    ProtocolKind protocol_ = ProtocolKind::Ftp;
    ConnectionProfile profile_;
    bool connected_ = false;
    std::string lastMessage_;
    ErrorCategory lastError_ = ErrorCategory::None;
};

} // namespace skiff
