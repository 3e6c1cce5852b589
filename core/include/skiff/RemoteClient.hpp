// Abstract interface for remote filesystem operations. FTP and SFTP backends
// implement it so the engine stays independent of the protocol family.
// No implementation lets an exception escape: failures are a false return
// plus a human-readable message.
#pragma once
#include "RemoteTypes.hpp"
#include <cstddef>
#include <functional>
#include <memory>

namespace skiff {

class RemoteClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~RemoteClient() = default;

    virtual ProtocolKind protocol() const = 0;

    // Connect and disconnect
    virtual bool connect(const ConnectionProfile &profile, RemoteError &err) = 0;
    virtual void disconnect() = 0;
    // False once the underlying channel is gone, even without disconnect().
    virtual bool isConnected() const = 0;

    // Directory listing. "out" is left empty on failure.
    virtual bool list(const std::string &remote_path,
                      std::vector<RemoteEntry> &out,
                      std::string &err) = 0;

    // Current directory cursor ("/" when unknown)
    virtual std::string currentDir() = 0;
    virtual bool changeDir(const std::string &remote_path, std::string &err) = 0;

    // Transfers: progress is called after every chunk, shouldCancel before.
    virtual bool upload(const std::string &local,
                        const std::string &remote,
                        std::string &err,
                        ProgressCB progress = {},
                        CancelCB shouldCancel = {}) = 0;

    virtual bool download(const std::string &remote,
                          const std::string &local,
                          std::string &err,
                          ProgressCB progress = {},
                          CancelCB shouldCancel = {}) = 0;

    // Single entry operations
    virtual bool deleteFile(const std::string &remote_path, std::string &err) = 0;
    virtual bool createDir(const std::string &remote_dir, std::string &err) = 0;
    virtual bool removeDir(const std::string &remote_dir, std::string &err) = 0;
    virtual bool rename(const std::string &from,
                        const std::string &to,
                        std::string &err) = 0;

    // Removes a directory and everything below it.
    virtual bool deleteDirRecursive(const std::string &remote_dir,
                                    std::string &err) = 0;

    // Metadata. Returns false (err empty) when the path does not exist.
    virtual bool getFileInfo(const std::string &remote_path,
                             RemoteEntry &info,
                             std::string &err) = 0;

    // Fresh, unconnected adapter of the same family. Cheap: no I/O.
    virtual std::unique_ptr<RemoteClient> cloneUnconnected() const = 0;

    // Independent connection of the same family (worker transfers).
    std::unique_ptr<RemoteClient>
    newConnectionLike(const ConnectionProfile &profile, RemoteError &err) const {
        auto ptr = cloneUnconnected();
        if (!ptr || !ptr->connect(profile, err))
            return nullptr;
        return ptr;
    }
};

// Optional capability: chmod.
class PermissionsCapability {
public:
    virtual ~PermissionsCapability() = default;
    virtual bool setPermissions(const std::string &remote_path,
                                std::uint32_t mode,
                                std::string &err) = 0;
};

// Optional capability: modification time.
class TimesCapability {
public:
    virtual ~TimesCapability() = default;
    virtual bool setModificationTime(const std::string &remote_path,
                                     std::uint64_t mtime,
                                     std::string &err) = 0;
};

inline PermissionsCapability *permissionsOf(RemoteClient *c) {
    return dynamic_cast<PermissionsCapability *>(c);
}

inline TimesCapability *timesOf(RemoteClient *c) {
    return dynamic_cast<TimesCapability *>(c);
}

} // namespace skiff
