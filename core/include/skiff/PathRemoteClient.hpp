// Base for the stateless-path family: every protocol call carries an
// absolute path, the "current directory" only lives on the client side.
#pragma once
#include "RemoteClient.hpp"
#include <string>

namespace skiff {

class PathRemoteClient : public RemoteClient {
public:
    std::string currentDir() override { return cwd_; }
    bool changeDir(const std::string &remote_path, std::string &err) override;

    // Files first, then subdirectories (each in name order), then the
    // directory itself. Stops at the first failure.
    bool deleteDirRecursive(const std::string &remote_dir,
                            std::string &err) override;

protected:
    // Absolute, normalized form of "path" relative to the cursor.
    std::string resolve(const std::string &path) const;
    void setCwd(const std::string &dir) { cwd_ = dir.empty() ? "/" : dir; }

private:
    std::string cwd_ = "/";
};

} // namespace skiff
