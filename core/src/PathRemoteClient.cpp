#include "skiff/PathRemoteClient.hpp"
#include "skiff/RemotePath.hpp"
#include <algorithm>
#include <vector>

namespace skiff {

std::string PathRemoteClient::resolve(const std::string &path) const {
    return normalizePath(path, cwd_);
}

bool PathRemoteClient::changeDir(const std::string &remote_path,
                                 std::string &err) {
    const std::string target = resolve(remote_path);
    RemoteEntry info;
    std::string ierr;
    if (!getFileInfo(target, info, ierr)) {
        err = ierr.empty() ? "No such directory: " + target : ierr;
        return false;
    }
    if (!info.is_dir) {
        err = "Not a directory: " + target;
        return false;
    }
    setCwd(target);
    return true;
}

bool PathRemoteClient::deleteDirRecursive(const std::string &remote_dir,
                                          std::string &err) {
    const std::string target = stripTrailingSlash(resolve(remote_dir));

    RemoteEntry info;
    std::string ierr;
    if (getFileInfo(target, info, ierr) && !info.is_dir)
        return deleteFile(target, err);

    std::vector<RemoteEntry> children;
    std::string lerr;
    if (!list(target, children, lerr)) {
        // Gone or unreadable: a plain remove reports the real reason.
        return removeDir(target, err);
    }

    std::vector<std::string> files;
    std::vector<std::string> dirs;
    for (const auto &e : children) {
        if (e.name.empty() || e.name == "." || e.name == "..")
            continue;
        (e.is_dir ? dirs : files).push_back(e.name);
    }
    std::sort(files.begin(), files.end());
    std::sort(dirs.begin(), dirs.end());

    for (const auto &name : files) {
        std::string ferr;
        if (!deleteFile(joinPath(target, name), ferr)) {
            err = "Failed to delete file '" + name + "': " + ferr;
            return false;
        }
    }
    for (const auto &name : dirs) {
        std::string derr;
        if (!deleteDirRecursive(joinPath(target, name), derr)) {
            err = "Failed to delete subdirectory '" + name + "': " + derr;
            return false;
        }
    }
    std::string rerr;
    if (!removeDir(target, rerr)) {
        err = "Failed to remove directory '" + baseName(target) + "': " + rerr;
        return false;
    }
    return true;
}

} // namespace skiff
