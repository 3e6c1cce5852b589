#include "skiff/MockRemoteClient.hpp"
#include "skiff/ListingParser.hpp"
#include "skiff/RemotePath.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <thread>

namespace skiff {

static const std::size_t CHUNK = 64 * 1024;

MockFilesystem::MockFilesystem() {
    Node root;
    root.is_dir = true;
    root.mode = 040755;
    nodes_["/"] = root;
}

void MockFilesystem::ensureParentsLocked(const std::string &path) {
    std::string parent = parentPath(path);
    std::vector<std::string> missing;
    while (nodes_.find(parent) == nodes_.end()) {
        missing.push_back(parent);
        parent = parentPath(parent);
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        Node d;
        d.is_dir = true;
        d.mode = 040755;
        nodes_[*it] = d;
    }
}

void MockFilesystem::addDir(const std::string &path) {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParentsLocked(p);
    Node d;
    d.is_dir = true;
    d.mode = 040755;
    nodes_[p] = d;
}

void MockFilesystem::addFile(const std::string &path, const std::string &data) {
    const std::string p = normalizePath(path);
    std::lock_guard<std::mutex> lk(mtx_);
    ensureParentsLocked(p);
    Node f;
    f.data = data;
    f.mode = 0100644;
    f.mtime = static_cast<std::uint64_t>(std::time(nullptr));
    nodes_[p] = f;
}

bool MockFilesystem::exists(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalizePath(path)) > 0;
}

bool MockFilesystem::isDir(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalizePath(path));
    return it != nodes_.end() && it->second.is_dir;
}

std::string MockFilesystem::fileData(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalizePath(path));
    return it == nodes_.end() ? std::string() : it->second.data;
}

std::vector<std::string> MockFilesystem::journal() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return journal_;
}

void MockFilesystem::clearJournal() {
    std::lock_guard<std::mutex> lk(mtx_);
    journal_.clear();
}

void MockFilesystem::failOn(const std::string &op,
                            const std::string &path,
                            const std::string &message) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_[op + " " + normalizePath(path)] = message;
}

void MockFilesystem::loseConnectionOn(const std::string &op) {
    std::lock_guard<std::mutex> lk(mtx_);
    drops_.push_back(op);
}

int MockFilesystem::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

void MockFilesystem::setConnectDelay(int ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectDelayMs_ = ms < 0 ? 0 : ms;
}

bool MockFilesystem::takeFailure(const std::string &op,
                                 const std::string &path,
                                 std::string &err) {
    auto it = failures_.find(op + " " + path);
    if (it == failures_.end())
        return false;
    err = it->second;
    failures_.erase(it);
    return true;
}

bool MockFilesystem::takeDrop(const std::string &op) {
    auto it = std::find(drops_.begin(), drops_.end(), op);
    if (it == drops_.end())
        return false;
    drops_.erase(it);
    return true;
}

std::vector<std::string> MockFilesystem::childrenLocked(const std::string &dir) const {
    std::vector<std::string> out;
    for (const auto &kv : nodes_) {
        if (kv.first != "/" && parentPath(kv.first) == dir)
            out.push_back(kv.first);
    }
    return out;
}

MockRemoteClient::MockRemoteClient() : fs_(std::make_shared<MockFilesystem>()) {
    // Small sample tree
    fs_->addFile("/readme.txt", "Skiff demo server\n");
    fs_->addFile("/home/demo/notes.md", "# notes\n");
    fs_->addDir("/home/guest");
    fs_->addDir("/var/log");
}

MockRemoteClient::MockRemoteClient(std::shared_ptr<MockFilesystem> fs)
    : fs_(std::move(fs)) {}

bool MockRemoteClient::connect(const ConnectionProfile &profile, RemoteError &err) {
    if (connected_) {
        err.set(ErrorCategory::Unclassified, "Already connected");
        return false;
    }
    if (!validateProfile(profile, err))
        return false;
    int delayMs = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        ++fs_->connects_;
        delayMs = fs_->connectDelayMs_;
    }
    if (delayMs > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    connected_ = true;
    setCwd("/");
    err.clear();
    return true;
}

void MockRemoteClient::disconnect() {
    connected_ = false;
}

bool MockRemoteClient::begin(const char *op, const std::string &path, std::string &err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    fs_->journal_.push_back(std::string(op) + " " + path);
    if (fs_->takeDrop(op)) {
        connected_ = false;
        err = std::string(op) + ": connection lost";
        return false;
    }
    return !fs_->takeFailure(op, path, err);
}

bool MockRemoteClient::list(const std::string &remote_path,
                            std::vector<RemoteEntry> &out,
                            std::string &err) {
    out.clear();
    const std::string path = resolve(remote_path);
    if (!begin("list", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err = "No such file or directory: " + path;
        return false;
    }
    if (!it->second.is_dir) {
        err = "Not a directory: " + path;
        return false;
    }
    for (const auto &child : fs_->childrenLocked(path)) {
        const auto &n = fs_->nodes_[child];
        RemoteEntry e;
        e.name = baseName(child);
        e.is_dir = n.is_dir;
        e.size = n.is_dir ? 0 : n.data.size();
        e.mode = n.mode;
        e.permissions = n.is_dir ? "drwxr-xr-x" : "-rw-r--r--";
        if (n.mtime)
            e.mtime = n.mtime;
        e.listing_line = formatLongListing(e);
        out.push_back(std::move(e));
    }
    std::sort(out.begin(), out.end(), [](const RemoteEntry &a, const RemoteEntry &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockRemoteClient::upload(const std::string &local,
                              const std::string &remote,
                              std::string &err,
                              ProgressCB progress,
                              CancelCB shouldCancel) {
    const std::string path = resolve(remote);
    if (!begin("upload", path, err))
        return false;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto parent = fs_->nodes_.find(parentPath(path));
        if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
            err = "No such directory: " + parentPath(path);
            return false;
        }
    }
    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Cannot open local file for reading";
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    std::string data;
    std::vector<char> buf(CHUNK);
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0)
            break;
        data.append(buf.data(), n);
        if (progress)
            progress(data.size(), total);
    }
    const bool readFailed = std::ferror(lf) != 0;
    std::fclose(lf);
    if (readFailed) {
        err = "Local read failed";
        return false;
    }

    std::lock_guard<std::mutex> lk(fs_->mtx_);
    MockFilesystem::Node f;
    f.data = std::move(data);
    f.mode = 0100644;
    f.mtime = static_cast<std::uint64_t>(std::time(nullptr));
    fs_->nodes_[path] = std::move(f);
    return true;
}

bool MockRemoteClient::download(const std::string &remote,
                                const std::string &local,
                                std::string &err,
                                ProgressCB progress,
                                CancelCB shouldCancel) {
    const std::string path = resolve(remote);
    if (!begin("download", path, err))
        return false;
    std::string data;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto it = fs_->nodes_.find(path);
        if (it == fs_->nodes_.end() || it->second.is_dir) {
            err = "No such file: " + path;
            return false;
        }
        data = it->second.data;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Cannot open local file for writing";
        return false;
    }
    std::size_t done = 0;
    while (done < data.size()) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        const std::size_t n = std::min(CHUNK, data.size() - done);
        if (std::fwrite(data.data() + done, 1, n, lf) != n) {
            std::fclose(lf);
            err = "Local write failed";
            return false;
        }
        done += n;
        if (progress)
            progress(done, data.size());
    }
    if (std::fclose(lf) != 0) {
        err = "Local write failed";
        return false;
    }
    return true;
}

bool MockRemoteClient::deleteFile(const std::string &remote_path, std::string &err) {
    const std::string path = resolve(remote_path);
    if (!begin("deleteFile", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err = "No such file: " + path;
        return false;
    }
    if (it->second.is_dir) {
        err = "Is a directory: " + path;
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockRemoteClient::createDir(const std::string &remote_dir, std::string &err) {
    const std::string path = resolve(remote_dir);
    if (!begin("createDir", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->nodes_.count(path)) {
        err = "File exists: " + path;
        return false;
    }
    auto parent = fs_->nodes_.find(parentPath(path));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "No such directory: " + parentPath(path);
        return false;
    }
    MockFilesystem::Node d;
    d.is_dir = true;
    d.mode = 040755;
    fs_->nodes_[path] = d;
    return true;
}

bool MockRemoteClient::removeDir(const std::string &remote_dir, std::string &err) {
    const std::string path = resolve(remote_dir);
    if (!begin("removeDir", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (path == "/") {
        err = "Cannot remove the root directory";
        return false;
    }
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err = "No such directory: " + path;
        return false;
    }
    if (!it->second.is_dir) {
        err = "Not a directory: " + path;
        return false;
    }
    if (!fs_->childrenLocked(path).empty()) {
        err = "Directory not empty: " + path;
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockRemoteClient::rename(const std::string &from,
                              const std::string &to,
                              std::string &err) {
    const std::string src = resolve(from);
    const std::string dst = resolve(to);
    if (!begin("rename", src, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (!fs_->nodes_.count(src) || src == "/") {
        err = "No such file or directory: " + src;
        return false;
    }
    if (fs_->nodes_.count(dst)) {
        err = "File exists: " + dst;
        return false;
    }
    if (!fs_->nodes_.count(parentPath(dst))) {
        err = "No such directory: " + parentPath(dst);
        return false;
    }
    std::vector<std::pair<std::string, MockFilesystem::Node>> moved;
    const std::string prefix = src + "/";
    for (auto it = fs_->nodes_.begin(); it != fs_->nodes_.end();) {
        if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
            moved.emplace_back(dst + it->first.substr(src.size()), it->second);
            it = fs_->nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto &m : moved)
        fs_->nodes_[m.first] = std::move(m.second);
    return true;
}

bool MockRemoteClient::getFileInfo(const std::string &remote_path,
                                   RemoteEntry &info,
                                   std::string &err) {
    info = RemoteEntry{};
    const std::string path = resolve(remote_path);
    if (!begin("getFileInfo", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err.clear();
        return false;
    }
    info.name = baseName(path);
    info.is_dir = it->second.is_dir;
    info.size = it->second.is_dir ? 0 : it->second.data.size();
    info.mode = it->second.mode;
    if (it->second.mtime)
        info.mtime = it->second.mtime;
    return true;
}

bool MockRemoteClient::setPermissions(const std::string &remote_path,
                                      std::uint32_t mode,
                                      std::string &err) {
    const std::string path = resolve(remote_path);
    if (!begin("setPermissions", path, err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end()) {
        err = "No such file or directory: " + path;
        return false;
    }
    it->second.mode = (it->second.mode & ~07777u) | (mode & 07777u);
    return true;
}

std::unique_ptr<RemoteClient> MockRemoteClient::cloneUnconnected() const {
    return std::make_unique<MockRemoteClient>(fs_);
}

} // namespace skiff
