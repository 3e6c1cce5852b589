// Core unit tests without external framework (run via CTest).
#include "skiff/ErrorClassifier.hpp"
#include "skiff/FtpClient.hpp"
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/ListingParser.hpp"
#include "skiff/MockRemoteClient.hpp"
#include "skiff/RemotePath.hpp"
#include "skiff/RuntimeLogging.hpp"
#include "skiff/SocketFtpTransport.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <optional>
#include <set>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

skiff::ConnectionProfile validProfile(skiff::ProtocolKind p = skiff::ProtocolKind::Sftp) {
    skiff::ConnectionProfile prof;
    prof.name = "test";
    prof.protocol = p;
    prof.host = "example.test";
    prof.username = "alice";
    prof.secret = "secret";
    return prof;
}

// ---------------------------------------------------------------------------
// Scripted FTP server behind the transport seam. Clones share one server.

struct FakeFtpServer {
    int opens = 0;
    int loginCode = 230;
    std::string cwd = "/";
    std::set<std::string> dirs{"/"};
    std::map<std::string, std::string> files;
    std::vector<std::string> commands;
    // Absolute DELE refused for these paths; relative DELE works.
    std::set<std::string> absoluteDeleRefused;
    // Forced RMD replies, by absolute path.
    std::map<std::string, skiff::FtpReply> rmdReplies;
    // The first command starting with this verb drops the connection.
    std::string dropOn;
    // Canned replies, by exact command line.
    std::map<std::string, skiff::FtpReply> forced;

    std::string resolve(const std::string &arg) const {
        return skiff::normalizePath(arg, cwd);
    }

    bool hasChildren(const std::string &dir) const {
        for (const auto &d : dirs)
            if (d != "/" && skiff::parentPath(d) == dir)
                return true;
        for (const auto &f : files)
            if (skiff::parentPath(f.first) == dir)
                return true;
        return false;
    }

    std::string listing(const std::string &dir) const {
        std::string out = "total 0\r\n";
        for (const auto &d : dirs)
            if (d != "/" && skiff::parentPath(d) == dir)
                out += "drwxr-xr-x 2 ftp ftp 0 Mar 04 21:30 " + skiff::baseName(d) + "\r\n";
        for (const auto &f : files)
            if (skiff::parentPath(f.first) == dir)
                out += "-rw-r--r-- 1 ftp ftp " + std::to_string(f.second.size()) +
                       " Mar 04 21:30 " + skiff::baseName(f.first) + "\r\n";
        return out;
    }

    size_t count(const std::string &prefix) const {
        return static_cast<size_t>(std::count_if(
            commands.begin(), commands.end(),
            [&](const std::string &c) { return c.compare(0, prefix.size(), prefix) == 0; }));
    }
};

class FakeFtpTransport : public skiff::FtpTransport {
public:
    explicit FakeFtpTransport(std::shared_ptr<FakeFtpServer> s) : s_(std::move(s)) {}

    bool open(const std::string &, std::uint16_t, int, skiff::RemoteError &) override {
        ++s_->opens;
        open_ = true;
        return true;
    }
    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }

    skiff::FtpReply readReply() override { return {220, "fake server ready"}; }

    skiff::FtpReply command(const std::string &line) override {
        s_->commands.push_back(line);
        if (!open_)
            return {};
        const auto sp = line.find(' ');
        const std::string verb = line.substr(0, sp);
        const std::string arg = sp == std::string::npos ? std::string() : line.substr(sp + 1);
        auto canned = s_->forced.find(line);
        if (canned != s_->forced.end())
            return canned->second;
        if (!s_->dropOn.empty() && verb == s_->dropOn) {
            s_->dropOn.clear();
            open_ = false;
            return {};
        }
        if (verb == "USER")
            return {331, "Password required"};
        if (verb == "PASS")
            return {s_->loginCode, s_->loginCode == 230 ? "Logged in" : "Login incorrect"};
        if (verb == "TYPE")
            return {200, "Type set to I"};
        if (verb == "QUIT")
            return {221, "Goodbye"};
        if (verb == "PWD") {
            std::string quoted;
            for (char c : s_->cwd) {
                quoted += c;
                if (c == '"')
                    quoted += '"';
            }
            return {257, "\"" + quoted + "\" is the current directory"};
        }
        if (verb == "CWD") {
            const std::string p = s_->resolve(arg);
            if (!s_->dirs.count(p))
                return {550, "No such directory"};
            s_->cwd = p;
            return {250, "Directory changed"};
        }
        if (verb == "DELE") {
            const std::string p = s_->resolve(arg);
            if (!arg.empty() && arg.front() == '/' && s_->absoluteDeleRefused.count(p))
                return {550, "Permission denied"};
            if (!s_->files.erase(p))
                return {550, "No such file"};
            return {250, "Deleted"};
        }
        if (verb == "RMD") {
            const std::string p = s_->resolve(arg);
            auto forced = s_->rmdReplies.find(p);
            if (forced != s_->rmdReplies.end())
                return forced->second;
            if (!s_->dirs.count(p))
                return {550, "No such directory"};
            if (s_->hasChildren(p))
                return {550, "Directory not empty"};
            s_->dirs.erase(p);
            return {250, "Removed"};
        }
        if (verb == "MKD") {
            s_->dirs.insert(s_->resolve(arg));
            return {257, "Created"};
        }
        if (verb == "SIZE") {
            auto it = s_->files.find(s_->resolve(arg));
            if (it == s_->files.end())
                return {550, "Not a plain file"};
            return {213, std::to_string(it->second.size())};
        }
        if (verb == "MDTM") {
            if (!s_->files.count(s_->resolve(arg)))
                return {550, "Not a plain file"};
            return {213, "20250304213030"};
        }
        if (verb == "SITE")
            return {200, "SITE CHMOD command successful"};
        return {502, "Command not implemented"};
    }

    bool startTls(std::string &err) override {
        err = "TLS not available in the fake server";
        return false;
    }
    void setProtectedData(bool) override {}

    bool beginData(const std::string &cmd, skiff::FtpReply &reply) override {
        s_->commands.push_back(cmd);
        data_.clear();
        pos_ = 0;
        storing_.clear();
        if (cmd.compare(0, 4, "LIST") == 0) {
            const std::string arg = cmd.size() > 5 ? cmd.substr(5) : std::string();
            const std::string p = arg.empty() ? s_->cwd : s_->resolve(arg);
            if (s_->dirs.count(p)) {
                data_ = s_->listing(p);
            } else if (s_->files.count(p)) {
                data_ = "-rw-r--r-- 1 ftp ftp " + std::to_string(s_->files[p].size()) +
                        " Mar 04 21:30 " + skiff::baseName(p) + "\r\n";
            } else {
                reply = {550, "No such file or directory"};
                return false;
            }
        } else if (cmd.compare(0, 5, "RETR ") == 0) {
            auto it = s_->files.find(s_->resolve(cmd.substr(5)));
            if (it == s_->files.end()) {
                reply = {550, "No such file"};
                return false;
            }
            data_ = it->second;
        } else if (cmd.compare(0, 5, "STOR ") == 0) {
            storing_ = s_->resolve(cmd.substr(5));
        }
        reply = {150, "Opening data connection"};
        return true;
    }

    long readData(char *buf, std::size_t len) override {
        const std::size_t n = std::min(len, data_.size() - pos_);
        std::copy(data_.data() + pos_, data_.data() + pos_ + n, buf);
        pos_ += n;
        return static_cast<long>(n);
    }
    bool writeData(const char *buf, std::size_t len) override {
        data_.append(buf, len);
        return true;
    }
    skiff::FtpReply endData() override {
        if (!storing_.empty())
            s_->files[storing_] = data_;
        storing_.clear();
        return {226, "Transfer complete"};
    }
    void abortData() override {
        storing_.clear();
        data_.clear();
    }

    std::unique_ptr<skiff::FtpTransport> clone() const override {
        return std::make_unique<FakeFtpTransport>(s_);
    }

private:
    std::shared_ptr<FakeFtpServer> s_;
    bool open_ = false;
    std::string data_;
    std::size_t pos_ = 0;
    std::string storing_;
};

std::unique_ptr<skiff::FtpClient> connectedFtp(const std::shared_ptr<FakeFtpServer> &server,
                                               TestContext &t) {
    auto c = std::make_unique<skiff::FtpClient>(std::make_unique<FakeFtpTransport>(server));
    skiff::RemoteError err;
    t.check(c->connect(validProfile(skiff::ProtocolKind::Ftp), err),
            "ftp connect should succeed against the fake server: " + err.message);
    return c;
}

// Only the commands that change the tree.
std::vector<std::string> mutations(const FakeFtpServer &s) {
    std::vector<std::string> out;
    for (const auto &c : s.commands)
        if (c.compare(0, 5, "DELE ") == 0 || c.compare(0, 4, "RMD ") == 0)
            out.push_back(c);
    return out;
}

// ---------------------------------------------------------------------------

void test_profile_defaults_and_validation(TestContext &t) {
    skiff::ConnectionProfile p;
    t.check(p.protocol == skiff::ProtocolKind::Ftp, "default protocol should be FTP");
    t.check(p.known_hosts_policy == skiff::KnownHostsPolicy::AcceptNew,
            "default known_hosts policy should be AcceptNew");

    p.protocol = skiff::ProtocolKind::Ftps;
    t.check(skiff::effectivePort(p) == 21, "FTPS should default to port 21");
    t.check(skiff::wantsTls(p), "FTPS should negotiate TLS");
    p.protocol = skiff::ProtocolKind::Sftp;
    t.check(skiff::effectivePort(p) == 22, "SFTP should default to port 22");
    p.port = 2222;
    t.check(skiff::effectivePort(p) == 2222, "explicit port should win");
    p.protocol = skiff::ProtocolKind::Ftp;
    p.use_tls = true;
    t.check(skiff::wantsTls(p), "FTP with use_tls should negotiate TLS");

    skiff::RemoteError err;
    skiff::ConnectionProfile bad = validProfile();
    bad.host = "   ";
    t.check(!skiff::validateProfile(bad, err), "blank host should be rejected");
    t.check(err.category == skiff::ErrorCategory::InputValidation,
            "blank host should be an input validation error");
    bad = validProfile();
    bad.username.clear();
    t.check(!skiff::validateProfile(bad, err), "empty username should be rejected");
    bad = validProfile();
    bad.port = 70000;
    t.check(!skiff::validateProfile(bad, err), "out of range port should be rejected");
    t.checkContains(err.message, "65535", "port error should name the valid range");

    t.check(skiff::protocolFromName("sftp") == skiff::ProtocolKind::Sftp,
            "protocol names should parse case-insensitively");
    t.check(!skiff::protocolFromName("gopher").has_value(), "unknown protocol name");
}

void test_listing_parser(TestContext &t) {
    auto dir = skiff::parseListLine("drwxr-xr-x  2 owner group  4096 Mar 04 21:30 docs");
    t.check(dir.has_value(), "directory line should parse");
    if (dir) {
        t.check(dir->is_dir, "leading 'd' marks a directory");
        t.check(dir->name == "docs", "directory name should be the last field");
        t.check(dir->size == 0, "directories report size 0");
        t.check(dir->owner && *dir->owner == "owner", "owner should be captured");
        t.check(dir->group && *dir->group == "group", "group should be captured");
    }

    auto file = skiff::parseListLine("-rw-r--r--  1 owner group  1234 Mar 04 21:30 file.txt");
    t.check(file && !file->is_dir && file->size == 1234, "file size should be parsed");
    t.check(file && file->mtime_text == "Mar 04 21:30", "date fields should be kept verbatim");
    t.check(file && file->permissions == "-rw-r--r--", "permission text should be kept");

    auto shortLine = skiff::parseListLine("-rw-r--r-- 1 1234 Mar 04 21:30 f");
    t.check(shortLine && shortLine->size == 1234 && shortLine->name == "f",
            "lines without owner/group should still parse");
    t.check(shortLine && !shortLine->owner, "padded lines carry no owner");

    auto spaced = skiff::parseListLine("-rw-r--r-- 1 o g 10 Mar 04 21:30 my file.txt");
    t.check(spaced && spaced->name == "file.txt", "names with spaces keep their last word");

    t.check(!skiff::parseListLine("total 12").has_value(), "'total' line should be skipped");
    t.check(!skiff::parseListLine("").has_value(), "blank line should be skipped");

    const auto all = skiff::parseListing("total 3\r\n"
                                         "drwxr-xr-x 2 o g 0 Mar 04 21:30 .\r\n"
                                         "drwxr-xr-x 2 o g 0 Mar 04 21:30 ..\r\n"
                                         "drwxr-xr-x 2 o g 0 Mar 04 21:30 sub\r\n"
                                         "-rw-r--r-- 1 o g 5 Mar 04 21:30 a.txt\n");
    t.check(all.size() == 2, "dot entries and the total line should be dropped");
    t.check(all.size() == 2 && all[0].name == "sub" && all[1].name == "a.txt",
            "listing order should follow the server");

    t.check(skiff::formatPermissions(040755) == "drwxr-xr-x", "directory mode text");
    t.check(skiff::formatPermissions(0100644) == "-rw-r--r--", "file mode text");

    // Structured entries render as lines the FTP parser reads back.
    skiff::RemoteEntry rec;
    rec.name = "report.txt";
    rec.size = 1234;
    rec.mode = 0100640;
    rec.mtime = 1741123830ULL;
    const std::string line = skiff::formatLongListing(rec);
    t.check(line == "-rw-r----- 1 - -       1234 Mar 04 21:30 report.txt",
            "long listing line for a file: " + line);
    auto back = skiff::parseListLine(line);
    t.check(back && back->name == "report.txt" && !back->is_dir && back->size == 1234,
            "rendered file line parses back");
    t.check(back && back->permissions == "-rw-r-----", "rendered permissions parse back");
    t.check(back && back->mtime_text == "Mar 04 21:30", "rendered time parses back");
    t.check(back && back->listing_line == line, "parsed entry keeps its source line");

    skiff::RemoteEntry sub;
    sub.name = "sub";
    sub.is_dir = true;
    sub.size = 4096;
    sub.mode = 040755;
    auto subBack = skiff::parseListLine(skiff::formatLongListing(sub));
    t.check(subBack && subBack->is_dir && subBack->name == "sub" && subBack->size == 0,
            "rendered directory line parses back as a directory");

    auto when = skiff::parseMdtm("20250304213030");
    t.check(when && *when == 1741123830ULL, "MDTM timestamp should be UTC");
    t.check(!skiff::parseMdtm("550 not a file").has_value(), "MDTM error text");
}

void test_error_classifier(TestContext &t) {
    using skiff::ErrorCategory;
    t.check(skiff::classifyResolverError(EAI_NONAME) == ErrorCategory::Resolution,
            "EAI_NONAME is a resolution error");
    t.check(skiff::classifyResolverError(EAI_AGAIN) == ErrorCategory::Resolution,
            "EAI_AGAIN is a resolution error");
    t.check(skiff::classifySocketErrno(ETIMEDOUT) == ErrorCategory::Timeout,
            "ETIMEDOUT is a timeout");
    t.check(skiff::classifySocketErrno(ECONNREFUSED) == ErrorCategory::Refused,
            "ECONNREFUSED is refused");
    t.check(skiff::classifySocketErrno(EHOSTUNREACH) == ErrorCategory::Unclassified,
            "other errno values stay unclassified");
    t.check(skiff::classifyFtpReply(226) == ErrorCategory::None, "226 is not an error");
    t.check(skiff::classifyFtpReply(450) == ErrorCategory::PermissionOrTemporary,
            "4xx replies are temporary");
    t.check(skiff::classifyFtpReply(550) == ErrorCategory::PermissionOrTemporary,
            "5xx replies are permission errors");
    t.check(skiff::classifyLoginReply(530) == ErrorCategory::Authentication,
            "530 at login is an authentication error");
    t.check(skiff::classifyLoginReply(421) == ErrorCategory::PermissionOrTemporary,
            "421 at login is temporary");

    t.check(skiff::isDirectoryNotEmpty(550, "Permission denied"), "550 counts as not empty");
    t.check(skiff::isDirectoryNotEmpty(450, "Could not delete /x"),
            "'could not delete' counts as not empty");
    t.check(!skiff::isDirectoryNotEmpty(553, "Permission denied"),
            "other refusals are not 'not empty'");

    t.checkContains(skiff::describe(ErrorCategory::Resolution, "nohost", 21, ""),
                    "Cannot resolve hostname 'nohost'", "resolution message");
    t.check(skiff::describe(ErrorCategory::Timeout, "h", 21, "") ==
                "Connection timeout. Server 'h:21' did not respond.",
            "timeout message");
    t.check(skiff::describe(ErrorCategory::Refused, "h", 2121, "") ==
                "Connection refused. Server 'h:2121' is not accepting connections.",
            "refused message");
    t.check(skiff::describe(ErrorCategory::Authentication, "h", 21, "") ==
                "Authentication failed. Please check username and password.",
            "authentication message without details");
    t.checkContains(skiff::describe(ErrorCategory::Unclassified, "h", 21, "boom"),
                    "Connection error: boom", "unclassified message");
}

void test_remote_paths(TestContext &t) {
    t.check(skiff::stripTrailingSlash("/a/b/") == "/a/b", "trailing slash removed");
    t.check(skiff::stripTrailingSlash("/") == "/", "root keeps its slash");
    t.check(skiff::parentPath("/a") == "/", "parent of top-level entry is root");
    t.check(skiff::parentPath("/") == "/", "root has no parent");
    t.check(skiff::parentPath("/a/b/") == "/a", "parent ignores trailing slash");
    t.check(skiff::baseName("/a/b") == "b", "basename");
    t.check(skiff::joinPath("/", "x") == "/x", "join on root");
    t.check(skiff::joinPath("/a", "x") == "/a/x", "join on subdirectory");
    t.check(skiff::normalizePath("../x", "/a/b") == "/a/x", "relative with ..");
    t.check(skiff::normalizePath("..", "/") == "/", ".. at root stays at root");
    t.check(skiff::normalizePath("//a/./b//") == "/a/b", "duplicate separators collapse");
    t.check(skiff::normalizePath("", "/home") == "/home", "empty path is the cwd");
}

void test_mock_connect_and_disconnect(TestContext &t) {
    skiff::MockRemoteClient c;
    skiff::RemoteError err;
    auto bad = validProfile();
    bad.host = "";
    t.check(!c.connect(bad, err), "connect should fail when host is empty");
    t.check(c.filesystem()->connectCount() == 0, "validation happens before connecting");

    t.check(c.connect(validProfile(), err), "connect should succeed with host+username");
    t.check(c.isConnected(), "client should report connected");
    t.check(!c.connect(validProfile(), err), "second connect should be refused");

    c.disconnect();
    c.disconnect();
    t.check(!c.isConnected(), "disconnect twice leaves the client disconnected");

    std::vector<skiff::RemoteEntry> out;
    std::string lerr;
    t.check(!c.list("/", out, lerr), "list should fail when disconnected");
    t.check(lerr == "Not connected", "disconnected list reports 'Not connected'");
}

void test_mock_listing_and_cursor(TestContext &t) {
    skiff::MockRemoteClient c;
    skiff::RemoteError cerr;
    c.connect(validProfile(), cerr);
    std::vector<skiff::RemoteEntry> out;
    std::string err;
    t.check(c.list("/", out, err), "root listing should succeed");
    t.check(out.size() == 3 && out[0].name == "home" && out[1].name == "var" &&
                out[2].name == "readme.txt",
            "directories first, then files, by name");
    t.check(out.size() == 3 && out[0].listing_line.rfind("drwxr-xr-x 1 ", 0) == 0,
            "stateless entries carry an ls -l line");
    auto parsed = out.size() == 3 ? skiff::parseListLine(out[2].listing_line) : std::nullopt;
    t.check(parsed && parsed->name == "readme.txt" && parsed->size == out[2].size,
            "stateless listing line reads like an FTP listing");

    t.check(c.changeDir("home", err), "relative changeDir should work");
    t.check(c.currentDir() == "/home", "cursor follows changeDir");
    t.check(c.list("", out, err) && out.size() == 2, "empty path lists the cursor");
    t.check(!c.changeDir("missing", err), "changeDir to a missing directory should fail");
    t.checkContains(err, "No such directory", "missing directory message");
    t.check(!c.changeDir("/readme.txt", err), "changeDir to a file should fail");
    t.checkContains(err, "Not a directory", "file target message");
    t.check(c.currentDir() == "/home", "failed changeDir keeps the cursor");

    skiff::RemoteEntry info;
    err.clear();
    t.check(!c.getFileInfo("/nope", info, err) && err.empty(),
            "getFileInfo on a missing path returns false with no error text");
}

void test_stateless_recursive_delete_order(TestContext &t) {
    auto fs = std::make_shared<skiff::MockFilesystem>();
    fs->addFile("/a/f", "1");
    fs->addFile("/a/b/g", "2");
    skiff::MockRemoteClient c(fs);
    skiff::RemoteError cerr;
    c.connect(validProfile(), cerr);
    fs->clearJournal();

    std::string err;
    t.check(c.deleteDirRecursive("/a/", err), "recursive delete should succeed: " + err);
    const std::vector<std::string> expected = {
        "getFileInfo /a", "list /a",          "deleteFile /a/f",   "getFileInfo /a/b",
        "list /a/b",      "deleteFile /a/b/g", "removeDir /a/b", "removeDir /a"};
    t.check(fs->journal() == expected, "files, then subdirectories, then the directory");
    t.check(!fs->exists("/a"), "tree should be gone");
}

void test_stateless_recursive_delete_stops_on_failure(TestContext &t) {
    auto fs = std::make_shared<skiff::MockFilesystem>();
    fs->addFile("/a/f", "1");
    fs->addFile("/a/b/g", "2");
    fs->failOn("deleteFile", "/a/f", "Permission denied");
    skiff::MockRemoteClient c(fs);
    skiff::RemoteError cerr;
    c.connect(validProfile(), cerr);

    std::string err;
    t.check(!c.deleteDirRecursive("/a", err), "failure should stop the walk");
    t.check(err == "Failed to delete file 'f': Permission denied",
            "failure message names the entry: " + err);
    t.check(fs->exists("/a/b/g"), "nothing after the failure is touched");
}

void test_stateless_recursive_delete_edges(TestContext &t) {
    auto fs = std::make_shared<skiff::MockFilesystem>();
    fs->addDir("/empty");
    fs->addFile("/plain.txt", "x");
    skiff::MockRemoteClient c(fs);
    skiff::RemoteError cerr;
    c.connect(validProfile(), cerr);
    fs->clearJournal();

    std::string err;
    t.check(c.deleteDirRecursive("/empty", err), "empty directory delete should succeed");
    const std::vector<std::string> expected = {"getFileInfo /empty", "list /empty",
                                               "removeDir /empty"};
    t.check(fs->journal() == expected, "empty directory behaves like a plain remove");

    t.check(c.deleteDirRecursive("/plain.txt", err), "a file target is deleted as a file");
    t.check(!fs->exists("/plain.txt"), "file should be gone");

    t.check(!c.deleteDirRecursive("/ghost", err), "missing directory should fail");
    t.checkContains(err, "No such directory", "missing directory reports the remove error");
}

void test_mock_clones_share_filesystem(TestContext &t) {
    skiff::MockRemoteClient c;
    skiff::RemoteError err;
    c.connect(validProfile(), err);
    auto clone = c.newConnectionLike(validProfile(), err);
    t.check(clone && clone->isConnected(), "clone should come back connected");
    std::string e;
    t.check(clone && clone->createDir("/shared", e), "clone can create a directory");
    t.check(c.filesystem()->isDir("/shared"), "both connections see the same tree");
    t.check(c.filesystem()->connectCount() == 2, "clone opened its own connection");

    auto bad = validProfile();
    bad.username.clear();
    t.check(!c.newConnectionLike(bad, err), "clone with an invalid profile fails");
    t.check(err.category == skiff::ErrorCategory::InputValidation,
            "clone validation error category");
}

void test_capabilities(TestContext &t) {
    skiff::MockRemoteClient mock;
    skiff::FtpClient ftp(std::make_unique<FakeFtpTransport>(std::make_shared<FakeFtpServer>()));
    skiff::Libssh2SftpClient sftp;
    t.check(skiff::permissionsOf(&mock) != nullptr, "mock supports chmod");
    t.check(skiff::permissionsOf(&ftp) != nullptr, "FTP supports SITE CHMOD");
    t.check(skiff::timesOf(&ftp) == nullptr, "FTP cannot set modification times");
    t.check(skiff::permissionsOf(&sftp) != nullptr, "SFTP supports chmod");
    t.check(skiff::timesOf(&sftp) != nullptr, "SFTP supports setting times");
    t.check(!sftp.isConnected(), "fresh SFTP client is disconnected");
}

void test_ftp_validation_opens_nothing(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    skiff::FtpClient c(std::make_unique<FakeFtpTransport>(server));
    auto p = validProfile(skiff::ProtocolKind::Ftp);
    p.host = "";
    skiff::RemoteError err;
    t.check(!c.connect(p, err), "empty host should fail");
    t.check(err.category == skiff::ErrorCategory::InputValidation,
            "empty host is an input validation error");
    t.check(server->opens == 0, "no connection should be opened for invalid input");
}

void test_ftp_login(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    auto c = connectedFtp(server, t);
    t.check(c->isConnected(), "client should be connected");
    t.check(c->protocol() == skiff::ProtocolKind::Ftp, "plain FTP profile stays FTP");
    t.check(server->count("USER alice") == 1 && server->count("PASS secret") == 1,
            "USER/PASS sequence should be sent");
    t.check(server->count("TYPE I") == 1, "binary mode should be selected");
    c->disconnect();
    c->disconnect();
    t.check(!c->isConnected(), "disconnect should be idempotent");
    t.check(server->count("QUIT") == 1, "QUIT is sent once");

    auto rejecting = std::make_shared<FakeFtpServer>();
    rejecting->loginCode = 530;
    skiff::FtpClient r(std::make_unique<FakeFtpTransport>(rejecting));
    skiff::RemoteError err;
    t.check(!r.connect(validProfile(skiff::ProtocolKind::Ftp), err), "530 should fail");
    t.check(err.category == skiff::ErrorCategory::Authentication,
            "530 is an authentication failure");
    t.checkContains(err.message, "Authentication failed", "authentication message");
    t.check(!r.isConnected(), "failed login leaves the client disconnected");
}

void test_ftp_list_and_pwd(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->dirs.insert("/pub");
    server->dirs.insert("/we\"ird");
    server->files["/pub/a.txt"] = "hello";
    auto c = connectedFtp(server, t);

    std::vector<skiff::RemoteEntry> out;
    std::string err;
    t.check(c->list("/pub", out, err), "list should succeed: " + err);
    t.check(out.size() == 1 && out[0].name == "a.txt" && out[0].size == 5,
            "list should parse the LIST payload");
    t.check(c->currentDir() == "/pub", "listing moves the cursor to the listed directory");

    t.check(!c->list("/missing", out, err), "list of a missing directory should fail");
    t.checkContains(err, "Cannot access directory", "list failure message");
    t.check(out.empty(), "failed listing leaves the output empty");

    t.check(c->changeDir("/we\"ird", err), "changeDir to a quoted name");
    t.check(c->currentDir() == "/we\"ird", "doubled quotes in PWD should be unescaped");
}

void test_ftp_file_info(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->dirs.insert("/pub");
    server->files["/pub/a.txt"] = "hello";
    auto c = connectedFtp(server, t);

    skiff::RemoteEntry info;
    std::string err;
    t.check(c->getFileInfo("/pub/a.txt", info, err), "file info for a file");
    t.check(!info.is_dir && info.size == 5 && info.name == "a.txt", "SIZE drives file info");
    t.check(info.mtime && *info.mtime == 1741123830ULL, "MDTM drives modification time");

    t.check(c->getFileInfo("/pub", info, err), "file info for a directory");
    t.check(info.is_dir, "a trial CWD detects directories");
    t.check(c->currentDir() == "/", "the trial CWD restores the cursor");

    err.clear();
    t.check(!c->getFileInfo("/nothing", info, err), "missing path");
    t.check(err.empty(), "missing path reports no error text");
}

void test_ftp_recursive_delete(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->dirs = {"/", "/pub", "/pub/a", "/pub/a/sub"};
    server->files["/pub/a/x.txt"] = "x";
    server->files["/pub/a/b.txt"] = "b";
    server->files["/pub/a/sub/c.txt"] = "c";
    auto c = connectedFtp(server, t);
    std::string err;
    c->changeDir("/pub", err);
    server->commands.clear();

    t.check(c->deleteDirRecursive("/pub/a/", err), "recursive delete should succeed: " + err);
    const std::vector<std::string> expected = {
        "RMD /pub/a",          "DELE /pub/a/b.txt", "DELE /pub/a/x.txt", "RMD /pub/a/sub",
        "DELE /pub/a/sub/c.txt", "RMD /pub/a/sub",  "RMD /pub/a"};
    t.check(mutations(*server) == expected, "FTP delete order: first RMD, files, subdirs, RMD");
    t.check(c->lastMessage() == "Directory deleted recursively", "outcome message");
    t.check(!server->dirs.count("/pub/a"), "tree should be gone");
    t.check(c->currentDir() == "/pub", "cursor is restored after the walk");

    server->dirs.insert("/pub/empty");
    t.check(c->deleteDirRecursive("empty", err), "empty directory by relative name");
    t.check(c->lastMessage() == "Directory deleted", "plain RMD outcome message");
}

void test_ftp_relative_delete_fallback(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->dirs = {"/", "/d"};
    server->files["/d/f.txt"] = "f";
    server->absoluteDeleRefused.insert("/d/f.txt");
    auto c = connectedFtp(server, t);
    server->commands.clear();

    std::string err;
    t.check(c->deleteDirRecursive("/d", err), "relative DELE fallback should succeed: " + err);
    t.check(server->count("DELE f.txt") == 1, "fallback deletes by name inside the directory");
    t.check(c->currentDir() == "/", "cursor returns to where it was");
    t.check(server->files.empty() && !server->dirs.count("/d"), "tree should be gone");
}

void test_ftp_rmd_refusal_is_not_walked(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->dirs = {"/", "/locked"};
    server->files["/locked/f"] = "f";
    server->rmdReplies["/locked"] = skiff::FtpReply{553, "Permission denied"};
    auto c = connectedFtp(server, t);
    server->commands.clear();

    std::string err;
    t.check(!c->deleteDirRecursive("/locked", err), "refused RMD should fail");
    t.checkContains(err, "Cannot delete directory", "refusal message");
    t.check(server->count("CWD") == 0 && server->count("LIST") == 0 &&
                server->count("DELE") == 0,
            "only a 'not empty' refusal triggers the walk");
    t.check(server->files.count("/locked/f") == 1, "contents untouched");
}

void test_ftp_connection_loss(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->files["/f"] = "f";
    auto c = connectedFtp(server, t);
    server->dropOn = "DELE";
    std::string err;
    t.check(!c->deleteFile("/f", err), "delete over a dropped connection fails");
    t.checkContains(err, "Connection to server lost", "loss message");
    t.check(!c->isConnected(), "adapter reports the dropped connection");
    t.check(!c->createDir("/x", err) && err == "Not connected", "later calls fail fast");
}

void test_ftp_single_entry_ops(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->files["/old"] = "o";
    auto c = connectedFtp(server, t);
    std::string err;
    t.check(c->rename("/old", "/new", err) == false, "fake server has no RNFR support");
    t.checkContains(err, "502", "rename failure carries the reply");
    t.check(c->createDir("/made", err), "MKD should succeed");
    t.check(server->dirs.count("/made") == 1, "directory created");
    t.check(c->removeDir("/made/", err), "RMD strips trailing slashes");
    t.check(c->setPermissions("/old", 0644, err), "SITE CHMOD accepted");
    t.check(server->count("SITE CHMOD 644 /old") == 1, "mode is sent in octal");

    skiff::RemoteError cerr;
    auto clone = c->newConnectionLike(validProfile(skiff::ProtocolKind::Ftp), cerr);
    t.check(clone && clone->isConnected(), "worker connection opens a second session");
    t.check(server->opens == 2, "worker connection has its own control channel");
}

void test_ftp_reply_categories(TestContext &t) {
    auto server = std::make_shared<FakeFtpServer>();
    server->forced["MKD /busy"] = {450, "Requested file action not taken"};
    auto c = connectedFtp(server, t);
    std::string err;

    t.check(!c->createDir("/busy", err), "MKD refused with 450");
    t.check(err == "Temporary error: 450 Requested file action not taken",
            "transient reply reads as a temporary error: " + err);
    t.check(c->lastErrorCategory() == skiff::ErrorCategory::PermissionOrTemporary,
            "450 is a permission/temporary failure");

    t.check(!c->deleteFile("/missing", err), "DELE of a missing file fails");
    t.check(err == "550 No such file", "permanent reply keeps the server wording: " + err);
    t.check(c->lastErrorCategory() == skiff::ErrorCategory::PermissionOrTemporary,
            "550 is a permission/temporary failure");

    std::vector<skiff::RemoteEntry> out;
    t.check(!c->list("/nowhere", out, err), "list of a missing directory fails");
    t.checkContains(err, "Cannot access directory: 550", "list failure names the reply");

    server->dropOn = "RMD";
    t.check(!c->removeDir("/x", err), "RMD over a dropped connection fails");
    t.check(c->lastErrorCategory() == skiff::ErrorCategory::Unclassified,
            "no reply at all is unclassified");
}

void test_log_policy(TestContext &t) {
    ::unsetenv("SKIFF_ENV");
    ::setenv("SKIFF_LOG_SENSITIVE", "1", 1);
    skiff::LogPolicy p = skiff::LogPolicy::fromEnvironment();
    t.check(!p.development && !p.sensitive, "sensitive flag ignored outside development");
    t.check(p.path("/srv/data/report.txt") == "report.txt", "only the file name is logged");
    t.check(p.path("/srv/data/") == "<path>", "directory paths are masked");
    t.check(p.detail("530 Login incorrect") == "<hidden>", "details are hidden");

    ::setenv("SKIFF_ENV", "  Dev ", 1);
    ::setenv("SKIFF_LOG_SENSITIVE", "Yes", 1);
    p = skiff::LogPolicy::fromEnvironment();
    t.check(p.development && p.sensitive, "trimmed, case-insensitive values");
    t.check(p.path("/srv/data/report.txt") == "/srv/data/report.txt", "full path when sensitive");
    t.check(skiff::loggablePath("/a/b") == "/a/b", "loggablePath follows the environment");

    ::setenv("SKIFF_LOG_SENSITIVE", "0", 1);
    t.check(!skiff::LogPolicy::fromEnvironment().sensitive, "flag off");
    ::unsetenv("SKIFF_ENV");
    ::unsetenv("SKIFF_LOG_SENSITIVE");
}

// One control session and one passive data connection on the loopback
// interface. A STOR ends with 226 once the client closes the data socket;
// ABOR is then answered separately.
class LoopbackFtpPeer {
public:
    LoopbackFtpPeer() {
        ctrlListen_ = listenLoopback(ctrlPort_);
        dataListen_ = listenLoopback(dataPort_);
        if (ready())
            thread_ = std::thread([this]() { run(); });
    }
    ~LoopbackFtpPeer() {
        if (thread_.joinable())
            thread_.join();
        if (ctrlListen_ != -1)
            ::close(ctrlListen_);
        if (dataListen_ != -1)
            ::close(dataListen_);
    }

    bool ready() const { return ctrlListen_ != -1 && dataListen_ != -1; }
    std::uint16_t port() const { return ctrlPort_; }
    // Valid once the session has ended.
    std::size_t storedBytes() const { return stored_.load(); }

private:
    static int listenLoopback(std::uint16_t &port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd == -1)
            return -1;
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        a.sin_port = 0;
        socklen_t len = sizeof(a);
        if (::bind(fd, reinterpret_cast<sockaddr *>(&a), sizeof(a)) != 0 ||
            ::listen(fd, 1) != 0 ||
            ::getsockname(fd, reinterpret_cast<sockaddr *>(&a), &len) != 0) {
            ::close(fd);
            return -1;
        }
        port = ntohs(a.sin_port);
        return fd;
    }

    static bool readLine(int fd, std::string &line) {
        line.clear();
        char c = 0;
        for (;;) {
            if (::recv(fd, &c, 1, 0) <= 0)
                return false;
            if (c == '\n')
                return true;
            if (c != '\r')
                line += c;
        }
    }

    static void reply(int fd, const std::string &text) {
        const std::string wire = text + "\r\n";
        ::send(fd, wire.data(), wire.size(), MSG_NOSIGNAL);
    }

    void run() {
        const int ctrl = ::accept(ctrlListen_, nullptr, nullptr);
        if (ctrl == -1)
            return;
        reply(ctrl, "220 loopback ready");
        std::string line;
        while (readLine(ctrl, line)) {
            if (line == "PASV") {
                reply(ctrl, "227 Entering Passive Mode (127,0,0,1," +
                                std::to_string(dataPort_ / 256) + "," +
                                std::to_string(dataPort_ % 256) + ")");
            } else if (line.compare(0, 5, "STOR ") == 0) {
                const int data = ::accept(dataListen_, nullptr, nullptr);
                reply(ctrl, "150 Ok to send data");
                char buf[256];
                ssize_t n = 0;
                while (data != -1 && (n = ::recv(data, buf, sizeof(buf), 0)) > 0)
                    stored_ += static_cast<std::size_t>(n);
                if (data != -1)
                    ::close(data);
                reply(ctrl, "226 Transfer complete");
            } else if (line == "ABOR") {
                reply(ctrl, "225 No transfer to abort");
            } else if (line == "NOOP") {
                reply(ctrl, "200 NOOP ok");
            } else if (line == "QUIT") {
                reply(ctrl, "221 Goodbye");
                break;
            } else {
                reply(ctrl, "502 Command not implemented");
            }
        }
        ::close(ctrl);
    }

    int ctrlListen_ = -1;
    int dataListen_ = -1;
    std::uint16_t ctrlPort_ = 0;
    std::uint16_t dataPort_ = 0;
    std::atomic<std::size_t> stored_{0};
    std::thread thread_;
};

void test_socket_abort_keeps_replies_in_step(TestContext &t) {
    LoopbackFtpPeer peer;
    t.check(peer.ready(), "loopback listeners");
    if (!peer.ready())
        return;
    {
        skiff::SocketFtpTransport transport;
        skiff::RemoteError err;
        t.check(transport.open("127.0.0.1", peer.port(), 5, err),
                "control connection opens: " + err.message);
        t.check(transport.readReply().code == 220, "greeting");

        skiff::FtpReply r;
        t.check(transport.beginData("STOR /upload.bin", r), "STOR accepted: " + r.text);
        t.check(transport.writeData("partial", 7), "some data goes out");
        transport.abortData();

        const skiff::FtpReply noop = transport.command("NOOP");
        t.check(noop.code == 200, "next command gets its own reply after an abort, got " +
                                      std::to_string(noop.code) + " " + noop.text);
        t.check(transport.command("QUIT").code == 221, "session still in step at QUIT");
        transport.close();
    }
    t.check(peer.storedBytes() == 7, "server saw the partial upload");
}

} // namespace

int main() {
    TestContext t;
    test_profile_defaults_and_validation(t);
    test_listing_parser(t);
    test_error_classifier(t);
    test_remote_paths(t);
    test_mock_connect_and_disconnect(t);
    test_mock_listing_and_cursor(t);
    test_stateless_recursive_delete_order(t);
    test_stateless_recursive_delete_stops_on_failure(t);
    test_stateless_recursive_delete_edges(t);
    test_mock_clones_share_filesystem(t);
    test_capabilities(t);
    test_ftp_validation_opens_nothing(t);
    test_ftp_login(t);
    test_ftp_list_and_pwd(t);
    test_ftp_file_info(t);
    test_ftp_recursive_delete(t);
    test_ftp_relative_delete_fallback(t);
    test_ftp_rmd_refusal_is_not_walked(t);
    test_ftp_connection_loss(t);
    test_ftp_single_entry_ops(t);
    test_ftp_reply_categories(t);
    test_log_policy(t);
    test_socket_abort_keeps_replies_in_step(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] skiff_core_tests\n";
    return EXIT_SUCCESS;
}
