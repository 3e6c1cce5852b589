// FTP command layer: login sequence, cursor handling, streaming transfers and
// the recursive delete that has to walk the server-side current directory.
#include "skiff/FtpClient.hpp"
#include "skiff/ErrorClassifier.hpp"
#include "skiff/ListingParser.hpp"
#include "skiff/RemotePath.hpp"
#include "skiff/SocketFtpTransport.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace skiff {

static const std::size_t CHUNK = 64 * 1024;

static std::string replyText(const FtpReply &r) {
    if (r.code == 0)
        return r.text.empty() ? std::string("Connection to server lost") : r.text;
    return std::to_string(r.code) + " " + r.text;
}

// Transient (4xx) replies read as temporary errors, permanent ones keep the
// server's wording.
static std::string replyError(const FtpReply &r) {
    const ErrorCategory c = classifyFtpReply(r.code);
    if (c == ErrorCategory::PermissionOrTemporary && r.code < 500)
        return describe(c, std::string(), 0, replyText(r));
    return replyText(r);
}

FtpClient::FtpClient() : FtpClient(std::make_unique<SocketFtpTransport>()) {}

FtpClient::FtpClient(std::unique_ptr<FtpTransport> transport)
    : transport_(std::move(transport)) {}

FtpClient::~FtpClient() {
    disconnect();
}

FtpReply FtpClient::cmd(const std::string &line) {
    return transport_->command(line);
}

bool FtpClient::isConnected() const {
    return connected_ && transport_->isOpen();
}

bool FtpClient::ensureConnected(std::string &err) const {
    if (!isConnected()) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool FtpClient::failReply(const FtpReply &r, const std::string &prefix, std::string &err) {
    lastError_ = classifyFtpReply(r.code);
    if (lastError_ == ErrorCategory::None)
        lastError_ = ErrorCategory::Unclassified;
    err = prefix + replyError(r);
    return false;
}

void FtpClient::failConnect(ErrorCategory c, const std::string &raw, RemoteError &err) {
    err.set(c, describe(c, profile_.host, effectivePort(profile_), raw));
    transport_->close();
}

bool FtpClient::connect(const ConnectionProfile &profile, RemoteError &err) {
    if (connected_) {
        err.set(ErrorCategory::Unclassified, "Already connected");
        return false;
    }
    if (!validateProfile(profile, err))
        return false;

    profile_ = profile;
    protocol_ = wantsTls(profile) ? ProtocolKind::Ftps : ProtocolKind::Ftp;
    const std::uint16_t port = effectivePort(profile);
    if (!transport_->open(profile.host, port, kConnectTimeoutSeconds, err))
        return false;

    FtpReply hello = transport_->readReply();
    if (hello.code == 0) {
        // Accepted but silent: the server never sent its greeting.
        failConnect(ErrorCategory::Timeout, replyText(hello), err);
        return false;
    }
    if (hello.code != 220) {
        failConnect(ErrorCategory::PermissionOrTemporary, replyText(hello), err);
        return false;
    }

    const bool tls = wantsTls(profile);
    if (tls) {
        FtpReply auth = cmd("AUTH TLS");
        if (auth.code != 234) {
            failConnect(auth.code == 0 ? ErrorCategory::Unclassified
                                       : ErrorCategory::PermissionOrTemporary,
                        "AUTH TLS refused: " + replyText(auth), err);
            return false;
        }
        std::string terr;
        if (!transport_->startTls(terr)) {
            failConnect(ErrorCategory::Unclassified, "TLS handshake failed: " + terr, err);
            return false;
        }
    }

    FtpReply login = cmd("USER " + profile.username);
    if (login.code == 331 || login.code == 332)
        login = cmd("PASS " + profile.secret);
    if (login.code != 230 && login.code != 202) {
        ErrorCategory c = classifyLoginReply(login.code);
        if (c == ErrorCategory::None)
            c = ErrorCategory::Authentication;
        failConnect(c, replyText(login), err);
        return false;
    }

    if (tls) {
        FtpReply pbsz = cmd("PBSZ 0");
        FtpReply prot = pbsz.positive() ? cmd("PROT P") : pbsz;
        if (!prot.positive()) {
            failConnect(ErrorCategory::PermissionOrTemporary,
                        "PROT P refused: " + replyText(prot), err);
            return false;
        }
        transport_->setProtectedData(true);
    }

    FtpReply type = cmd("TYPE I");
    if (!type.positive()) {
        failConnect(ErrorCategory::PermissionOrTemporary, replyText(type), err);
        return false;
    }

    connected_ = true;
    err.clear();
    return true;
}

void FtpClient::disconnect() {
    if (transport_->isOpen()) {
        if (connected_)
            cmd("QUIT");
        transport_->close();
    }
    connected_ = false;
}

std::string FtpClient::absolute(const std::string &path) {
    if (!path.empty() && path.front() == '/')
        return normalizePath(path);
    return normalizePath(path, currentDir());
}

bool FtpClient::readListing(const std::string &command,
                            std::string &text,
                            std::string &err) {
    text.clear();
    FtpReply r;
    if (!transport_->beginData(command, r))
        return failReply(r, {}, err);
    std::vector<char> buf(CHUNK);
    for (;;) {
        long n = transport_->readData(buf.data(), buf.size());
        if (n > 0) {
            text.append(buf.data(), static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else {
            transport_->abortData();
            err = "Listing transfer failed";
            return false;
        }
    }
    FtpReply fin = transport_->endData();
    if (!fin.positive())
        return failReply(fin, {}, err);
    return true;
}

bool FtpClient::list(const std::string &remote_path,
                     std::vector<RemoteEntry> &out,
                     std::string &err) {
    out.clear();
    if (!ensureConnected(err))
        return false;
    if (!remote_path.empty()) {
        FtpReply r = cmd("CWD " + remote_path);
        if (!r.positive())
            return failReply(r, "Cannot access directory: ", err);
    }
    std::string text;
    if (!readListing("LIST", text, err))
        return false;
    out = parseListing(text);
    return true;
}

std::string FtpClient::currentDir() {
    if (!isConnected())
        return "/";
    FtpReply r = cmd("PWD");
    if (r.code != 257)
        return "/";
    // 257 "/path/with ""quotes""" is current directory
    const auto first = r.text.find('"');
    if (first == std::string::npos)
        return "/";
    std::string out;
    for (std::size_t i = first + 1; i < r.text.size(); ++i) {
        if (r.text[i] == '"') {
            if (i + 1 < r.text.size() && r.text[i + 1] == '"') {
                out += '"';
                ++i;
                continue;
            }
            break;
        }
        out += r.text[i];
    }
    return out.empty() ? "/" : out;
}

bool FtpClient::changeDir(const std::string &remote_path, std::string &err) {
    if (!ensureConnected(err))
        return false;
    FtpReply r = cmd("CWD " + remote_path);
    if (!r.positive())
        return failReply(r, {}, err);
    return true;
}

bool FtpClient::upload(const std::string &local,
                       const std::string &remote,
                       std::string &err,
                       ProgressCB progress,
                       CancelCB shouldCancel) {
    if (!ensureConnected(err))
        return false;

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Cannot open local file for reading";
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    FtpReply r;
    if (!transport_->beginData("STOR " + remote, r)) {
        std::fclose(lf);
        return failReply(r, "Upload refused: ", err);
    }

    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            transport_->abortData();
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                transport_->abortData();
                std::fclose(lf);
                err = "Local read failed";
                return false;
            }
            break;
        }
        if (!transport_->writeData(buf.data(), n)) {
            transport_->abortData();
            std::fclose(lf);
            err = "Remote write failed";
            return false;
        }
        done += n;
        if (progress)
            progress(done, total);
    }
    std::fclose(lf);

    FtpReply fin = transport_->endData();
    if (!fin.positive())
        return failReply(fin, "Upload failed: ", err);
    return true;
}

bool FtpClient::download(const std::string &remote,
                         const std::string &local,
                         std::string &err,
                         ProgressCB progress,
                         CancelCB shouldCancel) {
    if (!ensureConnected(err))
        return false;

    std::size_t total = 0;
    FtpReply sz = cmd("SIZE " + remote);
    if (sz.code == 0)
        return failReply(sz, {}, err);
    if (sz.code == 213)
        total = static_cast<std::size_t>(std::strtoull(sz.text.c_str(), nullptr, 10));

    FtpReply r;
    if (!transport_->beginData("RETR " + remote, r))
        return failReply(r, "Download refused: ", err);
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        transport_->abortData();
        err = "Cannot open local file for writing";
        return false;
    }

    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            transport_->abortData();
            std::fclose(lf);
            err = "Cancelled by user";
            return false;
        }
        long n = transport_->readData(buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
                static_cast<std::size_t>(n)) {
                transport_->abortData();
                std::fclose(lf);
                err = "Local write failed";
                return false;
            }
            done += static_cast<std::size_t>(n);
            if (progress)
                progress(done, total);
        } else if (n == 0) {
            break;
        } else {
            transport_->abortData();
            std::fclose(lf);
            err = "Remote read failed";
            return false;
        }
    }
    if (std::fclose(lf) != 0) {
        transport_->endData();
        err = "Local write failed";
        return false;
    }

    FtpReply fin = transport_->endData();
    if (!fin.positive())
        return failReply(fin, "Download failed: ", err);
    return true;
}

bool FtpClient::deleteFile(const std::string &remote_path, std::string &err) {
    if (!ensureConnected(err))
        return false;
    FtpReply r = cmd("DELE " + remote_path);
    if (!r.positive())
        return failReply(r, {}, err);
    return true;
}

bool FtpClient::createDir(const std::string &remote_dir, std::string &err) {
    if (!ensureConnected(err))
        return false;
    FtpReply r = cmd("MKD " + remote_dir);
    if (!r.positive())
        return failReply(r, {}, err);
    return true;
}

bool FtpClient::removeDir(const std::string &remote_dir, std::string &err) {
    if (!ensureConnected(err))
        return false;
    FtpReply r = cmd("RMD " + stripTrailingSlash(remote_dir));
    if (!r.positive())
        return failReply(r, {}, err);
    return true;
}

bool FtpClient::rename(const std::string &from,
                       const std::string &to,
                       std::string &err) {
    if (!ensureConnected(err))
        return false;
    FtpReply r = cmd("RNFR " + from);
    if (r.code != 350)
        return failReply(r, {}, err);
    r = cmd("RNTO " + to);
    if (!r.positive())
        return failReply(r, {}, err);
    return true;
}

void FtpClient::restoreCursor(const std::string &saved, const std::string &fallback) {
    if (!cmd("CWD " + saved).positive())
        cmd("CWD " + fallback);
}

bool FtpClient::deleteEntryFile(const std::string &dir,
                                const std::string &name,
                                const std::string &saved,
                                std::string &err) {
    FtpReply r = cmd("DELE " + joinPath(dir, name));
    if (r.positive())
        return true;
    if (r.code == 0)
        return failReply(r, {}, err);
    // Some servers only accept names relative to the cursor.
    if (cmd("CWD " + dir).positive()) {
        FtpReply rel = cmd("DELE " + name);
        restoreCursor(saved, parentPath(dir));
        if (rel.positive())
            return true;
        return failReply(rel, {}, err);
    }
    return failReply(r, {}, err);
}

bool FtpClient::deleteTree(const std::string &target, std::string &err) {
    FtpReply r = cmd("RMD " + target);
    if (r.positive()) {
        lastMessage_ = "Directory deleted";
        return true;
    }
    if (r.code == 0 || !isDirectoryNotEmpty(r.code, r.text))
        return failReply(r, "Cannot delete directory: ", err);

    const std::string saved = currentDir();
    FtpReply cw = cmd("CWD " + target);
    if (!cw.positive())
        return failReply(cw, "Cannot access directory: ", err);
    std::string text;
    std::string lerr;
    if (!readListing("LIST", text, lerr)) {
        restoreCursor(saved, parentPath(target));
        err = "Cannot list directory contents: " + lerr;
        return false;
    }
    restoreCursor(saved, parentPath(target));

    std::vector<std::string> files;
    std::vector<std::string> dirs;
    for (const auto &e : parseListing(text))
        (e.is_dir ? dirs : files).push_back(e.name);
    std::sort(files.begin(), files.end());
    std::sort(dirs.begin(), dirs.end());

    for (const auto &name : files) {
        std::string ferr;
        if (!deleteEntryFile(target, name, saved, ferr)) {
            err = "Failed to delete file '" + name + "': " + ferr;
            return false;
        }
    }
    for (const auto &name : dirs) {
        std::string derr;
        if (!deleteTree(joinPath(target, name), derr)) {
            err = "Failed to delete subdirectory '" + name + "': " + derr;
            return false;
        }
    }

    FtpReply again = cmd("RMD " + target);
    if (!again.positive())
        return failReply(again, "Deleted contents but failed to remove directory: ", err);
    lastMessage_ = "Directory deleted recursively";
    return true;
}

bool FtpClient::deleteDirRecursive(const std::string &remote_dir, std::string &err) {
    lastMessage_.clear();
    if (!ensureConnected(err))
        return false;
    return deleteTree(stripTrailingSlash(absolute(remote_dir)), err);
}

bool FtpClient::getFileInfo(const std::string &remote_path,
                            RemoteEntry &info,
                            std::string &err) {
    info = RemoteEntry{};
    if (!ensureConnected(err))
        return false;
    const std::string path = absolute(remote_path);
    info.name = baseName(path);

    FtpReply sz = cmd("SIZE " + path);
    if (sz.code == 0)
        return failReply(sz, {}, err);
    if (sz.code == 213) {
        info.size = std::strtoull(sz.text.c_str(), nullptr, 10);
        FtpReply md = cmd("MDTM " + path);
        if (md.code == 213)
            info.mtime = parseMdtm(md.text);
        return true;
    }

    const std::string saved = currentDir();
    FtpReply cw = cmd("CWD " + path);
    if (cw.positive()) {
        restoreCursor(saved, parentPath(path));
        info.is_dir = true;
        return true;
    }
    if (cw.code == 0)
        return failReply(cw, {}, err);

    // Servers without SIZE: a file lists as exactly itself.
    std::string text;
    std::string lerr;
    if (readListing("LIST " + path, text, lerr)) {
        const auto entries = parseListing(text);
        if (entries.size() == 1 && !entries.front().is_dir &&
            entries.front().name == info.name) {
            const std::string name = info.name;
            info = entries.front();
            info.name = name;
            return true;
        }
    }
    err.clear();
    return false;
}

bool FtpClient::setPermissions(const std::string &remote_path,
                               std::uint32_t mode,
                               std::string &err) {
    if (!ensureConnected(err))
        return false;
    char octal[16];
    std::snprintf(octal, sizeof(octal), "%o", static_cast<unsigned>(mode & 07777u));
    FtpReply r = cmd(std::string("SITE CHMOD ") + octal + " " + remote_path);
    if (r.code != 200 && r.code != 250)
        return failReply(r, {}, err);
    return true;
}

std::unique_ptr<RemoteClient> FtpClient::cloneUnconnected() const {
    return std::make_unique<FtpClient>(transport_->clone());
}

} // namespace skiff
