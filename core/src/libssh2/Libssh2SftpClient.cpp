// libssh2 backend: TCP socket, SSH session and SFTP channel.
// Host keys are checked against known_hosts according to the profile policy.
#include "skiff/Libssh2SftpClient.hpp"
#include "skiff/ErrorClassifier.hpp"
#include "skiff/ListingParser.hpp"
#include "skiff/RemotePath.hpp"
#include "skiff/TcpConnect.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace skiff {

// libssh2 global init (once per process)
static std::once_flag g_libssh2_once;

static const std::size_t CHUNK = 64 * 1024;

// Context for keyboard-interactive: answers username or password by prompt
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

static char *dupAnswer(const char *src, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, src, len);
    buf[len] = '\0';
    return buf;
}

static bool promptAsksForUser(const char *prompt) {
    std::string p(prompt ? prompt : "");
    for (char &c : p)
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

static void kbint_password_callback(const char *name, int name_len,
                                    const char *instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                                    void **abstract) {
    (void)name;
    (void)name_len;
    (void)instruction;
    (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        const char *prompt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
        const char *ans = promptAsksForUser(prompt) ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupAnswer(ans, alen) : nullptr;
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

static const char *sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "No such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "Permission denied";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "File already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "Directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "Not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "No space left on server";
    case LIBSSH2_FX_WRITE_PROTECT:
        return "Write protected";
    case LIBSSH2_FX_OP_UNSUPPORTED:
        return "Operation not supported by server";
    default:
        return "Failure";
    }
}

static std::string hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
#endif
    default:
        return "UNKNOWN";
    }
}

static int knownHostKeyMask(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

static std::string fingerprintOf(LIBSSH2_SESSION *session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char *prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char *prefix = "SHA1:";
#endif
    const unsigned char *h =
        reinterpret_cast<const unsigned char *>(libssh2_hostkey_hash(session, hashType));
    if (!h)
        return std::string();
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

static std::string sessionLastError(LIBSSH2_SESSION *session) {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
}

static bool isChannelGone(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           rc == LIBSSH2_ERROR_TIMEOUT;
}

static RemoteEntry entryFromAttrs(const std::string &name,
                                  const LIBSSH2_SFTP_ATTRIBUTES &attrs) {
    RemoteEntry e;
    e.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        e.mode = static_cast<std::uint32_t>(attrs.permissions);
        e.permissions = formatPermissions(e.mode);
    }
    if ((attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) && !e.is_dir)
        e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        e.mtime = static_cast<std::uint64_t>(attrs.mtime);
    return e;
}

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] { libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::sshHandshakeAuth(const ConnectionProfile &profile,
                                         RemoteError &err) {
    const std::uint16_t port = effectivePort(profile);
    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorCategory::Unclassified, "libssh2_session_init failed");
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, kConnectTimeoutSeconds * 1000L);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        const int rc = libssh2_session_last_errno(session_);
        const ErrorCategory c = (rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT)
                                    ? ErrorCategory::Timeout
                                    : ErrorCategory::Unclassified;
        err.set(c, describe(c, profile.host, port,
                            "SSH handshake failed: " + sessionLastError(session_)));
        return false;
    }

    // SSH keepalive every 30s when the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (profile.known_hosts_policy != KnownHostsPolicy::Off) {
        LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
        if (!nh) {
            err.set(ErrorCategory::Unclassified, "Cannot initialize known_hosts");
            return false;
        }

        std::string khPath;
        if (profile.known_hosts_path.has_value()) {
            khPath = *profile.known_hosts_path;
        } else {
            const char *home = std::getenv("HOME");
            if (home)
                khPath = std::string(home) + "/.ssh/known_hosts";
        }

        bool khLoaded = false;
        if (!khPath.empty())
            khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                                  LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
        if (!khLoaded && profile.known_hosts_policy == KnownHostsPolicy::Strict) {
            libssh2_knownhost_free(nh);
            err.set(ErrorCategory::Authentication,
                    "known_hosts missing or unreadable (strict policy)");
            return false;
        }

        std::size_t keylen = 0;
        int keytype = 0;
        const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
        if (!hostkey || keylen == 0) {
            libssh2_knownhost_free(nh);
            err.set(ErrorCategory::Unclassified, "Cannot read server host key");
            return false;
        }

        const int alg = knownHostKeyMask(keytype);
        struct libssh2_knownhost *host = nullptr;
        int check = libssh2_knownhost_checkp(
            nh, profile.host.c_str(), port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
        if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
            check = libssh2_knownhost_checkp(
                nh, profile.host.c_str(), port, hostkey, keylen,
                LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg, &host);
        }

        if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
            libssh2_knownhost_free(nh);
        } else if (profile.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
                   check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
            // TOFU: ask when a callback is installed
            if (profile.hostkey_confirm_cb &&
                !profile.hostkey_confirm_cb(profile.host, port,
                                            hostKeyAlgorithmName(keytype),
                                            fingerprintOf(session_))) {
                libssh2_knownhost_free(nh);
                err.set(ErrorCategory::Authentication,
                        "Unknown host: fingerprint not confirmed");
                return false;
            }
            if (!khPath.empty()) {
                const int addrc = libssh2_knownhost_addc(
                    nh, profile.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
                    LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                    nullptr);
                if (addrc != 0 ||
                    libssh2_knownhost_writefile(nh, khPath.c_str(),
                                                LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
                    libssh2_knownhost_free(nh);
                    err.set(ErrorCategory::Unclassified,
                            "Cannot write host key to known_hosts");
                    return false;
                }
            }
            libssh2_knownhost_free(nh);
        } else {
            libssh2_knownhost_free(nh);
            // A changed key is refused under every checking policy.
            if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH ||
                profile.known_hosts_policy == KnownHostsPolicy::Strict) {
                err.set(ErrorCategory::Authentication,
                        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                            ? "Host key does not match known_hosts"
                            : "Host not found in known_hosts");
                return false;
            }
        }
    }

    // Password first, then keyboard-interactive, then ssh-agent.
    const std::string &user = profile.username;
    std::string authlist;
    auto hasMethod = [&](const char *m) {
        return !authlist.empty() && authlist.find(m) != std::string::npos;
    };
    auto fetchMethods = [&]() {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned>(user.size()));
        authlist = methods ? std::string(methods) : std::string();
    };

    bool authed = false;
    if (!profile.secret.empty()) {
        int rc = -1;
        for (;;) {
            rc = libssh2_userauth_password(session_, user.c_str(), profile.secret.c_str());
            if (rc != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (isChannelGone(rc)) {
            err.set(ErrorCategory::Authentication,
                    describe(ErrorCategory::Authentication, profile.host, port,
                             "server closed the connection after password"));
            return false;
        }
        authed = (rc == 0);
        if (!authed) {
            fetchMethods();
            if (hasMethod("keyboard-interactive")) {
                KbdIntCtx ctx{user.c_str(), profile.secret.c_str()};
                void **abs = libssh2_session_abstract(session_);
                if (abs)
                    *abs = &ctx;
                int krc = -1;
                for (;;) {
                    krc = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                                kbint_password_callback);
                    if (krc != LIBSSH2_ERROR_EAGAIN)
                        break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (abs)
                    *abs = nullptr;
                authed = (krc == 0);
            }
        }
    }

    if (!authed) {
        fetchMethods();
        if (hasMethod("publickey")) {
            LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
            if (agent && libssh2_agent_connect(agent) == 0 &&
                libssh2_agent_list_identities(agent) == 0) {
                struct libssh2_agent_publickey *identity = nullptr;
                struct libssh2_agent_publickey *prev = nullptr;
                int tries = 0;
                const int kMaxAgentTries = 3;
                while (tries < kMaxAgentTries &&
                       libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                    prev = identity;
                    ++tries;
                    int arc = -1;
                    for (;;) {
                        arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                        if (arc != LIBSSH2_ERROR_EAGAIN)
                            break;
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                    if (arc == 0) {
                        authed = true;
                        break;
                    }
                }
            }
            if (agent) {
                libssh2_agent_disconnect(agent);
                libssh2_agent_free(agent);
            }
        }
    }

    if (!authed) {
        std::string raw = sessionLastError(session_);
        if (!authlist.empty())
            raw += (raw.empty() ? "" : " ") + std::string("(methods: ") + authlist + ")";
        err.set(ErrorCategory::Authentication,
                describe(ErrorCategory::Authentication, profile.host, port, raw));
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err.set(ErrorCategory::Unclassified, "Cannot start SFTP subsystem");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const ConnectionProfile &profile, RemoteError &err) {
    if (connected_) {
        err.set(ErrorCategory::Unclassified, "Already connected");
        return false;
    }
    if (!validateProfile(profile, err))
        return false;

    // No SO_RCVTIMEO here: libssh2's own session timeout bounds the I/O.
    sock_ = tcpConnect(profile.host, effectivePort(profile), kConnectTimeoutSeconds,
                       false, err);
    if (sock_ == -1)
        return false;
    if (!sshHandshakeAuth(profile, err)) {
        disconnect();
        return false;
    }

    // Login directory becomes the initial cursor.
    char real[1024];
    const int n = libssh2_sftp_realpath(sftp_, ".", real, sizeof(real));
    setCwd(n > 0 ? std::string(real, static_cast<std::size_t>(n)) : std::string("/"));

    connected_ = true;
    err.clear();
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::ready(std::string &err) const {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    return true;
}

// Message for the last failed SFTP call. Marks the session dead when the
// failure came from the transport rather than the server.
std::string Libssh2SftpClient::lastSftpError(const char *what) {
    const int rc = libssh2_session_last_errno(session_);
    if (isChannelGone(rc)) {
        connected_ = false;
        return std::string(what) + ": connection lost";
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
        return std::string(what) + ": " + sftpStatusText(libssh2_sftp_last_error(sftp_));
    const std::string msg = sessionLastError(session_);
    return msg.empty() ? std::string(what) : std::string(what) + ": " + msg;
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<RemoteEntry> &out,
                             std::string &err) {
    out.clear();
    if (!ready(err))
        return false;

    const std::string path = resolve(remote_path);
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = lastSftpError("Cannot open directory");
        return false;
    }

    std::vector<RemoteEntry> entries;
    entries.reserve(64);
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            std::string name(filename, static_cast<std::size_t>(rc));
            if (name == "." || name == "..")
                continue;
            RemoteEntry e = entryFromAttrs(name, attrs);
            e.listing_line = formatLongListing(e);
            entries.push_back(std::move(e));
        } else if (rc == 0) {
            break;
        } else {
            err = lastSftpError("Cannot read directory");
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    out = std::move(entries);
    return true;
}

bool Libssh2SftpClient::download(const std::string &remote,
                                 const std::string &local,
                                 std::string &err,
                                 ProgressCB progress,
                                 CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    const std::string path = resolve(remote);

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = lastSftpError("Cannot stat remote file");
        return false;
    }
    const std::size_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::size_t>(st.filesize) : 0;

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()), LIBSSH2_FXF_READ, 0,
        LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = lastSftpError("Cannot open remote file for reading");
        return false;
    }
    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Cannot open local file for writing";
        return false;
    }

    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
                static_cast<std::size_t>(n)) {
                err = "Local write failed";
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
            done += static_cast<std::size_t>(n);
            if (progress)
                progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = lastSftpError("Remote read failed");
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }

    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) {
        err = "Local write failed";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::upload(const std::string &local,
                               const std::string &remote,
                               std::string &err,
                               ProgressCB progress,
                               CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    const std::string path = resolve(remote);

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Cannot open local file for reading";
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned>(path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = lastSftpError("Cannot open remote file for writing");
        return false;
    }

    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled by user";
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return false;
        }
        std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed";
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            break; // EOF
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = lastSftpError("Remote write failed");
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
        done += n;
        if (progress)
            progress(done, total);
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    return true;
}

bool Libssh2SftpClient::getFileInfo(const std::string &remote_path,
                                    RemoteEntry &info,
                                    std::string &err) {
    info = RemoteEntry{};
    if (!ready(err))
        return false;
    const std::string path = resolve(remote_path);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            const unsigned long code = libssh2_sftp_last_error(sftp_);
            if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
                err.clear();
                return false; // does not exist
            }
        }
        err = lastSftpError("Cannot stat remote path");
        return false;
    }
    info = entryFromAttrs(baseName(path), st);
    return true;
}

bool Libssh2SftpClient::setPermissions(const std::string &remote_path,
                                       std::uint32_t mode,
                                       std::string &err) {
    if (!ready(err))
        return false;
    const std::string path = resolve(remote_path);
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode & 07777u;
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        err = lastSftpError("chmod failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::setModificationTime(const std::string &remote_path,
                                            std::uint64_t mtime,
                                            std::string &err) {
    if (!ready(err))
        return false;
    const std::string path = resolve(remote_path);
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(mtime);
    a.mtime = static_cast<unsigned long>(mtime);
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                             LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        err = lastSftpError("Setting modification time failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::createDir(const std::string &remote_dir, std::string &err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_mkdir(sftp_, resolve(remote_dir).c_str(), 0755) != 0) {
        err = lastSftpError("mkdir failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::deleteFile(const std::string &remote_path, std::string &err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_unlink(sftp_, resolve(remote_path).c_str()) != 0) {
        err = lastSftpError("unlink failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &remote_dir, std::string &err) {
    if (!ready(err))
        return false;
    if (libssh2_sftp_rmdir(sftp_, resolve(remote_dir).c_str()) != 0) {
        err = lastSftpError("rmdir failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from,
                               const std::string &to,
                               std::string &err) {
    if (!ready(err))
        return false;
    const std::string src = resolve(from);
    const std::string dst = resolve(to);
    int rc = libssh2_sftp_rename_ex(sftp_, src.c_str(), static_cast<unsigned>(src.size()),
                                    dst.c_str(), static_cast<unsigned>(dst.size()),
                                    LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    if (rc != 0) {
        err = lastSftpError("rename failed");
        return false;
    }
    return true;
}

std::unique_ptr<RemoteClient> Libssh2SftpClient::cloneUnconnected() const {
    return std::make_unique<Libssh2SftpClient>();
}

} // namespace skiff
