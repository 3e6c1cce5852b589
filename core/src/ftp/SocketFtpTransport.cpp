// FTP control/data sockets. Data connections are passive only and always go
// to the control peer address (the PASV address is ignored, NAT'd servers
// often advertise a private one). TLS follows RFC 4217: AUTH TLS on the
// control channel, PROT P data channels reusing the control TLS session.
#include "skiff/SocketFtpTransport.hpp"
#include "skiff/TcpConnect.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace skiff {

static std::once_flag g_ssl_once;

static std::string sslErrorText() {
    unsigned long e = ERR_get_error();
    if (e == 0)
        return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

SocketFtpTransport::~SocketFtpTransport() {
    close();
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

bool SocketFtpTransport::open(const std::string &host,
                              std::uint16_t port,
                              int timeout_sec,
                              RemoteError &err) {
    close();
    host_ = host;
    timeout_ = timeout_sec;
    ctrl_ = tcpConnect(host, port, timeout_sec, true, err);
    return ctrl_ != -1;
}

void SocketFtpTransport::closeData() {
    if (dataSsl_) {
        SSL_shutdown(dataSsl_);
        SSL_free(dataSsl_);
        dataSsl_ = nullptr;
    }
    if (data_ != -1) {
        ::close(data_);
        data_ = -1;
    }
}

void SocketFtpTransport::close() {
    closeData();
    if (ctrlSsl_) {
        SSL_shutdown(ctrlSsl_);
        SSL_free(ctrlSsl_);
        ctrlSsl_ = nullptr;
    }
    if (ctrl_ != -1) {
        ::close(ctrl_);
        ctrl_ = -1;
    }
    rbuf_.clear();
    protectData_ = false;
    finalReplyRead_ = false;
}

long SocketFtpTransport::recvSome(int sock, SSL *ssl, char *buf, std::size_t len) {
    if (ssl) {
        int n = SSL_read(ssl, buf, static_cast<int>(len));
        if (n > 0)
            return n;
        int e = SSL_get_error(ssl, n);
        if (e == SSL_ERROR_ZERO_RETURN)
            return 0;
        // Some servers close the data socket without close_notify.
        if (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && errno == 0)
            return 0;
        ERR_clear_error();
        return -1;
    }
    for (;;) {
        ssize_t n = ::recv(sock, buf, len, 0);
        if (n < 0 && errno == EINTR)
            continue;
        return static_cast<long>(n);
    }
}

bool SocketFtpTransport::sendAll(int sock, SSL *ssl, const char *buf, std::size_t len) {
    while (len > 0) {
        long w;
        if (ssl) {
            int n = SSL_write(ssl, buf, static_cast<int>(len));
            if (n <= 0) {
                ERR_clear_error();
                return false;
            }
            w = n;
        } else {
            ssize_t n = ::send(sock, buf, len, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return false;
            w = static_cast<long>(n);
        }
        buf += w;
        len -= static_cast<std::size_t>(w);
    }
    return true;
}

bool SocketFtpTransport::readLine(std::string &line) {
    for (;;) {
        const auto pos = rbuf_.find('\n');
        if (pos != std::string::npos) {
            line = rbuf_.substr(0, pos);
            rbuf_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return true;
        }
        char buf[512];
        long n = recvSome(ctrl_, ctrlSsl_, buf, sizeof(buf));
        if (n <= 0)
            return false;
        rbuf_.append(buf, static_cast<std::size_t>(n));
    }
}

static int replyCodeOf(const std::string &line) {
    if (line.size() < 3)
        return -1;
    for (int i = 0; i < 3; ++i)
        if (!std::isdigit(static_cast<unsigned char>(line[static_cast<std::size_t>(i)])))
            return -1;
    return std::stoi(line.substr(0, 3));
}

FtpReply SocketFtpTransport::readReply() {
    FtpReply r;
    if (ctrl_ == -1) {
        r.text = "Not connected";
        return r;
    }
    std::string line;
    if (!readLine(line) || replyCodeOf(line) < 0) {
        close();
        r.text = "Connection to server lost";
        return r;
    }
    const int code = replyCodeOf(line);
    std::string text = line.size() > 4 ? line.substr(4) : std::string();
    if (line.size() > 3 && line[3] == '-') {
        // Multi-line reply: ends with "<code> " on a line of its own.
        const std::string end = line.substr(0, 3) + " ";
        for (;;) {
            if (!readLine(line)) {
                close();
                r.text = "Connection to server lost";
                return r;
            }
            if (line.compare(0, 4, end) == 0) {
                text += "\n" + line.substr(4);
                break;
            }
            text += "\n" + line;
        }
    }
    r.code = code;
    r.text = text;
    return r;
}

FtpReply SocketFtpTransport::command(const std::string &line) {
    if (ctrl_ == -1) {
        FtpReply r;
        r.text = "Not connected";
        return r;
    }
    const std::string wire = line + "\r\n";
    if (!sendAll(ctrl_, ctrlSsl_, wire.data(), wire.size())) {
        close();
        FtpReply r;
        r.text = "Connection to server lost";
        return r;
    }
    return readReply();
}

bool SocketFtpTransport::startTls(std::string &err) {
    if (ctrl_ == -1) {
        err = "Not connected";
        return false;
    }
    std::call_once(g_ssl_once, [] { OPENSSL_init_ssl(0, nullptr); });
    if (!ctx_) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            err = sslErrorText();
            return false;
        }
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        // FTPS servers are commonly self-signed; there is no CA to check.
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT);
    }
    ctrlSsl_ = SSL_new(ctx_);
    if (!ctrlSsl_) {
        err = sslErrorText();
        return false;
    }
    SSL_set_fd(ctrlSsl_, ctrl_);
    SSL_set_tlsext_host_name(ctrlSsl_, host_.c_str());
    if (SSL_connect(ctrlSsl_) != 1) {
        err = sslErrorText();
        SSL_free(ctrlSsl_);
        ctrlSsl_ = nullptr;
        return false;
    }
    return true;
}

bool SocketFtpTransport::wrapData(std::string &err) {
    dataSsl_ = SSL_new(ctx_);
    if (!dataSsl_) {
        err = sslErrorText();
        return false;
    }
    SSL_set_fd(dataSsl_, data_);
    SSL_set_tlsext_host_name(dataSsl_, host_.c_str());
    // Servers that require session reuse reject fresh data sessions.
    if (SSL_SESSION *s = SSL_get_session(ctrlSsl_))
        SSL_set_session(dataSsl_, s);
    if (SSL_connect(dataSsl_) != 1) {
        err = sslErrorText();
        return false;
    }
    return true;
}

// "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
static bool parsePasvPort(const std::string &text, std::uint16_t &port) {
    std::vector<int> nums;
    int cur = -1;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            cur = (cur < 0 ? 0 : cur * 10) + (c - '0');
            if (cur > 255)
                cur = 256;
        } else {
            if (cur >= 0)
                nums.push_back(cur);
            cur = -1;
            if (nums.size() == 6)
                break;
            if (c != ',')
                nums.clear();
        }
    }
    if (cur >= 0 && nums.size() < 6)
        nums.push_back(cur);
    if (nums.size() < 6 || nums[4] > 255 || nums[5] > 255)
        return false;
    port = static_cast<std::uint16_t>(nums[4] * 256 + nums[5]);
    return port != 0;
}

bool SocketFtpTransport::beginData(const std::string &cmd, FtpReply &reply) {
    closeData();
    finalReplyRead_ = false;

    FtpReply pasv = command("PASV");
    if (pasv.code != 227) {
        reply = pasv;
        return false;
    }
    std::uint16_t port = 0;
    if (!parsePasvPort(pasv.text, port)) {
        reply.code = 425;
        reply.text = "Malformed PASV reply: " + pasv.text;
        return false;
    }
    std::string addr = peerAddress(ctrl_);
    if (addr.empty())
        addr = host_;
    RemoteError cerr;
    data_ = tcpConnect(addr, port, timeout_, true, cerr);
    if (data_ == -1) {
        reply.code = 425;
        reply.text = "Cannot open data connection: " + cerr.message;
        return false;
    }

    reply = command(cmd);
    if (reply.positive()) {
        // Completed without a preliminary reply (tiny transfers).
        finalReplyRead_ = true;
        finalReply_ = reply;
    } else if (!reply.preliminary()) {
        closeData();
        return false;
    }

    if (protectData_ && ctrlSsl_) {
        std::string terr;
        if (!wrapData(terr)) {
            abortData();
            reply.code = 425;
            reply.text = "TLS on data connection failed: " + terr;
            return false;
        }
    }
    return true;
}

long SocketFtpTransport::readData(char *buf, std::size_t len) {
    if (data_ == -1)
        return -1;
    return recvSome(data_, dataSsl_, buf, len);
}

bool SocketFtpTransport::writeData(const char *buf, std::size_t len) {
    if (data_ == -1)
        return false;
    return sendAll(data_, dataSsl_, buf, len);
}

FtpReply SocketFtpTransport::endData() {
    closeData();
    if (finalReplyRead_) {
        finalReplyRead_ = false;
        return finalReply_;
    }
    return readReply();
}

bool SocketFtpTransport::controlReadable(int timeout_ms) {
    if (rbuf_.find('\n') != std::string::npos)
        return true;
    if (ctrlSsl_ && SSL_pending(ctrlSsl_) > 0)
        return true;
    pollfd p{};
    p.fd = ctrl_;
    p.events = POLLIN;
    for (;;) {
        const int rc = ::poll(&p, 1, timeout_ms);
        if (rc < 0 && errno == EINTR)
            continue;
        return rc > 0;
    }
}

void SocketFtpTransport::abortData() {
    closeData();
    const bool transferReplyOwed = !finalReplyRead_;
    finalReplyRead_ = false;
    if (ctrl_ == -1)
        return;
    FtpReply r = command("ABOR");
    if (r.code == 0 || !transferReplyOwed)
        return;
    // The first reply closed the transfer (426 or 226); the ABOR answer
    // (225/226) follows. Servers that fold both into one reply send nothing
    // more, hence the bounded wait.
    if (controlReadable(timeout_ * 1000))
        readReply();
}

std::unique_ptr<FtpTransport> SocketFtpTransport::clone() const {
    return std::make_unique<SocketFtpTransport>();
}

} // namespace skiff
