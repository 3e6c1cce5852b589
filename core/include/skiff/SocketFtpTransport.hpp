// FtpTransport over POSIX sockets, with OpenSSL for explicit FTPS.
#pragma once
#include "FtpTransport.hpp"

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace skiff {

class SocketFtpTransport : public FtpTransport {
public:
    SocketFtpTransport() = default;
    ~SocketFtpTransport() override;

    SocketFtpTransport(const SocketFtpTransport &) = delete;
    SocketFtpTransport &operator=(const SocketFtpTransport &) = delete;

    bool open(const std::string &host,
              std::uint16_t port,
              int timeout_sec,
              RemoteError &err) override;
    void close() override;
    bool isOpen() const override { return ctrl_ != -1; }

    FtpReply readReply() override;
    FtpReply command(const std::string &line) override;

    bool startTls(std::string &err) override;
    void setProtectedData(bool on) override { protectData_ = on; }

    bool beginData(const std::string &cmd, FtpReply &reply) override;
    long readData(char *buf, std::size_t len) override;
    bool writeData(const char *buf, std::size_t len) override;
    FtpReply endData() override;
    void abortData() override;

    std::unique_ptr<FtpTransport> clone() const override;

private:
    bool readLine(std::string &line);
    bool sendAll(int sock, SSL *ssl, const char *buf, std::size_t len);
    long recvSome(int sock, SSL *ssl, char *buf, std::size_t len);
    bool wrapData(std::string &err);
    void closeData();
    // A reply line is buffered or arrives within timeout_ms.
    bool controlReadable(int timeout_ms);

    int ctrl_ = -1;
    SSL_CTX *ctx_ = nullptr;
    SSL *ctrlSsl_ = nullptr;
    int data_ = -1;
    SSL *dataSsl_ = nullptr;

    std::string host_;
    int timeout_ = kConnectTimeoutSeconds;
    bool protectData_ = false;
    std::string rbuf_; // control bytes not consumed yet
    bool finalReplyRead_ = false;
    FtpReply finalReply_;
};

} // namespace skiff
