// Control/data channel plumbing used by FtpClient. The client only speaks in
// commands and replies; sockets, PASV and TLS live behind this interface so
// the command layer can run against a scripted server in tests.
#pragma once
#include "RemoteTypes.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace skiff {

struct FtpReply {
    int code = 0;     // 0: no reply, the control connection is gone
    std::string text; // reply text without the code, lines joined by '\n'

    bool preliminary() const { return code >= 100 && code < 200; }
    bool positive() const { return code >= 200 && code < 400; }
};

class FtpTransport {
public:
    virtual ~FtpTransport() = default;

    // Control connection. open() does not read the greeting.
    virtual bool open(const std::string &host,
                      std::uint16_t port,
                      int timeout_sec,
                      RemoteError &err) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Next reply from the server (greeting, or after a data transfer).
    virtual FtpReply readReply() = 0;
    // Sends one command line (no CRLF) and reads its reply. An I/O failure
    // closes the transport and returns code 0.
    virtual FtpReply command(const std::string &line) = 0;

    // Explicit TLS on the control connection, after "AUTH TLS" got 234.
    virtual bool startTls(std::string &err) = 0;
    // PROT P: wrap subsequent data connections in TLS.
    virtual void setProtectedData(bool on) = 0;

    // Opens a passive data connection and issues "cmd" (LIST, RETR x, ...).
    // True once the server accepted it; "reply" holds the server answer.
    virtual bool beginData(const std::string &cmd, FtpReply &reply) = 0;
    // >0 bytes read, 0 end of data, <0 error.
    virtual long readData(char *buf, std::size_t len) = 0;
    virtual bool writeData(const char *buf, std::size_t len) = 0;
    // Closes the data connection and returns the completion reply (226).
    virtual FtpReply endData() = 0;
    // Closes the data connection, sends ABOR and drains both the transfer's
    // closing reply and the ABOR reply, leaving the control stream in step.
    virtual void abortData() = 0;

    // Fresh, unopened transport of the same kind (worker connections).
    virtual std::unique_ptr<FtpTransport> clone() const = 0;
};

} // namespace skiff
