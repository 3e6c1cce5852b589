// Resolve + connect with a bounded wait. Keepalive settings match the ones
// the SSH backend has always used.
#include "skiff/TcpConnect.hpp"
#include "skiff/ErrorClassifier.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

// POSIX sockets
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace skiff {

static void setKeepalive(int s) {
    int opt = 1;
    ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
    int idle = 60;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
}

// Non-blocking connect bounded by timeout_sec. Returns 0 or an errno value.
static int connectWithTimeout(int s, const sockaddr *addr, socklen_t len,
                              int timeout_sec) {
    const int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0)
        return errno;

    int rc = ::connect(s, addr, len);
    int result = 0;
    if (rc != 0) {
        if (errno != EINPROGRESS) {
            result = errno;
        } else {
            pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int prc;
            do {
                prc = ::poll(&pfd, 1, timeout_sec * 1000);
            } while (prc < 0 && errno == EINTR);
            if (prc == 0) {
                result = ETIMEDOUT;
            } else if (prc < 0) {
                result = errno;
            } else {
                int soerr = 0;
                socklen_t sl = sizeof(soerr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &sl) != 0)
                    result = errno;
                else
                    result = soerr;
            }
        }
    }
    if (result == 0 && ::fcntl(s, F_SETFL, flags) < 0)
        result = errno;
    return result;
}

int tcpConnect(const std::string &host,
               std::uint16_t port,
               int timeout_sec,
               bool io_timeouts,
               RemoteError &err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        ErrorCategory c = classifyResolverError(gai);
        if (c == ErrorCategory::None)
            c = ErrorCategory::Unclassified;
        err.set(c, describe(c, host, port, gai_strerror(gai)));
        return -1;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        setKeepalive(s);
        int rc = connectWithTimeout(s, rp->ai_addr, rp->ai_addrlen, timeout_sec);
        if (rc == 0) {
            if (io_timeouts) {
                timeval tv{};
                tv.tv_sec = timeout_sec;
                ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                ::setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            }
            ::freeaddrinfo(res);
            err.clear();
            return s;
        }
        lastErrno = rc;
        ::close(s);
    }
    ::freeaddrinfo(res);

    ErrorCategory c = classifySocketErrno(lastErrno);
    if (c == ErrorCategory::None)
        c = ErrorCategory::Unclassified;
    err.set(c, describe(c, host, port,
                        lastErrno ? std::strerror(lastErrno)
                                  : "no usable address"));
    return -1;
}

std::string peerAddress(int sock) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(sock, reinterpret_cast<sockaddr *>(&ss), &len) != 0)
        return std::string();
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        auto *in = reinterpret_cast<sockaddr_in *>(&ss);
        if (!::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)))
            return std::string();
    } else if (ss.ss_family == AF_INET6) {
        auto *in6 = reinterpret_cast<sockaddr_in6 *>(&ss);
        if (!::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf)))
            return std::string();
    } else {
        return std::string();
    }
    return std::string(buf);
}

} // namespace skiff
