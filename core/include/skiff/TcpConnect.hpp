// TCP connect with resolver/timeout/refusal classification. Shared by the
// FTP transport and the libssh2 backend.
#pragma once
#include "RemoteTypes.hpp"
#include <cstdint>
#include <string>

namespace skiff {

// Returns a connected blocking socket, or -1 with "err" filled in.
// SO_RCVTIMEO/SO_SNDTIMEO are set to timeout_sec when io_timeouts is true.
int tcpConnect(const std::string &host,
               std::uint16_t port,
               int timeout_sec,
               bool io_timeouts,
               RemoteError &err);

// Numeric address of the peer of a connected socket ("" on failure).
std::string peerAddress(int sock);

} // namespace skiff
