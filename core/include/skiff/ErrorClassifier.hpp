// Maps low level failures (resolver, socket, FTP replies) to the error
// taxonomy and builds the user facing messages.
#pragma once
#include "RemoteTypes.hpp"
#include <cstdint>
#include <string>

namespace skiff {

const char *categoryName(ErrorCategory c);

ErrorCategory classifyResolverError(int gai_code);
ErrorCategory classifySocketErrno(int err_no);

// FTP reply classification for operations after login.
// 0 means the control connection failed (no reply).
ErrorCategory classifyFtpReply(int code);
// Same, for USER/PASS replies.
ErrorCategory classifyLoginReply(int code);

// "Directory not empty" signal consumed by the recursive FTP delete:
// reply 550, or text mentioning "not empty" / "could not delete".
bool isDirectoryNotEmpty(int code, const std::string &text);

// Builds the message for a category. "raw" is the library text.
std::string describe(ErrorCategory c,
                     const std::string &host,
                     std::uint16_t port,
                     const std::string &raw);

} // namespace skiff
