// Parsing of Unix-style "LIST" output (FTP) and the reverse rendering used to
// show SFTP entries in the same shape.
#pragma once
#include "RemoteTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace skiff {

// One "ls -l" line. Returns nullopt for lines with too few fields
// ("total 12", blank lines). Names with spaces keep only their last word.
std::optional<RemoteEntry> parseListLine(const std::string &line);

// Whole LIST payload; "." and ".." are dropped.
std::vector<RemoteEntry> parseListing(const std::string &text);

// "drwxr-xr-x" from POSIX mode bits.
std::string formatPermissions(std::uint32_t mode);

// "drwxr-xr-x 1 - - 4096 Mar 04 21:30 name", readable by parseListLine().
// Times are rendered in UTC.
std::string formatLongListing(const RemoteEntry &e);

// "213 20250304213030" -> epoch seconds (UTC).
std::optional<std::uint64_t> parseMdtm(const std::string &reply_text);

} // namespace skiff
