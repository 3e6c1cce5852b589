#include "skiff/RemoteTypes.hpp"
#include <algorithm>
#include <cctype>

namespace skiff {

const char *protocolName(ProtocolKind p) {
    switch (p) {
    case ProtocolKind::Ftp:
        return "FTP";
    case ProtocolKind::Ftps:
        return "FTPS";
    case ProtocolKind::Sftp:
        return "SFTP";
    }
    return "FTP";
}

std::optional<ProtocolKind> protocolFromName(const std::string &name) {
    std::string n = name;
    for (char &c : n)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (n == "FTP")
        return ProtocolKind::Ftp;
    if (n == "FTPS")
        return ProtocolKind::Ftps;
    if (n == "SFTP")
        return ProtocolKind::Sftp;
    return std::nullopt;
}

int defaultPort(ProtocolKind p) {
    return p == ProtocolKind::Sftp ? 22 : 21;
}

std::uint16_t effectivePort(const ConnectionProfile &p) {
    if (p.port >= 1 && p.port <= 65535)
        return static_cast<std::uint16_t>(p.port);
    return static_cast<std::uint16_t>(defaultPort(p.protocol));
}

bool wantsTls(const ConnectionProfile &p) {
    return p.protocol == ProtocolKind::Ftps ||
           (p.protocol == ProtocolKind::Ftp && p.use_tls);
}

static bool isBlank(const std::string &s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

bool validateProfile(const ConnectionProfile &p, RemoteError &err) {
    if (isBlank(p.host)) {
        err.set(ErrorCategory::InputValidation, "Host cannot be empty");
        return false;
    }
    if (isBlank(p.username)) {
        err.set(ErrorCategory::InputValidation, "Username cannot be empty");
        return false;
    }
    // 0 selects the protocol default; anything else must be a real port.
    if (p.port != 0 && (p.port < 1 || p.port > 65535)) {
        err.set(ErrorCategory::InputValidation,
                "Port must be between 1 and 65535");
        return false;
    }
    return true;
}

} // namespace skiff
