// Basic types shared between the engine and core: connection profiles,
// remote entries and the error taxonomy used by every adapter.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skiff {

// Fixed connect window. Also bounds every blocking socket read/write.
constexpr int kConnectTimeoutSeconds = 10;

enum class ProtocolKind {
    Ftp,  // plain FTP
    Ftps, // FTP with explicit TLS (AUTH TLS)
    Sftp  // SFTP over SSH
};

// Host key validation policy for SFTP (known_hosts).
enum class KnownHostsPolicy {
    Strict,    // Exact match with known_hosts required.
    AcceptNew, // TOFU: new hosts are accepted and saved; key changes rejected.
    Off        // No verification.
};

enum class ErrorCategory {
    None,
    InputValidation,
    Resolution,
    Timeout,
    Refused,
    Authentication,
    PermissionOrTemporary,
    Unclassified
};

struct RemoteError {
    ErrorCategory category = ErrorCategory::None;
    std::string message;

    void set(ErrorCategory c, std::string msg) {
        category = c;
        message = std::move(msg);
    }
    void clear() {
        category = ErrorCategory::None;
        message.clear();
    }
};

struct RemoteEntry {
    std::string name;
    bool is_dir = false;
    std::uint64_t size = 0;             // bytes (files only)
    std::optional<std::uint64_t> mtime; // epoch seconds, when known
    std::string mtime_text;             // opaque date string from a listing
    std::string permissions;            // "drwxr-xr-x" or raw protocol text
    std::uint32_t mode = 0;             // POSIX bits when known
    std::optional<std::string> owner;   // FTP listings only
    std::optional<std::string> group;
    std::string listing_line;           // "ls -l" shaped text, both families
};

struct ConnectionProfile {
    std::string name;
    ProtocolKind protocol = ProtocolKind::Ftp;
    std::string host;
    int port = 0; // 0 = protocol default
    std::string username;
    std::string secret;
    bool use_tls = false;
    bool favorite = false;
    std::int64_t last_used = 0; // epoch seconds

    // SFTP only
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
    // Asked on unknown host keys under AcceptNew. Without a callback the key
    // is accepted and saved.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;
};

const char *protocolName(ProtocolKind p);
std::optional<ProtocolKind> protocolFromName(const std::string &name);

// 21 for FTP/FTPS, 22 for SFTP when the profile does not set a port.
int defaultPort(ProtocolKind p);
std::uint16_t effectivePort(const ConnectionProfile &p);

// True when the profile negotiates TLS on the FTP control connection.
bool wantsTls(const ConnectionProfile &p);

// Input validation done before any socket is created.
bool validateProfile(const ConnectionProfile &p, RemoteError &err);

} // namespace skiff
