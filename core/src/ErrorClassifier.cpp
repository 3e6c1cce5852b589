#include "skiff/ErrorClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <netdb.h>

namespace skiff {

const char *categoryName(ErrorCategory c) {
    switch (c) {
    case ErrorCategory::None:
        return "None";
    case ErrorCategory::InputValidation:
        return "InputValidation";
    case ErrorCategory::Resolution:
        return "Resolution";
    case ErrorCategory::Timeout:
        return "Timeout";
    case ErrorCategory::Refused:
        return "Refused";
    case ErrorCategory::Authentication:
        return "Authentication";
    case ErrorCategory::PermissionOrTemporary:
        return "PermissionOrTemporary";
    case ErrorCategory::Unclassified:
        return "Unclassified";
    }
    return "Unclassified";
}

ErrorCategory classifyResolverError(int gai_code) {
    switch (gai_code) {
    case 0:
        return ErrorCategory::None;
    case EAI_NONAME:
    case EAI_AGAIN:
    case EAI_FAIL:
#ifdef EAI_NODATA
    case EAI_NODATA:
#endif
#ifdef EAI_ADDRFAMILY
    case EAI_ADDRFAMILY:
#endif
        return ErrorCategory::Resolution;
    default:
        return ErrorCategory::Unclassified;
    }
}

ErrorCategory classifySocketErrno(int err_no) {
    switch (err_no) {
    case 0:
        return ErrorCategory::None;
    case ETIMEDOUT:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EINPROGRESS:
        return ErrorCategory::Timeout;
    case ECONNREFUSED:
        return ErrorCategory::Refused;
    default:
        return ErrorCategory::Unclassified;
    }
}

ErrorCategory classifyFtpReply(int code) {
    if (code >= 100 && code < 400)
        return ErrorCategory::None;
    if (code >= 400 && code < 600)
        return ErrorCategory::PermissionOrTemporary;
    return ErrorCategory::Unclassified;
}

ErrorCategory classifyLoginReply(int code) {
    if (code >= 200 && code < 400)
        return ErrorCategory::None;
    if (code == 421 || (code >= 400 && code < 500))
        return ErrorCategory::PermissionOrTemporary;
    if (code >= 500 && code < 600)
        return ErrorCategory::Authentication;
    return ErrorCategory::Unclassified;
}

bool isDirectoryNotEmpty(int code, const std::string &text) {
    if (code == 550)
        return true;
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return lower.find("not empty") != std::string::npos ||
           lower.find("could not delete") != std::string::npos;
}

std::string describe(ErrorCategory c,
                     const std::string &host,
                     std::uint16_t port,
                     const std::string &raw) {
    const std::string hp = host + ":" + std::to_string(port);
    switch (c) {
    case ErrorCategory::None:
        return raw;
    case ErrorCategory::InputValidation:
        return raw;
    case ErrorCategory::Resolution:
        return "Cannot resolve hostname '" + host +
               "'. Please check:\n- Hostname is correct\n"
               "- Internet connection is active\n- DNS settings are correct";
    case ErrorCategory::Timeout:
        return "Connection timeout. Server '" + hp + "' did not respond.";
    case ErrorCategory::Refused:
        return "Connection refused. Server '" + hp +
               "' is not accepting connections.";
    case ErrorCategory::Authentication:
        return raw.empty() ? std::string("Authentication failed. Please check "
                                         "username and password.")
                           : "Authentication failed: " + raw;
    case ErrorCategory::PermissionOrTemporary:
        return "Temporary error: " + raw;
    case ErrorCategory::Unclassified:
        return "Connection error: " + raw;
    }
    return raw;
}

} // namespace skiff
