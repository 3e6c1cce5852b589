// What diagnostics may reveal. Read from the environment:
//   SKIFF_ENV=dev|development|local|debug   development environment
//   SKIFF_LOG_SENSITIVE=1|true|yes|on       full paths and server text,
//                                           honoured in development only
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace skiff {

struct LogPolicy {
    bool development = false;
    bool sensitive = false;

    static LogPolicy fromEnvironment() {
        LogPolicy p;
        const std::string env = envWord("SKIFF_ENV");
        p.development = env == "dev" || env == "development" || env == "local" ||
                        env == "debug";
        const std::string flag = envWord("SKIFF_LOG_SENSITIVE");
        p.sensitive = p.development &&
                      (flag == "1" || flag == "true" || flag == "yes" || flag == "on");
        return p;
    }

    // Last path component only, unless sensitive logging is on.
    std::string path(const std::string &p) const {
        if (sensitive || p.empty())
            return p;
        const auto pos = p.find_last_of('/');
        if (pos == std::string::npos)
            return p;
        if (pos + 1 >= p.size())
            return "<path>";
        return p.substr(pos + 1);
    }

    // Free-form text (server replies, error details).
    std::string detail(const std::string &text) const {
        return sensitive ? text : std::string("<hidden>");
    }

private:
    // Trimmed, lower-cased value; empty when unset.
    static std::string envWord(const char *name) {
        const char *raw = std::getenv(name);
        std::string out;
        for (const char *c = raw ? raw : ""; *c; ++c) {
            if (!std::isspace(static_cast<unsigned char>(*c)))
                out += static_cast<char>(std::tolower(static_cast<unsigned char>(*c)));
            else if (!out.empty())
                out += ' ';
        }
        while (!out.empty() && out.back() == ' ')
            out.pop_back();
        return out;
    }
};

inline std::string loggablePath(const std::string &path) {
    return LogPolicy::fromEnvironment().path(path);
}

} // namespace skiff
