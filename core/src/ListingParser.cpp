// LIST line parsing follows the classic Unix long format:
//   drwxr-xr-x  2 owner group  4096 Mar 04 21:30 name
// Some servers omit owner/group; those lines are padded before parsing.
#include "skiff/ListingParser.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

namespace skiff {

static std::vector<std::string> splitWs(const std::string &line) {
    std::vector<std::string> out;
    std::istringstream in(line);
    std::string tok;
    while (in >> tok)
        out.push_back(tok);
    return out;
}

static bool allDigits(const std::string &s) {
    if (s.empty())
        return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    return true;
}

std::optional<RemoteEntry> parseListLine(const std::string &line) {
    std::vector<std::string> parts = splitWs(line);
    bool relaxed = false;
    if (parts.size() < 9 && parts.size() >= 4) {
        parts.insert(parts.begin() + 1, 2, std::string());
        relaxed = true;
    }
    if (parts.size() < 9)
        return std::nullopt;

    RemoteEntry e;
    e.is_dir = !line.empty() && line.front() == 'd';
    e.name = parts.back();
    e.permissions = parts[0];
    if (allDigits(parts[4]))
        e.size = std::strtoull(parts[4].c_str(), nullptr, 10);
    if (!relaxed) {
        if (!parts[2].empty())
            e.owner = parts[2];
        if (!parts[3].empty())
            e.group = parts[3];
    }
    std::string when;
    for (std::size_t i = 5; i + 1 < parts.size(); ++i) {
        if (!when.empty())
            when += ' ';
        when += parts[i];
    }
    e.mtime_text = when;
    if (e.is_dir)
        e.size = 0;
    e.listing_line = line;
    return e;
}

std::vector<RemoteEntry> parseListing(const std::string &text) {
    std::vector<RemoteEntry> out;
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t j = text.find_first_of("\r\n", i);
        if (j == std::string::npos)
            j = text.size();
        const std::string line = text.substr(i, j - i);
        i = j + 1;
        if (line.empty())
            continue;
        auto e = parseListLine(line);
        if (!e || e->name == "." || e->name == "..")
            continue;
        out.push_back(std::move(*e));
    }
    return out;
}

std::string formatPermissions(std::uint32_t mode) {
    std::string s(10, '-');
    const std::uint32_t type = mode & 0170000u;
    if (type == 0040000u)
        s[0] = 'd';
    else if (type == 0120000u)
        s[0] = 'l';
    static const char rwx[] = {'r', 'w', 'x'};
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i)))
            s[static_cast<std::size_t>(i + 1)] = rwx[i % 3];
    }
    return s;
}

std::string formatLongListing(const RemoteEntry &e) {
    std::string perms = e.permissions.size() == 10 ? e.permissions : formatPermissions(e.mode);
    if (e.is_dir)
        perms[0] = 'd';
    else if (perms[0] == 'd')
        perms[0] = '-';

    std::string when = e.mtime_text;
    if (when.empty()) {
        const std::time_t t = static_cast<std::time_t>(e.mtime ? *e.mtime : 0);
        std::tm tmv{};
        char buf[32];
        if (gmtime_r(&t, &tmv) && std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tmv) > 0)
            when = buf;
        else
            when = "Jan 01 00:00";
    }
    char head[64];
    std::snprintf(head, sizeof(head), " %10llu ",
                  static_cast<unsigned long long>(e.is_dir ? 0 : e.size));
    return perms + " 1 " + e.owner.value_or("-") + " " + e.group.value_or("-") + head + when +
           " " + e.name;
}

std::optional<std::uint64_t> parseMdtm(const std::string &reply_text) {
    // Accept "213 YYYYMMDDHHMMSS[.sss]" or just the timestamp.
    std::string digits;
    for (std::size_t i = 0; i < reply_text.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(reply_text[i]))) {
            std::size_t j = i;
            while (j < reply_text.size() &&
                   std::isdigit(static_cast<unsigned char>(reply_text[j])))
                ++j;
            if (j - i >= 14) {
                digits = reply_text.substr(i, 14);
                break;
            }
            i = j;
        }
    }
    if (digits.size() != 14)
        return std::nullopt;
    std::tm tmv{};
    tmv.tm_year = std::stoi(digits.substr(0, 4)) - 1900;
    tmv.tm_mon = std::stoi(digits.substr(4, 2)) - 1;
    tmv.tm_mday = std::stoi(digits.substr(6, 2));
    tmv.tm_hour = std::stoi(digits.substr(8, 2));
    tmv.tm_min = std::stoi(digits.substr(10, 2));
    tmv.tm_sec = std::stoi(digits.substr(12, 2));
    if (tmv.tm_mon < 0 || tmv.tm_mon > 11 || tmv.tm_mday < 1 || tmv.tm_mday > 31)
        return std::nullopt;
    const std::time_t t = timegm(&tmv);
    if (t < 0)
        return std::nullopt;
    return static_cast<std::uint64_t>(t);
}

} // namespace skiff
