#include "skiff/RemotePath.hpp"
#include <vector>

namespace skiff {

std::string stripTrailingSlash(const std::string &path) {
    if (path.empty())
        return path;
    std::size_t end = path.size();
    while (end > 1 && path[end - 1] == '/')
        --end;
    return path.substr(0, end);
}

bool isRoot(const std::string &path) {
    return stripTrailingSlash(path) == "/";
}

std::string parentPath(const std::string &path) {
    const std::string p = stripTrailingSlash(path);
    if (p.empty() || p == "/")
        return "/";
    const auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string &path) {
    const std::string p = stripTrailingSlash(path);
    if (p == "/")
        return p;
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string joinPath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string normalizePath(const std::string &path, const std::string &cwd) {
    std::string full;
    if (!path.empty() && path.front() == '/')
        full = path;
    else if (path.empty())
        full = cwd.empty() ? std::string("/") : cwd;
    else
        full = joinPath(cwd.empty() ? std::string("/") : cwd, path);

    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= full.size()) {
        const std::size_t j = full.find('/', i);
        const std::size_t end = (j == std::string::npos) ? full.size() : j;
        const std::string part = full.substr(i, end - i);
        if (part.empty() || part == ".") {
            // skip
        } else if (part == "..") {
            if (!parts.empty())
                parts.pop_back();
        } else {
            parts.push_back(part);
        }
        if (j == std::string::npos)
            break;
        i = j + 1;
    }
    if (parts.empty())
        return "/";
    std::string out;
    for (const auto &p : parts) {
        out += '/';
        out += p;
    }
    return out;
}

} // namespace skiff
