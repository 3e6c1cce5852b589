// Helpers for slash separated remote paths.
#pragma once
#include <string>

namespace skiff {

// "/a/b/" -> "/a/b"; "/" stays "/"; "" stays "".
std::string stripTrailingSlash(const std::string &path);

// Parent of an absolute path. "/a" -> "/", "/" -> "/" (root has no parent).
std::string parentPath(const std::string &path);

// Last component. "/a/b" -> "b".
std::string baseName(const std::string &path);

// join("/", "x") -> "/x"; join("/a", "x") -> "/a/x".
std::string joinPath(const std::string &base, const std::string &name);

// Lexical cleanup: collapses "//", "." and "..". Relative paths are resolved
// against "cwd". The result is always absolute.
std::string normalizePath(const std::string &path, const std::string &cwd = "/");

bool isRoot(const std::string &path);

} // namespace skiff
