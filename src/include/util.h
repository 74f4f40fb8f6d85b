#ifndef UTIL_H
#define UTIL_H

#include <string>
#include <utility>
#include <vector>

// Splits "/a/b/c" into {"/a/b", "c"}. Root maps to {"/", ""}.
std::pair<std::string, std::string>
split_path_from_target(const std::string &path);

std::vector<std::string> split_path(const std::string &path);

std::string join_paths(const std::string &path1, const std::string &path2);

std::string filename(const std::string &path);

// Absolute path with single separators and no trailing slash.
std::string normalize_path(const std::string &path);

// Percent-encodes everything except RFC 3986 unreserved characters and '/'.
std::string url_encode(const std::string &value);

std::string
form_encode(const std::vector<std::pair<std::string, std::string>> &fields);

#endif // UTIL_H
