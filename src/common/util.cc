#include "util.h"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

std::pair<std::string, std::string>
split_path_from_target(const std::string &path) {
    // Treat both empty string and "/" as referring to root.
    if (path.empty() || path == "/") {
        return {"/", ""};
    }

    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }

    size_t pos = trimmed.find_last_of('/');
    if (pos == std::string::npos) {
        // Relative names live directly under the root of the repository.
        return {"/", trimmed};
    }
    std::string dir = (pos == 0) ? "/" : trimmed.substr(0, pos);
    std::string file = trimmed.substr(pos + 1);
    return {dir, file};
}

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> result;
    if (path.empty() || path == "/") {
        return result;
    }

    std::istringstream iss(path);
    std::string token;
    while (std::getline(iss, token, '/')) {
        if (!token.empty()) {
            result.push_back(token);
        }
    }

    return result;
}

std::string join_paths(const std::string &path1, const std::string &path2) {
    if (path1.empty()) {
        return path2;
    }
    if (path2.empty()) {
        return path1;
    }
    if (path1 == "/") {
        return "/" + path2;
    }
    if (path1.back() == '/') {
        return path1 + path2;
    }
    return path1 + "/" + path2;
}

std::string filename(const std::string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string normalize_path(const std::string &path) {
    std::string out = "/";
    for (const auto &part : split_path(path)) {
        out = join_paths(out, part);
    }
    return out;
}

std::string url_encode(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
            c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out.append(hex);
        }
    }
    return out;
}

std::string
form_encode(const std::vector<std::pair<std::string, std::string>> &fields) {
    std::string out;
    for (const auto &field : fields) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += url_encode(field.first);
        out.push_back('=');
        // '/' must not survive unescaped inside a form value.
        std::string value = url_encode(field.second);
        std::string escaped;
        for (char c : value) {
            if (c == '/') {
                escaped += "%2F";
            } else {
                escaped.push_back(c);
            }
        }
        out += escaped;
    }
    return out;
}
