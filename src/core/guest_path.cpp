/**
 * @file guest_path.cpp
 * @brief POSIX guest path normalization and composition
 *
 * @date 2025
 */

#include "vmsandbox/core/guest_path.hpp"

#include <sstream>
#include <vector>

namespace vmsandbox {
namespace core {

namespace {

std::string Normalize(const std::string& raw) {
    if (raw.empty()) {
        return raw;
    }

    // Host-side callers sometimes hand over backslashes; the guest never uses them
    std::string path = raw;
    for (auto& c : path) {
        if (c == '\\') {
            c = '/';
        }
    }

    const bool absolute = path.front() == '/';

    std::vector<std::string> parts;
    std::istringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        parts.push_back(part);
    }

    std::string result = absolute ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += parts[i];
    }

    if (result.empty()) {
        result = ".";
    }
    return result;
}

} // anonymous namespace

GuestPath::GuestPath(const std::string& path)
    : path_(Normalize(path)) {}

GuestPath GuestPath::FromHostName(const HostPath& host_path) {
    return GuestPath(host_path.filename().string());
}

GuestPath GuestPath::ResolveAgainst(const GuestPath& root) const {
    if (IsAbsolute() || root.Empty()) {
        return *this;
    }
    return root / *this;
}

GuestPath GuestPath::operator/(const std::string& component) const {
    if (path_.empty() || path_ == ".") {
        return GuestPath(component);
    }
    if (path_ == "/") {
        return GuestPath("/" + component);
    }
    return GuestPath(path_ + "/" + component);
}

GuestPath GuestPath::operator/(const GuestPath& relative) const {
    if (relative.IsAbsolute()) {
        return relative;
    }
    return *this / relative.String();
}

GuestPath GuestPath::Parent() const {
    auto pos = path_.find_last_of('/');
    if (pos == std::string::npos) {
        return GuestPath(".");
    }
    if (pos == 0) {
        return GuestPath("/");
    }
    return GuestPath(path_.substr(0, pos));
}

std::string GuestPath::Filename() const {
    auto pos = path_.find_last_of('/');
    if (pos == std::string::npos) {
        return path_;
    }
    return path_.substr(pos + 1);
}

std::string GuestPath::Stem() const {
    std::string name = Filename();
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return name;
    }
    return name.substr(0, dot);
}

std::string GuestPath::Extension() const {
    std::string name = Filename();
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return name.substr(dot);
}

GuestPath GuestPath::ReplaceExtension(const std::string& suffix) const {
    return Parent() / (Stem() + suffix);
}

} // namespace core
} // namespace vmsandbox
