/**
 * @file guest_path.hpp
 * @brief POSIX path inside the guest, kept apart from host paths
 *
 * Host paths use std::filesystem::path (host OS convention). Guest paths are
 * always forward-slash POSIX strings, so a Windows host never produces a
 * backslash path for a Linux guest. The two types do not convert implicitly;
 * crossing the boundary goes through GuestPath::FromHostName() or
 * GuestPath::String().
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <ostream>
#include <string>

namespace vmsandbox {
namespace core {

using HostPath = std::filesystem::path;

class GuestPath {
public:
    GuestPath() = default;

    /// Normalizes duplicate and trailing slashes; "." segments are dropped.
    explicit GuestPath(const std::string& path);

    /// Guest path for the final component of a host path (no directories).
    static GuestPath FromHostName(const HostPath& host_path);

    /**
     * @brief Resolve against a root
     *
     * Absolute paths are returned unchanged; relative ones are appended to
     * @p root.
     */
    GuestPath ResolveAgainst(const GuestPath& root) const;

    GuestPath operator/(const std::string& component) const;
    GuestPath operator/(const GuestPath& relative) const;

    GuestPath Parent() const;
    std::string Filename() const;
    std::string Stem() const;

    /// Extension including the dot, as written (".PY" stays ".PY")
    std::string Extension() const;

    /// Same path with the extension replaced by @p suffix (suffix may be empty)
    GuestPath ReplaceExtension(const std::string& suffix) const;

    bool IsAbsolute() const { return !path_.empty() && path_.front() == '/'; }
    bool Empty() const { return path_.empty(); }
    const std::string& String() const { return path_; }

    bool operator==(const GuestPath& other) const { return path_ == other.path_; }
    bool operator!=(const GuestPath& other) const { return path_ != other.path_; }
    bool operator<(const GuestPath& other) const { return path_ < other.path_; }

private:
    std::string path_;
};

inline std::ostream& operator<<(std::ostream& os, const GuestPath& path) {
    return os << path.String();
}

} // namespace core
} // namespace vmsandbox
