#ifndef MCPS_SECURITY_PATH_SANDBOX_HPP
#define MCPS_SECURITY_PATH_SANDBOX_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcps::security {

// ═══════════════════════════════════════════════════════════════════════════
// Path Sandbox
// ═══════════════════════════════════════════════════════════════════════════
// Confines file tool paths to one directory tree.
//
// resolve() accepts paths relative to the root or absolute paths inside it.
// Symlinks in the existing part of a path are followed before the
// containment check, so a link pointing outside the root is rejected. The
// non-existing tail is normalised lexically, which lets write_file create
// new files.
//
// LIMITATION: time-of-check to time-of-use. A directory swapped for a
// symlink after resolve() returns is not detected.

struct SandboxError {
    enum class Code {
        Invalid,  // empty path, NUL byte, unresolvable
        Escape    // resolves outside the root
    };

    Code code{Code::Invalid};
    std::string message;
};

template <typename T>
using SandboxResult = tl::expected<T, SandboxError>;

class PathSandbox {
public:
    /// Throws std::invalid_argument if `root` is not an existing directory.
    explicit PathSandbox(const std::filesystem::path& root);

    [[nodiscard]] SandboxResult<std::filesystem::path> resolve(std::string_view request) const;

    /// Path relative to the root, for messages shown to clients.
    [[nodiscard]] std::string display(const std::filesystem::path& resolved) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

namespace detail {

// True when `candidate` equals `root` or lies beneath it, by whole components
[[nodiscard]] bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

}  // namespace detail

}  // namespace mcps::security

#endif  // MCPS_SECURITY_PATH_SANDBOX_HPP
