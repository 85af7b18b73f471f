#include "mcps/security/path_sandbox.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace mcps::security {

namespace fs = std::filesystem;

namespace detail {

bool is_within(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        // A trailing separator shows up as an empty final component
        if (root_it->empty() && std::next(root_it) == root.end()) {
            return true;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

}  // namespace detail

PathSandbox::PathSandbox(const fs::path& root) {
    std::error_code ec;
    root_ = fs::canonical(root, ec);
    if (ec) {
        throw std::invalid_argument("PathSandbox: cannot resolve root '" + root.string() + "': " + ec.message());
    }
    if (fs::is_directory(root_, ec) == false) {
        throw std::invalid_argument("PathSandbox: root is not a directory: " + root_.string());
    }
}

SandboxResult<fs::path> PathSandbox::resolve(std::string_view request) const {
    if (request.empty()) {
        return tl::unexpected(SandboxError{SandboxError::Code::Invalid, "path cannot be empty"});
    }
    if (request.find('\0') != std::string_view::npos) {
        return tl::unexpected(SandboxError{SandboxError::Code::Invalid, "path contains a NUL byte"});
    }

    fs::path requested{std::string(request)};
    const fs::path joined = requested.is_absolute() ? requested : root_ / requested;

    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(joined, ec);
    if (ec) {
        return tl::unexpected(SandboxError{
            SandboxError::Code::Invalid, "cannot resolve '" + std::string(request) + "': " + ec.message()});
    }

    if (detail::is_within(root_, resolved) == false) {
        return tl::unexpected(SandboxError{
            SandboxError::Code::Escape, "path '" + std::string(request) + "' is outside the workspace"});
    }
    return resolved;
}

std::string PathSandbox::display(const fs::path& resolved) const {
    const auto relative = resolved.lexically_relative(root_);
    if (relative.empty() || relative == ".") {
        return ".";
    }
    return relative.generic_string();
}

}  // namespace mcps::security
