#include "PathSandbox.hpp"

namespace fs = std::filesystem;

bool PathSandbox::is_within(const fs::path& candidate, const fs::path& root) {
    const fs::path relative = candidate.lexically_relative(root);
    if (relative.empty() || relative == ".") {
        return false;
    }
    return *relative.begin() != "..";
}

fs::path PathSandbox::resolve(const std::string& requested, const fs::path& root, bool allow_unsafe) {
    if (requested.empty()) {
        throw PathEscapeError("Empty path");
    }

    const fs::path request(requested);
    const fs::path root_abs = fs::weakly_canonical(fs::absolute(root));

    if (request.is_absolute()) {
        if (!allow_unsafe) {
            throw PathEscapeError("Absolute paths are not allowed: " + requested);
        }
        return request.lexically_normal();
    }

    const fs::path joined = (root_abs / request).lexically_normal();
    if (allow_unsafe) {
        return joined;
    }

    if (!is_within(joined, root_abs)) {
        throw PathEscapeError("Path leaves the working directory: " + requested);
    }

    // Symlinks inside the root may still point elsewhere
    const fs::path real = fs::weakly_canonical(joined);
    if (!is_within(real, root_abs)) {
        throw PathEscapeError("Path resolves outside the working directory: " + requested);
    }
    return joined;
}
