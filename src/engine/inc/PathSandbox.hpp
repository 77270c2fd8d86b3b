#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

class PathEscapeError : public std::runtime_error {
public:
    explicit PathEscapeError(const std::string& message) : std::runtime_error(message) {}
};

// Keeps file targets inside the run's working directory.
class PathSandbox {
public:
    // Resolves `requested` against `root` and returns an absolute path.
    // Unless allow_unsafe is set, throws PathEscapeError for absolute paths
    // and for paths (including through symlinks) that leave `root`.
    static std::filesystem::path resolve(const std::string& requested,
                                         const std::filesystem::path& root,
                                         bool allow_unsafe = false);

    static bool is_within(const std::filesystem::path& candidate, const std::filesystem::path& root);
};
