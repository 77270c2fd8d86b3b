#pragma once

#include "LogUtils.hpp"
#include <map>
#include <optional>
#include <string>

enum class Verbosity {
    Quiet,
    Normal,
    Verbose,
    Debug
};

// Throws std::runtime_error for anything but quiet/normal/verbose/debug
Verbosity parse_verbosity(const std::string& name);
const char* to_string(Verbosity verbosity);
LogUtils::Level to_log_level(Verbosity verbosity);

struct GlobalConfig {
    std::string tutorial_path;
    Verbosity verbosity = Verbosity::Normal;
    std::string log_file;
    std::string working_dir;                // empty = current directory
    bool allow_unsafe_paths = false;
    std::string shell = "/bin/sh";
    bool dry_run = false;
    std::optional<std::string> only_step;
    std::map<std::string, std::string> vars;
    std::string config_file;                // the file that was merged, if any
};
