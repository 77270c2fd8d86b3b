#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#ifndef TUTORUN_VERSION
#define TUTORUN_VERSION "0.0.0"
#endif

#ifndef TUTORUN_BUILD_GIT
#define TUTORUN_BUILD_GIT "unknown"
#endif

Verbosity parse_verbosity(const std::string& name) {
    const std::string lowered = StringUtils::to_lower(StringUtils::trim_copy(name));
    if (lowered == "quiet")   return Verbosity::Quiet;
    if (lowered == "normal")  return Verbosity::Normal;
    if (lowered == "verbose") return Verbosity::Verbose;
    if (lowered == "debug")   return Verbosity::Debug;
    throw std::runtime_error("Invalid verbosity '" + name + "' (expected quiet, normal, verbose or debug)");
}

const char* to_string(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Quiet:   return "quiet";
        case Verbosity::Normal:  return "normal";
        case Verbosity::Verbose: return "verbose";
        case Verbosity::Debug:   return "debug";
    }
    return "normal";
}

LogUtils::Level to_log_level(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::Quiet:   return LogUtils::Level::Warn;
        case Verbosity::Normal:  return LogUtils::Level::Info;
        case Verbosity::Verbose: return LogUtils::Level::Debug;
        case Verbosity::Debug:   return LogUtils::Level::Debug;
    }
    return LogUtils::Level::Info;
}

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--working-dir", 'w', "Directory commands run in and files are written to", true},
    {"--allow-unsafe-paths", 'a', "Allow file blocks to write outside the working directory", false},
    {"--var", 'e', "Seed a variable, NAME=VALUE (repeatable)", true},
    {"--step", 's', "Run only the step with this id or 1-based index", true},
    {"--config-file", 'c', "Specify config file path", true},
    {"--dry-run", 'n', "Parse and list actions without executing them", false},
    {"--log-file", 'l', "Also write the log to this file", true},
    {"--verbose", 'v', "Show substituted commands and captures", false},
    {"--quiet", 'q', "Only show warnings and failures", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: tutorun [OPTIONS]... TUTORIAL.md\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;
        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset > current_len ? desc_offset - current_len : 1;
        std::cout << std::string(padding, ' ') << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  tutorun docs/getting-started.md\n"
              << "  tutorun -w /tmp/sandbox --var USER=demo --step install tutorial.md\n"
              << "\nConfiguration is read from " << kConfigFileName
              << " in the current directory or its parents.\n\n";
}

void ParameterContext::show_version() {
    std::cout << "tutorun version: " << TUTORUN_VERSION << std::endl;
    std::cout << "git: " << TUTORUN_BUILD_GIT << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config || config.IsNull()) {
        return;
    }
    GlobalConfig merged = config_;
    YAML::convert<GlobalConfig>::decode(config, merged);
    config_ = std::move(merged);
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
        config_.config_file = file_path;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
        return;
    }
    if (auto found = find_config_file(std::filesystem::current_path().string())) {
        merge_yaml(*found);
    }
}

std::optional<std::string> ParameterContext::find_config_file(const std::string& start) {
    std::filesystem::path dir = std::filesystem::absolute(start);
    while (true) {
        std::filesystem::path candidate = dir / kConfigFileName;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }
        }
        // Handle short option format (-k value)
        else if (arg.size() > 1 && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }
        } else {
            positional.push_back(arg);
            continue;
        }

        if (key == "--var") {
            cli_vars.push_back(value);
        } else {
            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (!positional.empty()) {
        if (positional.size() > 1) {
            throw std::runtime_error("Only one tutorial file may be given, got " + std::to_string(positional.size()));
        }
        config_.tutorial_path = positional.front();
    }

    if (cli_params.count("--working-dir")) {
        config_.working_dir = cli_params["--working-dir"];
    }
    if (cli_params.count("--allow-unsafe-paths")) {
        config_.allow_unsafe_paths = true;
    }
    if (cli_params.count("--step")) {
        if (cli_params["--step"].empty()) {
            throw std::runtime_error("--step requires a step id or index");
        }
        config_.only_step = cli_params["--step"];
    }
    if (cli_params.count("--dry-run")) {
        config_.dry_run = true;
    }
    if (cli_params.count("--log-file")) {
        config_.log_file = cli_params["--log-file"];
    }
    if (cli_params.count("--verbose") && cli_params.count("--quiet")) {
        throw std::runtime_error("--verbose and --quiet cannot be combined");
    }
    if (cli_params.count("--verbose")) {
        config_.verbosity = Verbosity::Verbose;
    }
    if (cli_params.count("--quiet")) {
        config_.verbosity = Verbosity::Quiet;
    }

    for (const auto& assignment : cli_vars) {
        size_t eq = assignment.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("--var expects NAME=VALUE, got '" + assignment + "'");
        }
        std::string name = assignment.substr(0, eq);
        if (!StringUtils::is_identifier(name)) {
            throw std::runtime_error("Invalid variable name in --var: '" + name + "'");
        }
        config_.vars[name] = assignment.substr(eq + 1);
    }
}

void ParameterContext::merge_environment_vars() {
    if (const char* value = std::getenv("TUTORUN_VERBOSITY")) {
        config_.verbosity = parse_verbosity(value);
    }
    if (const char* value = std::getenv("TUTORUN_WORKDIR")) {
        config_.working_dir = value;
    }
    if (const char* value = std::getenv("TUTORUN_ALLOW_UNSAFE_PATHS")) {
        bool flag = false;
        if (!StringUtils::parse_bool(value, flag)) {
            throw std::runtime_error(std::string("Invalid boolean in TUTORUN_ALLOW_UNSAFE_PATHS: ") + value);
        }
        config_.allow_unsafe_paths = flag;
    }
    if (const char* value = std::getenv("TUTORUN_LOG_FILE")) {
        config_.log_file = value;
    }
    if (const char* value = std::getenv("TUTORUN_SHELL")) {
        if (value[0] != '\0') {
            config_.shell = value;
        }
    }
}

void ParameterContext::validate() {
    if (config_.tutorial_path.empty()) {
        throw std::runtime_error("Missing tutorial file argument");
    }
    if (!config_.working_dir.empty() && !std::filesystem::is_directory(config_.working_dir)) {
        throw std::runtime_error("Working directory does not exist: " + config_.working_dir);
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    validate();
    return true;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_;
}
