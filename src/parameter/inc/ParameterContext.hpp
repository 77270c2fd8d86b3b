#pragma once

#include "ConfigParser.hpp"
#include "GlobalConfig.hpp"

#include <unordered_map>
#include <vector>
#include <string>
#include <optional>


class ParameterContext {
public:
    static constexpr const char* kConfigFileName = "tutorun.yml";

    ParameterContext();

    // Returns false when the process should exit without running (help, version)
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    // Looks for tutorun.yml in `start` and its parents
    static std::optional<std::string> find_config_file(const std::string& start);

    const GlobalConfig& get_global_config() const;

private:
    GlobalConfig config_;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> cli_vars;          // repeated --var NAME=VALUE
    std::vector<std::string> positional;

    void validate();

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--working-dir")
        char short_opt;          // Short option (e.g. 'w')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
