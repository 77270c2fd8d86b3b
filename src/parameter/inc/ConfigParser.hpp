#pragma once

#include "GlobalConfig.hpp"
#include "StringUtils.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<Verbosity> {
        static bool decode(const Node& node, Verbosity& rhs) {
            rhs = parse_verbosity(node.as<std::string>());
            return true;
        }
    };

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("Configuration root must be a mapping");
            }

            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "verbosity", "log_file", "working_dir", "allow_unsafe_paths", "shell", "vars"
            };
            check_unknown_keys(node, valid_keys, "config");

            if (node["verbosity"]) {
                rhs.verbosity = node["verbosity"].as<Verbosity>();
            }
            if (node["log_file"]) {
                rhs.log_file = node["log_file"].as<std::string>();
            }
            if (node["working_dir"]) {
                rhs.working_dir = node["working_dir"].as<std::string>();
            }
            if (node["allow_unsafe_paths"]) {
                rhs.allow_unsafe_paths = node["allow_unsafe_paths"].as<bool>();
            }
            if (node["shell"]) {
                rhs.shell = node["shell"].as<std::string>();
                if (rhs.shell.empty()) {
                    throw std::runtime_error("shell must not be empty in config.");
                }
            }
            if (node["vars"]) {
                const auto& vars = node["vars"];
                if (!vars.IsMap()) {
                    throw std::runtime_error("vars must be a mapping of NAME: value in config.");
                }
                for (auto it = vars.begin(); it != vars.end(); ++it) {
                    std::string name = it->first.as<std::string>();
                    if (!StringUtils::is_identifier(name)) {
                        throw std::runtime_error("Invalid variable name in config vars: " + name);
                    }
                    rhs.vars[name] = it->second.as<std::string>();
                }
            }
            return true;
        }
    };

}
