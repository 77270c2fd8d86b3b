#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>
#include "ConfigParser.hpp"

static bool decode_fails(const std::string& yaml) {
    try {
        YAML::Load(yaml).as<GlobalConfig>();
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

void test_GlobalConfig_full() {
    std::string yaml = R"(
verbosity: verbose
log_file: /tmp/tutorun/run.log
working_dir: /tmp/sandbox
allow_unsafe_paths: true
shell: /bin/bash
vars:
  NAME: World
  PORT: 8080
)";
    GlobalConfig config = YAML::Load(yaml).as<GlobalConfig>();
    assert(config.verbosity == Verbosity::Verbose);
    assert(config.log_file == "/tmp/tutorun/run.log");
    assert(config.working_dir == "/tmp/sandbox");
    assert(config.allow_unsafe_paths);
    assert(config.shell == "/bin/bash");
    assert(config.vars.size() == 2);
    assert(config.vars.at("NAME") == "World");
    assert(config.vars.at("PORT") == "8080");
    std::cout << "test_GlobalConfig_full passed" << std::endl;
}

void test_GlobalConfig_defaults() {
    GlobalConfig config = YAML::Load("verbosity: quiet").as<GlobalConfig>();
    assert(config.verbosity == Verbosity::Quiet);
    assert(config.shell == "/bin/sh");
    assert(!config.allow_unsafe_paths);
    assert(config.working_dir.empty());
    assert(config.vars.empty());
    std::cout << "test_GlobalConfig_defaults passed" << std::endl;
}

void test_Verbosity_values() {
    assert(YAML::Load("normal").as<Verbosity>() == Verbosity::Normal);
    assert(YAML::Load("DEBUG").as<Verbosity>() == Verbosity::Debug);
    assert(parse_verbosity(" Verbose ") == Verbosity::Verbose);
    assert(std::string(to_string(Verbosity::Quiet)) == "quiet");
    assert(to_log_level(Verbosity::Quiet) == LogUtils::Level::Warn);
    assert(to_log_level(Verbosity::Normal) == LogUtils::Level::Info);
    assert(to_log_level(Verbosity::Verbose) == LogUtils::Level::Debug);
    std::cout << "test_Verbosity_values passed" << std::endl;
}

void test_GlobalConfig_invalid() {
    assert(decode_fails("verbosity: loud"));
    assert(decode_fails("workdir: /tmp"));                 // unknown key
    assert(decode_fails("- verbosity: quiet"));            // not a mapping
    assert(decode_fails("vars: [A, B]"));
    assert(decode_fails("vars:\n  1BAD: x"));
    assert(decode_fails("allow_unsafe_paths: sometimes"));
    assert(decode_fails("shell: ''"));
    std::cout << "test_GlobalConfig_invalid passed" << std::endl;
}

int main() {
    test_GlobalConfig_full();
    test_GlobalConfig_defaults();
    test_Verbosity_values();
    test_GlobalConfig_invalid();

    std::cout << "All ConfigParser tests passed!" << std::endl;
    return 0;
}
