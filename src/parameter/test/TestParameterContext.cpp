#include "ParameterContext.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

static void clear_env() {
    for (const char* name : {"TUTORUN_VERBOSITY", "TUTORUN_WORKDIR", "TUTORUN_ALLOW_UNSAFE_PATHS",
                             "TUTORUN_LOG_FILE", "TUTORUN_SHELL"}) {
        unsetenv(name);
    }
}

static bool init_fails(std::vector<const char*> argv) {
    ParameterContext ctx;
    try {
        ctx.init(static_cast<int>(argv.size()), const_cast<char**>(argv.data()));
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

// Test command line parameter parsing
void test_commandline_merge() {
    ParameterContext ctx;
    const char* argv[] = {
        "tutorun",
        "--working-dir=/tmp",
        "-e", "NAME=World",
        "--var", "GREETING=Hi=there",
        "--step", "install",
        "-n",
        "-v",
        "docs/tutorial.md"
    };
    ctx.merge_commandline(11, const_cast<char**>(argv));

    const auto& config = ctx.get_global_config();
    assert(config.tutorial_path == "docs/tutorial.md");
    assert(config.working_dir == "/tmp");
    assert(config.vars.at("NAME") == "World");
    assert(config.vars.at("GREETING") == "Hi=there");
    assert(config.only_step == std::string("install"));
    assert(config.dry_run);
    assert(config.verbosity == Verbosity::Verbose);
    assert(!config.allow_unsafe_paths);
    std::cout << "Commandline merge test passed.\n";
}

// Test environment variable merge
void test_environment_merge() {
    clear_env();
    ParameterContext ctx;
    setenv("TUTORUN_VERBOSITY", "quiet", 1);
    setenv("TUTORUN_WORKDIR", "/var/tmp", 1);
    setenv("TUTORUN_ALLOW_UNSAFE_PATHS", "yes", 1);
    setenv("TUTORUN_SHELL", "/bin/bash", 1);
    ctx.merge_environment_vars();

    const auto& config = ctx.get_global_config();
    assert(config.verbosity == Verbosity::Quiet);
    assert(config.working_dir == "/var/tmp");
    assert(config.allow_unsafe_paths);
    assert(config.shell == "/bin/bash");

    setenv("TUTORUN_ALLOW_UNSAFE_PATHS", "perhaps", 1);
    bool thrown = false;
    try {
        ctx.merge_environment_vars();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    clear_env();
    std::cout << "Environment merge test passed.\n";
}

// Test YAML config merge
void test_yaml_merge() {
    ParameterContext ctx;
    YAML::Node config = YAML::Load(R"(
verbosity: debug
working_dir: /srv
vars:
  NAME: FromYaml
)");
    ctx.merge_yaml(config);

    const auto& data = ctx.get_global_config();
    assert(data.verbosity == Verbosity::Debug);
    assert(data.working_dir == "/srv");
    assert(data.vars.at("NAME") == "FromYaml");

    // A failed merge leaves the previous values alone
    bool thrown = false;
    try {
        ctx.merge_yaml(YAML::Load("verbosity: quiet\nbogus: 1"));
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(ctx.get_global_config().verbosity == Verbosity::Debug);
    std::cout << "YAML merge test passed.\n";
}

// Test priority: command line > environment > yaml
void test_priority() {
    clear_env();
    fs::path dir = fs::temp_directory_path() / "tutorun_test_param_priority";
    fs::remove_all(dir);
    fs::create_directories(dir / "yaml-wd");
    fs::create_directories(dir / "env-wd");
    fs::create_directories(dir / "cli-wd");

    fs::path config_file = dir / "custom.yml";
    {
        std::ofstream out(config_file);
        out << "verbosity: debug\n"
            << "working_dir: " << (dir / "yaml-wd").string() << "\n"
            << "shell: /bin/sh\n"
            << "vars:\n  NAME: yaml\n  KEEP: yaml\n";
    }
    setenv("TUTORUN_WORKDIR", (dir / "env-wd").string().c_str(), 1);
    setenv("TUTORUN_VERBOSITY", "normal", 1);

    std::string config_arg = "--config-file=" + config_file.string();
    std::string wd_arg = (dir / "cli-wd").string();
    const char* argv[] = {
        "tutorun", config_arg.c_str(), "-w", wd_arg.c_str(), "--var", "NAME=cli", "tutorial.md"
    };

    ParameterContext ctx;
    assert(ctx.init(7, const_cast<char**>(argv)));
    const auto& config = ctx.get_global_config();
    assert(config.config_file == config_file.string());
    assert(config.working_dir == wd_arg);
    assert(config.verbosity == Verbosity::Normal);
    assert(config.vars.at("NAME") == "cli");
    assert(config.vars.at("KEEP") == "yaml");

    clear_env();
    fs::remove_all(dir);
    std::cout << "Priority test passed.\n";
}

void test_find_config_file() {
    fs::path dir = fs::temp_directory_path() / "tutorun_test_find_config";
    fs::remove_all(dir);
    fs::create_directories(dir / "a" / "b");
    { std::ofstream out(dir / ParameterContext::kConfigFileName); out << "verbosity: quiet\n"; }

    auto found = ParameterContext::find_config_file((dir / "a" / "b").string());
    assert(found);
    assert(fs::equivalent(*found, dir / ParameterContext::kConfigFileName));

    fs::remove(dir / ParameterContext::kConfigFileName);
    found = ParameterContext::find_config_file((dir / "a" / "b").string());
    assert(!found || !fs::equivalent(fs::path(*found).parent_path(), dir));

    fs::remove_all(dir);
    std::cout << "Find config file test passed.\n";
}

void test_help_and_version() {
    const char* help[] = {"tutorun", "--help"};
    ParameterContext ctx;
    assert(!ctx.init(2, const_cast<char**>(help)));

    const char* version[] = {"tutorun", "-V"};
    ParameterContext ctx2;
    assert(!ctx2.init(2, const_cast<char**>(version)));
    std::cout << "Help and version test passed.\n";
}

void test_invalid_commandlines() {
    clear_env();
    assert(init_fails({"tutorun"}));                                   // no tutorial
    assert(init_fails({"tutorun", "--unknown", "t.md"}));
    assert(init_fails({"tutorun", "-x", "t.md"}));
    assert(init_fails({"tutorun", "-vq", "t.md"}));
    assert(init_fails({"tutorun", "--step"}));                         // missing value
    assert(init_fails({"tutorun", "--var", "NOVALUE", "t.md"}));
    assert(init_fails({"tutorun", "--var", "1X=2", "t.md"}));
    assert(init_fails({"tutorun", "--dry-run=yes", "t.md"}));
    assert(init_fails({"tutorun", "a.md", "b.md"}));
    assert(init_fails({"tutorun", "-v", "-q", "t.md"}));
    assert(init_fails({"tutorun", "-w", "/definitely/not/a/dir", "t.md"}));
    assert(init_fails({"tutorun", "-c", "/definitely/not/a/config.yml", "t.md"}));
    std::cout << "Invalid commandline test passed.\n";
}

int main() {
    test_commandline_merge();
    test_environment_merge();
    test_yaml_merge();
    test_priority();
    test_find_config_file();
    test_help_and_version();
    test_invalid_commandlines();

    std::cout << "All tests passed!\n";
    return 0;
}
