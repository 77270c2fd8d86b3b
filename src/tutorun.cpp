#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "SignalManager.hpp"
#include "ShellProcess.hpp"
#include "TutorialParser.hpp"
#include "TutorialExecutor.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

void install_signal_handlers() {
    for (int signum : {SIGINT, SIGTERM}) {
        SignalManager::register_signal(signum, [](int) { ShellProcess::kill_active(); });
        SignalManager::register_signal(signum, [](int sig) { ::_exit(128 + sig); }, true);
    }
    SignalManager::setup();
}

ExecutorConfig make_executor_config(const GlobalConfig& global) {
    ExecutorConfig config;
    config.working_dir = global.working_dir.empty()
        ? std::filesystem::current_path()
        : std::filesystem::absolute(global.working_dir);
    config.allow_unsafe_paths = global.allow_unsafe_paths;
    config.shell = global.shell;
    config.only_step = global.only_step;
    return config;
}

}

int main(int argc, char* argv[]) {
    LogUtils::init(LogUtils::Level::Info);
    install_signal_handlers();

    int result = kExitSuccess;

    // 1. Layer configuration: yaml < environment < command line
    ParameterContext context;
    try {
        if (!context.init(argc, argv)) {
            LogUtils::shutdown();
            return kExitSuccess;
        }
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::error("Use --help or -? to show usage information");
        LogUtils::shutdown();
        return kExitUsage;
    }

    const GlobalConfig& global = context.get_global_config();
    if (!global.log_file.empty()) {
        LogUtils::init(to_log_level(global.verbosity), global.log_file);
    } else {
        LogUtils::set_level(to_log_level(global.verbosity));
    }
    if (!global.config_file.empty()) {
        LogUtils::debug("Loaded configuration from {}", global.config_file);
    }

    // 2. Parse the whole document before anything runs
    Tutorial tutorial;
    try {
        tutorial = TutorialParser().parse_file(global.tutorial_path);
    } catch (const DocumentParseError& e) {
        LogUtils::error("Parse error ({}): {}", to_string(e.kind()), e.what());
        LogUtils::shutdown();
        return kExitUsage;
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        LogUtils::shutdown();
        return kExitUsage;
    }

    // 3. Execute in document order
    try {
        ExecutorConfig config = make_executor_config(global);
        std::unique_ptr<TutorialExecutor> executor = global.dry_run
            ? TutorialExecutor::create_dry_run(config)
            : std::make_unique<TutorialExecutor>(config);

        VariableStore variables(global.vars);
        RunReport report = executor->run(tutorial, variables);

        if (!report.success()) {
            result = kExitRunFailed;
        }
    } catch (const std::invalid_argument& e) {
        LogUtils::error("Error: {}", e.what());
        result = kExitUsage;
    } catch (const std::exception& e) {
        LogUtils::error("Error during tutorial execution: {}", e.what());
        result = kExitRunFailed;
    }

    LogUtils::shutdown();
    return result;
}
