#include "ActionExecutionStrategy.hpp"
#include "PathSandbox.hpp"
#include "Substitution.hpp"
#include "Validator.hpp"
#include "StringUtils.hpp"
#include "TimeRecorder.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string errno_text() {
    return std::strerror(errno);
}

}

void ProductionActionStrategy::execute(const Action& action, ActionOutcome& outcome, ExecutionContext& context) {
    std::visit(overloaded{
        [&](const RunAction& run) { run_command(run, outcome, context); },
        [&](const FileAction& file) { write_file(file, outcome, context); }
    }, action);
}

void ProductionActionStrategy::run_command(const RunAction& action, ActionOutcome& outcome, ExecutionContext& context) {
    const std::string command = Substitution::apply(action.command, context.variables);
    for (const auto& name : Substitution::unresolved(action.command, context.variables)) {
        LogUtils::warn("Variable ${{{}}} is not set, substituting an empty string (line {})", name, action.line_number);
    }
    LogUtils::debug("Command: {}", command);

    fs::path workdir = context.working_dir;
    if (action.working_dir) {
        fs::path requested(*action.working_dir);
        workdir = requested.is_absolute() ? requested : context.working_dir / requested;
    }

    std::error_code ec;
    if (!fs::is_directory(workdir, ec)) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                       "Working directory does not exist: " + workdir.string());
        return;
    }

    ShellProcess::Options options;
    options.command = command;
    options.working_dir = workdir;
    options.timeout = std::chrono::seconds(action.timeout_sec);
    options.shell = context.shell;

    ProcessResult result;
    try {
        result = ShellProcess::execute(options);
    } catch (const std::system_error& e) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::SpawnError,
                       "Failed to start command: " + std::string(e.what()));
        return;
    }

    outcome.process = result;
    outcome.duration_ms = result.duration_ms;
    outcome.expected = action.expected;
    outcome.actual = result.combined;

    if (result.timed_out) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::Timeout,
                       "Command timed out after " + std::to_string(action.timeout_sec) + " seconds");
        return;
    }

    ValidationResult validation = Validator::validate(action, result);
    outcome.expected = validation.expected;
    outcome.actual = validation.actual;
    if (!validation.passed) {
        outcome.finish(ActionStatus::Failed, OutcomeReason::ValidationMismatch, validation.message);
        return;
    }

    if (!capture(action, result, outcome, context)) {
        return;
    }

    outcome.finish(ActionStatus::Passed, OutcomeReason::None, validation.message);
}

bool ProductionActionStrategy::capture(const RunAction& action, const ProcessResult& result,
                                       ActionOutcome& outcome, ExecutionContext& context) {
    if (action.out_file) {
        fs::path target;
        try {
            target = PathSandbox::resolve(*action.out_file, context.working_dir, context.allow_unsafe_paths);
        } catch (const PathEscapeError& e) {
            outcome.finish(ActionStatus::Errored, OutcomeReason::PathEscape, e.what());
            return false;
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                           "Failed to open output file " + target.string() + ": " + errno_text());
            return false;
        }
        out << result.stdout_text;
        out.close();
        if (out.fail()) {
            outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                           "Failed to write output file " + target.string());
            return false;
        }
        LogUtils::debug("Captured stdout ({} bytes) into {}", result.stdout_text.size(), target.string());
    }

    if (action.out_var) {
        context.variables.set(*action.out_var, StringUtils::trim_copy(result.combined));
        LogUtils::debug("Captured output into ${{{}}}", *action.out_var);
    }

    if (action.code_var) {
        context.variables.set(*action.code_var, std::to_string(result.exit_code));
        LogUtils::debug("Captured exit code {} into ${{{}}}", result.exit_code, *action.code_var);
    }
    return true;
}

void ProductionActionStrategy::write_file(const FileAction& action, ActionOutcome& outcome, ExecutionContext& context) {
    TimeRecorder timer;

    fs::path target;
    try {
        target = PathSandbox::resolve(action.path, context.working_dir, context.allow_unsafe_paths);
    } catch (const PathEscapeError& e) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::PathEscape, e.what());
        return;
    }

    std::error_code ec;
    if (action.once && fs::exists(target, ec)) {
        outcome.finish(ActionStatus::Skipped, OutcomeReason::AlreadyExists,
                       "File already exists, skipping (once=true): " + action.path);
        return;
    }

    std::string content = action.templated
        ? Substitution::apply(action.content, context.variables)
        : action.content;
    if (content.empty() || content.back() != '\n') {
        content += '\n';
    }

    const fs::path parent = target.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                       "Parent directory does not exist: " + parent.string());
        return;
    }

    auto flags = std::ios::binary | (action.mode == WriteMode::Append ? std::ios::app : std::ios::trunc);
    std::ofstream out(target, flags);
    if (!out.is_open()) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                       "Failed to open " + target.string() + ": " + errno_text());
        return;
    }
    out << content;
    out.close();
    if (out.fail()) {
        outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                       "Failed to write " + target.string());
        return;
    }

    if (action.executable) {
        fs::permissions(target,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError,
                           "Failed to make " + target.string() + " executable: " + ec.message());
            return;
        }
    }

    outcome.duration_ms = timer.elapsed();
    outcome.finish(ActionStatus::Passed, OutcomeReason::None,
                   std::string(action.mode == WriteMode::Append ? "Appended " : "Wrote ")
                   + std::to_string(content.size()) + " bytes to " + action.path);
}

void DryRunActionStrategy::execute(const Action& action, ActionOutcome& outcome, ExecutionContext& context) {
    std::visit(overloaded{
        [&](const RunAction& run) {
            LogUtils::info("Would run (mode={}, exp={}, timeout={}s): {}",
                           to_string(run.mode), run.expected, run.timeout_sec,
                           Substitution::apply(run.command, context.variables));
        },
        [&](const FileAction& file) {
            LogUtils::info("Would {} {} ({} bytes{}{})",
                           to_string(file.mode), file.path, file.content.size(),
                           file.executable ? ", executable" : "",
                           file.once ? ", once" : "");
        }
    }, action);

    outcome.finish(ActionStatus::Skipped, OutcomeReason::DryRun, "Dry run");
}
