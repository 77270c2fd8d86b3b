#include "TutorialExecutor.hpp"
#include "TutorialParser.hpp"
#include "TimeRecorder.hpp"
#include "LogUtils.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

static fs::path make_workdir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("tutorun_test_executor_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static ExecutorConfig config_for(const fs::path& dir) {
    ExecutorConfig config;
    config.working_dir = dir;
    return config;
}

void test_capture_then_substitute() {
    fs::path dir = make_workdir("capture");
    Tutorial tutorial = TutorialParser().parse(
        "# Greeting\n"
        "## Say hi {.gr-step #hi}\n"
        "```bash {.gr-run out-var=NAME}\n"
        "echo -n \"World\"\n"
        "```\n"
        "```bash {.gr-run mode=contains exp=\"Hi World\"}\n"
        "echo \"Hi ${NAME}\"\n"
        "```\n");

    TutorialExecutor executor(config_for(dir));
    VariableStore vars;
    RunReport report = executor.run(tutorial, vars);

    assert(report.size() == 2);
    assert(report.success());
    assert(report.count(ActionStatus::Passed) == 2);
    assert(vars.get("NAME") == std::string("World"));
    assert(report.outcomes()[1].actual.find("Hi World") != std::string::npos);

    fs::remove_all(dir);
    std::cout << "test_capture_then_substitute passed" << std::endl;
}

void test_failure_halts_later_steps() {
    fs::path dir = make_workdir("halt");
    Tutorial tutorial = TutorialParser().parse(
        "## One {.gr-step}\n"
        "```bash {.gr-run}\n"
        "exit 1\n"
        "```\n"
        "## Two {.gr-step}\n"
        "```bash {.gr-run}\n"
        "touch should-not-exist\n"
        "```\n"
        "```text {.gr-file path=also-not.txt}\n"
        "x\n"
        "```\n");

    TutorialExecutor executor(config_for(dir));
    RunReport report = executor.run(tutorial);

    assert(!report.success());
    assert(executor.halted());
    const auto& outcomes = report.outcomes();
    assert(outcomes.size() == 3);
    assert(outcomes[0].status == ActionStatus::Failed);
    assert(outcomes[0].reason == OutcomeReason::ValidationMismatch);
    assert(outcomes[0].expected == "0" && outcomes[0].actual == "1");
    for (size_t i = 1; i < outcomes.size(); ++i) {
        assert(outcomes[i].status == ActionStatus::Skipped);
        assert(outcomes[i].reason == OutcomeReason::RunHalted);
        assert(outcomes[i].step_id == "step-2");
    }
    assert(!fs::exists(dir / "should-not-exist"));
    assert(!fs::exists(dir / "also-not.txt"));

    fs::remove_all(dir);
    std::cout << "test_failure_halts_later_steps passed" << std::endl;
}

void test_continue_on_error() {
    fs::path dir = make_workdir("continue");
    Tutorial tutorial = TutorialParser().parse(
        "## One {.gr-step}\n"
        "```bash {.gr-run continue-on-error=true mode=exact exp=yes}\n"
        "echo no\n"
        "```\n"
        "```text {.gr-file path=../escape.txt continue-on-error=true}\n"
        "x\n"
        "```\n"
        "## Two {.gr-step}\n"
        "```bash {.gr-run}\n"
        "touch reached\n"
        "```\n");

    TutorialExecutor executor(config_for(dir));
    RunReport report = executor.run(tutorial);

    const auto& outcomes = report.outcomes();
    assert(outcomes[0].status == ActionStatus::Failed);
    assert(outcomes[1].status == ActionStatus::Errored);
    assert(outcomes[1].reason == OutcomeReason::PathEscape);
    assert(outcomes[2].status == ActionStatus::Passed);
    assert(fs::exists(dir / "reached"));
    // a tolerated failure is still a failure of the run
    assert(!report.success());
    assert(!executor.halted());

    fs::remove_all(dir);
    std::cout << "test_continue_on_error passed" << std::endl;
}

void test_timeout_is_errored_quickly() {
    fs::path dir = make_workdir("timeout");
    Tutorial tutorial = TutorialParser().parse(
        "## Slow {.gr-step}\n"
        "```bash {.gr-run timeout=1}\n"
        "sleep 5\n"
        "```\n");

    TimeRecorder timer;
    TutorialExecutor executor(config_for(dir));
    RunReport report = executor.run(tutorial);
    double elapsed = timer.elapsed();

    assert(report.size() == 1);
    assert(report.outcomes()[0].status == ActionStatus::Errored);
    assert(report.outcomes()[0].reason == OutcomeReason::Timeout);
    assert(elapsed < 3000.0);

    fs::remove_all(dir);
    std::cout << "test_timeout_is_errored_quickly passed" << std::endl;
}

void test_variables_are_run_global() {
    fs::path dir = make_workdir("global");
    Tutorial tutorial = TutorialParser().parse(
        "## Produce {.gr-step}\n"
        "```bash {.gr-run out-var=VERSION code-var=RC}\n"
        "echo 1.4.2\n"
        "```\n"
        "## Consume {.gr-step}\n"
        "```conf {.gr-file path=app.conf template=shell}\n"
        "version=${VERSION} rc=${RC} user=${USER_NAME}\n"
        "```\n"
        "```bash {.gr-run mode=exact exp=\"version=1.4.2 rc=0 user=seeded\"}\n"
        "cat app.conf\n"
        "```\n");

    TutorialExecutor executor(config_for(dir));
    VariableStore vars(std::map<std::string, std::string>{{"USER_NAME", "seeded"}});
    RunReport report = executor.run(tutorial, vars);
    assert(report.success());
    assert(report.count(ActionStatus::Passed) == 3);

    fs::remove_all(dir);
    std::cout << "test_variables_are_run_global passed" << std::endl;
}

void test_step_selection() {
    fs::path dir = make_workdir("select");
    Tutorial tutorial = TutorialParser().parse(
        "## A {.gr-step #first}\n"
        "```bash {.gr-run}\ntouch a\n```\n"
        "## B {.gr-step #second}\n"
        "```bash {.gr-run}\ntouch b\n```\n");

    ExecutorConfig by_id = config_for(dir);
    by_id.only_step = "second";
    RunReport report = TutorialExecutor(by_id).run(tutorial);
    assert(report.outcomes()[0].status == ActionStatus::Skipped);
    assert(report.outcomes()[0].reason == OutcomeReason::NotSelected);
    assert(report.outcomes()[1].status == ActionStatus::Passed);
    assert(!fs::exists(dir / "a"));
    assert(fs::exists(dir / "b"));

    ExecutorConfig by_index = config_for(dir);
    by_index.only_step = "1";
    report = TutorialExecutor(by_index).run(tutorial);
    assert(report.outcomes()[0].status == ActionStatus::Passed);
    assert(report.outcomes()[1].reason == OutcomeReason::NotSelected);

    ExecutorConfig unknown = config_for(dir);
    unknown.only_step = "third";
    bool thrown = false;
    try {
        TutorialExecutor(unknown).run(tutorial);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    fs::remove_all(dir);
    std::cout << "test_step_selection passed" << std::endl;
}

void test_dry_run() {
    fs::path dir = make_workdir("dry");
    Tutorial tutorial = TutorialParser().parse(
        "## A {.gr-step}\n"
        "```bash {.gr-run}\ntouch created\n```\n"
        "```text {.gr-file path=file.txt}\nx\n```\n");

    auto executor = TutorialExecutor::create_dry_run(config_for(dir));
    RunReport report = executor->run(tutorial);
    assert(report.success());
    assert(report.count(ActionStatus::Skipped) == 2);
    assert(!fs::exists(dir / "created"));
    assert(!fs::exists(dir / "file.txt"));

    fs::remove_all(dir);
    std::cout << "test_dry_run passed" << std::endl;
}

class ThrowingStrategy : public ActionExecutionStrategy {
public:
    explicit ThrowingStrategy(bool filesystem) : filesystem_(filesystem) {}

    void execute(const Action&, ActionOutcome&, ExecutionContext&) override {
        if (filesystem_) {
            throw fs::filesystem_error("cannot write", fs::path("out.txt"),
                                       std::make_error_code(std::errc::permission_denied));
        }
        throw std::runtime_error("unexpected state");
    }

private:
    bool filesystem_;
};

void test_strategy_exceptions_are_classified() {
    fs::path dir = make_workdir("throwing");
    Tutorial tutorial = TutorialParser().parse(
        "## One {.gr-step}\n"
        "```bash {.gr-run}\n"
        "true\n"
        "```\n");

    TutorialExecutor fs_executor(config_for(dir), std::make_unique<ThrowingStrategy>(true));
    RunReport fs_report = fs_executor.run(tutorial);
    assert(fs_report.outcomes()[0].status == ActionStatus::Errored);
    assert(fs_report.outcomes()[0].reason == OutcomeReason::FilesystemError);

    TutorialExecutor other_executor(config_for(dir), std::make_unique<ThrowingStrategy>(false));
    RunReport other_report = other_executor.run(tutorial);
    assert(other_report.outcomes()[0].status == ActionStatus::Errored);
    assert(other_report.outcomes()[0].reason == OutcomeReason::InternalError);
    assert(other_report.outcomes()[0].message == "unexpected state");
    assert(other_executor.halted());

    fs::remove_all(dir);
    std::cout << "test_strategy_exceptions_are_classified passed" << std::endl;
}

void test_outcome_state_machine() {
    ActionOutcome outcome;
    outcome.start();
    assert(outcome.status == ActionStatus::Running);
    outcome.finish(ActionStatus::Passed, OutcomeReason::None, "ok");

    bool thrown = false;
    try {
        outcome.finish(ActionStatus::Failed, OutcomeReason::ValidationMismatch, "again");
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(outcome.status == ActionStatus::Passed);

    RunReport report;
    thrown = false;
    try {
        report.add(ActionOutcome{});
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(report.success());
    std::cout << "test_outcome_state_machine passed" << std::endl;
}

int main() {
    LogUtils::LoggerGuard guard(LogUtils::Level::Warn);

    test_capture_then_substitute();
    test_failure_halts_later_steps();
    test_continue_on_error();
    test_timeout_is_errored_quickly();
    test_variables_are_run_global();
    test_step_selection();
    test_dry_run();
    test_strategy_exceptions_are_classified();
    test_outcome_state_machine();

    std::cout << "All TutorialExecutor tests passed!" << std::endl;
    return 0;
}
