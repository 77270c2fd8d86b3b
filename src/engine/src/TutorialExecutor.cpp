#include "TutorialExecutor.hpp"
#include "LogUtils.hpp"
#include <filesystem>
#include <stdexcept>


TutorialExecutor::TutorialExecutor(ExecutorConfig config)
    : TutorialExecutor(std::move(config), std::make_unique<ProductionActionStrategy>()) {
}

TutorialExecutor::TutorialExecutor(ExecutorConfig config, std::unique_ptr<ActionExecutionStrategy> strategy)
    : config_(std::move(config)),
      strategy_(std::move(strategy)) {

    if (!strategy_) {
        throw std::invalid_argument("TutorialExecutor requires an execution strategy");
    }
    if (config_.working_dir.empty()) {
        config_.working_dir = std::filesystem::current_path();
    }
    config_.working_dir = std::filesystem::absolute(config_.working_dir).lexically_normal();
}

bool TutorialExecutor::step_selected(const Step& step, size_t index) const {
    if (!config_.only_step) return true;
    return step.id == *config_.only_step || std::to_string(index + 1) == *config_.only_step;
}

RunReport TutorialExecutor::run(const Tutorial& tutorial) {
    VariableStore variables;
    return run(tutorial, variables);
}

RunReport TutorialExecutor::run(const Tutorial& tutorial, VariableStore& variables) {
    if (config_.only_step) {
        bool found = false;
        for (size_t i = 0; i < tutorial.steps.size() && !found; ++i) {
            found = step_selected(tutorial.steps[i], i);
        }
        if (!found) {
            throw std::invalid_argument("No step matches '" + *config_.only_step + "'");
        }
    }

    ExecutionContext context{variables, config_.working_dir, config_.allow_unsafe_paths, config_.shell};
    RunReport report;
    halted_ = false;

    LogUtils::info("Running tutorial: {} ({} steps, {} actions)",
                   tutorial.title, tutorial.steps.size(), tutorial.action_count());
    LogUtils::debug("Working directory: {}", config_.working_dir.string());

    for (size_t s = 0; s < tutorial.steps.size(); ++s) {
        const Step& step = tutorial.steps[s];
        const bool selected = step_selected(step, s);

        if (selected && !halted_) {
            LogUtils::info("Step {}/{}: {} [{}]", s + 1, tutorial.steps.size(), step.title, step.id);
        }

        for (size_t a = 0; a < step.actions.size(); ++a) {
            const Action& action = step.actions[a];

            ActionOutcome outcome;
            outcome.step_index = s;
            outcome.step_id = step.id;
            outcome.step_title = step.title;
            outcome.action_index = a;
            outcome.kind = action_kind(action);
            outcome.line = action_line(action);

            if (halted_) {
                outcome.finish(ActionStatus::Skipped, OutcomeReason::RunHalted,
                               "Not executed: run halted by an earlier failure");
                report.add(std::move(outcome));
                continue;
            }
            if (!selected) {
                outcome.finish(ActionStatus::Skipped, OutcomeReason::NotSelected, "Step not selected");
                report.add(std::move(outcome));
                continue;
            }

            outcome.start();
            try {
                strategy_->execute(action, outcome, context);
            } catch (const std::filesystem::filesystem_error& e) {
                if (!is_terminal(outcome.status)) {
                    outcome.finish(ActionStatus::Errored, OutcomeReason::FilesystemError, e.what());
                }
            } catch (const std::exception& e) {
                if (!is_terminal(outcome.status)) {
                    outcome.finish(ActionStatus::Errored, OutcomeReason::InternalError, e.what());
                }
            }
            if (!is_terminal(outcome.status)) {
                throw std::logic_error("Execution strategy left an action unfinished");
            }

            log_outcome(outcome);

            if (outcome.is_failure()) {
                if (action_continues_on_error(action)) {
                    LogUtils::warn("Continuing after failure (continue-on-error)");
                } else {
                    LogUtils::error("Halting run (step: {}, line: {})", step.id, outcome.line);
                    halted_ = true;
                }
            }
            report.add(std::move(outcome));
        }
    }

    if (report.success()) {
        LogUtils::info("Tutorial completed: {}", report.summary());
    } else {
        LogUtils::error("Tutorial failed: {}", report.summary());
    }
    return report;
}

void TutorialExecutor::log_outcome(const ActionOutcome& outcome) const {
    switch (outcome.status) {
        case ActionStatus::Passed:
            LogUtils::info("  [PASS] {} action at line {}: {}", outcome.kind, outcome.line, outcome.message);
            break;
        case ActionStatus::Skipped:
            LogUtils::info("  [SKIP] {} action at line {}: {}", outcome.kind, outcome.line, outcome.message);
            break;
        case ActionStatus::Failed:
        case ActionStatus::Errored:
            LogUtils::error("  [{}] {} action at line {} ({}): {}",
                            outcome.status == ActionStatus::Failed ? "FAIL" : "ERROR",
                            outcome.kind, outcome.line, to_string(outcome.reason), outcome.message);
            if (outcome.reason == OutcomeReason::ValidationMismatch) {
                LogUtils::error("    expected: {}", outcome.expected);
                LogUtils::error("    actual:   {}", outcome.actual);
            }
            break;
        default:
            break;
    }
}
