#pragma once

#include "ShellProcess.hpp"
#include <optional>
#include <string>
#include <vector>

enum class ActionStatus {
    Pending,
    Running,
    Passed,
    Failed,
    Skipped,
    Errored
};

enum class OutcomeReason {
    None,
    ValidationMismatch,
    Timeout,
    PathEscape,
    FilesystemError,
    SpawnError,
    InternalError,
    RunHalted,
    AlreadyExists,
    NotSelected,
    DryRun
};

const char* to_string(ActionStatus status);
const char* to_string(OutcomeReason reason);

bool is_terminal(ActionStatus status);

struct ActionOutcome {
    size_t step_index = 0;
    std::string step_id;
    std::string step_title;
    size_t action_index = 0;
    std::string kind;                 // "run" or "file"
    size_t line = 0;

    ActionStatus status = ActionStatus::Pending;
    OutcomeReason reason = OutcomeReason::None;
    std::string message;
    std::string expected;
    std::string actual;
    double duration_ms = 0.0;
    std::optional<ProcessResult> process;   // run actions that got as far as spawning

    // Pending -> Running
    void start();

    // Pending/Running -> terminal. Throws std::logic_error when already terminal.
    void finish(ActionStatus terminal, OutcomeReason why, const std::string& text);

    bool is_failure() const {
        return status == ActionStatus::Failed || status == ActionStatus::Errored;
    }
};

class RunReport {
public:
    void add(ActionOutcome outcome);

    const std::vector<ActionOutcome>& outcomes() const { return outcomes_; }

    // No Failed or Errored outcome
    bool success() const;
    size_t count(ActionStatus status) const;
    size_t size() const { return outcomes_.size(); }
    std::string summary() const;

private:
    std::vector<ActionOutcome> outcomes_;
};
