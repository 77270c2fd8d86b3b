#include "RunReport.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

const char* to_string(ActionStatus status) {
    switch (status) {
        case ActionStatus::Pending: return "pending";
        case ActionStatus::Running: return "running";
        case ActionStatus::Passed:  return "passed";
        case ActionStatus::Failed:  return "failed";
        case ActionStatus::Skipped: return "skipped";
        case ActionStatus::Errored: return "errored";
    }
    return "unknown";
}

const char* to_string(OutcomeReason reason) {
    switch (reason) {
        case OutcomeReason::None:               return "none";
        case OutcomeReason::ValidationMismatch: return "validation-mismatch";
        case OutcomeReason::Timeout:            return "timeout";
        case OutcomeReason::PathEscape:         return "path-escape";
        case OutcomeReason::FilesystemError:    return "filesystem-error";
        case OutcomeReason::SpawnError:         return "spawn-error";
        case OutcomeReason::InternalError:      return "internal-error";
        case OutcomeReason::RunHalted:          return "run-halted";
        case OutcomeReason::AlreadyExists:      return "already-exists";
        case OutcomeReason::NotSelected:        return "not-selected";
        case OutcomeReason::DryRun:             return "dry-run";
    }
    return "unknown";
}

bool is_terminal(ActionStatus status) {
    return status == ActionStatus::Passed || status == ActionStatus::Failed
        || status == ActionStatus::Skipped || status == ActionStatus::Errored;
}

void ActionOutcome::start() {
    if (status != ActionStatus::Pending) {
        throw std::logic_error(std::string("Cannot start an action that is ") + to_string(status));
    }
    status = ActionStatus::Running;
}

void ActionOutcome::finish(ActionStatus terminal, OutcomeReason why, const std::string& text) {
    if (!is_terminal(terminal)) {
        throw std::logic_error(std::string("Not a terminal state: ") + to_string(terminal));
    }
    if (is_terminal(status)) {
        throw std::logic_error(std::string("Action already finished as ") + to_string(status));
    }
    status = terminal;
    reason = why;
    message = text;
}

void RunReport::add(ActionOutcome outcome) {
    if (!is_terminal(outcome.status)) {
        throw std::logic_error("Run report only records finished actions");
    }
    outcomes_.push_back(std::move(outcome));
}

bool RunReport::success() const {
    return std::none_of(outcomes_.begin(), outcomes_.end(),
                        [](const ActionOutcome& o) { return o.is_failure(); });
}

size_t RunReport::count(ActionStatus status) const {
    return static_cast<size_t>(std::count_if(outcomes_.begin(), outcomes_.end(),
                                             [status](const ActionOutcome& o) { return o.status == status; }));
}

std::string RunReport::summary() const {
    std::ostringstream oss;
    oss << outcomes_.size() << " actions: "
        << count(ActionStatus::Passed) << " passed, "
        << count(ActionStatus::Failed) << " failed, "
        << count(ActionStatus::Errored) << " errored, "
        << count(ActionStatus::Skipped) << " skipped";
    return oss.str();
}
