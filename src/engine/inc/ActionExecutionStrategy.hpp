#pragma once

#include "Action.hpp"
#include "ExecutionContext.hpp"
#include "RunReport.hpp"


// Abstract base class: action execution strategy
class ActionExecutionStrategy {
public:
    virtual ~ActionExecutionStrategy() = default;

    // Drives `outcome` from Running to a terminal state. Failures of the
    // action itself are recorded in the outcome, never thrown.
    virtual void execute(const Action& action, ActionOutcome& outcome, ExecutionContext& context) = 0;
};

// Performs the real effects: process spawn, file write
class ProductionActionStrategy : public ActionExecutionStrategy {
public:
    void execute(const Action& action, ActionOutcome& outcome, ExecutionContext& context) override;

private:
    void run_command(const RunAction& action, ActionOutcome& outcome, ExecutionContext& context);
    void write_file(const FileAction& action, ActionOutcome& outcome, ExecutionContext& context);

    // Returns false (and finishes the outcome) when the capture fails
    bool capture(const RunAction& action, const ProcessResult& result,
                 ActionOutcome& outcome, ExecutionContext& context);
};

// Walks the tutorial and logs what would happen
class DryRunActionStrategy : public ActionExecutionStrategy {
public:
    void execute(const Action& action, ActionOutcome& outcome, ExecutionContext& context) override;
};
