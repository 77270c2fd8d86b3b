#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "Tutorial.hpp"
#include "VariableStore.hpp"
#include "RunReport.hpp"
#include "ActionExecutionStrategy.hpp"

struct ExecutorConfig {
    std::filesystem::path working_dir;          // empty = current directory
    bool allow_unsafe_paths = false;
    std::string shell = "/bin/sh";
    std::optional<std::string> only_step;       // step id or 1-based index
};

// Runs a tutorial strictly in document order, one action at a time.
class TutorialExecutor {
public:
    explicit TutorialExecutor(ExecutorConfig config);

    // Constructor, allow custom strategy
    TutorialExecutor(ExecutorConfig config, std::unique_ptr<ActionExecutionStrategy> strategy);

    static std::unique_ptr<TutorialExecutor> create_dry_run(ExecutorConfig config) {
        return std::make_unique<TutorialExecutor>(
            std::move(config), std::make_unique<DryRunActionStrategy>()
        );
    }

    // Executes with a caller-owned store (seeded variables, inspection afterwards).
    // Throws std::invalid_argument when only_step matches no step.
    RunReport run(const Tutorial& tutorial, VariableStore& variables);

    RunReport run(const Tutorial& tutorial);

    // True once a failure without continue-on-error stopped the run
    bool halted() const { return halted_; }

    const ExecutorConfig& config() const { return config_; }

private:
    bool step_selected(const Step& step, size_t index) const;
    void log_outcome(const ActionOutcome& outcome) const;

    ExecutorConfig config_;
    std::unique_ptr<ActionExecutionStrategy> strategy_;
    bool halted_ = false;
};
