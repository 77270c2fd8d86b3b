#pragma once

#include "VariableStore.hpp"
#include <filesystem>
#include <string>

// Everything an action may read or change besides its own definition.
// Passed by reference into every action so one store serves the whole run.
struct ExecutionContext {
    VariableStore& variables;
    std::filesystem::path working_dir;
    bool allow_unsafe_paths = false;
    std::string shell = "/bin/sh";
};
