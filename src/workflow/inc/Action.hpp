#pragma once

#include "AttributeSet.hpp"
#include <optional>
#include <string>
#include <variant>

enum class ValidationMode {
    Exit,
    Contains,
    Regex,
    Exact
};

enum class WriteMode {
    Write,
    Append
};

const char* to_string(ValidationMode mode);
const char* to_string(WriteMode mode);
std::optional<ValidationMode> parse_validation_mode(const std::string& name);
std::optional<WriteMode> parse_write_mode(const std::string& name);

// A fenced block tagged `.gr-run`: a shell command plus its expectation.
struct RunAction {
    std::string command;                    // before substitution
    std::string language = "bash";
    ValidationMode mode = ValidationMode::Exit;
    std::string expected = "0";
    int timeout_sec = 30;                   // 0 disables the limit
    std::optional<std::string> working_dir;
    bool continue_on_error = false;
    std::optional<std::string> out_var;
    std::optional<std::string> code_var;
    std::optional<std::string> out_file;

    size_t line_number = 0;
    AttributeSet attributes;
};

// A fenced block tagged `.gr-file`: content materialized at `path`.
struct FileAction {
    std::string path;
    WriteMode mode = WriteMode::Write;
    std::string content;                    // before substitution
    bool executable = false;
    bool templated = false;                 // template=shell
    bool once = false;
    bool continue_on_error = false;

    size_t line_number = 0;
    AttributeSet attributes;
};

using Action = std::variant<RunAction, FileAction>;

inline const char* action_kind(const Action& action) {
    return std::holds_alternative<RunAction>(action) ? "run" : "file";
}

inline size_t action_line(const Action& action) {
    return std::visit([](const auto& a) { return a.line_number; }, action);
}

inline bool action_continues_on_error(const Action& action) {
    return std::visit([](const auto& a) { return a.continue_on_error; }, action);
}
