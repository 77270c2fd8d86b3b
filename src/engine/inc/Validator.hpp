#pragma once

#include "Action.hpp"
#include "ShellProcess.hpp"
#include <string>

struct ValidationResult {
    bool passed = false;
    std::string expected;
    std::string actual;
    std::string message;
};

// exit:     exit code == expected integer
// contains: expected is a byte substring of the combined output
// regex:    ECMAScript search anywhere in the combined output, ^ and $ per line
// exact:    combined output minus one trailing newline == expected
class Validator {
public:
    static ValidationResult validate(const RunAction& action, const ProcessResult& result);

    static ValidationResult check_exit(int actual, const std::string& expected);
    static ValidationResult check_contains(const std::string& output, const std::string& expected);
    static ValidationResult check_regex(const std::string& output, const std::string& pattern);
    static ValidationResult check_exact(const std::string& output, const std::string& expected);
};
