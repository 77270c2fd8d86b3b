#include "Validator.hpp"
#include "StringUtils.hpp"
#include <boost/regex.hpp>

ValidationResult Validator::validate(const RunAction& action, const ProcessResult& result) {
    switch (action.mode) {
        case ValidationMode::Exit:     return check_exit(result.exit_code, action.expected);
        case ValidationMode::Contains: return check_contains(result.combined, action.expected);
        case ValidationMode::Regex:    return check_regex(result.combined, action.expected);
        case ValidationMode::Exact:    return check_exact(result.combined, action.expected);
    }
    return ValidationResult{false, action.expected, result.combined, "Unknown validation mode"};
}

ValidationResult Validator::check_exit(int actual, const std::string& expected) {
    ValidationResult v;
    v.expected = expected;
    v.actual = std::to_string(actual);

    int expected_code = 0;
    try {
        expected_code = std::stoi(expected);
    } catch (const std::exception&) {
        v.message = "Expected exit code is not an integer: " + expected;
        return v;
    }

    v.passed = actual == expected_code;
    v.message = v.passed
        ? "Exit code matched: " + expected
        : "Exit code " + v.actual + " != expected " + expected;
    return v;
}

ValidationResult Validator::check_contains(const std::string& output, const std::string& expected) {
    ValidationResult v;
    v.expected = expected;
    v.actual = output;
    v.passed = output.find(expected) != std::string::npos;
    v.message = v.passed
        ? "Output contains: '" + expected + "'"
        : "Output does not contain: '" + expected + "'";
    return v;
}

ValidationResult Validator::check_regex(const std::string& output, const std::string& pattern) {
    ValidationResult v;
    v.expected = pattern;
    v.actual = output;
    // ^ and $ anchor at line boundaries; . stops at newlines
    try {
        boost::regex compiled(pattern, boost::regex::ECMAScript);
        v.passed = boost::regex_search(output, compiled, boost::match_not_dot_newline);
    } catch (const boost::regex_error& e) {
        v.message = "Invalid regex pattern: " + std::string(e.what());
        return v;
    } catch (const std::runtime_error& e) {
        v.message = "Regex search failed: " + std::string(e.what());
        return v;
    }
    v.message = v.passed
        ? "Output matches regex: " + pattern
        : "Output does not match regex: " + pattern;
    return v;
}

ValidationResult Validator::check_exact(const std::string& output, const std::string& expected) {
    ValidationResult v;
    v.expected = expected;
    v.actual = StringUtils::strip_one_trailing_newline(output);
    v.passed = v.actual == expected;
    v.message = v.passed ? "Output matches exactly" : "Output does not match exactly";
    return v;
}
