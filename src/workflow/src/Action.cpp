#include "Action.hpp"
#include "StringUtils.hpp"

const char* to_string(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Exit:     return "exit";
        case ValidationMode::Contains: return "contains";
        case ValidationMode::Regex:    return "regex";
        case ValidationMode::Exact:    return "exact";
    }
    return "exit";
}

const char* to_string(WriteMode mode) {
    return mode == WriteMode::Append ? "append" : "write";
}

std::optional<ValidationMode> parse_validation_mode(const std::string& name) {
    const std::string lowered = StringUtils::to_lower(name);
    if (lowered == "exit")     return ValidationMode::Exit;
    if (lowered == "contains") return ValidationMode::Contains;
    if (lowered == "regex")    return ValidationMode::Regex;
    if (lowered == "exact")    return ValidationMode::Exact;
    return std::nullopt;
}

std::optional<WriteMode> parse_write_mode(const std::string& name) {
    const std::string lowered = StringUtils::to_lower(name);
    if (lowered == "write")  return WriteMode::Write;
    if (lowered == "append") return WriteMode::Append;
    return std::nullopt;
}
