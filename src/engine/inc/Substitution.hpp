#pragma once

#include "VariableStore.hpp"
#include <string>
#include <vector>

// `${NAME}` expansion. One pass only: text produced by a substitution is never
// scanned again. Unset names expand to the empty string.
class Substitution {
public:
    static std::string apply(const std::string& text, const VariableStore& variables);

    // Names referenced by `text`, in order of appearance, duplicates included
    static std::vector<std::string> references(const std::string& text);

    // Referenced names that have no value in `variables`
    static std::vector<std::string> unresolved(const std::string& text, const VariableStore& variables);
};
