#include "Substitution.hpp"
#include <regex>

namespace {

const std::regex& reference_pattern() {
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    return re;
}

}

std::string Substitution::apply(const std::string& text, const VariableStore& variables) {
    std::string result;
    result.reserve(text.size());

    std::sregex_iterator it(text.begin(), text.end(), reference_pattern());
    std::sregex_iterator end;

    std::ptrdiff_t last_pos = 0;
    for (; it != end; ++it) {
        result.append(text, static_cast<size_t>(last_pos), static_cast<size_t>(it->position() - last_pos));
        if (auto value = variables.get(it->str(1))) {
            result += *value;
        }
        last_pos = it->position() + it->length();
    }
    result.append(text, static_cast<size_t>(last_pos), std::string::npos);
    return result;
}

std::vector<std::string> Substitution::references(const std::string& text) {
    std::vector<std::string> names;
    std::sregex_iterator it(text.begin(), text.end(), reference_pattern());
    std::sregex_iterator end;
    for (; it != end; ++it) {
        names.push_back(it->str(1));
    }
    return names;
}

std::vector<std::string> Substitution::unresolved(const std::string& text, const VariableStore& variables) {
    std::vector<std::string> missing;
    for (const auto& name : references(text)) {
        if (!variables.contains(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}
