#include "VariableStore.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

VariableStore::VariableStore(const std::map<std::string, std::string>& initial) {
    for (const auto& [name, value] : initial) {
        set(name, value);
    }
}

void VariableStore::set(const std::string& name, const std::string& value) {
    if (!StringUtils::is_identifier(name)) {
        throw std::invalid_argument("Invalid variable name: '" + name + "'");
    }
    variables_[name] = value;
}

std::optional<std::string> VariableStore::get(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}
