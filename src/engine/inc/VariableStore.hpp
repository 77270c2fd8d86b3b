#pragma once

#include <map>
#include <optional>
#include <string>

// Run-scoped name -> value mapping shared by every action of one run.
// Values are overwritten, never merged; nothing is ever removed.
class VariableStore {
public:
    VariableStore() = default;

    // Throws std::invalid_argument if any name is not an identifier
    explicit VariableStore(const std::map<std::string, std::string>& initial);

    // Throws std::invalid_argument if name is not an identifier
    void set(const std::string& name, const std::string& value);

    // std::nullopt means "unset"
    std::optional<std::string> get(const std::string& name) const;

    bool contains(const std::string& name) const { return variables_.count(name) != 0; }
    size_t size() const { return variables_.size(); }
    const std::map<std::string, std::string>& all() const { return variables_; }

private:
    std::map<std::string, std::string> variables_;
};
