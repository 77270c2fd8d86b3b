#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// Decoded `{.class #id key=value ...}` annotation. Every key is kept, even the
// ones no action understands.
struct AttributeSet {
    std::vector<std::string> classes;
    std::optional<std::string> id;
    std::map<std::string, std::string> values;

    bool has_class(const std::string& name) const {
        for (const auto& cls : classes) {
            if (cls == name) return true;
        }
        return false;
    }

    bool has(const std::string& key) const { return values.count(key) != 0; }

    std::optional<std::string> get(const std::string& key) const {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    bool empty() const { return classes.empty() && !id && values.empty(); }
};
