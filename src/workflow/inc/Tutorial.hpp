#pragma once

#include "Step.hpp"
#include <string>
#include <vector>

// Parsed document. Steps and their actions are in source order.
struct Tutorial {
    std::string title;
    std::string source;         // file path or "<string>"
    std::vector<Step> steps;

    size_t action_count() const {
        size_t count = 0;
        for (const auto& step : steps) count += step.actions.size();
        return count;
    }
};
