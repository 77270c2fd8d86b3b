#pragma once

#include <string>
#include <vector>
#include "Action.hpp"

struct Step {
    std::string title;          // heading text without the annotation
    std::string id;             // `#id` or the generated "step-N"
    bool generated_id = false;
    size_t line_number = 0;
    std::vector<Action> actions;
};
