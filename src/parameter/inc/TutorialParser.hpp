#pragma once

#include "Tutorial.hpp"
#include "AttributeSet.hpp"
#include "ParseError.hpp"
#include <string>
#include <vector>

// Turns annotated Markdown into a Tutorial. The whole document is validated
// before anything is returned; the first problem raises DocumentParseError.
class TutorialParser {
public:
    static constexpr const char* kStepClass = "gr-step";
    static constexpr const char* kRunClass = "gr-run";
    static constexpr const char* kFileClass = "gr-file";

    Tutorial parse(const std::string& content, const std::string& source = "<string>") const;

    // Throws std::runtime_error when the file cannot be read
    Tutorial parse_file(const std::string& file_path) const;

private:
    struct Heading {
        int level = 0;
        std::string text;
        AttributeSet attrs;
    };

    bool parse_heading(const std::vector<std::string>& lines, size_t index,
                       const std::string& source, Heading& heading, bool& consumed_next) const;

    RunAction build_run_action(const AttributeSet& attrs, const std::string& language,
                               const std::string& body, const std::string& source, size_t line) const;

    FileAction build_file_action(const AttributeSet& attrs, const std::string& body,
                                 const std::string& source, size_t line) const;
};
