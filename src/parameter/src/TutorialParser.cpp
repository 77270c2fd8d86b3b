#include "TutorialParser.hpp"
#include "AttributeParser.hpp"
#include "StringUtils.hpp"
#include "LogUtils.hpp"
#include <boost/regex.hpp>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

namespace {

struct Fence {
    char marker = '`';
    size_t length = 0;
    size_t line = 0;
    std::string language;
    std::optional<AttributeSet> attrs;
    std::vector<std::string> body;
};

size_t leading_run(const std::string& text, char ch) {
    size_t n = 0;
    while (n < text.size() && text[n] == ch) ++n;
    return n;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) joined += '\n';
        joined += lines[i];
    }
    return joined;
}

bool parse_strict_int(const std::string& text, long long& out) {
    if (text.empty()) return false;
    size_t pos = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (pos == text.size()) return false;
    for (size_t i = pos; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    try {
        out = std::stoll(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

}

const char* to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::MalformedAttributes: return "malformed-attributes";
        case ParseErrorKind::OrphanAction:        return "orphan-action";
        case ParseErrorKind::ConflictingMarkers:  return "conflicting-markers";
        case ParseErrorKind::MissingAttribute:    return "missing-attribute";
        case ParseErrorKind::InvalidValue:        return "invalid-value";
        case ParseErrorKind::DuplicateStepId:     return "duplicate-step-id";
        case ParseErrorKind::UnterminatedBlock:   return "unterminated-block";
    }
    return "unknown";
}

Tutorial TutorialParser::parse_file(const std::string& file_path) const {
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Tutorial file not found or unreadable: " + file_path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), file_path);
}

bool TutorialParser::parse_heading(const std::vector<std::string>& lines, size_t index,
                                   const std::string& source, Heading& heading, bool& consumed_next) const {
    const std::string trimmed = StringUtils::trim_copy(lines[index]);
    size_t hashes = leading_run(trimmed, '#');
    if (hashes == 0 || hashes > 6) return false;
    if (hashes < trimmed.size() && trimmed[hashes] != ' ' && trimmed[hashes] != '\t') return false;

    heading.level = static_cast<int>(hashes);
    std::string text = StringUtils::trim_copy(trimmed.substr(hashes));
    std::optional<std::string> annotation;

    // Same-line annotation: the first brace group that opens with .class/#id
    // and runs to the end of the heading
    if (!text.empty() && text.back() == '}') {
        for (size_t pos = text.find('{'); pos != std::string::npos; pos = text.find('{', pos + 1)) {
            std::string candidate = text.substr(pos);
            if (AttributeParser::is_marker_group(candidate)) {
                annotation = candidate;
                text = StringUtils::trim_copy(text.substr(0, pos));
                break;
            }
        }
    }

    // Annotation on the line right after the heading
    consumed_next = false;
    if (!annotation && index + 1 < lines.size()
        && AttributeParser::is_marker_group(lines[index + 1])) {
        annotation = lines[index + 1];
        consumed_next = true;
    }

    heading.text = text;
    if (annotation) {
        size_t line = consumed_next ? index + 2 : index + 1;
        try {
            heading.attrs = AttributeParser::parse(*annotation);
        } catch (const AttributeError& e) {
            throw DocumentParseError(ParseErrorKind::MalformedAttributes, source, line, e.what());
        }
    }
    return true;
}

Tutorial TutorialParser::parse(const std::string& content, const std::string& source) const {
    Tutorial tutorial;
    tutorial.source = source;

    const std::vector<std::string> lines = StringUtils::split_lines(content);
    std::optional<Fence> fence;
    std::set<std::string> step_ids;
    Step* current_step = nullptr;

    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t line_no = i + 1;
        const std::string& line = lines[i];
        const std::string trimmed = StringUtils::trim_copy(line);

        if (fence) {
            size_t run = leading_run(trimmed, fence->marker);
            if (run >= fence->length && StringUtils::trim_copy(trimmed.substr(run)).empty()) {
                // Closing fence
                if (fence->attrs) {
                    const AttributeSet& attrs = *fence->attrs;
                    bool is_run = attrs.has_class(kRunClass);
                    bool is_file = attrs.has_class(kFileClass);
                    if (is_run && is_file) {
                        throw DocumentParseError(ParseErrorKind::ConflictingMarkers, source, fence->line,
                            "code block is marked both ." + std::string(kRunClass) + " and ." + kFileClass);
                    }
                    if (is_run || is_file) {
                        if (!current_step) {
                            throw DocumentParseError(ParseErrorKind::OrphanAction, source, fence->line,
                                "action block appears before any ." + std::string(kStepClass) + " heading");
                        }
                        const std::string body = join_lines(fence->body);
                        if (is_run) {
                            current_step->actions.emplace_back(
                                build_run_action(attrs, fence->language, body, source, fence->line));
                        } else {
                            current_step->actions.emplace_back(
                                build_file_action(attrs, body, source, fence->line));
                        }
                    }
                }
                fence.reset();
            } else {
                fence->body.push_back(line);
            }
            continue;
        }

        size_t backticks = leading_run(trimmed, '`');
        size_t tildes = leading_run(trimmed, '~');
        // A backtick in the info string means inline code, not a fence
        bool backtick_info = backticks >= 3
            && trimmed.find('`', backticks) != std::string::npos;
        if ((backticks >= 3 && !backtick_info) || tildes >= 3) {
            Fence opened;
            opened.marker = backticks >= 3 ? '`' : '~';
            opened.length = backticks >= 3 ? backticks : tildes;
            opened.line = line_no;

            std::string info = StringUtils::trim_copy(trimmed.substr(opened.length));
            size_t brace = info.find('{');
            if (brace != std::string::npos) {
                opened.language = StringUtils::trim_copy(info.substr(0, brace));
                try {
                    opened.attrs = AttributeParser::parse(info.substr(brace));
                } catch (const AttributeError& e) {
                    throw DocumentParseError(ParseErrorKind::MalformedAttributes, source, line_no, e.what());
                }
            } else {
                std::istringstream tokens(info);
                tokens >> opened.language;
            }
            if (opened.language.empty()) {
                opened.language = "bash";
            }
            fence = std::move(opened);
            continue;
        }

        Heading heading;
        bool consumed_next = false;
        if (!parse_heading(lines, i, source, heading, consumed_next)) {
            continue;
        }

        if (heading.attrs.has_class(kStepClass)) {
            Step step;
            step.line_number = line_no;
            if (heading.attrs.id) {
                step.id = *heading.attrs.id;
                if (!step_ids.insert(step.id).second) {
                    throw DocumentParseError(ParseErrorKind::DuplicateStepId, source, line_no,
                        "duplicate step id '" + step.id + "'");
                }
            } else {
                // Assigned once every explicit id is known
                step.generated_id = true;
            }
            step.title = heading.text;
            tutorial.steps.push_back(std::move(step));
            current_step = &tutorial.steps.back();
        } else if (heading.level == 1 && tutorial.title.empty()) {
            tutorial.title = heading.text;
        }

        if (consumed_next) {
            ++i;
        }
    }

    if (fence && fence->attrs
        && (fence->attrs->has_class(kRunClass) || fence->attrs->has_class(kFileClass))) {
        throw DocumentParseError(ParseErrorKind::UnterminatedBlock, source, fence->line,
            "action block is never closed");
    }

    // step-<N>, suffixed when an explicit id already took it
    for (size_t n = 0; n < tutorial.steps.size(); ++n) {
        Step& step = tutorial.steps[n];
        if (!step.generated_id) continue;
        const std::string base = "step-" + std::to_string(n + 1);
        std::string candidate = base;
        for (size_t suffix = 1; step_ids.count(candidate); ++suffix) {
            candidate = base + "-" + std::to_string(suffix);
        }
        step_ids.insert(candidate);
        step.id = candidate;
    }
    for (Step& step : tutorial.steps) {
        if (step.title.empty()) step.title = step.id;
    }

    if (tutorial.title.empty()) {
        tutorial.title = "Untitled Tutorial";
    }

    LogUtils::debug("Parsed tutorial '{}' from {}: {} steps, {} actions",
                    tutorial.title, source, tutorial.steps.size(), tutorial.action_count());
    return tutorial;
}

namespace {

class ActionAttributes {
public:
    ActionAttributes(const AttributeSet& attrs, const std::string& source, size_t line)
        : attrs_(attrs), source_(source), line_(line) {}

    std::optional<std::string> get(const std::string& key) const { return attrs_.get(key); }

    bool flag(const std::string& key, bool fallback) const {
        auto raw = attrs_.get(key);
        if (!raw) return fallback;
        const std::string lowered = StringUtils::to_lower(*raw);
        if (lowered == "true") return true;
        if (lowered == "false") return false;
        invalid(key + " must be true or false, got '" + *raw + "'");
    }

    std::optional<std::string> identifier(const std::string& key) const {
        auto raw = attrs_.get(key);
        if (raw && !StringUtils::is_identifier(*raw)) {
            invalid(key + " must be an identifier (letters, digits, underscore), got '" + *raw + "'");
        }
        return raw;
    }

    std::optional<std::string> non_empty(const std::string& key) const {
        auto raw = attrs_.get(key);
        if (raw && raw->empty()) {
            invalid(key + " must not be empty");
        }
        return raw;
    }

    [[noreturn]] void invalid(const std::string& message) const {
        throw DocumentParseError(ParseErrorKind::InvalidValue, source_, line_, message);
    }

    [[noreturn]] void missing(const std::string& message) const {
        throw DocumentParseError(ParseErrorKind::MissingAttribute, source_, line_, message);
    }

private:
    const AttributeSet& attrs_;
    const std::string& source_;
    size_t line_;
};

}

RunAction TutorialParser::build_run_action(const AttributeSet& attrs, const std::string& language,
                                           const std::string& body, const std::string& source, size_t line) const {
    ActionAttributes a(attrs, source, line);
    RunAction action;
    action.command = body;
    action.language = language;
    action.line_number = line;
    action.attributes = attrs;

    if (auto mode = a.get("mode")) {
        auto parsed = parse_validation_mode(*mode);
        if (!parsed) {
            a.invalid("unknown validation mode '" + *mode + "' (expected exit, contains, regex or exact)");
        }
        action.mode = *parsed;
    }

    if (auto exp = a.get("exp")) {
        action.expected = *exp;
    }

    if (action.mode == ValidationMode::Exit) {
        long long code = 0;
        if (!parse_strict_int(action.expected, code)) {
            a.invalid("exp must be an integer exit code in exit mode, got '" + action.expected + "'");
        }
    } else if (action.mode == ValidationMode::Regex) {
        try {
            boost::regex compiled(action.expected, boost::regex::ECMAScript);
        } catch (const boost::regex_error& e) {
            a.invalid("invalid regex '" + action.expected + "': " + e.what());
        }
    }

    if (auto timeout = a.get("timeout")) {
        long long seconds = 0;
        if (!parse_strict_int(*timeout, seconds) || seconds < 0 || seconds > 86400 * 365) {
            a.invalid("timeout must be a non-negative integer number of seconds, got '" + *timeout + "'");
        }
        action.timeout_sec = static_cast<int>(seconds);
    }

    action.working_dir = a.non_empty("workdir");
    action.continue_on_error = a.flag("continue-on-error", false);
    action.out_var = a.identifier("out-var");
    action.code_var = a.identifier("code-var");
    action.out_file = a.non_empty("out-file");
    return action;
}

FileAction TutorialParser::build_file_action(const AttributeSet& attrs, const std::string& body,
                                             const std::string& source, size_t line) const {
    ActionAttributes a(attrs, source, line);
    FileAction action;
    action.content = body;
    action.line_number = line;
    action.attributes = attrs;

    auto path = a.get("path");
    if (!path || path->empty()) {
        a.missing("file block requires a path attribute");
    }
    action.path = *path;

    if (auto mode = a.get("mode")) {
        auto parsed = parse_write_mode(*mode);
        if (!parsed) {
            a.invalid("unknown file mode '" + *mode + "' (expected write or append)");
        }
        action.mode = *parsed;
    }

    if (auto tmpl = a.get("template")) {
        const std::string lowered = StringUtils::to_lower(*tmpl);
        if (lowered == "shell" || lowered == "true") {
            action.templated = true;
        } else if (lowered == "none" || lowered == "false") {
            action.templated = false;
        } else {
            a.invalid("unknown template '" + *tmpl + "' (expected none or shell)");
        }
    }

    action.executable = a.flag("exec", false);
    action.once = a.flag("once", false);
    action.continue_on_error = a.flag("continue-on-error", false);
    return action;
}
