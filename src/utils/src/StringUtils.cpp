#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <string>

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower_str;
}

void StringUtils::trim(std::string& str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));

    str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

std::string StringUtils::trim_copy(const std::string& str) {
    std::string copy = str;
    trim(copy);
    return copy;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size()
        && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::strip_one_trailing_newline(const std::string& str) {
    if (ends_with(str, "\r\n")) {
        return str.substr(0, str.size() - 2);
    }
    if (ends_with(str, "\n")) {
        return str.substr(0, str.size() - 1);
    }
    return str;
}

std::vector<std::string> StringUtils::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

bool StringUtils::is_identifier(const std::string& str) {
    if (str.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(str[0]))) return false;
    return std::all_of(str.begin(), str.end(), [](unsigned char ch) {
        return std::isalnum(ch) || ch == '_';
    });
}

bool StringUtils::parse_bool(const std::string& str, bool& out) {
    const std::string lowered = to_lower(str);
    if (lowered == "true" || lowered == "yes" || lowered == "1" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}
