#include "AttributeParser.hpp"
#include "StringUtils.hpp"
#include <cctype>

namespace {

bool is_name_char(char ch) {
    unsigned char c = static_cast<unsigned char>(ch);
    return std::isalnum(c) || ch == '_' || ch == '-';
}

bool is_space(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::string read_name(const std::string& body, size_t& pos, const char* what) {
    size_t start = pos;
    while (pos < body.size() && !is_space(body[pos])) {
        if (!is_name_char(body[pos])) {
            throw AttributeError(std::string("invalid character '") + body[pos] + "' in " + what);
        }
        ++pos;
    }
    if (pos == start) {
        throw AttributeError(std::string("empty ") + what);
    }
    return body.substr(start, pos - start);
}

std::string read_quoted(const std::string& body, size_t& pos) {
    // pos is on the opening quote
    std::string value;
    ++pos;
    while (pos < body.size()) {
        char ch = body[pos];
        if (ch == '"') {
            ++pos;
            if (pos < body.size() && !is_space(body[pos])) {
                throw AttributeError("unexpected character after closing quote");
            }
            return value;
        }
        if (ch == '\\' && pos + 1 < body.size()) {
            char next = body[pos + 1];
            switch (next) {
                case '"':  value += '"';  break;
                case '\\': value += '\\'; break;
                case 'n':  value += '\n'; break;
                case 't':  value += '\t'; break;
                default:   value += ch; value += next; break;
            }
            pos += 2;
            continue;
        }
        value += ch;
        ++pos;
    }
    throw AttributeError("unterminated quoted value");
}

std::string read_bare(const std::string& body, size_t& pos) {
    size_t start = pos;
    while (pos < body.size() && !is_space(body[pos])) {
        if (body[pos] == '"') {
            throw AttributeError("unexpected quote inside unquoted value");
        }
        ++pos;
    }
    return body.substr(start, pos - start);
}

}

std::string AttributeParser::normalize_key(const std::string& key) {
    std::string normalized = StringUtils::starts_with(key, "data-") ? key.substr(5) : key;
    if (normalized == "expected") {
        normalized = "exp";
    }
    return normalized;
}

bool AttributeParser::is_marker_group(const std::string& text) {
    std::string trimmed = StringUtils::trim_copy(text);
    if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
        return false;
    }
    size_t pos = 1;
    while (pos < trimmed.size() && is_space(trimmed[pos])) ++pos;
    return pos < trimmed.size() && (trimmed[pos] == '.' || trimmed[pos] == '#');
}

AttributeSet AttributeParser::parse(const std::string& text) {
    std::string trimmed = StringUtils::trim_copy(text);
    if (trimmed.empty() || trimmed.front() != '{') {
        throw AttributeError("attribute list must start with '{'");
    }
    if (trimmed.size() < 2 || trimmed.back() != '}') {
        throw AttributeError("attribute list is missing its closing '}'");
    }

    const std::string body = trimmed.substr(1, trimmed.size() - 2);
    AttributeSet attrs;
    size_t pos = 0;

    while (pos < body.size()) {
        if (is_space(body[pos])) {
            ++pos;
            continue;
        }

        char lead = body[pos];
        if (lead == '.') {
            ++pos;
            attrs.classes.push_back(read_name(body, pos, "class name"));
            continue;
        }
        if (lead == '#') {
            ++pos;
            std::string id = read_name(body, pos, "id");
            if (attrs.id) {
                throw AttributeError("duplicate id '#" + id + "'");
            }
            attrs.id = std::move(id);
            continue;
        }

        // key=value
        size_t key_start = pos;
        while (pos < body.size() && body[pos] != '=' && !is_space(body[pos])) {
            ++pos;
        }
        std::string key = body.substr(key_start, pos - key_start);
        if (pos >= body.size() || body[pos] != '=') {
            throw AttributeError("unexpected token '" + key + "' (expected .class, #id or key=value)");
        }
        for (char ch : key) {
            if (!is_name_char(ch)) {
                throw AttributeError("invalid attribute name '" + key + "'");
            }
        }
        if (key.empty()) {
            throw AttributeError("attribute value without a name");
        }
        ++pos; // '='

        std::string value;
        if (pos < body.size() && body[pos] == '"') {
            value = read_quoted(body, pos);
        } else {
            value = read_bare(body, pos);
        }

        // Later occurrences override earlier ones
        attrs.values[normalize_key(key)] = std::move(value);
    }

    return attrs;
}
