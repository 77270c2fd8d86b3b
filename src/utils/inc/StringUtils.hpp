#pragma once

#include <string>
#include <vector>


class StringUtils {
public:
    static std::string to_lower(const std::string& str);
    static void trim(std::string& str);
    static std::string trim_copy(const std::string& str);

    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);

    // Removes a single trailing "\n" (or "\r\n"), never more
    static std::string strip_one_trailing_newline(const std::string& str);

    // Splits on '\n'; a trailing newline does not produce an extra empty line
    static std::vector<std::string> split_lines(const std::string& text);

    // Letters, digits and underscore, not starting with a digit
    static bool is_identifier(const std::string& str);

    static bool parse_bool(const std::string& str, bool& out);
};
