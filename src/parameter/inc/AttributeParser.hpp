#pragma once

#include "AttributeSet.hpp"
#include "ParseError.hpp"
#include <string>

// Grammar of the `{.class #id key=value key="quoted value"}` annotations found
// after a heading or a fence's language tag.
class AttributeParser {
public:
    // `text` is the whole brace group, surrounding whitespace allowed.
    // Throws AttributeError on a missing brace, an unterminated quote or a
    // token that is neither `.class`, `#id` nor `key=value`.
    static AttributeSet parse(const std::string& text);

    // True when `text` is a brace group opening with a class or id token,
    // the only form accepted after heading text.
    static bool is_marker_group(const std::string& text);

    // `data-mode` -> `mode`, `expected` -> `exp`
    static std::string normalize_key(const std::string& key);
};
