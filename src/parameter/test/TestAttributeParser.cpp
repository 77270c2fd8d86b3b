#include "AttributeParser.hpp"
#include <cassert>
#include <iostream>
#include <string>

static bool rejects(const std::string& text) {
    try {
        AttributeParser::parse(text);
    } catch (const AttributeError&) {
        return true;
    }
    return false;
}

void test_classes_id_and_values() {
    AttributeSet attrs = AttributeParser::parse(R"({.gr-run #build mode=contains exp="Hello World" timeout=5})");
    assert(attrs.classes.size() == 1);
    assert(attrs.has_class("gr-run"));
    assert(attrs.id && *attrs.id == "build");
    assert(attrs.get("mode") == std::string("contains"));
    assert(attrs.get("exp") == std::string("Hello World"));
    assert(attrs.get("timeout") == std::string("5"));
    assert(!attrs.has("path"));
    std::cout << "test_classes_id_and_values passed" << std::endl;
}

void test_data_prefix_and_alias() {
    AttributeSet attrs = AttributeParser::parse("{.gr-run data-mode=exact data-expected=ok}");
    assert(attrs.get("mode") == std::string("exact"));
    assert(attrs.get("exp") == std::string("ok"));
    assert(!attrs.has("data-mode"));
    assert(!attrs.has("expected"));
    std::cout << "test_data_prefix_and_alias passed" << std::endl;
}

void test_quoted_escapes() {
    AttributeSet attrs = AttributeParser::parse(R"({.gr-run exp="say \"hi\"\n\tback\\slash" empty=""})");
    assert(attrs.get("exp") == std::string("say \"hi\"\n\tback\\slash"));
    assert(attrs.get("empty") == std::string(""));

    // unknown escapes stay verbatim, which keeps regex patterns readable
    attrs = AttributeParser::parse(R"({.gr-run mode=regex exp="^v\d+\.\d+$"})");
    assert(attrs.get("exp") == std::string("^v\\d+\\.\\d+$"));
    std::cout << "test_quoted_escapes passed" << std::endl;
}

void test_unknown_keys_preserved() {
    AttributeSet attrs = AttributeParser::parse("{.gr-file path=a.txt owner=docs .extra}");
    assert(attrs.get("owner") == std::string("docs"));
    assert(attrs.has_class("extra"));
    assert(attrs.classes.size() == 2);
    std::cout << "test_unknown_keys_preserved passed" << std::endl;
}

void test_last_value_wins() {
    AttributeSet attrs = AttributeParser::parse("{.gr-run timeout=5 timeout=10}");
    assert(attrs.get("timeout") == std::string("10"));
    std::cout << "test_last_value_wins passed" << std::endl;
}

void test_malformed() {
    assert(rejects(".gr-run}"));
    assert(rejects("{.gr-run"));
    assert(rejects(R"({.gr-run exp="never closed})"));
    assert(rejects(R"({.gr-run exp="a"b})"));
    assert(rejects(R"({.gr-run exp=a"b})"));
    assert(rejects("{.gr-run #a #b}"));
    assert(rejects("{.gr-run lonely}"));
    assert(rejects("{.gr-run =value}"));
    assert(rejects("{. }"));
    assert(rejects("{.gr$run}"));
    std::cout << "test_malformed passed" << std::endl;
}

void test_marker_group() {
    assert(AttributeParser::is_marker_group("{.gr-step}"));
    assert(AttributeParser::is_marker_group("  { #install .gr-step }  "));
    assert(!AttributeParser::is_marker_group("{not an annotation}"));
    assert(!AttributeParser::is_marker_group("{}"));
    assert(!AttributeParser::is_marker_group("text {.gr-step}"));
    std::cout << "test_marker_group passed" << std::endl;
}

int main() {
    test_classes_id_and_values();
    test_data_prefix_and_alias();
    test_quoted_escapes();
    test_unknown_keys_preserved();
    test_last_value_wins();
    test_malformed();
    test_marker_group();

    std::cout << "All AttributeParser tests passed!" << std::endl;
    return 0;
}
