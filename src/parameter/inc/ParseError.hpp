#pragma once

#include <stdexcept>
#include <string>

// Raised by the attribute grammar. Carries no line; the document parser adds it.
class AttributeError : public std::runtime_error {
public:
    explicit AttributeError(const std::string& message) : std::runtime_error(message) {}
};

enum class ParseErrorKind {
    MalformedAttributes,
    OrphanAction,
    ConflictingMarkers,
    MissingAttribute,
    InvalidValue,
    DuplicateStepId,
    UnterminatedBlock
};

const char* to_string(ParseErrorKind kind);

// Any problem found while turning a document into a Tutorial. Parsing stops at
// the first one and nothing is executed.
class DocumentParseError : public std::runtime_error {
public:
    DocumentParseError(ParseErrorKind kind, const std::string& source, size_t line, const std::string& message)
        : std::runtime_error(source + ":" + std::to_string(line) + ": " + message),
          kind_(kind), source_(source), line_(line), detail_(message) {}

    ParseErrorKind kind() const { return kind_; }
    const std::string& source() const { return source_; }
    size_t line() const { return line_; }
    const std::string& detail() const { return detail_; }

private:
    ParseErrorKind kind_;
    std::string source_;
    size_t line_;
    std::string detail_;
};
