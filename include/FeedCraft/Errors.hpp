#pragma once
// Errors.hpp – Exception types raised by the RSS 2.0 parser.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace feedcraft {

// Base of every error the library throws.
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Input is not text, is blank, or carries a DOCTYPE / ENTITY declaration.
class InputError : public ParseError {
public:
    using ParseError::ParseError;
};

// The document is not well-formed XML.
class XmlSyntaxError : public ParseError {
public:
    XmlSyntaxError(const std::string& what, std::ptrdiff_t offset)
        : ParseError(what), offset_(offset) {}

    // Byte offset into the input at which the XML parser gave up.
    [[nodiscard]] std::ptrdiff_t offset() const noexcept { return offset_; }

private:
    std::ptrdiff_t offset_;
};

// <rss>, <channel> or one of the channel skeleton fields is absent.
class MissingFieldError : public ParseError {
public:
    MissingFieldError(const std::string& what, std::string field)
        : ParseError(what), field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// An assembled model violates one of its invariants.
class ValidationError : public ParseError {
public:
    using ParseError::ParseError;
};

// A date string does not follow the RFC 822 grammar.
// Only parseDate() throws it; parseRss() never does.
class DateGrammarError : public ParseError {
public:
    using ParseError::ParseError;
};

} // namespace feedcraft
