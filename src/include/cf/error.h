#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cf {

// Location of a byte in the source text. Lines and columns are 1-based,
// columns count bytes.
struct Position {
    std::size_t line = 1;
    std::size_t column = 1;
    std::size_t offset = 0;

    std::string to_string() const;
};

inline bool operator==(const Position& a, const Position& b) {
    return a.line == b.line && a.column == b.column && a.offset == b.offset;
}
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

// Base of every error thrown by the library.
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// An error tied to a location in the source text. what() carries the message,
// the line and column, and the offending source line with a caret.
class SyntaxError : public Error {
  public:
    SyntaxError(const std::string& message, const Position& pos, const std::string& source);

    const std::string& message() const noexcept { return message_; }
    const Position& position() const noexcept { return position_; }

  private:
    std::string message_;
    Position position_;
};

class LexError : public SyntaxError {
  public:
    using SyntaxError::SyntaxError;
};

class ParseError : public SyntaxError {
  public:
    using SyntaxError::SyntaxError;
};

// Nesting depth, directive count or argument count above the configured limit.
class ResourceLimitExceeded : public ParseError {
  public:
    using ParseError::ParseError;
};

class MapperError : public Error {
  public:
    MapperError(const std::string& what, std::string field);

    // Dotted path of the field the error refers to; empty when not field-specific.
    const std::string& field() const noexcept { return field_; }

  private:
    std::string field_;
};

class MissingField : public MapperError {
  public:
    explicit MissingField(const std::string& field);
};

class ConversionError : public MapperError {
  public:
    // Raised by value converters, which do not know the field yet.
    explicit ConversionError(const std::string& cause);
    ConversionError(const std::string& field, const std::string& cause);

    const std::string& cause() const noexcept { return cause_; }

  private:
    std::string cause_;
};

class UnknownField : public MapperError {
  public:
    UnknownField(const std::string& field, const std::string& suggestion = "");
};

class SerializeError : public MapperError {
  public:
    explicit SerializeError(const std::string& message);
};

class IoError : public Error {
  public:
    IoError(const std::string& message, std::string path);

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
};

// Renders the source line containing `pos` followed by a caret under the column.
std::string source_excerpt(const std::string& source, const Position& pos);

}  // namespace cf
