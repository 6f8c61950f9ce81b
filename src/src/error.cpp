#include <cf/error.h>
#include <sstream>
#include <utility>

namespace cf {

std::string Position::to_string() const {
    std::ostringstream ss;
    ss << "line " << line << ", column " << column;
    return ss.str();
}

std::string source_excerpt(const std::string& source, const Position& pos) {
    size_t line_start = pos.offset > source.size() ? source.size() : pos.offset;
    while (line_start > 0 and source[line_start - 1] != '\n' and source[line_start - 1] != '\r')
        --line_start;
    size_t line_end = line_start;
    while (line_end < source.size() and source[line_end] != '\n' and source[line_end] != '\r')
        ++line_end;
    std::string line_text = source.substr(line_start, line_end - line_start);
    size_t caret_pos = pos.column > 0 ? pos.column - 1 : 0;
    if (caret_pos > line_text.size()) caret_pos = line_text.size();
    std::string caret(caret_pos, ' ');
    caret.push_back('^');
    return line_text + "\n" + caret;
}

namespace {
    std::string format_syntax_error(const std::string& message, const Position& pos,
                                    const std::string& source) {
        std::ostringstream ss;
        ss << message << " (" << pos.to_string() << ")";
        if (not source.empty()) ss << "\n" << source_excerpt(source, pos);
        return ss.str();
    }
}

SyntaxError::SyntaxError(const std::string& message, const Position& pos, const std::string& source)
    : Error(format_syntax_error(message, pos, source)), message_(message), position_(pos) {}

MapperError::MapperError(const std::string& what, std::string field)
    : Error(what), field_(std::move(field)) {}

MissingField::MissingField(const std::string& field)
    : MapperError("missing required field '" + field + "'", field) {}

ConversionError::ConversionError(const std::string& cause)
    : MapperError("conversion error: " + cause, ""), cause_(cause) {}

ConversionError::ConversionError(const std::string& field, const std::string& cause)
    : MapperError("conversion error in field '" + field + "': " + cause, field), cause_(cause) {}

namespace {
    std::string unknown_field_message(const std::string& field, const std::string& suggestion) {
        std::string msg = "unknown field '" + field + "'";
        if (!suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
        return msg;
    }
}

UnknownField::UnknownField(const std::string& field, const std::string& suggestion)
    : MapperError(unknown_field_message(field, suggestion), field) {}

SerializeError::SerializeError(const std::string& message)
    : MapperError("serialization error: " + message, "") {}

IoError::IoError(const std::string& message, std::string path)
    : Error(message + ": " + path), path_(std::move(path)) {}

}  // namespace cf
