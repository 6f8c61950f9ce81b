#pragma once

#include <cf/error.h>
#include <cstdint>
#include <string>

namespace cf {

struct Token {
    enum class Type : std::uint8_t {
        Word,
        QuotedString,
        TripleQuotedString,
        Punctuator,
        Comment,
        BlockOpen,
        BlockClose,
        ArgumentSeparator,
        LineContinuation,
        EndOfDirective,
        EndOfInput
    };

    Type type = Type::EndOfInput;
    // Exact slice of the source text.
    std::string text;
    // Decoded value: escapes resolved and continuations elided for words and
    // strings, the raw text for everything else.
    std::string value;
    Position position;

    bool is_argument() const noexcept {
        return type == Type::Word || type == Type::QuotedString || type == Type::TripleQuotedString;
    }
    bool is_punctuator(char c) const noexcept {
        return type == Type::Punctuator && text.size() == 1 && text[0] == c;
    }
};

const char* to_string(Token::Type type) noexcept;

}  // namespace cf
