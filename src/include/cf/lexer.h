#pragma once

#include <cf/options.h>
#include <cf/token.h>
#include <cstddef>
#include <string>
#include <vector>

namespace cf {

// Turns source text into tokens on demand. The lexer keeps a reference to the
// text, which must outlive it.
class Lexer {
  public:
    Lexer(const std::string& text, const ParserOptions& options);
    Lexer(std::string&&, const ParserOptions&) = delete;

    // Next token; EndOfInput is returned repeatedly once the text is exhausted.
    Token next();

    // Start again from the beginning of the text.
    void reset();

    // Every token up to and including EndOfInput.
    std::vector<Token> tokenize();

    const std::string& source() const noexcept { return s; }
    const ParserOptions& options() const noexcept { return opts; }

  private:
    const std::string& s;
    ParserOptions opts;
    size_t i = 0;
    size_t line = 1;
    size_t col = 1;

    char peek(size_t ahead = 0) const { return i + ahead < s.size() ? s[i + ahead] : '\0'; }
    bool at_end() const { return i >= s.size(); }
    char get();
    Position here() const { return Position{line, col, i}; }

    bool at_line_terminator() const;
    void consume_line_terminator();
    void check_allowed(const Position& where);
    [[noreturn]] void fail(const std::string& message, const Position& pos) const;

    Token make(Token::Type type, const Position& start, std::string value);
    Token scan_terminators(const Position& start);
    Token scan_comment(const Position& start);
    Token scan_string(const Position& start);
    Token scan_word(const Position& start);
    void decode_escape(std::string& out);
};

// True for characters that end a word under the given options.
bool is_delimiter(char c, const ParserOptions& options);

// True for '(' ')' '[' ']' '='; these are rejected unless enabled as punctuators.
bool is_reserved_punctuator(char c) noexcept;

// Code point of the bidirectional formatting character encoded at `pos`, or 0.
unsigned long bidi_character_at(const std::string& text, std::size_t pos);
bool contains_bidi_character(const std::string& text);

// Whether `value` must be quoted to be read back as a single word with the
// same value. This is the inverse of the lexer's word rule.
bool requires_quotes(const std::string& value, const ParserOptions& options);

}  // namespace cf
