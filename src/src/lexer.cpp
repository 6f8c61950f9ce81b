#include <cf/lexer.h>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace cf {

const char* to_string(Token::Type type) noexcept {
    switch (type) {
        case Token::Type::Word:
            return "word";
        case Token::Type::QuotedString:
            return "quoted string";
        case Token::Type::TripleQuotedString:
            return "triple-quoted string";
        case Token::Type::Punctuator:
            return "punctuator";
        case Token::Type::Comment:
            return "comment";
        case Token::Type::BlockOpen:
            return "'{'";
        case Token::Type::BlockClose:
            return "'}'";
        case Token::Type::ArgumentSeparator:
            return "','";
        case Token::Type::LineContinuation:
            return "line continuation";
        case Token::Type::EndOfDirective:
            return "end of directive";
        case Token::Type::EndOfInput:
            return "end of input";
    }
    return "token";
}

namespace {
    bool is_horizontal_space(char c) { return c == ' ' or c == '\t' or c == '\v' or c == '\f'; }

    bool is_line_terminator(char c) { return c == '\n' or c == '\r'; }

    std::string code_point_name(unsigned long cp) {
        std::ostringstream ss;
        ss << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << cp;
        return ss.str();
    }
}

unsigned long bidi_character_at(const std::string& text, std::size_t pos) {
    auto byte = [&](std::size_t k) {
        return pos + k < text.size() ? static_cast<unsigned char>(text[pos + k]) : 0u;
    };
    unsigned char c = byte(0);
    if (c == 0xD8 and byte(1) == 0x9C) return 0x061C;
    if (c == 0xE2 and byte(1) == 0x80) {
        unsigned char b = byte(2);
        if (b == 0x8E or b == 0x8F or (b >= 0xAA and b <= 0xAE)) return 0x2000 + (b - 0x80);
    }
    if (c == 0xE2 and byte(1) == 0x81) {
        unsigned char b = byte(2);
        if (b >= 0xA6 and b <= 0xA9) return 0x2040 + (b - 0x80);
    }
    return 0;
}

bool contains_bidi_character(const std::string& text) {
    for (std::size_t k = 0; k < text.size(); ++k)
        if (bidi_character_at(text, k) != 0) return true;
    return false;
}

bool is_reserved_punctuator(char c) noexcept {
    return c == '(' or c == ')' or c == '[' or c == ']' or c == '=';
}

bool is_delimiter(char c, const ParserOptions& options) {
    if (is_horizontal_space(c) or is_line_terminator(c)) return true;
    switch (c) {
        case '"':
        case '{':
        case '}':
        case ';':
        case '#':
            return true;
        case ',':
            return options.allow_argument_separators;
        default:
            break;
    }
    return is_reserved_punctuator(c) or options.is_punctuator(c);
}

bool requires_quotes(const std::string& value, const ParserOptions& options) {
    if (value.empty()) return true;
    if (options.allow_c_style_comments and value.size() >= 2 and value[0] == '/' and
        (value[1] == '/' or value[1] == '*'))
        return true;
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 or c == 0x7F or c == '\\') return true;
        if (is_delimiter(ch, options)) return true;
    }
    return false;
}

Lexer::Lexer(const std::string& text, const ParserOptions& options) : s(text), opts(options) {}

void Lexer::reset() {
    i = 0;
    line = 1;
    col = 1;
}

std::vector<Token> Lexer::tokenize() {
    reset();
    std::vector<Token> out;
    while (true) {
        out.push_back(next());
        if (out.back().type == Token::Type::EndOfInput) break;
    }
    return out;
}

void Lexer::fail(const std::string& message, const Position& pos) const {
    throw LexError(message, pos, s);
}

void Lexer::check_allowed(const Position& where) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if ((c < 0x20 and not is_horizontal_space(s[i]) and not is_line_terminator(s[i])) or c == 0x7F)
        fail("forbidden character " + code_point_name(c), where);
    if (not opts.forbid_bidi_characters) return;
    unsigned long cp = bidi_character_at(s, i);
    if (cp != 0) fail("forbidden bidirectional character " + code_point_name(cp), where);
}

char Lexer::get() {
    if (at_end()) return '\0';
    check_allowed(here());
    char c = s[i++];
    if (c == '\n' or (c == '\r' and peek() != '\n')) {
        ++line;
        col = 1;
    } else {
        ++col;
    }
    return c;
}

bool Lexer::at_line_terminator() const { return not at_end() and is_line_terminator(s[i]); }

void Lexer::consume_line_terminator() {
    if (peek() == '\r') {
        get();
        if (peek() == '\n') get();
    } else if (peek() == '\n') {
        get();
    }
}

Token Lexer::make(Token::Type type, const Position& start, std::string value) {
    Token t;
    t.type = type;
    t.text = s.substr(start.offset, i - start.offset);
    t.value = std::move(value);
    t.position = start;
    return t;
}

Token Lexer::next() {
    while (not at_end() and is_horizontal_space(peek())) get();

    Position start = here();
    if (at_end()) return make(Token::Type::EndOfInput, start, "");

    char c = peek();
    if (c == ';' or is_line_terminator(c)) return scan_terminators(start);
    if (c == '#') return scan_comment(start);
    if (c == '/' and opts.allow_c_style_comments and (peek(1) == '/' or peek(1) == '*'))
        return scan_comment(start);
    if (c == '{') {
        get();
        return make(Token::Type::BlockOpen, start, "{");
    }
    if (c == '}') {
        get();
        return make(Token::Type::BlockClose, start, "}");
    }
    if (c == ',' and opts.allow_argument_separators) {
        get();
        return make(Token::Type::ArgumentSeparator, start, ",");
    }
    if (c == '\\' and opts.allow_line_continuations and is_line_terminator(peek(1))) {
        get();
        consume_line_terminator();
        return make(Token::Type::LineContinuation, start, "");
    }
    if (c == '"') return scan_string(start);
    if (opts.is_punctuator(c) or (opts.allow_expression_arguments and (c == '(' or c == ')'))) {
        get();
        return make(Token::Type::Punctuator, start, std::string(1, c));
    }
    if (is_reserved_punctuator(c)) fail(std::string("unexpected punctuator '") + c + "'", start);
    return scan_word(start);
}

Token Lexer::scan_terminators(const Position& start) {
    while (not at_end()) {
        char c = peek();
        if (c == ';' or is_horizontal_space(c))
            get();
        else if (is_line_terminator(c))
            consume_line_terminator();
        else
            break;
    }
    Token t = make(Token::Type::EndOfDirective, start, "");
    t.value = t.text;
    return t;
}

Token Lexer::scan_comment(const Position& start) {
    if (peek() == '/' and peek(1) == '*') {
        get();
        get();
        while (true) {
            if (at_end()) fail("unterminated comment", start);
            if (peek() == '*' and peek(1) == '/') {
                get();
                get();
                break;
            }
            get();
        }
    } else {
        // '#' or '//': a trailing backslash does not continue the comment
        while (not at_end() and not at_line_terminator()) get();
    }
    Token t = make(Token::Type::Comment, start, "");
    t.value = t.text;
    return t;
}

void Lexer::decode_escape(std::string& out) {
    Position at = here();
    get();  // backslash
    if (at_end()) fail("unterminated escape sequence", at);
    if (at_line_terminator()) {
        if (not opts.allow_line_continuations) fail("invalid escape sequence at end of line", at);
        consume_line_terminator();
        return;
    }
    char e = get();
    switch (e) {
        case 'n':
            out.push_back('\n');
            return;
        case 't':
            out.push_back('\t');
            return;
        case 'r':
            out.push_back('\r');
            return;
        case 'b':
            out.push_back('\b');
            return;
        case 'f':
            out.push_back('\f');
            return;
        case 'v':
            out.push_back('\v');
            return;
        case '0':
            out.push_back('\0');
            return;
        default:
            break;
    }
    if (std::ispunct(static_cast<unsigned char>(e)) or e == ' ' or e == '\t') {
        out.push_back(e);
        return;
    }
    fail(std::string("invalid escape sequence '\\") + e + "'", at);
}

Token Lexer::scan_string(const Position& start) {
    get();  // opening quote
    bool triple = opts.allow_triple_quotes and peek() == '"' and peek(1) == '"';
    if (triple) {
        get();
        get();
    }
    std::string out;
    while (true) {
        if (at_end())
            fail(triple ? "unterminated triple-quoted string" : "unterminated quoted string", start);
        char c = peek();
        if (c == '\\') {
            decode_escape(out);
            continue;
        }
        if (triple) {
            if (c == '"' and peek(1) == '"' and peek(2) == '"') {
                get();
                get();
                get();
                break;
            }
            out.push_back(get());
            continue;
        }
        if (c == '"') {
            get();
            break;
        }
        if (is_line_terminator(c)) fail("unterminated quoted string", start);
        out.push_back(get());
    }
    return make(triple ? Token::Type::TripleQuotedString : Token::Type::QuotedString, start, std::move(out));
}

Token Lexer::scan_word(const Position& start) {
    std::string out;
    while (not at_end()) {
        char c = peek();
        if (c == '\\') {
            decode_escape(out);
            continue;
        }
        if (is_delimiter(c, opts)) break;
        out.push_back(get());
    }
    if (i == start.offset) fail(std::string("unexpected character '") + peek() + "'", start);
    return make(Token::Type::Word, start, std::move(out));
}

}  // namespace cf
