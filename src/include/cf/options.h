#pragma once

#include <cstddef>
#include <string>

namespace cf {

// Syntax extensions and resource limits applied by the lexer and parser.
struct ParserOptions {
    bool allow_c_style_comments = false;
    bool allow_triple_quotes = true;
    bool allow_line_continuations = true;
    bool allow_expression_arguments = false;
    // ',' splits arguments instead of being part of a word.
    bool allow_argument_separators = true;
    // Characters lexed as single-character Punctuator tokens.
    std::string punctuators;
    bool forbid_bidi_characters = true;

    // Open blocks and open expression parentheses count towards the depth.
    std::size_t max_depth = 100;
    std::size_t max_directives = 100000;
    std::size_t max_arguments = 10000;

    bool is_punctuator(char c) const { return punctuators.find(c) != std::string::npos; }
};

enum class NamingPolicy {
    AsDeclared,
    KebabCase,  // maxConnections, max_connections -> max-connections
    SnakeCase   // maxConnections, max-connections -> max_connections
};

struct MapperOptions {
    NamingPolicy naming = NamingPolicy::AsDeclared;
    std::string indent = "  ";
    ParserOptions parser;
    // Reject child directives that match no field instead of ignoring them.
    bool strict = false;
};

}  // namespace cf
