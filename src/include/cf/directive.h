#pragma once

#include <cf/error.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cf {

struct Argument {
    enum class Kind : std::uint8_t { Word, Quoted, TripleQuoted, Expression, Punctuator };

    std::string value;
    Kind kind = Kind::Word;
    Position position;

    Argument() = default;
    Argument(std::string v, Kind k = Kind::Word) : value(std::move(v)), kind(k) {}
    Argument(const char* v) : value(v) {}

    static Argument word(std::string v) { return Argument(std::move(v), Kind::Word); }
    static Argument quoted(std::string v) { return Argument(std::move(v), Kind::Quoted); }
    static Argument expression(std::string v) { return Argument(std::move(v), Kind::Expression); }
    static Argument punctuator(char c) { return Argument(std::string(1, c), Kind::Punctuator); }

    bool is_quoted() const noexcept { return kind == Kind::Quoted || kind == Kind::TripleQuoted; }
    bool is_expression() const noexcept { return kind == Kind::Expression; }
    bool is_punctuator() const noexcept { return kind == Kind::Punctuator; }
};

// Values are equal when their text and their expression/punctuator nature
// match; quoting style and positions are presentation only.
bool operator==(const Argument& a, const Argument& b);
inline bool operator!=(const Argument& a, const Argument& b) { return !(a == b); }

struct Directive {
    Argument name;
    std::vector<Argument> arguments;
    std::vector<Directive> children;
    // `a {}` has a block with no children, `a;` has none.
    bool has_block = false;

    Directive() = default;
    explicit Directive(Argument n, std::vector<Argument> args = {})
        : name(std::move(n)), arguments(std::move(args)) {}

    // Appends a child and marks the directive as a block.
    Directive& add_child(Directive child);
    Directive& add_argument(Argument arg);

    // First child with the given name, or nullptr.
    const Directive* find(const std::string& child_name) const;
    std::vector<const Directive*> find_all(const std::string& child_name) const;
    bool has(const std::string& child_name) const { return find(child_name) != nullptr; }

    // Value of the argument at `index`; throws std::out_of_range.
    const std::string& arg(std::size_t index) const;
};

bool operator==(const Directive& a, const Directive& b);
inline bool operator!=(const Directive& a, const Directive& b) { return !(a == b); }

struct Comment {
    std::string text;
    Position position;
    bool multi_line = false;
};

// Result of parsing: the implicit unnamed root holding the top-level
// directives in source order, plus the comments seen along the way.
struct Document {
    std::vector<Directive> directives;
    std::vector<Comment> comments;

    bool empty() const noexcept { return directives.empty(); }
    std::size_t size() const noexcept { return directives.size(); }
    const Directive* find(const std::string& name) const;

    // Total number of directives in the tree.
    std::size_t count() const;
    // Deepest block nesting in the tree; 0 when no directive has a block.
    std::size_t depth() const;
};

// Documents compare by their directives; comments are not part of the value.
bool operator==(const Document& a, const Document& b);
inline bool operator!=(const Document& a, const Document& b) { return !(a == b); }

}  // namespace cf
