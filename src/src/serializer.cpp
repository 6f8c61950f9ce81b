#include <cf/serialize.h>
#include <cf/lexer.h>
#include <cf/parse.h>
#include <sstream>

namespace cf {

namespace {
    // Escapes for the characters the lexer reads back from a backslash sequence.
    bool append_escape(std::ostringstream& ss, char c) {
        switch (c) {
            case '"':
            case '\\':
                ss << '\\' << c;
                return true;
            case '\n':
                ss << "\\n";
                return true;
            case '\t':
                ss << "\\t";
                return true;
            case '\r':
                ss << "\\r";
                return true;
            case '\b':
                ss << "\\b";
                return true;
            case '\f':
                ss << "\\f";
                return true;
            case '\v':
                ss << "\\v";
                return true;
            case '\0':
                ss << "\\0";
                return true;
            default:
                break;
        }
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 or u == 0x7F) throw SerializeError("control character cannot be written in a string");
        return false;
    }

    std::string triple_quote(const std::string& value) {
        std::ostringstream ss;
        ss << "\"\"\"";
        for (char c : value) {
            if (c == '\n') {
                ss << c;
                continue;
            }
            if (not append_escape(ss, c)) ss << c;
        }
        ss << "\"\"\"";
        return ss.str();
    }

    // Re-reads an expression through the parser so the written form is the
    // one the parser produces.
    std::string normalize_expression(const std::string& value, const ParserOptions& opts) {
        Document doc;
        try {
            doc = parse("e (" + value + ")", opts);
        } catch (const SyntaxError& e) {
            throw SerializeError("invalid expression '" + value + "': " + e.message());
        }
        if (doc.size() != 1 or doc.directives[0].arguments.size() != 1 or
            not doc.directives[0].arguments[0].is_expression() or doc.directives[0].has_block)
            throw SerializeError("invalid expression '" + value + "'");
        return doc.directives[0].arguments[0].value;
    }

    std::string render_argument(const Argument& arg, const ParserOptions& opts) {
        if (opts.forbid_bidi_characters and contains_bidi_character(arg.value))
            throw SerializeError("value '" + arg.value + "' contains a bidirectional formatting character");
        switch (arg.kind) {
            case Argument::Kind::Expression:
                if (not opts.allow_expression_arguments)
                    throw SerializeError("expression argument '" + arg.value +
                                         "' requires expression arguments to be enabled");
                return "(" + normalize_expression(arg.value, opts) + ")";
            case Argument::Kind::Punctuator:
                if (arg.value.size() != 1 or not opts.is_punctuator(arg.value[0]) or
                    (opts.allow_expression_arguments and (arg.value == "(" or arg.value == ")")))
                    throw SerializeError("'" + arg.value + "' is not a configured punctuator");
                return arg.value;
            case Argument::Kind::TripleQuoted:
                if (opts.allow_triple_quotes) return triple_quote(arg.value);
                return quote(arg.value);
            case Argument::Kind::Quoted:
                return quote(arg.value);
            case Argument::Kind::Word:
                break;
        }
        return requires_quotes(arg.value, opts) ? quote(arg.value) : arg.value;
    }

    void emit(std::ostringstream& out, const Directive& d, const MapperOptions& opts, std::size_t depth) {
        if (d.name.is_expression() or d.name.is_punctuator())
            throw SerializeError("directive name '" + d.name.value + "' must be a word or string");
        for (std::size_t k = 0; k < depth; ++k) out << opts.indent;
        out << render_argument(d.name, opts.parser);
        for (auto const& a : d.arguments) out << ' ' << render_argument(a, opts.parser);

        if (not d.has_block and d.children.empty()) {
            out << ";\n";
            return;
        }
        if (d.children.empty()) {
            out << " {}\n";
            return;
        }
        out << " {\n";
        for (auto const& c : d.children) emit(out, c, opts, depth + 1);
        for (std::size_t k = 0; k < depth; ++k) out << opts.indent;
        out << "}\n";
    }
}

std::string quote(const std::string& value) {
    std::ostringstream ss;
    ss << '"';
    for (char c : value)
        if (not append_escape(ss, c)) ss << c;
    ss << '"';
    return ss.str();
}

std::string serialize(const Directive& directive, const MapperOptions& options, std::size_t depth) {
    std::ostringstream out;
    emit(out, directive, options, depth);
    return out.str();
}

std::string serialize(const Document& doc, const MapperOptions& options) {
    std::ostringstream out;
    for (auto const& d : doc.directives) emit(out, d, options, 0);
    return out.str();
}

}  // namespace cf
