#include <cf/parse.h>
#include <cf/lexer.h>
#include <utility>

namespace cf {

namespace {
    Argument to_argument(const Token& t) {
        Argument a;
        a.value = t.value;
        a.position = t.position;
        switch (t.type) {
            case Token::Type::QuotedString:
                a.kind = Argument::Kind::Quoted;
                break;
            case Token::Type::TripleQuotedString:
                a.kind = Argument::Kind::TripleQuoted;
                break;
            case Token::Type::Punctuator:
                a.kind = Argument::Kind::Punctuator;
                break;
            default:
                a.kind = Argument::Kind::Word;
                break;
        }
        return a;
    }

    struct Parser {
        Lexer lexer;
        const ParserOptions& opts;
        Token tok;
        Document doc;
        size_t depth = 0;
        size_t directive_count = 0;

        Parser(const std::string& text, const ParserOptions& o) : lexer(text, o), opts(o) { advance(); }

        void advance() { tok = lexer.next(); }

        [[noreturn]] void fail(const std::string& message, const Position& pos) const {
            throw ParseError(message, pos, lexer.source());
        }

        [[noreturn]] void limit(const std::string& message, const Position& pos) const {
            throw ResourceLimitExceeded(message, pos, lexer.source());
        }

        void record_comment() {
            Comment c;
            c.text = tok.text;
            c.position = tok.position;
            c.multi_line = tok.text.compare(0, 2, "/*") == 0;
            doc.comments.push_back(std::move(c));
        }

        void enter(const Token& opener) {
            if (depth + 1 > opts.max_depth)
                limit("maximum nesting depth of " + std::to_string(opts.max_depth) + " exceeded",
                      opener.position);
            ++depth;
        }

        // Terminators, comments and continuations between directives.
        void skip_boundaries() {
            while (true) {
                switch (tok.type) {
                    case Token::Type::EndOfDirective:
                    case Token::Type::LineContinuation:
                        advance();
                        break;
                    case Token::Type::Comment:
                        record_comment();
                        advance();
                        break;
                    default:
                        return;
                }
            }
        }

        Document parse_document() {
            while (true) {
                skip_boundaries();
                if (tok.type == Token::Type::EndOfInput) break;
                if (tok.type == Token::Type::BlockClose) fail("unmatched '}'", tok.position);
                doc.directives.push_back(parse_directive());
            }
            return std::move(doc);
        }

        Directive parse_directive() {
            if (not tok.is_argument())
                fail(std::string("expected directive name, found ") + to_string(tok.type), tok.position);
            if (++directive_count > opts.max_directives)
                limit("maximum directive count of " + std::to_string(opts.max_directives) + " exceeded",
                      tok.position);

            Directive d;
            d.name = to_argument(tok);
            advance();
            parse_arguments(d);
            if (tok.type == Token::Type::BlockOpen)
                parse_block(d);
            else if (tok.type == Token::Type::EndOfDirective)
                advance();
            return d;
        }

        void push_argument(Directive& d, Argument a) {
            if (d.arguments.size() >= opts.max_arguments)
                limit("directive '" + d.name.value + "' has more than " + std::to_string(opts.max_arguments) +
                          " arguments",
                      a.position);
            d.arguments.push_back(std::move(a));
        }

        void parse_arguments(Directive& d) {
            while (true) {
                switch (tok.type) {
                    case Token::Type::Word:
                    case Token::Type::QuotedString:
                    case Token::Type::TripleQuotedString:
                        push_argument(d, to_argument(tok));
                        advance();
                        break;
                    case Token::Type::Punctuator:
                        if (opts.allow_expression_arguments and tok.is_punctuator('(')) {
                            push_argument(d, parse_expression());
                            break;
                        }
                        if (opts.allow_expression_arguments and tok.is_punctuator(')'))
                            fail("unmatched ')'", tok.position);
                        push_argument(d, to_argument(tok));
                        advance();
                        break;
                    case Token::Type::ArgumentSeparator:
                    case Token::Type::LineContinuation:
                        advance();
                        break;
                    case Token::Type::Comment:
                        record_comment();
                        advance();
                        break;
                    default:
                        return;
                }
            }
        }

        void parse_block(Directive& d) {
            Token opener = tok;
            enter(opener);
            d.has_block = true;
            advance();
            while (true) {
                skip_boundaries();
                if (tok.type == Token::Type::BlockClose) {
                    advance();
                    break;
                }
                if (tok.type == Token::Type::EndOfInput)
                    fail("unclosed '{': expected '}' before end of input", opener.position);
                d.children.push_back(parse_directive());
            }
            --depth;
        }

        // tok is '('; consumes through the matching ')'.
        Argument parse_expression() {
            Token opener = tok;
            enter(opener);
            advance();
            Argument a = Argument::expression(parse_expression_body(opener));
            a.position = opener.position;
            --depth;
            return a;
        }

        // Flattens the tokens up to the ')' matching `opener` into one string.
        std::string parse_expression_body(const Token& opener) {
            std::string out;
            auto append = [&out](const std::string& piece, bool space_before) {
                if (space_before and not out.empty() and out.back() != '(') out.push_back(' ');
                out += piece;
            };
            while (true) {
                switch (tok.type) {
                    case Token::Type::Word:
                    case Token::Type::QuotedString:
                    case Token::Type::TripleQuotedString:
                        append(tok.text, true);
                        advance();
                        break;
                    case Token::Type::Punctuator:
                        if (tok.is_punctuator(')')) {
                            advance();
                            return out;
                        }
                        if (tok.is_punctuator('(')) {
                            Token inner = tok;
                            enter(inner);
                            advance();
                            append("(" + parse_expression_body(inner) + ")", true);
                            --depth;
                            break;
                        }
                        append(tok.text, true);
                        advance();
                        break;
                    case Token::Type::ArgumentSeparator:
                        append(",", false);
                        advance();
                        break;
                    case Token::Type::Comment:
                        record_comment();
                        advance();
                        break;
                    case Token::Type::LineContinuation:
                        advance();
                        break;
                    case Token::Type::EndOfDirective:
                        // a newline inside parentheses is whitespace, a ';' is not
                        if (tok.text.find(';') != std::string::npos)
                            fail("expected ')' before ';'", tok.position);
                        advance();
                        break;
                    default:
                        fail("unclosed '(': expected ')' before " + std::string(to_string(tok.type)),
                             opener.position);
                }
            }
        }
    };
}

Document parse(const std::string& text, const ParserOptions& options) {
    Parser p(text, options);
    return p.parse_document();
}

}  // namespace cf
