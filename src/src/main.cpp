// confetti - check, format and inspect configuration files

#include <cf/cli_args.h>
#include <cf/error.h>
#include <cf/file_io.h>
#include <cf/lexer.h>
#include <cf/parse.h>
#include <cf/serialize.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void showHelp() {
    std::cout << "confetti - configuration file checker and formatter\n\n";
    std::cout << "Usage:\n";
    std::cout << "  confetti <file> [--check] [options]\n";
    std::cout << "  confetti <file> --format [--output <file>] [--indent <n>] [options]\n";
    std::cout << "  confetti <file> --tokens [options]\n\n";
    std::cout << "Actions:\n";
    std::cout << "  --check              Parse and print a summary (default)\n";
    std::cout << "  --format             Print the file in canonical form\n";
    std::cout << "  --tokens             Print the token stream\n\n";
    std::cout << "Options:\n";
    std::cout << "  --output, -o <file>  Write formatted output to a file\n";
    std::cout << "  --indent <n>         Spaces per nesting level (default 2)\n";
    std::cout << "  --c-comments         Accept // and /* */ comments\n";
    std::cout << "  --expressions        Accept parenthesized expression arguments\n";
    std::cout << "  --no-triple-quotes   Read \"\"\" as an empty string and a quote\n";
    std::cout << "  --no-separators      Treat ',' as part of a word\n";
    std::cout << "  --no-continuations   Disable backslash-newline continuation\n";
    std::cout << "  --punctuators <set>  Characters read as single-character punctuators\n";
    std::cout << "  --max-depth <n>      Maximum block nesting (default 100)\n";
    std::cout << "  --verbose, -v        Report progress on stderr\n\n";
    std::cout << "Exit status: 0 on success, 1 on a syntax error, 2 on a usage or I/O error.\n";
}

void log(bool enabled, const std::string& message) {
    if (enabled) std::cerr << "confetti: " << message << "\n";
}

void printTokens(const std::string& text, const cf::ParserOptions& options) {
    cf::Lexer lexer(text, options);
    while (true) {
        cf::Token t = lexer.next();
        std::cout << t.position.line << ":" << t.position.column << "\t" << cf::to_string(t.type);
        if (t.type != cf::Token::Type::EndOfDirective and t.type != cf::Token::Type::EndOfInput and
            t.type != cf::Token::Type::LineContinuation)
            std::cout << "\t" << cf::quote(t.value);
        std::cout << "\n";
        if (t.type == cf::Token::Type::EndOfInput) break;
    }
}

}  // namespace

int main(int argc, const char* argv[]) {
    std::optional<cf::CliArgs> parsed;
    try {
        parsed.emplace(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Run 'confetti --help' for usage.\n";
        return 2;
    }
    const cf::CliArgs& args = *parsed;

    if (args.getAction() == cf::CliArgs::Action::HELP) {
        showHelp();
        return argc < 2 ? 2 : 0;
    }

    std::string text;
    try {
        log(args.isVerbose(), "reading " + args.getFilePath());
        text = cf::read_text_file(args.getFilePath());
    } catch (const cf::IoError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    try {
        if (args.getAction() == cf::CliArgs::Action::TOKENS) {
            printTokens(text, args.getParserOptions());
            return 0;
        }

        cf::Document doc = cf::parse(text, args.getParserOptions());
        log(args.isVerbose(), "parsed " + std::to_string(doc.count()) + " directives, depth " +
                                  std::to_string(doc.depth()));

        if (args.getAction() == cf::CliArgs::Action::FORMAT) {
            std::string out = cf::serialize(doc, args.getMapperOptions());
            if (args.hasOutputPath()) {
                cf::write_text_file(args.getOutputPath(), out);
                log(args.isVerbose(), "wrote " + args.getOutputPath());
            } else {
                std::cout << out;
            }
            return 0;
        }

        std::cout << "OK: " << doc.count() << " directives, " << doc.comments.size() << " comments\n";
        return 0;
    } catch (const cf::SyntaxError& e) {
        std::cerr << args.getFilePath() << ": parse error: " << e.what() << "\n";
        return 1;
    } catch (const cf::SerializeError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const cf::IoError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
