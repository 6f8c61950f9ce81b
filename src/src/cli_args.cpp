#include <cf/cli_args.h>
#include <cf/cli_utils.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace cf {

namespace {
    std::size_t parse_count(const std::string& flag, const std::string& text) {
        std::size_t used = 0;
        unsigned long long n = 0;
        try {
            n = std::stoull(text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != text.size() or text.empty() or text[0] == '-')
            throw std::invalid_argument(flag + " requires a non-negative integer, got '" + text + "'");
        return static_cast<std::size_t>(n);
    }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        action_ = Action::HELP;
        return;
    }
    if (first.size() > 1 && first[0] == '-')
        throw std::invalid_argument("expected a file path before options, got '" + first + "'");

    // First argument is the file path
    filePath_ = first;
    action_ = Action::CHECK;

    // Valid options for error suggestions
    static const std::vector<std::string> valid_options = {
        "--check",      "--format",       "--tokens",        "--output",    "-o",
        "--c-comments", "--expressions",  "--no-triple-quotes", "--no-separators",
        "--no-continuations", "--punctuators", "--max-depth", "--indent", "--verbose",
        "-v",           "--help",         "-h"};

    ParserOptions& parser = mapperOptions_.parser;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const std::string& what) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires " + what);
            return argv[++i];
        };

        if (arg == "--check") {
            action_ = Action::CHECK;
        } else if (arg == "--format") {
            action_ = Action::FORMAT;
        } else if (arg == "--tokens") {
            action_ = Action::TOKENS;
        } else if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
        } else if (arg == "--output" || arg == "-o") {
            outputPath_ = value("a file path");
        } else if (arg == "--c-comments") {
            parser.allow_c_style_comments = true;
        } else if (arg == "--expressions") {
            parser.allow_expression_arguments = true;
        } else if (arg == "--no-triple-quotes") {
            parser.allow_triple_quotes = false;
        } else if (arg == "--no-separators") {
            parser.allow_argument_separators = false;
        } else if (arg == "--no-continuations") {
            parser.allow_line_continuations = false;
        } else if (arg == "--punctuators") {
            parser.punctuators = value("a list of characters");
        } else if (arg == "--max-depth") {
            parser.max_depth = parse_count(arg, value("a number"));
        } else if (arg == "--indent") {
            mapperOptions_.indent = std::string(parse_count(arg, value("a number")), ' ');
        } else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        } else {
            throw std::invalid_argument(cli_utils::create_unknown_arg_error(arg, valid_options));
        }
    }

    if (!outputPath_.empty() && action_ != Action::FORMAT)
        throw std::invalid_argument("--output is only valid with --format");
}

}  // namespace cf
