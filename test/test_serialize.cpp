#include <catch2/catch.hpp>
#include <cf/parse.h>
#include <cf/serialize.h>

using namespace cf;

TEST_CASE("serializer writes one directive per line with indented blocks", "[serialize]") {
    auto doc = parse("server{listen 80;location /{root /srv}} empty {} flag;");
    std::string expected =
        "server {\n"
        "  listen 80;\n"
        "  location / {\n"
        "    root /srv;\n"
        "  }\n"
        "}\n"
        "empty {}\n"
        "flag;\n";
    REQUIRE(serialize(doc) == expected);
}

TEST_CASE("indent string is configurable", "[serialize]") {
    MapperOptions opts;
    opts.indent = "\t";
    REQUIRE(serialize(parse("a { b; }"), opts) == "a {\n\tb;\n}\n");
}

TEST_CASE("values are quoted only when a word cannot hold them", "[serialize]") {
    Directive d(Argument::word("set"));
    d.add_argument(Argument::word("plain"));
    d.add_argument(Argument::word("two words"));
    d.add_argument(Argument::word(""));
    d.add_argument(Argument::word("semi;colon"));
    d.add_argument(Argument::word("back\\slash"));
    d.add_argument(Argument::quoted("kept"));
    REQUIRE(serialize(d) == R"(set plain "two words" "" "semi;colon" "back\\slash" "kept";)" "\n");
}

TEST_CASE("quote escapes what the lexer decodes", "[serialize]") {
    REQUIRE(quote("say \"hi\"") == R"("say \"hi\"")");
    REQUIRE(quote("a\nb\tc") == R"("a\nb\tc")");
    REQUIRE(quote(std::string("nul\0", 4)) == R"("nul\0")");
    REQUIRE_THROWS_AS(quote("bell\x07"), SerializeError);
}

TEST_CASE("triple-quoted values keep their newlines", "[serialize]") {
    Directive d(Argument::word("run"));
    d.add_argument(Argument("line one\nline \"two\"", Argument::Kind::TripleQuoted));
    REQUIRE(serialize(d) == "run \"\"\"line one\nline \\\"two\\\"\"\"\";\n");

    MapperOptions opts;
    opts.parser.allow_triple_quotes = false;
    REQUIRE(serialize(d, opts) == "run \"line one\\nline \\\"two\\\"\";\n");
}

TEST_CASE("expressions and punctuators need the matching parser options", "[serialize]") {
    Directive d(Argument::word("when"));
    d.add_argument(Argument::expression("a  +  b"));
    REQUIRE_THROWS_AS(serialize(d), SerializeError);

    MapperOptions opts;
    opts.parser.allow_expression_arguments = true;
    REQUIRE(serialize(d, opts) == "when (a + b);\n");

    Directive p(Argument::word("key"));
    p.add_argument(Argument::punctuator('='));
    p.add_argument(Argument::word("value"));
    REQUIRE_THROWS_AS(serialize(p), SerializeError);
    opts.parser.punctuators = "=";
    REQUIRE(serialize(p, opts) == "key = value;\n");
}

TEST_CASE("invalid expressions are rejected", "[serialize]") {
    MapperOptions opts;
    opts.parser.allow_expression_arguments = true;
    Directive d(Argument::word("e"));
    d.add_argument(Argument::expression("a) (b"));
    REQUIRE_THROWS_AS(serialize(d, opts), SerializeError);

    Directive semi(Argument::word("e"));
    semi.add_argument(Argument::expression("a; b"));
    REQUIRE_THROWS_AS(serialize(semi, opts), SerializeError);
}

TEST_CASE("directive names must be words or strings", "[serialize]") {
    Directive d(Argument::expression("x"));
    REQUIRE_THROWS_AS(serialize(d), SerializeError);
}

TEST_CASE("bidirectional characters cannot be written", "[serialize]") {
    Directive d(Argument::word("a"));
    d.add_argument(Argument::word("x\xE2\x80\xAEy"));
    REQUIRE_THROWS_AS(serialize(d), SerializeError);

    MapperOptions opts;
    opts.parser.forbid_bidi_characters = false;
    REQUIRE_NOTHROW(serialize(d, opts));
}

TEST_CASE("C-style comment openers are quoted when comments are enabled", "[serialize]") {
    Directive d(Argument::word("path"));
    d.add_argument(Argument::word("//share"));
    REQUIRE(serialize(d) == "path //share;\n");

    MapperOptions opts;
    opts.parser.allow_c_style_comments = true;
    REQUIRE(serialize(d, opts) == "path \"//share\";\n");
}

TEST_CASE("an empty document serializes to nothing", "[serialize]") {
    REQUIRE(serialize(Document{}).empty());
}
