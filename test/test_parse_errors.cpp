#include <catch2/catch.hpp>
#include <cf/parse.h>

using namespace cf;

TEST_CASE("parse errors report line and column with the source line") {
    std::string s = "a;\n}\n";
    try {
        parse(s);
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        std::string msg = e.what();
        REQUIRE(e.message() == "unmatched '}'");
        REQUIRE(e.position().line == 2);
        REQUIRE(e.position().column == 1);
        REQUIRE(msg.find("(line 2, column 1)") != std::string::npos);
        REQUIRE(msg.find("\n}\n^") != std::string::npos);
    }
}

TEST_CASE("unclosed block is reported at its opening brace") {
    std::string s = "server {\n  listen 80;\n";
    try {
        parse(s);
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.message().find("unclosed '{'") != std::string::npos);
        REQUIRE(e.position().line == 1);
        REQUIRE(e.position().column == 8);
    }
}

TEST_CASE("a directive must start with a word or string") {
    for (const char* s : {"{ a; }", ", a;"}) {
        try {
            parse(s);
            FAIL("expected parse to throw");
        } catch (const ParseError& e) {
            REQUIRE(e.message().find("expected directive name") != std::string::npos);
            REQUIRE(e.position().offset == 0);
        }
    }
}

TEST_CASE("syntax errors share one hierarchy") {
    REQUIRE_THROWS_AS(parse("a \"b"), LexError);
    REQUIRE_THROWS_AS(parse("a \"b"), SyntaxError);
    REQUIRE_THROWS_AS(parse("}"), SyntaxError);
    REQUIRE_THROWS_AS(parse("}"), Error);
    REQUIRE_THROWS_AS(parse("}"), std::runtime_error);
}

TEST_CASE("lexer errors surface unchanged through parse") {
    try {
        parse("a b;\nc \"unterminated\n");
        FAIL("expected parse to throw");
    } catch (const LexError& e) {
        REQUIRE(e.message() == "unterminated quoted string");
        REQUIRE(e.position().line == 2);
        REQUIRE(e.position().column == 3);
        REQUIRE(e.position().offset == 7);
    }
}

TEST_CASE("excerpt points at the reported column") {
    REQUIRE(source_excerpt("abc\ndef\n", Position{2, 2, 5}) == "def\n ^");
    REQUIRE(source_excerpt("", Position{}) == "\n^");
}
