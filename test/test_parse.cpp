#include <catch2/catch.hpp>
#include <cf/parse.h>

using namespace cf;

TEST_CASE("empty input yields an empty document") {
    REQUIRE(parse("").empty());
    REQUIRE(parse("   \n\n\t ;; \n").empty());
    auto doc = parse("# only a comment\n");
    REQUIRE(doc.empty());
    REQUIRE(doc.comments.size() == 1);
}

TEST_CASE("simple directives keep their arguments in order", "[parse]") {
    auto doc = parse("listen 80 default_server;\nserver_name example.com www.example.com;\n");
    REQUIRE(doc.size() == 2);
    REQUIRE(doc.directives[0].name.value == "listen");
    REQUIRE(doc.directives[0].arguments.size() == 2);
    REQUIRE(doc.directives[0].arg(0) == "80");
    REQUIRE(doc.directives[0].arg(1) == "default_server");
    REQUIRE(doc.directives[1].arg(1) == "www.example.com");
    REQUIRE_FALSE(doc.directives[0].has_block);
}

TEST_CASE("comma separated arguments equal whitespace separated ones", "[parse]") {
    REQUIRE(parse("a 1, 2, 3;") == parse("a 1 2 3;"));
    REQUIRE(parse("a 1,2,3") == parse("a 1 2 3"));
}

TEST_CASE("newline, semicolon and end of input all end a directive", "[parse]") {
    REQUIRE(parse("a; b; c").size() == 3);
    REQUIRE(parse("a\nb\nc\n").size() == 3);
    REQUIRE(parse("a 1").directives[0].arguments.size() == 1);
}

TEST_CASE("blocks nest directives", "[parse]") {
    std::string s = R"(
server {
    listen 80;
    location / {
        root /var/www;
    }
}
)";
    auto doc = parse(s);
    REQUIRE(doc.size() == 1);
    const Directive& server = doc.directives[0];
    REQUIRE(server.has_block);
    REQUIRE(server.children.size() == 2);
    REQUIRE(server.find("listen") != nullptr);
    const Directive* location = server.find("location");
    REQUIRE(location != nullptr);
    REQUIRE(location->arg(0) == "/");
    REQUIRE(location->children[0].arg(0) == "/var/www");
    REQUIRE(doc.count() == 4);
    REQUIRE(doc.depth() == 2);
}

TEST_CASE("an empty block differs from no block", "[parse]") {
    auto with_block = parse("a {}");
    auto without = parse("a;");
    REQUIRE(with_block.directives[0].has_block);
    REQUIRE(with_block.directives[0].children.empty());
    REQUIRE_FALSE(without.directives[0].has_block);
    REQUIRE(with_block != without);
}

TEST_CASE("the last directive in a block needs no terminator", "[parse]") {
    auto doc = parse("a { b 1 }");
    REQUIRE(doc.directives[0].children.size() == 1);
    REQUIRE(doc.directives[0].children[0].arg(0) == "1");

    doc = parse("a {} b;");
    REQUIRE(doc.size() == 2);
}

TEST_CASE("quoted strings can name directives and keep spaces", "[parse]") {
    auto doc = parse(R"("my key" "some value" plain;)");
    const Directive& d = doc.directives[0];
    REQUIRE(d.name.value == "my key");
    REQUIRE(d.name.is_quoted());
    REQUIRE(d.arg(0) == "some value");
    REQUIRE(d.arguments[0].kind == Argument::Kind::Quoted);
    REQUIRE(d.arguments[1].kind == Argument::Kind::Word);
}

TEST_CASE("quoting style does not affect equality", "[parse]") {
    REQUIRE(parse(R"(a "b";)") == parse("a b;"));
}

TEST_CASE("repeated directives are all kept in source order", "[parse]") {
    auto doc = parse("include a.conf;\ninclude b.conf;\n");
    REQUIRE(doc.size() == 2);
    REQUIRE(doc.find("include")->arg(0) == "a.conf");

    auto block = parse("x { v 1; v 2; v 3; }");
    auto all = block.directives[0].find_all("v");
    REQUIRE(all.size() == 3);
    REQUIRE(all[2]->arg(0) == "3");
}

TEST_CASE("arguments record their source position", "[parse]") {
    auto doc = parse("a\n  b c");
    const Directive& d = doc.directives[1];
    REQUIRE(d.name.position.line == 2);
    REQUIRE(d.name.position.column == 3);
    REQUIRE(d.arguments[0].position.column == 5);
}

TEST_CASE("arg() rejects missing indices") {
    auto doc = parse("a 1;");
    REQUIRE_THROWS_AS(doc.directives[0].arg(1), std::out_of_range);
}
