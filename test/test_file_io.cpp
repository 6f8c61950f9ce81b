#include <catch2/catch.hpp>
#include <cf/confetti.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct Endpoint {
    std::string host;
    int port = 0;
};

fs::path temp_file(const std::string& name) { return fs::temp_directory_path() / ("confetti_test_" + name); }

}  // namespace

namespace cf {
template <>
struct MappingTraits<Endpoint> {
    static void describe(Mapping<Endpoint>& m) {
        m.name("endpoint");
        m.field("host", &Endpoint::host);
        m.field("port", &Endpoint::port);
    }
};
}  // namespace cf

TEST_CASE("load and save documents", "[file_io]") {
    auto path = temp_file("doc.conf").string();
    cf::Document doc = cf::parse("a { b 1; }\nc \"two words\";\n");
    cf::save_file(path, doc);
    REQUIRE(cf::read_text_file(path) == "a {\n  b 1;\n}\nc \"two words\";\n");
    REQUIRE(cf::load_file(path) == doc);
    fs::remove(path);
}

TEST_CASE("map records to and from files", "[file_io]") {
    auto path = temp_file("endpoint.conf").string();
    Endpoint e{"db.internal", 5432};
    cf::to_file(path, e);
    auto back = cf::from_file<Endpoint>(path);
    REQUIRE(back.host == "db.internal");
    REQUIRE(back.port == 5432);
    fs::remove(path);
}

TEST_CASE("missing files raise IoError with the path", "[file_io][errors]") {
    std::string path = temp_file("does_not_exist.conf").string();
    fs::remove(path);
    try {
        cf::load_file(path);
        FAIL("expected load to throw");
    } catch (const cf::IoError& e) {
        REQUIRE(e.path() == path);
        REQUIRE(std::string(e.what()).find("cannot open file") != std::string::npos);
    }
    REQUIRE_THROWS_AS(cf::write_text_file((fs::path(path) / "sub" / "x.conf").string(), "x"), cf::IoError);
}

TEST_CASE("syntax errors from files keep their positions", "[file_io][errors]") {
    auto path = temp_file("broken.conf").string();
    {
        std::ofstream out(path);
        out << "ok;\nbad {\n";
    }
    try {
        cf::load_file(path);
        FAIL("expected load to throw");
    } catch (const cf::ParseError& e) {
        REQUIRE(e.position().line == 2);
        REQUIRE(e.position().column == 5);
    }
    fs::remove(path);
}
