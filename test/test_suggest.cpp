#include <catch2/catch.hpp>
#include <cf/suggest.h>

using namespace cf;

TEST_CASE("Levenshtein distance", "[suggest][unit]") {
    REQUIRE(levenshtein_distance("", "") == 0);
    REQUIRE(levenshtein_distance("abc", "") == 3);
    REQUIRE(levenshtein_distance("kitten", "sitting") == 3);
    REQUIRE(levenshtein_distance("--format", "--fromat") == 2);
}

TEST_CASE("Suggest the closest candidate", "[suggest][unit]") {
    std::vector<std::string> options = {"--format", "--tokens", "--check"};
    REQUIRE(suggest_similar("--fromat", options) == "--format");
    REQUIRE(suggest_similar("--token", options) == "--tokens");
    REQUIRE(suggest_similar("--completely-different", options).empty());
    REQUIRE(suggest_similar("x", {}).empty());
}

TEST_CASE("Suggestions pick the first of equally close candidates", "[suggest][unit]") {
    REQUIRE(suggest_similar("port", {"sort", "part"}) == "sort");
    REQUIRE(suggest_similar("port", {"port", "ports"}) == "port");
}
