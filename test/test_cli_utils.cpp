#include <catch2/catch.hpp>
#include <cf/cli_utils.h>

using namespace cf::cli_utils;

TEST_CASE("Unknown argument message includes a hint", "[cli_utils][unit]") {
    std::string msg = create_unknown_arg_error("--verbos", {"--verbose", "--indent"});
    REQUIRE(msg.find("Unknown argument: --verbos") != std::string::npos);
    REQUIRE(msg.find("Did you mean '--verbose'?") != std::string::npos);

    msg = create_unknown_arg_error("--zzzzzzzzzzzz", {"--verbose"});
    REQUIRE(msg.find("Did you mean") == std::string::npos);
}
