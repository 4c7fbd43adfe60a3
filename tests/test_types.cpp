#include <catch2/catch.hpp>

#include <sift/types.hpp>

using namespace sift;

TEST_CASE("Stage names match the stage directories", "[types]")
{
    REQUIRE(std::string(stageName(Stage::Review)) == "review");
    REQUIRE(std::string(stageName(Stage::Accept)) == "accept");
    REQUIRE(std::string(stageName(Stage::Reject)) == "reject");
}

TEST_CASE("parseItemId accepts only positive decimal integers", "[types]")
{
    REQUIRE(parseItemId("101") == ItemId{101});
    REQUIRE(parseItemId("9223372036854775807") == ItemId{9223372036854775807LL});

    REQUIRE_FALSE(parseItemId("0").has_value());
    REQUIRE_FALSE(parseItemId("000").has_value());
    // Only the name std::to_string would produce maps to an id
    REQUIRE_FALSE(parseItemId("007").has_value());
    REQUIRE_FALSE(parseItemId("0101").has_value());
    REQUIRE_FALSE(parseItemId("-5").has_value());
    REQUIRE_FALSE(parseItemId("+5").has_value());
    REQUIRE_FALSE(parseItemId("12a").has_value());
    REQUIRE_FALSE(parseItemId("comment-12.txt").has_value());
    REQUIRE_FALSE(parseItemId("").has_value());
    REQUIRE_FALSE(parseItemId("9223372036854775808").has_value());
}
