#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"
#include <limits>
#include <stdexcept>

TEST_CASE("Fixed-point parsing", "[util]") {
    SECTION("Decimal strings scale by 1e18") {
        REQUIRE(util::parse_wad("1.0") == WAD);
        REQUIRE(util::parse_wad("1.2") == Wad(1200000000000000000ULL));
        REQUIRE(util::parse_wad("0.05") == Wad(50000000000000000ULL));
        REQUIRE(util::parse_wad("0.000000000000000001") == Wad(1));
        REQUIRE(util::parse_wad(" 2.5 ") == WAD * 5 / 2);
    }

    SECTION("Plain digits are raw integers") {
        REQUIRE(util::parse_wad("1") == Wad(1));
        REQUIRE(util::parse_wad("0") == Wad(0));
        REQUIRE(util::parse_wad("000123") == Wad(123));
        REQUIRE(util::parse_wad("1000000000000000000") == WAD);
    }

    SECTION("Scientific notation is a raw integer") {
        REQUIRE(util::parse_wad("1e18") == WAD);
        REQUIRE(util::parse_wad("1.2e18") == Wad(1200000000000000000ULL));
        REQUIRE(util::parse_wad("5E+3") == Wad(5000));
    }

    SECTION("Largest uint256 parses, one more does not") {
        std::string max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
        REQUIRE(util::parse_wad(max) == std::numeric_limits<Wad>::max());
        std::string over = "115792089237316195423570985008687907853269984665640564039457584007913129639936";
        REQUIRE_THROWS_AS(util::parse_wad(over), std::invalid_argument);
    }

    SECTION("Malformed input is rejected") {
        for (const char* bad : {"", "  ", "-1", "1.", ".5", "abc", "1.2.3", "1e", "1e-3",
                                "1.25e1", "0.0000000000000000001", "1e100", "0x10"}) {
            REQUIRE_THROWS_AS(util::parse_wad(bad), std::invalid_argument);
        }
    }
}

TEST_CASE("Fixed-point formatting", "[util]") {
    REQUIRE(util::wad_to_string(WAD) == "1000000000000000000");
    REQUIRE(util::wad_to_decimal(WAD) == "1.0");
    REQUIRE(util::wad_to_decimal(Wad(0)) == "0.0");
    REQUIRE(util::wad_to_decimal(util::parse_wad("0.05")) == "0.05");
    REQUIRE(util::wad_to_decimal(Wad(1)) == "0.000000000000000001");
    REQUIRE(util::wad_to_decimal(WAD * 1000 + util::parse_wad("0.5")) == "1000.5");
    REQUIRE(util::parse_wad(util::wad_to_decimal(Wad(1064516129032258064ULL))) ==
            Wad(1064516129032258064ULL));
}

TEST_CASE("String trimming", "[util]") {
    REQUIRE(util::trim("  abc \r\n") == "abc");
    REQUIRE(util::trim("\t\t") == "");
    REQUIRE(util::trim("x") == "x");
}
