/**
 * @file test_delimited.cpp
 * @brief Tests for column extraction from delimited lines
 */

#include <catch2/catch_test_macros.hpp>

#include <attridx/attridx.hpp>
#include <attridx/delimited.hpp>
#include <string>
#include <vector>

using namespace attridx;

TEST_CASE("column_extractor splits fields", "[delimited]") {
    const column_extractor first{',', 0};
    const column_extractor third{',', 2};

    SECTION("Selects the requested column") {
        REQUIRE(first("Ada,London,1815") == "Ada");
        REQUIRE(third("Ada,London,1815") == "1815");
    }

    SECTION("Missing column has no value") {
        REQUIRE_FALSE(third("Ada,London").has_value());
        REQUIRE_FALSE(column_extractor{',', 5}("a,b,c").has_value());
    }

    SECTION("Trailing delimiter yields an empty field") {
        REQUIRE(third("Ada,London,") == "");
        REQUIRE(column_extractor{',', 1}("a,,c") == "");
    }

    SECTION("Carriage return is not part of the last field") {
        REQUIRE(third("Ada,London,1815\r") == "1815");
        REQUIRE(first("Ada\r") == "Ada");
    }

    SECTION("Blank line has no value") {
        REQUIRE_FALSE(first("").has_value());
        REQUIRE_FALSE(first("\r").has_value());
    }

    SECTION("Custom delimiter") {
        const column_extractor tab{'\t', 1};
        REQUIRE(tab("x\ty,z") == "y,z");
    }
}

TEST_CASE("column_extractor drives an index over lines", "[delimited][integration]") {
    const std::vector<std::string> lines = {
        "Ada,London",
        "Alan",
        "",
        "Grace,Arlington\r",
        "Edsger,London",
        "Barbara,",
    };

    auto index = attribute_index<std::string, uint8_t>::build(lines, column_extractor{',', 1});
    REQUIRE(index.has_value());

    REQUIRE(index->object_count() == 6);
    REQUIRE(index->size() == 4);
    REQUIRE(index->get("London") == std::vector<uint8_t>{0, 4});
    REQUIRE(index->get("Arlington") == std::vector<uint8_t>{3});
    REQUIRE(index->get("") == std::vector<uint8_t>{5});
    REQUIRE(index->get_all() == std::vector<uint8_t>{0, 3, 4, 5});

    SECTION("Blank line is not indexed under column 0") {
        auto names = attribute_index<std::string, uint8_t>::build(lines, column_extractor{',', 0});
        REQUIRE(names.has_value());
        REQUIRE(names->size() == 5);
        REQUIRE(names->get("").empty());
        REQUIRE(names->get("Alan") == std::vector<uint8_t>{1});
    }
}
