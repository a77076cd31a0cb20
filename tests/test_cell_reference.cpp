#include <catch2/catch_test_macros.hpp>
#include "workbook/CellReference.hpp"

using namespace workbook;

TEST_CASE("CellReference - Column letters", "[workbook]")
{
    REQUIRE(columnLetter(1) == "A");
    REQUIRE(columnLetter(26) == "Z");
    REQUIRE(columnLetter(27) == "AA");
    REQUIRE(columnLetter(702) == "ZZ");
    REQUIRE(columnLetter(16384) == "XFD");
}

TEST_CASE("CellReference - Parsing", "[workbook]")
{
    CellAddress address;

    SECTION("Plain and absolute references")
    {
        REQUIRE(parseCellReference("C4", address));
        REQUIRE(address == CellAddress{ 4, 3 });
        REQUIRE(parseCellReference("$AA$10", address));
        REQUIRE(address == CellAddress{ 10, 27 });
        REQUIRE(toA1(address) == "AA10");
    }

    SECTION("Malformed references")
    {
        REQUIRE_FALSE(parseCellReference("", address));
        REQUIRE_FALSE(parseCellReference("4C", address));
        REQUIRE_FALSE(parseCellReference("C0", address));
        REQUIRE_FALSE(parseCellReference("C4x", address));
        REQUIRE_FALSE(parseCellReference("XFE1", address));
        REQUIRE_FALSE(parseCellReference("A1048577", address));
    }

    SECTION("Row-major ordering")
    {
        REQUIRE(CellAddress{ 1, 5 } < CellAddress{ 2, 1 });
        REQUIRE(CellAddress{ 2, 1 } < CellAddress{ 2, 3 });
    }
}
