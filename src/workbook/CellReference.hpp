#pragma once

#include <compare>
#include <string>
#include <string_view>

namespace workbook
{

// 1-based sheet coordinate. Ordering is row-major.
struct CellAddress
{
    int row = 0;
    int col = 0;

    auto operator<=>(const CellAddress& other) const = default;
};

// 1 -> "A", 26 -> "Z", 27 -> "AA"
std::string columnLetter(int col);

// "C4" -> {4, 3}. Accepts optional '$' anchors; rejects anything else.
bool parseCellReference(std::string_view ref, CellAddress& out);

// {4, 3} -> "C4"
std::string toA1(const CellAddress& address);

} // namespace workbook
