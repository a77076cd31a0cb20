#pragma once

#include "../workbook/CellReference.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scanning
{

// Two-line visualization around one position
struct FindingContext
{
    std::string line;  // "...<window>..."
    std::string caret; // spaces and '^' under the position
};

/// All occurrences of one problematic character within one cell.
/// Immutable snapshot: positions index cell_value as it was at scan time.
struct Finding
{
    std::string sheet_name;
    int row = 0;
    int col = 0;
    std::string column_letter;
    std::optional<std::string> column_header;
    char32_t character = 0;
    bool is_printable = false;
    std::string category;
    std::vector<std::size_t> positions; // codepoint offsets, strictly increasing
    std::string cell_value;             // UTF-8

    workbook::CellAddress address() const { return { row, col }; }
    std::string cellReference() const;   // "C4"
    std::string hexValue() const;        // "0x81"
    std::string positionList() const;    // "3, 15"

    /// Window of `radius` codepoints either side of the first position.
    /// Non-printable codepoints are shown as '?' so the caret lines up.
    FindingContext context(std::size_t radius = 10) const;
};

} // namespace scanning
