#pragma once

#include "Finding.hpp"
#include "../charclass/CharacterClassifier.hpp"
#include "../workbook/Workbook.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scanning
{

struct ScanResult
{
    std::vector<Finding> findings;
    std::size_t sheets_scanned = 0;
    std::size_t cells_scanned = 0;  // text cells examined
    std::size_t sheets_skipped = 0; // unreadable sheets
    std::size_t cells_skipped = 0;  // unreadable cells / invalid UTF-8
};

/// Read-only walk over a workbook producing one Finding per distinct
/// problematic character per text cell, in sheet / row-major / first
/// occurrence order.
class CellScanner
{
public:
    explicit CellScanner(const charclass::CharacterClassifier& classifier);

    [[nodiscard]] ScanResult scan(const workbook::Workbook& workbook,
                                  const std::optional<charclass::TargetSet>& targets) const;

    /// Findings for a single text value. Returns false (and fills outError)
    /// if the value is not valid UTF-8.
    bool scanText(const workbook::Sheet& sheet, const workbook::CellAddress& address, const std::string& value,
                  const std::optional<charclass::TargetSet>& targets, std::vector<Finding>& out,
                  std::string& outError) const;

    /// Row-1 value in the given column, rendered as text
    static std::optional<std::string> columnHeader(const workbook::Sheet& sheet, int col);

    /// Codepoint offsets of `character` in a UTF-8 value (empty if absent or invalid)
    static std::vector<std::size_t> positionsOf(const std::string& value, char32_t character);

private:
    const charclass::CharacterClassifier& classifier_;
};

} // namespace scanning
