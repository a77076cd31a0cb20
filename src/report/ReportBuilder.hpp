#pragma once

#include "../scanning/Finding.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace report
{

// One line of the results table; mirrors Finding
struct ResultRow
{
    std::string sheet;
    int row = 0;
    std::string column;
    std::string column_header;
    std::string cell_value;
    std::string problematic_char;
    std::string hex_value;
    std::string char_positions;
    bool is_printable = false;
    std::string char_description;
};

struct Report
{
    std::string console_text;
    std::vector<ResultRow> rows;
};

struct ReportOptions
{
    std::size_t context_radius = 10;
};

class ReportBuilder
{
public:
    static constexpr const char* kNoFindings = "No problematic characters found.";

    explicit ReportBuilder(ReportOptions options = {});

    // Pure: no I/O
    [[nodiscard]] Report build(const std::vector<scanning::Finding>& findings) const;

    // Block for one Finding (without separators), shared with the cleaning prompt
    [[nodiscard]] std::string renderFinding(const scanning::Finding& finding) const;

    [[nodiscard]] static ResultRow toRow(const scanning::Finding& finding);

    static const std::vector<std::string>& columnNames();
    static std::vector<std::string> toFields(const ResultRow& row);

    // Cell text with non-printable codepoints shown as '?'
    static std::string displayText(const std::string& value);

    static std::string separator();

private:
    ReportOptions options_;
};

} // namespace report
