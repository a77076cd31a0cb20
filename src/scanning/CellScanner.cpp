#include "CellScanner.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <unordered_map>

#include <plog/Log.h>

namespace scanning
{

CellScanner::CellScanner(const charclass::CharacterClassifier& classifier)
    : classifier_(classifier)
{
}

ScanResult CellScanner::scan(const workbook::Workbook& workbook,
                             const std::optional<charclass::TargetSet>& targets) const
{
    ScanResult result;

    for (const auto& sheet : workbook.sheets())
    {
        if (!sheet.isReadable())
        {
            ++result.sheets_skipped;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::WorkbookRead,
                                                "Skipping unreadable sheet '" + sheet.name() + "'",
                                                sheet.readError());
            continue;
        }

        PLOG_INFO << "Scanning sheet: " << sheet.name();
        ++result.sheets_scanned;
        const std::size_t before = result.findings.size();

        for (const auto& [address, cell] : sheet.cells())
        {
            if (cell.kind == workbook::CellKind::Unreadable)
            {
                ++result.cells_skipped;
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::WorkbookRead,
                                                    "Skipping unreadable cell " + sheet.name() + "!" +
                                                        workbook::toA1(address),
                                                    cell.read_error);
                continue;
            }
            if (cell.kind != workbook::CellKind::Text)
                continue;

            std::string error;
            if (!scanText(sheet, address, cell.text, targets, result.findings, error))
            {
                ++result.cells_skipped;
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::WorkbookRead,
                                                    "Skipping unreadable cell " + sheet.name() + "!" +
                                                        workbook::toA1(address),
                                                    error);
                continue;
            }
            ++result.cells_scanned;
        }

        PLOG_INFO << "Sheet '" << sheet.name() << "': " << (result.findings.size() - before) << " findings";
    }

    return result;
}

bool CellScanner::scanText(const workbook::Sheet& sheet, const workbook::CellAddress& address,
                           const std::string& value, const std::optional<charclass::TargetSet>& targets,
                           std::vector<Finding>& out, std::string& outError) const
{
    std::u32string text;
    std::size_t bad_offset = 0;
    if (!processing::tryUtf8ToUtf32(value, text, &bad_offset))
    {
        outError = "invalid UTF-8 at byte " + std::to_string(bad_offset);
        return false;
    }

    // character -> index into `order`, so distinct characters keep first-occurrence order
    std::unordered_map<char32_t, std::size_t> index;
    std::vector<std::pair<char32_t, std::vector<std::size_t>>> order;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char32_t cp = text[i];
        if (!classifier_.isProblematic(cp, targets))
            continue;

        auto [it, inserted] = index.try_emplace(cp, order.size());
        if (inserted)
            order.emplace_back(cp, std::vector<std::size_t>{});
        order[it->second].second.push_back(i);
    }

    if (order.empty())
        return true;

    // Row 1 is the header row itself
    const auto header = address.row > 1 ? columnHeader(sheet, address.col) : std::nullopt;
    for (auto& [cp, positions] : order)
    {
        const auto classification = classifier_.classify(cp, targets);

        Finding finding;
        finding.sheet_name = sheet.name();
        finding.row = address.row;
        finding.col = address.col;
        finding.column_letter = workbook::columnLetter(address.col);
        finding.column_header = header;
        finding.character = cp;
        finding.is_printable = classification.is_printable;
        finding.category = classification.category;
        finding.positions = std::move(positions);
        finding.cell_value = value;

        if (utils::Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[CellScanner] " << sheet.name() << "!" << finding.cellReference() << " char=" << finding.hexValue()
                << " positions=[" << finding.positionList() << "] value=" << utils::Diagnostics::Preview(value);
        }
        out.push_back(std::move(finding));
    }
    return true;
}

std::optional<std::string> CellScanner::columnHeader(const workbook::Sheet& sheet, int col)
{
    const workbook::Cell* header = sheet.find({ 1, col });
    if (!header)
        return std::nullopt;

    switch (header->kind)
    {
    case workbook::CellKind::Text:
    case workbook::CellKind::Number:
    case workbook::CellKind::Boolean:
        if (header->text.empty())
            return std::nullopt;
        return header->text;
    default:
        return std::nullopt;
    }
}

std::vector<std::size_t> CellScanner::positionsOf(const std::string& value, char32_t character)
{
    std::vector<std::size_t> positions;
    std::u32string text;
    if (!processing::tryUtf8ToUtf32(value, text))
        return positions;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == character)
            positions.push_back(i);
    }
    return positions;
}

} // namespace scanning
