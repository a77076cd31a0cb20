#include "ReportBuilder.hpp"
#include "../charclass/CharacterClassifier.hpp"
#include "../processing/TextUtils.hpp"

#include <sstream>

namespace report
{

ReportBuilder::ReportBuilder(ReportOptions options)
    : options_(options)
{
}

Report ReportBuilder::build(const std::vector<scanning::Finding>& findings) const
{
    Report report;
    if (findings.empty())
    {
        report.console_text = std::string(kNoFindings) + "\n";
        return report;
    }

    std::ostringstream oss;
    oss << "Found " << findings.size() << " instances of problematic characters:\n";
    oss << separator() << "\n";
    for (const auto& finding : findings)
    {
        oss << renderFinding(finding);
        oss << separator() << "\n";
        report.rows.push_back(toRow(finding));
    }
    report.console_text = oss.str();
    return report;
}

std::string ReportBuilder::renderFinding(const scanning::Finding& finding) const
{
    std::ostringstream oss;
    oss << "Sheet: " << finding.sheet_name << "\n";
    oss << "Location: Cell " << finding.cellReference();
    if (finding.column_header)
        oss << " (Column Header: " << displayText(*finding.column_header) << ")";
    oss << "\n";
    oss << "Problematic Character: " << finding.hexValue() << "\n";
    if (finding.is_printable)
        oss << "Character: '" << processing::codepointToUtf8(finding.character) << "' - " << finding.category << "\n";
    else
        oss << "Character: " << finding.category << "\n";
    oss << "Character Position(s) in Cell: " << finding.positionList() << "\n";
    oss << "Cell Value: " << displayText(finding.cell_value) << "\n";

    const auto ctx = finding.context(options_.context_radius);
    if (!ctx.line.empty())
    {
        oss << "Context: " << ctx.line << "\n";
        oss << "         " << ctx.caret << "\n";
    }
    return oss.str();
}

ResultRow ReportBuilder::toRow(const scanning::Finding& finding)
{
    ResultRow row;
    row.sheet = finding.sheet_name;
    row.row = finding.row;
    row.column = finding.column_letter;
    row.column_header = finding.column_header.value_or("");
    row.cell_value = finding.cell_value;
    row.problematic_char = processing::codepointToUtf8(finding.character);
    row.hex_value = finding.hexValue();
    row.char_positions = finding.positionList();
    row.is_printable = finding.is_printable;
    row.char_description = finding.category;
    return row;
}

const std::vector<std::string>& ReportBuilder::columnNames()
{
    static const std::vector<std::string> names = { "sheet",          "row",       "column",
                                                    "column_header",  "cell_value", "problematic_char",
                                                    "hex_value",      "char_positions", "is_printable",
                                                    "char_description" };
    return names;
}

std::vector<std::string> ReportBuilder::toFields(const ResultRow& row)
{
    return { row.sheet,
             std::to_string(row.row),
             row.column,
             row.column_header,
             row.cell_value,
             row.problematic_char,
             row.hex_value,
             row.char_positions,
             row.is_printable ? "True" : "False",
             row.char_description };
}

std::string ReportBuilder::displayText(const std::string& value)
{
    std::u32string text = processing::utf8ToUtf32(value);
    for (auto& cp : text)
    {
        if (!charclass::CharacterClassifier::isPrintable(cp) && cp != U'\t')
            cp = U'?';
    }
    return processing::utf32ToUtf8(text);
}

std::string ReportBuilder::separator()
{
    return std::string(80, '-');
}

} // namespace report
