#pragma once

#include "Workbook.hpp"

#include <string>

namespace workbook
{

/// Writes a Workbook back out as .xlsx.
///
/// The source package (Workbook::sourcePath) is copied entry by entry; only
/// worksheets with modified cells are re-serialized, and in those only the
/// modified cells change (rewritten as inline strings).
class XlsxWriter
{
public:
    static bool save(const Workbook& workbook, const std::string& path, std::string& outError);

    // Rewrites the modified cells of one worksheet XML document
    static bool patchWorksheetXml(const Sheet& sheet, const std::string& xml, std::string& out,
                                  std::string& outError);
};

} // namespace workbook
