#pragma once

#include "Workbook.hpp"

#include <string>

namespace workbook
{

/// Loads an Office Open XML spreadsheet (.xlsx / .xlsm) into a Workbook.
///
/// Fails (returns false, fills outError) only when the package itself cannot
/// be used: missing file, not a ZIP, no workbook part. A worksheet that cannot
/// be parsed is kept, marked unreadable, and the load still succeeds.
class XlsxReader
{
public:
    static bool open(const std::string& path, Workbook& out, std::string& outError);
};

} // namespace workbook
