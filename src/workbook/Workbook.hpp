#pragma once

#include "CellReference.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace workbook
{

enum class CellKind
{
    Empty,
    Text,
    Number,
    Boolean,
    Formula,    // any cell carrying <f>; its cached value is not editable text
    ErrorValue, // #DIV/0!, #N/A, ...
    Unreadable  // cell present but its value could not be decoded
};

struct Cell
{
    CellKind kind = CellKind::Empty;
    std::string text;       // Text value, or the raw value for non-text kinds
    double number = 0.0;
    std::string read_error; // set for Unreadable

    static Cell Text(std::string value);
    static Cell Number(double value, std::string raw = "");
};

class Sheet
{
public:
    explicit Sheet(std::string name, std::string part_path = "");

    const std::string& name() const { return name_; }

    // Package part holding the worksheet XML, e.g. "xl/worksheets/sheet1.xml"
    const std::string& partPath() const { return part_path_; }

    bool isReadable() const { return read_error_.empty(); }
    const std::string& readError() const { return read_error_; }
    void markUnreadable(std::string error);

    const std::map<CellAddress, Cell>& cells() const { return cells_; }
    const Cell* find(const CellAddress& address) const;

    void setCell(const CellAddress& address, Cell cell);

    // Replaces the value of an existing Text cell. Returns true when the
    // value actually changed; the address is then recorded as modified.
    bool setText(const CellAddress& address, const std::string& value);

    const std::set<CellAddress>& modifiedCells() const { return modified_; }
    bool isModified() const { return !modified_.empty(); }

private:
    std::string name_;
    std::string part_path_;
    std::string read_error_;
    std::map<CellAddress, Cell> cells_;
    std::set<CellAddress> modified_;
};

/// Ordered set of named sheets, exclusively owned by one run.
class Workbook
{
public:
    Workbook() = default;
    explicit Workbook(std::string source_path);

    const std::string& sourcePath() const { return source_path_; }

    Sheet& addSheet(std::string name, std::string part_path = "");

    std::vector<Sheet>& sheets() { return sheets_; }
    const std::vector<Sheet>& sheets() const { return sheets_; }

    Sheet* findSheet(const std::string& name);
    const Sheet* findSheet(const std::string& name) const;

    std::size_t modifiedCellCount() const;

private:
    std::string source_path_;
    std::vector<Sheet> sheets_;
};

} // namespace workbook
