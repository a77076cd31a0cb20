#include "Workbook.hpp"

namespace workbook
{

Cell Cell::Text(std::string value)
{
    Cell cell;
    cell.kind = CellKind::Text;
    cell.text = std::move(value);
    return cell;
}

Cell Cell::Number(double value, std::string raw)
{
    Cell cell;
    cell.kind = CellKind::Number;
    cell.number = value;
    cell.text = std::move(raw);
    return cell;
}

Sheet::Sheet(std::string name, std::string part_path)
    : name_(std::move(name))
    , part_path_(std::move(part_path))
{
}

void Sheet::markUnreadable(std::string error)
{
    read_error_ = error.empty() ? std::string("unreadable sheet") : std::move(error);
    cells_.clear();
}

const Cell* Sheet::find(const CellAddress& address) const
{
    auto it = cells_.find(address);
    return it == cells_.end() ? nullptr : &it->second;
}

void Sheet::setCell(const CellAddress& address, Cell cell)
{
    cells_[address] = std::move(cell);
}

bool Sheet::setText(const CellAddress& address, const std::string& value)
{
    auto it = cells_.find(address);
    if (it == cells_.end() || it->second.kind != CellKind::Text)
        return false;
    if (it->second.text == value)
        return false;

    it->second.text = value;
    modified_.insert(address);
    return true;
}

Workbook::Workbook(std::string source_path)
    : source_path_(std::move(source_path))
{
}

Sheet& Workbook::addSheet(std::string name, std::string part_path)
{
    sheets_.emplace_back(std::move(name), std::move(part_path));
    return sheets_.back();
}

Sheet* Workbook::findSheet(const std::string& name)
{
    for (auto& sheet : sheets_)
    {
        if (sheet.name() == name)
            return &sheet;
    }
    return nullptr;
}

const Sheet* Workbook::findSheet(const std::string& name) const
{
    for (const auto& sheet : sheets_)
    {
        if (sheet.name() == name)
            return &sheet;
    }
    return nullptr;
}

std::size_t Workbook::modifiedCellCount() const
{
    std::size_t count = 0;
    for (const auto& sheet : sheets_)
        count += sheet.modifiedCells().size();
    return count;
}

} // namespace workbook
