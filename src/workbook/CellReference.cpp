#include "CellReference.hpp"

namespace workbook
{

namespace
{
// XFD is the last column Excel allows
constexpr int kMaxColumn = 16384;
constexpr int kMaxRow = 1048576;
} // namespace

std::string columnLetter(int col)
{
    std::string result;
    while (col > 0)
    {
        int remainder = (col - 1) % 26;
        result.insert(result.begin(), static_cast<char>('A' + remainder));
        col = (col - 1) / 26;
    }
    return result;
}

bool parseCellReference(std::string_view ref, CellAddress& out)
{
    std::size_t i = 0;
    if (i < ref.size() && ref[i] == '$')
        ++i;

    int col = 0;
    std::size_t letters = 0;
    while (i < ref.size() && ((ref[i] >= 'A' && ref[i] <= 'Z') || (ref[i] >= 'a' && ref[i] <= 'z')))
    {
        char c = ref[i];
        int v = (c >= 'a') ? (c - 'a' + 1) : (c - 'A' + 1);
        col = col * 26 + v;
        if (col > kMaxColumn)
            return false;
        ++i;
        ++letters;
    }
    if (letters == 0)
        return false;

    if (i < ref.size() && ref[i] == '$')
        ++i;

    int row = 0;
    std::size_t digits = 0;
    while (i < ref.size() && ref[i] >= '0' && ref[i] <= '9')
    {
        row = row * 10 + (ref[i] - '0');
        if (row > kMaxRow)
            return false;
        ++i;
        ++digits;
    }
    if (digits == 0 || row == 0 || i != ref.size())
        return false;

    out.row = row;
    out.col = col;
    return true;
}

std::string toA1(const CellAddress& address)
{
    return columnLetter(address.col) + std::to_string(address.row);
}

} // namespace workbook
