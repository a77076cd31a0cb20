#include "Finding.hpp"
#include "../charclass/CharacterClassifier.hpp"
#include "../processing/TextUtils.hpp"

#include <algorithm>

namespace scanning
{

std::string Finding::cellReference() const
{
    return workbook::toA1(address());
}

std::string Finding::hexValue() const
{
    return processing::formatCodepointHex(character);
}

std::string Finding::positionList() const
{
    std::string out;
    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += std::to_string(positions[i]);
    }
    return out;
}

FindingContext Finding::context(std::size_t radius) const
{
    FindingContext ctx;
    if (positions.empty())
        return ctx;

    const std::u32string value = processing::utf8ToUtf32(cell_value);
    const std::size_t pos = positions.front();
    if (pos >= value.size())
        return ctx;

    const std::size_t start = pos > radius ? pos - radius : 0;
    const std::size_t end = std::min(value.size(), pos + radius + 1);

    std::u32string window;
    window.reserve(end - start);
    for (std::size_t i = start; i < end; ++i)
    {
        char32_t cp = value[i];
        window.push_back(charclass::CharacterClassifier::isPrintable(cp) ? cp : U'?');
    }

    ctx.line = "..." + processing::utf32ToUtf8(window) + "...";
    ctx.caret = std::string(3 + (pos - start), ' ') + "^";
    return ctx;
}

} // namespace scanning
