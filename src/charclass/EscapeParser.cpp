#include "EscapeParser.hpp"
#include "../processing/TextUtils.hpp"

#include <cctype>

namespace charclass
{

namespace
{

bool readHex(const std::u32string& text, std::size_t start, std::size_t digits, char32_t& value)
{
    if (start + digits > text.size())
        return false;

    value = 0;
    for (std::size_t i = start; i < start + digits; ++i)
    {
        char32_t c = text[i];
        if (c > 0x7F || !std::isxdigit(static_cast<int>(c)))
            return false;
        int nibble = std::isdigit(static_cast<int>(c)) ? static_cast<int>(c - U'0')
                                                       : std::tolower(static_cast<int>(c)) - 'a' + 10;
        value = (value << 4) | static_cast<char32_t>(nibble);
    }
    return true;
}

} // namespace

bool parseTargetSpec(const std::string& spec, TargetSet& out, std::string& outError)
{
    std::u32string text;
    std::size_t bad = 0;
    if (!processing::tryUtf8ToUtf32(spec, text, &bad))
    {
        outError = "Character list is not valid UTF-8 (byte " + std::to_string(bad) + ")";
        return false;
    }

    TargetSet parsed;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] != U'\\')
        {
            parsed.insert(text[i]);
            continue;
        }

        if (i + 1 >= text.size())
        {
            outError = "Trailing backslash in character list";
            return false;
        }

        char32_t kind = text[i + 1];
        char32_t value = 0;
        std::size_t digits = 0;
        switch (kind)
        {
        case U'x':
            digits = 2;
            break;
        case U'u':
            digits = 4;
            break;
        case U'U':
            digits = 8;
            break;
        case U'\\':
            parsed.insert(U'\\');
            ++i;
            continue;
        case U't':
            parsed.insert(U'\t');
            ++i;
            continue;
        case U'n':
            parsed.insert(U'\n');
            ++i;
            continue;
        case U'r':
            parsed.insert(U'\r');
            ++i;
            continue;
        default:
            outError = "Unsupported escape '\\" + processing::codepointToUtf8(kind) + "'";
            return false;
        }

        if (!readHex(text, i + 2, digits, value))
        {
            outError = "Escape '\\" + processing::codepointToUtf8(kind) + "' needs " + std::to_string(digits) +
                       " hex digits";
            return false;
        }
        if (value > 0x10FFFF)
        {
            outError = "Escape value " + processing::formatCodepointHex(value) + " is outside the Unicode range";
            return false;
        }
        parsed.insert(value);
        i += 1 + digits;
    }

    if (parsed.empty())
    {
        outError = "Character list is empty";
        return false;
    }

    out = std::move(parsed);
    return true;
}

} // namespace charclass
