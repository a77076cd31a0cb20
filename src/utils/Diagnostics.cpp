#include "Diagnostics.hpp"

#include <cstdio>

#include <utf8proc.h>

namespace utils
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

namespace
{

void appendHex(std::string& out, const char* prefix, unsigned value)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02X", value & 0xFFu);
    out += prefix;
    out += buf;
}

} // namespace

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t codepoints) noexcept
{
    if (codepoints == 0)
        codepoints = 1;
    max_preview_.store(codepoints, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(text.size() + 16);

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    std::size_t count = 0;
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        if (count >= limit)
            break;

        utf8proc_int32_t cp = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &cp);
        if (bytes <= 0)
        {
            appendHex(out, "\\?", static_cast<unsigned>(str[pos]));
            ++pos;
            ++count;
            continue;
        }

        switch (cp)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F))
                appendHex(out, "\\x", static_cast<unsigned>(cp));
            else
                out.append(text.data() + pos, static_cast<std::size_t>(bytes));
            break;
        }
        pos += bytes;
        ++count;
    }

    if (pos < len)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    return out;
}

} // namespace utils
