#pragma once

#include <string>

namespace processing
{

/// UTF-8 to UTF-32 conversion. Stops at the first invalid sequence.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// Strict UTF-8 to UTF-32 conversion. Returns false (and leaves the offset of
/// the first bad byte in bad_offset) if the input is not valid UTF-8.
bool tryUtf8ToUtf32(const std::string& utf8_str, std::u32string& out, std::size_t* bad_offset = nullptr);

/// UTF-32 to UTF-8 conversion. Codepoints that cannot be encoded are dropped.
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Single codepoint to UTF-8 (empty for codepoints that cannot be encoded)
std::string codepointToUtf8(char32_t cp);

/// "0x81", "0xe9", "0x2014": lowercase, at least two hex digits
std::string formatCodepointHex(char32_t cp);

} // namespace processing
