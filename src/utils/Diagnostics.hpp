#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace utils
{

class Diagnostics
{
public:
    // plog instance used for per-cell trace output (logs/trace.log)
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t codepoints) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line rendering of cell text for logs. Control codepoints
    // (C0, DEL, C1) are shown as \xHH, invalid UTF-8 bytes as \?HH.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
