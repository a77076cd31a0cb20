#pragma once

#include "../charclass/CharacterClassifier.hpp"

#include <cstddef>
#include <string>

namespace config
{

struct ScanConfig
{
    // [scan]
    charclass::CodepointRange range;

    // [report]
    std::size_t context_radius = 10;
    bool write_csv = true;
    bool write_text = true;
    std::string output_dir; // empty: next to the input workbook

    // Missing file yields defaults. Parse errors and out-of-range values are
    // reported as Configuration warnings and the affected keys keep their
    // defaults. Returns false only when the file exists but cannot be parsed.
    bool load(const std::string& path);

    const std::string& lastError() const { return last_error_; }

private:
    std::string last_error_;
};

} // namespace config
