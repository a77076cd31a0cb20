#include "ScanConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <fstream>

#include <plog/Log.h>
#include <toml++/toml.h>

namespace config
{

namespace
{

constexpr std::int64_t kMaxCodepoint = 0x10FFFF;

void warnInvalid(const std::string& key, const std::string& details, const std::string& path)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignoring invalid value for " + key + ", using default",
                                        details + "\nFile: " + path);
}

} // namespace

bool ScanConfig::load(const std::string& path)
{
    last_error_.clear();
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No configuration at " << path << ", using defaults";
        return true;
    }

    toml::table root;
    try
    {
        root = toml::parse(ifs, path);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                            std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + path);
        return false;
    }

    if (auto scan = root["scan"].as_table())
    {
        auto start = (*scan)["range_start"].value<std::int64_t>();
        auto end = (*scan)["range_end"].value<std::int64_t>();
        const std::int64_t first = start.value_or(static_cast<std::int64_t>(range.first));
        const std::int64_t last = end.value_or(static_cast<std::int64_t>(range.last));
        if (first < 0 || last > kMaxCodepoint || first > last)
        {
            warnInvalid("[scan] range_start/range_end",
                        "Range must satisfy 0 <= range_start <= range_end <= 0x10FFFF", path);
        }
        else
        {
            range.first = static_cast<char32_t>(first);
            range.last = static_cast<char32_t>(last);
        }
    }

    if (auto report = root["report"].as_table())
    {
        if (auto radius = (*report)["context_radius"].value<std::int64_t>())
        {
            if (*radius < 0)
                warnInvalid("[report] context_radius", "Must not be negative", path);
            else
                context_radius = static_cast<std::size_t>(*radius);
        }
        if (auto csv = (*report)["write_csv"].value<bool>())
            write_csv = *csv;
        if (auto text = (*report)["write_text"].value<bool>())
            write_text = *text;
        if (auto dir = (*report)["output_dir"].value<std::string>())
            output_dir = *dir;
    }

    PLOG_INFO << "Loaded configuration from " << path;
    return true;
}

} // namespace config
