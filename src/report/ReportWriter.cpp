#include "ReportWriter.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <plog/Log.h>

namespace fs = std::filesystem;

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace report
{

ReportWriter::ReportWriter(std::string input_path, std::string output_dir, std::string timestamp)
    : input_path_(std::move(input_path))
    , output_dir_(std::move(output_dir))
    , timestamp_(std::move(timestamp))
{
}

std::string ReportWriter::pathFor(const std::string& suffix, const std::string& extension) const
{
    const fs::path input(input_path_);
    fs::path dir = output_dir_.empty() ? input.parent_path() : fs::path(output_dir_);
    const std::string name = input.stem().string() + "_" + suffix + "_" + timestamp_ + extension;
    return (dir / name).string();
}

std::string ReportWriter::cleanedWorkbookPath() const
{
    std::string ext = fs::path(input_path_).extension().string();
    if (ext.empty())
        ext = ".xlsx";
    return pathFor("cleaned", ext);
}

bool ReportWriter::prepareOutputDirectory() const
{
    if (output_dir_.empty())
        return true;

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::ReportWrite, "Cannot create output directory " + output_dir_,
                                   ec.message());
        return false;
    }
    return true;
}

bool ReportWriter::writeResultsCsv(const std::vector<ResultRow>& rows) const
{
    std::ostringstream oss;
    const auto& names = ReportBuilder::columnNames();
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i)
            oss << ',';
        oss << escapeCsv(names[i]);
    }
    oss << "\n";

    for (const auto& row : rows)
    {
        const auto fields = ReportBuilder::toFields(row);
        for (std::size_t i = 0; i < fields.size(); ++i)
        {
            if (i)
                oss << ',';
            oss << escapeCsv(fields[i]);
        }
        oss << "\n";
    }

    return writeFile(resultsCsvPath(), oss.str(), "results table");
}

bool ReportWriter::writeFindingsReport(const Report& report) const
{
    std::ostringstream oss;
    oss << "Problematic Character Report for: " << fs::path(input_path_).filename().string() << "\n";
    oss << "Generated on: " << ErrorReporter::GetTimestamp() << "\n\n";
    oss << report.console_text;
    return writeFile(findingsReportPath(), oss.str(), "findings report");
}

bool ReportWriter::writeCleaningLog(const std::vector<cleaning::CleaningLogEntry>& entries) const
{
    return writeFile(cleaningLogPath(), renderCleaningLog(input_path_, entries, ErrorReporter::GetTimestamp()),
                     "cleaning log");
}

std::string ReportWriter::renderCleaningLog(const std::string& input_path,
                                            const std::vector<cleaning::CleaningLogEntry>& entries,
                                            const std::string& created_on)
{
    std::ostringstream oss;
    oss << "Excel Cleaning Log for " << input_path << "\n";
    oss << "Created on " << created_on << "\n\n";
    oss << "Total changes: " << entries.size() << "\n\n";

    std::size_t i = 0;
    for (const auto& entry : entries)
    {
        oss << "Change " << ++i << ":\n";
        oss << "  Sheet: " << entry.sheet << "\n";
        oss << "  Cell: " << entry.cellReference() << "\n";
        oss << "  Character: " << processing::formatCodepointHex(entry.character) << "\n";
        oss << "  Operation: " << cleaning::toString(entry.operation) << "\n";
        if (entry.replacement_text)
            oss << "  Replacement: '" << *entry.replacement_text << "'\n";
        oss << "  Original: " << entry.original_value << "\n";
        oss << "  Cleaned: " << entry.resulting_value << "\n";
        oss << "  Timestamp: " << entry.timestamp << "\n\n";
    }
    return oss.str();
}

std::string ReportWriter::fileTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
#ifdef _WIN32
    std::tm tm_buf;
    localtime_s(&tm_buf, &time_t_now);
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
#else
    ss << std::put_time(std::localtime(&time_t_now), "%Y%m%d_%H%M%S");
#endif
    return ss.str();
}

std::string ReportWriter::escapeCsv(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string out = "\"";
    for (char c : field)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

bool ReportWriter::writeFile(const std::string& path, const std::string& contents, const char* what) const
{
    if (!prepareOutputDirectory())
        return false;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        ErrorReporter::ReportError(ErrorCategory::ReportWrite, std::string("Cannot write ") + what + " to " + path,
                                   "open failed");
        return false;
    }

    out << contents;
    out.close();
    if (out.fail())
    {
        ErrorReporter::ReportError(ErrorCategory::ReportWrite, std::string("Cannot write ") + what + " to " + path,
                                   "write failed");
        std::error_code ec;
        fs::remove(path, ec);
        return false;
    }

    PLOG_INFO << "Wrote " << what << " to " << path;
    return true;
}

} // namespace report
