#pragma once

#include "ReportBuilder.hpp"
#include "../cleaning/CleaningTypes.hpp"

#include <string>
#include <vector>

namespace report
{

/**
 * @brief Writes the run's output files next to the input workbook
 *
 * All files of one run share a single timestamp:
 *   <base>_char_scan_results_<YYYYmmdd_HHMMSS>.csv
 *   <base>_findings_report_<ts>.txt
 *   <base>_cleaning_log_<ts>.txt
 *   <base>_cleaned_<ts>.xlsx
 *
 * Write failures are reported under ErrorCategory::ReportWrite and the
 * function returns false; nothing here throws.
 */
class ReportWriter
{
public:
    // Empty output_dir: the input workbook's directory
    explicit ReportWriter(std::string input_path, std::string output_dir = "",
                          std::string timestamp = fileTimestamp());

    const std::string& timestamp() const { return timestamp_; }

    std::string pathFor(const std::string& suffix, const std::string& extension) const;

    std::string resultsCsvPath() const { return pathFor("char_scan_results", ".csv"); }
    std::string findingsReportPath() const { return pathFor("findings_report", ".txt"); }
    std::string cleaningLogPath() const { return pathFor("cleaning_log", ".txt"); }
    std::string cleanedWorkbookPath() const;

    bool writeResultsCsv(const std::vector<ResultRow>& rows) const;
    bool writeFindingsReport(const Report& report) const;
    bool writeCleaningLog(const std::vector<cleaning::CleaningLogEntry>& entries) const;

    // Creates the output directory if needed
    bool prepareOutputDirectory() const;

    /// "20240131_094502"
    static std::string fileTimestamp();

    static std::string escapeCsv(const std::string& field);

    static std::string renderCleaningLog(const std::string& input_path,
                                         const std::vector<cleaning::CleaningLogEntry>& entries,
                                         const std::string& created_on);

private:
    bool writeFile(const std::string& path, const std::string& contents, const char* what) const;

    std::string input_path_;
    std::string output_dir_;
    std::string timestamp_;
};

} // namespace report
