#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <map>

namespace utils {

enum class ErrorCategory
{
    Initialization,  // logging, console setup
    Configuration,   // TOML parsing, invalid config
    WorkbookOpen,    // input workbook cannot be opened
    WorkbookRead,    // unreadable sheet or cell, skipped
    WorkbookWrite,   // cleaned workbook cannot be saved
    ReportWrite,     // CSV / text report / cleaning log cannot be written
    InvalidDecision, // cleaning decision violates its contract
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Unit skipped, run continues
    Error,   // Operation failed, but the run can continue
    Fatal    // Whole run aborted
};

struct ErrorReport
{
    ErrorCategory category;
    ErrorSeverity severity;
    std::string user_message;      // Short message naming the file/cell/operation
    std::string technical_details; // Technical details for logs
    std::string timestamp;
    bool is_fatal;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Error reporter shared by all modules
 *
 * Logs every report through plog and keeps a bounded queue that the
 * application drains into its end-of-run summary. Per-category counters
 * survive draining so skipped sheets/cells can be totalled.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::WorkbookRead,
 *                                "Skipping unreadable sheet 'Data'",
 *                                "XML_ERROR_PARSING_ELEMENT");
 *
 *   for (const auto& err : ErrorReporter::GetPendingErrors()) { ... }
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Number of reports seen for a category since the last Reset()
     */
    static std::size_t CountFor(ErrorCategory category);

    /**
     * @brief Clear queue and counters (used between runs and in tests)
     */
    static void Reset();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    /**
     * @brief Current local time as "YYYY-mm-dd HH:MM:SS"
     */
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::map<ErrorCategory, std::size_t> s_counts;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
