#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Diagnostics.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    s_settings = ReadSettings(config_path);
    Diagnostics::SetMaxPreview(s_settings.preview_length);

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

bool LogManager::RegisterRunLoggers(bool console)
{
    const bool main_ok = RegisterLogger<0>({ .name = "main",
                                             .file_name = "charscan.log",
                                             .append_override = std::nullopt,
                                             .level_override = std::nullopt,
                                             .max_file_size = 10 * 1024 * 1024,
                                             .backup_count = 3,
                                             .add_console_appender = console });

    // Trace lines are only emitted while Diagnostics is verbose
    const bool trace_ok = RegisterLogger<Diagnostics::kLogInstance>({ .name = "trace",
                                                                      .file_name = "trace.log",
                                                                      .append_override = false,
                                                                      .level_override = plog::verbose,
                                                                      .max_file_size = 10 * 1024 * 1024,
                                                                      .backup_count = 1,
                                                                      .add_console_appender = false });
    if (!trace_ok)
        PLOG_WARNING << "Per-cell trace log unavailable";

    PLOG_INFO << "charscan logging to " << LogPath("charscan.log") << " (level "
              << plog::severityToString(s_settings.level) << ")";
    return main_ok;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    const std::string path = LogPath(config.file_name);
    try
    {
        if (!config.append_override.value_or(s_settings.append))
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::init<InstanceId>(config.level_override.value_or(s_settings.level), file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + path, ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const LogManager::LogSettings& LogManager::Settings() { return s_settings; }

std::string LogManager::LogPath(const std::string& file_name)
{
    return (fs::path(s_settings.directory) / file_name).string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    fs::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization,
                                     "Unable to prepare log directory " + s_settings.directory, ec.message());
        return false;
    }
    return true;
}

LogManager::LogSettings LogManager::ReadSettings(const std::string& config_path)
{
    LogSettings settings;
    std::error_code ec;
    if (!fs::exists(config_path, ec))
        return settings;

    toml::table cfg;
    try
    {
        cfg = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& pe)
    {
        // ScanConfig reports the parse details as a Configuration warning
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Logging settings ignored",
                                     std::string(pe.description()));
        return settings;
    }

    auto logging = cfg["logging"].as_table();
    if (!logging)
        return settings;

    if (auto append = (*logging)["append_logs"].value<bool>())
        settings.append = *append;
    if (auto level = (*logging)["level"].value<std::int64_t>())
    {
        if (*level >= plog::none && *level <= plog::verbose)
            settings.level = static_cast<plog::Severity>(*level);
    }
    if (auto dir = (*logging)["directory"].value<std::string>(); dir && !dir->empty())
        settings.directory = *dir;
    if (auto preview = (*logging)["preview_length"].value<std::int64_t>(); preview && *preview > 0)
        settings.preview_length = static_cast<std::size_t>(*preview);

    return settings;
}

} // namespace utils
