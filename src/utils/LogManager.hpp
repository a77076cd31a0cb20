#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    // [logging] table of config.toml
    struct LogSettings
    {
        bool append = true;
        plog::Severity level = plog::info;
        std::string directory = "logs";
        std::size_t preview_length = 160; // codepoints of cell text per trace line
    };

    struct LoggerConfig
    {
        std::string name;
        std::string file_name; // inside LogSettings::directory
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Reads [logging] (missing file = defaults) and creates the log directory
    static bool Initialize(const std::string& config_path = "config.toml");

    // Application log (instance 0) plus the per-cell trace log
    static bool RegisterRunLoggers(bool console);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static const LogSettings& Settings();
    static std::string LogPath(const std::string& file_name);

    // Out-of-range values keep their defaults; a malformed file yields all
    // defaults and an Initialization warning.
    static LogSettings ReadSettings(const std::string& config_path);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
