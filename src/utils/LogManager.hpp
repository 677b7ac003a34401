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

// [logging] table of config.toml
struct LogSettings
{
    bool append = true;                  // keep previous log contents
    plog::Severity level = plog::info;   // 0 (none) .. 6 (verbose)
    std::string directory = "logs";
};

/**
 * @brief Owns the plog appenders of the process
 *
 *   [logging]
 *   append = true
 *   level = 4
 *   directory = "logs"
 *
 * ReadSettings() runs before ConfigManager so that configuration problems
 * themselves end up in the log.
 */
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename; // relative to the log directory
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static LogSettings ReadSettings(const std::string& config_path);

    static bool Initialize(const LogSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static const LogSettings& Settings() { return s_settings; }
    static std::string LogFilePath(const std::string& filename);

private:
    LogManager() = default;

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
