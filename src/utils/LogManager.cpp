#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogSettings LogManager::ReadSettings(const std::string& config_path)
{
    LogSettings settings;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return settings;

    try
    {
        const auto doc = toml::parse_file(config_path);
        const toml::table* logging = doc["logging"].as_table();
        if (!logging)
            return settings;

        settings.append = (*logging)["append"].value_or(settings.append);

        const auto level = (*logging)["level"].value<int64_t>();
        if (level && *level >= plog::none && *level <= plog::verbose)
            settings.level = static_cast<plog::Severity>(*level);

        const auto dir = (*logging)["directory"].value<std::string>();
        if (dir && !dir->empty())
            settings.directory = *dir;
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the same error in full once logging is up
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
    }
    return settings;
}

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;

    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   s_settings.directory + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }

    const std::string path = LogFilePath(config.filename);
    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, config.backup_count);
        plog::init<InstanceId>(config.level_override.value_or(s_settings.level), file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            plog::get<InstanceId>()->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + config.name,
                                   path + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

std::string LogManager::LogFilePath(const std::string& filename)
{
    return (std::filesystem::path(s_settings.directory) / filename).string();
}

} // namespace utils
