#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

class ConfigManager;

namespace config
{
class ConfigLoader;
}

namespace surveyor
{
class Engine;
class Session;
struct Config;
} // namespace surveyor

/**
 * @brief Command-line entry point: one enumeration from config.toml seeds
 *
 *   surveyor [-c config.toml] [-d example.com]... [-t timeout_seconds] [-v]
 */
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initialize();
    bool initializeLogging();
    bool initializeConfig();
    bool parseCommandLineArgs();

    bool runEnumeration();
    bool writeSnapshot(surveyor::Session& session);
    void reportErrors();
    void cleanup();

    std::vector<std::string> args_;
    std::string config_path_ = "config.toml";
    std::vector<std::string> extra_domains_;
    std::chrono::seconds timeout_{ 3600 };
    bool verbose_ = false;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<config::ConfigLoader> loader_;
    std::shared_ptr<const surveyor::Config> settings_;
    std::unique_ptr<surveyor::Engine> engine_;
};
