#include "Application.hpp"

#include "../config/ConfigLoader.hpp"
#include "../config/ConfigManager.hpp"
#include "../surveyor/engine/Engine.hpp"
#include "../surveyor/graph/Traversal.hpp"
#include "../surveyor/session/Session.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace
{

void Report(const surveyor::ErrorInfo& err, const std::string& what)
{
    utils::ErrorReporter::ReportEngineError(err, what);
}

constexpr const char* kUsage = "usage: surveyor [-c config.toml] [-d domain]... [-t timeout_seconds] [-v]";

} // namespace

Application::Application(int argc, char** argv)
    : args_(argv + 1, argv + argc)
{
}

Application::~Application()
{
    cleanup();
    utils::LogManager::Shutdown();
}

int Application::run()
{
    if (!initialize())
    {
        reportErrors();
        return 1;
    }

    const bool ok = runEnumeration();
    cleanup();
    reportErrors();
    return ok && utils::ErrorReporter::Tally().fatals == 0 ? 0 : 1;
}

bool Application::initialize()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << kUsage << std::endl;
        return false;
    }

    if (!initializeLogging())
        return false;

    return initializeConfig();
}

bool Application::parseCommandLineArgs()
{
    for (size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        const bool has_value = i + 1 < args_.size();

        if ((arg == "-c" || arg == "--config") && has_value)
        {
            config_path_ = args_[++i];
        }
        else if ((arg == "-d" || arg == "--domain") && has_value)
        {
            extra_domains_.push_back(args_[++i]);
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            verbose_ = true;
        }
        else if ((arg == "-t" || arg == "--timeout") && has_value)
        {
            try
            {
                timeout_ = std::chrono::seconds(std::stol(args_[++i]));
            }
            catch (const std::exception&)
            {
                std::cerr << "invalid timeout: " << args_[i] << std::endl;
                return false;
            }
        }
        else
        {
            std::cerr << "unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

bool Application::initializeLogging()
{
    utils::LogSettings settings = utils::LogManager::ReadSettings(config_path_);
    if (verbose_)
        settings.level = plog::debug;

    if (!utils::LogManager::Initialize(settings))
        return false;

    utils::LogManager::LoggerConfig run_log;
    run_log.name = "main";
    run_log.filename = "surveyor.log";
    run_log.add_console_appender = true;
    return utils::LogManager::RegisterLogger<0>(run_log);
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(config_path_);
    loader_ = std::make_unique<config::ConfigLoader>(*config_);
    if (!loader_->registerTables())
        return false;

    auto loaded = loader_->load();
    if (!extra_domains_.empty())
    {
        auto merged = std::make_shared<surveyor::Config>(*loaded);
        for (const auto& d : extra_domains_)
        {
            const std::string n = surveyor::NormalizeName(d);
            if (!n.empty() && std::find(merged->domains.begin(), merged->domains.end(), n) == merged->domains.end())
                merged->domains.push_back(n);
        }
        loaded = std::move(merged);
    }
    settings_ = std::move(loaded);

    if (settings_->domains.empty() && settings_->addresses.empty() && settings_->cidrs.empty() &&
        settings_->asns.empty())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Nothing to enumerate",
                                          "configure [scope] seeds or pass -d <domain>");
        return false;
    }
    return true;
}

bool Application::runEnumeration()
{
    engine_ = std::make_unique<surveyor::Engine>(*settings_);
    engine_->SetErrorCallback([](const surveyor::ErrorInfo& e) { Report(e, "Engine error"); });
    engine_->Start();

    surveyor::ErrorInfo err;
    auto session = engine_->NewSession(settings_, &err);
    if (!session)
    {
        Report(err, "Failed to create a session");
        return false;
    }

    PLOG_INFO << "Session " << session->ID() << " enumerating " << settings_->domains.size() << " domains";

    if (engine_->StartEnumeration(session, &err) == 0)
    {
        if (err)
            Report(err, "No seed could be dispatched");
        else
            PLOG_WARNING << "No handlers consumed the seeds of session " << session->ID();
    }

    if (!engine_->WaitForQuiescence(session, timeout_))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Session, "Enumeration did not finish in time",
                                            "timeout " + std::to_string(timeout_.count()) + "s");
    }

    const bool written = writeSnapshot(*session);

    if (!engine_->Sessions().CancelSession(session->ID(), &err))
        Report(err, "Session did not shut down cleanly");

    return written;
}

bool Application::writeSnapshot(surveyor::Session& session)
{
    nlohmann::json snapshot;
    snapshot["session"] = session.ID();
    snapshot["stats"] = session.Stats().ToJSON();
    snapshot["errors"] = utils::ErrorReporter::Tally().ToJSON();
    snapshot["scope"] = { { "domains", session.GetScope().Domains() },
                          { "addresses", session.GetScope().Addresses() },
                          { "cidrs", session.GetScope().CIDRs() },
                          { "asns", session.GetScope().ASNs() } };

    nlohmann::json assets = nlohmann::json::array();
    std::vector<std::string> names;
    for (auto type : { surveyor::AssetType::FQDN, surveyor::AssetType::IPAddress, surveyor::AssetType::Netblock,
                       surveyor::AssetType::AutonomousSystem })
    {
        std::vector<surveyor::Entity> found;
        surveyor::ErrorInfo err;
        if (!session.Store().FindEntitiesByType(type, surveyor::kAnyTime, found, &err))
        {
            Report(err, "Failed to read discovered assets");
            return false;
        }
        for (const auto& e : found)
        {
            assets.push_back(e.asset.ToJSON());
            if (type == surveyor::AssetType::FQDN)
                names.push_back(e.asset.CanonicalValue());
        }
    }
    snapshot["assets"] = std::move(assets);

    nlohmann::json infrastructure = nlohmann::json::array();
    for (const auto& entry :
         surveyor::graph::NamesToInfrastructure(session.Store(), session.ASNs(), surveyor::kAnyTime, names))
    {
        nlohmann::json item = { { "name", entry.fqdn }, { "address", entry.addr } };
        if (entry.asn > 0)
        {
            item["asn"] = entry.asn;
            item["netblock"] = entry.netblock;
            item["description"] = entry.description;
        }
        infrastructure.push_back(std::move(item));
    }
    snapshot["infrastructure"] = std::move(infrastructure);

    std::error_code ec;
    std::filesystem::create_directories(settings_->output_dir, ec);
    const auto path = std::filesystem::path(settings_->output_dir) / (session.ID() + ".json");
    std::ofstream ofs(path);
    if (ec || !ofs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to write the session snapshot",
                                          path.string());
        return false;
    }
    ofs << snapshot.dump(2) << '\n';

    std::cout << snapshot["stats"].dump() << std::endl;
    PLOG_INFO << "Snapshot written to " << path.string();
    return true;
}

void Application::reportErrors()
{
    for (const auto& e : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << "[" << utils::ErrorReporter::SeverityToString(e.severity) << "] "
                  << utils::ErrorReporter::CategoryToString(e.category) << ": " << e.summary;
        if (!e.details.empty())
            std::cerr << " (" << e.details << ")";
        std::cerr << std::endl;
    }
}

void Application::cleanup()
{
    if (engine_)
    {
        engine_->Shutdown();
        engine_.reset();
    }
}
