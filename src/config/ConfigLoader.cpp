#include "ConfigLoader.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <set>

namespace config
{

namespace
{

std::vector<std::string> stringArray(const toml::table& t, const char* key)
{
    std::vector<std::string> out;
    if (auto arr = t[key].as_array())
    {
        for (const auto& node : *arr)
        {
            if (auto v = node.value<std::string>())
                out.push_back(*v);
            else
                PLOG_WARNING << "Ignoring non-string entry in '" << key << "'";
        }
    }
    return out;
}

// Entries outside [min, max] are dropped, never narrowed
std::vector<int> intArray(const toml::table& t, const char* key, int64_t min, int64_t max)
{
    std::vector<int> out;
    if (auto arr = t[key].as_array())
    {
        for (const auto& node : *arr)
        {
            auto v = node.value<int64_t>();
            if (!v)
                PLOG_WARNING << "Ignoring non-integer entry in '" << key << "'";
            else if (*v < min || *v > max)
                PLOG_WARNING << "Ignoring out-of-range entry in '" << key << "': " << *v;
            else
                out.push_back(static_cast<int>(*v));
        }
    }
    return out;
}

// Port numbers may be written as integers or strings
std::string scalarString(const toml::node_view<const toml::node>& node)
{
    if (auto s = node.value<std::string>())
        return *s;
    if (auto i = node.value<int64_t>())
        return std::to_string(*i);
    return {};
}

} // namespace

ConfigLoader::ConfigLoader(ConfigManager& manager)
    : manager_(manager)
{
}

bool ConfigLoader::registerTables()
{
    bool ok = true;

    // Consumed by utils::LogManager before anything else runs
    ok &= manager_.registerTable("logging", {[](const toml::table&) {}}, {"append", "level", "directory"});

    ok &= manager_.registerTable("engine", {[this](const toml::table& t) { loadEngine(t); }},
                                 {"workers", "callback_threads", "poll_interval_ms", "output_dir"});
    ok &= manager_.registerTable("scope", {[this](const toml::table& t) { loadScope(t); }},
                                 {"domains", "addresses", "cidrs", "asns", "ports", "confidence", "domains_file"});
    ok &= manager_.registerTable("", {[this](const toml::table& t) { loadDatabases(t); }}, {"database"});
    ok &= manager_.registerTable("ttl", {[this](const toml::table& t) { loadTTL(t); }}, {});
    ok &= manager_.registerTable("sources", {[this](const toml::table& t) { loadSources(t); }}, {});
    ok &= manager_.registerTable("transformations", {[this](const toml::table& t) { loadTransformations(t); }}, {});

    if (!ok)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Config table registration failed",
                                          manager_.lastError());
    }
    return ok;
}

std::shared_ptr<const surveyor::Config> ConfigLoader::load()
{
    cfg_ = surveyor::Config{};
    domains_file_.clear();

    // A parse failure is already reported; the run continues on defaults
    if (!manager_.load())
        PLOG_WARNING << "Using default settings: " << manager_.lastError();

    if (!domains_file_.empty())
    {
        std::vector<std::string> names;
        std::string error;
        if (ReadDomainsFile(domains_file_, names, &error))
        {
            for (const auto& n : names)
            {
                if (std::find(cfg_.domains.begin(), cfg_.domains.end(), n) == cfg_.domains.end())
                    cfg_.domains.push_back(n);
            }
            PLOG_INFO << "Loaded " << names.size() << " root domains from " << domains_file_;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Could not read domains file",
                                                error);
        }
    }

    return std::make_shared<const surveyor::Config>(cfg_);
}

void ConfigLoader::loadEngine(const toml::table& t)
{
    if (auto v = t["workers"].value<int64_t>(); v && *v > 0)
        cfg_.event_workers = static_cast<int>(*v);
    if (auto v = t["callback_threads"].value<int64_t>(); v && *v > 0)
        cfg_.callback_threads = static_cast<int>(*v);
    if (auto v = t["poll_interval_ms"].value<int64_t>(); v && *v > 0)
        cfg_.poll_interval = std::chrono::milliseconds(*v);
    if (auto v = t["output_dir"].value<std::string>(); v && !v->empty())
        cfg_.output_dir = *v;
}

void ConfigLoader::loadScope(const toml::table& t)
{
    for (const auto& d : stringArray(t, "domains"))
    {
        const std::string n = surveyor::NormalizeName(d);
        if (!n.empty() && std::find(cfg_.domains.begin(), cfg_.domains.end(), n) == cfg_.domains.end())
            cfg_.domains.push_back(n);
    }
    cfg_.addresses = stringArray(t, "addresses");
    cfg_.cidrs = stringArray(t, "cidrs");
    cfg_.asns = intArray(t, "asns", 1, std::numeric_limits<int>::max());
    cfg_.ports = intArray(t, "ports", 1, 65535);

    if (auto v = t["confidence"].value<int64_t>())
    {
        if (*v >= 0 && *v <= 100)
            cfg_.scope_confidence = static_cast<int>(*v);
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Scope confidence must be between 0 and 100",
                                                "got " + std::to_string(*v));
    }

    if (auto v = t["domains_file"].value<std::string>())
        domains_file_ = *v;
}

void ConfigLoader::loadDatabases(const toml::table& root)
{
    const auto* arr = root["database"].as_array();
    if (!arr)
        return;

    for (const auto& node : *arr)
    {
        const auto* db = node.as_table();
        if (!db)
        {
            PLOG_WARNING << "Ignoring [[database]] entry that is not a table";
            continue;
        }

        surveyor::DatabaseConfig entry;
        entry.system = (*db)["system"].value_or(std::string("memory"));
        entry.primary = (*db)["primary"].value_or(false);
        entry.host = (*db)["host"].value_or(std::string());
        entry.port = scalarString((*db)["port"]);
        entry.username = (*db)["username"].value_or(std::string());
        entry.password = (*db)["password"].value_or(std::string());
        entry.dbname = (*db)["dbname"].value_or(std::string());
        cfg_.databases.push_back(std::move(entry));
    }
}

void ConfigLoader::loadTTL(const toml::table& t)
{
    for (const auto& [key, node] : t)
    {
        const std::string k(key.str());
        auto minutes = node.value<int64_t>();
        if (!minutes || *minutes < 0)
        {
            PLOG_WARNING << "Ignoring invalid TTL '" << k << "'";
            continue;
        }

        if (k == "default_minutes")
            cfg_.default_ttl_minutes = static_cast<int>(*minutes);
        else
            cfg_.transformation_ttl_minutes[k] = static_cast<int>(*minutes);
    }
}

void ConfigLoader::loadSources(const toml::table& t)
{
    for (const auto& [key, node] : t)
    {
        const auto* src = node.as_table();
        if (!src)
            continue;

        surveyor::SourceConfig sc;
        if (auto v = (*src)["ttl_minutes"].value<int64_t>(); v && *v >= 0)
            sc.ttl_minutes = static_cast<int>(*v);
        if (auto v = (*src)["rate_per_second"].value<double>(); v && *v >= 0.0)
            sc.rate_per_second = *v;
        if (auto v = (*src)["confidence"].value<int64_t>(); v && *v >= 0 && *v <= 100)
            sc.confidence = static_cast<int>(*v);
        cfg_.sources[std::string(key.str())] = sc;
    }
}

void ConfigLoader::loadTransformations(const toml::table& t)
{
    for (const auto& [key, node] : t)
    {
        if (auto enabled = node.value<bool>())
            cfg_.transformations[std::string(key.str())] = *enabled;
        else
            PLOG_WARNING << "Ignoring non-boolean transformation '" << key.str() << "'";
    }
}

bool ReadDomainsFile(const std::string& path, std::vector<std::string>& out, std::string* error)
{
    std::ifstream in(path);
    if (!in)
    {
        if (error)
            *error = "cannot open " + path;
        return false;
    }

    std::set<std::string> seen(out.begin(), out.end());
    std::string line;
    while (std::getline(in, line))
    {
        const std::string name = surveyor::NormalizeName(line);
        if (name.empty() || name[0] == '#')
            continue;
        if (seen.insert(name).second)
            out.push_back(name);
    }
    return true;
}

} // namespace config
