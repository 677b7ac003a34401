#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
}

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& reg : registrations_)
    {
        if (reg.path != path)
            continue;

        std::string clash;
        if (reg.ownedKeys.empty() || ownedKeys.empty())
            clash = "path '" + path + "'";
        for (const auto& key : ownedKeys)
        {
            if (clash.empty() && std::find(reg.ownedKeys.begin(), reg.ownedKeys.end(), key) != reg.ownedKeys.end())
                clash = "key '" + key + "' at path '" + path + "'";
        }

        if (!clash.empty())
        {
            last_error_ = "Duplicate ownership: " + clash + " already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    registrations_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::isClaimed(const std::string& sectionPath, const std::string& key) const
{
    const std::string child = sectionPath.empty() ? key : sectionPath + "." + key;
    return std::any_of(registrations_.begin(), registrations_.end(), [&](const Registration& reg) {
        if (reg.path == child || reg.path.rfind(child + ".", 0) == 0)
            return true;
        return reg.path == sectionPath &&
               (reg.ownedKeys.empty() ||
                std::find(reg.ownedKeys.begin(), reg.ownedKeys.end(), key) != reg.ownedKeys.end());
    });
}

void ConfigManager::warnUnclaimed(const Registration& reg, const toml::table& section) const
{
    for (const auto& [key, node] : section)
    {
        const std::string k(key.str());
        if (!isClaimed(reg.path, k))
            PLOG_WARNING << "Unrecognised config key '" << k << "' in ["
                         << (reg.path.empty() ? std::string("root") : reg.path) << "]";
    }
}

void ConfigManager::dispatch(const toml::table& root) const
{
    static const toml::table empty;
    for (const auto& reg : registrations_)
    {
        const toml::table* section = findSection(root, reg.path);
        if (section)
            warnUnclaimed(reg, *section);
        reg.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    file_found_ = static_cast<bool>(ifs);
    if (!file_found_)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        const toml::table root = toml::parse(ifs, config_path_);
        dispatch(root);
        PLOG_INFO << "Configuration loaded from " << config_path_;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string where = config_path_;
        if (pe.source().begin.line > 0)
            where += ":" + std::to_string(pe.source().begin.line);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, running with defaults",
                                            where + ": " + std::string(pe.description()));
        return false;
    }
}

const toml::table* ConfigManager::findSection(const toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Empty segment in config path '" << path << "'";
            return nullptr;
        }

        const toml::node* next = current->get(segment);
        if (!next)
            return nullptr;

        current = next->as_table();
        if (!current)
        {
            PLOG_WARNING << "Config entry '" << segment << "' of '" << path << "' is not a table";
            return nullptr;
        }
    }

    return current;
}
