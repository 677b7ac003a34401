#pragma once

#include "ConfigManager.hpp"
#include "../surveyor/api/Config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace config
{

/**
 * @brief Maps the tables of config.toml onto surveyor::Config
 *
 * Registers [logging], [engine], [scope], [[database]], [ttl], [sources.*]
 * and [transformations] with a ConfigManager. Each load() produces a fresh
 * immutable snapshot; sessions keep the snapshot they were created with.
 */
class ConfigLoader
{
public:
    explicit ConfigLoader(ConfigManager& manager);

    // false when another owner already claimed one of the tables
    bool registerTables();

    std::shared_ptr<const surveyor::Config> load();

    const std::string& domainsFile() const { return domains_file_; }

private:
    void loadEngine(const toml::table& t);
    void loadScope(const toml::table& t);
    void loadDatabases(const toml::table& root);
    void loadTTL(const toml::table& t);
    void loadSources(const toml::table& t);
    void loadTransformations(const toml::table& t);

    ConfigManager& manager_;
    surveyor::Config cfg_;
    std::string domains_file_;
};

/**
 * @brief Read root domains from a newline-separated file
 *
 * Blank lines and lines starting with '#' are skipped; names are normalised
 * and de-duplicated in file order.
 *
 * @return false when the file cannot be opened
 */
bool ReadDomainsFile(const std::string& path, std::vector<std::string>& out, std::string* error = nullptr);

} // namespace config
