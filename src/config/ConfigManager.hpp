#pragma once

#include <functional>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Parses config.toml and hands each registered section to its loader
 *
 * A section is addressed by a dotted path ("engine", "sources") or the empty
 * path for the document root. Each registration names the keys it owns; an
 * empty list claims the whole section. Keys nobody owns are logged so typos
 * in a run configuration do not go unnoticed.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file keeps defaults; a parse error keeps defaults and reports a warning
    bool load();

    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    struct Registration
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };

    static const toml::table* findSection(const toml::table& root, const std::string& path);
    bool isClaimed(const std::string& sectionPath, const std::string& key) const;
    void warnUnclaimed(const Registration& reg, const toml::table& section) const;
    void dispatch(const toml::table& root) const;

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;
    std::vector<Registration> registrations_;
};
