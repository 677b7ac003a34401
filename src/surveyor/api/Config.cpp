#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace surveyor {

std::chrono::minutes Config::SourceTTL(const std::string& source) const
{
    auto it = sources.find(source);
    if (it != sources.end() && it->second.ttl_minutes && *it->second.ttl_minutes >= 0)
        return std::chrono::minutes(*it->second.ttl_minutes);
    return std::chrono::minutes(default_ttl_minutes < 0 ? 0 : default_ttl_minutes);
}

std::chrono::minutes Config::TransformationTTL(AssetType from, AssetType to, const std::string& source) const
{
    auto src = sources.find(source);
    if (src != sources.end() && src->second.ttl_minutes && *src->second.ttl_minutes >= 0)
        return std::chrono::minutes(*src->second.ttl_minutes);

    auto it = transformation_ttl_minutes.find(std::string(AssetTypeToString(from)) + "->" + AssetTypeToString(to));
    if (it != transformation_ttl_minutes.end() && it->second >= 0)
        return std::chrono::minutes(it->second);

    return std::chrono::minutes(default_ttl_minutes < 0 ? 0 : default_ttl_minutes);
}

double Config::SourceRate(const std::string& source) const
{
    auto it = sources.find(source);
    if (it == sources.end() || it->second.rate_per_second < 0.0)
        return 0.0;
    return it->second.rate_per_second;
}

bool Config::TransformationAllowed(AssetType from, const std::string& to) const
{
    if (transformations.empty())
        return true;

    const std::string prefix = std::string(AssetTypeToString(from)) + "->";

    auto exact = transformations.find(prefix + to);
    if (exact != transformations.end())
        return exact->second;

    auto all = transformations.find(prefix + "all");
    if (all != transformations.end())
        return all->second;

    bool from_mentioned = std::any_of(transformations.begin(), transformations.end(),
                                      [&](const auto& kv) { return kv.first.rfind(prefix, 0) == 0; });
    return !from_mentioned;
}

std::optional<DatabaseSelection> Config::SelectPrimaryDatabase(ErrorInfo* err) const
{
    if (databases.empty())
        return DatabaseSelection{ "memory", "" };

    for (const auto& db : databases)
    {
        if (!db.primary)
            continue;

        DatabaseSelection sel;
        sel.system = db.system;
        std::transform(sel.system.begin(), sel.system.end(), sel.system.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (sel.system == "postgres")
        {
            sel.dsn = "host=" + db.host + " port=" + db.port + " user=" + db.username + " password=" + db.password +
                      " dbname=" + db.dbname;
        }
        else if (sel.system == "sqlite" || sel.system == "sqlite3")
        {
            sel.system = "sqlite";
            sel.dsn = (std::filesystem::path(output_dir) / "surveyor.sqlite").string();
        }
        else if (sel.system == "memory")
        {
            sel.dsn.clear();
        }
        else
        {
            Fail(err, ErrorKind::Configuration, "unknown database system", db.system);
            return std::nullopt;
        }
        return sel;
    }

    Fail(err, ErrorKind::Configuration, "no primary database specified in the configuration");
    return std::nullopt;
}

} // namespace surveyor
