#pragma once

#include "../model/Asset.hpp"
#include "../util/ErrorContext.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace surveyor {

struct DatabaseConfig
{
    std::string system = "memory"; // memory, sqlite, postgres
    bool primary = false;
    std::string host;
    std::string port;
    std::string username;
    std::string password;
    std::string dbname;
};

struct SourceConfig
{
    std::optional<int> ttl_minutes;
    double rate_per_second = 0.0; // 0 = unlimited
    std::optional<int> confidence;
};

/**
 * @brief Resolved connection parameters of the primary database
 */
struct DatabaseSelection
{
    std::string system; // lower-cased
    std::string dsn;
};

/**
 * @brief Immutable run configuration shared by every component of a session
 */
struct Config
{
    // Scope seeds
    std::vector<std::string> domains;
    std::vector<std::string> addresses;
    std::vector<std::string> cidrs;
    std::vector<int> asns;
    std::vector<int> ports;
    int scope_confidence = 0;

    std::vector<DatabaseConfig> databases;
    std::string output_dir = "surveyor-output";

    int default_ttl_minutes = 1440;
    std::map<std::string, int> transformation_ttl_minutes; // "<From>-><To>" -> minutes
    std::map<std::string, SourceConfig> sources;

    // "<From>-><To>" or "<From>->all" -> enabled
    std::map<std::string, bool> transformations;

    // Engine tuning
    int event_workers = 4;
    int callback_threads = 16;
    std::chrono::milliseconds poll_interval{ 500 };

    /**
     * @brief TTL for a source; the per-source override wins over the default
     */
    std::chrono::minutes SourceTTL(const std::string& source) const;

    /**
     * @brief TTL for results of type `to` produced from `from` by `source`
     *
     * Source override, then the "From->To" entry of [ttl], then the default.
     */
    std::chrono::minutes TransformationTTL(AssetType from, AssetType to, const std::string& source) const;

    double SourceRate(const std::string& source) const;

    /**
     * @brief Whether results of type `to` may be produced from events of type `from`
     *
     * With no transformations configured every pair is permitted. An exact
     * "From->To" entry wins over "From->all"; pairs not mentioned are
     * permitted only when the event type has no entries at all.
     */
    bool TransformationAllowed(AssetType from, const std::string& to) const;

    /**
     * @brief Pick the primary database and build its connection string
     *
     * No databases configured selects the in-memory store. The first entry
     * marked primary wins; configurations with databases but no primary are
     * rejected.
     */
    std::optional<DatabaseSelection> SelectPrimaryDatabase(ErrorInfo* err = nullptr) const;
};

} // namespace surveyor
