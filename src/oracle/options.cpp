// PRICEFEED - Engine Options
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/options.h"

#include <algorithm>
#include <cctype>

namespace pricefeed {
namespace oracle {

namespace {

const std::vector<std::string> LOG_LEVELS = {
    "trace", "debug", "info", "warn", "warning", "error", "fatal", "off", "none"
};

const std::vector<std::string> LOG_CATEGORIES = {
    "default", "oracle", "admin", "db", "config", "cli"
};

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool Contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

/// Positive integer option; records an error for malformed or zero values
uint64_t ReadPositive(const util::ConfigManager& config, const char* key,
                      uint64_t fallback, std::vector<std::string>& errors) {
    if (!config.HasKey(key)) {
        return fallback;
    }
    auto value = config.TryGetUInt(key);
    if (!value || *value == 0) {
        errors.push_back(std::string(key) + " must be a positive integer, got '" +
                         config.GetString(key, "") + "'");
        return fallback;
    }
    return *value;
}

} // namespace

const char* StorageBackendToString(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::LevelDB: return "leveldb";
        case StorageBackend::Memory: return "memory";
        default: return "unknown";
    }
}

bool EngineOptionsFromConfig(const util::ConfigManager& config,
                             EngineOptions& out,
                             std::vector<std::string>& errors) {
    size_t initialErrors = errors.size();
    EngineOptions options;

    options.dataDir = config.GetPath(util::ConfigKeys::DATADIR, config.GetDataDir());

    // Owner
    auto owner = config.TryGetString(util::ConfigKeys::OWNER);
    if (!owner || owner->empty()) {
        errors.push_back("owner is required (40 hex characters)");
    } else if (!ParsePrincipal(*owner, options.owner)) {
        errors.push_back("owner is not a valid principal: '" + *owner + "'");
    }

    // Aggregation parameters
    options.params.minSources = ReadPositive(config, util::ConfigKeys::MINSOURCES,
                                             DEFAULT_MIN_SOURCES, errors);
    options.params.stalenessThreshold = ReadPositive(config,
                                                     util::ConfigKeys::STALENESSTHRESHOLD,
                                                     DEFAULT_STALENESS_THRESHOLD, errors);

    for (const auto& entry : config.GetList(util::ConfigKeys::AUTHORIZE)) {
        Principal source;
        if (!ParsePrincipal(entry, source)) {
            errors.push_back("authorize entry is not a valid principal: '" + entry + "'");
            continue;
        }
        options.initialSources.push_back(source);
    }

    // Storage
    std::string backend = ToLower(config.GetString(util::ConfigKeys::DB, "leveldb"));
    if (backend == "leveldb") {
        options.backend = StorageBackend::LevelDB;
    } else if (backend == "memory") {
        options.backend = StorageBackend::Memory;
    } else {
        errors.push_back("db must be 'leveldb' or 'memory', got '" + backend + "'");
    }
    options.dbCacheMb = ReadPositive(config, util::ConfigKeys::DBCACHE, 8, errors);

    // Logging
    options.logLevel = ToLower(config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    if (!Contains(LOG_LEVELS, options.logLevel)) {
        errors.push_back("unknown loglevel '" + options.logLevel + "'");
    }
    options.logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    options.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);

    // A bare -debug flag means "everything"
    auto debug = config.TryGetBool(util::ConfigKeys::DEBUG);
    if (!debug.has_value()) {
        for (const auto& category : config.GetList(util::ConfigKeys::DEBUG)) {
            std::string lower = ToLower(category);
            if (!Contains(LOG_CATEGORIES, lower)) {
                errors.push_back("unknown debug category '" + category + "'");
                continue;
            }
            options.debugCategories.push_back(lower);
        }
    }

    if (errors.size() != initialErrors) {
        return false;
    }
    out = std::move(options);
    return true;
}

} // namespace oracle
} // namespace pricefeed
