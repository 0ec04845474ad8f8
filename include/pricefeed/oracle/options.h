// PRICEFEED - Engine Options
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Startup settings for an engine instance, read from the configuration.

#ifndef PRICEFEED_ORACLE_OPTIONS_H
#define PRICEFEED_ORACLE_OPTIONS_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/aggregator.h"
#include "pricefeed/util/config.h"

#include <filesystem>
#include <string>
#include <vector>

namespace pricefeed {
namespace oracle {

/// Where engine state is kept
enum class StorageBackend {
    LevelDB,
    Memory
};

const char* StorageBackendToString(StorageBackend backend);

struct EngineOptions {
    /// Data directory holding the state database
    std::string dataDir;

    Principal owner;

    /// Initial parameters; stored parameters take precedence once state exists
    AggregationParams params;

    /// Sources authorized when the state is first created
    std::vector<Principal> initialSources;

    StorageBackend backend{StorageBackend::LevelDB};

    /// LevelDB block cache in MB
    size_t dbCacheMb{8};

    std::string logLevel{"info"};
    std::string logFile;
    bool printToConsole{true};

    /// Enabled log categories; empty enables all
    std::vector<std::string> debugCategories;

    /// Directory of the LevelDB state database
    std::filesystem::path StatePath() const {
        return std::filesystem::path(dataDir) / "state";
    }
};

/**
 * Read and validate engine options.
 *
 * Every problem found is appended to errors; returns true when there are none.
 */
bool EngineOptionsFromConfig(const util::ConfigManager& config,
                             EngineOptions& out,
                             std::vector<std::string>& errors);

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_OPTIONS_H
