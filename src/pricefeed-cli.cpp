// PRICEFEED CLI - Command Line Interface
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// The pricefeed-cli tool opens the engine state in the data directory, runs
// one command (or a script of commands) against it and exits.

#include "pricefeed/cli/commands.h"
#include "pricefeed/db/database.h"
#include "pricefeed/oracle/engine.h"
#include "pricefeed/oracle/options.h"
#include "pricefeed/oracle/state_store.h"
#include "pricefeed/util/config.h"
#include "pricefeed/util/logging.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pricefeed {
namespace cli {

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: pricefeed-cli [options] <command> [args...]\n";
    std::cout << "       pricefeed-cli [options] -script=<file>\n";
    std::cout << "       pricefeed-cli [options] -stdin\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                   Show this help message\n";
    std::cout << "  -version                Show version information\n";
    std::cout << "  -datadir=<dir>          Data directory (default: ~/.pricefeed)\n";
    std::cout << "  -conf=<file>            Configuration file (default: <datadir>/pricefeed.conf)\n";
    std::cout << "  -owner=<hex>            Owner principal (required)\n";
    std::cout << "  -caller=<hex>           Caller principal for admin and submit commands\n";
    std::cout << "  -height=<n>             Current block height (default: highest stored height;\n";
    std::cout << "                          required for submit, getprice, isfresh and convert)\n";
    std::cout << "  -db=<leveldb|memory>    State storage backend (default: leveldb)\n";
    std::cout << "  -script=<file>          Run '<caller> <height> <command> [args]' lines\n";
    std::cout << "  -stdin                  Read script lines from standard input\n";
    std::cout << "  -loglevel=<level>       trace, debug, info, warn, error, off (default: info)\n";
    std::cout << "  -debug=<categories>     Log only these categories\n";
    std::cout << "  -genconf                Print a sample configuration file\n";
    std::cout << "\nAdministration (require -caller):\n";
    std::cout << "  authorize <source>                   Allow a source to submit quotes\n";
    std::cout << "  deauthorize <source>                 Revoke a source, keeping its quotes\n";
    std::cout << "  setminsources <n>                    Minimum fresh quotes per aggregate\n";
    std::cout << "  setstaleness <blocks>                Staleness threshold in blocks\n";
    std::cout << "  pause <asset> <source>               Deactivate one quote\n";
    std::cout << "\nReporting (requires -caller):\n";
    std::cout << "  submit <asset> <price> <weight>      Submit a quote at the current height\n";
    std::cout << "\nQueries:\n";
    std::cout << "  getprice <asset>                     Fresh aggregate price\n";
    std::cout << "  getpricedata <asset>                 Stored aggregate regardless of age\n";
    std::cout << "  getquote <asset> <source>            One source's quote\n";
    std::cout << "  isfresh <asset>                      Whether the aggregate is fresh\n";
    std::cout << "  convert <from> <to> <amount>         Cross-asset conversion\n";
    std::cout << "  sources                              Authorized sources\n";
    std::cout << "  assets                               Assets with quotes\n";
    std::cout << "  height                               Current block height\n";
    std::cout << "  help [command]                       Command usage\n";
    std::cout << "  version                              Client version\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const oracle::EngineOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();

    // Drop the default sink; stdout is reserved for command output
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(options.logLevel);
    logger.SetLevel(level);

    if (options.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useColors = true;
        consoleConfig.stderrOnly = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!options.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = options.logFile;
        fileConfig.level = util::LogLevel::Debug;  // Always log debug to file
        fileConfig.rotate = true;
        logger.AddSink(std::make_shared<util::FileSink>(fileConfig));
    }

    for (const auto& category : options.debugCategories) {
        logger.EnableCategory(category);
    }
}

std::unique_ptr<db::Database> OpenStateDatabase(const oracle::EngineOptions& options) {
    if (options.backend == oracle::StorageBackend::Memory) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory state; nothing will be saved";
        return db::NewMemoryDatabase();
    }

    db::Options dbOptions;
    dbOptions.create_if_missing = true;
    dbOptions.block_cache_size = options.dbCacheMb * 1024 * 1024;

    auto [status, database] = db::OpenDatabase(options.StatePath(), dbOptions);
    if (!status.ok()) {
        std::cerr << "error: could not open state database " << options.StatePath().string()
                  << ": " << status.ToString() << "\n";
        return nullptr;
    }
    return std::move(database);
}

/// Commands whose result depends on the current height
bool NeedsExplicitHeight(const std::vector<std::string>& positional) {
    static const std::vector<std::string> commands = {"submit", "getprice", "isfresh", "convert"};
    return !positional.empty() &&
           std::find(commands.begin(), commands.end(), positional[0]) != commands.end();
}

int ToExitStatus(ExitCode code) {
    return static_cast<int>(code);
}

int PrintResult(const CommandResult& result) {
    if (!result.output.empty()) {
        std::cout << result.output << "\n";
    }
    if (!result.error.empty()) {
        std::cerr << result.error << "\n";
    }
    return ToExitStatus(result.code);
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    auto parseResult = util::InitConfig(argc, argv);
    if (!parseResult.success) {
        std::cerr << "Error: " << parseResult.errorMessage;
        if (!parseResult.errorFile.empty()) {
            std::cerr << " (" << parseResult.errorFile;
            if (parseResult.errorLine > 0) {
                std::cerr << ":" << parseResult.errorLine;
            }
            std::cerr << ")";
        }
        std::cerr << "\nUse 'pricefeed-cli -help' for usage information.\n";
        return 1;
    }

    const util::ConfigManager& config = util::GetConfig();
    const auto& positional = config.GetPositional();

    // Handle special flags
    bool scriptMode = config.HasKey(util::ConfigKeys::SCRIPT) ||
                      config.GetBool(util::ConfigKeys::STDIN, false);
    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }

    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    if (config.GetBool("genconf", false)) {
        std::cout << config.GenerateSampleConfig();
        return 0;
    }

    if (positional.empty() && !scriptMode) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'pricefeed-cli -help' for usage information.\n";
        return 1;
    }

    // Handle local commands without opening the state
    if (!scriptMode && positional.size() == 1) {
        if (positional[0] == "help") {
            PrintHelp();
            return 0;
        }
        if (positional[0] == "version") {
            PrintVersion();
            return 0;
        }
    }

    oracle::EngineOptions options;
    std::vector<std::string> errors;
    if (!oracle::EngineOptionsFromConfig(config, options, errors)) {
        for (const auto& error : errors) {
            std::cerr << "error: " << error << "\n";
        }
        return 1;
    }

    SetupLogging(options);
    for (const auto& warning : parseResult.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    std::optional<Principal> caller;
    if (auto callerHex = config.TryGetString(util::ConfigKeys::CALLER)) {
        Principal principal;
        if (!ParsePrincipal(*callerHex, principal)) {
            std::cerr << "error: invalid -caller '" << *callerHex << "'\n";
            return 1;
        }
        caller = principal;
    }

    std::optional<Height> height;
    if (config.HasKey(util::ConfigKeys::HEIGHT)) {
        auto heightArg = config.GetString(util::ConfigKeys::HEIGHT, "");
        Height parsed = 0;
        if (!ParseUInt64(heightArg, parsed)) {
            std::cerr << "error: invalid -height '" << heightArg << "'\n";
            return 1;
        }
        height = parsed;
    } else if (!scriptMode && NeedsExplicitHeight(positional)) {
        std::cerr << "error: " << positional[0] << " requires -height\n";
        return 1;
    }

    auto database = OpenStateDatabase(options);
    if (!database) {
        return 1;
    }
    oracle::StateStore store(*database);

    if (!height) {
        Height stored = 0;
        db::Status heightStatus = store.StoredHeight(stored);
        if (!heightStatus.ok() && !heightStatus.IsNotFound()) {
            std::cerr << "error: could not read stored height: " << heightStatus.ToString() << "\n";
            return 1;
        }
        height = stored;
    }

    oracle::ManualClock clock(*height);
    oracle::PriceFeedEngine engine(options.owner, clock, options.params);

    bool restored = false;
    db::Status status = engine.AttachStore(store, &restored);
    if (status.IsInvalidArgument()) {
        std::cerr << "error: -height " << *height << " rejected: " << status.message() << "\n";
        return 1;
    }
    if (!status.ok()) {
        std::cerr << "error: could not load engine state: " << status.ToString() << "\n";
        return 1;
    }

    if (!restored) {
        for (const auto& source : options.initialSources) {
            auto result = engine.AuthorizeSource(options.owner, source);
            if (!result) {
                std::cerr << CommandResult::Failed(result.failure()).error << "\n";
                return ToExitStatus(ExitCode::Failed);
            }
        }
        LOG_INFO(util::LogCategory::CLI) << "Initialized new state with "
            << options.initialSources.size() << " authorized source(s)";
    }

    CommandTable table(engine);

    // Script mode
    if (scriptMode) {
        ExitCode code;
        if (config.GetBool(util::ConfigKeys::STDIN, false)) {
            code = table.RunScript(std::cin, clock, std::cout, std::cerr);
        } else {
            std::string scriptPath = config.GetPath(util::ConfigKeys::SCRIPT, "");
            std::ifstream script(scriptPath);
            if (!script.is_open()) {
                std::cerr << "error: cannot open script " << scriptPath << "\n";
                return 1;
            }
            code = table.RunScript(script, clock, std::cout, std::cerr);
        }

        // Script lines may have moved the clock past the last write
        db::Status heightStatus = engine.PersistHeight();
        if (!heightStatus.ok()) {
            std::cerr << "error: could not record height: " << heightStatus.ToString() << "\n";
            return ToExitStatus(ExitCode::Failed);
        }
        return ToExitStatus(code);
    }

    return PrintResult(table.Execute(caller, positional));
}

} // namespace cli
} // namespace pricefeed

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return pricefeed::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
