// PRICEFEED - Command Table
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Text commands that drive a PriceFeedEngine: used by pricefeed-cli for
// single commands and for scripts of the form
//
//     <caller> <height> <command> [args...]

#ifndef PRICEFEED_CLI_COMMANDS_H
#define PRICEFEED_CLI_COMMANDS_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/clock.h"
#include "pricefeed/oracle/engine.h"
#include "pricefeed/oracle/errors.h"

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pricefeed {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "PRICEFEED CLI";

// ============================================================================
// Command Result
// ============================================================================

/// Exit status of a command
enum class ExitCode : int {
    Ok = 0,
    Usage = 1,      // Malformed command line or arguments
    Failed = 2      // The engine rejected the operation
};

struct CommandResult {
    ExitCode code{ExitCode::Ok};
    std::string output;     // For stdout
    std::string error;      // For stderr

    bool ok() const { return code == ExitCode::Ok; }

    static CommandResult Ok(std::string output) {
        return {ExitCode::Ok, std::move(output), ""};
    }

    static CommandResult Usage(std::string message) {
        return {ExitCode::Usage, "", "error: " + std::move(message)};
    }

    /// "error <code>: <kind>: <message>"
    static CommandResult Failed(const oracle::Failure& failure);
};

// ============================================================================
// Command Table
// ============================================================================

/// Command categories for help output
namespace Category {
    constexpr const char* ADMIN = "admin";
    constexpr const char* REPORTING = "reporting";
    constexpr const char* QUERY = "query";
    constexpr const char* UTILITY = "utility";
}

/// Caller is set when the command line or script line supplied one
using CommandHandler = std::function<CommandResult(const std::vector<std::string>& args,
                                                   const std::optional<Principal>& caller)>;

struct CommandInfo {
    std::string name;
    std::string category;
    std::string description;
    CommandHandler handler;
    bool requiresCaller{false};
    std::vector<std::string> argNames;
    /// Trailing argNames that may be omitted
    size_t optionalArgs{0};

    /// "submit <asset> <price> <weight>"
    std::string Usage() const;
};

class CommandTable {
public:
    explicit CommandTable(oracle::PriceFeedEngine& engine);

    // Handlers capture this table
    CommandTable(const CommandTable&) = delete;
    CommandTable& operator=(const CommandTable&) = delete;

    void Register(const CommandInfo& command);

    bool HasCommand(const std::string& name) const;
    const CommandInfo* GetCommand(const std::string& name) const;
    std::vector<CommandInfo> GetCommandsByCategory(const std::string& category) const;

    oracle::PriceFeedEngine& GetEngine() const { return engine_; }

    /**
     * Run one command; args[0] is the command name.
     * Argument count and caller presence are checked before the handler runs.
     */
    CommandResult Execute(const std::optional<Principal>& caller,
                          const std::vector<std::string>& args) const;

    /**
     * Run "<caller> <height> <command> [args...]" after moving clock to height.
     * A caller of "-" means none. Blank lines and lines starting with # yield
     * an empty Ok result.
     */
    CommandResult ExecuteScriptLine(const std::string& line, oracle::ManualClock& clock) const;

    /**
     * Run every line of a script, writing results to out and err.
     * Lines the engine rejects are reported and the script continues; a
     * malformed line stops it.
     * @return Usage if stopped, Failed if any line failed, Ok otherwise
     */
    ExitCode RunScript(std::istream& in, oracle::ManualClock& clock,
                       std::ostream& out, std::ostream& err) const;

    /// All commands by category, or the usage of one command
    std::string HelpText(const std::string& command = "") const;

private:
    oracle::PriceFeedEngine& engine_;
    std::map<std::string, CommandInfo> commands_;

    void RegisterAdminCommands();
    void RegisterReportingCommands();
    void RegisterQueryCommands();
    void RegisterUtilityCommands();
};

// ============================================================================
// Argument Parsing
// ============================================================================

/// Base-10 unsigned integer with no sign, whitespace or suffix
bool ParseUInt64(const std::string& str, uint64_t& out);

/// Split on whitespace
std::vector<std::string> SplitWords(const std::string& line);

} // namespace cli
} // namespace pricefeed

#endif // PRICEFEED_CLI_COMMANDS_H
