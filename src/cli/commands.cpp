// PRICEFEED - Command Table
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/cli/commands.h"
#include "pricefeed/util/logging.h"

#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>

namespace pricefeed {
namespace cli {

// ============================================================================
// Helpers
// ============================================================================

bool ParseUInt64(const std::string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

std::vector<std::string> SplitWords(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream ss(line);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

CommandResult CommandResult::Failed(const oracle::Failure& failure) {
    std::ostringstream ss;
    ss << "error " << oracle::OracleErrorCode(failure.kind) << ": "
       << oracle::OracleErrorToString(failure.kind);
    if (!failure.message.empty()) {
        ss << ": " << failure.message;
    }
    return {ExitCode::Failed, "", ss.str()};
}

std::string CommandInfo::Usage() const {
    std::string usage = name;
    for (size_t i = 0; i < argNames.size(); ++i) {
        bool optional = i >= argNames.size() - optionalArgs;
        usage += optional ? " [" + argNames[i] + "]" : " <" + argNames[i] + ">";
    }
    return usage;
}

namespace {

CommandResult FromResult(const oracle::Result<void>& result) {
    if (!result) {
        return CommandResult::Failed(result.failure());
    }
    return CommandResult::Ok("ok");
}

bool ParseSourceArg(const std::string& arg, Principal& out, CommandResult& error) {
    if (!ParsePrincipal(arg, out)) {
        error = CommandResult::Usage("invalid principal '" + arg + "' (expected 40 hex characters)");
        return false;
    }
    return true;
}

bool ParseNumberArg(const std::string& name, const std::string& arg,
                    uint64_t& out, CommandResult& error) {
    if (!ParseUInt64(arg, out)) {
        error = CommandResult::Usage(name + " must be an unsigned integer, got '" + arg + "'");
        return false;
    }
    return true;
}

std::string FormatAggregate(const oracle::AggregatePrice& aggregate) {
    std::ostringstream ss;
    ss << "price=" << aggregate.price
       << " lastUpdateHeight=" << aggregate.lastUpdateHeight
       << " sourceCount=" << aggregate.sourceCount;
    return ss.str();
}

std::string FormatQuote(const oracle::Quote& quote) {
    std::ostringstream ss;
    ss << "price=" << quote.price
       << " weight=" << quote.weight
       << " height=" << quote.height
       << " active=" << (quote.active ? "true" : "false");
    return ss.str();
}

// ============================================================================
// Admin Commands
// ============================================================================

CommandResult cmd_authorize(const std::vector<std::string>& args,
                            const std::optional<Principal>& caller,
                            oracle::PriceFeedEngine& engine) {
    Principal source;
    CommandResult error;
    if (!ParseSourceArg(args[0], source, error)) {
        return error;
    }
    return FromResult(engine.AuthorizeSource(*caller, source));
}

CommandResult cmd_deauthorize(const std::vector<std::string>& args,
                              const std::optional<Principal>& caller,
                              oracle::PriceFeedEngine& engine) {
    Principal source;
    CommandResult error;
    if (!ParseSourceArg(args[0], source, error)) {
        return error;
    }
    return FromResult(engine.DeauthorizeSource(*caller, source));
}

CommandResult cmd_setminsources(const std::vector<std::string>& args,
                                const std::optional<Principal>& caller,
                                oracle::PriceFeedEngine& engine) {
    uint64_t n = 0;
    CommandResult error;
    if (!ParseNumberArg("n", args[0], n, error)) {
        return error;
    }
    return FromResult(engine.SetMinSources(*caller, n));
}

CommandResult cmd_setstaleness(const std::vector<std::string>& args,
                               const std::optional<Principal>& caller,
                               oracle::PriceFeedEngine& engine) {
    uint64_t blocks = 0;
    CommandResult error;
    if (!ParseNumberArg("blocks", args[0], blocks, error)) {
        return error;
    }
    return FromResult(engine.SetStalenessThreshold(*caller, blocks));
}

CommandResult cmd_pause(const std::vector<std::string>& args,
                        const std::optional<Principal>& caller,
                        oracle::PriceFeedEngine& engine) {
    Principal source;
    CommandResult error;
    if (!ParseSourceArg(args[1], source, error)) {
        return error;
    }
    return FromResult(engine.PauseSource(*caller, args[0], source));
}

// ============================================================================
// Reporting Commands
// ============================================================================

CommandResult cmd_submit(const std::vector<std::string>& args,
                         const std::optional<Principal>& caller,
                         oracle::PriceFeedEngine& engine) {
    uint64_t price = 0;
    uint64_t weight = 0;
    CommandResult error;
    if (!ParseNumberArg("price", args[1], price, error) ||
        !ParseNumberArg("weight", args[2], weight, error)) {
        return error;
    }
    auto result = engine.Submit(*caller, args[0], price, weight);
    if (!result) {
        return CommandResult::Failed(result.failure());
    }
    return CommandResult::Ok(result.value());
}

// ============================================================================
// Query Commands
// ============================================================================

CommandResult cmd_getprice(const std::vector<std::string>& args,
                           const std::optional<Principal>&,
                           oracle::PriceFeedEngine& engine) {
    auto result = engine.GetPrice(args[0]);
    if (!result) {
        return CommandResult::Failed(result.failure());
    }
    return CommandResult::Ok(std::to_string(result.value()));
}

CommandResult cmd_getpricedata(const std::vector<std::string>& args,
                               const std::optional<Principal>&,
                               oracle::PriceFeedEngine& engine) {
    auto aggregate = engine.GetPriceData(args[0]);
    return CommandResult::Ok(aggregate ? FormatAggregate(*aggregate) : "none");
}

CommandResult cmd_getquote(const std::vector<std::string>& args,
                           const std::optional<Principal>&,
                           oracle::PriceFeedEngine& engine) {
    Principal source;
    CommandResult error;
    if (!ParseSourceArg(args[1], source, error)) {
        return error;
    }
    auto quote = engine.GetSourceQuote(args[0], source);
    return CommandResult::Ok(quote ? FormatQuote(*quote) : "none");
}

CommandResult cmd_isfresh(const std::vector<std::string>& args,
                          const std::optional<Principal>&,
                          oracle::PriceFeedEngine& engine) {
    return CommandResult::Ok(engine.IsPriceFresh(args[0]) ? "true" : "false");
}

CommandResult cmd_convert(const std::vector<std::string>& args,
                          const std::optional<Principal>&,
                          oracle::PriceFeedEngine& engine) {
    uint64_t amount = 0;
    CommandResult error;
    if (!ParseNumberArg("amount", args[2], amount, error)) {
        return error;
    }
    auto result = engine.Convert(args[0], args[1], amount);
    if (!result) {
        return CommandResult::Failed(result.failure());
    }
    return CommandResult::Ok(std::to_string(result.value()));
}

CommandResult cmd_sources(const std::vector<std::string>&,
                          const std::optional<Principal>&,
                          oracle::PriceFeedEngine& engine) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& source : engine.AuthorizedSources()) {
        if (!first) ss << "\n";
        ss << source.ToHex();
        first = false;
    }
    return CommandResult::Ok(ss.str());
}

CommandResult cmd_assets(const std::vector<std::string>&,
                         const std::optional<Principal>&,
                         oracle::PriceFeedEngine& engine) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& asset : engine.Assets()) {
        if (!first) ss << "\n";
        ss << asset;
        first = false;
    }
    return CommandResult::Ok(ss.str());
}

CommandResult cmd_height(const std::vector<std::string>&,
                         const std::optional<Principal>&,
                         oracle::PriceFeedEngine& engine) {
    return CommandResult::Ok(std::to_string(engine.GetClock().CurrentHeight()));
}

} // namespace

// ============================================================================
// CommandTable
// ============================================================================

CommandTable::CommandTable(oracle::PriceFeedEngine& engine) : engine_(engine) {
    RegisterAdminCommands();
    RegisterReportingCommands();
    RegisterQueryCommands();
    RegisterUtilityCommands();
}

void CommandTable::Register(const CommandInfo& command) {
    commands_[command.name] = command;
}

bool CommandTable::HasCommand(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

const CommandInfo* CommandTable::GetCommand(const std::string& name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

std::vector<CommandInfo> CommandTable::GetCommandsByCategory(const std::string& category) const {
    std::vector<CommandInfo> result;
    for (const auto& [name, command] : commands_) {
        if (command.category == category) {
            result.push_back(command);
        }
    }
    return result;
}

CommandResult CommandTable::Execute(const std::optional<Principal>& caller,
                                    const std::vector<std::string>& args) const {
    if (args.empty()) {
        return CommandResult::Usage("no command specified");
    }

    const CommandInfo* command = GetCommand(args[0]);
    if (!command) {
        return CommandResult::Usage("unknown command '" + args[0] + "'");
    }

    std::vector<std::string> params(args.begin() + 1, args.end());
    size_t maxArgs = command->argNames.size();
    size_t minArgs = maxArgs - command->optionalArgs;
    if (params.size() < minArgs || params.size() > maxArgs) {
        return CommandResult::Usage("usage: " + command->Usage());
    }

    if (command->requiresCaller && !caller) {
        return CommandResult::Usage(command->name + " requires -caller=<principal>");
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Executing " << command->name
        << " with " << params.size() << " argument(s)";

    return command->handler(params, caller);
}

CommandResult CommandTable::ExecuteScriptLine(const std::string& line,
                                              oracle::ManualClock& clock) const {
    auto words = SplitWords(line);
    if (words.empty() || words[0][0] == '#') {
        return CommandResult::Ok("");
    }
    if (words.size() < 3) {
        return CommandResult::Usage("expected '<caller> <height> <command> [args...]'");
    }

    std::optional<Principal> caller;
    if (words[0] != "-") {
        Principal principal;
        if (!ParsePrincipal(words[0], principal)) {
            return CommandResult::Usage("invalid caller '" + words[0] + "'");
        }
        caller = principal;
    }

    uint64_t height = 0;
    if (!ParseUInt64(words[1], height)) {
        return CommandResult::Usage("invalid height '" + words[1] + "'");
    }
    if (!clock.SetHeight(height)) {
        return CommandResult::Usage("height " + words[1] + " is below current height " +
                                    std::to_string(clock.CurrentHeight()));
    }

    return Execute(caller, std::vector<std::string>(words.begin() + 2, words.end()));
}

ExitCode CommandTable::RunScript(std::istream& in, oracle::ManualClock& clock,
                                 std::ostream& out, std::ostream& err) const {
    ExitCode status = ExitCode::Ok;
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        CommandResult result = ExecuteScriptLine(line, clock);
        if (!result.output.empty()) {
            out << result.output << "\n";
        }
        if (result.ok()) {
            continue;
        }

        err << "line " << lineNumber << ": " << result.error << "\n";
        if (result.code == ExitCode::Usage) {
            LOG_WARN(util::LogCategory::CLI) << "Script stopped at line " << lineNumber;
            return ExitCode::Usage;
        }
        status = ExitCode::Failed;
    }

    return status;
}

std::string CommandTable::HelpText(const std::string& command) const {
    std::ostringstream ss;

    if (!command.empty()) {
        const CommandInfo* info = GetCommand(command);
        if (!info) {
            return "unknown command '" + command + "'";
        }
        ss << info->Usage() << "\n\n" << info->description;
        if (info->requiresCaller) {
            ss << "\n\nRequires -caller=<principal>.";
        }
        return ss.str();
    }

    static const std::vector<std::pair<const char*, const char*>> sections = {
        {Category::ADMIN, "Administration"},
        {Category::REPORTING, "Reporting"},
        {Category::QUERY, "Queries"},
        {Category::UTILITY, "Utility"},
    };

    bool first = true;
    for (const auto& [category, title] : sections) {
        if (!first) ss << "\n";
        ss << "== " << title << " ==\n";
        for (const auto& info : GetCommandsByCategory(category)) {
            ss << std::left << std::setw(40) << info.Usage() << " " << info.description << "\n";
        }
        first = false;
    }
    return ss.str();
}

// ============================================================================
// Command Registration
// ============================================================================

void CommandTable::RegisterAdminCommands() {
    oracle::PriceFeedEngine* engine = &engine_;

    Register({
        "authorize",
        Category::ADMIN,
        "Allow a source to submit quotes (owner only).",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_authorize(args, caller, *engine);
        },
        true,
        {"source"}
    });

    Register({
        "deauthorize",
        Category::ADMIN,
        "Revoke a source; its existing quotes are kept (owner only).",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_deauthorize(args, caller, *engine);
        },
        true,
        {"source"}
    });

    Register({
        "setminsources",
        Category::ADMIN,
        "Set the minimum number of fresh quotes per aggregate (owner only).",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_setminsources(args, caller, *engine);
        },
        true,
        {"n"}
    });

    Register({
        "setstaleness",
        Category::ADMIN,
        "Set the staleness threshold in blocks (owner only).",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_setstaleness(args, caller, *engine);
        },
        true,
        {"blocks"}
    });

    Register({
        "pause",
        Category::ADMIN,
        "Deactivate a source's quote for an asset (owner only).",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_pause(args, caller, *engine);
        },
        true,
        {"asset", "source"}
    });
}

void CommandTable::RegisterReportingCommands() {
    oracle::PriceFeedEngine* engine = &engine_;

    Register({
        "submit",
        Category::REPORTING,
        "Submit the caller's quote for an asset at the current height.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_submit(args, caller, *engine);
        },
        true,
        {"asset", "price", "weight"}
    });
}

void CommandTable::RegisterQueryCommands() {
    oracle::PriceFeedEngine* engine = &engine_;

    Register({
        "getprice",
        Category::QUERY,
        "Return the fresh aggregate price of an asset.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_getprice(args, caller, *engine);
        },
        false,
        {"asset"}
    });

    Register({
        "getpricedata",
        Category::QUERY,
        "Return the stored aggregate regardless of age.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_getpricedata(args, caller, *engine);
        },
        false,
        {"asset"}
    });

    Register({
        "getquote",
        Category::QUERY,
        "Return one source's quote for an asset.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_getquote(args, caller, *engine);
        },
        false,
        {"asset", "source"}
    });

    Register({
        "isfresh",
        Category::QUERY,
        "Return whether the aggregate of an asset is fresh.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_isfresh(args, caller, *engine);
        },
        false,
        {"asset"}
    });

    Register({
        "convert",
        Category::QUERY,
        "Convert an amount between two assets at their fresh prices.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_convert(args, caller, *engine);
        },
        false,
        {"from", "to", "amount"}
    });

    Register({
        "sources",
        Category::QUERY,
        "List authorized sources in authorization order.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_sources(args, caller, *engine);
        },
        false,
        {}
    });

    Register({
        "assets",
        Category::QUERY,
        "List assets that have quotes.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_assets(args, caller, *engine);
        },
        false,
        {}
    });
}

void CommandTable::RegisterUtilityCommands() {
    const CommandTable* table = this;
    oracle::PriceFeedEngine* engine = &engine_;

    Register({
        "help",
        Category::UTILITY,
        "List all commands, or show usage for one command.",
        [table](const std::vector<std::string>& args, const std::optional<Principal>&) {
            return CommandResult::Ok(table->HelpText(args.empty() ? "" : args[0]));
        },
        false,
        {"command"},
        1
    });

    Register({
        "version",
        Category::UTILITY,
        "Print the client version.",
        [](const std::vector<std::string>&, const std::optional<Principal>&) {
            return CommandResult::Ok(std::string(CLIENT_NAME) + " v" + VERSION);
        },
        false,
        {}
    });

    Register({
        "height",
        Category::UTILITY,
        "Return the current block height.",
        [engine](const std::vector<std::string>& args, const std::optional<Principal>& caller) {
            return cmd_height(args, caller, *engine);
        },
        false,
        {}
    });
}

} // namespace cli
} // namespace pricefeed
