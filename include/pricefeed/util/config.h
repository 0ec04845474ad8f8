// PRICEFEED - Configuration File Parser
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Parses INI-style configuration files for the price-feed engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef PRICEFEED_UTIL_CONFIG_H
#define PRICEFEED_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pricefeed {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name
constexpr const char* DEFAULT_DATADIR_NAME = ".pricefeed";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "pricefeed.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth (to prevent infinite recursion)
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Explicit -conf file, or the data directory config file
 * 3. User config file (~/.pricefeed/pricefeed.conf)
 * 4. Built-in defaults
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // File Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form -key=value, -flag or -noflag.
     * Everything from the first non-option argument on is positional and
     * available via GetPositional().
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /**
     * Load the user config and the data directory (or -conf) config file.
     *
     * @param dataDir Data directory path (or empty for default)
     */
    ConfigParseResult LoadAllConfigs(const std::string& dataDir = "");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; accepts k/m/g suffixes. nullopt if absent or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get list of values (comma-separated or repeated entries)
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Get path value (with ~ and environment expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    /// Non-option command-line arguments, in order
    const std::vector<std::string>& GetPositional() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);

    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// Sample configuration file listing every engine key
    std::string GenerateSampleConfig() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static bool IsValidKey(const std::string& key, char& badChar);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated entries
    std::vector<std::string> positional_;

    std::string dataDir_;
    int includeDepth_{0};
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Get global configuration manager
ConfigManager& GetConfig();

/// Initialize global configuration from command line and config files
ConfigParseResult InitConfig(int argc, const char* const argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";

    // Engine
    constexpr const char* OWNER = "owner";
    constexpr const char* MINSOURCES = "minsources";
    constexpr const char* STALENESSTHRESHOLD = "stalenessthreshold";
    constexpr const char* AUTHORIZE = "authorize";

    // Storage
    constexpr const char* DB = "db";
    constexpr const char* DBCACHE = "dbcache";

    // Command line
    constexpr const char* CALLER = "caller";
    constexpr const char* HEIGHT = "height";
    constexpr const char* SCRIPT = "script";
    constexpr const char* STDIN = "stdin";
}

} // namespace util
} // namespace pricefeed

#endif // PRICEFEED_UTIL_CONFIG_H
