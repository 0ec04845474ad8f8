// PRICEFEED - Configuration File Parser Implementation
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace pricefeed {
namespace util {

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();

    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        std::string result = str.substr(1, str.length() - 2);

        // Escape sequences only apply inside double quotes
        if (first == '"') {
            std::string unescaped;
            unescaped.reserve(result.length());

            for (size_t i = 0; i < result.length(); ++i) {
                if (result[i] == '\\' && i + 1 < result.length()) {
                    char next = result[i + 1];
                    switch (next) {
                        case 'n': unescaped += '\n'; ++i; break;
                        case 't': unescaped += '\t'; ++i; break;
                        case 'r': unescaped += '\r'; ++i; break;
                        case '\\': unescaped += '\\'; ++i; break;
                        case '"': unescaped += '"'; ++i; break;
                        default: unescaped += result[i]; break;
                    }
                } else {
                    unescaped += result[i];
                }
            }
            return unescaped;
        }

        return result;
    }

    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }

    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key, char& badChar) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            badChar = c;
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$') {
            if (i + 1 < value.length() && value[i + 1] == '{') {
                // ${VAR}
                size_t end = value.find('}', i + 2);
                if (end != std::string::npos) {
                    std::string varName = value.substr(i + 2, end - i - 2);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end + 1;
                    continue;
                }
            } else if (i + 1 < value.length()) {
                // $VAR
                size_t start = i + 1;
                size_t end = start;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > start) {
                    std::string varName = value.substr(start, end - start);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end;
                    continue;
                }
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    // Only a leading ~ or ~/ is expanded
    if (path.length() == 1 || path[1] == '/') {
        std::string home;

        const char* homeEnv = std::getenv("HOME");
        if (homeEnv) {
            home = homeEnv;
        } else {
            struct passwd* pw = getpwuid(getuid());
            if (pw) {
                home = pw->pw_dir;
            }
        }

        if (!home.empty()) {
            return home + path.substr(1);
        }
    }

    return path;
}

std::string ConfigManager::GetDefaultDataDir() {
    std::string path;

#if defined(__APPLE__)
    const char* home = std::getenv("HOME");
    if (home) {
        path = std::string(home) + "/Library/Application Support/" + DEFAULT_DATADIR_NAME;
    }
#else
    const char* home = std::getenv("HOME");
    if (home) {
        path = std::string(home) + "/" + DEFAULT_DATADIR_NAME;
    }
#endif

    return path;
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

// ============================================================================
// File Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    // [section]
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }

        std::string includePath = Unquote(Trim(trimmed.substr(8)));
        includePath = ExpandEnvVars(ExpandTilde(includePath));

        ++includeDepth_;
        ConfigParseResult includeResult = ParseFile(includePath);
        --includeDepth_;

        if (!includeResult.success) {
            result = includeResult;
            return false;
        }
        return true;
    }

    char badChar = 0;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag; "nokey" negates
        std::string key = trimmed;
        bool negated = false;
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            negated = true;
        }

        if (!IsValidKey(key, badChar)) {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, badChar), source, lineNum);
            return false;
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = negated ? "false" : "true";
        entry.section = currentSection;
        entry.source = source;
        entry.lineNumber = lineNum;

        entries_[MakeKey(key, currentSection)] = entry;
        return true;
    }

    std::string key = Trim(trimmed.substr(0, eqPos));
    std::string value = Trim(trimmed.substr(eqPos + 1));

    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }

    if (!IsValidKey(key, badChar)) {
        result = ConfigParseResult::Error(
            "Invalid character in key: " + std::string(1, badChar), source, lineNum);
        return false;
    }

    value = ExpandEnvVars(Unquote(value));

    std::string fullKey = MakeKey(key, currentSection);

    // A repeated key becomes a list
    auto it = entries_.find(fullKey);
    if (it != entries_.end()) {
        lists_[fullKey].push_back(value);
    } else {
        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.section = currentSection;
        entry.source = source;
        entry.lineNumber = lineNum;

        entries_[fullKey] = entry;
    }

    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& sourceName) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Everything from the first positional argument on is the command
        if (arg.empty() || arg[0] != '-' || !positional_.empty()) {
            positional_.push_back(arg);
            continue;
        }

        while (!arg.empty() && arg[0] == '-') {
            arg = arg.substr(1);
        }

        if (arg.empty()) {
            continue;
        }

        std::string key;
        std::string value;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            key = arg;
            value = "true";
            if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }

        char badChar = 0;
        if (key.empty() || !IsValidKey(key, badChar)) {
            return ConfigParseResult::Error("Invalid command-line option: -" + arg,
                                            "<command-line>");
        }

        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = "<command-line>";

        // Command line always overwrites
        entries_[key] = entry;
        lists_.erase(key);
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadAllConfigs(const std::string& dataDir) {
    std::vector<std::string> warnings;

    if (!dataDir.empty()) {
        SetDataDir(dataDir);
    } else if (dataDir_.empty()) {
        dataDir_ = GetDefaultDataDir();
    }

    std::string userConfig = ExpandTilde("~/" + std::string(DEFAULT_DATADIR_NAME) + "/" +
                                         DEFAULT_CONFIG_FILENAME);

    // An explicit -conf replaces the data directory file
    std::string dataConfig = dataDir_ + "/" + DEFAULT_CONFIG_FILENAME;
    auto explicitConf = TryGetString(ConfigKeys::CONF);
    if (explicitConf) {
        dataConfig = ExpandEnvVars(ExpandTilde(*explicitConf));
    }

    if (userConfig != dataConfig) {
        std::ifstream testUser(userConfig);
        if (testUser.is_open()) {
            testUser.close();
            auto result = ParseFile(userConfig);
            if (!result.success) {
                warnings.push_back("Failed to parse user config: " + result.errorMessage);
            }
        }
    }

    std::ifstream testData(dataConfig);
    if (testData.is_open()) {
        testData.close();
        auto result = ParseFile(dataConfig);
        if (!result.success) {
            return result;
        }
    } else if (explicitConf) {
        return ConfigParseResult::Error("Cannot open file: " + dataConfig);
    }

    ConfigParseResult result = ConfigParseResult::Success();
    result.warnings = warnings;
    return result;
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const std::string& strValue = it->second.value;

    try {
        size_t pos;
        int64_t value = std::stoll(strValue, &pos);

        std::string suffix = Trim(strValue.substr(pos));
        if (!suffix.empty()) {
            if (suffix.length() > 1) {
                return std::nullopt;
            }
            switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
                case 'k': value *= 1024; break;
                case 'm': value *= 1024 * 1024; break;
                case 'g': value *= 1024LL * 1024 * 1024; break;
                default: return std::nullopt;
            }
        }

        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto intValue = TryGetInt(key, section);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return ParseBool(it->second.value);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> result;

    auto splitInto = [&result](const std::string& value) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    };

    // Primary entry first, then repeated entries in file order
    auto entryIt = entries_.find(fullKey);
    if (entryIt != entries_.end()) {
        splitInto(entryIt->second.value);
    }

    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        for (const auto& value : listIt->second) {
            splitInto(value);
        }
    }

    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";

    entries_[MakeKey(key, section)] = entry;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    positional_.clear();
    dataDir_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::GetDataDir() const {
    return dataDir_.empty() ? GetDefaultDataDir() : dataDir_;
}

void ConfigManager::SetDataDir(const std::string& dir) {
    dataDir_ = ExpandEnvVars(ExpandTilde(dir));
}

std::string ConfigManager::GenerateSampleConfig() const {
    std::ostringstream oss;

    oss << "# Price feed engine configuration\n\n";

    oss << "# ============================================================================\n";
    oss << "# General Settings\n";
    oss << "# ============================================================================\n\n";

    oss << "# Data directory (default: ~/" << DEFAULT_DATADIR_NAME << ")\n";
    oss << "#datadir=~/" << DEFAULT_DATADIR_NAME << "\n\n";

    oss << "# Minimum log level: trace, debug, info, warn, error, off\n";
    oss << "#loglevel=info\n\n";

    oss << "# Log file (empty disables file logging)\n";
    oss << "#logfile=\n\n";

    oss << "# Log to console\n";
    oss << "#printtoconsole=1\n\n";

    oss << "# Only log these categories (oracle, admin, db, config, cli)\n";
    oss << "#debug=oracle,admin\n\n";

    oss << "# ============================================================================\n";
    oss << "# Engine Settings\n";
    oss << "# ============================================================================\n\n";

    oss << "# Owner principal, 40 hex characters (required)\n";
    oss << "#owner=\n\n";

    oss << "# Minimum number of fresh quotes needed for an aggregate\n";
    oss << "#minsources=1\n\n";

    oss << "# Heights after which a quote or aggregate is stale\n";
    oss << "#stalenessthreshold=120\n\n";

    oss << "# Sources authorized when the state database is first created\n";
    oss << "#authorize=\n\n";

    oss << "# ============================================================================\n";
    oss << "# Storage Settings\n";
    oss << "# ============================================================================\n\n";

    oss << "# State backend: leveldb or memory\n";
    oss << "#db=leveldb\n\n";

    oss << "# LevelDB block cache in MB\n";
    oss << "#dbcache=8\n\n";

    return oss.str();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager config;
    return config;
}

ConfigParseResult InitConfig(int argc, const char* const argv[]) {
    ConfigManager& config = GetConfig();

    // First pass picks up -datadir and -conf
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        return cmdResult;
    }

    std::string dataDir;
    auto dataDirOpt = config.TryGetString(ConfigKeys::DATADIR);
    if (dataDirOpt) {
        dataDir = *dataDirOpt;
    }

    auto loadResult = config.LoadAllConfigs(dataDir);
    if (!loadResult.success) {
        return loadResult;
    }

    // Command line takes priority over config files
    auto finalResult = config.ParseCommandLine(argc, argv);
    if (finalResult.success) {
        finalResult.warnings = loadResult.warnings;
    }
    return finalResult;
}

} // namespace util
} // namespace pricefeed
