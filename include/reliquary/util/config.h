// RELIQUARY - Configuration File Parser
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Parses INI-style configuration for the governance ledger.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0; a bare "key" means
//   true and "nokey" means false
// - Environment variable expansion: ${VAR_NAME}
// - "include <path>" pulls in another file
//
// Command-line options (-key=value, -section.key=value, -flag, -noflag)
// take priority over every file.

#ifndef RELIQUARY_UTIL_CONFIG_H
#define RELIQUARY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace reliquary {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".reliquary";

constexpr const char* DEFAULT_CONFIG_FILENAME = "reliquary.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

/// Guards against include cycles
constexpr int MAX_INCLUDE_DEPTH = 10;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>" or "<default>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

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
    
    /// "file:line: message" style description
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, command-line arguments and defaults.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Values set with Set() or parsed from files (later files win)
 * 3. Defaults registered with SetDefault()
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse command-line arguments. Arguments that do not start with '-'
     * are kept in order and returned by GetPositionalArgs().
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    /**
     * Resolve the data directory (command-line "datadir", then the given
     * argument, then the default) and parse the configuration file there.
     * A "conf" option names an explicit file instead. A missing default
     * file is not an error.
     */
    ConfigParseResult LoadConfigFile(const std::string& dataDir = "");
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Integer value; nullopt if missing or not a whole number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;
    
    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    
    /// Comma-separated value split into trimmed, non-empty items
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;
    
    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Lowest priority value; never replaces an explicit one
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void RequireKey(const std::string& key, const std::string& section = "");
    
    /// Messages for every missing required key (empty when valid)
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    
    size_t Size() const;
    
    std::vector<std::string> GetSections() const;
    
    std::string GetDataDir() const { return dataDir_; }
    
    static std::string GetDefaultDataDir();
    
    static std::string ExpandEnvVars(const std::string& value);
    
    static std::string ExpandTilde(const std::string& path);
    
    /// Commented configuration file listing every recognised key
    static std::string GenerateSampleConfig();

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    
    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    static bool IsValidKey(const std::string& key);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    
    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, ConfigEntry> overrides_;  // From the command line
    std::vector<std::string> positional_;
    
    std::set<std::pair<std::string, std::string>> requiredKeys_;
    
    std::string dataDir_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Global
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    
    // [governance]
    constexpr const char* GOVERNANCE_SECTION = "governance";
    constexpr const char* ADMIN = "admin";
    constexpr const char* VOTINGPERIOD = "votingperiod";
    constexpr const char* EXECUTIONDELAY = "executiondelay";
    constexpr const char* QUORUM = "quorum";
}

} // namespace util
} // namespace reliquary

#endif // RELIQUARY_UTIL_CONFIG_H
