// RELIQUARY - Configuration File Parser Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace reliquary {
namespace util {

// ============================================================================
// ConfigParseResult
// ============================================================================

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "OK";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

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
    if (first != last || (first != '"' && first != '\'')) {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }
    
    // Escape sequences are honoured inside double quotes only
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.length()) {
            out += inner[i];
            continue;
        }
        char next = inner[i + 1];
        switch (next) {
            case 'n': out += '\n'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"': out += '"'; ++i; break;
            default: out += inner[i]; break;
        }
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string name = value.substr(i + 2, end - i - 2);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = end + 1;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }
    
    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    if (section.empty()) {
        return key;
    }
    return section + "." + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }
    
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!currentSection.empty() && !IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }
    
    if (trimmed.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            result = ConfigParseResult::Error(
                "Maximum include depth exceeded", source, lineNum);
            return false;
        }
        std::string path = ExpandEnvVars(Unquote(Trim(trimmed.substr(8))));
        
        ++includeDepth_;
        ConfigParseResult included = ParseFile(path);
        --includeDepth_;
        
        if (!included.success) {
            result = included;
            return false;
        }
        result.warnings.insert(result.warnings.end(),
                               included.warnings.begin(), included.warnings.end());
        return true;
    }
    
    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0 && 
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }
    
    std::string fullKey = MakeKey(key, currentSection);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        result.warnings.push_back(source + ":" + std::to_string(lineNum) +
                                  ": '" + fullKey + "' overrides value from " +
                                  it->second.source);
    }
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    ConfigParseResult result = ConfigParseResult::Success();
    std::string currentSection;
    std::string line;
    std::string pending;
    int lineNum = 0;
    
    while (std::getline(in, line)) {
        ++lineNum;
        
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        
        if (!line.empty() && line.back() == '\\') {
            pending += line.substr(0, line.length() - 1);
            continue;
        }
        
        if (!pending.empty()) {
            line = pending + line;
            pending.clear();
        }
        
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }
    
    if (!pending.empty() && !ParseLine(pending, source, lineNum, currentSection, result)) {
        return result;
    }
    
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    
    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            path);
    }
    
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }
        
        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        arg = arg.substr(start);
        
        std::string name;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            name = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else {
            name = arg;
            value = "true";
            if (name.size() > 2 && name.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(name[2]))) {
                name = name.substr(2);
                value = "false";
            }
        }
        
        // -section.key=value targets a section
        std::string section;
        std::string key = name;
        size_t dot = name.find('.');
        if (dot != std::string::npos) {
            section = name.substr(0, dot);
            key = name.substr(dot + 1);
        }
        
        if (!IsValidKey(key) || (!section.empty() && !IsValidKey(section))) {
            return ConfigParseResult::Error("Invalid option: -" + arg, "<command-line>");
        }
        
        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.section = section;
        entry.source = "<command-line>";
        overrides_[MakeKey(key, section)] = entry;
    }
    
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile(const std::string& dataDir) {
    if (auto dir = TryGetString(ConfigKeys::DATADIR)) {
        dataDir_ = ExpandTilde(*dir);
    } else if (!dataDir.empty()) {
        dataDir_ = ExpandTilde(dataDir);
    } else {
        dataDir_ = GetDefaultDataDir();
    }
    
    if (auto conf = TryGetString(ConfigKeys::CONF)) {
        return ParseFile(*conf);
    }
    
    std::string path = dataDir_ + "/" + DEFAULT_CONFIG_FILENAME;
    std::ifstream probe(path);
    if (!probe.is_open()) {
        return ConfigParseResult::Success();
    }
    probe.close();
    return ParseFile(path);
}

// ============================================================================
// Value Retrieval
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    auto over = overrides_.find(fullKey);
    if (over != overrides_.end()) {
        return &over->second;
    }
    auto it = entries_.find(fullKey);
    if (it != entries_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (const ConfigEntry* entry = Find(key, section)) {
        return entry->value;
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
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    std::string value = Trim(*str);
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                              int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(Trim(*str));
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    std::string value = Trim(*str);
    try {
        size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> items;
    auto str = TryGetString(key, section);
    if (!str) {
        return items;
    }
    std::istringstream stream(*str);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, defaultValue, section));
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
    entry.source = "<set>";
    entries_[MakeKey(key, section)] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.count(fullKey) > 0) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.emplace(section, key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    for (const auto& required : requiredKeys_) {
        auto value = TryGetString(required.second, required.first);
        if (!value || Trim(*value).empty()) {
            errors.push_back("Missing required option '" +
                             MakeKey(required.second, required.first) + "'");
        }
    }
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    overrides_.clear();
    positional_.clear();
    requiredKeys_.clear();
    dataDir_.clear();
    includeDepth_ = 0;
}

size_t ConfigManager::Size() const {
    size_t count = entries_.size();
    for (const auto& over : overrides_) {
        if (entries_.count(over.first) == 0) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& kv : entries_) {
        if (!kv.second.section.empty()) {
            sections.insert(kv.second.section);
        }
    }
    for (const auto& kv : overrides_) {
        if (!kv.second.section.empty()) {
            sections.insert(kv.second.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

std::string ConfigManager::GenerateSampleConfig() {
    std::ostringstream oss;
    oss << "# RELIQUARY configuration file\n"
        << "#\n"
        << "# Every option can also be given on the command line as\n"
        << "# -key=value, or -governance.key=value for the [governance] section.\n"
        << "\n"
        << "# Directory holding the ledger database\n"
        << "#datadir=~/" << DEFAULT_DATADIR_NAME << "\n"
        << "\n"
        << "# trace, debug, info, warn, error, fatal, off\n"
        << "#loglevel=info\n"
        << "#logfile=\n"
        << "#printtoconsole=1\n"
        << "\n"
        << "[governance]\n"
        << "# Administrative principal (required)\n"
        << "admin=\n"
        << "# Voting window in seconds\n"
        << "#votingperiod=86400\n"
        << "# Seconds between the end of voting and earliest execution\n"
        << "#executiondelay=7200\n"
        << "# Minimum total voting power cast for a proposal to execute\n"
        << "#quorum=3\n";
    return oss.str();
}

} // namespace util
} // namespace reliquary
