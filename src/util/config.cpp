// ZEUS - Configuration File Parser Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace zeus {
namespace util {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "ok";
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
// Static Helpers
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
    if (str.size() < 2) {
        return str;
    }
    char q = str.front();
    if ((q != '"' && q != '\'') || str.back() != q) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (q == '\'') {
        return inner;
    }
    
    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            char next = inner[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                default: out += next; break;
            }
        } else {
            out += inner[i];
        }
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
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
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
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
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    
    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    return ExpandTilde(std::string("~/") + DEFAULT_DATADIR_NAME);
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
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
        return true;
    }
    
    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag: "key" means true, "nokey" means false
        key = trimmed;
        value = "true";
        if (key.size() > 2 && key.compare(0, 2, "no") == 0) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key '" + key + "'", source, lineNum);
        return false;
    }
    
    std::string fullKey = MakeKey(key, currentSection);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault) {
        lists_[fullKey].push_back(value);
        return true;
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
        return ConfigParseResult::Error("Config file too large", path);
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    
    ConfigParseResult result = ConfigParseResult::Success();
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error("Line too long", sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            return ConfigParseResult::Error("Unexpected argument: " + arg,
                                            "<command-line>");
        }
        arg.erase(0, arg.find_first_not_of('-'));
        if (arg.empty()) {
            continue;
        }
        
        std::string key;
        std::string value;
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            key = arg.substr(0, eqPos);
            value = arg.substr(eqPos + 1);
        } else if (arg.size() > 2 && arg.compare(0, 2, "no") == 0) {
            key = arg.substr(2);
            value = "false";
        } else {
            key = arg;
            value = "true";
        }
        
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option -" + key, "<command-line>");
        }
        
        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = "<command-line>";
        overrides_[key] = entry;
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile(const std::string& dataDir) {
    if (!dataDir.empty()) {
        SetDataDir(dataDir);
    }
    
    std::string path;
    if (auto conf = TryGetString(ConfigKeys::CONF)) {
        path = ExpandEnvVars(ExpandTilde(*conf));
    } else {
        path = GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    }
    
    std::ifstream probe(path);
    if (!probe.is_open()) {
        ConfigParseResult result = ConfigParseResult::Success();
        result.warnings.push_back("No config file at " + path + ", using defaults");
        return result;
    }
    probe.close();
    return ParseFile(path);
}

// ============================================================================
// Value Retrieval
// ============================================================================

const ConfigEntry* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto ov = overrides_.find(key);
    if (ov != overrides_.end()) {
        return &ov->second;
    }
    if (!section.empty()) {
        auto it = entries_.find(MakeKey(key, section));
        if (it != entries_.end()) {
            return &it->second;
        }
    }
    auto it = entries_.find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    const ConfigEntry* entry = Find(key, section);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
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
    std::string text = Trim(*str);
    try {
        size_t pos = 0;
        int64_t value = std::stoll(text, &pos, 0);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto value = TryGetInt(key, section);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    std::string text = Trim(*str);
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue,
                                const std::string& section) const {
    return TryGetDouble(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::vector<std::string> result;
    
    auto ov = overrides_.find(key);
    if (ov != overrides_.end()) {
        result.push_back(ov->second.value);
    }
    
    auto collect = [&](const std::string& fullKey) {
        auto it = entries_.find(fullKey);
        if (it == entries_.end()) {
            return;
        }
        result.push_back(it->second.value);
        auto listIt = lists_.find(fullKey);
        if (listIt != lists_.end()) {
            result.insert(result.end(), listIt->second.begin(), listIt->second.end());
        }
    };
    
    if (!section.empty()) {
        collect(MakeKey(key, section));
    }
    collect(key);
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
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    overrides_.clear();
    dataDir_.clear();
}

std::string ConfigManager::GetDataDir() const {
    if (!dataDir_.empty()) {
        return dataDir_;
    }
    auto fromArgs = TryGetString(ConfigKeys::DATADIR);
    if (fromArgs) {
        return ExpandEnvVars(ExpandTilde(*fromArgs));
    }
    return GetDefaultDataDir();
}

void ConfigManager::SetDataDir(const std::string& dir) {
    dataDir_ = ExpandEnvVars(ExpandTilde(dir));
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    auto emit = [&oss](const ConfigEntry& entry) {
        if (!entry.section.empty()) {
            oss << "[" << entry.section << "] ";
        }
        oss << entry.key << "=" << entry.value << "  # " << entry.source;
        if (entry.lineNumber > 0) {
            oss << ":" << entry.lineNumber;
        }
        oss << "\n";
    };
    for (const auto& kv : overrides_) {
        emit(kv.second);
    }
    for (const auto& kv : entries_) {
        emit(kv.second);
    }
    return oss.str();
}

// ============================================================================
// Global Configuration
// ============================================================================

ConfigManager& GetConfig() {
    static ConfigManager config;
    return config;
}

ConfigParseResult InitConfig(int argc, char* argv[]) {
    ConfigManager& config = GetConfig();
    
    auto cmdResult = config.ParseCommandLine(argc, argv);
    if (!cmdResult.success) {
        return cmdResult;
    }
    return config.LoadConfigFile();
}

} // namespace util
} // namespace zeus
