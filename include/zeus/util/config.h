// ZEUS - Configuration File Parser
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// INI-style configuration shared by zeus-validatord and zeus-minerd.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [validator] / [miner]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, 1/0; a bare "nokey" sets key=false
// - Environment variable expansion: ${VAR_NAME}
// - Repeating a key builds a list (e.g. miner=...)
//
// Command-line arguments (-key=value) override every file value,
// regardless of section.

#ifndef ZEUS_UTIL_CONFIG_H
#define ZEUS_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zeus {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".zeus";
constexpr const char* DEFAULT_CONFIG_FILENAME = "zeus.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or <command-line>
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
    
    /// "file:line: message"
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and the command line.
 * 
 * Lookup order for GetX(key, default, section):
 * 1. Command-line override of key
 * 2. [section] key
 * 3. Global key
 * 4. Default (SetDefault or the supplied default)
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content, 
                                  const std::string& sourceName = "<string>");
    
    /// Parse -key=value / -key value / -nokey arguments
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);
    
    /**
     * Load <datadir>/zeus.conf (or the file named by -conf).
     * A missing file is not an error.
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
    
    /// Integers accept decimal or 0x-prefixed hex
    std::optional<int64_t> TryGetInt(const std::string& key, 
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key, 
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key, 
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    std::optional<double> TryGetDouble(const std::string& key, 
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;
    
    /// All values given for a repeated key, in file order
    std::vector<std::string> GetList(const std::string& key, 
                                     const std::string& section = "") const;
    
    /// Get path value with ~ and ${VAR} expansion
    std::string GetPath(const std::string& key, 
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value, 
             const std::string& section = "");
    
    /// Set a value only if none is present
    void SetDefault(const std::string& key, const std::string& value, 
                    const std::string& section = "");
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size() + overrides_.size(); }
    
    /// Data directory (-datadir or ~/.zeus)
    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);
    
    static std::string GetDefaultDataDir();
    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);
    
    /// Dump configuration, one key=value # source per line
    std::string Dump() const;

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    
    /// Find the entry that wins for key in section
    const ConfigEntry* Find(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::map<std::string, ConfigEntry> overrides_;
    std::string dataDir_;
};

// ============================================================================
// Global Configuration
// ============================================================================

/// Get global configuration manager
ConfigManager& GetConfig();

/// Parse the command line, then load the config file it points to
ConfigParseResult InitConfig(int argc, char* argv[]);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigSection {
    constexpr const char* VALIDATOR = "validator";
    constexpr const char* MINER = "miner";
}

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* PORT = "port";
    constexpr const char* BIND = "bind";
    constexpr const char* THREADS = "threads";
    constexpr const char* POWALGORITHM = "powalgorithm";
    
    // Trend tracking and early detection
    constexpr const char* ALPHALOW = "alphalow";
    constexpr const char* ALPHAHIGH = "alphahigh";
    constexpr const char* TRACKINGPERIOD = "trackingperiod";
    constexpr const char* CONSENSUSWEIGHTTHRESHOLD = "consensusweightthreshold";
    constexpr const char* NEWMINERTHRESHOLD = "newminerthreshold";
    constexpr const char* PERFORMANCETHRESHOLD = "performancethreshold";
    constexpr const char* BONDAGGRESSIVENESS = "bondaggressiveness";
    constexpr const char* EARLYDETECTIONBONUS = "earlydetectionbonus";
    
    // Challenge classes
    constexpr const char* WEIGHTSTANDARD = "weightstandard";
    constexpr const char* WEIGHTHIGH = "weighthigh";
    constexpr const char* WEIGHTTIMEPRESSURE = "weighttimepressure";
    constexpr const char* WEIGHTEFFICIENCY = "weightefficiency";
    
    // Difficulty
    constexpr const char* BASEDIFFICULTY = "basedifficulty";
    constexpr const char* MINDIFFICULTY = "mindifficulty";
    constexpr const char* MAXDIFFICULTY = "maxdifficulty";
    constexpr const char* ADJUSTMENTFACTOR = "adjustmentfactor";
    constexpr const char* HIGHBAND = "highband";
    constexpr const char* LOWBAND = "lowband";
    
    // Verification and scoring
    constexpr const char* GRACEMS = "gracems";
    constexpr const char* SPEEDTHRESHOLDMS = "speedthresholdms";
    constexpr const char* EFFICIENCYTARGET = "efficiencytarget";
    constexpr const char* HIGHPERFORMER = "highperformer";
    constexpr const char* STABILITYVARIANCE = "stabilityvariance";
    constexpr const char* TRENDTOLERANCE = "trendtolerance";
    constexpr const char* CAPTOTAL = "captotal";
    constexpr const char* WEIGHTTOTAL = "weighttotal";
    
    // Validator daemon
    constexpr const char* EPOCHROUNDS = "epochrounds";
    constexpr const char* CHECKPOINTINTERVAL = "checkpointinterval";
    constexpr const char* ROUNDINTERVAL = "roundinterval";
    constexpr const char* MINER = "miner";
    
    // Miner daemon
    constexpr const char* CGMINERHOST = "cgminerhost";
    constexpr const char* CGMINERPORT = "cgminerport";
    constexpr const char* SIMULATE = "simulate";
    constexpr const char* SAFETYMARGINMS = "safetymarginms";
    constexpr const char* POLLINTERVALMS = "pollintervalms";
    constexpr const char* REPROBEINTERVALMS = "reprobeintervalms";
    constexpr const char* THERMALLIMIT = "thermallimit";
    constexpr const char* MAXHWERRORRATE = "maxhwerrorrate";
    constexpr const char* SOFTWARETHREADS = "softwarethreads";
}

} // namespace util
} // namespace zeus

#endif // ZEUS_UTIL_CONFIG_H
