// VELEDGER - Configuration File Parser
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Parses INI-style configuration for the ledger and the simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - A bare key is a flag (true); "nokey" negates it

#ifndef VELEDGER_UTIL_CONFIG_H
#define VELEDGER_UTIL_CONFIG_H

#include "veledger/core/types.h"

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace veledger {
namespace util {

/// Default config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "veledger.conf";

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
    std::string source;    // File path or "<command-line>"
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

    /// "file:line: message" for display
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Command-line values override file values; SetDefault never overrides
 * anything that was parsed.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text (sourceName is used in error messages)
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse -key=value style arguments into the global section.
     * A dotted key ("-escrow.treasury=...") targets a section.
     * Positional arguments are collected and returned by GetPositional().
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Integer value; nullopt if missing or not a plain integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Token amount such as "10" or "0.5"; a trailing "wei" selects raw base units
    std::optional<Amount> TryGetAmount(const std::string& key,
                                       const std::string& section = "") const;

    Amount GetAmount(const std::string& key, Amount defaultValue,
                     const std::string& section = "") const;

    /// Path value with ~ and environment expansion
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

    /// Set only when nothing was parsed for the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections and validation
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Register a known key; Validate() reports keys never registered
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Warnings about unknown keys (empty when AllowKey was never called)
    std::vector<std::string> Validate() const;

    void Clear();

    size_t Size() const { return entries_.size(); }

    /// Dump all configuration as INI text
    std::string Dump() const;

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Sections
    constexpr const char* ESCROW_SECTION = "escrow";
    constexpr const char* REWARDS_SECTION = "rewards";
    constexpr const char* DB_SECTION = "db";

    // Global
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* SCRIPT = "script";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* START_TIME = "starttime";

    // [escrow]
    constexpr const char* NAME = "name";
    constexpr const char* SYMBOL = "symbol";
    constexpr const char* VERSION = "version";
    constexpr const char* BASE_URI = "base_uri";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* MIN_LOCK_AMOUNT = "min_lock_amount";
    constexpr const char* LIQUIDATIONS_ENABLED = "liquidations_enabled";
    constexpr const char* PENALTY_NUMERATOR = "liquidation_penalty_numerator";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* MAX_REPLAY_WEEKS = "max_replay_weeks";

    // [rewards]
    constexpr const char* BASE_EMISSION_RATE = "base_emission_rate";
    constexpr const char* NODE_EMISSION_RATE = "node_emission_rate";
    constexpr const char* NODE_REWARD_THRESHOLD = "node_reward_threshold";
    constexpr const char* MAX_EMISSION_RATE = "max_emission_rate";
    constexpr const char* GENESIS = "genesis";

    // [db]
    constexpr const char* BACKEND = "backend";
    constexpr const char* PATH = "path";
}

} // namespace util
} // namespace veledger

#endif // VELEDGER_UTIL_CONFIG_H
