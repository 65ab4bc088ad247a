// AEGIS - Configuration File Parser
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Parses INI-style configuration for the controller.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally inside [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare "key" means key=true, "nokey" means key=false
// - Repeating a key builds a list (e.g. one authorizedkey per line)
// - Environment variable expansion: ${VAR_NAME} or $VAR_NAME

#ifndef AEGIS_UTIL_CONFIG_H
#define AEGIS_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace aegis {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "aegis.conf";

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

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration gathered from files, strings and the command line.
 *
 * Scalar lookups return the most recent definition of a key, so later
 * sources override earlier ones. Every definition is also kept in
 * order and can be read back as a list with GetList().
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse "-key=value", "--key value", "-flag" and "-noflag" arguments
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

    /// Integers are plain decimal; anything else is treated as absent
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

    /// All values for a repeated key, in definition order. A single
    /// comma-separated value is split into its items.
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a value only if nothing has defined the key yet
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections and Validation
    // ========================================================================

    std::vector<std::string> GetSections() const;

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Report missing required keys and, when an allow-list exists, unknown keys
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::string ExpandEnvVars(const std::string& value);
    static std::string Trim(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key, char* badChar);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;

    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Controller
    constexpr const char* INITIAL_VERSION = "initialversion";
    constexpr const char* MAX_PENDING_UPDATES = "maxpendingupdates";
    constexpr const char* ALLOW_DEMO_KEYS = "allowdemokeys";
    constexpr const char* AUTHORIZED_KEY = "authorizedkey";

    // [script] section
    constexpr const char* SCRIPT_SECTION = "script";
    constexpr const char* MAX_STEPS = "maxsteps";
    constexpr const char* MAX_DEPTH = "maxdepth";

    // Logging
    constexpr const char* LOG_LEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOG_FILE = "logfile";
    constexpr const char* PRINT_TO_CONSOLE = "printtoconsole";
}

} // namespace util
} // namespace aegis

#endif // AEGIS_UTIL_CONFIG_H
