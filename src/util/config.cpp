// AEGIS - Configuration File Parser Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace aegis {
namespace util {

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
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }

    std::string inner = str.substr(1, str.length() - 2);
    std::string unescaped;
    unescaped.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] != '\\' || i + 1 >= inner.length()) {
            unescaped += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n': unescaped += '\n'; ++i; break;
            case 't': unescaped += '\t'; ++i; break;
            case '\\': unescaped += '\\'; ++i; break;
            case '"': unescaped += '"'; ++i; break;
            default: unescaped += inner[i]; break;
        }
    }
    return unescaped;
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

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t resume;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                resume = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }

            if (nameEnd != std::string::npos && nameEnd > nameStart) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = resume;
                continue;
            }
        }
        result += value[i];
        ++i;
    }
    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) {
    return section.empty() ? key : section + ":" + key;
}

bool ConfigManager::IsValidKey(const std::string& key, char* badChar) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            if (badChar) *badChar = c;
            return false;
        }
    }
    return !key.empty();
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(const std::string& key, const std::string& value,
                          const std::string& section, const std::string& source,
                          int lineNum) {
    std::string fullKey = MakeKey(key, section);

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;

    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.isDefault) {
        lists_.erase(fullKey);
    }
    entries_[fullKey] = entry;
    lists_[fullKey].push_back(value);
}

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
        // Bare flag; "nofoo" negates "foo"
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    char badChar = 0;
    if (!IsValidKey(key, &badChar)) {
        result = ConfigParseResult::Error(
            key.empty() ? "Empty key" : "Invalid character in key: " + std::string(1, badChar),
            source, lineNum);
        return false;
    }

    Store(key, value, currentSection, source, lineNum);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuation;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(in, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuation += line.substr(0, line.length() - 1);
            continue;
        }
        if (!continuation.empty()) {
            line = continuation + line;
            continuation.clear();
        }

        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuation.empty() &&
        !ParseLine(continuation, source, lineNum, currentSection, result)) {
        return result;
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(filePath);

    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }

    file.seekg(0, std::ios::end);
    std::streampos size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
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
            continue;
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
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            key = arg.substr(2);
            value = "false";
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            key = arg;
            value = argv[++i];
        } else {
            key = arg;
            value = "true";
        }

        char badChar = 0;
        if (!IsValidKey(key, &badChar)) {
            return ConfigParseResult::Error("Invalid command-line option: " + arg,
                                            "<command-line>", i);
        }
        Store(key, value, "", "<command-line>", 0);
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.count(MakeKey(key, section)) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
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
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        if (pos != str->length()) {
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

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                const std::string& section) const {
    std::string fullKey = MakeKey(key, section);

    std::vector<std::string> values;
    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        values = listIt->second;
    } else {
        auto entryIt = entries_.find(fullKey);
        if (entryIt != entries_.end()) {
            values.push_back(entryIt->second.value);
        }
    }

    if (values.size() != 1 || values[0].find(',') == std::string::npos) {
        return values;
    }

    std::vector<std::string> split;
    std::istringstream ss(values[0]);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            split.push_back(item);
        }
    }
    return split;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    lists_.erase(fullKey);
    Store(key, value, section, "<programmatic>", 0);
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
// Sections and Validation
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }
    return std::vector<std::string>(sections.begin(), sections.end());
}

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;

    for (const auto& required : requiredKeys_) {
        if (entries_.count(required) == 0) {
            errors.push_back("Required key missing: " + required);
        }
    }

    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.count(fullKey) == 0 && requiredKeys_.count(fullKey) == 0) {
                errors.push_back("Unknown key: " + fullKey +
                                 " (defined in " + entry.source + ")");
            }
        }
    }

    return errors;
}

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
}

} // namespace util
} // namespace aegis
