// CHAINSYNC - Configuration File Parser Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/util/config.h>
#include <chainsync/util/logging.h>
#include <chainsync/core/errors.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace chainsync {
namespace util {

namespace {

std::string Strip(const std::string& str) {
    const char* blanks = " \t\r\n";
    size_t start = str.find_first_not_of(blanks);
    if (start == std::string::npos) {
        return "";
    }
    return str.substr(start, str.find_last_not_of(blanks) - start + 1);
}

std::string StripQuotes(const std::string& str) {
    if (str.size() >= 2 && ((str.front() == '"' && str.back() == '"') ||
                            (str.front() == '\'' && str.back() == '\''))) {
        return str.substr(1, str.size() - 2);
    }
    return str;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

} // namespace

ConfigManager::ConfigManager(std::string network) : network_(std::move(network)) {}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            result.append(value, pos, std::string::npos);
            break;
        }
        result.append(value, pos, open - pos);
        std::string name = value.substr(open + 2, close - open - 2);
        if (const char* env = std::getenv(name.c_str())) {
            result += env;
        }
        pos = close + 1;
    }
    return result;
}

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseStream(std::istream& stream) {
    std::string line;
    std::string section;
    int lineNum = 0;

    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error("Line too long", lineNum);
        }

        std::string text = Strip(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }

        if (text[0] == '[') {
            if (text.back() != ']') {
                return ConfigParseResult::Error("Missing closing bracket in section header",
                                                lineNum);
            }
            section = Strip(text.substr(1, text.size() - 2));
            continue;
        }

        std::string key;
        std::string value = "1";
        size_t eq = text.find('=');
        if (eq == std::string::npos) {
            key = text;
        } else {
            key = Strip(text.substr(0, eq));
            value = ExpandEnvVars(StripQuotes(Strip(text.substr(eq + 1))));
        }

        if (key.empty()) {
            return ConfigParseResult::Error("Empty key", lineNum);
        }
        for (char c : key) {
            if (!IsKeyChar(c)) {
                return ConfigParseResult::Error("Invalid character in key: " + key, lineNum);
            }
        }

        if (section.empty()) {
            global_[key] = value;
        } else if (section == network_) {
            networkValues_[key] = value;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }
    ConfigParseResult result = ParseStream(file);
    if (result.success) {
        LOG_DEBUG(LogCategory::CONFIG) << "Read " << filePath
                                       << (network_.empty() ? "" : " for " + network_);
    }
    return result;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content) {
    std::istringstream stream(content);
    return ParseStream(stream);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return TryGetString(key).has_value();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = networkValues_.find(key);
    if (it != networkValues_.end()) {
        return it->second;
    }
    it = global_.find(key);
    if (it != global_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

int64_t ConfigManager::GetIntInRange(const std::string& key,
                                     int64_t defaultValue,
                                     int64_t minValue,
                                     int64_t maxValue) const {
    auto str = TryGetString(key);
    if (!str) {
        return defaultValue;
    }

    int64_t value = 0;
    size_t used = 0;
    try {
        value = std::stoll(*str, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != str->size() || value < minValue || value > maxValue) {
        throw ValidationError("invalid value for " + key + ": " + *str);
    }
    return value;
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    networkValues_.erase(key);
    global_[key] = value;
}

void ConfigureLogging(const ConfigManager& config) {
    auto level = config.TryGetString(ConfigKeys::DEBUG);
    if (!level) {
        return;
    }

    // A bare "debug" line reads as "1"
    LogLevel parsed = (*level == "1" || *level == "true")
                          ? LogLevel::Debug
                          : LogLevelFromString(*level);
    Logger::Instance().SetLevel(parsed);
    LOG_INFO(LogCategory::CONFIG) << "Log level set to " << LogLevelToString(parsed);
}

} // namespace util
} // namespace chainsync
