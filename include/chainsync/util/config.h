// CHAINSYNC - Configuration File Parser
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Reads node-style configuration (the bitcoin.conf layout) for the provider
// and the sync engine.
//
// Format:
// - Lines starting with # are comments
// - key=value pairs; a bare key reads as "1"
// - [network] headers; keys under the selected network override global
//   ones, keys under any other network are ignored
// - Values can be quoted: key="value with spaces"
// - ${VAR} expands from the environment

#ifndef CHAINSYNC_UTIL_CONFIG_H
#define CHAINSYNC_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace chainsync {
namespace util {

/// Longest accepted line
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    int errorLine{0};

    static ConfigParseResult Success() { return {true, "", 0}; }
    static ConfigParseResult Error(const std::string& msg, int line = 0) {
        return {false, msg, line};
    }
};

/**
 * Key/value settings with an optional network overlay. Later parses
 * overwrite earlier values of the same key.
 */
class ConfigManager {
public:
    /// @param network Section whose keys override globals, e.g. "regtest"
    explicit ConfigManager(std::string network = "");

    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content);

    bool HasKey(const std::string& key) const;

    /// Network value if set, else the global one
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /**
     * Integer within [minValue, maxValue], or defaultValue when the key is
     * absent. Throws ValidationError if present but unparsable or out of range.
     */
    int64_t GetIntInRange(const std::string& key,
                          int64_t defaultValue,
                          int64_t minValue,
                          int64_t maxValue) const;

    /// Set a global value, overriding anything parsed
    void Set(const std::string& key, const std::string& value);

    const std::string& GetNetwork() const { return network_; }

    /// Expand ${VAR} references; unset variables expand to nothing
    static std::string ExpandEnvVars(const std::string& value);

private:
    ConfigParseResult ParseStream(std::istream& stream);

    std::string network_;
    std::map<std::string, std::string> global_;
    std::map<std::string, std::string> networkValues_;
};

/// Apply the `debug` key (a log level name, or a bare flag for Debug)
void ConfigureLogging(const ConfigManager& config);

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Node connection
    constexpr const char* RPCCONNECT = "rpcconnect";
    constexpr const char* RPCPORT = "rpcport";
    constexpr const char* RPCUSER = "rpcuser";
    constexpr const char* RPCPASSWORD = "rpcpassword";
    constexpr const char* ZMQPORT = "zmqport";
    constexpr const char* RECONNECTATTEMPTS = "reconnectattempts";
    constexpr const char* RECONNECTINTERVAL = "reconnectinterval";
    constexpr const char* PROVIDERTHREADS = "providerthreads";

    // Response cache
    constexpr const char* CACHETIMEOUT = "cachetimeout";
    constexpr const char* MAXCACHESIZE = "maxcachesize";
    constexpr const char* CACHESWEEPINTERVAL = "cachesweepinterval";

    // Sync engine
    constexpr const char* GAPLIMIT = "gaplimit";
    constexpr const char* MINCONFIRMATIONS = "minconfirmations";
    constexpr const char* MAXSCRIPTWATCH = "maxscriptwatch";
    constexpr const char* SYNCTHREADS = "syncthreads";

    // Logging
    constexpr const char* DEBUG = "debug";
}

} // namespace util
} // namespace chainsync

#endif // CHAINSYNC_UTIL_CONFIG_H
