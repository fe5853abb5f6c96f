#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace util {

/**
 * Process-wide settings read from a JSON file and then from VCODEC_*
 * environment variables (environment wins).
 *
 * {
 *   "logging": { "level": "info", "console": true, "file": false, ... },
 *   "codec":   { "request_complex_types": true, "default_timezone": "UTC" }
 * }
 */
class Config {
public:
    struct LoggingConfig {
        std::string level = "info";
        bool console = true;
        bool file = false;
        std::string filePath = "logs/vcodec.log";
        size_t rotateMaxSizeMb = 5;
        size_t rotateMaxFiles = 3;
    };

    struct CodecConfig {
        bool requestComplexTypes = true;
        std::string defaultTimezone = "UTC";
    };

    // Returns false when the file could not be opened; env overrides still apply
    static bool load(const std::string& jsonPath);
    static void loadFromJsonText(const std::string& jsonText);
    static LoggingConfig& logging() { return instance().logging_; }
    static CodecConfig& codec() { return instance().codec_; }

    // Restore built-in defaults (tests)
    static void reset();

private:
    Config() = default;
    static Config& instance();

    void loadFromEnv();
    void loadFromJson(const nlohmann::json& j);

    LoggingConfig logging_;
    CodecConfig codec_;
};

bool parseBoolSetting(const std::string& text, bool fallback);

}  // namespace util
