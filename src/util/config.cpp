#include <vcodec_util/config.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace util {

Config& Config::instance() {
    static Config cfg;
    return cfg;
}

bool Config::load(const std::string& jsonPath) {
    auto& cfg = instance();

    bool found = false;
    std::ifstream file(jsonPath);
    if (file.is_open()) {
        nlohmann::json j;
        file >> j;
        cfg.loadFromJson(j);
        found = true;
    }

    cfg.loadFromEnv();
    return found;
}

void Config::loadFromJsonText(const std::string& jsonText) {
    auto& cfg = instance();
    cfg.loadFromJson(nlohmann::json::parse(jsonText));
    cfg.loadFromEnv();
}

void Config::reset() {
    auto& cfg = instance();
    cfg.logging_ = LoggingConfig{};
    cfg.codec_ = CodecConfig{};
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& jlog = j["logging"];
        if (jlog.contains("level")) logging_.level = jlog["level"];
        if (jlog.contains("console")) logging_.console = jlog["console"];
        if (jlog.contains("file")) logging_.file = jlog["file"];
        if (jlog.contains("file_path")) logging_.filePath = jlog["file_path"];
        if (jlog.contains("rotate_max_size_mb")) logging_.rotateMaxSizeMb = jlog["rotate_max_size_mb"];
        if (jlog.contains("rotate_max_files")) logging_.rotateMaxFiles = jlog["rotate_max_files"];
    }

    if (j.contains("codec")) {
        auto& jcodec = j["codec"];
        if (jcodec.contains("request_complex_types")) codec_.requestComplexTypes = jcodec["request_complex_types"];
        if (jcodec.contains("default_timezone")) codec_.defaultTimezone = jcodec["default_timezone"];
    }
}

void Config::loadFromEnv() {
    if (const char* val = std::getenv("VCODEC_LOG_LEVEL")) logging_.level = val;
    if (const char* val = std::getenv("VCODEC_DEFAULT_TIMEZONE")) codec_.defaultTimezone = val;
    if (const char* val = std::getenv("VCODEC_REQUEST_COMPLEX_TYPES")) {
        codec_.requestComplexTypes = parseBoolSetting(val, codec_.requestComplexTypes);
    }
}

bool parseBoolSetting(const std::string& text, bool fallback) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return fallback;
}

}  // namespace util
