#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace util {

/**
 * Process-wide "vcodec" logger.
 *
 * init() is idempotent: a second call only adjusts the level of the
 * already registered logger. Library code never calls init() itself;
 * get() lazily creates a console logger at "info".
 */
class Logging {
public:
    static constexpr const char* kLoggerName = "vcodec";

    static void init(const std::string& level = "info",
                     bool console = true,
                     bool file = false,
                     const std::string& filePath = "logs/vcodec.log",
                     size_t maxSizeMb = 5,
                     size_t maxFiles = 3);

    // Initialise from Config::logging()
    static void initFromConfig();

    static std::shared_ptr<spdlog::logger> get();

    // Unknown names map to info
    static spdlog::level::level_enum parseLevel(const std::string& level);

    // Shutdown logging (useful for tests)
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace util
