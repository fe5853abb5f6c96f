#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace util {

/**
 * Configuration file lookup.
 *
 * Search order:
 * 1. Paths added with addSearchPath()
 * 2. Current working directory
 * 3. Directory of the running executable
 * 4. Build directory root, source config/ folder (when compiled in)
 * 5. /etc/vcodec
 * 6. ~/.config/vcodec
 * 7. $VCODEC_CONFIG_PATH
 */
class ConfigLoader {
public:
    // Empty string when not found
    static std::string findConfigFile(const std::string& filename);

    static std::vector<std::filesystem::path> getSearchPaths();

    static void addSearchPath(const std::filesystem::path& path);
    static void clearSearchPaths();

private:
    static std::vector<std::filesystem::path> customPaths_;
};

} // namespace util
