#include <vcodec_util/config_loader.h>
#include <vcodec_util/logging.h>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>
#include <climits>

namespace fs = std::filesystem;

namespace util {

std::vector<fs::path> ConfigLoader::customPaths_;

std::string ConfigLoader::findConfigFile(const std::string& filename) {
    auto paths = getSearchPaths();
    auto logger = Logging::get();

    for (const auto& dir : paths) {
        auto fullPath = dir / filename;
        std::error_code ec;
        if (fs::is_regular_file(fullPath, ec)) {
            if (logger) logger->debug("ConfigLoader: found {}", fullPath.string());
            return fullPath.string();
        }
    }

    if (logger) {
        logger->debug("ConfigLoader: '{}' not found in {} search paths", filename, paths.size());
    }
    return "";
}

std::vector<fs::path> ConfigLoader::getSearchPaths() {
    std::vector<fs::path> paths;

    paths.insert(paths.end(), customPaths_.begin(), customPaths_.end());

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) paths.push_back(cwd);

    #ifdef __linux__
    char exePath[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exePath, sizeof(exePath) - 1);
    if (len != -1) {
        exePath[len] = '\0';
        paths.push_back(fs::path(exePath).parent_path());
    }
    #endif

    #ifdef CMAKE_BINARY_DIR
    paths.push_back(fs::path(CMAKE_BINARY_DIR));
    #endif

    #ifdef CMAKE_SOURCE_DIR
    paths.push_back(fs::path(CMAKE_SOURCE_DIR) / "config");
    #endif

    paths.push_back(fs::path("/etc/vcodec"));

    const char* home = std::getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) home = pw->pw_dir;
    }
    if (home) {
        paths.push_back(fs::path(home) / ".config" / "vcodec");
    }

    if (const char* configPath = std::getenv("VCODEC_CONFIG_PATH")) {
        paths.push_back(fs::path(configPath));
    }

    return paths;
}

void ConfigLoader::addSearchPath(const fs::path& path) {
    customPaths_.push_back(path);
}

void ConfigLoader::clearSearchPaths() {
    customPaths_.clear();
}

} // namespace util
