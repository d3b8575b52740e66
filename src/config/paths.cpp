#include "config/paths.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

namespace cfi::paths {

static fs::path configPathOverride;
static fs::path logPathOverride;

fs::path getConfigPath() {
    if (!configPathOverride.empty()) return configPathOverride;
    if (const char* env = std::getenv("CFI_CONFIG"); env && *env) return env;
    return "/etc/cfinvalidator/config.yaml";
}

fs::path getLogPath() {
    if (!logPathOverride.empty()) return logPathOverride;
    return "/var/log/cfinvalidator";
}

void setConfigPath(const fs::path& path) {
    configPathOverride = path;
}

void setLogPathForTesting() {
    logPathOverride = fs::temp_directory_path() / "cfinvalidator_test_logs";
}

}
