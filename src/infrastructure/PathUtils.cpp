#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace submitkit::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::temp_directory_path();
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "SubmitKit" / "settings.json";
}

fs::path PathUtils::GetDefaultArtifactDir() {
    return GetCacheHome() / "SubmitKit" / "temp";
}

} // namespace submitkit::infrastructure
