// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace submitkit::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief Default settings.json location: $XDG_CONFIG_HOME/SubmitKit/settings.json. */
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief Default artifact directory: $XDG_CACHE_HOME/SubmitKit/temp. Not created here. */
    static std::filesystem::path GetDefaultArtifactDir();
};

} // namespace submitkit::infrastructure
