/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Every setting has a default, so a missing or partial file is never an error.
 */

#pragma once

#include <string>
#include <vector>

namespace submitkit::infrastructure {

/**
 * @struct EngineConfig
 * @brief Effective runtime settings for the server and its components.
 */
struct EngineConfig {
    std::string host = "0.0.0.0";
    int port = 5000;
    std::string artifactDir;                       ///< Empty means PathUtils::GetDefaultArtifactDir().
    long long maxUploadBytes = 50LL * 1024 * 1024;
    int artifactTtlSeconds = 5 * 60;
    int sweepIntervalSeconds = 60;
    int toolTimeoutSeconds = 120;
    long long riskySizeBytes = 5LL * 1024 * 1024;  ///< Validation marks larger files RISKY.
    std::vector<std::string> reductionTools = {"gswin64c", "gswin32c", "gs"};
    std::string conversionTool = "soffice";
    std::string producer = "College Submission Toolkit";
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file, falling back to defaults per key.
     * @param settingsPath Path to settings.json; empty uses PathUtils::GetDefaultSettingsPath().
     * @return Effective configuration, with the PORT environment variable applied last.
     */
    static EngineConfig Load(const std::string& settingsPath = "");

    /**
     * @brief Writes the configuration to settings.json, preserving unknown keys if possible.
     */
    static void Save(const EngineConfig& config, const std::string& settingsPath);
};

} // namespace submitkit::infrastructure
