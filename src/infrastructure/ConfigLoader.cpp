/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace submitkit::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

EngineConfig ConfigLoader::Load(const std::string& settingsPath) {
    EngineConfig config;
    std::filesystem::path configPath = settingsPath.empty()
        ? PathUtils::GetDefaultSettingsPath()
        : std::filesystem::path(settingsPath);

    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            ReadKey(j, "host", config.host);
            ReadKey(j, "port", config.port);
            ReadKey(j, "artifact_dir", config.artifactDir);
            ReadKey(j, "max_upload_bytes", config.maxUploadBytes);
            ReadKey(j, "artifact_ttl_seconds", config.artifactTtlSeconds);
            ReadKey(j, "sweep_interval_seconds", config.sweepIntervalSeconds);
            ReadKey(j, "tool_timeout_seconds", config.toolTimeoutSeconds);
            ReadKey(j, "risky_size_bytes", config.riskySizeBytes);
            ReadKey(j, "reduction_tools", config.reductionTools);
            ReadKey(j, "conversion_tool", config.conversionTool);
            ReadKey(j, "producer", config.producer);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                      << ". Using defaults." << std::endl;
            config = EngineConfig{};
        }
    }

    const char* port = std::getenv("PORT");
    if (port && *port) {
        try {
            config.port = std::stoi(port);
        } catch (const std::exception&) {
            std::cerr << "[ConfigLoader] Ignoring non-numeric PORT: " << port << std::endl;
        }
    }

    if (config.artifactDir.empty()) {
        config.artifactDir = PathUtils::GetDefaultArtifactDir().string();
    }
    return config;
}

void ConfigLoader::Save(const EngineConfig& config, const std::string& settingsPath) {
    std::filesystem::path configPath(settingsPath);
    nlohmann::json j;

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["host"] = config.host;
    j["port"] = config.port;
    j["artifact_dir"] = config.artifactDir;
    j["max_upload_bytes"] = config.maxUploadBytes;
    j["artifact_ttl_seconds"] = config.artifactTtlSeconds;
    j["sweep_interval_seconds"] = config.sweepIntervalSeconds;
    j["tool_timeout_seconds"] = config.toolTimeoutSeconds;
    j["risky_size_bytes"] = config.riskySizeBytes;
    j["reduction_tools"] = config.reductionTools;
    j["conversion_tool"] = config.conversionTool;
    j["producer"] = config.producer;

    try {
        if (configPath.has_parent_path()) {
            std::filesystem::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << ": " << e.what() << std::endl;
    }
}

} // namespace submitkit::infrastructure
