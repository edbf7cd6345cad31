#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "application/CompressionService.hpp"
#include "application/OperationDispatcher.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ExternalToolAdapter.hpp"
#include "infrastructure/HttpFront.hpp"
#include "infrastructure/ProcessCommandRunner.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/QpdfDocumentAdapter.hpp"
#include "infrastructure/SignalWatcher.hpp"

using namespace submitkit;

int main(int argc, char** argv) {
    // Before any thread exists, so every later thread inherits the blocked mask.
    infrastructure::SignalWatcher signals;

    // Usage: submitkit_server [settings.json]
    //        submitkit_server --write-config [settings.json]
    const bool writeConfig = argc > 1 && std::string(argv[1]) == "--write-config";
    const int pathArg = writeConfig ? 2 : 1;
    const std::string settingsPath = argc > pathArg ? argv[pathArg] : "";
    infrastructure::EngineConfig config = infrastructure::ConfigLoader::Load(settingsPath);

    if (writeConfig) {
        const std::string target = settingsPath.empty()
            ? infrastructure::PathUtils::GetDefaultSettingsPath().string()
            : settingsPath;
        infrastructure::ConfigLoader::Save(config, target);
        std::cout << "[SYSTEM] Wrote effective configuration to " << target << std::endl;
        return 0;
    }

    infrastructure::ExternalToolAdapter::Options toolOptions;
    toolOptions.reductionCandidates = config.reductionTools;
    toolOptions.conversionTool = config.conversionTool;
    toolOptions.timeout = std::chrono::seconds(config.toolTimeoutSeconds);
    infrastructure::ExternalToolAdapter tools(std::make_shared<infrastructure::ProcessCommandRunner>(), toolOptions);

    infrastructure::QpdfDocumentAdapter documents(config.producer);

    std::unique_ptr<infrastructure::ArtifactStore> store;
    try {
        store = std::make_unique<infrastructure::ArtifactStore>(config.artifactDir);
    } catch (const std::exception& e) {
        std::cerr << "[SYSTEM] Cannot use artifact directory " << config.artifactDir << ": " << e.what() << std::endl;
        return 1;
    }
    store->startSweeper(std::chrono::seconds(config.sweepIntervalSeconds),
                        std::chrono::seconds(config.artifactTtlSeconds));

    application::CompressionService compression(tools, documents, *store);

    application::OperationDispatcher::Options dispatchOptions;
    dispatchOptions.maxUploadBytes = config.maxUploadBytes;
    dispatchOptions.riskySizeBytes = config.riskySizeBytes;
    application::OperationDispatcher dispatcher(compression, documents, tools, *store, dispatchOptions);

    if (auto gs = tools.reductionTool()) {
        std::cout << "[SYSTEM] Ghostscript found (" << *gs << "). Compression enabled." << std::endl;
    } else {
        std::cout << "[SYSTEM] WARNING: Ghostscript not found. Compression will fall back to basic optimization." << std::endl;
    }

    infrastructure::HttpFront::Options frontOptions;
    frontOptions.host = config.host;
    frontOptions.port = config.port;
    frontOptions.maxUploadBytes = config.maxUploadBytes;
    infrastructure::HttpFront front(dispatcher, *store, tools, frontOptions);

    signals.start([&front](int) { front.stop(); });

    const bool ok = front.listen() || signals.triggered();

    signals.stop();
    store->stopSweeper();
    std::cout << "[SYSTEM] Shutdown complete." << std::endl;
    return ok ? 0 : 1;
}
