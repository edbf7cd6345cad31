/**
 * @file CompressionService.cpp
 * @brief Implementation of CompressionService.
 */

#include "application/CompressionService.hpp"
#include "domain/EngineErrors.hpp"

#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace submitkit::application {

namespace {

// Removes a working file when the search leaves scope, whatever the outcome.
class WorkingFile {
public:
    WorkingFile(infrastructure::ArtifactStore& store, fs::path path) : m_store(store), m_path(std::move(path)) {}
    ~WorkingFile() { m_store.discard(m_path); }
    WorkingFile(const WorkingFile&) = delete;
    WorkingFile& operator=(const WorkingFile&) = delete;

    const fs::path& path() const { return m_path; }

private:
    infrastructure::ArtifactStore& m_store;
    fs::path m_path;
};

} // namespace

const std::vector<std::string>& CompressionService::Presets() {
    static const std::vector<std::string> presets = {"/prepress", "/printer", "/ebook", "/screen"};
    return presets;
}

const std::string& CompressionService::DefaultPreset() {
    static const std::string preset = "/ebook";
    return preset;
}

const std::string& CompressionService::FallbackWarning() {
    static const std::string warning = "Basic optimization only. Install Ghostscript for max compression.";
    return warning;
}

CompressionService::CompressionService(infrastructure::ExternalToolAdapter& tools,
                                       const infrastructure::QpdfDocumentAdapter& documents,
                                       infrastructure::ArtifactStore& store)
    : m_tools(tools), m_documents(documents), m_store(store) {}

CompressionOutcome CompressionService::compress(const domain::InputDocument& doc, std::optional<long long> targetSize) {
    const std::string outputName = "compressed_" + (doc.originalName.empty() ? std::string("document.pdf") : doc.originalName);

    if (targetSize && *targetSize > 0 && doc.size() <= *targetSize) {
        std::cout << "[Compression] Skipping compression: " << doc.size() << " <= " << *targetSize << std::endl;
        CompressionOutcome outcome;
        outcome.artifact = m_store.put(doc.bytes, outputName);
        outcome.originalSize = doc.size();
        outcome.skipped = true;
        return outcome;
    }

    if (!m_tools.reductionTool()) {
        return fallback(doc, outputName);
    }

    WorkingFile input(m_store, m_store.reservePath("input.pdf"));
    {
        std::ofstream ofs(input.path(), std::ios::binary);
        ofs.write(doc.bytes.data(), static_cast<std::streamsize>(doc.bytes.size()));
        if (!ofs) {
            throw domain::OperationError("Could not stage input for compression");
        }
    }

    std::optional<Candidate> best = search(input.path(), targetSize);

    if (!best) {
        throw domain::CompressionFailure("Could not compress file");
    }

    CompressionOutcome outcome;
    outcome.artifact = m_store.adopt(best->path, outputName);
    outcome.originalSize = doc.size();
    outcome.preset = best->preset;
    std::cout << "[Compression] Promoted " << best->preset << " (" << outcome.artifact.size
              << " bytes, original " << doc.size() << ")" << std::endl;
    return outcome;
}

CompressionOutcome CompressionService::fallback(const domain::InputDocument& doc, const std::string& outputName) {
    std::cout << "[Compression] Ghostscript not found. Using fallback (qpdf) optimization." << std::endl;

    std::string optimized = m_documents.optimize(doc.bytes);

    CompressionOutcome outcome;
    outcome.artifact = m_store.put(optimized, outputName);
    outcome.originalSize = doc.size();
    outcome.warning = FallbackWarning();
    return outcome;
}

std::optional<CompressionService::Candidate> CompressionService::search(const fs::path& input, std::optional<long long> targetSize) {
    if (!targetSize) {
        return runPreset(input, DefaultPreset());
    }

    const long long target = *targetSize;
    std::optional<Candidate> best;
    try {
        for (const auto& preset : Presets()) {
            auto candidate = runPreset(input, preset);
            if (!candidate) continue;

            if (target > 0 && candidate->size <= target) {
                if (best) m_store.discard(best->path);
                return candidate;
            }

            if (!best || candidate->size < best->size) {
                if (best) m_store.discard(best->path);
                best = std::move(candidate);
            } else {
                m_store.discard(candidate->path);
            }
        }
    } catch (const domain::ToolTimeout&) {
        // A hung tool ends the request; do not leave the current best behind.
        if (best) m_store.discard(best->path);
        throw;
    }
    return best;
}

std::optional<CompressionService::Candidate> CompressionService::runPreset(const fs::path& input, const std::string& preset) {
    Candidate candidate;
    candidate.preset = preset;
    candidate.path = m_store.reservePath("comp_" + preset.substr(1) + ".pdf");

    try {
        candidate.size = m_tools.reduce(input, candidate.path, preset);
        return candidate;
    } catch (const domain::ToolTimeout& e) {
        std::cerr << "[Compression] Compression step timed out (" << preset << "): " << e.what() << std::endl;
        m_store.discard(candidate.path);
        throw;
    } catch (const domain::ToolExecutionError& e) {
        std::cerr << "[Compression] Compression step failed (" << preset << "): " << e.what() << std::endl;
    }
    m_store.discard(candidate.path);
    return std::nullopt;
}

} // namespace submitkit::application
