/**
 * @file CompressionService.hpp
 * @brief Size-targeted PDF compression with graceful degradation.
 */

#pragma once
#include "domain/Artifact.hpp"
#include "domain/InputDocument.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ExternalToolAdapter.hpp"
#include "infrastructure/QpdfDocumentAdapter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace submitkit::application {

/**
 * @struct CompressionOutcome
 * @brief Promoted artifact plus how it was obtained.
 */
struct CompressionOutcome {
    domain::Artifact artifact;
    long long originalSize = 0;
    std::optional<std::string> warning;  ///< Set in fallback mode.
    std::optional<std::string> preset;   ///< Preset of the promoted candidate, if any ran.
    bool skipped = false;                ///< Input already met the target; stored verbatim.
};

/**
 * @class CompressionService
 * @brief Greedy search over descending-quality presets for an artifact within a target size.
 *
 * With a target, the first candidate at or under it wins; otherwise the
 * smallest candidate seen is kept. Superseded candidates are deleted as soon
 * as they lose, so at most two candidates exist on disk at any time. Without
 * the reduction binary, a structural resave is returned with a warning.
 */
class CompressionService {
public:
    static const std::vector<std::string>& Presets();
    static const std::string& DefaultPreset();
    static const std::string& FallbackWarning();

    CompressionService(infrastructure::ExternalToolAdapter& tools,
                       const infrastructure::QpdfDocumentAdapter& documents,
                       infrastructure::ArtifactStore& store);

    /**
     * @brief Compresses a PDF.
     * @param doc Uploaded document.
     * @param targetSize Desired maximum size in bytes; <= 0 never stops the search early.
     * @throws domain::CompressionFailure when no preset produced a file.
     * @throws domain::DocumentLoadError when the fallback path cannot parse the input.
     */
    CompressionOutcome compress(const domain::InputDocument& doc, std::optional<long long> targetSize);

private:
    struct Candidate {
        std::string preset;
        std::filesystem::path path;
        long long size = 0;
    };

    CompressionOutcome fallback(const domain::InputDocument& doc, const std::string& outputName);
    std::optional<Candidate> search(const std::filesystem::path& input, std::optional<long long> targetSize);
    std::optional<Candidate> runPreset(const std::filesystem::path& input, const std::string& preset);

    infrastructure::ExternalToolAdapter& m_tools;
    const infrastructure::QpdfDocumentAdapter& m_documents;
    infrastructure::ArtifactStore& m_store;
};

} // namespace submitkit::application
