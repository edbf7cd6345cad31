/**
 * @file ExternalToolAdapter.hpp
 * @brief Adapter for the platform binaries the engine shells out to.
 */

#pragma once
#include "domain/CommandRunner.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace submitkit::infrastructure {

/**
 * @class ExternalToolAdapter
 * @brief Detects and drives Ghostscript (quality reduction) and LibreOffice (conversion).
 *
 * All invocations go through the injected CommandRunner. The reduction tool
 * probe runs at most once per adapter; its result is kept for the adapter's
 * lifetime.
 */
class ExternalToolAdapter {
public:
    struct Options {
        std::vector<std::string> reductionCandidates = {"gswin64c", "gswin32c", "gs"};
        std::string conversionTool = "soffice";
        std::chrono::seconds timeout{120};
    };

    ExternalToolAdapter(std::shared_ptr<domain::CommandRunner> runner, Options options);

    /**
     * @brief Returns the first reduction binary answering "--version", probing on first use.
     * @return Binary name, or nullopt when none of the candidates runs.
     */
    std::optional<std::string> reductionTool();

    /** @brief True once a probe has been performed (successful or not). */
    bool isProbed() const;

    /**
     * @brief Rewrites a PDF with the given quality preset.
     * @param input Source PDF.
     * @param output Destination path; overwritten.
     * @param preset Ghostscript PDFSETTINGS value such as "/ebook".
     * @return Size in bytes of the produced file.
     * @throws domain::ToolUnavailable when no reduction binary exists.
     * @throws domain::ToolTimeout when the deadline expires.
     * @throws domain::ToolExecutionError on non-zero exit or missing output.
     */
    long long reduce(const std::filesystem::path& input, const std::filesystem::path& output, const std::string& preset);

    /**
     * @brief Converts a PDF to DOCX into outputDir.
     * @return Path of the produced .docx (named after the input's stem).
     * @throws domain::ToolTimeout, domain::ToolExecutionError
     */
    std::filesystem::path convertToDocx(const std::filesystem::path& input, const std::filesystem::path& outputDir);

    /**
     * @brief Normalizes a path before handing it to a binary.
     *
     * Produces an absolute, lexically normal path with forward slashes.
     * Rejects empty paths and control characters.
     */
    static std::string SanitizePath(const std::filesystem::path& path);

private:
    enum class ProbeState { NotProbed, Available, Unavailable };

    std::shared_ptr<domain::CommandRunner> m_runner;
    Options m_options;

    mutable std::mutex m_probeMutex;
    ProbeState m_probeState = ProbeState::NotProbed;
    std::string m_reductionTool;
};

} // namespace submitkit::infrastructure
