#include "infrastructure/ExternalToolAdapter.hpp"
#include "domain/EngineErrors.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace submitkit::infrastructure {

ExternalToolAdapter::ExternalToolAdapter(std::shared_ptr<domain::CommandRunner> runner, Options options)
    : m_runner(std::move(runner)), m_options(std::move(options)) {}

std::optional<std::string> ExternalToolAdapter::reductionTool() {
    std::lock_guard<std::mutex> lock(m_probeMutex);
    if (m_probeState == ProbeState::NotProbed) {
        m_probeState = ProbeState::Unavailable;
        for (const auto& candidate : m_options.reductionCandidates) {
            auto res = m_runner->run({candidate, "--version"}, std::chrono::seconds(10));
            if (res.started && !res.timedOut && res.exitCode == 0) {
                m_reductionTool = candidate;
                m_probeState = ProbeState::Available;
                std::cout << "[ToolAdapter] Ghostscript found: " << candidate << std::endl;
                break;
            }
        }
        if (m_probeState == ProbeState::Unavailable) {
            std::cerr << "[ToolAdapter] Ghostscript NOT found. Compression will use the basic fallback." << std::endl;
        }
    }

    if (m_probeState == ProbeState::Available) return m_reductionTool;
    return std::nullopt;
}

bool ExternalToolAdapter::isProbed() const {
    std::lock_guard<std::mutex> lock(m_probeMutex);
    return m_probeState != ProbeState::NotProbed;
}

long long ExternalToolAdapter::reduce(const fs::path& input, const fs::path& output, const std::string& preset) {
    auto tool = reductionTool();
    if (!tool) {
        throw domain::ToolUnavailable("No quality-reduction binary available");
    }

    const std::string safeInput = SanitizePath(input);
    const std::string safeOutput = SanitizePath(output);

    std::vector<std::string> argv = {
        *tool,
        "-sDEVICE=pdfwrite",
        "-dCompatibilityLevel=1.4",
        "-dPDFSETTINGS=" + preset,
        "-dNOPAUSE",
        "-dQUIET",
        "-dBATCH",
        "-dSAFER",
        "-sOutputFile=" + safeOutput,
        safeInput
    };

    std::cout << "[ToolAdapter] Running " << *tool << " with preset " << preset << std::endl;
    auto res = m_runner->run(argv, m_options.timeout);

    if (res.timedOut) {
        throw domain::ToolTimeout(*tool + " timed out after " + std::to_string(m_options.timeout.count()) + "s");
    }
    if (!res.started || res.exitCode != 0) {
        std::cerr << "[ToolAdapter] " << *tool << " failed (exit " << res.exitCode << "): " << res.output << std::endl;
        throw domain::ToolExecutionError(*tool + " exited with code " + std::to_string(res.exitCode));
    }

    std::error_code ec;
    auto size = fs::file_size(output, ec);
    if (ec) {
        std::cerr << "[ToolAdapter] Output missing after " << *tool << " success: " << output << std::endl;
        throw domain::ToolExecutionError("Output file not created");
    }
    std::cout << "[ToolAdapter] Preset " << preset << " -> " << (size / 1024.0) << " KiB" << std::endl;
    return static_cast<long long>(size);
}

fs::path ExternalToolAdapter::convertToDocx(const fs::path& input, const fs::path& outputDir) {
    const std::string safeInput = SanitizePath(input);
    const std::string safeOutDir = SanitizePath(outputDir);

    // A private profile lets concurrent conversions run without fighting over the user's lock file.
    std::vector<std::string> argv = {
        m_options.conversionTool,
        "-env:UserInstallation=file://" + safeOutDir + "/profile",
        "--headless",
        "--infilter=writer_pdf_import",
        "--convert-to", "docx",
        "--outdir", safeOutDir,
        safeInput
    };

    std::cout << "[ToolAdapter] Converting " << input.filename() << " with " << m_options.conversionTool << std::endl;
    auto res = m_runner->run(argv, m_options.timeout);

    if (!res.started) {
        throw domain::ToolExecutionError(m_options.conversionTool + " is not installed");
    }
    if (res.timedOut) {
        throw domain::ToolTimeout(m_options.conversionTool + " timed out after " + std::to_string(m_options.timeout.count()) + "s");
    }
    if (res.exitCode != 0) {
        // LibreOffice reports warnings through its exit status; the output file decides.
        std::cerr << "[ToolAdapter] " << m_options.conversionTool << " log: " << res.output << std::endl;
    }

    fs::path expected = outputDir / (input.stem().string() + ".docx");
    if (!fs::exists(expected)) {
        throw domain::ToolExecutionError("Output file not found. Conversion might have failed silently.");
    }
    return expected;
}

std::string ExternalToolAdapter::SanitizePath(const fs::path& path) {
    if (path.empty()) {
        throw domain::ToolExecutionError("Empty path passed to external tool");
    }
    std::string normalized = fs::absolute(path).lexically_normal().generic_string();
    for (char c : normalized) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            throw domain::ToolExecutionError("Path contains control characters");
        }
    }
    // Native Windows separators would be taken literally by Ghostscript.
    for (char& c : normalized) {
        if (c == '\\') c = '/';
    }
    return normalized;
}

} // namespace submitkit::infrastructure
