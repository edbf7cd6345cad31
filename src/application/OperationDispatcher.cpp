/**
 * @file OperationDispatcher.cpp
 * @brief Implementation of OperationDispatcher.
 */

#include "application/OperationDispatcher.hpp"
#include "domain/EngineErrors.hpp"
#include "domain/PageRangeSelector.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

namespace fs = std::filesystem;

namespace submitkit::application {

namespace {

const std::map<std::string, Operation>& OperationTable() {
    static const std::map<std::string, Operation> table = {
        {"compress", Operation::Compress},
        {"merge", Operation::Merge},
        {"split", Operation::Split},
        {"organise", Operation::Organise},
        {"rotate", Operation::Rotate},
        {"image-to-pdf", Operation::ImageToPdf},
        {"metadata", Operation::Metadata},
        {"validate", Operation::Validate},
        {"rename", Operation::Rename},
        {"pdf-to-word", Operation::PdfToWord},
    };
    return table;
}

std::string Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string Param(const OperationRequest& request, const std::string& key) {
    auto it = request.params.find(key);
    return it == request.params.end() ? std::string() : Trim(it->second);
}

std::optional<std::string> OptionalParam(const OperationRequest& request, const std::string& key) {
    std::string value = Param(request, key);
    if (value.empty()) return std::nullopt;
    return value;
}

// Leading integer of a string, parseInt style: "90deg" -> 90, "abc" -> nullopt.
constexpr double kMaxRotationMagnitude = 1e15;

std::optional<long long> LeadingInteger(const std::string& text) {
    std::string s = Trim(text);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || errno == ERANGE) return std::nullopt;
    return value;
}

std::string NameOrDefault(const domain::InputDocument& doc, const std::string& fallback) {
    return doc.originalName.empty() ? fallback : doc.originalName;
}

// Per-operation wording for failures the client cannot act on.
std::string FailureMessage(Operation operation) {
    switch (operation) {
        case Operation::Compress: return "Compression failed";
        case Operation::Merge: return "Merge failed";
        case Operation::Split: return "Failed to split PDF";
        case Operation::Organise: return "Failed to organise PDF";
        case Operation::Rotate: return "Failed to rotate PDF";
        case Operation::ImageToPdf: return "Image conversion failed";
        case Operation::Metadata: return "Metadata update failed";
        case Operation::Validate: return "Validation failed";
        case Operation::Rename: return "Rename failed";
        case Operation::PdfToWord: return "Conversion failed";
    }
    return "Operation failed";
}

DispatchResponse ErrorResponse(int statusCode, const std::string& message) {
    DispatchResponse response;
    response.statusCode = statusCode;
    response.body = {{"error", message}};
    return response;
}

void LogTransition(Operation operation, RequestState state) {
    std::ostream& out = state == RequestState::Failed ? std::cerr : std::cout;
    out << "[Dispatcher] " << OperationName(operation) << " -> " << RequestStateName(state) << std::endl;
}

// Scratch directory for a single conversion; removed on every path out.
class ScratchDir {
public:
    ScratchDir(infrastructure::ArtifactStore& store, fs::path path) : m_store(store), m_path(std::move(path)) {
        fs::create_directories(m_path);
    }
    ~ScratchDir() { m_store.discard(m_path); }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    infrastructure::ArtifactStore& m_store;
    fs::path m_path;
};

} // namespace

std::optional<Operation> ParseOperation(const std::string& name) {
    auto it = OperationTable().find(name);
    if (it == OperationTable().end()) return std::nullopt;
    return it->second;
}

std::string OperationName(Operation operation) {
    for (const auto& [name, op] : OperationTable()) {
        if (op == operation) return name;
    }
    return "unknown";
}

std::string RequestStateName(RequestState state) {
    switch (state) {
        case RequestState::Received: return "received";
        case RequestState::Validated: return "validated";
        case RequestState::Executing: return "executing";
        case RequestState::Succeeded: return "succeeded";
        case RequestState::Failed: return "failed";
    }
    return "unknown";
}

nlohmann::json ResultDescriptor::toJson() const {
    nlohmann::json j;
    if (!artifactRef.empty()) {
        j["url"] = url;
    }
    j["filename"] = filename;
    j["size"] = size;
    if (originalSize) j["originalSize"] = *originalSize;
    if (pageCount) j["pageCount"] = *pageCount;
    if (warning) j["warning"] = *warning;
    if (status) j["status"] = *status;
    if (message) j["message"] = *message;
    if (originalName) j["originalName"] = *originalName;
    return j;
}

OperationDispatcher::OperationDispatcher(CompressionService& compression,
                                         const infrastructure::QpdfDocumentAdapter& documents,
                                         infrastructure::ExternalToolAdapter& tools,
                                         infrastructure::ArtifactStore& store,
                                         Options options)
    : m_compression(compression), m_documents(documents), m_tools(tools), m_store(store), m_options(options) {}

ResultDescriptor OperationDispatcher::dispatch(const OperationRequest& request) {
    LogTransition(request.operation, RequestState::Received);
    try {
        checkInputs(request);
        LogTransition(request.operation, RequestState::Validated);
        LogTransition(request.operation, RequestState::Executing);
        ResultDescriptor result = execute(request);
        LogTransition(request.operation, RequestState::Succeeded);
        return result;
    } catch (const domain::EngineError&) {
        LogTransition(request.operation, RequestState::Failed);
        throw;
    } catch (const std::exception& e) {
        LogTransition(request.operation, RequestState::Failed);
        throw domain::OperationError(e.what());
    }
}

DispatchResponse OperationDispatcher::handle(const OperationRequest& request) {
    const std::string tag = "[Dispatcher] " + OperationName(request.operation) + ": ";
    try {
        DispatchResponse response;
        response.body = dispatch(request).toJson();
        return response;
    } catch (const domain::RequestError& e) {
        return ErrorResponse(e.statusCode(), e.what());
    } catch (const domain::DocumentLoadError& e) {
        std::cerr << tag << e.what() << std::endl;
        return ErrorResponse(422, request.operation == Operation::ImageToPdf ? "Image could not be read"
                                                                             : "Corrupted or not a valid PDF");
    } catch (const domain::CompressionFailure& e) {
        std::cerr << tag << e.what() << std::endl;
        return ErrorResponse(500, "Could not compress file");
    } catch (const domain::ToolTimeout& e) {
        std::cerr << tag << e.what() << std::endl;
        return ErrorResponse(504, "Processing timed out");
    } catch (const domain::ToolExecutionError& e) {
        std::cerr << tag << e.what() << std::endl;
        return ErrorResponse(502, FailureMessage(request.operation));
    } catch (const domain::ArtifactNotFound& e) {
        return ErrorResponse(404, e.what());
    } catch (const std::exception& e) {
        std::cerr << tag << e.what() << std::endl;
        return ErrorResponse(500, FailureMessage(request.operation));
    }
}

void OperationDispatcher::checkInputs(const OperationRequest& request) const {
    switch (request.operation) {
        case Operation::Merge:
            if (request.inputs.size() < 2) throw domain::RequestError("At least 2 files required");
            break;
        case Operation::ImageToPdf:
            if (request.inputs.empty()) throw domain::RequestError("No images uploaded");
            break;
        default:
            if (request.inputs.empty()) throw domain::RequestError("No file uploaded");
            break;
    }

    long long total = 0;
    for (const auto& input : request.inputs) {
        total += input.size();
    }
    if (total > m_options.maxUploadBytes) {
        throw domain::RequestError("File exceeds upload limit", 413);
    }

    switch (request.operation) {
        case Operation::Split:
            if (Param(request, "pages").empty()) throw domain::RequestError("Page range required");
            break;
        case Operation::Organise:
            if (Param(request, "pageOrder").empty()) throw domain::RequestError("Page order required");
            break;
        case Operation::Rotate:
            if (Param(request, "rotations").empty()) throw domain::RequestError("Rotation data required");
            break;
        case Operation::Rename:
            if (Param(request, "rollNo").empty() || Param(request, "subject").empty() ||
                Param(request, "type").empty() || Param(request, "date").empty()) {
                throw domain::RequestError("Roll number, subject, type and date are required");
            }
            break;
        case Operation::Compress:
            if (auto target = OptionalParam(request, "targetSize"); target && !LeadingInteger(*target)) {
                throw domain::RequestError("Invalid target size");
            }
            break;
        default:
            break;
    }
}

ResultDescriptor OperationDispatcher::execute(const OperationRequest& request) {
    switch (request.operation) {
        case Operation::Compress: return compress(request);
        case Operation::Merge: return merge(request);
        case Operation::Split: return selectPages(request, false);
        case Operation::Organise: return selectPages(request, true);
        case Operation::Rotate: return rotate(request);
        case Operation::ImageToPdf: return imageToPdf(request);
        case Operation::Metadata: return updateMetadata(request);
        case Operation::Validate: return validateRoute(request);
        case Operation::Rename: return rename(request);
        case Operation::PdfToWord: return pdfToWord(request);
    }
    throw domain::RequestError("Unknown operation");
}

ResultDescriptor OperationDispatcher::describe(const domain::Artifact& artifact, const std::string& filename) const {
    ResultDescriptor result;
    result.artifactRef = artifact.name;
    result.url = "/download/" + artifact.name;
    result.filename = filename;
    result.size = artifact.size;
    return result;
}

ResultDescriptor OperationDispatcher::compress(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();
    std::optional<long long> target;
    if (auto text = OptionalParam(request, "targetSize")) {
        target = LeadingInteger(*text);
    }

    CompressionOutcome outcome = m_compression.compress(doc, target);
    ResultDescriptor result = describe(outcome.artifact, outcome.artifact.name);
    result.originalSize = outcome.originalSize;
    result.warning = outcome.warning;
    return result;
}

ResultDescriptor OperationDispatcher::merge(const OperationRequest& request) {
    std::vector<infrastructure::PdfDocument> docs;
    docs.reserve(request.inputs.size());
    for (const auto& input : request.inputs) {
        docs.push_back(m_documents.load(input.bytes));
    }

    infrastructure::PdfDocument merged = m_documents.merge(docs);
    domain::Artifact artifact = m_store.put(m_documents.save(merged), "merged.pdf");
    ResultDescriptor result = describe(artifact, artifact.name);
    result.pageCount = m_documents.pageCount(merged);
    return result;
}

ResultDescriptor OperationDispatcher::selectPages(const OperationRequest& request, bool reorder) {
    const domain::InputDocument& doc = request.inputs.front();
    infrastructure::PdfDocument source = m_documents.load(doc.bytes);
    const int pageCount = m_documents.pageCount(source);

    const std::string selection = Param(request, reorder ? "pageOrder" : "pages");
    std::vector<int> pages = domain::PageRangeSelector::Parse(
        selection, pageCount, reorder ? domain::RangeMode::Reorder : domain::RangeMode::Selection);
    if (pages.empty()) {
        throw domain::RequestError(reorder ? "Invalid page order" : "No valid pages selected");
    }

    infrastructure::PdfDocument out =
        m_documents.extractPages(source, domain::PageRangeSelector::ToZeroBased(pages));
    const std::string prefix = reorder ? "organised_" : "split_";
    domain::Artifact artifact = m_store.put(m_documents.save(out), prefix + NameOrDefault(doc, "document.pdf"));

    ResultDescriptor result = describe(artifact, artifact.name);
    result.originalSize = doc.size();
    result.pageCount = static_cast<int>(pages.size());
    return result;
}

domain::RotationMap OperationDispatcher::ParseRotations(const std::string& json) {
    nlohmann::json parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw domain::RequestError("Invalid rotation data");
    }

    domain::RotationMap rotations;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        std::optional<long long> page = LeadingInteger(it.key());
        if (!page || *page < 1 || *page > std::numeric_limits<int>::max()) continue;

        std::optional<long long> degrees;
        const auto& value = it.value();
        if (value.is_number_unsigned()) {
            degrees = static_cast<long long>(value.get<unsigned long long>() % 360);
        } else if (value.is_number_integer()) {
            degrees = value.get<long long>();
        } else if (value.is_number_float()) {
            // Non-finite or huge values are not angles and may not fit a long long.
            const double d = value.get<double>();
            if (std::isfinite(d) && std::fabs(d) <= kMaxRotationMagnitude) {
                degrees = static_cast<long long>(d);
            }
        } else if (value.is_string()) {
            degrees = LeadingInteger(value.get<std::string>());
        }
        if (!degrees) continue;

        rotations[static_cast<int>(*page)] = domain::NormalizeRotation(*degrees);
    }
    return rotations;
}

ResultDescriptor OperationDispatcher::rotate(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();
    domain::RotationMap rotations = ParseRotations(Param(request, "rotations"));

    infrastructure::PdfDocument pdf = m_documents.load(doc.bytes);
    m_documents.rotate(pdf, rotations);
    domain::Artifact artifact = m_store.put(m_documents.save(pdf), "rotated_" + NameOrDefault(doc, "document.pdf"));

    ResultDescriptor result = describe(artifact, artifact.name);
    result.originalSize = doc.size();
    return result;
}

ResultDescriptor OperationDispatcher::imageToPdf(const OperationRequest& request) {
    infrastructure::PdfDocument pdf = m_documents.create();
    for (const auto& image : request.inputs) {
        if (!m_documents.embedRasterPage(pdf, image.bytes, image.mediaType)) {
            std::cout << "[Dispatcher] Skipping unsupported image type: " << image.mediaType << std::endl;
        }
    }

    const int pages = m_documents.pageCount(pdf);
    if (pages == 0) {
        throw domain::RequestError("No supported images found");
    }

    domain::Artifact artifact = m_store.put(m_documents.save(pdf), "converted.pdf");
    ResultDescriptor result = describe(artifact, artifact.name);
    result.pageCount = pages;
    return result;
}

ResultDescriptor OperationDispatcher::updateMetadata(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();

    infrastructure::QpdfDocumentAdapter::Metadata metadata;
    metadata.title = OptionalParam(request, "title");
    metadata.author = OptionalParam(request, "author");
    metadata.subject = OptionalParam(request, "subject");
    metadata.keywords = OptionalParam(request, "keywords");

    infrastructure::PdfDocument pdf = m_documents.load(doc.bytes);
    m_documents.setMetadata(pdf, metadata);
    domain::Artifact artifact = m_store.put(m_documents.save(pdf), "meta_" + NameOrDefault(doc, "document.pdf"));

    return describe(artifact, NameOrDefault(doc, artifact.name));
}

domain::ValidationReport OperationDispatcher::validate(const domain::InputDocument& doc) const {
    domain::ValidationReport report;
    report.size = doc.size();

    infrastructure::PdfDocument pdf;
    try {
        pdf = m_documents.load(doc.bytes);
    } catch (const domain::DocumentLoadError& e) {
        std::cout << "[Dispatcher] Validation load failed: " << e.what() << std::endl;
        report.status = domain::ValidationStatus::Invalid;
        report.message = "Corrupted or not a valid PDF";
        return report;
    }

    if (m_documents.isEncrypted(pdf)) {
        report.status = domain::ValidationStatus::Invalid;
        report.message = "PDF is password protected";
        return report;
    }

    report.pageCount = m_documents.pageCount(pdf);
    report.status = doc.size() > m_options.riskySizeBytes ? domain::ValidationStatus::Risky
                                                         : domain::ValidationStatus::Ready;
    return report;
}

ResultDescriptor OperationDispatcher::validateRoute(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();
    domain::ValidationReport report = validate(doc);

    ResultDescriptor result;
    result.filename = doc.originalName;
    result.size = report.size;
    result.status = domain::ValidationStatusToString(report.status);
    if (report.status == domain::ValidationStatus::Invalid) {
        result.message = report.message;
    } else {
        result.pageCount = report.pageCount;
    }
    return result;
}

std::string OperationDispatcher::SubmissionFilename(const std::string& rollNo, const std::string& subject,
                                                    const std::string& type, const std::string& date) {
    const std::string raw = rollNo + "_" + subject + "_" + type + "_" + date + ".pdf";
    std::string name;
    name.reserve(raw.size());
    for (char c : raw) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-') {
            name.push_back(c);
        }
    }
    return name;
}

ResultDescriptor OperationDispatcher::rename(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();
    const std::string name = SubmissionFilename(Param(request, "rollNo"), Param(request, "subject"),
                                                Param(request, "type"), Param(request, "date"));

    domain::Artifact artifact = m_store.put(doc.bytes, name);
    ResultDescriptor result = describe(artifact, name);
    result.originalName = doc.originalName;
    return result;
}

ResultDescriptor OperationDispatcher::pdfToWord(const OperationRequest& request) {
    const domain::InputDocument& doc = request.inputs.front();

    std::string stem = fs::path(infrastructure::ArtifactStore::SanitizeSuffix(doc.originalName)).stem().string();
    if (stem.empty() || stem == "file") {
        stem = "document";
    }

    ScratchDir scratch(m_store, m_store.reservePath("docx"));
    const fs::path input = scratch.path() / (stem + ".pdf");
    {
        std::ofstream ofs(input, std::ios::binary);
        ofs.write(doc.bytes.data(), static_cast<std::streamsize>(doc.bytes.size()));
        if (!ofs) {
            throw domain::OperationError("Could not stage input for conversion: " + input.string());
        }
    }

    const fs::path produced = m_tools.convertToDocx(input, scratch.path());
    const std::string filename = stem + ".docx";
    domain::Artifact artifact = m_store.adopt(produced, filename);

    ResultDescriptor result = describe(artifact, filename);
    result.originalSize = doc.size();
    return result;
}

} // namespace submitkit::application
