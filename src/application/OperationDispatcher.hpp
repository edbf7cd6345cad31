/**
 * @file OperationDispatcher.hpp
 * @brief Single entry point that validates, routes and normalizes every operation.
 */

#pragma once
#include "application/CompressionService.hpp"
#include "domain/InputDocument.hpp"
#include "domain/RotationMap.hpp"
#include "domain/ValidationReport.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/ExternalToolAdapter.hpp"
#include "infrastructure/QpdfDocumentAdapter.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace submitkit::application {

/**
 * @enum Operation
 * @brief Everything a client can ask the engine to do.
 */
enum class Operation {
    Compress,
    Merge,
    Split,
    Organise,
    Rotate,
    ImageToPdf,
    Metadata,
    Validate,
    Rename,
    PdfToWord
};

/** @brief Maps a route name ("image-to-pdf") to an Operation. */
std::optional<Operation> ParseOperation(const std::string& name);
std::string OperationName(Operation operation);

/**
 * @enum RequestState
 * @brief Lifecycle of one request. There is no way back from Failed.
 */
enum class RequestState {
    Received,
    Validated,
    Executing,
    Succeeded,
    Failed
};

std::string RequestStateName(RequestState state);

/**
 * @struct OperationRequest
 * @brief Files in submission order plus the raw form parameters.
 */
struct OperationRequest {
    Operation operation = Operation::Validate;
    std::vector<domain::InputDocument> inputs;
    std::map<std::string, std::string> params;
};

/**
 * @struct ResultDescriptor
 * @brief Normalized success payload returned to the client.
 */
struct ResultDescriptor {
    std::string artifactRef;  ///< Store name; empty for validate.
    std::string url;          ///< Download route for artifactRef.
    std::string filename;     ///< Name to present to the user.
    long long size = 0;
    std::optional<long long> originalSize;
    std::optional<int> pageCount;
    std::optional<std::string> warning;
    std::optional<std::string> status;        ///< validate only.
    std::optional<std::string> message;
    std::optional<std::string> originalName;  ///< rename only.

    nlohmann::json toJson() const;
};

/**
 * @struct DispatchResponse
 * @brief HTTP-shaped result of handle(); body always carries either a result or "error".
 */
struct DispatchResponse {
    int statusCode = 200;
    nlohmann::json body;
};

/**
 * @class OperationDispatcher
 * @brief Routes requests to the components and turns failures into client responses.
 *
 * Input checks run before any component is touched. Failures are never
 * retried; internal detail (paths, qpdf messages) is logged, not returned.
 */
class OperationDispatcher {
public:
    struct Options {
        long long maxUploadBytes = 50LL * 1024 * 1024;
        long long riskySizeBytes = 5LL * 1024 * 1024;
    };

    OperationDispatcher(CompressionService& compression,
                        const infrastructure::QpdfDocumentAdapter& documents,
                        infrastructure::ExternalToolAdapter& tools,
                        infrastructure::ArtifactStore& store,
                        Options options);

    /**
     * @brief Executes a request.
     * @throws domain::EngineError subclasses; never anything else.
     */
    ResultDescriptor dispatch(const OperationRequest& request);

    /** @brief dispatch() with every failure mapped to a status code and a safe message. */
    DispatchResponse handle(const OperationRequest& request);

    /** @brief Classifies a document for submission portals. Never throws for bad input. */
    domain::ValidationReport validate(const domain::InputDocument& doc) const;

    /**
     * @brief Parses a JSON object such as {"1": 90, "3": "180"}.
     * @throws domain::RequestError for anything that is not a JSON object.
     */
    static domain::RotationMap ParseRotations(const std::string& json);

    /** @brief "<rollNo>_<subject>_<type>_<date>.pdf" with unsafe characters removed. */
    static std::string SubmissionFilename(const std::string& rollNo, const std::string& subject,
                                          const std::string& type, const std::string& date);

private:
    void checkInputs(const OperationRequest& request) const;
    ResultDescriptor execute(const OperationRequest& request);

    ResultDescriptor compress(const OperationRequest& request);
    ResultDescriptor merge(const OperationRequest& request);
    ResultDescriptor selectPages(const OperationRequest& request, bool reorder);
    ResultDescriptor rotate(const OperationRequest& request);
    ResultDescriptor imageToPdf(const OperationRequest& request);
    ResultDescriptor updateMetadata(const OperationRequest& request);
    ResultDescriptor validateRoute(const OperationRequest& request);
    ResultDescriptor rename(const OperationRequest& request);
    ResultDescriptor pdfToWord(const OperationRequest& request);

    ResultDescriptor describe(const domain::Artifact& artifact, const std::string& filename) const;

    CompressionService& m_compression;
    const infrastructure::QpdfDocumentAdapter& m_documents;
    infrastructure::ExternalToolAdapter& m_tools;
    infrastructure::ArtifactStore& m_store;
    Options m_options;
};

} // namespace submitkit::application
