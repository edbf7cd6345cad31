/**
 * @file EngineErrors.hpp
 * @brief Typed failures raised by the processing engine.
 *
 * Components throw these; the OperationDispatcher is the only place that
 * catches them and turns them into client responses.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace submitkit::domain {

/** @brief Common base so the dispatcher can catch every engine failure at once. */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Missing or invalid input; the client can fix it and resubmit. */
class RequestError : public EngineError {
public:
    explicit RequestError(const std::string& message, int statusCode = 400)
        : EngineError(message), m_statusCode(statusCode) {}

    int statusCode() const { return m_statusCode; }

private:
    int m_statusCode;
};

/** @brief Input bytes could not be parsed as a document or image. */
class DocumentLoadError : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief Every compression attempt failed to produce a candidate. */
class CompressionFailure : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief No usable binary was found. Soft: callers switch to a fallback path. */
class ToolUnavailable : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief An external binary ran past its deadline and was killed. */
class ToolTimeout : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief An external binary failed or produced no output. */
class ToolExecutionError : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief Generic internal failure. */
class OperationError : public EngineError {
public:
    using EngineError::EngineError;
};

/** @brief Requested artifact does not exist (never created, or already swept). */
class ArtifactNotFound : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace submitkit::domain
