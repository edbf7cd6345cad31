/**
 * @file InputDocument.hpp
 * @brief Immutable upload received for a single request.
 */

#pragma once
#include <string>

namespace submitkit::domain {

/**
 * @struct InputDocument
 * @brief Raw bytes of an uploaded file plus what the client declared about it.
 */
struct InputDocument {
    std::string bytes;        ///< File content as received.
    std::string mediaType;    ///< Declared MIME type (e.g. "application/pdf", "image/png").
    std::string originalName; ///< Client-side file name, never used as a path.

    long long size() const { return static_cast<long long>(bytes.size()); }
};

} // namespace submitkit::domain
