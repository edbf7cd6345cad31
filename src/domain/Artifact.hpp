/**
 * @file Artifact.hpp
 * @brief Generated output file living on ephemeral storage.
 */

#pragma once
#include <chrono>
#include <string>

namespace submitkit::domain {

/**
 * @struct Artifact
 * @brief A downloadable result with a bounded lifetime.
 *
 * The name is the only handle; whoever holds it may download the artifact
 * until the store evicts it.
 */
struct Artifact {
    std::string name;  ///< Store-assigned name: <token>_<sanitized suffix>.
    std::string path;  ///< Absolute location inside the store directory.
    long long size = 0;
    std::chrono::system_clock::time_point createdAt;
};

} // namespace submitkit::domain
