/**
 * @file ArtifactStore.hpp
 * @brief Ephemeral on-disk storage for generated artifacts.
 */

#pragma once
#include "domain/Artifact.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace submitkit::infrastructure {

/**
 * @class ArtifactStore
 * @brief Owns a single directory of short-lived files addressed by unguessable names.
 *
 * Names are "<32 hex token>_<sanitized suffix>", so concurrent requests never
 * collide and user-supplied names can never escape the directory. There is
 * no ownership tracking: knowing a name is enough to read the artifact until
 * it is swept.
 */
class ArtifactStore {
public:
    /** @param rootDir Directory to manage; created if missing. */
    explicit ArtifactStore(const std::string& rootDir);
    ~ArtifactStore();

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /**
     * @brief Stores bytes under a fresh name (temp write + atomic rename).
     * @param suggestedName Client-influenced name; only its safe characters survive.
     * @throws domain::OperationError if the file cannot be written.
     */
    domain::Artifact put(const std::string& bytes, const std::string& suggestedName);

    /**
     * @brief Reads an artifact back.
     * @throws domain::ArtifactNotFound for unknown, malformed or evicted names.
     */
    std::string get(const std::string& name) const;

    /**
     * @brief Resolves a name to its on-disk path after validating it.
     * @throws domain::ArtifactNotFound
     */
    std::filesystem::path pathFor(const std::string& name) const;

    /**
     * @brief Returns a unique, not yet existing path inside the store.
     *
     * Used for working files written by external tools. The path stays in
     * flight, and the sweep skips it, until it is adopted or discarded.
     * Working files left by an earlier process are swept like any other entry.
     */
    std::filesystem::path reservePath(const std::string& suffix);

    /**
     * @brief Promotes a file produced inside the store (see reservePath) to an artifact.
     * @throws domain::OperationError if the file cannot be moved.
     */
    domain::Artifact adopt(const std::filesystem::path& producedFile, const std::string& suggestedName);

    /** @brief Best-effort removal of a working file or directory; failures are logged. */
    void discard(const std::filesystem::path& path);

    /**
     * @brief Deletes every entry last modified more than maxAge before now.
     * @return Number of entries deleted. Per-entry errors are logged and skipped.
     */
    int sweep(std::chrono::seconds maxAge,
              std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now());

    /** @brief Starts the background sweeper (no-op if already running). */
    void startSweeper(std::chrono::seconds interval, std::chrono::seconds ttl);

    /** @brief Stops and joins the background sweeper. */
    void stopSweeper();

    const std::filesystem::path& root() const { return m_root; }

    static std::string SanitizeSuffix(const std::string& suggestedName);
    static bool IsValidName(const std::string& name);
    static std::string GenerateToken();

private:
    void sweeperLoop(std::chrono::seconds interval, std::chrono::seconds ttl);
    void release(const std::filesystem::path& path);
    bool isInFlight(const std::filesystem::path& path) const;

    std::filesystem::path m_root;

    // Working files reserved by running requests, by file name
    mutable std::mutex m_inFlightMutex;
    std::set<std::string> m_inFlight;

    // Sweeper control
    std::thread m_sweeper;
    std::mutex m_sweeperMutex;
    std::condition_variable m_sweeperCv;
    std::atomic<bool> m_sweeperRunning{false};
};

} // namespace submitkit::infrastructure
