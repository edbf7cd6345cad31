/**
 * @file ArtifactStore.cpp
 * @brief Implementation of ArtifactStore.
 */

#include "infrastructure/ArtifactStore.hpp"
#include "domain/EngineErrors.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace submitkit::infrastructure {

namespace {

constexpr size_t kTokenLength = 32;
constexpr size_t kMaxSuffixLength = 96;

bool IsSafeChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '.' || c == '-';
}

domain::Artifact Describe(const std::string& name, const fs::path& path) {
    domain::Artifact artifact;
    artifact.name = name;
    artifact.path = path.string();
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    artifact.size = ec ? 0 : static_cast<long long>(size);
    artifact.createdAt = std::chrono::system_clock::now();
    return artifact;
}

} // namespace

ArtifactStore::ArtifactStore(const std::string& rootDir)
    : m_root(fs::absolute(rootDir).lexically_normal()) {
    if (!fs::exists(m_root)) fs::create_directories(m_root);
}

ArtifactStore::~ArtifactStore() {
    stopSweeper();
}

std::string ArtifactStore::GenerateToken() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);
    static const char hex[] = "0123456789abcdef";
    std::string token;
    token.reserve(kTokenLength);
    for (size_t i = 0; i < kTokenLength; ++i) {
        token += hex[nibble(engine)];
    }
    return token;
}

std::string ArtifactStore::SanitizeSuffix(const std::string& suggestedName) {
    std::string out;
    out.reserve(suggestedName.size());
    for (char c : suggestedName) {
        if (IsSafeChar(c)) out.push_back(c);
    }
    out.erase(0, out.find_first_not_of('.'));
    if (out.size() > kMaxSuffixLength) {
        // Keep the tail so the extension survives.
        out = out.substr(out.size() - kMaxSuffixLength);
        out.erase(0, out.find_first_not_of('.'));
    }
    if (out.empty()) out = "file";
    return out;
}

bool ArtifactStore::IsValidName(const std::string& name) {
    if (name.size() < kTokenLength + 2 || name.size() > kTokenLength + 1 + kMaxSuffixLength) return false;
    for (size_t i = 0; i < kTokenLength; ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(name[i])) || std::isupper(static_cast<unsigned char>(name[i]))) {
            return false;
        }
    }
    if (name[kTokenLength] != '_') return false;
    if (name[kTokenLength + 1] == '.') return false;
    for (size_t i = kTokenLength + 1; i < name.size(); ++i) {
        if (!IsSafeChar(name[i])) return false;
    }
    return true;
}

domain::Artifact ArtifactStore::put(const std::string& bytes, const std::string& suggestedName) {
    const std::string name = GenerateToken() + "_" + SanitizeSuffix(suggestedName);
    const fs::path finalPath = m_root / name;
    fs::path tempPath = finalPath;
    tempPath += ".part";

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[ArtifactStore] Failed to open temp file: " << tempPath << std::endl;
            throw domain::OperationError("Could not write artifact");
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (ofs.fail()) {
            std::cerr << "[ArtifactStore] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            discard(tempPath);
            throw domain::OperationError("Could not write artifact");
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Rename failed: " << ec.message() << std::endl;
        discard(tempPath);
        throw domain::OperationError("Could not write artifact");
    }
    return Describe(name, finalPath);
}

fs::path ArtifactStore::pathFor(const std::string& name) const {
    if (!IsValidName(name)) {
        throw domain::ArtifactNotFound("File not found or expired");
    }
    fs::path path = m_root / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw domain::ArtifactNotFound("File not found or expired");
    }
    return path;
}

std::string ArtifactStore::get(const std::string& name) const {
    fs::path path = pathFor(name);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        // Swept between the existence check and the open.
        throw domain::ArtifactNotFound("File not found or expired");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

fs::path ArtifactStore::reservePath(const std::string& suffix) {
    const std::string name = "work_" + GenerateToken() + "_" + SanitizeSuffix(suffix);
    std::lock_guard<std::mutex> lock(m_inFlightMutex);
    m_inFlight.insert(name);
    return m_root / name;
}

void ArtifactStore::release(const fs::path& path) {
    std::lock_guard<std::mutex> lock(m_inFlightMutex);
    m_inFlight.erase(path.filename().string());
}

bool ArtifactStore::isInFlight(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(m_inFlightMutex);
    return m_inFlight.count(path.filename().string()) > 0;
}

domain::Artifact ArtifactStore::adopt(const fs::path& producedFile, const std::string& suggestedName) {
    const std::string name = GenerateToken() + "_" + SanitizeSuffix(suggestedName);
    const fs::path finalPath = m_root / name;

    std::error_code ec;
    fs::rename(producedFile, finalPath, ec);
    if (ec) {
        // Different filesystem (tool wrote outside the store): copy, then drop the source.
        ec.clear();
        fs::copy_file(producedFile, finalPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::cerr << "[ArtifactStore] Could not adopt " << producedFile << ": " << ec.message() << std::endl;
            throw domain::OperationError("Could not store artifact");
        }
        discard(producedFile);
    }
    release(producedFile);
    return Describe(name, finalPath);
}

void ArtifactStore::discard(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Failed to discard " << path << ": " << ec.message() << std::endl;
    }
    // Released after removal so the sweep never sees it unpinned while it exists.
    release(path);
}

int ArtifactStore::sweep(std::chrono::seconds maxAge, fs::file_time_type now) {
    int deleted = 0;
    std::error_code ec;
    fs::directory_iterator it(m_root, ec);
    if (ec) {
        std::cerr << "[ArtifactStore] Cleanup error: " << ec.message() << std::endl;
        return 0;
    }

    for (const auto& entry : it) {
        if (isInFlight(entry.path())) continue;

        std::error_code entryEc;
        auto mtime = fs::last_write_time(entry.path(), entryEc);
        if (entryEc) {
            // Vanished under us (downloaded and removed, or another sweep); not an error.
            continue;
        }
        if (now - mtime <= maxAge) continue;

        fs::remove_all(entry.path(), entryEc);
        if (entryEc) {
            std::cerr << "[ArtifactStore] Cleanup error for " << entry.path().filename() << ": "
                      << entryEc.message() << std::endl;
            continue;
        }
        std::cout << "[ArtifactStore] Deleted old temp file: " << entry.path().filename().string() << std::endl;
        ++deleted;
    }
    return deleted;
}

void ArtifactStore::startSweeper(std::chrono::seconds interval, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(m_sweeperMutex);
    if (m_sweeperRunning) return;
    m_sweeperRunning = true;
    m_sweeper = std::thread(&ArtifactStore::sweeperLoop, this, interval, ttl);
}

void ArtifactStore::stopSweeper() {
    {
        std::lock_guard<std::mutex> lock(m_sweeperMutex);
        if (!m_sweeperRunning) return;
        m_sweeperRunning = false;
    }
    m_sweeperCv.notify_all();

    if (m_sweeper.joinable()) {
        m_sweeper.join();
    }
}

void ArtifactStore::sweeperLoop(std::chrono::seconds interval, std::chrono::seconds ttl) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_sweeperMutex);
            bool stopping = m_sweeperCv.wait_for(lock, interval, [this] { return !m_sweeperRunning; });
            if (stopping) return;
        }

        // Sweep outside the lock so stopSweeper() is never blocked behind disk I/O.
        try {
            sweep(ttl);
        } catch (const std::exception& e) {
            std::cerr << "[ArtifactStore] Cleanup error: " << e.what() << std::endl;
        }
    }
}

} // namespace submitkit::infrastructure
