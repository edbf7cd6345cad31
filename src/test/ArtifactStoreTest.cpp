#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/ArtifactStore.hpp"

using namespace submitkit;
using submitkit::infrastructure::ArtifactStore;
namespace fs = std::filesystem;

namespace {

void Age(const fs::path& path, std::chrono::minutes by) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - by);
}

bool ThrowsNotFound(const ArtifactStore& store, const std::string& name) {
    try {
        store.get(name);
    } catch (const domain::ArtifactNotFound&) {
        return true;
    }
    return false;
}

void TestPutAndGet() {
    std::cout << "[Test] put/get..." << std::endl;
    test::TempDir dir("store");
    ArtifactStore store(dir.str());

    domain::Artifact a = store.put("hello", "report.pdf");
    assert(ArtifactStore::IsValidName(a.name));
    assert(a.name.size() == 32 + 1 + std::string("report.pdf").size());
    assert(a.name.substr(33) == "report.pdf");
    assert(a.size == 5);
    assert(store.get(a.name) == "hello");

    // No temp files left behind.
    assert(test::CountEntries(dir.path()) == 1);
    std::cout << "[PASS] Stored artifact reads back." << std::endl;
}

void TestUniqueNames() {
    std::cout << "[Test] Concurrent puts with the same suggested name..." << std::endl;
    test::TempDir dir("store_unique");
    ArtifactStore store(dir.str());

    std::vector<std::thread> threads;
    std::vector<std::string> names(16);
    for (size_t i = 0; i < names.size(); ++i) {
        threads.emplace_back([&store, &names, i]() {
            names[i] = store.put("payload " + std::to_string(i), "merged.pdf").name;
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> unique(names.begin(), names.end());
    assert(unique.size() == names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        assert(store.get(names[i]) == "payload " + std::to_string(i));
    }
    std::cout << "[PASS] Names never collide." << std::endl;
}

void TestSanitization() {
    std::cout << "[Test] Name sanitization..." << std::endl;
    assert(ArtifactStore::SanitizeSuffix("../../etc/passwd") == "etcpasswd");
    assert(ArtifactStore::SanitizeSuffix("my report (final).pdf") == "myreportfinal.pdf");
    assert(ArtifactStore::SanitizeSuffix("...hidden") == "hidden");
    assert(ArtifactStore::SanitizeSuffix("") == "file");
    assert(ArtifactStore::SanitizeSuffix("///") == "file");

    std::string longName(200, 'a');
    longName += ".pdf";
    std::string suffix = ArtifactStore::SanitizeSuffix(longName);
    assert(suffix.size() == 96);
    assert(suffix.substr(suffix.size() - 4) == ".pdf");

    test::TempDir dir("store_sanitize");
    ArtifactStore store(dir.str());
    domain::Artifact a = store.put("x", "../../escape.pdf");
    assert(fs::path(a.path).parent_path() == fs::path(store.root()));
    std::cout << "[PASS] Suffixes stay inside the store." << std::endl;
}

void TestRejectsBadNames() {
    std::cout << "[Test] get() rejects malformed names..." << std::endl;
    test::TempDir dir("store_reject");
    ArtifactStore store(dir.str());

    // A file that exists next to the store must not be reachable.
    std::ofstream(dir.path().parent_path() / "submitkit_outside.txt") << "secret";

    assert(ThrowsNotFound(store, "../submitkit_outside.txt"));
    assert(ThrowsNotFound(store, ""));
    assert(ThrowsNotFound(store, "notatoken_file.pdf"));
    assert(ThrowsNotFound(store, std::string(32, 'A') + "_file.pdf"));
    assert(ThrowsNotFound(store, std::string(32, 'a') + "_.hidden"));
    assert(ThrowsNotFound(store, std::string(32, 'a') + "_missing.pdf"));

    // Working files are never downloadable.
    fs::path work = store.reservePath("input.pdf");
    std::ofstream(work) << "tmp";
    assert(ThrowsNotFound(store, work.filename().string()));

    fs::remove(dir.path().parent_path() / "submitkit_outside.txt");
    std::cout << "[PASS] Traversal and malformed names are NotFound." << std::endl;
}

void TestAdopt() {
    std::cout << "[Test] adopt..." << std::endl;
    test::TempDir dir("store_adopt");
    ArtifactStore store(dir.str());

    fs::path work = store.reservePath("comp_ebook.pdf");
    assert(!fs::exists(work));
    std::ofstream(work, std::ios::binary) << "candidate";

    domain::Artifact a = store.adopt(work, "compressed_thesis.pdf");
    assert(!fs::exists(work));
    assert(store.get(a.name) == "candidate");
    assert(a.size == 9);

    std::cout << "[PASS] Produced files are promoted to artifacts." << std::endl;
}

void TestSweep() {
    std::cout << "[Test] TTL sweep..." << std::endl;
    test::TempDir dir("store_sweep");
    ArtifactStore store(dir.str());

    domain::Artifact fresh = store.put("fresh", "fresh.pdf");
    domain::Artifact stale = store.put("stale", "stale.pdf");
    // Left behind by an earlier process: nothing holds it in flight.
    fs::path staleWork = dir.path() / ("work_" + ArtifactStore::GenerateToken() + "_docx");
    fs::create_directories(staleWork / "profile");
    std::ofstream(staleWork / "profile" / "lock") << "x";

    Age(stale.path, std::chrono::minutes(10));
    Age(staleWork, std::chrono::minutes(10));

    int deleted = store.sweep(std::chrono::minutes(5));
    assert(deleted == 2);
    assert(store.get(fresh.name) == "fresh");
    assert(ThrowsNotFound(store, stale.name));
    assert(!fs::exists(staleWork));

    // Nothing is old enough now.
    assert(store.sweep(std::chrono::minutes(5)) == 0);

    // An injected clock far in the future evicts everything.
    auto later = fs::file_time_type::clock::now() + std::chrono::hours(1);
    assert(store.sweep(std::chrono::minutes(5), later) == 1);
    assert(ThrowsNotFound(store, fresh.name));
    std::cout << "[PASS] Entries older than the TTL are evicted." << std::endl;
}

void TestSweepSkipsInFlightWork() {
    std::cout << "[Test] Sweep skips reserved working files..." << std::endl;
    test::TempDir dir("store_inflight");
    ArtifactStore store(dir.str());

    fs::path input = store.reservePath("input.pdf");
    std::ofstream(input, std::ios::binary) << "input";
    fs::path candidate = store.reservePath("comp_ebook.pdf");
    std::ofstream(candidate, std::ios::binary) << "candidate";
    Age(input, std::chrono::minutes(10));

    auto later = fs::file_time_type::clock::now() + std::chrono::hours(1);
    assert(store.sweep(std::chrono::minutes(5), later) == 0);
    assert(fs::exists(input));
    assert(fs::exists(candidate));

    // Once adopted, the artifact ages out normally.
    domain::Artifact a = store.adopt(candidate, "compressed.pdf");
    store.discard(input);
    assert(!fs::exists(input));
    assert(store.sweep(std::chrono::minutes(5), later) == 1);
    assert(ThrowsNotFound(store, a.name));
    std::cout << "[PASS] In-flight working files survive the sweep." << std::endl;
}

void TestBackgroundSweeper() {
    std::cout << "[Test] Background sweeper start/stop..." << std::endl;
    test::TempDir dir("store_sweeper");
    ArtifactStore store(dir.str());

    domain::Artifact stale = store.put("stale", "stale.pdf");
    Age(stale.path, std::chrono::minutes(10));

    store.startSweeper(std::chrono::seconds(1), std::chrono::seconds(60));
    store.startSweeper(std::chrono::seconds(1), std::chrono::seconds(60)); // no-op

    bool evicted = false;
    for (int i = 0; i < 50 && !evicted; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        evicted = !fs::exists(stale.path);
    }
    store.stopSweeper();
    store.stopSweeper(); // idempotent

    assert(evicted);
    std::cout << "[PASS] Sweeper evicts in the background and stops cleanly." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArtifactStore Test..." << std::endl;

    TestPutAndGet();
    TestUniqueNames();
    TestSanitization();
    TestRejectsBadNames();
    TestAdopt();
    TestSweep();
    TestSweepSkipsInFlightWork();
    TestBackgroundSweeper();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
