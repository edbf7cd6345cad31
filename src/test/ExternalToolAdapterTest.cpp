#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/ExternalToolAdapter.hpp"

using namespace submitkit;
using submitkit::infrastructure::ExternalToolAdapter;
namespace fs = std::filesystem;

namespace {

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void TestProbeOrderAndCaching() {
    std::cout << "[Test] Probe order and caching..." << std::endl;
    auto runner = std::make_shared<test::FakeCommandRunner>();
    runner->installed = {"gswin32c", "gs"};
    ExternalToolAdapter tools(runner, ExternalToolAdapter::Options{});

    assert(!tools.isProbed());
    auto tool = tools.reductionTool();
    assert(tool && *tool == "gswin32c");
    assert(tools.isProbed());
    assert(runner->versionProbes() == 2); // gswin64c failed, gswin32c answered

    // Cached: no further probes, even from many threads.
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&tools]() { assert(tools.reductionTool()); });
    }
    for (auto& t : threads) t.join();
    assert(runner->versionProbes() == 2);
    std::cout << "[PASS] First answering candidate wins, probe runs once." << std::endl;
}

void TestProbeUnavailable() {
    std::cout << "[Test] No reduction binary..." << std::endl;
    auto runner = std::make_shared<test::FakeCommandRunner>();
    ExternalToolAdapter tools(runner, ExternalToolAdapter::Options{});

    assert(!tools.reductionTool());
    assert(!tools.reductionTool());
    assert(runner->versionProbes() == 3);

    test::TempDir dir("tools_none");
    assert(Throws<domain::ToolUnavailable>([&] { tools.reduce(dir.path() / "in.pdf", dir.path() / "out.pdf", "/ebook"); }));
    std::cout << "[PASS] Unavailable result is cached too." << std::endl;
}

void TestReduce() {
    std::cout << "[Test] reduce()..." << std::endl;
    auto runner = std::make_shared<test::FakeCommandRunner>();
    runner->installed = {"gs"};
    runner->presetSizes = {{"/screen", 1234}};
    runner->failingPresets = {"/printer"};
    runner->timingOutPresets = {"/prepress"};
    ExternalToolAdapter tools(runner, ExternalToolAdapter::Options{});

    test::TempDir dir("tools_reduce");
    const fs::path in = dir.path() / "in.pdf";
    const fs::path out = dir.path() / "out.pdf";
    std::ofstream(in) << "%PDF-1.4";

    assert(tools.reduce(in, out, "/screen") == 1234);
    assert(fs::file_size(out) == 1234);

    const auto calls = runner->calls();
    const auto& call = calls.back();
    assert(call.front() == "gs");
    assert(call.back() == ExternalToolAdapter::SanitizePath(in));
    bool hasPreset = false, hasSafer = false;
    for (const auto& arg : call) {
        hasPreset = hasPreset || arg == "-dPDFSETTINGS=/screen";
        hasSafer = hasSafer || arg == "-dSAFER";
    }
    assert(hasPreset && hasSafer);

    assert(Throws<domain::ToolExecutionError>([&] { tools.reduce(in, dir.path() / "p.pdf", "/printer"); }));
    assert(Throws<domain::ToolTimeout>([&] { tools.reduce(in, dir.path() / "t.pdf", "/prepress"); }));
    std::cout << "[PASS] Presets run, failures and timeouts are typed." << std::endl;
}

void TestConvert() {
    std::cout << "[Test] convertToDocx()..." << std::endl;
    auto runner = std::make_shared<test::FakeCommandRunner>();
    ExternalToolAdapter tools(runner, ExternalToolAdapter::Options{});

    test::TempDir dir("tools_convert");
    const fs::path in = dir.path() / "essay.pdf";
    std::ofstream(in) << "%PDF-1.4";

    fs::path docx = tools.convertToDocx(in, dir.path());
    assert(docx == dir.path() / "essay.docx");
    assert(fs::exists(docx));
    fs::remove(docx);

    // A non-zero exit with output present is still a success.
    runner->conversionExitCode = 1;
    assert(fs::exists(tools.convertToDocx(in, dir.path())));
    fs::remove(dir.path() / "essay.docx");

    runner->conversionWritesOutput = false;
    assert(Throws<domain::ToolExecutionError>([&] { tools.convertToDocx(in, dir.path()); }));

    runner->conversionInstalled = false;
    assert(Throws<domain::ToolExecutionError>([&] { tools.convertToDocx(in, dir.path()); }));
    std::cout << "[PASS] Output file decides success." << std::endl;
}

void TestSanitizePath() {
    std::cout << "[Test] SanitizePath()..." << std::endl;
    const std::string p = ExternalToolAdapter::SanitizePath("/tmp/a/../b/./c.pdf");
    assert(p == "/tmp/b/c.pdf");
    assert(fs::path(ExternalToolAdapter::SanitizePath("rel.pdf")).is_absolute());
    assert(Throws<domain::ToolExecutionError>([] { ExternalToolAdapter::SanitizePath(""); }));
    assert(Throws<domain::ToolExecutionError>([] { ExternalToolAdapter::SanitizePath("/tmp/bad\nname.pdf"); }));
    std::cout << "[PASS] Paths normalized, control characters rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ExternalToolAdapter Test..." << std::endl;

    TestProbeOrderAndCaching();
    TestProbeUnavailable();
    TestReduce();
    TestConvert();
    TestSanitizePath();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
