#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/QpdfDocumentAdapter.hpp"
#include "infrastructure/RasterImage.hpp"

using namespace submitkit;
using submitkit::infrastructure::PdfDocument;
using submitkit::infrastructure::QpdfDocumentAdapter;

namespace {

using Pages = std::vector<int>;

template <typename E, typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

// Round-trips through save/load so assertions see what a client would download.
PdfDocument Reload(const QpdfDocumentAdapter& adapter, const PdfDocument& doc) {
    return adapter.load(adapter.save(doc));
}

void TestLoad(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] load()..." << std::endl;
    PdfDocument doc = adapter.load(test::MakePdf(4));
    assert(adapter.pageCount(doc) == 4);
    assert(!adapter.isEncrypted(doc));

    assert(Throws<domain::DocumentLoadError>([&] { adapter.load("definitely not a pdf"); }));
    assert(Throws<domain::DocumentLoadError>([&] { adapter.load(""); }));
    std::cout << "[PASS] Valid PDFs load, garbage fails fast." << std::endl;
}

void TestMergeOrder(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] merge()..." << std::endl;
    PdfDocument a = adapter.load(test::MakePdf(2));
    PdfDocument b = adapter.load(test::MakePdf(3));

    PdfDocument merged = Reload(adapter, adapter.merge({b, a}));
    assert(adapter.pageCount(merged) == 5);
    assert((test::PageNumbers(merged) == Pages{1, 2, 3, 1, 2}));

    // The same source twice yields independent copies.
    PdfDocument twice = Reload(adapter, adapter.merge({a, a}));
    assert((test::PageNumbers(twice) == Pages{1, 2, 1, 2}));
    std::cout << "[PASS] Pages appended in input order." << std::endl;
}

void TestExtractPages(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] extractPages()..." << std::endl;
    PdfDocument doc = adapter.load(test::MakePdf(5));

    PdfDocument picked = Reload(adapter, adapter.extractPages(doc, {4, 0, 2}));
    assert((test::PageNumbers(picked) == Pages{5, 1, 3}));

    PdfDocument dup = adapter.extractPages(doc, {1, 1});
    adapter.rotate(dup, {{1, 90}});
    dup = Reload(adapter, dup);
    assert((test::PageNumbers(dup) == Pages{2, 2}));
    assert(adapter.rotationOf(dup, 0) == 90);
    assert(adapter.rotationOf(dup, 1) == 0);

    assert(Throws<domain::OperationError>([&] { adapter.extractPages(doc, {5}); }));
    assert(Throws<domain::OperationError>([&] { adapter.extractPages(doc, {-1}); }));
    std::cout << "[PASS] Order kept, duplicates independent." << std::endl;
}

void TestRotate(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] rotate()..." << std::endl;
    PdfDocument doc = adapter.load(test::MakePdf(3));

    adapter.rotate(doc, {{1, 270}, {2, -90}, {3, 45}, {9, 90}});
    adapter.rotate(doc, {{1, 180}});
    doc = Reload(adapter, doc);

    assert(adapter.rotationOf(doc, 0) == 90);
    assert(adapter.rotationOf(doc, 1) == 270);
    assert(adapter.rotationOf(doc, 2) == 0);
    assert(adapter.pageCount(doc) == 3);
    std::cout << "[PASS] Deltas accumulate modulo 360; invalid entries ignored." << std::endl;
}

void TestMetadata(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] setMetadata()..." << std::endl;
    PdfDocument doc = adapter.load(test::MakePdf(1));

    QpdfDocumentAdapter::Metadata first;
    first.title = "Lab Report";
    first.author = "A. Student";
    first.keywords = "physics, optics ,lab";
    adapter.setMetadata(doc, first);

    QpdfDocumentAdapter::Metadata second;
    second.subject = "PHY101";
    second.title = "";
    adapter.setMetadata(doc, second);

    doc = Reload(adapter, doc);
    assert(adapter.infoField(doc, "/Title") == std::optional<std::string>("Lab Report"));
    assert(adapter.infoField(doc, "/Author") == std::optional<std::string>("A. Student"));
    assert(adapter.infoField(doc, "/Subject") == std::optional<std::string>("PHY101"));
    assert(adapter.infoField(doc, "/Keywords") == std::optional<std::string>("physics optics lab"));
    assert(adapter.infoField(doc, "/Producer") == std::optional<std::string>(adapter.producer()));

    QpdfDocumentAdapter custom("Registrar Office");
    PdfDocument other = custom.load(test::MakePdf(1));
    custom.setMetadata(other, {});
    assert(custom.infoField(other, "/Producer") == std::optional<std::string>("Registrar Office"));
    assert(!custom.infoField(other, "/Title"));
    std::cout << "[PASS] Only supplied fields change, producer stamped." << std::endl;
}

void TestRasterPages(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] embedRasterPage()..." << std::endl;
    PdfDocument doc = adapter.create();
    assert(adapter.pageCount(doc) == 0);

    assert(adapter.embedRasterPage(doc, test::MakeJpeg(64, 48), "image/jpeg"));
    assert(adapter.embedRasterPage(doc, test::MakePng(30, 20, true), "image/png"));
    assert(adapter.embedRasterPage(doc, test::MakePng(10, 12, false), "IMAGE/PNG; charset=binary"));
    assert(adapter.embedRasterPage(doc, test::MakeJpeg(8, 8), "image/jpg"));
    assert(!adapter.embedRasterPage(doc, "GIF89a", "image/gif"));

    doc = Reload(adapter, doc);
    assert(adapter.pageCount(doc) == 4);
    assert((test::PageSize(doc, 0) == std::pair<int, int>{64, 48}));
    assert((test::PageSize(doc, 1) == std::pair<int, int>{30, 20}));
    assert((test::PageSize(doc, 2) == std::pair<int, int>{10, 12}));
    assert((test::PageSize(doc, 3) == std::pair<int, int>{8, 8}));

    assert(Throws<domain::DocumentLoadError>([&] { adapter.embedRasterPage(doc, "broken", "image/png"); }));
    assert(Throws<domain::DocumentLoadError>([&] { adapter.embedRasterPage(doc, "broken", "image/jpeg"); }));
    assert(adapter.pageCount(doc) == 4);
    std::cout << "[PASS] Pages sized to the image, unsupported types skipped." << std::endl;
}

void TestRasterDecoder() {
    std::cout << "[Test] RasterDecoder..." << std::endl;
    auto jpeg = infrastructure::RasterDecoder::Decode(test::MakeJpeg(16, 9), "image/jpeg");
    assert(jpeg && jpeg->encoding == infrastructure::RasterImage::Encoding::Dct);
    assert(jpeg->width == 16 && jpeg->height == 9 && jpeg->components == 3);

    auto png = infrastructure::RasterDecoder::Decode(test::MakePng(5, 4, true), "image/png");
    assert(png && png->encoding == infrastructure::RasterImage::Encoding::Raw);
    assert(png->data.size() == 5u * 4u * 3u);
    assert(png->alpha.size() == 5u * 4u);

    auto opaque = infrastructure::RasterDecoder::Decode(test::MakePng(5, 4, false), "image/png");
    assert(opaque && opaque->alpha.empty());

    assert(!infrastructure::RasterDecoder::Decode("x", "application/pdf"));
    std::cout << "[PASS] JPEG passthrough, PNG alpha split." << std::endl;
}

void TestEncryption(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] Encrypted input..." << std::endl;
    PdfDocument open = adapter.load(test::MakeEncryptedPdf(2, ""));
    assert(adapter.isEncrypted(open));
    assert(adapter.pageCount(open) == 2);

    assert(Throws<domain::DocumentLoadError>([&] { adapter.load(test::MakeEncryptedPdf(2, "user-secret")); }));
    std::cout << "[PASS] Encryption detected; password-locked files fail to load." << std::endl;
}

void TestOptimize(const QpdfDocumentAdapter& adapter) {
    std::cout << "[Test] optimize()..." << std::endl;
    std::string optimized = adapter.optimize(test::MakePdf(6));
    PdfDocument doc = adapter.load(optimized);
    assert((test::PageNumbers(doc) == Pages{1, 2, 3, 4, 5, 6}));
    assert(Throws<domain::DocumentLoadError>([&] { adapter.optimize("%PDF-1.4 truncated"); }));
    std::cout << "[PASS] Structural resave keeps content." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentAdapter Test..." << std::endl;
    QpdfDocumentAdapter adapter;

    TestLoad(adapter);
    TestMergeOrder(adapter);
    TestExtractPages(adapter);
    TestRotate(adapter);
    TestMetadata(adapter);
    TestRasterPages(adapter);
    TestRasterDecoder();
    TestEncryption(adapter);
    TestOptimize(adapter);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
