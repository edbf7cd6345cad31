/**
 * @file QpdfDocumentAdapter.cpp
 * @brief Implementation of QpdfDocumentAdapter.
 */

#include "infrastructure/QpdfDocumentAdapter.hpp"
#include "infrastructure/RasterImage.hpp"
#include "domain/EngineErrors.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace submitkit::infrastructure {

namespace {

// Pages already copied into the output, per source document. A page requested
// twice must become two page objects, not two references to one.
using CopiedPages = std::map<unsigned long long, std::set<QPDFObjGen>>;

void AppendPage(QPDFPageDocumentHelper& dest, QPDFPageObjectHelper page, CopiedPages& copied) {
    const QPDFObjGen og = page.getObjectHandle().getObjGen();
    const unsigned long long from = page.getObjectHandle().getOwningQPDF()->getUniqueId();
    if (copied[from].count(og)) {
        page = page.shallowCopyPage();
    } else {
        copied[from].insert(og);
    }
    dest.addPage(page, false);
}

std::string ToString(std::shared_ptr<Buffer> const& buffer) {
    return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
}

std::string JoinKeywords(const std::string& commaList) {
    std::string joined;
    std::stringstream ss(commaList);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (item.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += item;
    }
    return joined;
}

QPDFObjectHandle InfoDictionary(QPDF& pdf) {
    QPDFObjectHandle trailer = pdf.getTrailer();
    QPDFObjectHandle info = trailer.getKey("/Info");
    if (!info.isDictionary()) {
        info = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", info);
    }
    return info;
}

QPDFObjectHandle ImageStream(QPDF& pdf, int width, int height, const std::string& colorSpace) {
    QPDFObjectHandle stream = pdf.newStream();
    QPDFObjectHandle dict = stream.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(height));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(colorSpace));
    return stream;
}

std::string ColorSpaceFor(int components) {
    switch (components) {
        case 1: return "/DeviceGray";
        case 4: return "/DeviceCMYK";
        default: return "/DeviceRGB";
    }
}

} // namespace

QpdfDocumentAdapter::QpdfDocumentAdapter(std::string producer)
    : m_producer(std::move(producer)) {}

PdfDocument QpdfDocumentAdapter::load(const std::string& bytes) const {
    auto source = std::make_shared<const std::string>(bytes);
    auto pdf = std::make_shared<QPDF>();
    pdf->setSuppressWarnings(true);

    try {
        pdf->processMemoryFile("upload.pdf", source->data(), source->size());
        // The page tree is parsed lazily; force it so damage shows up here and not mid-operation.
        QPDFPageDocumentHelper(*pdf).getAllPages();
    } catch (const std::exception& e) {
        throw domain::DocumentLoadError(std::string("Corrupted or not a valid PDF: ") + e.what());
    }

    PdfDocument doc;
    doc.m_pdf = std::move(pdf);
    doc.m_retained.push_back(source);
    return doc;
}

PdfDocument QpdfDocumentAdapter::create() const {
    PdfDocument doc;
    doc.m_pdf = std::make_shared<QPDF>();
    doc.m_pdf->emptyPDF();
    return doc;
}

PdfDocument QpdfDocumentAdapter::merge(const std::vector<PdfDocument>& docs) const {
    PdfDocument merged = create();
    QPDFPageDocumentHelper dest(merged.qpdf());
    CopiedPages copied;

    for (const auto& doc : docs) {
        if (doc.isNull()) continue;
        for (auto& page : QPDFPageDocumentHelper(doc.qpdf()).getAllPages()) {
            AppendPage(dest, page, copied);
        }
        merged.m_retained.push_back(doc.m_pdf);
        merged.m_retained.insert(merged.m_retained.end(), doc.m_retained.begin(), doc.m_retained.end());
    }
    return merged;
}

PdfDocument QpdfDocumentAdapter::extractPages(const PdfDocument& doc, const std::vector<int>& indices) const {
    std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(doc.qpdf()).getAllPages();

    PdfDocument out = create();
    QPDFPageDocumentHelper dest(out.qpdf());
    CopiedPages copied;

    for (int index : indices) {
        if (index < 0 || index >= static_cast<int>(pages.size())) {
            throw domain::OperationError("Page index out of range: " + std::to_string(index));
        }
        AppendPage(dest, pages[static_cast<size_t>(index)], copied);
    }

    out.m_retained.push_back(doc.m_pdf);
    out.m_retained.insert(out.m_retained.end(), doc.m_retained.begin(), doc.m_retained.end());
    return out;
}

bool QpdfDocumentAdapter::embedRasterPage(PdfDocument& doc, const std::string& imageBytes, const std::string& mimeType) const {
    auto raster = RasterDecoder::Decode(imageBytes, mimeType);
    if (!raster) {
        std::cout << "[DocumentModel] Skipping unsupported image type: " << mimeType << std::endl;
        return false;
    }

    QPDF& pdf = doc.qpdf();
    QPDFObjectHandle image = ImageStream(pdf, raster->width, raster->height, ColorSpaceFor(raster->components));

    if (raster->encoding == RasterImage::Encoding::Dct) {
        image.replaceStreamData(raster->data, QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
        if (raster->invertedCmyk) {
            std::vector<QPDFObjectHandle> decode;
            for (int i = 0; i < 4; ++i) {
                decode.push_back(QPDFObjectHandle::newInteger(1));
                decode.push_back(QPDFObjectHandle::newInteger(0));
            }
            image.getDict().replaceKey("/Decode", QPDFObjectHandle::newArray(decode));
        }
    } else {
        // Unfiltered data; QPDFWriter applies Flate on output.
        image.replaceStreamData(raster->data, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
    }

    if (!raster->alpha.empty()) {
        QPDFObjectHandle mask = ImageStream(pdf, raster->width, raster->height, "/DeviceGray");
        mask.replaceStreamData(raster->alpha, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
        image.getDict().replaceKey("/SMask", mask);
    }

    std::ostringstream content;
    content << "q\n" << raster->width << " 0 0 " << raster->height << " 0 0 cm\n/Im0 Do\nQ\n";

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Im0", image);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", QPDFObjectHandle::newArray(
        QPDFObjectHandle::Rectangle(0, 0, raster->width, raster->height)));
    page.replaceKey("/Contents", pdf.newStream(content.str()));
    page.replaceKey("/Resources", resources);

    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
    return true;
}

void QpdfDocumentAdapter::rotate(PdfDocument& doc, const domain::RotationMap& rotations) const {
    std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(doc.qpdf()).getAllPages();

    for (const auto& [pageNumber, delta] : rotations) {
        const int index = pageNumber - 1;
        if (index < 0 || index >= static_cast<int>(pages.size())) continue;
        if (delta % 90 != 0) {
            std::cerr << "[DocumentModel] Ignoring rotation of " << delta << " degrees on page " << pageNumber << std::endl;
            continue;
        }

        const int current = rotationOf(doc, index);
        const int next = domain::NormalizeRotation(static_cast<long long>(current) + delta);
        pages[static_cast<size_t>(index)].getObjectHandle().replaceKey("/Rotate", QPDFObjectHandle::newInteger(next));
    }
}

int QpdfDocumentAdapter::rotationOf(const PdfDocument& doc, int pageIndex) const {
    std::vector<QPDFPageObjectHelper> pages = QPDFPageDocumentHelper(doc.qpdf()).getAllPages();
    if (pageIndex < 0 || pageIndex >= static_cast<int>(pages.size())) {
        throw domain::OperationError("Page index out of range: " + std::to_string(pageIndex));
    }
    QPDFObjectHandle rotate = pages[static_cast<size_t>(pageIndex)].getAttribute("/Rotate", false);
    if (rotate.isInteger()) {
        return domain::NormalizeRotation(rotate.getIntValue());
    }
    return 0;
}

void QpdfDocumentAdapter::setMetadata(PdfDocument& doc, const Metadata& metadata) const {
    QPDFObjectHandle info = InfoDictionary(doc.qpdf());

    auto assign = [&info](const char* key, const std::optional<std::string>& value) {
        if (value && !value->empty()) {
            info.replaceKey(key, QPDFObjectHandle::newUnicodeString(*value));
        }
    };
    assign("/Title", metadata.title);
    assign("/Author", metadata.author);
    assign("/Subject", metadata.subject);
    if (metadata.keywords && !metadata.keywords->empty()) {
        assign("/Keywords", JoinKeywords(*metadata.keywords));
    }

    info.replaceKey("/Producer", QPDFObjectHandle::newUnicodeString(m_producer));
}

std::optional<std::string> QpdfDocumentAdapter::infoField(const PdfDocument& doc, const std::string& key) const {
    QPDFObjectHandle info = doc.qpdf().getTrailer().getKey("/Info");
    if (!info.isDictionary()) return std::nullopt;
    QPDFObjectHandle value = info.getKey(key);
    if (!value.isString()) return std::nullopt;
    return value.getUTF8Value();
}

bool QpdfDocumentAdapter::isEncrypted(const PdfDocument& doc) const {
    return doc.qpdf().isEncrypted();
}

int QpdfDocumentAdapter::pageCount(const PdfDocument& doc) const {
    return static_cast<int>(QPDFPageDocumentHelper(doc.qpdf()).getAllPages().size());
}

std::string QpdfDocumentAdapter::save(const PdfDocument& doc) const {
    try {
        QPDFWriter writer(doc.qpdf());
        writer.setOutputMemory();
        if (!doc.qpdf().isEncrypted()) {
            writer.setDeterministicID(true);
        }
        writer.write();
        return ToString(writer.getBufferSharedPointer());
    } catch (const std::exception& e) {
        std::cerr << "[DocumentModel] Save failed: " << e.what() << std::endl;
        throw domain::OperationError("Could not write PDF");
    }
}

std::string QpdfDocumentAdapter::optimize(const std::string& bytes) const {
    PdfDocument doc = load(bytes);
    try {
        QPDFWriter writer(doc.qpdf());
        writer.setOutputMemory();
        writer.setObjectStreamMode(qpdf_o_generate);
        writer.setCompressStreams(true);
        writer.setRecompressFlate(true);
        if (!doc.qpdf().isEncrypted()) {
            writer.setDeterministicID(true);
        }
        writer.write();
        return ToString(writer.getBufferSharedPointer());
    } catch (const std::exception& e) {
        std::cerr << "[DocumentModel] Optimize failed: " << e.what() << std::endl;
        throw domain::OperationError("Could not write PDF");
    }
}

} // namespace submitkit::infrastructure
