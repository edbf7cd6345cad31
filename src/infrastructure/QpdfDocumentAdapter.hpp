/**
 * @file QpdfDocumentAdapter.hpp
 * @brief In-process PDF structure manipulation on top of qpdf.
 */

#pragma once
#include "domain/RotationMap.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class QPDF;

namespace submitkit::infrastructure {

/**
 * @class PdfDocument
 * @brief A loaded or newly built PDF, plus everything it still reads from.
 *
 * qpdf reads stream data lazily, so a document keeps its source buffer and
 * every document it copied pages from alive until it is saved.
 */
class PdfDocument {
public:
    PdfDocument() = default;

    QPDF& qpdf() const { return *m_pdf; }
    bool isNull() const { return !m_pdf; }

private:
    friend class QpdfDocumentAdapter;

    std::shared_ptr<QPDF> m_pdf;
    std::vector<std::shared_ptr<const void>> m_retained;
};

/**
 * @class QpdfDocumentAdapter
 * @brief Document Model operations: load, merge, page copy, raster pages, rotation, metadata, save.
 *
 * Fails fast with domain::DocumentLoadError on malformed input; otherwise
 * deterministic for a given input.
 */
class QpdfDocumentAdapter {
public:
    /**
     * @struct Metadata
     * @brief Info dictionary fields to overwrite; unset or empty fields are left alone.
     */
    struct Metadata {
        std::optional<std::string> title;
        std::optional<std::string> author;
        std::optional<std::string> subject;
        std::optional<std::string> keywords; ///< Comma-separated; stored space-joined.
    };

    /** @param producer Value stamped into /Producer by setMetadata(). */
    explicit QpdfDocumentAdapter(std::string producer = "College Submission Toolkit");

    /** @throws domain::DocumentLoadError for bytes qpdf cannot open (including password-protected files). */
    PdfDocument load(const std::string& bytes) const;

    /** @brief A new document with no pages. */
    PdfDocument create() const;

    /** @brief Appends all pages of each document, in the given order. */
    PdfDocument merge(const std::vector<PdfDocument>& docs) const;

    /**
     * @brief Builds a new document from copies of the given pages.
     * @param indices 0-based page indices in output order; repeats allowed.
     * @throws domain::OperationError for an index outside the document.
     */
    PdfDocument extractPages(const PdfDocument& doc, const std::vector<int>& indices) const;

    /**
     * @brief Appends one page showing the image at its native pixel size.
     * @return False when the MIME type is not supported (nothing added).
     * @throws domain::DocumentLoadError when a supported image cannot be decoded.
     */
    bool embedRasterPage(PdfDocument& doc, const std::string& imageBytes, const std::string& mimeType) const;

    /**
     * @brief Adds each delta to the page's current rotation, normalized to [0, 360).
     *
     * Pages outside the document and deltas that are not multiples of 90 are ignored.
     */
    void rotate(PdfDocument& doc, const domain::RotationMap& rotations) const;

    /** @brief Effective (possibly inherited) /Rotate of a 0-based page. */
    int rotationOf(const PdfDocument& doc, int pageIndex) const;

    /** @brief Overwrites supplied Info fields, then stamps the producer. */
    void setMetadata(PdfDocument& doc, const Metadata& metadata) const;

    /** @brief Reads an Info dictionary entry such as "/Title". */
    std::optional<std::string> infoField(const PdfDocument& doc, const std::string& key) const;

    bool isEncrypted(const PdfDocument& doc) const;
    int pageCount(const PdfDocument& doc) const;

    /** @brief Serializes the document. @throws domain::OperationError if qpdf cannot write it. */
    std::string save(const PdfDocument& doc) const;

    /**
     * @brief Structural resave: only reachable objects, packed into object streams,
     * Flate streams recompressed. Images are not resampled.
     * @throws domain::DocumentLoadError, domain::OperationError
     */
    std::string optimize(const std::string& bytes) const;

    const std::string& producer() const { return m_producer; }

private:
    std::string m_producer;
};

} // namespace submitkit::infrastructure
