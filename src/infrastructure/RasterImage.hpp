/**
 * @file RasterImage.hpp
 * @brief Decoding of uploaded JPEG/PNG images into PDF-embeddable samples.
 */

#pragma once
#include <optional>
#include <string>

namespace submitkit::infrastructure {

/**
 * @struct RasterImage
 * @brief Image data ready to become a PDF image XObject.
 */
struct RasterImage {
    enum class Encoding {
        Dct, ///< Original JPEG stream, embedded as-is with /DCTDecode.
        Raw  ///< Uncompressed interleaved 8-bit samples.
    };

    int width = 0;
    int height = 0;
    int components = 3;          ///< 1 = gray, 3 = RGB, 4 = CMYK.
    Encoding encoding = Encoding::Raw;
    bool invertedCmyk = false;   ///< Adobe-style CMYK JPEG, needs a /Decode array.
    std::string data;
    std::string alpha;           ///< 8-bit soft mask samples; empty when opaque.
};

class RasterDecoder {
public:
    /**
     * @brief Decodes an image by its declared MIME type.
     * @return nullopt for unsupported types (callers skip those silently).
     * @throws domain::DocumentLoadError when a supported type cannot be decoded.
     */
    static std::optional<RasterImage> Decode(const std::string& bytes, const std::string& mimeType);

    /** @brief Reads JPEG dimensions/components with libjpeg; the stream itself is kept intact. */
    static RasterImage InspectJpeg(const std::string& bytes);

    /** @brief Fully decodes a PNG with libpng, splitting out any alpha channel. */
    static RasterImage DecodePng(const std::string& bytes);
};

} // namespace submitkit::infrastructure
