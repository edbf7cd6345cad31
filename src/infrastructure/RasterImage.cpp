#include "infrastructure/RasterImage.hpp"
#include "domain/EngineErrors.hpp"

#include <algorithm>
#include <cctype>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <vector>

#include <jpeglib.h>
#include <png.h>

namespace submitkit::infrastructure {

namespace {

// Refuse decompression bombs before allocating sample buffers.
constexpr long long kMaxPixels = 100LL * 1000 * 1000;

struct JpegErrorManager {
    jpeg_error_mgr pub;
    jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void OnJpegError(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->jump, 1);
}

void OnJpegMessage(j_common_ptr) {
    // libjpeg warnings go to stderr by default; uploads are noisy enough.
}

std::string NormalizeMime(const std::string& mimeType) {
    std::string mime = mimeType.substr(0, mimeType.find(';'));
    mime.erase(0, mime.find_first_not_of(" \t"));
    mime.erase(mime.find_last_not_of(" \t") + 1);
    std::transform(mime.begin(), mime.end(), mime.begin(), [](unsigned char c){ return std::tolower(c); });
    return mime;
}

} // namespace

std::optional<RasterImage> RasterDecoder::Decode(const std::string& bytes, const std::string& mimeType) {
    const std::string mime = NormalizeMime(mimeType);
    if (mime == "image/jpeg" || mime == "image/jpg") {
        return InspectJpeg(bytes);
    }
    if (mime == "image/png") {
        return DecodePng(bytes);
    }
    return std::nullopt;
}

RasterImage RasterDecoder::InspectJpeg(const std::string& bytes) {
    if (bytes.empty()) {
        throw domain::DocumentLoadError("Empty JPEG image");
    }

    jpeg_decompress_struct cinfo;
    JpegErrorManager err;
    std::memset(&err, 0, sizeof(err));
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = OnJpegError;
    err.pub.output_message = OnJpegMessage;

    if (setjmp(err.jump)) {
        jpeg_destroy_decompress(&cinfo);
        throw domain::DocumentLoadError(std::string("Invalid JPEG image: ") + err.message);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo,
                 reinterpret_cast<unsigned char*>(const_cast<char*>(bytes.data())),
                 static_cast<unsigned long>(bytes.size()));
    jpeg_read_header(&cinfo, TRUE);

    const int width = static_cast<int>(cinfo.image_width);
    const int height = static_cast<int>(cinfo.image_height);
    const int components = cinfo.num_components;
    const bool adobe = cinfo.saw_Adobe_marker != 0;
    jpeg_destroy_decompress(&cinfo);

    if (width <= 0 || height <= 0) {
        throw domain::DocumentLoadError("JPEG image has no pixels");
    }
    if (components != 1 && components != 3 && components != 4) {
        throw domain::DocumentLoadError("Unsupported JPEG component count: " + std::to_string(components));
    }

    RasterImage image;
    image.width = width;
    image.height = height;
    image.components = components;
    image.encoding = RasterImage::Encoding::Dct;
    image.invertedCmyk = (components == 4 && adobe);
    image.data = bytes;
    return image;
}

RasterImage RasterDecoder::DecodePng(const std::string& bytes) {
    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&png, bytes.data(), bytes.size())) {
        std::string message = png.message;
        png_image_free(&png);
        throw domain::DocumentLoadError("Invalid PNG image: " + message);
    }

    if (static_cast<long long>(png.width) * static_cast<long long>(png.height) > kMaxPixels) {
        png_image_free(&png);
        throw domain::DocumentLoadError("PNG image is too large");
    }

    const bool hasAlpha = (png.format & PNG_FORMAT_FLAG_ALPHA) != 0;
    const bool isColor = (png.format & PNG_FORMAT_FLAG_COLOR) != 0;
    if (isColor) {
        png.format = hasAlpha ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;
    } else {
        png.format = hasAlpha ? PNG_FORMAT_GA : PNG_FORMAT_GRAY;
    }

    std::vector<png_byte> samples(PNG_IMAGE_SIZE(png));
    if (!png_image_finish_read(&png, nullptr, samples.data(), 0, nullptr)) {
        std::string message = png.message;
        png_image_free(&png);
        throw domain::DocumentLoadError("Invalid PNG image: " + message);
    }

    RasterImage image;
    image.width = static_cast<int>(png.width);
    image.height = static_cast<int>(png.height);
    image.components = isColor ? 3 : 1;
    image.encoding = RasterImage::Encoding::Raw;

    const size_t pixels = static_cast<size_t>(png.width) * png.height;
    const size_t stride = static_cast<size_t>(image.components) + (hasAlpha ? 1 : 0);
    if (!hasAlpha) {
        image.data.assign(reinterpret_cast<const char*>(samples.data()), samples.size());
        return image;
    }

    image.data.resize(pixels * static_cast<size_t>(image.components));
    image.alpha.resize(pixels);
    for (size_t p = 0; p < pixels; ++p) {
        const png_byte* px = samples.data() + p * stride;
        for (int c = 0; c < image.components; ++c) {
            image.data[p * image.components + c] = static_cast<char>(px[c]);
        }
        image.alpha[p] = static_cast<char>(px[image.components]);
    }
    return image;
}

} // namespace submitkit::infrastructure
