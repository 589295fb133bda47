#include "rasterkit/codecs.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>

// stb
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"

namespace rk {

// ======================
//  StbDecoder
// ======================

StbDecoder::StbDecoder(std::string name, std::vector<uint8_t> signature)
    : name_(std::move(name)), signature_(std::move(signature))
{
}

bool StbDecoder::is_supported(const std::vector<uint8_t>& header) const {
    if (header.size() < signature_.size()) return false;
    return std::equal(signature_.begin(), signature_.end(), header.begin());
}

void StbDecoder::decode(Image& image, std::istream& stream) const {
    // stb 只吃記憶體 buffer，整個 stream 讀進來
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(stream)),
                               std::istreambuf_iterator<char>());
    if (bytes.empty()) throw FormatError(name_ + ": empty stream");

    int w = 0, h = 0, ch_in = 0;
    stbi_uc* raw = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                         &w, &h, &ch_in, 4);
    if (!raw) {
        const char* reason = stbi_failure_reason();
        throw FormatError(name_ + ": stb_image failed to decode (" +
                          std::string(reason ? reason : "unknown") + ")");
    }

    // raw 交給 unique_ptr 管理，deleter 使用 stbi_image_free
    std::unique_ptr<stbi_uc, void (*)(void*)> owner(raw, stbi_image_free);

    if (w > kMaxWidth || h > kMaxHeight) {
        throw FormatError(name_ + ": image " + std::to_string(w) + "x" + std::to_string(h) +
                          " is bigger than the max allowed size");
    }

    const std::size_t n = static_cast<std::size_t>(w) * h;
    std::vector<Color> pixels(n);
    for (std::size_t i = 0; i < n; ++i) {
        const stbi_uc* p = raw + i * 4;
        pixels[i] = unpack(Rgba32{p[0], p[1], p[2], p[3]});
    }
    image.set_pixels(w, h, std::move(pixels));
}

// ======================
//  stb_image_write 共用
// ======================

static void write_to_stream(void* context, void* data, int size) {
    auto* os = static_cast<std::ostream*>(context);
    os->write(static_cast<const char*>(data), size);
}

// RGBA8 的連續 buffer，stride = w * 4
static std::vector<uint8_t> to_rgba8(const PixelBuffer& src) {
    std::vector<uint8_t> out(src.pixels().size() * 4);
    std::size_t o = 0;
    for (const Color& c : src.pixels()) {
        const Rgba32 p = pack(c);
        out[o++] = p.r;
        out[o++] = p.g;
        out[o++] = p.b;
        out[o++] = p.a;
    }
    return out;
}

void PngEncoder::encode(const Image& image, std::ostream& stream) const {
    const std::vector<uint8_t> data = to_rgba8(image);
    const int stride = image.width() * 4; // bytes per row
    if (!stbi_write_png_to_func(write_to_stream, &stream, image.width(), image.height(),
                                4, data.data(), stride)) {
        throw std::runtime_error("stb_image_write: failed to write png");
    }
}

void BmpEncoder::encode(const Image& image, std::ostream& stream) const {
    const std::vector<uint8_t> data = to_rgba8(image);
    if (!stbi_write_bmp_to_func(write_to_stream, &stream, image.width(), image.height(),
                                4, data.data())) {
        throw std::runtime_error("stb_image_write: failed to write bmp");
    }
}

JpegEncoder::JpegEncoder(int quality)
    : quality_(quality)
{
    if (quality < 1 || quality > 100) {
        throw ArgumentError("JpegEncoder: quality must be in [1, 100]");
    }
}

void JpegEncoder::encode(const Image& image, std::ostream& stream) const {
    // JPEG 沒有 alpha，只給 3 通道
    std::vector<uint8_t> rgb(image.pixels().size() * 3);
    std::size_t o = 0;
    for (const Color& c : image.pixels()) {
        const Rgba32 p = pack(c);
        rgb[o++] = p.r;
        rgb[o++] = p.g;
        rgb[o++] = p.b;
    }
    if (!stbi_write_jpg_to_func(write_to_stream, &stream, image.width(), image.height(),
                                3, rgb.data(), quality_)) {
        throw std::runtime_error("stb_image_write: failed to write jpg");
    }
}

// ======================
//  format factories
// ======================

std::shared_ptr<const ImageFormat> make_png_format() {
    return std::make_shared<const ImageFormat>(
        "png", "image/png", std::vector<std::string>{"png"},
        std::make_shared<StbDecoder>("png", std::vector<uint8_t>{0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}),
        std::make_shared<PngEncoder>());
}

std::shared_ptr<const ImageFormat> make_jpeg_format(int quality) {
    return std::make_shared<const ImageFormat>(
        "jpeg", "image/jpeg", std::vector<std::string>{"jpg", "jpeg", "jfif"},
        std::make_shared<StbDecoder>("jpeg", std::vector<uint8_t>{0xFF, 0xD8}),
        std::make_shared<JpegEncoder>(quality));
}

std::shared_ptr<const ImageFormat> make_bmp_format() {
    return std::make_shared<const ImageFormat>(
        "bmp", "image/bmp", std::vector<std::string>{"bmp"},
        std::make_shared<StbDecoder>("bmp", std::vector<uint8_t>{'B', 'M'}),
        std::make_shared<BmpEncoder>());
}

} // namespace rk
