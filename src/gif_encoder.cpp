#include "rasterkit/gif.hpp"
#include "rasterkit/errors.hpp"

#include "lzw.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace rk {

namespace {

// alpha 低於這個值的像素寫成透明 index
constexpr float kTransparentThreshold = 0.5f;

// 顏色超過 255 種時改用 6x7x6 的均勻調色盤
constexpr int kUniformR = 6;
constexpr int kUniformG = 7;
constexpr int kUniformB = 6;

uint32_t rgb_key(const Rgba32& p) {
    return (static_cast<uint32_t>(p.r) << 16) | (static_cast<uint32_t>(p.g) << 8) | p.b;
}

// ------------------------------------------------------------
// Palette：所有 frame 共用一個 global color table
// ------------------------------------------------------------
struct Palette {
    std::vector<Rgba32> colors;                 // 不含透明那格
    std::unordered_map<uint32_t, uint8_t> exact; // 無損模式才有
    bool uniform = false;
    bool has_transparent = false;
    uint8_t transparent_index = 0;
    int bits = 1;                               // table 大小 = 1 << bits

    uint8_t index_of(const Color& c) const {
        if (c.a < kTransparentThreshold) return transparent_index;
        const Rgba32 p = pack(c);
        if (!uniform) return exact.at(rgb_key(p));

        const int r = (p.r * (kUniformR - 1) + 127) / 255;
        const int g = (p.g * (kUniformG - 1) + 127) / 255;
        const int b = (p.b * (kUniformB - 1) + 127) / 255;
        return static_cast<uint8_t>((r * kUniformG + g) * kUniformB + b);
    }
};

Palette build_palette(const Image& image) {
    Palette palette;

    for (int f = 0; f < image.frame_count() && !palette.uniform; ++f) {
        for (const Color& c : image.frame(f).pixels()) {
            if (c.a < kTransparentThreshold) {
                palette.has_transparent = true;
                continue;
            }
            const Rgba32 p = pack(c);
            const uint32_t key = rgb_key(p);
            if (palette.exact.count(key)) continue;
            if (palette.colors.size() == 255) {
                palette.uniform = true;
                break;
            }
            palette.exact.emplace(key, static_cast<uint8_t>(palette.colors.size()));
            palette.colors.push_back(Rgba32{p.r, p.g, p.b, 255});
        }
    }

    if (palette.uniform) {
        palette.exact.clear();
        palette.colors.clear();
        for (int r = 0; r < kUniformR; ++r) {
            for (int g = 0; g < kUniformG; ++g) {
                for (int b = 0; b < kUniformB; ++b) {
                    palette.colors.push_back(Rgba32{
                        static_cast<uint8_t>(r * 255 / (kUniformR - 1)),
                        static_cast<uint8_t>(g * 255 / (kUniformG - 1)),
                        static_cast<uint8_t>(b * 255 / (kUniformB - 1)),
                        255});
                }
            }
        }
        // 均勻模式沒掃完全部像素，透明與否要重新確認
        palette.has_transparent = false;
        for (int f = 0; f < image.frame_count() && !palette.has_transparent; ++f) {
            for (const Color& c : image.frame(f).pixels()) {
                if (c.a < kTransparentThreshold) {
                    palette.has_transparent = true;
                    break;
                }
            }
        }
    }

    // 透明 index 放在顏色之後
    palette.transparent_index = static_cast<uint8_t>(palette.colors.size());
    const std::size_t entries = palette.colors.size() + (palette.has_transparent ? 1 : 0);
    while ((std::size_t{1} << palette.bits) < entries) ++palette.bits;
    return palette;
}

class GifWriter {
public:
    explicit GifWriter(std::ostream& out) : out_(out) {}

    void u8(uint8_t v) { out_.put(static_cast<char>(v)); }

    void u16_le(int v) {
        u8(static_cast<uint8_t>(v & 0xFF));
        u8(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void bytes(const void* data, std::size_t n) {
        out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(n));
    }

    void bytes(const std::vector<uint8_t>& data) { bytes(data.data(), data.size()); }

    // 切成最多 255 bytes 的 sub-block + terminator
    void sub_blocks(const std::string& text) {
        for (std::size_t off = 0; off < text.size(); off += 255) {
            const std::size_t n = std::min<std::size_t>(255, text.size() - off);
            u8(static_cast<uint8_t>(n));
            bytes(text.data() + off, n);
        }
        u8(gif::kTerminator);
    }

private:
    std::ostream& out_;
};

void write_frame(GifWriter& w, const ImageFrame& frame, const Palette& palette) {
    // graphic control extension
    const uint8_t packed = static_cast<uint8_t>(
        (static_cast<int>(DisposalMethod::RestoreToBackground) << 2) |
        (palette.has_transparent ? 0x01 : 0x00));
    w.u8(gif::kExtensionIntroducer);
    w.u8(gif::kGraphicControlLabel);
    w.u8(4);
    w.u8(packed);
    w.u16_le(std::max(frame.delay(), 0));
    w.u8(palette.has_transparent ? palette.transparent_index : 0);
    w.u8(gif::kTerminator);

    // image descriptor：整張 canvas，沒有 local table、不 interlace
    w.u8(gif::kImageLabel);
    w.u16_le(0);
    w.u16_le(0);
    w.u16_le(frame.width());
    w.u16_le(frame.height());
    w.u8(0);

    std::vector<uint8_t> indices(frame.pixels().size());
    for (std::size_t i = 0; i < indices.size(); ++i) {
        indices[i] = palette.index_of(frame.pixels()[i]);
    }

    const int data_size = std::max(2, palette.bits);
    w.u8(static_cast<uint8_t>(data_size));
    gif::LzwEncoder lzw(data_size);
    w.bytes(lzw.encode(indices));
}

} // namespace

// ======================
//  GifEncoder
// ======================

void GifEncoder::encode(const Image& image, std::ostream& stream) const {
    if (image.empty()) {
        throw ArgumentError("gif: cannot encode an empty image");
    }

    const Palette palette = build_palette(image);
    GifWriter w(stream);

    w.bytes("GIF89a", 6);

    // logical screen descriptor
    const int table_bits = palette.bits;
    w.u16_le(image.width());
    w.u16_le(image.height());
    w.u8(static_cast<uint8_t>(0x80 | ((table_bits - 1) << 4) | (table_bits - 1)));
    w.u8(0); // background index
    w.u8(0); // pixel aspect ratio

    // global color table，補到 2 的次方
    const std::size_t table_size = std::size_t{1} << table_bits;
    for (std::size_t i = 0; i < table_size; ++i) {
        const Rgba32 c = i < palette.colors.size() ? palette.colors[i] : Rgba32{0, 0, 0, 0};
        w.u8(c.r);
        w.u8(c.g);
        w.u8(c.b);
    }

    if (image.is_animated()) {
        w.u8(gif::kExtensionIntroducer);
        w.u8(gif::kApplicationExtensionLabel);
        w.u8(11);
        w.bytes("NETSCAPE2.0", 11);
        w.u8(3);
        w.u8(1);
        w.u16_le(image.repeat_count());
        w.u8(gif::kTerminator);
    }

    for (const ImageProperty& p : image.properties()) {
        if (p.name != gif::kCommentProperty) continue;
        w.u8(gif::kExtensionIntroducer);
        w.u8(gif::kCommentLabel);
        w.sub_blocks(p.value.substr(0, gif::kMaxCommentLength));
    }

    for (int f = 0; f < image.frame_count(); ++f) {
        write_frame(w, image.frame(f), palette);
    }

    w.u8(gif::kTrailer);

    if (!stream) {
        throw std::runtime_error("gif: failed to write stream");
    }
}

} // namespace rk
