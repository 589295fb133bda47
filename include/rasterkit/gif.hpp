#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "rasterkit/formats.hpp"

namespace rk {

namespace gif {

constexpr uint8_t kExtensionIntroducer       = 0x21;
constexpr uint8_t kImageLabel                = 0x2C;
constexpr uint8_t kTrailer                   = 0x3B;
constexpr uint8_t kTerminator                = 0x00;
constexpr uint8_t kGraphicControlLabel       = 0xF9;
constexpr uint8_t kCommentLabel              = 0xFE;
constexpr uint8_t kApplicationExtensionLabel = 0xFF;
constexpr uint8_t kPlainTextLabel            = 0x01;

// comment 所有 sub-block 加總的上限
constexpr std::size_t kMaxCommentLength = 1024 * 8;

// LZW code 最長 12 bits
constexpr int kMaxCodeBits = 12;

constexpr const char* kCommentProperty = "Comments";

// GifDecoder 預設允許的 logical screen 上限
constexpr int kDefaultMaxCanvasWidth  = 8192;
constexpr int kDefaultMaxCanvasHeight = 8192;

} // namespace gif

// ------------------------------------------------------------
// GifDecoder：signature → logical screen → block loop
// 解到一半失敗時，已經加進 image 的 frame 會保留（不 rollback）
// ------------------------------------------------------------
class GifDecoder : public ImageDecoder {
public:
    // logical screen 超過 max_canvas 時丟 FormatError
    explicit GifDecoder(Size max_canvas = Size{gif::kDefaultMaxCanvasWidth, gif::kDefaultMaxCanvasHeight});

    std::size_t header_size() const override { return 6; }
    bool is_supported(const std::vector<uint8_t>& header) const override;
    void decode(Image& image, std::istream& stream) const override;

private:
    Size max_canvas_;
};

// ------------------------------------------------------------
// GifEncoder：GIF89a，每個 frame 都是整張 canvas 大小
// 所有 frame 加起來 <= 255 種不透明顏色時是無損的
// ------------------------------------------------------------
class GifEncoder : public ImageEncoder {
public:
    void encode(const Image& image, std::ostream& stream) const override;
};

std::shared_ptr<const ImageFormat> make_gif_format();

} // namespace rk
