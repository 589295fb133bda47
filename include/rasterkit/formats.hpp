#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "rasterkit/image.hpp"

namespace rk {

// ------------------------------------------------------------
// Decoder / Encoder 介面
// ------------------------------------------------------------
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;

    // 偵測格式時需要讀取的 header 長度
    virtual std::size_t header_size() const = 0;

    // header 的長度可能小於 header_size()（檔案很短時）
    virtual bool is_supported(const std::vector<uint8_t>& header) const = 0;

    // 把 stream 內容解到 image 裡；格式錯誤丟 FormatError
    virtual void decode(Image& image, std::istream& stream) const = 0;
};

class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;

    virtual void encode(const Image& image, std::ostream& stream) const = 0;
};

// 一個格式 = 名稱 + 副檔名 + decoder + encoder
class ImageFormat {
public:
    ImageFormat(std::string name,
                std::string mime_type,
                std::vector<std::string> extensions,
                std::shared_ptr<const ImageDecoder> decoder,
                std::shared_ptr<const ImageEncoder> encoder);

    const std::string& name() const { return name_; }
    const std::string& mime_type() const { return mime_type_; }
    const std::vector<std::string>& extensions() const { return extensions_; }

    const ImageDecoder& decoder() const { return *decoder_; }
    const ImageEncoder& encoder() const { return *encoder_; }

    // 不分大小寫，可帶或不帶 '.'
    bool matches_extension(const std::string& extension) const;

private:
    std::string name_;
    std::string mime_type_;
    std::vector<std::string> extensions_;
    std::shared_ptr<const ImageDecoder> decoder_;
    std::shared_ptr<const ImageEncoder> encoder_;
};

// ------------------------------------------------------------
// FormatRegistry：有順序的格式清單
// ------------------------------------------------------------
class FormatRegistry {
public:
    FormatRegistry() = default;

    void add(std::shared_ptr<const ImageFormat> format);

    const std::vector<std::shared_ptr<const ImageFormat>>& formats() const { return formats_; }
    bool empty() const { return formats_.empty(); }

    // 所有 decoder 的 header_size() 最大值
    std::size_t max_header_size() const;

    // 第一個接受這段 header 的格式；找不到回傳 nullptr
    std::shared_ptr<const ImageFormat> detect(const std::vector<uint8_t>& header) const;

    // 依名稱或副檔名查詢（"gif", ".png", "jpeg"...）；找不到回傳 nullptr
    std::shared_ptr<const ImageFormat> find(const std::string& name_or_extension) const;

    // "bmp, jpeg, png, gif"
    std::string describe() const;

private:
    std::vector<std::shared_ptr<const ImageFormat>> formats_;
};

// BMP, JPEG, PNG, GIF（依這個順序）
const FormatRegistry& default_registry();

// ------------------------------------------------------------
// decode / encode
// ------------------------------------------------------------

// stream 不可讀 / 不可 seek → DecodeError；沒有符合的格式或內容損毀 → FormatError
Image decode(std::istream& stream, const FormatRegistry& formats = default_registry());
Image decode(const std::vector<uint8_t>& bytes, const FormatRegistry& formats = default_registry());

// 沒指定格式時用 image.format()，兩者都沒有 → ArgumentError
void encode(const Image& image, std::ostream& stream);
void encode(const Image& image, std::ostream& stream, const ImageFormat& format);

std::vector<uint8_t> encode_to_memory(const Image& image, const ImageFormat& format);

} // namespace rk
