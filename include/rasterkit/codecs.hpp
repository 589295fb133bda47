#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rasterkit/formats.hpp"

namespace rk {

// ------------------------------------------------------------
// 透過 stb_image 解碼的格式（PNG / JPEG / BMP），只用檔頭 signature 判斷
// ------------------------------------------------------------
class StbDecoder : public ImageDecoder {
public:
    StbDecoder(std::string name, std::vector<uint8_t> signature);

    std::size_t header_size() const override { return signature_.size(); }
    bool is_supported(const std::vector<uint8_t>& header) const override;
    void decode(Image& image, std::istream& stream) const override;

private:
    std::string name_;
    std::vector<uint8_t> signature_;
};

// stb_image_write 只寫 primary frame
class PngEncoder : public ImageEncoder {
public:
    void encode(const Image& image, std::ostream& stream) const override;
};

class BmpEncoder : public ImageEncoder {
public:
    void encode(const Image& image, std::ostream& stream) const override;
};

class JpegEncoder : public ImageEncoder {
public:
    // quality: 1 ~ 100
    explicit JpegEncoder(int quality = 90);

    int quality() const { return quality_; }
    void encode(const Image& image, std::ostream& stream) const override;

private:
    int quality_;
};

std::shared_ptr<const ImageFormat> make_png_format();
std::shared_ptr<const ImageFormat> make_jpeg_format(int quality = 90);
std::shared_ptr<const ImageFormat> make_bmp_format();

} // namespace rk
