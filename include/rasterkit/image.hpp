#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rasterkit/color.hpp"

namespace rk {

class ImageFormat;

// GIF 的 logical screen 只有 16 bits，整個函式庫沿用同一個上限
constexpr int kMaxWidth  = 65535;
constexpr int kMaxHeight = 65535;

struct Size {
    int width  = 0;
    int height = 0;
};

struct Rect {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    int  right()  const { return x + width; }
    int  bottom() const { return y + height; }
    bool empty()  const { return width <= 0 || height <= 0; }
    bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }
};

Rect intersect(const Rect& a, const Rect& b);

// GIF graphic control 的 disposal method（數值與檔案格式一致）
enum class DisposalMethod : uint8_t {
    None                = 0,
    DoNotDispose        = 1,
    RestoreToBackground = 2,
    RestoreToPrevious   = 3,
};

// ------------------------------------------------------------
// PixelBuffer：row-major 的 Color 陣列，長度永遠是 width * height
// ------------------------------------------------------------
class PixelBuffer {
public:
    PixelBuffer() = default;

    // 配置 width x height 個全透明像素
    PixelBuffer(int width, int height);

    // 接手既有像素，pixels.size() 必須等於 width * height
    PixelBuffer(int width, int height, std::vector<Color> pixels);

    int  width()  const { return width_; }
    int  height() const { return height_; }
    Size size()   const { return Size{width_, height_}; }
    Rect bounds() const { return Rect{0, 0, width_, height_}; }
    bool empty()  const { return pixels_.empty(); }

    // 有 bounds check，越界丟 IndexError
    Color&       at(int x, int y);
    const Color& at(int x, int y) const;

    // 熱迴圈用：回傳第 y 列的起點（y 越界一樣丟 IndexError）
    Color*       row(int y);
    const Color* row(int y) const;

    std::vector<Color>&       pixels()       { return pixels_; }
    const std::vector<Color>& pixels() const { return pixels_; }

    void set_pixels(int width, int height, std::vector<Color> pixels);

    // allocate-then-swap：processor 跑完後把 target 換進來
    void swap_pixels(PixelBuffer& other);

private:
    void check_index(int x, int y) const;

    int width_  = 0;
    int height_ = 0;
    std::vector<Color> pixels_;
};

// 動畫中的一個 frame：像素 + delay (1/100 秒) + disposal
class ImageFrame : public PixelBuffer {
public:
    using PixelBuffer::PixelBuffer;

    int  delay() const { return delay_; }
    void set_delay(int delay) { delay_ = delay; }

    DisposalMethod disposal() const { return disposal_; }
    void set_disposal(DisposalMethod d) { disposal_ = d; }

private:
    int delay_ = 0;
    DisposalMethod disposal_ = DisposalMethod::None;
};

struct ImageProperty {
    std::string name;
    std::string value;
};

// ------------------------------------------------------------
// Image：自己的 buffer 就是 primary frame，其餘 frame 另外存
// ------------------------------------------------------------
class Image : public ImageFrame {
public:
    static constexpr double kDefaultResolution = 96.0;

    Image() = default;
    Image(int width, int height);

    // copy 會深拷貝所有 frame
    Image(const Image&)            = default;
    Image& operator=(const Image&) = default;
    Image(Image&&)                 = default;
    Image& operator=(Image&&)      = default;

    // 透過 default_registry() 偵測格式
    static Image load(const std::string& path);

    // 沒給格式時：副檔名 → format()，都沒有丟 ArgumentError
    void save(const std::string& path) const;
    void save(const std::string& path, const ImageFormat& format) const;

    double horizontal_resolution() const { return horizontal_resolution_; }
    double vertical_resolution()   const { return vertical_resolution_; }
    void set_horizontal_resolution(double dpi) { horizontal_resolution_ = dpi; }
    void set_vertical_resolution(double dpi)   { vertical_resolution_ = dpi; }

    // 解析度 <= 0 時用預設的 96 DPI
    double inch_width()  const;
    double inch_height() const;

    bool is_animated() const { return !frames_.empty(); }

    // primary + 額外 frame 的總數
    int frame_count() const { return 1 + static_cast<int>(frames_.size()); }

    // index 0 是 primary frame（也就是 *this）
    ImageFrame&       frame(int index);
    const ImageFrame& frame(int index) const;

    std::vector<ImageFrame>&       frames()       { return frames_; }
    const std::vector<ImageFrame>& frames() const { return frames_; }

    // 尺寸必須跟 primary frame 一樣，否則丟 ArgumentError
    void add_frame(ImageFrame frame);

    uint16_t repeat_count() const { return repeat_count_; }
    void set_repeat_count(uint16_t count) { repeat_count_ = count; }

    std::vector<ImageProperty>&       properties()       { return properties_; }
    const std::vector<ImageProperty>& properties() const { return properties_; }

    // decode 時偵測到的格式；直接建構的影像沒有格式
    const std::shared_ptr<const ImageFormat>& format() const { return format_; }
    void set_format(std::shared_ptr<const ImageFormat> format) { format_ = std::move(format); }

private:
    double horizontal_resolution_ = kDefaultResolution;
    double vertical_resolution_   = kDefaultResolution;
    uint16_t repeat_count_ = 0;
    std::vector<ImageFrame> frames_;
    std::vector<ImageProperty> properties_;
    std::shared_ptr<const ImageFormat> format_;
};

// 檔案 I/O：依 header 偵測格式 / 依副檔名選 encoder
Image load_image(const std::string& path);
void  save_image(const Image& image, const std::string& path);

} // namespace rk
