#include "rasterkit/image.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <string>

namespace rk {

Rect intersect(const Rect& a, const Rect& b) {
    const int x1 = std::max(a.x, b.x);
    const int y1 = std::max(a.y, b.y);
    const int x2 = std::min(a.right(), b.right());
    const int y2 = std::min(a.bottom(), b.bottom());
    if (x2 <= x1 || y2 <= y1) return Rect{x1, y1, 0, 0};
    return Rect{x1, y1, x2 - x1, y2 - y1};
}

static void check_shape(int width, int height, const char* who) {
    if (width <= 0 || height <= 0 || width > kMaxWidth || height > kMaxHeight) {
        throw ArgumentError(std::string(who) + ": invalid shape " +
                            std::to_string(width) + "x" + std::to_string(height));
    }
}

// ======================
//  PixelBuffer
// ======================

PixelBuffer::PixelBuffer(int width, int height)
    : width_(width), height_(height)
{
    check_shape(width, height, "PixelBuffer");
    pixels_.assign(static_cast<std::size_t>(width) * height, Color());
}

PixelBuffer::PixelBuffer(int width, int height, std::vector<Color> pixels)
{
    set_pixels(width, height, std::move(pixels));
}

void PixelBuffer::check_index(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        throw IndexError("pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                         ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
}

Color& PixelBuffer::at(int x, int y) {
    check_index(x, y);
    return pixels_[static_cast<std::size_t>(y) * width_ + x];
}

const Color& PixelBuffer::at(int x, int y) const {
    check_index(x, y);
    return pixels_[static_cast<std::size_t>(y) * width_ + x];
}

Color* PixelBuffer::row(int y) {
    if (y < 0 || y >= height_) {
        throw IndexError("row " + std::to_string(y) + " outside height " + std::to_string(height_));
    }
    return pixels_.data() + static_cast<std::size_t>(y) * width_;
}

const Color* PixelBuffer::row(int y) const {
    if (y < 0 || y >= height_) {
        throw IndexError("row " + std::to_string(y) + " outside height " + std::to_string(height_));
    }
    return pixels_.data() + static_cast<std::size_t>(y) * width_;
}

void PixelBuffer::set_pixels(int width, int height, std::vector<Color> pixels) {
    check_shape(width, height, "set_pixels");
    if (pixels.size() != static_cast<std::size_t>(width) * height) {
        throw ArgumentError("set_pixels: buffer length " + std::to_string(pixels.size()) +
                            " does not match " + std::to_string(width) + "x" + std::to_string(height));
    }
    width_  = width;
    height_ = height;
    pixels_ = std::move(pixels);
}

void PixelBuffer::swap_pixels(PixelBuffer& other) {
    std::swap(width_, other.width_);
    std::swap(height_, other.height_);
    pixels_.swap(other.pixels_);
}

// ======================
//  Image
// ======================

Image::Image(int width, int height)
    : ImageFrame(width, height)
{
}

double Image::inch_width() const {
    const double res = horizontal_resolution_ > 0 ? horizontal_resolution_ : kDefaultResolution;
    return width() / res;
}

double Image::inch_height() const {
    const double res = vertical_resolution_ > 0 ? vertical_resolution_ : kDefaultResolution;
    return height() / res;
}

ImageFrame& Image::frame(int index) {
    if (index == 0) return *this;
    if (index < 0 || index > static_cast<int>(frames_.size())) {
        throw IndexError("frame " + std::to_string(index) + " outside frame count " +
                         std::to_string(frame_count()));
    }
    return frames_[static_cast<std::size_t>(index) - 1];
}

const ImageFrame& Image::frame(int index) const {
    if (index == 0) return *this;
    if (index < 0 || index > static_cast<int>(frames_.size())) {
        throw IndexError("frame " + std::to_string(index) + " outside frame count " +
                         std::to_string(frame_count()));
    }
    return frames_[static_cast<std::size_t>(index) - 1];
}

void Image::add_frame(ImageFrame frame) {
    if (frame.width() != width() || frame.height() != height()) {
        throw ArgumentError("add_frame: frame " + std::to_string(frame.width()) + "x" +
                            std::to_string(frame.height()) + " does not match image " +
                            std::to_string(width()) + "x" + std::to_string(height()));
    }
    frames_.push_back(std::move(frame));
}

} // namespace rk
