#include "rasterkit/filters.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace rk {

// ============================================================
// 小工具：邊界處理
// ============================================================

int border_index(int i, int n, Border border) {
    if (n <= 0) return 0;

    switch (border) {
        case Border::Reflect: {
            if (n == 1) return 0;
            // 反覆折返，直到落在範圍內（kernel 比影像大時會超過一次）
            while (i < 0 || i >= n) {
                if (i < 0)  i = -i - 1;
                if (i >= n) i = 2 * n - i - 1;
            }
            return i;
        }
        case Border::Wrap: {
            int m = i % n;
            if (m < 0) m += n;
            return m;
        }
        case Border::Replicate:
        default:
            return std::clamp(i, 0, n - 1);
    }
}

namespace {

// BT.709 灰階（亮度在 linear 空間計算）
Color to_grey(const Color& c) {
    const float l = luminance_bt709(to_linear(c));
    return to_companded(Color(l, l, l, c.a));
}

Color premultiply(const Color& l) {
    return Color(l.r * l.a, l.g * l.a, l.b * l.a, l.a);
}

Color unpremultiply(const Color& p) {
    if (p.a <= 1e-6f) return Color();
    return Color(p.r / p.a, p.g / p.a, p.b / p.a, clamp01(p.a));
}

void check_kernel1d(const std::vector<float>& k, const char* who) {
    if (k.empty() || k.size() % 2 == 0) {
        throw ArgumentError(std::string(who) + ": kernel length must be odd");
    }
}

// 一個 2-D kernel 在 (x, y) 的加權和，只算 RGB
struct Rgb {
    float r = 0.f;
    float g = 0.f;
    float b = 0.f;
};

Rgb convolve_at(const PixelBuffer& source,
                const Rect& area,
                const Kernel& kernel,
                int x,
                int y,
                Border border,
                bool greyscale)
{
    const int rx = kernel.width / 2;
    const int ry = kernel.height / 2;

    Rgb sum;
    for (int ky = 0; ky < kernel.height; ++ky) {
        const int sy = border_index(y + ky - ry, area.height, border);
        const Color* row = source.row(area.y + sy) + area.x;
        for (int kx = 0; kx < kernel.width; ++kx) {
            const float w = kernel.at(kx, ky);
            if (w == 0.f) continue;
            const int sx = border_index(x + kx - rx, area.width, border);
            const Color c = greyscale ? to_grey(row[sx]) : row[sx];
            sum.r += c.r * w;
            sum.g += c.g * w;
            sum.b += c.b * w;
        }
    }
    return sum;
}

} // namespace

// ============================================================
// Kernel
// ============================================================

Kernel::Kernel(int w, int h, std::vector<float> v)
    : width(w), height(h), values(std::move(v))
{
    if (w < 1 || h < 1 || w % 2 == 0 || h % 2 == 0) {
        throw ArgumentError("Kernel: width and height must be odd and >= 1");
    }
    if (values.size() != static_cast<std::size_t>(w) * h) {
        throw ArgumentError("Kernel: expected " + std::to_string(w * h) + " values, got " +
                            std::to_string(values.size()));
    }
}

std::vector<float> box_kernel1d(int ksize) {
    if (ksize < 3 || (ksize % 2 == 0)) {
        throw ArgumentError("box_kernel1d: ksize must be odd and >= 3");
    }

    std::vector<float> kernel(ksize, 1.0f / static_cast<float>(ksize));
    return kernel;
}

std::vector<float> gaussian_kernel1d(float sigma) {
    if (!(sigma > 0.f)) {
        throw ArgumentError("gaussian_kernel1d: sigma must be > 0");
    }

    // kernel 長度約為 6*sigma，並強制為奇數
    int k = std::max(3, (static_cast<int>(std::ceil(6.f * sigma)) | 1));
    int R = k / 2;

    std::vector<float> kernel(k);
    float inv2s2 = 1.f / (2.f * sigma * sigma);
    float sum = 0.f;

    for (int i = -R; i <= R; ++i) {
        float v = std::exp(-static_cast<float>(i * i) * inv2s2);
        kernel[i + R] = v;
        sum += v;
    }

    // 正規化使 sum = 1
    for (float& v : kernel) v /= sum;
    return kernel;
}

// ============================================================
// ConvolutionFilter
// ============================================================

ConvolutionFilter::ConvolutionFilter(Kernel kernel, Border border, bool greyscale)
    : kernel_(std::move(kernel)), border_(border), greyscale_(greyscale)
{
    if (kernel_.values.empty()) {
        throw ArgumentError("ConvolutionFilter: kernel empty");
    }
}

void ConvolutionFilter::apply_rows(PixelBuffer& target,
                                   const PixelBuffer& source,
                                   const Rect& target_rect,
                                   const Rect& source_rect,
                                   int start_y,
                                   int end_y) const
{
    for (int y = start_y; y < end_y; ++y) {
        const Color* center = source.row(source_rect.y + y) + source_rect.x;
        Color* out = target.row(y);
        for (int x = 0; x < target_rect.width; ++x) {
            const Rgb s = convolve_at(source, source_rect, kernel_, x, y, border_, greyscale_);
            out[x] = Color(clamp01(s.r), clamp01(s.g), clamp01(s.b), center[x].a);
        }
    }
}

// ============================================================
// Convolution2DFilter
// ============================================================

Convolution2DFilter::Convolution2DFilter(Kernel kernel_x, Kernel kernel_y, Border border, bool greyscale)
    : kernel_x_(std::move(kernel_x)), kernel_y_(std::move(kernel_y)), border_(border), greyscale_(greyscale)
{
    if (kernel_x_.values.empty() || kernel_y_.values.empty()) {
        throw ArgumentError("Convolution2DFilter: kernel empty");
    }
}

void Convolution2DFilter::apply_rows(PixelBuffer& target,
                                     const PixelBuffer& source,
                                     const Rect& target_rect,
                                     const Rect& source_rect,
                                     int start_y,
                                     int end_y) const
{
    for (int y = start_y; y < end_y; ++y) {
        const Color* center = source.row(source_rect.y + y) + source_rect.x;
        Color* out = target.row(y);
        for (int x = 0; x < target_rect.width; ++x) {
            const Rgb gx = convolve_at(source, source_rect, kernel_x_, x, y, border_, greyscale_);
            const Rgb gy = convolve_at(source, source_rect, kernel_y_, x, y, border_, greyscale_);
            out[x] = Color(clamp01(std::sqrt(gx.r * gx.r + gy.r * gy.r)),
                           clamp01(std::sqrt(gx.g * gx.g + gy.g * gy.g)),
                           clamp01(std::sqrt(gx.b * gx.b + gy.b * gy.b)),
                           center[x].a);
        }
    }
}

// ============================================================
// 可重用的 Separable Convolution
// ============================================================

SeparableFilter::SeparableFilter(std::vector<float> kernel_x, std::vector<float> kernel_y, Border border)
    : kernel_x_(std::move(kernel_x)), kernel_y_(std::move(kernel_y)), border_(border)
{
    check_kernel1d(kernel_x_, "SeparableFilter");
    check_kernel1d(kernel_y_, "SeparableFilter");
}

void SeparableFilter::apply_rows(PixelBuffer& target,
                                 const PixelBuffer& source,
                                 const Rect& /*target_rect*/,
                                 const Rect& source_rect,
                                 int start_y,
                                 int end_y) const
{
    const int W = source_rect.width;
    const int H = source_rect.height;
    const int RX = static_cast<int>(kernel_x_.size()) / 2;
    const int RY = static_cast<int>(kernel_y_.size()) / 2;

    // 這段 row range 需要的水平結果：[start_y - RY, end_y + RY)
    const int first = start_y - RY;
    const int count = (end_y + RY) - first;

    std::vector<Color> tmp(static_cast<std::size_t>(count) * W);
    std::vector<Color> line(static_cast<std::size_t>(W));

    // ---- 水平 pass: src → tmp ----
    for (int r = 0; r < count; ++r) {
        const int sy = border_index(first + r, H, border_);
        const Color* in = source.row(source_rect.y + sy) + source_rect.x;
        for (int x = 0; x < W; ++x) {
            line[static_cast<std::size_t>(x)] = premultiply(to_linear(in[x]));
        }

        Color* t = &tmp[static_cast<std::size_t>(r) * W];
        for (int x = 0; x < W; ++x) {
            Color sum(0.f, 0.f, 0.f, 0.f);
            for (int k = -RX; k <= RX; ++k) {
                sum += line[static_cast<std::size_t>(border_index(x + k, W, border_))] * kernel_x_[k + RX];
            }
            t[x] = sum;
        }
    }

    // ---- 垂直 pass: tmp → dst ----
    for (int y = start_y; y < end_y; ++y) {
        Color* out = target.row(y);
        for (int x = 0; x < W; ++x) {
            Color sum(0.f, 0.f, 0.f, 0.f);
            for (int k = -RY; k <= RY; ++k) {
                const int r = y + k - first;
                sum += tmp[static_cast<std::size_t>(r) * W + x] * kernel_y_[k + RY];
            }
            out[x] = clamped(to_companded(clamped(unpremultiply(sum))));
        }
    }
}

// ============================================================
// Blur / Sharpen
// ============================================================

GaussianBlur::GaussianBlur(float sigma, Border border)
    : SeparableFilter(gaussian_kernel1d(sigma), gaussian_kernel1d(sigma), border)
{
}

static std::vector<float> box_kernel_for_radius(int radius) {
    if (radius < 1) {
        throw ArgumentError("box_blur: radius must be >= 1");
    }
    return box_kernel1d(2 * radius + 1);
}

BoxBlur::BoxBlur(int radius, Border border)
    : SeparableFilter(box_kernel_for_radius(radius), box_kernel_for_radius(radius), border)
{
}

static std::vector<float> sharpen_kernel1d(float sigma) {
    std::vector<float> k = gaussian_kernel1d(sigma);
    for (float& v : k) v = -v;
    k[k.size() / 2] += 2.f;
    return k;
}

GaussianSharpen::GaussianSharpen(float sigma, Border border)
    : SeparableFilter(sharpen_kernel1d(sigma), sharpen_kernel1d(sigma), border)
{
}

// ============================================================
// Edge detection
// ============================================================

std::unique_ptr<ImageProcessor> make_edge_detector(EdgeDetection kind, bool greyscale) {
    const Border border = Border::Replicate;

    switch (kind) {
    case EdgeDetection::Prewitt:
        return std::make_unique<Convolution2DFilter>(
            Kernel(3, 3, {-1, 0, 1,
                          -1, 0, 1,
                          -1, 0, 1}),
            Kernel(3, 3, { 1,  1,  1,
                           0,  0,  0,
                          -1, -1, -1}),
            border, greyscale);
    case EdgeDetection::Sobel:
        return std::make_unique<Convolution2DFilter>(
            Kernel(3, 3, {-1, 0, 1,
                          -2, 0, 2,
                          -1, 0, 1}),
            Kernel(3, 3, {-1, -2, -1,
                           0,  0,  0,
                           1,  2,  1}),
            border, greyscale);
    case EdgeDetection::Scharr:
        return std::make_unique<Convolution2DFilter>(
            Kernel(3, 3, { -3, 0,  3,
                          -10, 0, 10,
                           -3, 0,  3}),
            Kernel(3, 3, { 3,  10,  3,
                           0,   0,  0,
                          -3, -10, -3}),
            border, greyscale);
    case EdgeDetection::Kayyali:
        return std::make_unique<Convolution2DFilter>(
            Kernel(3, 3, { 6, 0, -6,
                           0, 0,  0,
                          -6, 0,  6}),
            Kernel(3, 3, {-6, 0,  6,
                           0, 0,  0,
                           6, 0, -6}),
            border, greyscale);
    case EdgeDetection::Laplacian3x3:
        return std::make_unique<ConvolutionFilter>(
            Kernel(3, 3, {-1, -1, -1,
                          -1,  8, -1,
                          -1, -1, -1}),
            border, greyscale);
    case EdgeDetection::Laplacian5x5: {
        std::vector<float> k(25, -1.f);
        k[12] = 24.f;
        return std::make_unique<ConvolutionFilter>(Kernel(5, 5, std::move(k)), border, greyscale);
    }
    }
    throw ArgumentError("make_edge_detector: unknown kind");
}

} // namespace rk
