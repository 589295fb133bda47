#pragma once

#include <memory>
#include <vector>

#include "rasterkit/processor.hpp"

namespace rk {

// ------------------------------------------------------------
// 邊界模式（越界的 index 怎麼映射回影像內）
// ------------------------------------------------------------
enum class Border {
    Reflect,
    Replicate,
    Wrap,
};

// 將越界的 index 依照 Border 規則映射回 [0, n-1]
int border_index(int i, int n, Border border);

// ------------------------------------------------------------
// 2-D kernel，row-major，寬高都必須是奇數
// ------------------------------------------------------------
struct Kernel {
    int width = 0;
    int height = 0;
    std::vector<float> values;

    Kernel() = default;
    Kernel(int w, int h, std::vector<float> v);

    float at(int x, int y) const { return values[static_cast<std::size_t>(y) * width + x]; }
};

// ------------------------------------------------------------
// Kernel utilities
// ------------------------------------------------------------

// box kernel: k 個 1/k
std::vector<float> box_kernel1d(int ksize);

// gaussian kernel: sum = 1
std::vector<float> gaussian_kernel1d(float sigma);

// ------------------------------------------------------------
// 單一 kernel 的 convolution（companded RGB，alpha 保留）
// greyscale = true 時先轉成 BT.709 灰階再取樣
// ------------------------------------------------------------
class ConvolutionFilter : public ImageProcessor {
public:
    explicit ConvolutionFilter(Kernel kernel,
                               Border border = Border::Replicate,
                               bool greyscale = false);

    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    Kernel kernel_;
    Border border_;
    bool greyscale_;
};

// 兩個方向的梯度，輸出 sqrt(gx^2 + gy^2)
class Convolution2DFilter : public ImageProcessor {
public:
    Convolution2DFilter(Kernel kernel_x,
                        Kernel kernel_y,
                        Border border = Border::Replicate,
                        bool greyscale = false);

    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    Kernel kernel_x_;
    Kernel kernel_y_;
    Border border_;
    bool greyscale_;
};

// ------------------------------------------------------------
// 可分離的 convolution：先水平、再垂直
// 在 linear + premultiplied alpha 空間計算，四個通道一起處理
// ------------------------------------------------------------
class SeparableFilter : public ImageProcessor {
public:
    SeparableFilter(std::vector<float> kernel_x,
                    std::vector<float> kernel_y,
                    Border border = Border::Replicate);

    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    std::vector<float> kernel_x_;
    std::vector<float> kernel_y_;
    Border border_;
};

// sigma > 0
class GaussianBlur : public SeparableFilter {
public:
    explicit GaussianBlur(float sigma, Border border = Border::Replicate);
};

// radius >= 1，kernel 長度 2 * radius + 1
class BoxBlur : public SeparableFilter {
public:
    explicit BoxBlur(int radius, Border border = Border::Replicate);
};

// 2 * delta - gaussian，sum = 1
class GaussianSharpen : public SeparableFilter {
public:
    explicit GaussianSharpen(float sigma, Border border = Border::Replicate);
};

// ------------------------------------------------------------
// 邊緣偵測
// ------------------------------------------------------------
enum class EdgeDetection {
    Prewitt,
    Sobel,
    Scharr,
    Kayyali,
    Laplacian3x3,
    Laplacian5x5,
};

std::unique_ptr<ImageProcessor> make_edge_detector(EdgeDetection kind, bool greyscale = true);

} // namespace rk
