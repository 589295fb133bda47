#pragma once

#include "rasterkit/color.hpp"
#include "rasterkit/processor.hpp"

namespace rk {

// ------------------------------------------------------------
// PixelFilter：每個像素只看自己的 processor（尺寸不變）
// ------------------------------------------------------------
class PixelFilter : public ImageProcessor {
public:
    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

    // 輸入 / 輸出都是 companded 值
    virtual Color transform(const Color& c) const = 0;
};

// ------------------------------------------------------------
// 色彩矩陣（在 linear 空間套用，alpha 不變）
//   r' = r*m[0][0] + g*m[1][0] + b*m[2][0] + m[3][0]
//   g' = r*m[0][1] + g*m[1][1] + b*m[2][1] + m[3][1]
//   b' = r*m[0][2] + g*m[1][2] + b*m[2][2] + m[3][2]
// ------------------------------------------------------------
struct ColorMatrix {
    float m[4][3] = {
        {1.f, 0.f, 0.f},
        {0.f, 1.f, 0.f},
        {0.f, 0.f, 1.f},
        {0.f, 0.f, 0.f},
    };
};

enum class GreyscaleMode {
    Bt709,
    Bt601,
};

ColorMatrix greyscale_matrix(GreyscaleMode mode);
ColorMatrix sepia_matrix();
ColorMatrix polaroid_matrix();
ColorMatrix lomograph_matrix();
ColorMatrix black_white_matrix();

// saturation: -100 ~ 100（-100 = 灰階）
ColorMatrix saturation_matrix(int saturation);

// hue 旋轉角度，-180 ~ 180
ColorMatrix hue_matrix(float degrees);

class MatrixFilter : public PixelFilter {
public:
    explicit MatrixFilter(const ColorMatrix& matrix) : matrix_(matrix) {}

    const ColorMatrix& matrix() const { return matrix_; }
    Color transform(const Color& c) const override;

private:
    ColorMatrix matrix_;
};

// -100 ~ 100，在 linear 空間加上 value / 100
class Brightness : public PixelFilter {
public:
    explicit Brightness(int value);
    Color transform(const Color& c) const override;

private:
    int value_;
};

// -100 ~ 100，在 linear 空間以 0.5 為中心縮放 (100 + value) / 100
class Contrast : public PixelFilter {
public:
    explicit Contrast(int value);
    Color transform(const Color& c) const override;

private:
    int value_;
};

// 0 ~ 100，alpha 乘上 value / 100
class Alpha : public PixelFilter {
public:
    explicit Alpha(int percent);
    Color transform(const Color& c) const override;

private:
    int percent_;
};

class Invert : public PixelFilter {
public:
    Color transform(const Color& c) const override;
};

// v' = v ^ gamma（companded 值），gamma > 0
class Gamma : public PixelFilter {
public:
    explicit Gamma(float gamma);
    Color transform(const Color& c) const override;

private:
    float gamma_;
};

// 把像素疊在指定顏色上（linear 空間的 source-over）
class BackgroundColor : public PixelFilter {
public:
    explicit BackgroundColor(const Color& color) : color_(color) {}
    Color transform(const Color& c) const override;

private:
    Color color_;
};

} // namespace rk
