#include "rasterkit/tone.hpp"
#include "rasterkit/errors.hpp"

#include <cmath>
#include <string>

namespace rk {

namespace {

constexpr float kPi = 3.14159265358979323846f;

void check_range(int value, int lo, int hi, const char* who) {
    if (value < lo || value > hi) {
        throw ArgumentError(std::string(who) + ": value " + std::to_string(value) +
                            " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

// 三個通道都用同一組係數（灰階類）
ColorMatrix uniform_rows(float r, float g, float b) {
    ColorMatrix m;
    for (int c = 0; c < 3; ++c) {
        m.m[0][c] = r;
        m.m[1][c] = g;
        m.m[2][c] = b;
    }
    return m;
}

} // namespace

void PixelFilter::apply_rows(PixelBuffer& target,
                             const PixelBuffer& source,
                             const Rect& target_rect,
                             const Rect& source_rect,
                             int start_y,
                             int end_y) const
{
    for (int y = start_y; y < end_y; ++y) {
        const Color* in = source.row(source_rect.y + y) + source_rect.x;
        Color* out = target.row(y);
        for (int x = 0; x < target_rect.width; ++x) {
            out[x] = transform(in[x]);
        }
    }
}

// ======================
//  色彩矩陣
// ======================

ColorMatrix greyscale_matrix(GreyscaleMode mode) {
    if (mode == GreyscaleMode::Bt601) return uniform_rows(0.299f, 0.587f, 0.114f);
    return uniform_rows(0.2126f, 0.7152f, 0.0722f);
}

ColorMatrix sepia_matrix() {
    ColorMatrix m;
    m.m[0][0] = 0.393f; m.m[0][1] = 0.349f; m.m[0][2] = 0.272f;
    m.m[1][0] = 0.769f; m.m[1][1] = 0.686f; m.m[1][2] = 0.534f;
    m.m[2][0] = 0.189f; m.m[2][1] = 0.168f; m.m[2][2] = 0.131f;
    return m;
}

ColorMatrix polaroid_matrix() {
    ColorMatrix m;
    m.m[0][0] = 1.538f;  m.m[0][1] = -0.062f; m.m[0][2] = -0.262f;
    m.m[1][0] = -0.022f; m.m[1][1] = 1.578f;  m.m[1][2] = -0.022f;
    m.m[2][0] = 0.216f;  m.m[2][1] = -0.16f;  m.m[2][2] = 1.5831f;
    m.m[3][0] = 0.02f;   m.m[3][1] = -0.05f;  m.m[3][2] = -0.05f;
    return m;
}

ColorMatrix lomograph_matrix() {
    ColorMatrix m;
    m.m[0][0] = 1.50f;
    m.m[1][1] = 1.45f;
    m.m[2][2] = 1.09f;
    m.m[3][0] = -0.10f; m.m[3][1] = 0.05f; m.m[3][2] = -0.08f;
    return m;
}

ColorMatrix black_white_matrix() {
    ColorMatrix m = uniform_rows(1.5f, 1.5f, 1.5f);
    m.m[3][0] = m.m[3][1] = m.m[3][2] = -1.f;
    return m;
}

ColorMatrix saturation_matrix(int saturation) {
    check_range(saturation, -100, 100, "saturation");

    const float s = (100.f + saturation) / 100.f;
    const float complement = 1.f - s;
    const float cr = 0.3086f * complement;
    const float cg = 0.6094f * complement;
    const float cb = 0.0820f * complement;

    ColorMatrix m;
    m.m[0][0] = cr + s; m.m[0][1] = cr;     m.m[0][2] = cr;
    m.m[1][0] = cg;     m.m[1][1] = cg + s; m.m[1][2] = cg;
    m.m[2][0] = cb;     m.m[2][1] = cb;     m.m[2][2] = cb + s;
    return m;
}

ColorMatrix hue_matrix(float degrees) {
    if (!(degrees >= -180.f && degrees <= 180.f)) {
        throw ArgumentError("hue: angle must be in [-180, 180]");
    }

    const float rad = degrees * kPi / 180.f;
    const float cs = std::cos(rad);
    const float sn = std::sin(rad);

    // 以亮度為軸旋轉，亮度不變
    const float lr = 0.213f, lg = 0.715f, lb = 0.072f;

    ColorMatrix m;
    m.m[0][0] = lr + cs * (1.f - lr) - sn * lr;
    m.m[0][1] = lr - cs * lr + sn * 0.143f;
    m.m[0][2] = lr - cs * lr - sn * (1.f - lr);
    m.m[1][0] = lg - cs * lg - sn * lg;
    m.m[1][1] = lg + cs * (1.f - lg) + sn * 0.140f;
    m.m[1][2] = lg - cs * lg + sn * lg;
    m.m[2][0] = lb - cs * lb + sn * (1.f - lb);
    m.m[2][1] = lb - cs * lb - sn * 0.283f;
    m.m[2][2] = lb + cs * (1.f - lb) + sn * lb;
    return m;
}

Color MatrixFilter::transform(const Color& c) const {
    const Color l = to_linear(c);
    const auto& m = matrix_.m;
    const Color out(
        l.r * m[0][0] + l.g * m[1][0] + l.b * m[2][0] + m[3][0],
        l.r * m[0][1] + l.g * m[1][1] + l.b * m[2][1] + m[3][1],
        l.r * m[0][2] + l.g * m[1][2] + l.b * m[2][2] + m[3][2],
        l.a);
    return to_companded(clamped(out));
}

// ======================
//  單一參數的調整
// ======================

Brightness::Brightness(int value)
    : value_(value)
{
    check_range(value, -100, 100, "brightness");
}

Color Brightness::transform(const Color& c) const {
    const float delta = value_ / 100.f;
    Color l = to_linear(c);
    l.r += delta;
    l.g += delta;
    l.b += delta;
    return to_companded(clamped(l));
}

Contrast::Contrast(int value)
    : value_(value)
{
    check_range(value, -100, 100, "contrast");
}

Color Contrast::transform(const Color& c) const {
    const float contrast = (100.f + value_) / 100.f;
    Color l = to_linear(c);
    l.r = (l.r - 0.5f) * contrast + 0.5f;
    l.g = (l.g - 0.5f) * contrast + 0.5f;
    l.b = (l.b - 0.5f) * contrast + 0.5f;
    return to_companded(clamped(l));
}

Alpha::Alpha(int percent)
    : percent_(percent)
{
    check_range(percent, 0, 100, "alpha");
}

Color Alpha::transform(const Color& c) const {
    Color out = c;
    out.a = clamp01(c.a * (percent_ / 100.f));
    return out;
}

Color Invert::transform(const Color& c) const {
    return Color(1.f - c.r, 1.f - c.g, 1.f - c.b, c.a);
}

Gamma::Gamma(float gamma)
    : gamma_(gamma)
{
    if (!(gamma > 0.f)) {
        throw ArgumentError("gamma: gamma must be > 0");
    }
}

Color Gamma::transform(const Color& c) const {
    return Color(std::pow(clamp01(c.r), gamma_),
                 std::pow(clamp01(c.g), gamma_),
                 std::pow(clamp01(c.b), gamma_),
                 c.a);
}

Color BackgroundColor::transform(const Color& c) const {
    const Color fg = to_linear(c);
    const Color bg = to_linear(color_);

    const float a = fg.a + bg.a * (1.f - fg.a);
    if (a <= 0.f) return Color();

    const float wb = bg.a * (1.f - fg.a);
    const Color out((fg.r * fg.a + bg.r * wb) / a,
                    (fg.g * fg.a + bg.g * wb) / a,
                    (fg.b * fg.a + bg.b * wb) / a,
                    a);
    return to_companded(clamped(out));
}

} // namespace rk
