#pragma once

#include <cstdint>
#include <string>

namespace rk {

using std::uint8_t;

// ------------------------------------------------------------
// Color：四個 0~1 的 float 通道，存的是 companded (sRGB) 值
// 混色 / 加權運算請先 to_linear()，算完再 to_companded()
// ------------------------------------------------------------
struct Color {
    float r = 0.f;
    float g = 0.f;
    float b = 0.f;
    float a = 0.f;

    Color() = default;
    Color(float r_, float g_, float b_, float a_ = 1.f)
        : r(r_), g(g_), b(b_), a(a_) {}

    Color& operator+=(const Color& o) {
        r += o.r; g += o.g; b += o.b; a += o.a;
        return *this;
    }
    Color& operator-=(const Color& o) {
        r -= o.r; g -= o.g; b -= o.b; a -= o.a;
        return *this;
    }
    Color& operator*=(float s) {
        r *= s; g *= s; b *= s; a *= s;
        return *this;
    }

    friend Color operator+(Color l, const Color& r) { return l += r; }
    friend Color operator-(Color l, const Color& r) { return l -= r; }
    friend Color operator*(Color l, float s) { return l *= s; }
    friend Color operator*(float s, Color l) { return l *= s; }

    friend bool operator==(const Color& l, const Color& r) {
        return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
    }
    friend bool operator!=(const Color& l, const Color& r) { return !(l == r); }
};

// byte-packed 表示（GIF palette / stb buffer 都是這個排列）
struct Rgba32 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0;

    friend bool operator==(const Rgba32& l, const Rgba32& r) {
        return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
    }
    friend bool operator!=(const Rgba32& l, const Rgba32& r) { return !(l == r); }
};

// 其他色彩空間（全部都是 plain struct，轉換函式在下面）
struct Hsv    { float h = 0.f, s = 0.f, v = 0.f; };          // h: [0,360)  s,v: [0,1]
struct Hsl    { float h = 0.f, s = 0.f, l = 0.f; };          // h: [0,360)  s,l: [0,1]
struct Cmyk   { float c = 0.f, m = 0.f, y = 0.f, k = 0.f; }; // [0,1]
struct CieXyz { float x = 0.f, y = 0.f, z = 0.f; };          // D65, Y 白點 = 1
struct YCbCr  { float y = 0.f, cb = 0.f, cr = 0.f; };        // BT.601，[0,255]

float clamp01(float v);

Color clamped(const Color& c);

// ------------------------------------------------------------
// companding
// ------------------------------------------------------------
float srgb_to_linear(float v);
float linear_to_srgb(float v);

Color to_linear(const Color& c);
Color to_companded(const Color& c);

Rgba32 pack(const Color& c);
Color  unpack(const Rgba32& p);

// ------------------------------------------------------------
// 色彩空間轉換（輸入 / 輸出都會 clamp，不丟例外）
// ------------------------------------------------------------
Hsv    to_hsv(const Color& c);
Hsl    to_hsl(const Color& c);
Cmyk   to_cmyk(const Color& c);
CieXyz to_xyz(const Color& c);
YCbCr  to_ycbcr(const Color& c);

Color to_color(const Hsv& hsv, float alpha = 1.f);
Color to_color(const Hsl& hsl, float alpha = 1.f);
Color to_color(const Cmyk& cmyk, float alpha = 1.f);
Color to_color(const CieXyz& xyz, float alpha = 1.f);
Color to_color(const YCbCr& ycc, float alpha = 1.f);

// 亮度：輸入為 linear 值
float luminance_bt709(const Color& linear);
float luminance_bt601(const Color& linear);

Color lerp(const Color& from, const Color& to, float amount);

// "#rgb" / "#rrggbb" / "#rrggbbaa"，'#' 可省略
Color parse_color(const std::string& hex);

std::string to_string(const Color& c);

} // namespace rk
