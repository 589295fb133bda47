#include "rasterkit/color.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace rk {

float clamp01(float v) {
    // NaN 也收斂到 0
    if (!(v > 0.f)) return 0.f;
    return v > 1.f ? 1.f : v;
}

Color clamped(const Color& c) {
    return Color(clamp01(c.r), clamp01(c.g), clamp01(c.b), clamp01(c.a));
}

// =========================
//   sRGB companding
// =========================

float srgb_to_linear(float v) {
    v = clamp01(v);
    if (v <= 0.04045f) return v / 12.92f;
    return std::pow((v + 0.055f) / 1.055f, 2.4f);
}

float linear_to_srgb(float v) {
    v = clamp01(v);
    if (v <= 0.0031308f) return v * 12.92f;
    return 1.055f * std::pow(v, 1.0f / 2.4f) - 0.055f;
}

Color to_linear(const Color& c) {
    return Color(srgb_to_linear(c.r), srgb_to_linear(c.g), srgb_to_linear(c.b), clamp01(c.a));
}

Color to_companded(const Color& c) {
    return Color(linear_to_srgb(c.r), linear_to_srgb(c.g), linear_to_srgb(c.b), clamp01(c.a));
}

static inline uint8_t to_byte(float v) {
    return static_cast<uint8_t>(std::lround(clamp01(v) * 255.f));
}

Rgba32 pack(const Color& c) {
    return Rgba32{to_byte(c.r), to_byte(c.g), to_byte(c.b), to_byte(c.a)};
}

Color unpack(const Rgba32& p) {
    constexpr float inv = 1.f / 255.f;
    return Color(p.r * inv, p.g * inv, p.b * inv, p.a * inv);
}

// =========================
//   HSV / HSL
// =========================

// 共用：回傳 hue（度），saturation 為 0 時 hue 定義為 0
static float hue_of(float r, float g, float b, float max, float delta) {
    if (delta <= 0.f) return 0.f;

    float h;
    if (max == r) {
        h = 60.f * std::fmod((g - b) / delta, 6.f);
    } else if (max == g) {
        h = 60.f * ((b - r) / delta + 2.f);
    } else {
        h = 60.f * ((r - g) / delta + 4.f);
    }
    if (h < 0.f) h += 360.f;
    if (h >= 360.f) h -= 360.f;
    return h;
}

Hsv to_hsv(const Color& c) {
    const float r = clamp01(c.r), g = clamp01(c.g), b = clamp01(c.b);
    const float max = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float delta = max - min;

    Hsv out;
    out.h = hue_of(r, g, b, max, delta);
    out.s = (max <= 0.f) ? 0.f : delta / max;
    out.v = max;
    return out;
}

Hsl to_hsl(const Color& c) {
    const float r = clamp01(c.r), g = clamp01(c.g), b = clamp01(c.b);
    const float max = std::max({r, g, b});
    const float min = std::min({r, g, b});
    const float delta = max - min;

    Hsl out;
    out.h = hue_of(r, g, b, max, delta);
    out.l = (max + min) * 0.5f;
    const float denom = 1.f - std::fabs(2.f * out.l - 1.f);
    out.s = (delta <= 0.f || denom <= 0.f) ? 0.f : clamp01(delta / denom);
    return out;
}

static float wrap_hue(float h) {
    h = std::fmod(h, 360.f);
    if (h < 0.f) h += 360.f;
    return h;
}

// chroma + hue → (r,g,b) 的共用部分，最後再加上 m
static Color from_chroma(float h, float chroma, float m, float alpha) {
    const float hp = wrap_hue(h) / 60.f;
    const float x = chroma * (1.f - std::fabs(std::fmod(hp, 2.f) - 1.f));

    float r = 0.f, g = 0.f, b = 0.f;
    switch (static_cast<int>(hp) % 6) {
    case 0: r = chroma; g = x;      b = 0.f;    break;
    case 1: r = x;      g = chroma; b = 0.f;    break;
    case 2: r = 0.f;    g = chroma; b = x;      break;
    case 3: r = 0.f;    g = x;      b = chroma; break;
    case 4: r = x;      g = 0.f;    b = chroma; break;
    default: r = chroma; g = 0.f;   b = x;      break;
    }
    return clamped(Color(r + m, g + m, b + m, alpha));
}

Color to_color(const Hsv& hsv, float alpha) {
    const float s = clamp01(hsv.s);
    const float v = clamp01(hsv.v);
    const float chroma = v * s;
    return from_chroma(hsv.h, chroma, v - chroma, alpha);
}

Color to_color(const Hsl& hsl, float alpha) {
    const float s = clamp01(hsl.s);
    const float l = clamp01(hsl.l);
    const float chroma = (1.f - std::fabs(2.f * l - 1.f)) * s;
    return from_chroma(hsl.h, chroma, l - chroma * 0.5f, alpha);
}

// =========================
//   CMYK
// =========================

Cmyk to_cmyk(const Color& c) {
    const float r = clamp01(c.r), g = clamp01(c.g), b = clamp01(c.b);
    Cmyk out;
    out.k = 1.f - std::max({r, g, b});
    if (out.k >= 1.f) {
        // 全黑：c/m/y 沒有意義，固定回報 0
        return out;
    }
    const float inv = 1.f / (1.f - out.k);
    out.c = clamp01((1.f - r - out.k) * inv);
    out.m = clamp01((1.f - g - out.k) * inv);
    out.y = clamp01((1.f - b - out.k) * inv);
    return out;
}

Color to_color(const Cmyk& cmyk, float alpha) {
    const float k = 1.f - clamp01(cmyk.k);
    return clamped(Color((1.f - clamp01(cmyk.c)) * k,
                         (1.f - clamp01(cmyk.m)) * k,
                         (1.f - clamp01(cmyk.y)) * k,
                         alpha));
}

// =========================
//   CIE XYZ (sRGB D65)
// =========================

CieXyz to_xyz(const Color& c) {
    const Color lin = to_linear(c);
    CieXyz out;
    out.x = 0.4124f * lin.r + 0.3576f * lin.g + 0.1805f * lin.b;
    out.y = 0.2126f * lin.r + 0.7152f * lin.g + 0.0722f * lin.b;
    out.z = 0.0193f * lin.r + 0.1192f * lin.g + 0.9505f * lin.b;
    return out;
}

Color to_color(const CieXyz& xyz, float alpha) {
    const float r =  3.2406f * xyz.x - 1.5372f * xyz.y - 0.4986f * xyz.z;
    const float g = -0.9689f * xyz.x + 1.8758f * xyz.y + 0.0415f * xyz.z;
    const float b =  0.0557f * xyz.x - 0.2040f * xyz.y + 1.0570f * xyz.z;
    return to_companded(Color(clamp01(r), clamp01(g), clamp01(b), alpha));
}

// =========================
//   YCbCr (ITU-R BT.601)
// =========================

YCbCr to_ycbcr(const Color& c) {
    // 先量化成 byte，跟 JPEG / 一般影像工具的結果一致
    const Rgba32 p = pack(c);
    const float r = p.r, g = p.g, b = p.b;

    YCbCr out;
    out.y  = std::clamp(0.299f * r + 0.587f * g + 0.114f * b, 0.f, 255.f);
    out.cb = std::clamp(128.f - 0.168736f * r - 0.331264f * g + 0.5f * b, 0.f, 255.f);
    out.cr = std::clamp(128.f + 0.5f * r - 0.418688f * g - 0.081312f * b, 0.f, 255.f);
    return out;
}

Color to_color(const YCbCr& ycc, float alpha) {
    const float y  = std::clamp(ycc.y, 0.f, 255.f);
    const float cb = std::clamp(ycc.cb, 0.f, 255.f) - 128.f;
    const float cr = std::clamp(ycc.cr, 0.f, 255.f) - 128.f;

    const float r = y + 1.402f * cr;
    const float g = y - 0.344136f * cb - 0.714136f * cr;
    const float b = y + 1.772f * cb;

    constexpr float inv = 1.f / 255.f;
    return clamped(Color(r * inv, g * inv, b * inv, alpha));
}

// =========================
//   misc
// =========================

float luminance_bt709(const Color& linear) {
    return 0.2126f * linear.r + 0.7152f * linear.g + 0.0722f * linear.b;
}

float luminance_bt601(const Color& linear) {
    return 0.299f * linear.r + 0.587f * linear.g + 0.114f * linear.b;
}

Color lerp(const Color& from, const Color& to, float amount) {
    amount = clamp01(amount);
    return from + (to - from) * amount;
}

static int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    const char lo = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lo >= 'a' && lo <= 'f') return lo - 'a' + 10;
    return -1;
}

Color parse_color(const std::string& text) {
    std::string hex = (!text.empty() && text[0] == '#') ? text.substr(1) : text;
    if (hex.size() != 3 && hex.size() != 6 && hex.size() != 8) {
        throw ArgumentError("parse_color: expected #rgb, #rrggbb or #rrggbbaa, got '" + text + "'");
    }

    std::string full;
    if (hex.size() == 3) {
        for (char ch : hex) { full += ch; full += ch; }
    } else {
        full = hex;
    }
    if (full.size() == 6) full += "ff";

    uint8_t bytes[4];
    for (int i = 0; i < 4; ++i) {
        const int hi = hex_digit(full[2 * i]);
        const int lo = hex_digit(full[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ArgumentError("parse_color: invalid hex digit in '" + text + "'");
        }
        bytes[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return unpack(Rgba32{bytes[0], bytes[1], bytes[2], bytes[3]});
}

std::string to_string(const Color& c) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Color [ R=%.3f, G=%.3f, B=%.3f, A=%.3f ]", c.r, c.g, c.b, c.a);
    return buf;
}

} // namespace rk
