#include "rasterkit/effects.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <cmath>

namespace rk {

// =========================
//   Pixelate
// =========================

Pixelate::Pixelate(int size)
    : size_(size)
{
    if (size < 1) {
        throw ArgumentError("pixelate: size must be >= 1");
    }
}

void Pixelate::apply_rows(PixelBuffer& target,
                          const PixelBuffer& source,
                          const Rect& target_rect,
                          const Rect& source_rect,
                          int start_y,
                          int end_y) const
{
    const int W = target_rect.width;
    const int H = target_rect.height;
    const int half = size_ / 2;

    for (int y = start_y; y < end_y; ++y) {
        // 區塊中心（最後一塊可能不完整，clamp 回影像內）
        const int sy = std::min((y / size_) * size_ + half, H - 1);
        const Color* in = source.row(source_rect.y + sy) + source_rect.x;
        Color* out = target.row(y);
        for (int x = 0; x < W; ++x) {
            const int sx = std::min((x / size_) * size_ + half, W - 1);
            out[x] = in[sx];
        }
    }
}

// =========================
//   Vignette
// =========================

Vignette::Vignette(const Color& color, float strength)
    : color_(color), strength_(strength)
{
    if (!(strength >= 0.f && strength <= 1.f)) {
        throw ArgumentError("vignette: strength must be in [0, 1]");
    }
}

void Vignette::apply_rows(PixelBuffer& target,
                          const PixelBuffer& source,
                          const Rect& target_rect,
                          const Rect& source_rect,
                          int start_y,
                          int end_y) const
{
    const float cx = target_rect.width * 0.5f;
    const float cy = target_rect.height * 0.5f;
    const Color tint = to_linear(color_);

    for (int y = start_y; y < end_y; ++y) {
        const Color* in = source.row(source_rect.y + y) + source_rect.x;
        Color* out = target.row(y);
        const float dy = (y + 0.5f - cy) / cy;

        for (int x = 0; x < target_rect.width; ++x) {
            const float dx = (x + 0.5f - cx) / cx;

            // 正規化距離：中心 0、角落 1
            const float d = std::min(1.f, std::sqrt((dx * dx + dy * dy) * 0.5f));
            const float amount = strength_ * d * d * tint.a;

            const Color l = to_linear(in[x]);
            Color mixed = lerp(l, tint, amount);
            mixed.a = l.a;
            out[x] = to_companded(clamped(mixed));
        }
    }
}

} // namespace rk
