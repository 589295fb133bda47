#pragma once

#include "rasterkit/color.hpp"
#include "rasterkit/processor.hpp"

namespace rk {

// 馬賽克：size x size 的區塊都填成區塊中心的顏色
class Pixelate : public ImageProcessor {
public:
    // size >= 1
    explicit Pixelate(int size);

    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    int size_;
};

// 暗角：離中心越遠越接近 color，角落的混合比例 = strength
class Vignette : public ImageProcessor {
public:
    // strength: 0 ~ 1
    explicit Vignette(const Color& color = Color(0.f, 0.f, 0.f, 1.f), float strength = 0.75f);

    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    Color color_;
    float strength_;
};

} // namespace rk
