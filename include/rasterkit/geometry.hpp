#pragma once

#include <memory>
#include <vector>

#include "rasterkit/image.hpp"
#include "rasterkit/processor.hpp"
#include "rasterkit/resamplers.hpp"

namespace rk {

// ------------------------------------------------------------
// Resize：每個軸先算好 (source index, weight) 表，再在 linear 空間加權
// width 或 height 給 0 時依比例算另一邊
// ------------------------------------------------------------
class Resize : public ImageProcessor {
public:
    Resize(std::shared_ptr<const Resampler> resampler, int width, int height);

    const Resampler& resampler() const { return *resampler_; }

    Size target_size(const PixelBuffer& source) const override;
    void prepare(const Rect& target_rect, const Rect& source_rect, Backend backend) override;
    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

    struct Weight {
        int   index;
        float value;
    };

    struct WeightSet {
        std::vector<Weight> values;
        float sum = 0.f;
    };

    // 單一軸的權重表，dest_size 個 WeightSet
    std::vector<WeightSet> compute_weights(int dest_size, int source_size, Backend backend) const;

private:
    std::shared_ptr<const Resampler> resampler_;
    int width_;
    int height_;

    bool identity_ = false;
    std::vector<WeightSet> horizontal_;
    std::vector<WeightSet> vertical_;
};

// 取出 rect 範圍（先跟影像交集，交集為空丟 ArgumentError）
class Crop : public ImageProcessor {
public:
    explicit Crop(const Rect& rect);

    Size target_size(const PixelBuffer& source) const override;
    Rect source_rectangle(const PixelBuffer& source) const override;
    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;

private:
    Rect rect_;
};

class FlipHorizontal : public ImageProcessor {
public:
    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;
};

class FlipVertical : public ImageProcessor {
public:
    void apply_rows(PixelBuffer& target,
                    const PixelBuffer& source,
                    const Rect& target_rect,
                    const Rect& source_rect,
                    int start_y,
                    int end_y) const override;
};

// 便利函式：直接套用到整張 Image（所有 frame）
void resize(Image& image, int width, int height,
            std::shared_ptr<const Resampler> resampler = std::make_shared<BicubicResampler>(),
            const ProcessOptions& options = {});

void crop(Image& image, const Rect& rect, const ProcessOptions& options = {});

void flip_horizontal(Image& image, const ProcessOptions& options = {});
void flip_vertical(Image& image, const ProcessOptions& options = {});

} // namespace rk
