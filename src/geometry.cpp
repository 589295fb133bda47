#include "rasterkit/geometry.hpp"
#include "rasterkit/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace rk {

namespace {

// 權重絕對值低於這個就丟掉
constexpr float kWeightEpsilon = 1e-4f;

// alpha 低於這個的樣本不參與加權，避免透明像素的顏色滲進來
constexpr float kAlphaEpsilon = 0.01f;

} // namespace

// ======================
//  Resize
// ======================

Resize::Resize(std::shared_ptr<const Resampler> resampler, int width, int height)
    : resampler_(std::move(resampler)), width_(width), height_(height)
{
    if (!resampler_) {
        throw ArgumentError("resize: resampler is null");
    }
    if (width < 0 || height < 0 || (width == 0 && height == 0)) {
        throw ArgumentError("resize: invalid new size " + std::to_string(width) + "x" +
                            std::to_string(height));
    }
}

Size Resize::target_size(const PixelBuffer& source) const {
    int w = width_;
    int h = height_;
    // 只給一邊：維持長寬比
    if (w == 0) {
        w = std::max(1, static_cast<int>(std::lround(
            static_cast<double>(source.width()) * h / source.height())));
    }
    if (h == 0) {
        h = std::max(1, static_cast<int>(std::lround(
            static_cast<double>(source.height()) * w / source.width())));
    }
    return Size{w, h};
}

std::vector<Resize::WeightSet> Resize::compute_weights(int dest_size, int source_size, Backend backend) const {
    std::vector<WeightSet> result(static_cast<std::size_t>(dest_size));

    const float du = static_cast<float>(source_size) / static_cast<float>(dest_size);
    const float scale = std::max(du, 1.f);
    const float ru = std::ceil(scale * resampler_->radius());
    const bool nearest = dynamic_cast<const NearestNeighborResampler*>(resampler_.get()) != nullptr;
    const bool parallel = backend == Backend::OpenMP;
    (void)parallel;

#ifdef RK_HAS_OPENMP
#pragma omp parallel for if(parallel)
#endif
    for (int i = 0; i < dest_size; ++i) {
        WeightSet& ws = result[static_cast<std::size_t>(i)];

        if (nearest) {
            const int index = std::min(source_size - 1, static_cast<int>(std::floor((i + 0.5f) * du)));
            ws.values.push_back(Weight{index, 1.f});
            ws.sum = 1.f;
            continue;
        }

        const float center = (i + 0.5f) * du - 0.5f;
        const int start = std::max(0, static_cast<int>(std::floor(center - ru)));
        const int end   = std::min(source_size - 1, static_cast<int>(std::ceil(center + ru)));

        for (int j = start; j <= end; ++j) {
            const float w = resampler_->weight((static_cast<float>(j) - center) / scale);
            if (std::fabs(w) > kWeightEpsilon) {
                ws.values.push_back(Weight{j, w});
                ws.sum += w;
            }
        }

        // kernel 在這個位置全為 0（理論上不會）：退回最近的像素
        if (ws.values.empty() || std::fabs(ws.sum) < kWeightEpsilon) {
            const int index = std::clamp(static_cast<int>(std::lround(center)), 0, source_size - 1);
            ws.values.assign(1, Weight{index, 1.f});
            ws.sum = 1.f;
        }
    }

    return result;
}

void Resize::prepare(const Rect& target_rect, const Rect& source_rect, Backend backend) {
    identity_ = target_rect.width == source_rect.width && target_rect.height == source_rect.height;
    if (identity_) {
        horizontal_.clear();
        vertical_.clear();
        return;
    }
    horizontal_ = compute_weights(target_rect.width, source_rect.width, backend);
    vertical_   = compute_weights(target_rect.height, source_rect.height, backend);
}

void Resize::apply_rows(PixelBuffer& target,
                        const PixelBuffer& source,
                        const Rect& target_rect,
                        const Rect& source_rect,
                        int start_y,
                        int end_y) const
{
    const int tw = target_rect.width;

    if (identity_) {
        for (int y = start_y; y < end_y; ++y) {
            const Color* in = source.row(source_rect.y + y) + source_rect.x;
            std::copy(in, in + tw, target.row(y));
        }
        return;
    }

    for (int y = start_y; y < end_y; ++y) {
        const WeightSet& vw = vertical_[static_cast<std::size_t>(y)];
        Color* out = target.row(y);

        for (int x = 0; x < tw; ++x) {
            const WeightSet& hw = horizontal_[static_cast<std::size_t>(x)];

            // premultiplied linear 累加
            float r = 0.f, g = 0.f, b = 0.f, a = 0.f;
            for (const Weight& yw : vw.values) {
                const Color* in = source.row(source_rect.y + yw.index) + source_rect.x;
                const float wy = yw.value / vw.sum;

                for (const Weight& xw : hw.values) {
                    const Color c = to_linear(in[xw.index]);
                    if (c.a < kAlphaEpsilon) continue;

                    const float w = wy * (xw.value / hw.sum);
                    r += c.r * c.a * w;
                    g += c.g * c.a * w;
                    b += c.b * c.a * w;
                    a += c.a * w;
                }
            }

            // alpha 只保留兩位小數
            const float alpha = clamp01(std::round(a * 100.f) / 100.f);
            if (alpha <= 0.f) {
                out[x] = Color();
                continue;
            }
            out[x] = clamped(to_companded(Color(r / a, g / a, b / a, alpha)));
        }
    }
}

// ======================
//  Crop
// ======================

Crop::Crop(const Rect& rect)
    : rect_(rect)
{
    if (rect.empty()) {
        throw ArgumentError("crop: invalid size " + std::to_string(rect.width) + "x" +
                            std::to_string(rect.height));
    }
}

Rect Crop::source_rectangle(const PixelBuffer& source) const {
    const Rect area = intersect(rect_, source.bounds());
    if (area.empty()) {
        throw ArgumentError("crop: rectangle lies outside the " + std::to_string(source.width()) +
                            "x" + std::to_string(source.height()) + " image");
    }
    return area;
}

Size Crop::target_size(const PixelBuffer& source) const {
    const Rect area = source_rectangle(source);
    return Size{area.width, area.height};
}

void Crop::apply_rows(PixelBuffer& target,
                      const PixelBuffer& source,
                      const Rect& target_rect,
                      const Rect& source_rect,
                      int start_y,
                      int end_y) const
{
    for (int y = start_y; y < end_y; ++y) {
        const Color* in = source.row(source_rect.y + y) + source_rect.x;
        std::copy(in, in + target_rect.width, target.row(y));
    }
}

// ======================
//  Flip
// ======================

void FlipHorizontal::apply_rows(PixelBuffer& target,
                                const PixelBuffer& source,
                                const Rect& target_rect,
                                const Rect& /*source_rect*/,
                                int start_y,
                                int end_y) const
{
    const int W = target_rect.width;
    for (int y = start_y; y < end_y; ++y) {
        const Color* in = source.row(y);
        Color* out = target.row(y);
        for (int x = 0; x < W; ++x) {
            out[x] = in[W - 1 - x];
        }
    }
}

void FlipVertical::apply_rows(PixelBuffer& target,
                              const PixelBuffer& source,
                              const Rect& target_rect,
                              const Rect& /*source_rect*/,
                              int start_y,
                              int end_y) const
{
    const int H = target_rect.height;
    for (int y = start_y; y < end_y; ++y) {
        const Color* in = source.row(H - 1 - y);
        std::copy(in, in + target_rect.width, target.row(y));
    }
}

// ======================
//  Public APIs
// ======================

void resize(Image& image, int width, int height,
            std::shared_ptr<const Resampler> resampler,
            const ProcessOptions& options)
{
    Resize processor(std::move(resampler), width, height);
    apply(image, processor, options);
}

void crop(Image& image, const Rect& rect, const ProcessOptions& options) {
    Crop processor(rect);
    apply(image, processor, options);
}

void flip_horizontal(Image& image, const ProcessOptions& options) {
    FlipHorizontal processor;
    apply(image, processor, options);
}

void flip_vertical(Image& image, const ProcessOptions& options) {
    FlipVertical processor;
    apply(image, processor, options);
}

} // namespace rk
