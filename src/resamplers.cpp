#include "rasterkit/resamplers.hpp"
#include "rasterkit/errors.hpp"

#include <cmath>

namespace rk {

namespace {

constexpr float kPi = 3.14159265358979323846f;

// 非常接近 0 的結果直接當 0
float clean(float x) {
    return std::fabs(x) < 1e-5f ? 0.f : x;
}

} // namespace

float sinc(float x) {
    if (std::fabs(x) > 1e-5f) {
        x *= kPi;
        return clean(std::sin(x) / x);
    }
    return 1.f;
}

// ======================
//  Bicubic (B, C)
// ======================

BicubicResampler::BicubicResampler(float b, float c)
    : b_(b), c_(c)
{
}

float BicubicResampler::weight(float x) const {
    x = std::fabs(x);
    const float x2 = x * x;
    const float x3 = x2 * x;

    if (x < 1.f) {
        return ((12.f - 9.f * b_ - 6.f * c_) * x3 +
                (-18.f + 12.f * b_ + 6.f * c_) * x2 +
                (6.f - 2.f * b_)) / 6.f;
    }
    if (x < 2.f) {
        return ((-b_ - 6.f * c_) * x3 +
                (6.f * b_ + 30.f * c_) * x2 +
                (-12.f * b_ - 48.f * c_) * x +
                (8.f * b_ + 24.f * c_)) / 6.f;
    }
    return 0.f;
}

// ======================
//  Lanczos
// ======================

LanczosResampler::LanczosResampler(int lobes)
    : lobes_(lobes)
{
    if (lobes < 1) {
        throw ArgumentError("LanczosResampler: lobes must be >= 1");
    }
}

float LanczosResampler::weight(float x) const {
    x = std::fabs(x);
    const float n = static_cast<float>(lobes_);
    if (x < n) return sinc(x) * sinc(x / n);
    return 0.f;
}

// ======================
//  Box / Triangle / Nearest
// ======================

float BoxResampler::weight(float x) const {
    // 半開區間，剛好落在兩格中間時只取一邊
    return (x > -0.5f && x <= 0.5f) ? 1.f : 0.f;
}

float TriangleResampler::weight(float x) const {
    x = std::fabs(x);
    return x < 1.f ? 1.f - x : 0.f;
}

float NearestNeighborResampler::weight(float x) const {
    return (x > -0.5f && x <= 0.5f) ? 1.f : 0.f;
}

// ======================
//  名稱 → resampler
// ======================

std::shared_ptr<const Resampler> make_resampler(const std::string& name) {
    if (name == "bicubic")  return std::make_shared<BicubicResampler>(0.f, 0.5f);
    if (name == "bspline")  return std::make_shared<BicubicResampler>(1.f, 0.f);
    if (name == "mitchell") return std::make_shared<BicubicResampler>(1.f / 3.f, 1.f / 3.f);
    if (name == "robidoux") return std::make_shared<BicubicResampler>(0.37821575509399867f, 0.31089212245300067f);
    if (name == "hermite")  return std::make_shared<BicubicResampler>(0.f, 0.f);
    if (name == "lanczos2") return std::make_shared<LanczosResampler>(2);
    if (name == "lanczos3") return std::make_shared<LanczosResampler>(3);
    if (name == "lanczos5") return std::make_shared<LanczosResampler>(5);
    if (name == "lanczos8") return std::make_shared<LanczosResampler>(8);
    if (name == "box")      return std::make_shared<BoxResampler>();
    if (name == "triangle") return std::make_shared<TriangleResampler>();
    if (name == "nearest")  return std::make_shared<NearestNeighborResampler>();
    throw ArgumentError("make_resampler: unknown resampler '" + name + "'");
}

std::vector<std::string> resampler_names() {
    return {"bicubic", "bspline", "mitchell", "robidoux", "hermite",
            "lanczos2", "lanczos3", "lanczos5", "lanczos8",
            "box", "triangle", "nearest"};
}

} // namespace rk
