#pragma once

#include <memory>
#include <string>
#include <vector>

namespace rk {

// ------------------------------------------------------------
// Resampler：resize 用的 kernel，只需要 radius 與 weight(x)
// ------------------------------------------------------------
class Resampler {
public:
    virtual ~Resampler() = default;

    virtual float radius() const = 0;
    virtual float weight(float x) const = 0;
};

// Mitchell-Netravali 的 (B, C) cubic 家族
class BicubicResampler : public Resampler {
public:
    // 預設 (0, 0.5) = Catmull-Rom
    explicit BicubicResampler(float b = 0.f, float c = 0.5f);

    float radius() const override { return 2.f; }
    float weight(float x) const override;

    float b() const { return b_; }
    float c() const { return c_; }

private:
    float b_;
    float c_;
};

// windowed sinc，lobes = 2 / 3 / 5 / 8
class LanczosResampler : public Resampler {
public:
    explicit LanczosResampler(int lobes = 3);

    float radius() const override { return static_cast<float>(lobes_); }
    float weight(float x) const override;

private:
    int lobes_;
};

class BoxResampler : public Resampler {
public:
    float radius() const override { return 0.5f; }
    float weight(float x) const override;
};

// bilinear
class TriangleResampler : public Resampler {
public:
    float radius() const override { return 1.f; }
    float weight(float x) const override;
};

// Resize 看到這個型別時直接取最近的像素，不做加權
class NearestNeighborResampler : public Resampler {
public:
    float radius() const override { return 0.5f; }
    float weight(float x) const override;
};

// sin(pi x) / (pi x)
float sinc(float x);

// "bicubic", "bspline", "mitchell", "robidoux", "hermite",
// "lanczos2", "lanczos3", "lanczos5", "lanczos8", "box", "triangle", "nearest"
std::shared_ptr<const Resampler> make_resampler(const std::string& name);

std::vector<std::string> resampler_names();

} // namespace rk
