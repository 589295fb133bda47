#include "rasterkit/errors.hpp"
#include "rasterkit/geometry.hpp"
#include "rasterkit/resamplers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>

using namespace rk;

namespace {

class ResizeTest : public ::testing::Test
{
protected:
    // (x, y) → r = x / 255, g = y / 255
    static Image CreateCoordinates(int width, int height)
    {
        Image img(width, height);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.at(x, y) = Color(x / 255.f, y / 255.f, 0.f, 1.f);
            }
        }
        return img;
    }

    static Image CreateSolid(int width, int height, const Color& color)
    {
        Image img(width, height);
        for (Color& c : img.pixels()) c = color;
        return img;
    }
};

} // namespace

// Resamplers
TEST_F(ResizeTest, BicubicWeights)
{
    const BicubicResampler catmull_rom;
    EXPECT_FLOAT_EQ(catmull_rom.weight(0.f), 1.f);
    EXPECT_NEAR(catmull_rom.weight(1.f), 0.f, 1e-6f);
    EXPECT_NEAR(catmull_rom.weight(-1.f), 0.f, 1e-6f);
    EXPECT_FLOAT_EQ(catmull_rom.weight(2.f), 0.f);
    EXPECT_FLOAT_EQ(catmull_rom.radius(), 2.f);

    const BicubicResampler bspline(1.f, 0.f);
    EXPECT_NEAR(bspline.weight(0.f), 2.f / 3.f, 1e-6f);
}

TEST_F(ResizeTest, LanczosWeights)
{
    const LanczosResampler lanczos(3);
    EXPECT_FLOAT_EQ(lanczos.weight(0.f), 1.f);
    EXPECT_NEAR(lanczos.weight(1.f), 0.f, 1e-5f);
    EXPECT_NEAR(lanczos.weight(2.f), 0.f, 1e-5f);
    EXPECT_FLOAT_EQ(lanczos.weight(3.f), 0.f);
    EXPECT_FLOAT_EQ(lanczos.radius(), 3.f);
    EXPECT_THROW(LanczosResampler(0), ArgumentError);
}

TEST_F(ResizeTest, SimpleWeights)
{
    EXPECT_FLOAT_EQ(BoxResampler().weight(0.5f), 1.f);
    EXPECT_FLOAT_EQ(BoxResampler().weight(-0.5f), 0.f);
    EXPECT_FLOAT_EQ(TriangleResampler().weight(0.25f), 0.75f);
    EXPECT_FLOAT_EQ(TriangleResampler().weight(1.f), 0.f);
    EXPECT_FLOAT_EQ(sinc(0.f), 1.f);
    EXPECT_FLOAT_EQ(sinc(1.f), 0.f);
}

TEST_F(ResizeTest, MakeResampler)
{
    for (const std::string& name : resampler_names()) {
        EXPECT_NE(make_resampler(name), nullptr) << name;
    }
    EXPECT_NE(dynamic_cast<const NearestNeighborResampler*>(make_resampler("nearest").get()), nullptr);
    EXPECT_FLOAT_EQ(make_resampler("lanczos8")->radius(), 8.f);
    EXPECT_THROW(make_resampler("sinc"), ArgumentError);
}

// Resize
TEST_F(ResizeTest, InvalidSize)
{
    auto bicubic = std::make_shared<BicubicResampler>();
    EXPECT_THROW(Resize(bicubic, 0, 0), ArgumentError);
    EXPECT_THROW(Resize(bicubic, -1, 10), ArgumentError);
    EXPECT_THROW(Resize(nullptr, 10, 10), ArgumentError);
}

TEST_F(ResizeTest, KeepsAspectRatio)
{
    const Image img(100, 50);
    EXPECT_EQ(Resize(make_resampler("box"), 50, 0).target_size(img).height, 25);
    EXPECT_EQ(Resize(make_resampler("box"), 0, 10).target_size(img).width, 20);

    Image tiny(3, 1000);
    EXPECT_EQ(Resize(make_resampler("box"), 0, 10).target_size(tiny).width, 1);
}

TEST_F(ResizeTest, SameSizeIsIdentity)
{
    Image img = CreateCoordinates(7, 5);
    img.at(3, 3).a = 0.25f;
    const Image before = img;

    resize(img, 7, 5, make_resampler("lanczos3"));
    EXPECT_EQ(img.pixels(), before.pixels());
}

TEST_F(ResizeTest, UniformColorIsPreserved)
{
    const Color color(0.4f, 0.6f, 0.8f, 1.f);
    for (const std::string& name : resampler_names()) {
        Image img = CreateSolid(10, 10, color);
        resize(img, 1, 1, make_resampler(name));
        ASSERT_EQ(img.width(), 1);
        ASSERT_EQ(img.height(), 1);
        EXPECT_NEAR(img.at(0, 0).r, color.r, 1e-3f) << name;
        EXPECT_NEAR(img.at(0, 0).g, color.g, 1e-3f) << name;
        EXPECT_NEAR(img.at(0, 0).b, color.b, 1e-3f) << name;
        EXPECT_FLOAT_EQ(img.at(0, 0).a, 1.f) << name;
    }
}

TEST_F(ResizeTest, ShrinkToOnePixelIsWeightedAverage)
{
    Image source(6, 4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 6; ++x) {
            source.at(x, y) = Color(x / 5.f, y / 3.f, float((x + y) % 2), 1.f);
        }
    }

    // box：每個 source pixel 權重相同，就是 linear 空間的平均
    {
        Image img = source;
        resize(img, 1, 1, make_resampler("box"));

        Color mean(0.f, 0.f, 0.f, 0.f);
        for (const Color& c : source.pixels()) {
            const Color l = to_linear(c);
            mean.r += l.r / 24.f;
            mean.g += l.g / 24.f;
            mean.b += l.b / 24.f;
        }
        mean.a = 1.f;
        const Color expected = to_companded(mean);

        EXPECT_NEAR(img.at(0, 0).r, expected.r, 1e-4f);
        EXPECT_NEAR(img.at(0, 0).g, expected.g, 1e-4f);
        EXPECT_NEAR(img.at(0, 0).b, expected.b, 1e-4f);
        EXPECT_FLOAT_EQ(img.at(0, 0).a, 1.f);
    }

    // triangle：依 compute_weights 的權重加權，且涵蓋整張 source
    {
        const Resize processor(make_resampler("triangle"), 1, 1);
        const auto horizontal = processor.compute_weights(1, 6, Backend::Single);
        const auto vertical   = processor.compute_weights(1, 4, Backend::Single);
        ASSERT_EQ(horizontal[0].values.size(), 6u);
        ASSERT_EQ(vertical[0].values.size(), 4u);

        Color sum(0.f, 0.f, 0.f, 0.f);
        for (const auto& yw : vertical[0].values) {
            for (const auto& xw : horizontal[0].values) {
                const float w = (yw.value / vertical[0].sum) * (xw.value / horizontal[0].sum);
                const Color l = to_linear(source.at(xw.index, yw.index));
                sum.r += l.r * w;
                sum.g += l.g * w;
                sum.b += l.b * w;
            }
        }
        sum.a = 1.f;
        const Color expected = to_companded(sum);

        Image img = source;
        resize(img, 1, 1, make_resampler("triangle"));
        EXPECT_NEAR(img.at(0, 0).r, expected.r, 1e-4f);
        EXPECT_NEAR(img.at(0, 0).g, expected.g, 1e-4f);
        EXPECT_NEAR(img.at(0, 0).b, expected.b, 1e-4f);

        // 不是中間某個 pixel 的值
        for (const Color& c : source.pixels()) {
            EXPECT_GT(std::fabs(c.r - img.at(0, 0).r) + std::fabs(c.g - img.at(0, 0).g) +
                      std::fabs(c.b - img.at(0, 0).b), 1e-3f);
        }
    }
}

TEST_F(ResizeTest, UpscaleUniform)
{
    const Color color(0.2f, 0.3f, 0.9f, 1.f);
    Image img = CreateSolid(3, 2, color);
    resize(img, 12, 8);
    for (const Color& c : img.pixels()) {
        EXPECT_NEAR(c.r, color.r, 1e-3f);
        EXPECT_NEAR(c.b, color.b, 1e-3f);
    }
}

TEST_F(ResizeTest, NearestPicksSourcePixels)
{
    Image img = CreateCoordinates(4, 4);
    const Image source = img;
    resize(img, 2, 2, make_resampler("nearest"));

    EXPECT_EQ(img.at(0, 0), source.at(1, 1));
    EXPECT_EQ(img.at(1, 0), source.at(3, 1));
    EXPECT_EQ(img.at(1, 1), source.at(3, 3));
}

TEST_F(ResizeTest, TransparentSamplesDoNotBleed)
{
    Image img(2, 1);
    img.at(0, 0) = Color(1.f, 0.f, 0.f, 1.f);
    img.at(1, 0) = Color(0.f, 1.f, 0.f, 0.f);

    resize(img, 1, 1, make_resampler("triangle"));
    EXPECT_NEAR(img.at(0, 0).r, 1.f, 1e-4f);
    EXPECT_NEAR(img.at(0, 0).g, 0.f, 1e-4f);
    EXPECT_FLOAT_EQ(img.at(0, 0).a, 0.5f);
}

TEST_F(ResizeTest, FullyTransparentStaysTransparent)
{
    Image img = CreateSolid(4, 4, Color(1.f, 1.f, 1.f, 0.f));
    resize(img, 2, 2);
    for (const Color& c : img.pixels()) EXPECT_EQ(c, Color());
}

TEST_F(ResizeTest, ResizesAllFrames)
{
    Image img = CreateSolid(8, 8, Color(1.f, 0.f, 0.f, 1.f));
    img.add_frame(ImageFrame(8, 8));
    resize(img, 4, 0);

    EXPECT_EQ(img.width(), 4);
    EXPECT_EQ(img.height(), 4);
    EXPECT_EQ(img.frame(1).width(), 4);
    EXPECT_EQ(img.frame(1).height(), 4);
}

TEST_F(ResizeTest, ComputeWeightsAreNormalizable)
{
    const Resize processor(make_resampler("lanczos3"), 10, 10);
    const auto weights = processor.compute_weights(7, 20, Backend::Single);
    ASSERT_EQ(weights.size(), 7u);
    for (const auto& ws : weights) {
        ASSERT_FALSE(ws.values.empty());
        EXPECT_GT(ws.sum, 0.f);
        for (const auto& w : ws.values) {
            EXPECT_GE(w.index, 0);
            EXPECT_LT(w.index, 20);
        }
    }
}

// Crop
TEST_F(ResizeTest, Crop)
{
    Image img = CreateCoordinates(6, 5);
    const Image source = img;
    crop(img, Rect{1, 2, 3, 2});

    EXPECT_EQ(img.width(), 3);
    EXPECT_EQ(img.height(), 2);
    EXPECT_EQ(img.at(0, 0), source.at(1, 2));
    EXPECT_EQ(img.at(2, 1), source.at(3, 3));
}

TEST_F(ResizeTest, CropIsClippedToImage)
{
    Image img = CreateCoordinates(4, 4);
    const Image source = img;
    crop(img, Rect{2, 3, 10, 10});

    EXPECT_EQ(img.width(), 2);
    EXPECT_EQ(img.height(), 1);
    EXPECT_EQ(img.at(1, 0), source.at(3, 3));
}

TEST_F(ResizeTest, CropOutside)
{
    Image img = CreateCoordinates(4, 4);
    EXPECT_THROW(crop(img, Rect{4, 0, 2, 2}), ArgumentError);
    EXPECT_THROW(crop(img, Rect{0, 0, 0, 2}), ArgumentError);
    EXPECT_EQ(img.width(), 4);
}

// Flip
TEST_F(ResizeTest, FlipHorizontal)
{
    Image img = CreateCoordinates(5, 3);
    const Image source = img;
    flip_horizontal(img);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            EXPECT_EQ(img.at(x, y), source.at(4 - x, y));
        }
    }
}

TEST_F(ResizeTest, FlipVertical)
{
    Image img = CreateCoordinates(5, 3);
    const Image source = img;
    flip_vertical(img);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            EXPECT_EQ(img.at(x, y), source.at(x, 2 - y));
        }
    }

    flip_vertical(img);
    EXPECT_EQ(img.pixels(), source.pixels());
}
