#include "rasterkit/effects.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/filters.hpp"
#include "rasterkit/tone.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <vector>

using namespace rk;

namespace {

class FiltersTest : public ::testing::Test
{
protected:
    static Image CreateSolid(int width, int height, const Color& color)
    {
        Image img(width, height);
        for (Color& c : img.pixels()) c = color;
        return img;
    }

    // 左半黑、右半白
    static Image CreateStep(int width, int height)
    {
        Image img(width, height);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.at(x, y) = x < width / 2 ? Color(0.f, 0.f, 0.f, 1.f) : Color(1.f, 1.f, 1.f, 1.f);
            }
        }
        return img;
    }

    static void ExpectColorNear(const Color& actual, const Color& expected, float tol = 1e-3f)
    {
        EXPECT_NEAR(actual.r, expected.r, tol);
        EXPECT_NEAR(actual.g, expected.g, tol);
        EXPECT_NEAR(actual.b, expected.b, tol);
        EXPECT_NEAR(actual.a, expected.a, tol);
    }
};

} // namespace

// Kernels / borders
TEST_F(FiltersTest, BorderIndex)
{
    EXPECT_EQ(border_index(-1, 5, Border::Reflect), 0);
    EXPECT_EQ(border_index(-2, 5, Border::Reflect), 1);
    EXPECT_EQ(border_index(5, 5, Border::Reflect), 4);
    EXPECT_EQ(border_index(12, 5, Border::Reflect), 2);
    EXPECT_EQ(border_index(-3, 1, Border::Reflect), 0);

    EXPECT_EQ(border_index(-1, 5, Border::Wrap), 4);
    EXPECT_EQ(border_index(7, 5, Border::Wrap), 2);

    EXPECT_EQ(border_index(-3, 5, Border::Replicate), 0);
    EXPECT_EQ(border_index(7, 5, Border::Replicate), 4);
    EXPECT_EQ(border_index(2, 5, Border::Replicate), 2);
}

TEST_F(FiltersTest, KernelValidation)
{
    EXPECT_THROW(Kernel(2, 3, std::vector<float>(6, 1.f)), ArgumentError);
    EXPECT_THROW(Kernel(3, 3, std::vector<float>(8, 1.f)), ArgumentError);
    const Kernel k(3, 1, {1.f, 2.f, 3.f});
    EXPECT_FLOAT_EQ(k.at(2, 0), 3.f);
}

TEST_F(FiltersTest, KernelUtilities)
{
    const std::vector<float> box = box_kernel1d(3);
    ASSERT_EQ(box.size(), 3u);
    EXPECT_FLOAT_EQ(box[1], 1.f / 3.f);
    EXPECT_THROW(box_kernel1d(4), ArgumentError);
    EXPECT_THROW(box_kernel1d(1), ArgumentError);

    const std::vector<float> gauss = gaussian_kernel1d(1.5f);
    EXPECT_EQ(gauss.size() % 2, 1u);
    EXPECT_NEAR(std::accumulate(gauss.begin(), gauss.end(), 0.f), 1.f, 1e-5f);
    EXPECT_GT(gauss[gauss.size() / 2], gauss.front());
    EXPECT_FLOAT_EQ(gauss.front(), gauss.back());
    EXPECT_THROW(gaussian_kernel1d(0.f), ArgumentError);
}

// Tone
TEST_F(FiltersTest, Greyscale)
{
    const MatrixFilter bt709(greyscale_matrix(GreyscaleMode::Bt709));
    const Color red = bt709.transform(Color(1.f, 0.f, 0.f, 0.5f));
    EXPECT_FLOAT_EQ(red.r, red.g);
    EXPECT_FLOAT_EQ(red.g, red.b);
    EXPECT_NEAR(red.r, linear_to_srgb(0.2126f), 1e-4f);
    EXPECT_FLOAT_EQ(red.a, 0.5f);

    const MatrixFilter bt601(greyscale_matrix(GreyscaleMode::Bt601));
    EXPECT_NEAR(bt601.transform(Color(0.f, 1.f, 0.f)).r, linear_to_srgb(0.587f), 1e-4f);
}

TEST_F(FiltersTest, IdentityMatrices)
{
    const Color c(0.3f, 0.5f, 0.7f, 0.9f);
    ExpectColorNear(MatrixFilter(ColorMatrix{}).transform(c), c, 1e-4f);
    ExpectColorNear(MatrixFilter(saturation_matrix(0)).transform(c), c, 1e-4f);
    ExpectColorNear(MatrixFilter(hue_matrix(0.f)).transform(c), c, 1e-3f);
}

TEST_F(FiltersTest, Desaturate)
{
    const Color out = MatrixFilter(saturation_matrix(-100)).transform(Color(0.9f, 0.2f, 0.4f));
    EXPECT_NEAR(out.r, out.g, 1e-5f);
    EXPECT_NEAR(out.g, out.b, 1e-5f);
    EXPECT_THROW(saturation_matrix(101), ArgumentError);
}

TEST_F(FiltersTest, HueRotationKeepsGrey)
{
    const Color grey(0.5f, 0.5f, 0.5f);
    ExpectColorNear(MatrixFilter(hue_matrix(120.f)).transform(grey), grey, 2e-3f);
    EXPECT_THROW(hue_matrix(181.f), ArgumentError);
}

TEST_F(FiltersTest, Sepia)
{
    const Color out = MatrixFilter(sepia_matrix()).transform(Color(0.5f, 0.5f, 0.5f));
    EXPECT_GT(out.r, out.g);
    EXPECT_GT(out.g, out.b);
}

TEST_F(FiltersTest, Brightness)
{
    ExpectColorNear(Brightness(100).transform(Color(0.f, 0.f, 0.f)), Color(1.f, 1.f, 1.f, 1.f));
    ExpectColorNear(Brightness(-100).transform(Color(0.7f, 0.2f, 1.f)), Color(0.f, 0.f, 0.f, 1.f));
    ExpectColorNear(Brightness(0).transform(Color(0.25f, 0.5f, 0.75f)), Color(0.25f, 0.5f, 0.75f));
    EXPECT_THROW(Brightness(101), ArgumentError);
    EXPECT_THROW(Brightness(-101), ArgumentError);
}

TEST_F(FiltersTest, Contrast)
{
    const float mid = linear_to_srgb(0.5f);
    ExpectColorNear(Contrast(-100).transform(Color(0.1f, 0.9f, 0.4f)), Color(mid, mid, mid, 1.f));
    ExpectColorNear(Contrast(0).transform(Color(0.1f, 0.9f, 0.4f)), Color(0.1f, 0.9f, 0.4f));
    ExpectColorNear(Contrast(100).transform(Color(1.f, 0.f, 0.f)), Color(1.f, 0.f, 0.f));
    EXPECT_THROW(Contrast(200), ArgumentError);
}

TEST_F(FiltersTest, AlphaInvertGamma)
{
    EXPECT_FLOAT_EQ(Alpha(50).transform(Color(1.f, 1.f, 1.f, 0.8f)).a, 0.4f);
    EXPECT_FLOAT_EQ(Alpha(0).transform(Color(1.f, 1.f, 1.f, 1.f)).a, 0.f);
    EXPECT_THROW(Alpha(101), ArgumentError);

    ExpectColorNear(Invert().transform(Color(0.2f, 0.5f, 1.f, 0.3f)), Color(0.8f, 0.5f, 0.f, 0.3f), 1e-6f);

    ExpectColorNear(Gamma(2.f).transform(Color(0.5f, 1.f, 0.f)), Color(0.25f, 1.f, 0.f), 1e-6f);
    EXPECT_THROW(Gamma(0.f), ArgumentError);
}

TEST_F(FiltersTest, BackgroundColor)
{
    const BackgroundColor white(Color(1.f, 1.f, 1.f, 1.f));
    ExpectColorNear(white.transform(Color(0.f, 0.f, 0.f, 0.f)), Color(1.f, 1.f, 1.f, 1.f));
    ExpectColorNear(white.transform(Color(0.2f, 0.4f, 0.6f, 1.f)), Color(0.2f, 0.4f, 0.6f, 1.f));

    const float half = linear_to_srgb(0.5f);
    ExpectColorNear(white.transform(Color(0.f, 0.f, 0.f, 0.5f)), Color(half, half, half, 1.f));

    const BackgroundColor clear(Color(1.f, 0.f, 0.f, 0.f));
    EXPECT_EQ(clear.transform(Color()), Color());
}

TEST_F(FiltersTest, PixelFilterAppliesToEveryPixel)
{
    Image img = CreateSolid(3, 3, Color(0.2f, 0.4f, 0.6f, 1.f));
    Invert invert;
    apply(img, invert);
    for (const Color& c : img.pixels()) ExpectColorNear(c, Color(0.8f, 0.6f, 0.4f, 1.f), 1e-6f);
}

// Blur / sharpen
TEST_F(FiltersTest, BlurPreservesUniformImage)
{
    const Color color(0.3f, 0.6f, 0.9f, 0.75f);
    for (Border border : {Border::Reflect, Border::Replicate, Border::Wrap}) {
        Image gaussian = CreateSolid(9, 7, color);
        GaussianBlur blur(2.f, border);
        apply(gaussian, blur);
        for (const Color& c : gaussian.pixels()) ExpectColorNear(c, color);

        Image box = CreateSolid(9, 7, color);
        BoxBlur box_blur(2, border);
        apply(box, box_blur);
        for (const Color& c : box.pixels()) ExpectColorNear(c, color);

        Image sharp = CreateSolid(9, 7, color);
        GaussianSharpen sharpen(1.f, border);
        apply(sharp, sharpen);
        for (const Color& c : sharp.pixels()) ExpectColorNear(c, color);
    }
}

TEST_F(FiltersTest, BlurSpreadsSymmetrically)
{
    Image img = CreateSolid(9, 9, Color(0.f, 0.f, 0.f, 1.f));
    img.at(4, 4) = Color(1.f, 1.f, 1.f, 1.f);

    GaussianBlur blur(1.f);
    apply(img, blur);

    EXPECT_LT(img.at(4, 4).r, 1.f);
    EXPECT_GT(img.at(3, 4).r, 0.f);
    EXPECT_NEAR(img.at(3, 4).r, img.at(5, 4).r, 1e-5f);
    EXPECT_NEAR(img.at(4, 3).r, img.at(4, 5).r, 1e-5f);
    EXPECT_GT(img.at(4, 4).r, img.at(3, 4).r);
}

TEST_F(FiltersTest, BlurIgnoresTransparentColor)
{
    // 透明像素的顏色不應該滲進來
    Image img = CreateSolid(5, 1, Color(1.f, 0.f, 0.f, 1.f));
    img.at(2, 0) = Color(0.f, 1.f, 0.f, 0.f);

    BoxBlur blur(1);
    apply(img, blur);
    EXPECT_NEAR(img.at(2, 0).g, 0.f, 1e-4f);
    EXPECT_NEAR(img.at(2, 0).r, 1.f, 1e-4f);
    EXPECT_LT(img.at(2, 0).a, 1.f);
}

TEST_F(FiltersTest, BlurValidation)
{
    EXPECT_THROW(GaussianBlur(0.f), ArgumentError);
    EXPECT_THROW(BoxBlur(0), ArgumentError);
    EXPECT_THROW(SeparableFilter({1.f, 1.f}, {1.f}), ArgumentError);
}

// Edge detection
TEST_F(FiltersTest, EdgesOnFlatImageAreZero)
{
    for (EdgeDetection kind : {EdgeDetection::Prewitt, EdgeDetection::Sobel, EdgeDetection::Scharr,
                               EdgeDetection::Kayyali, EdgeDetection::Laplacian3x3,
                               EdgeDetection::Laplacian5x5}) {
        Image img = CreateSolid(7, 7, Color(0.4f, 0.5f, 0.6f, 0.8f));
        auto detector = make_edge_detector(kind);
        apply(img, *detector);
        for (const Color& c : img.pixels()) {
            EXPECT_NEAR(c.r, 0.f, 1e-5f);
            EXPECT_NEAR(c.g, 0.f, 1e-5f);
            EXPECT_NEAR(c.b, 0.f, 1e-5f);
            EXPECT_FLOAT_EQ(c.a, 0.8f);
        }
    }
}

TEST_F(FiltersTest, SobelFindsVerticalEdge)
{
    Image img = CreateStep(8, 4);
    auto sobel = make_edge_detector(EdgeDetection::Sobel);
    apply(img, *sobel);

    EXPECT_FLOAT_EQ(img.at(0, 2).r, 0.f);
    EXPECT_FLOAT_EQ(img.at(7, 2).r, 0.f);
    EXPECT_FLOAT_EQ(img.at(3, 2).r, 1.f);
    EXPECT_FLOAT_EQ(img.at(4, 2).r, 1.f);
}

TEST_F(FiltersTest, ConvolutionIdentityKernel)
{
    Image img = CreateStep(4, 4);
    const Image before = img;
    ConvolutionFilter identity(Kernel(3, 3, {0, 0, 0, 0, 1, 0, 0, 0, 0}));
    apply(img, identity);
    EXPECT_EQ(img.pixels(), before.pixels());
}

// Effects
TEST_F(FiltersTest, Pixelate)
{
    Image img(5, 4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 5; ++x) img.at(x, y) = Color(x / 4.f, y / 3.f, 0.f, 1.f);
    }
    const Image source = img;

    Pixelate pixelate(2);
    apply(img, pixelate);

    EXPECT_EQ(img.at(0, 0), source.at(1, 1));
    EXPECT_EQ(img.at(1, 1), source.at(1, 1));
    EXPECT_EQ(img.at(2, 0), source.at(3, 1));
    EXPECT_EQ(img.at(3, 3), source.at(3, 3));
    // 最後一塊不完整：中心 clamp 回影像內
    EXPECT_EQ(img.at(4, 0), source.at(4, 1));

    EXPECT_THROW(Pixelate(0), ArgumentError);
}

TEST_F(FiltersTest, Vignette)
{
    const Color white(1.f, 1.f, 1.f, 1.f);
    Image img = CreateSolid(5, 5, white);

    Vignette vignette;
    apply(img, vignette);

    ExpectColorNear(img.at(2, 2), white);
    EXPECT_LT(img.at(0, 0).r, img.at(1, 1).r);
    EXPECT_LT(img.at(1, 1).r, img.at(2, 2).r);
    EXPECT_NEAR(img.at(0, 0).r, img.at(4, 4).r, 1e-5f);
    EXPECT_FLOAT_EQ(img.at(0, 0).a, 1.f);

    EXPECT_THROW(Vignette(Color(), 1.5f), ArgumentError);
}
