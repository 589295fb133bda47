#include "rasterkit/codecs.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/formats.hpp"
#include "rasterkit/gif.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace rk;

namespace {

// 測試用的格式："RKT!" + width + height，像素一律填白色
class TaggedDecoder : public ImageDecoder
{
public:
    std::size_t header_size() const override { return 4; }

    bool is_supported(const std::vector<uint8_t>& header) const override
    {
        return header.size() >= 4 && std::memcmp(header.data(), "RKT!", 4) == 0;
    }

    void decode(Image& image, std::istream& stream) const override
    {
        char magic[4];
        stream.read(magic, 4);
        const int w = stream.get();
        const int h = stream.get();
        if (!stream) throw FormatError("tagged: truncated");
        image = Image(w, h);
        for (Color& c : image.pixels()) c = Color(1.f, 1.f, 1.f, 1.f);
    }
};

class TaggedEncoder : public ImageEncoder
{
public:
    void encode(const Image& image, std::ostream& stream) const override
    {
        stream.write("RKT!", 4);
        stream.put(static_cast<char>(image.width()));
        stream.put(static_cast<char>(image.height()));
    }
};

class FormatsTest : public ::testing::Test
{
protected:
    static std::shared_ptr<const ImageFormat> MakeTagged()
    {
        return std::make_shared<const ImageFormat>(
            "tagged", "image/x-tagged", std::vector<std::string>{"rkt", "tag"},
            std::make_shared<TaggedDecoder>(), std::make_shared<TaggedEncoder>());
    }

    static Image CreateCheckerboard(int width, int height)
    {
        Image img(width, height);
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                img.at(x, y) = ((x + y) % 2) ? Color(1.f, 0.f, 0.f, 1.f) : Color(0.f, 0.f, 1.f, 1.f);
            }
        }
        return img;
    }
};

} // namespace

// Registry
TEST_F(FormatsTest, DefaultRegistryOrder)
{
    const FormatRegistry& registry = default_registry();
    ASSERT_EQ(registry.formats().size(), 4u);
    EXPECT_EQ(registry.describe(), "bmp, jpeg, png, gif");
    EXPECT_EQ(registry.max_header_size(), 8u);
}

TEST_F(FormatsTest, FindByNameOrExtension)
{
    const FormatRegistry& registry = default_registry();
    ASSERT_NE(registry.find("gif"), nullptr);
    EXPECT_EQ(registry.find("GIF")->name(), "gif");
    EXPECT_EQ(registry.find(".jpg")->name(), "jpeg");
    EXPECT_EQ(registry.find("jfif")->name(), "jpeg");
    EXPECT_EQ(registry.find("jpeg")->mime_type(), "image/jpeg");
    EXPECT_EQ(registry.find("tiff"), nullptr);
}

TEST_F(FormatsTest, DetectBySignature)
{
    const FormatRegistry& registry = default_registry();

    const std::vector<uint8_t> gif = {'G', 'I', 'F', '8', '9', 'a', 0, 0};
    ASSERT_NE(registry.detect(gif), nullptr);
    EXPECT_EQ(registry.detect(gif)->name(), "gif");

    const std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    EXPECT_EQ(registry.detect(png)->name(), "png");

    const std::vector<uint8_t> bmp = {'B', 'M'};
    EXPECT_EQ(registry.detect(bmp)->name(), "bmp");

    EXPECT_EQ(registry.detect({}), nullptr);
    EXPECT_EQ(registry.detect({'n', 'o', 'p', 'e'}), nullptr);
}

TEST_F(FormatsTest, FirstMatchWins)
{
    FormatRegistry registry;
    auto first = MakeTagged();
    auto second = MakeTagged();
    registry.add(first);
    registry.add(second);
    EXPECT_EQ(registry.detect({'R', 'K', 'T', '!'}), first);
}

TEST_F(FormatsTest, RegistryRejectsNull)
{
    FormatRegistry registry;
    EXPECT_THROW(registry.add(nullptr), ArgumentError);
    EXPECT_THROW(ImageFormat("x", "x", {}, nullptr, std::make_shared<TaggedEncoder>()), ArgumentError);
}

TEST_F(FormatsTest, MatchesExtension)
{
    auto tagged = MakeTagged();
    EXPECT_TRUE(tagged->matches_extension("rkt"));
    EXPECT_TRUE(tagged->matches_extension(".TAG"));
    EXPECT_FALSE(tagged->matches_extension("png"));
}

// decode
TEST_F(FormatsTest, DecodeWithCustomRegistry)
{
    FormatRegistry registry;
    registry.add(MakeTagged());

    const Image img = decode(std::vector<uint8_t>{'R', 'K', 'T', '!', 3, 2}, registry);
    EXPECT_EQ(img.width(), 3);
    EXPECT_EQ(img.height(), 2);
    ASSERT_NE(img.format(), nullptr);
    EXPECT_EQ(img.format()->name(), "tagged");
    EXPECT_EQ(img.at(2, 1), Color(1.f, 1.f, 1.f, 1.f));
}

TEST_F(FormatsTest, DecodeUnknownBytes)
{
    try {
        decode(std::vector<uint8_t>{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'});
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("Available formats"), std::string::npos);
        EXPECT_NE(msg.find("bmp, jpeg, png, gif"), std::string::npos);
    }
}

TEST_F(FormatsTest, DecodeWithEmptyRegistry)
{
    FormatRegistry empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.describe(), "(none)");
    EXPECT_THROW(decode(std::vector<uint8_t>{'G', 'I', 'F', '8', '9', 'a'}, empty), FormatError);
}

TEST_F(FormatsTest, DecodeEmptyInput)
{
    EXPECT_THROW(decode(std::vector<uint8_t>{}), FormatError);
}

TEST_F(FormatsTest, DecodeUnreadableStream)
{
    std::istringstream in("GIF89a");
    in.setstate(std::ios::badbit);
    EXPECT_THROW(decode(in), DecodeError);
}

TEST_F(FormatsTest, DecodeStartsAtCurrentPosition)
{
    FormatRegistry registry;
    registry.add(MakeTagged());

    std::istringstream in(std::string("xxRKT!") + char(4) + char(5), std::ios::binary);
    in.seekg(2);
    const Image img = decode(in, registry);
    EXPECT_EQ(img.width(), 4);
    EXPECT_EQ(img.height(), 5);
}

// encode
TEST_F(FormatsTest, EncodeWithoutFormat)
{
    Image img(2, 2);
    std::ostringstream out;
    EXPECT_THROW(encode(img, out), ArgumentError);
}

TEST_F(FormatsTest, EncodeEmptyImage)
{
    std::ostringstream out;
    EXPECT_THROW(encode(Image(), out, *MakeTagged()), ArgumentError);
}

TEST_F(FormatsTest, EncodeUsesImageFormat)
{
    FormatRegistry registry;
    registry.add(MakeTagged());
    Image img = decode(std::vector<uint8_t>{'R', 'K', 'T', '!', 7, 1}, registry);

    std::ostringstream out(std::ios::binary);
    encode(img, out);
    EXPECT_EQ(out.str(), std::string("RKT!") + char(7) + char(1));
}

// stb codecs
TEST_F(FormatsTest, PngRoundTrip)
{
    const Image img = CreateCheckerboard(5, 3);
    const std::vector<uint8_t> bytes = encode_to_memory(img, *default_registry().find("png"));

    const Image back = decode(bytes);
    EXPECT_EQ(back.format()->name(), "png");
    ASSERT_EQ(back.width(), 5);
    ASSERT_EQ(back.height(), 3);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            EXPECT_EQ(pack(back.at(x, y)), pack(img.at(x, y)));
        }
    }
}

TEST_F(FormatsTest, BmpRoundTrip)
{
    const Image img = CreateCheckerboard(4, 4);
    const Image back = decode(encode_to_memory(img, *default_registry().find("bmp")));
    EXPECT_EQ(back.format()->name(), "bmp");
    EXPECT_EQ(pack(back.at(1, 0)), (Rgba32{255, 0, 0, 255}));
}

TEST_F(FormatsTest, JpegQuality)
{
    EXPECT_THROW(JpegEncoder(0), ArgumentError);
    EXPECT_THROW(JpegEncoder(101), ArgumentError);
    EXPECT_EQ(JpegEncoder(75).quality(), 75);

    Image img(8, 8);
    for (Color& c : img.pixels()) c = Color(0.5f, 0.5f, 0.5f, 1.f);
    const Image back = decode(encode_to_memory(img, *make_jpeg_format(95)));
    EXPECT_EQ(back.format()->name(), "jpeg");
    EXPECT_NEAR(back.at(4, 4).r, 0.5f, 0.02f);
}

TEST_F(FormatsTest, CorruptPng)
{
    const std::vector<uint8_t> bytes = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0};
    EXPECT_THROW(decode(bytes), FormatError);
}
