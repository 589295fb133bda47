#include "rasterkit/gif.hpp"
#include "rasterkit/errors.hpp"

#include "gif_io.hpp"
#include "lzw.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace rk {

namespace {

using gif::GifReader;

// ------------------------------------------------------------
// 只在一次 decode 內有效的 descriptor（不對外公開）
// ------------------------------------------------------------
struct LogicalScreenDescriptor {
    int  width = 0;
    int  height = 0;
    bool global_table = false;
    int  global_table_size = 0;
    uint8_t background_index = 0;
    uint8_t pixel_aspect_ratio = 0;
};

struct GraphicControlExtension {
    int  delay = 0;
    bool transparency = false;
    uint8_t transparency_index = 0;
    DisposalMethod disposal = DisposalMethod::None;
};

struct ImageDescriptor {
    int  left = 0;
    int  top = 0;
    int  width = 0;
    int  height = 0;
    bool local_table = false;
    int  local_table_size = 0;
    bool interlace = false;
};

// block loop 之間傳遞的狀態，由 decode() 擁有
struct DecodeState {
    LogicalScreenDescriptor screen;
    std::vector<uint8_t> global_table;
    std::optional<GraphicControlExtension> control; // 只作用在下一個 frame
    std::vector<Color> canvas;
    bool has_primary = false;
};

DisposalMethod to_disposal(int value) {
    switch (value) {
    case 1:  return DisposalMethod::DoNotDispose;
    case 2:  return DisposalMethod::RestoreToBackground;
    case 3:  return DisposalMethod::RestoreToPrevious;
    default: return DisposalMethod::None; // 0 與保留值 4~7
    }
}

LogicalScreenDescriptor read_logical_screen(GifReader& reader, const Size& max_canvas) {
    uint8_t buffer[7];
    reader.read_bytes(buffer, sizeof(buffer));

    const uint8_t packed = buffer[4];

    LogicalScreenDescriptor d;
    d.width  = buffer[0] | (buffer[1] << 8);
    d.height = buffer[2] | (buffer[3] << 8);
    d.global_table       = (packed & 0x80) != 0;
    d.global_table_size  = 2 << (packed & 0x07);
    d.background_index   = buffer[5];
    d.pixel_aspect_ratio = buffer[6];

    if (d.global_table_size > 255 * 4) {
        throw FormatError("gif: invalid colormap size '" + std::to_string(d.global_table_size) + "'");
    }
    if (d.width <= 0 || d.height <= 0) {
        throw FormatError("gif: empty logical screen " + std::to_string(d.width) + "x" +
                          std::to_string(d.height));
    }
    if (d.width > max_canvas.width || d.height > max_canvas.height) {
        throw FormatError("gif: the input '" + std::to_string(d.width) + "x" + std::to_string(d.height) +
                          "' is bigger than the max allowed size '" + std::to_string(max_canvas.width) +
                          "x" + std::to_string(max_canvas.height) + "'");
    }
    return d;
}

GraphicControlExtension read_graphic_control(GifReader& reader) {
    // block size, packed, delay (LE16), transparency index, terminator
    uint8_t buffer[6];
    reader.read_bytes(buffer, sizeof(buffer));

    const uint8_t packed = buffer[1];

    GraphicControlExtension g;
    g.delay              = buffer[2] | (buffer[3] << 8);
    g.transparency_index = buffer[4];
    g.transparency       = (packed & 0x01) != 0;
    g.disposal           = to_disposal((packed & 0x1C) >> 2);
    return g;
}

ImageDescriptor read_image_descriptor(GifReader& reader) {
    uint8_t buffer[9];
    reader.read_bytes(buffer, sizeof(buffer));

    const uint8_t packed = buffer[8];

    ImageDescriptor d;
    d.left   = buffer[0] | (buffer[1] << 8);
    d.top    = buffer[2] | (buffer[3] << 8);
    d.width  = buffer[4] | (buffer[5] << 8);
    d.height = buffer[6] | (buffer[7] << 8);
    d.local_table      = (packed & 0x80) != 0;
    d.local_table_size = 2 << (packed & 0x07);
    d.interlace        = (packed & 0x40) != 0;
    return d;
}

void read_comments(GifReader& reader, Image& image) {
    std::string text;
    for (uint8_t size = reader.read_u8(); size != gif::kTerminator; size = reader.read_u8()) {
        if (text.size() + size > gif::kMaxCommentLength) {
            throw FormatError("gif: comment length '" + std::to_string(text.size() + size) +
                              "' exceeds max '" + std::to_string(gif::kMaxCommentLength) + "'");
        }
        uint8_t buffer[255];
        reader.read_bytes(buffer, size);
        text.append(reinterpret_cast<const char*>(buffer), size);
    }
    image.properties().push_back(ImageProperty{gif::kCommentProperty, text});
}

void read_application_extension(GifReader& reader, Image& image) {
    const uint8_t header_size = reader.read_u8();
    std::array<uint8_t, 255> id{};
    reader.read_bytes(id.data(), header_size);

    const bool looping = header_size == 11 &&
        (std::memcmp(id.data(), "NETSCAPE2.0", 11) == 0 ||
         std::memcmp(id.data(), "ANIMEXTS1.0", 11) == 0);

    for (uint8_t size = reader.read_u8(); size != gif::kTerminator; size = reader.read_u8()) {
        uint8_t buffer[255];
        reader.read_bytes(buffer, size);
        // sub-block id 1 = loop count
        if (looping && size >= 3 && buffer[0] == 1) {
            image.set_repeat_count(static_cast<uint16_t>(buffer[1] | (buffer[2] << 8)));
        }
    }
}

// plain text 與未知的 extension：固定 header 再接 sub-block
void skip_extension(GifReader& reader) {
    reader.skip_sub_blocks();
}

// 輸出第 i 列 index 要畫到 frame 的哪一列
std::vector<int> row_order(int height, bool interlace) {
    std::vector<int> rows;
    rows.reserve(static_cast<std::size_t>(std::max(height, 0)));
    if (!interlace) {
        for (int y = 0; y < height; ++y) rows.push_back(y);
        return rows;
    }

    static constexpr int kStart[4]  = {0, 4, 2, 1};
    static constexpr int kStride[4] = {8, 8, 4, 2};
    for (int pass = 0; pass < 4; ++pass) {
        for (int y = kStart[pass]; y < height; y += kStride[pass]) rows.push_back(y);
    }
    return rows;
}

// 一列 index 畫到 canvas，超出 logical screen 的部分直接裁掉
void draw_row(DecodeState& state,
              const ImageDescriptor& d,
              const GraphicControlExtension& control,
              const std::vector<uint8_t>& table,
              int y,
              const uint8_t* indices)
{
    const int sw = state.screen.width;
    if (y >= state.screen.height) return;

    const std::size_t palette_size = table.size() / 3;
    const int visible = std::min(d.width, sw - d.left);
    Color* out = state.canvas.data() + static_cast<std::size_t>(y) * sw + d.left;

    for (int c = 0; c < visible; ++c) {
        const uint8_t index = indices[c];
        if (control.transparency && index == control.transparency_index) continue;

        if (index >= palette_size) {
            throw FormatError("gif: color index " + std::to_string(index) +
                              " outside palette of " + std::to_string(palette_size));
        }
        const uint8_t* rgb = &table[static_cast<std::size_t>(index) * 3];
        out[c] = unpack(Rgba32{rgb[0], rgb[1], rgb[2], 255});
    }
}

// 畫完後 snapshot：第一個 frame 進 image 本身，其後 append；然後做 disposal
void finish_frame(DecodeState& state,
                  Image& image,
                  const ImageDescriptor& d,
                  const GraphicControlExtension& control,
                  std::vector<Color>& previous)
{
    const int sw = state.screen.width;
    const int sh = state.screen.height;

    if (!state.has_primary) {
        image.set_pixels(sw, sh, state.canvas);
        image.set_delay(control.delay);
        image.set_disposal(control.disposal);
        state.has_primary = true;
    } else {
        ImageFrame frame(sw, sh, state.canvas);
        frame.set_delay(control.delay);
        frame.set_disposal(control.disposal);
        image.add_frame(std::move(frame));
    }

    if (control.disposal == DisposalMethod::RestoreToBackground) {
        const Rect area = intersect(Rect{d.left, d.top, d.width, d.height}, Rect{0, 0, sw, sh});
        for (int y = area.y; y < area.bottom(); ++y) {
            std::fill_n(state.canvas.begin() + static_cast<std::ptrdiff_t>(y) * sw + area.x,
                        area.width, Color());
        }
    } else if (control.disposal == DisposalMethod::RestoreToPrevious) {
        state.canvas = std::move(previous);
    }
}

void read_frame(GifReader& reader, DecodeState& state, Image& image) {
    const ImageDescriptor d = read_image_descriptor(reader);

    std::vector<uint8_t> local_table;
    if (d.local_table) {
        local_table.resize(static_cast<std::size_t>(d.local_table_size) * 3);
        reader.read_bytes(local_table.data(), local_table.size());
    }

    // 有 local table 用 local，否則用 global；兩者皆無就是壞檔
    const std::vector<uint8_t>& table = d.local_table ? local_table : state.global_table;
    if (table.empty()) {
        throw FormatError("gif: frame has neither a local nor a global color table");
    }

    // canvas 只依 logical screen 配置；frame 的大小只決定一列 index 的 buffer
    if (state.canvas.empty()) {
        state.canvas.assign(static_cast<std::size_t>(state.screen.width) * state.screen.height, Color());
    }

    const GraphicControlExtension control = state.control.value_or(GraphicControlExtension{});

    std::vector<Color> previous;
    if (control.disposal == DisposalMethod::RestoreToPrevious) {
        previous = state.canvas;
    }

    const bool visible = d.left < state.screen.width && d.top < state.screen.height;
    const std::vector<int> rows = row_order(visible ? d.height : 0, d.interlace);

    const int data_size = reader.read_u8();
    gif::LzwDecoder lzw(reader);
    lzw.decode(d.width, d.height, data_size, [&](int r, const uint8_t* indices) {
        if (!visible) return;
        draw_row(state, d, control, table, d.top + rows[static_cast<std::size_t>(r)], indices);
    });
    lzw.skip_remaining();

    finish_frame(state, image, d, control, previous);
    state.control.reset();
}

} // namespace

// ======================
//  GifDecoder
// ======================

GifDecoder::GifDecoder(Size max_canvas)
    : max_canvas_(max_canvas)
{
}

bool GifDecoder::is_supported(const std::vector<uint8_t>& header) const {
    if (header.size() < 6) return false;
    return std::memcmp(header.data(), "GIF87a", 6) == 0 ||
           std::memcmp(header.data(), "GIF89a", 6) == 0;
}

void GifDecoder::decode(Image& image, std::istream& stream) const {
    GifReader reader(stream);

    std::vector<uint8_t> signature(6);
    reader.read_bytes(signature.data(), signature.size());
    if (!is_supported(signature)) {
        throw FormatError("gif: invalid signature");
    }

    // 從乾淨的 image 開始
    image = Image();

    DecodeState state;
    state.screen = read_logical_screen(reader, max_canvas_);

    if (state.screen.global_table) {
        state.global_table.resize(static_cast<std::size_t>(state.screen.global_table_size) * 3);
        reader.read_bytes(state.global_table.data(), state.global_table.size());
    }

    uint8_t flag = 0;
    while (reader.try_read_u8(flag)) {
        if (flag == gif::kImageLabel) {
            read_frame(reader, state, image);
        } else if (flag == gif::kExtensionIntroducer) {
            const uint8_t label = reader.read_u8();
            switch (label) {
            case gif::kGraphicControlLabel:
                state.control = read_graphic_control(reader);
                break;
            case gif::kCommentLabel:
                read_comments(reader, image);
                break;
            case gif::kApplicationExtensionLabel:
                read_application_extension(reader, image);
                break;
            case gif::kPlainTextLabel:
            default:
                skip_extension(reader);
                break;
            }
        } else {
            // trailer (0x3B) 或任何其他 byte 都結束
            break;
        }
    }

    if (!state.has_primary) {
        throw FormatError("gif: stream contains no image data");
    }
}

std::shared_ptr<const ImageFormat> make_gif_format() {
    return std::make_shared<const ImageFormat>(
        "gif", "image/gif", std::vector<std::string>{"gif"},
        std::make_shared<GifDecoder>(),
        std::make_shared<GifEncoder>());
}

} // namespace rk
