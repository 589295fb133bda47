#include "rasterkit/formats.hpp"
#include "rasterkit/codecs.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/gif.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

namespace rk {

static std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static std::string strip_dot(const std::string& s) {
    return (!s.empty() && s[0] == '.') ? s.substr(1) : s;
}

// ======================
//  ImageFormat
// ======================

ImageFormat::ImageFormat(std::string name,
                         std::string mime_type,
                         std::vector<std::string> extensions,
                         std::shared_ptr<const ImageDecoder> decoder,
                         std::shared_ptr<const ImageEncoder> encoder)
    : name_(std::move(name)),
      mime_type_(std::move(mime_type)),
      extensions_(std::move(extensions)),
      decoder_(std::move(decoder)),
      encoder_(std::move(encoder))
{
    if (!decoder_ || !encoder_) {
        throw ArgumentError("ImageFormat: '" + name_ + "' needs both a decoder and an encoder");
    }
}

bool ImageFormat::matches_extension(const std::string& extension) const {
    const std::string ext = lower(strip_dot(extension));
    return std::any_of(extensions_.begin(), extensions_.end(),
                       [&](const std::string& e) { return lower(e) == ext; });
}

// ======================
//  FormatRegistry
// ======================

void FormatRegistry::add(std::shared_ptr<const ImageFormat> format) {
    if (!format) throw ArgumentError("FormatRegistry::add: null format");
    formats_.push_back(std::move(format));
}

std::size_t FormatRegistry::max_header_size() const {
    std::size_t n = 0;
    for (const auto& f : formats_) n = std::max(n, f->decoder().header_size());
    return n;
}

std::shared_ptr<const ImageFormat> FormatRegistry::detect(const std::vector<uint8_t>& header) const {
    if (header.empty()) return nullptr;
    for (const auto& f : formats_) {
        if (f->decoder().is_supported(header)) return f;
    }
    return nullptr;
}

std::shared_ptr<const ImageFormat> FormatRegistry::find(const std::string& name_or_extension) const {
    const std::string key = lower(strip_dot(name_or_extension));
    for (const auto& f : formats_) {
        if (lower(f->name()) == key || f->matches_extension(key)) return f;
    }
    return nullptr;
}

std::string FormatRegistry::describe() const {
    std::string out;
    for (const auto& f : formats_) {
        if (!out.empty()) out += ", ";
        out += f->name();
    }
    return out.empty() ? std::string("(none)") : out;
}

const FormatRegistry& default_registry() {
    static const FormatRegistry registry = [] {
        FormatRegistry r;
        r.add(make_bmp_format());
        r.add(make_jpeg_format());
        r.add(make_png_format());
        r.add(make_gif_format());
        return r;
    }();
    return registry;
}

// ======================
//  decode / encode
// ======================

Image decode(std::istream& stream, const FormatRegistry& formats) {
    if (!stream.good()) {
        throw DecodeError("decode: cannot read from the stream");
    }

    const std::istream::pos_type start = stream.tellg();
    if (start == std::istream::pos_type(-1)) {
        throw DecodeError("decode: the stream does not support seeking");
    }

    const std::size_t header_size = formats.max_header_size();
    std::shared_ptr<const ImageFormat> format;

    if (header_size > 0) {
        std::vector<uint8_t> header(header_size);
        stream.read(reinterpret_cast<char*>(header.data()),
                    static_cast<std::streamsize>(header.size()));
        header.resize(static_cast<std::size_t>(stream.gcount()));

        // 短檔案會把 eofbit 設起來，先清掉再回到起點
        stream.clear();
        stream.seekg(start);
        if (!stream) {
            throw DecodeError("decode: failed to rewind the stream after reading the header");
        }
        format = formats.detect(header);
    }

    if (!format) {
        throw FormatError("decode: image cannot be loaded. Available formats: " + formats.describe());
    }

    Image image;
    format->decoder().decode(image, stream);
    image.set_format(format);
    return image;
}

Image decode(const std::vector<uint8_t>& bytes, const FormatRegistry& formats) {
    std::istringstream in(std::string(bytes.begin(), bytes.end()), std::ios::binary);
    return decode(in, formats);
}

void encode(const Image& image, std::ostream& stream) {
    if (!image.format()) {
        throw ArgumentError("encode: image has no format, pass one explicitly");
    }
    encode(image, stream, *image.format());
}

void encode(const Image& image, std::ostream& stream, const ImageFormat& format) {
    if (image.empty()) throw ArgumentError("encode: empty image");
    if (!stream.good()) throw ArgumentError("encode: stream is not writable");

    format.encoder().encode(image, stream);
    stream.flush();
    if (!stream) {
        throw std::runtime_error("encode: failed writing " + format.name() + " data");
    }
}

std::vector<uint8_t> encode_to_memory(const Image& image, const ImageFormat& format) {
    std::ostringstream out(std::ios::binary);
    encode(image, out, format);
    const std::string s = out.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ======================
//  檔案 I/O
// ======================

Image load_image(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw DecodeError("load_image: cannot open file: " + path);
    return decode(ifs);
}

void save_image(const Image& image, const std::string& path) {
    // 先看副檔名，沒有對應的 encoder 再用影像本身的格式
    std::shared_ptr<const ImageFormat> format;
    const auto dot = path.find_last_of('.');
    if (dot != std::string::npos) format = default_registry().find(path.substr(dot + 1));
    if (!format) format = image.format();
    if (!format) {
        throw ArgumentError("save_image: unsupported extension (use " +
                            default_registry().describe() + "): " + path);
    }

    image.save(path, *format);
}

Image Image::load(const std::string& path) {
    return load_image(path);
}

void Image::save(const std::string& path) const {
    save_image(*this, path);
}

void Image::save(const std::string& path, const ImageFormat& format) const {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("save: cannot open file for writing: " + path);
    encode(*this, ofs, format);
}

} // namespace rk
