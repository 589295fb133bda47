#include "rasterkit/pipeline.hpp"
#include "rasterkit/effects.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/filters.hpp"
#include "rasterkit/formats.hpp"
#include "rasterkit/geometry.hpp"
#include "rasterkit/resamplers.hpp"
#include "rasterkit/tone.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <string>

namespace rk {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string describe_range(const ParameterSpec& spec) {
    if (spec.kind == ParameterKind::Int) {
        return "[" + std::to_string(std::lround(spec.min)) + ", " + std::to_string(std::lround(spec.max)) + "]";
    }
    return "[" + std::to_string(spec.min) + ", " + std::to_string(spec.max) + "]";
}

// ------------------------------------------------------------
// 字串 → 值；失敗一律 ArgumentError，訊息帶 processor 與參數名
// ------------------------------------------------------------
[[noreturn]] void bad_value(const std::string& processor, const ParameterSpec& spec,
                            const std::string& text, const std::string& why)
{
    throw ArgumentError(processor + ": parameter '" + spec.name + "' = '" + text + "' " + why);
}

int parse_int(const std::string& processor, const ParameterSpec& spec, const std::string& text) {
    std::size_t used = 0;
    long v = 0;
    try {
        v = std::stol(text, &used);
    } catch (const std::exception&) {
        bad_value(processor, spec, text, "is not an integer");
    }
    if (used != text.size()) bad_value(processor, spec, text, "is not an integer");
    if (v < spec.min || v > spec.max) bad_value(processor, spec, text, "is outside " + describe_range(spec));
    return static_cast<int>(v);
}

float parse_float(const std::string& processor, const ParameterSpec& spec, const std::string& text) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        bad_value(processor, spec, text, "is not a number");
    }
    if (used != text.size() || !std::isfinite(v)) bad_value(processor, spec, text, "is not a number");
    if (v < spec.min || v > spec.max) bad_value(processor, spec, text, "is outside " + describe_range(spec));
    return static_cast<float>(v);
}

bool parse_bool(const std::string& processor, const ParameterSpec& spec, const std::string& text) {
    const std::string s = to_lower(text);
    if (s == "true" || s == "1" || s == "yes" || s == "on")  return true;
    if (s == "false" || s == "0" || s == "no" || s == "off") return false;
    bad_value(processor, spec, text, "is not a boolean");
}

std::string parse_enum(const std::string& processor, const ParameterSpec& spec, const std::string& text) {
    const std::string s = to_lower(text);
    if (std::find(spec.choices.begin(), spec.choices.end(), s) == spec.choices.end()) {
        std::string all;
        for (const auto& c : spec.choices) all += (all.empty() ? "" : ", ") + c;
        bad_value(processor, spec, text, "is not one of: " + all);
    }
    return s;
}

// 依 kind 驗證一次，回傳正規化後的字串
std::string validate(const std::string& processor, const ParameterSpec& spec, const std::string& text) {
    switch (spec.kind) {
    case ParameterKind::Int:   parse_int(processor, spec, text);   return text;
    case ParameterKind::Float: parse_float(processor, spec, text); return text;
    case ParameterKind::Bool:  return parse_bool(processor, spec, text) ? "true" : "false";
    case ParameterKind::Enum:  return parse_enum(processor, spec, text);
    case ParameterKind::Color: parse_color(text);                  return text;
    }
    return text;
}

// ------------------------------------------------------------
// schema 建構小工具
// ------------------------------------------------------------
ParameterSpec int_param(const std::string& name, int lo, int hi, const std::string& def = "") {
    ParameterSpec p;
    p.name = name;
    p.kind = ParameterKind::Int;
    p.min = lo;
    p.max = hi;
    p.required = def.empty();
    p.default_value = def;
    return p;
}

ParameterSpec float_param(const std::string& name, double lo, double hi, const std::string& def = "") {
    ParameterSpec p = int_param(name, 0, 0, def);
    p.kind = ParameterKind::Float;
    p.min = lo;
    p.max = hi;
    return p;
}

ParameterSpec bool_param(const std::string& name, const std::string& def) {
    ParameterSpec p;
    p.name = name;
    p.kind = ParameterKind::Bool;
    p.default_value = def;
    return p;
}

ParameterSpec enum_param(const std::string& name, std::vector<std::string> choices, const std::string& def = "") {
    ParameterSpec p;
    p.name = name;
    p.kind = ParameterKind::Enum;
    p.choices = std::move(choices);
    p.required = def.empty();
    p.default_value = def;
    return p;
}

ParameterSpec color_param(const std::string& name, const std::string& def = "") {
    ParameterSpec p;
    p.name = name;
    p.kind = ParameterKind::Color;
    p.required = def.empty();
    p.default_value = def;
    return p;
}

using Runner = std::function<void(Image&, const ParameterSet&, const ProcessOptions&, const ProcessorLimits&)>;

struct Entry {
    ProcessorInfo info;
    Runner run;
};

void check_limits(const std::string& who, int width, int height, const ProcessorLimits& limits) {
    if (width > limits.max_width || height > limits.max_height) {
        throw ArgumentError(who + ": " + std::to_string(width) + "x" + std::to_string(height) +
                            " exceeds the allowed " + std::to_string(limits.max_width) + "x" +
                            std::to_string(limits.max_height));
    }
}

// 只有一個 processor 物件、不需要額外檢查的情況
template <typename MakeProcessor>
Runner simple(MakeProcessor make) {
    return [make](Image& image, const ParameterSet& p, const ProcessOptions& options, const ProcessorLimits&) {
        auto processor = make(p);
        apply(image, processor, options);
    };
}

std::vector<std::string> format_choices() {
    std::vector<std::string> out;
    for (const auto& f : default_registry().formats()) {
        out.push_back(f->name());
        for (const auto& ext : f->extensions()) {
            if (std::find(out.begin(), out.end(), ext) == out.end()) out.push_back(ext);
        }
    }
    return out;
}

std::vector<Entry> build_registry() {
    std::vector<Entry> r;

    // ---- geometry ----
    {
        ProcessorInfo info{"resize", "resample to width x height (0 keeps the aspect ratio)",
                           {int_param("width", 0, kMaxWidth, "0"),
                            int_param("height", 0, kMaxHeight, "0"),
                            enum_param("resampler", resampler_names(), "bicubic")}};
        r.push_back({info, [](Image& image, const ParameterSet& p, const ProcessOptions& options,
                              const ProcessorLimits& limits) {
            Resize processor(make_resampler(p.get_enum("resampler")), p.get_int("width"), p.get_int("height"));
            const Size size = processor.target_size(image);
            check_limits("resize", size.width, size.height, limits);
            apply(image, processor, options);
        }});
    }
    {
        ProcessorInfo info{"crop", "cut out the given rectangle",
                           {int_param("x", 0, kMaxWidth, "0"),
                            int_param("y", 0, kMaxHeight, "0"),
                            int_param("width", 1, kMaxWidth),
                            int_param("height", 1, kMaxHeight)}};
        r.push_back({info, [](Image& image, const ParameterSet& p, const ProcessOptions& options,
                              const ProcessorLimits& limits) {
            Crop processor(Rect{p.get_int("x"), p.get_int("y"), p.get_int("width"), p.get_int("height")});
            const Size size = processor.target_size(image);
            check_limits("crop", size.width, size.height, limits);
            apply(image, processor, options);
        }});
    }
    {
        ProcessorInfo info{"flip", "mirror the image",
                           {enum_param("direction", {"horizontal", "vertical", "both"}, "horizontal")}};
        r.push_back({info, [](Image& image, const ParameterSet& p, const ProcessOptions& options,
                              const ProcessorLimits&) {
            const std::string dir = p.get_enum("direction");
            if (dir != "vertical") {
                FlipHorizontal processor;
                apply(image, processor, options);
            }
            if (dir != "horizontal") {
                FlipVertical processor;
                apply(image, processor, options);
            }
        }});
    }

    // ---- tone ----
    r.push_back({{"brightness", "add to every channel in linear light", {int_param("value", -100, 100)}},
                 simple([](const ParameterSet& p) { return Brightness(p.get_int("value")); })});
    r.push_back({{"contrast", "scale channels about mid grey", {int_param("value", -100, 100)}},
                 simple([](const ParameterSet& p) { return Contrast(p.get_int("value")); })});
    r.push_back({{"saturation", "scale colour saturation", {int_param("value", -100, 100)}},
                 simple([](const ParameterSet& p) { return MatrixFilter(saturation_matrix(p.get_int("value"))); })});
    r.push_back({{"hue", "rotate hue by an angle in degrees", {float_param("angle", -180.0, 180.0)}},
                 simple([](const ParameterSet& p) { return MatrixFilter(hue_matrix(p.get_float("angle"))); })});
    r.push_back({{"alpha", "scale opacity to a percentage", {int_param("value", 0, 100)}},
                 simple([](const ParameterSet& p) { return Alpha(p.get_int("value")); })});
    r.push_back({{"invert", "negative image", {}},
                 simple([](const ParameterSet&) { return Invert(); })});
    r.push_back({{"gamma", "raise channels to a power", {float_param("value", 0.01, 10.0, "1")}},
                 simple([](const ParameterSet& p) { return Gamma(p.get_float("value")); })});
    r.push_back({{"background", "composite over a solid colour", {color_param("color")}},
                 simple([](const ParameterSet& p) { return BackgroundColor(p.get_color("color")); })});
    r.push_back({{"greyscale", "luminance only", {enum_param("mode", {"bt709", "bt601"}, "bt709")}},
                 simple([](const ParameterSet& p) {
                     return MatrixFilter(greyscale_matrix(p.get_enum("mode") == "bt601" ? GreyscaleMode::Bt601
                                                                                        : GreyscaleMode::Bt709));
                 })});
    r.push_back({{"sepia", "warm brown tint", {}},
                 simple([](const ParameterSet&) { return MatrixFilter(sepia_matrix()); })});
    r.push_back({{"polaroid", "instant film colours", {}},
                 simple([](const ParameterSet&) { return MatrixFilter(polaroid_matrix()); })});
    r.push_back({{"blackwhite", "hard black and white", {}},
                 simple([](const ParameterSet&) { return MatrixFilter(black_white_matrix()); })});
    r.push_back({{"lomograph", "lomo colours with a dark vignette", {}},
                 [](Image& image, const ParameterSet&, const ProcessOptions& options, const ProcessorLimits&) {
                     MatrixFilter matrix(lomograph_matrix());
                     apply(image, matrix, options);
                     Vignette vignette;
                     apply(image, vignette, options);
                 }});

    // ---- convolution ----
    r.push_back({{"gaussianblur", "gaussian blur", {float_param("sigma", 0.1, 50.0, "1.4")}},
                 simple([](const ParameterSet& p) { return GaussianBlur(p.get_float("sigma")); })});
    r.push_back({{"boxblur", "box blur", {int_param("radius", 1, 100, "3")}},
                 simple([](const ParameterSet& p) { return BoxBlur(p.get_int("radius")); })});
    r.push_back({{"gaussiansharpen", "gaussian sharpen", {float_param("sigma", 0.1, 50.0, "1.4")}},
                 simple([](const ParameterSet& p) { return GaussianSharpen(p.get_float("sigma")); })});
    {
        ProcessorInfo info{"detectedges", "edge detection",
                           {enum_param("filter", {"prewitt", "sobel", "scharr", "kayyali",
                                                  "laplacian3x3", "laplacian5x5"}, "sobel"),
                            bool_param("greyscale", "true")}};
        r.push_back({info, [](Image& image, const ParameterSet& p, const ProcessOptions& options,
                              const ProcessorLimits&) {
            static const std::map<std::string, EdgeDetection> kinds = {
                {"prewitt", EdgeDetection::Prewitt},
                {"sobel", EdgeDetection::Sobel},
                {"scharr", EdgeDetection::Scharr},
                {"kayyali", EdgeDetection::Kayyali},
                {"laplacian3x3", EdgeDetection::Laplacian3x3},
                {"laplacian5x5", EdgeDetection::Laplacian5x5},
            };
            auto processor = make_edge_detector(kinds.at(p.get_enum("filter")), p.get_bool("greyscale"));
            apply(image, *processor, options);
        }});
    }

    // ---- effects ----
    r.push_back({{"pixelate", "mosaic blocks", {int_param("size", 1, 1024, "4")}},
                 simple([](const ParameterSet& p) { return Pixelate(p.get_int("size")); })});
    r.push_back({{"vignette", "darken towards the corners",
                  {color_param("color", "#000000"), float_param("strength", 0.0, 1.0, "0.75")}},
                 simple([](const ParameterSet& p) { return Vignette(p.get_color("color"), p.get_float("strength")); })});

    // ---- output format ----
    r.push_back({{"format", "choose the encoder used when saving", {enum_param("format", format_choices())}},
                 [](Image& image, const ParameterSet& p, const ProcessOptions&, const ProcessorLimits&) {
                     image.set_format(default_registry().find(p.get_enum("format")));
                 }});

    std::sort(r.begin(), r.end(), [](const Entry& a, const Entry& b) { return a.info.name < b.info.name; });
    return r;
}

const std::vector<Entry>& registry() {
    static const std::vector<Entry> entries = build_registry();
    return entries;
}

const Entry& find_entry(const std::string& name) {
    const std::string key = to_lower(name);
    for (const Entry& e : registry()) {
        if (e.info.name == key) return e;
    }
    throw ArgumentError("process: unknown processor '" + name + "'");
}

} // namespace

// ======================
//  ParameterSet
// ======================

ParameterSet::ParameterSet(const ProcessorInfo& info, const Parameters& raw)
    : processor_(info.name)
{
    for (const auto& kv : raw) {
        const std::string key = to_lower(kv.first);
        const auto it = std::find_if(info.parameters.begin(), info.parameters.end(),
                                     [&](const ParameterSpec& s) { return s.name == key; });
        if (it == info.parameters.end()) {
            throw ArgumentError(info.name + ": unknown parameter '" + kv.first + "'");
        }
        values_[key] = validate(info.name, *it, kv.second);
    }

    for (const ParameterSpec& spec : info.parameters) {
        if (values_.count(spec.name)) continue;
        if (spec.required) {
            throw ArgumentError(info.name + ": missing required parameter '" + spec.name + "'");
        }
        values_[spec.name] = spec.default_value;
    }
}

const std::string& ParameterSet::value(const std::string& name) const {
    const auto it = values_.find(name);
    if (it == values_.end()) {
        throw ArgumentError(processor_ + ": no parameter '" + name + "'");
    }
    return it->second;
}

int ParameterSet::get_int(const std::string& name) const {
    return static_cast<int>(std::stol(value(name)));
}

float ParameterSet::get_float(const std::string& name) const {
    return std::stof(value(name));
}

bool ParameterSet::get_bool(const std::string& name) const {
    return value(name) == "true";
}

std::string ParameterSet::get_enum(const std::string& name) const {
    return value(name);
}

Color ParameterSet::get_color(const std::string& name) const {
    return parse_color(value(name));
}

// ======================
//  Public APIs
// ======================

std::vector<std::string> list_processors() {
    std::vector<std::string> names;
    for (const Entry& e : registry()) names.push_back(e.info.name);
    return names;
}

const ProcessorInfo& processor_info(const std::string& name) {
    return find_entry(name).info;
}

Image process(const Image& image,
              const std::string& name,
              const Parameters& parameters,
              const ProcessOptions& options,
              const ProcessorLimits& limits)
{
    const Entry& entry = find_entry(name);
    const ParameterSet params(entry.info, parameters);

    Image result(image);
    entry.run(result, params, options, limits);
    return result;
}

} // namespace rk
