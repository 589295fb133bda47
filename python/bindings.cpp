#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "rasterkit/color.hpp"
#include "rasterkit/errors.hpp"
#include "rasterkit/formats.hpp"
#include "rasterkit/image.hpp"
#include "rasterkit/pipeline.hpp"
#include "rasterkit/processor.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace py = pybind11;

namespace rkpy {

using rk::Backend;
using rk::Image;
using rk::PixelBuffer;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxWx3 or HxWx4)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
    int c;
};

static ShapeInfo check_uint8_hwc(const py::buffer_info& info) {
    if (info.ndim != 3) {
        throw rk::ArgumentError("expected HxWxC uint8 array");
    }
    if (info.itemsize != 1) {
        throw rk::ArgumentError("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);
    const int c = static_cast<int>(info.shape[2]);

    if (c != 3 && c != 4) {
        throw rk::ArgumentError("expected 3 or 4 channels");
    }

    // H x W x C: strides = [W*C, C, 1]
    if (!(info.strides[0] == static_cast<ssize_t>(w * c) &&
          info.strides[1] == static_cast<ssize_t>(c) &&
          info.strides[2] == 1)) {
        throw rk::ArgumentError("expected C-contiguous array (HxWxC)");
    }

    return {h, w, c};
}

// ------------------------------------------------------------
// PixelBuffer -> numpy.ndarray（HxWx4 RGBA8，複製）
// ------------------------------------------------------------
static py::array_t<uint8_t> buffer_to_numpy(const PixelBuffer& buf) {
    const int h = buf.height();
    const int w = buf.width();

    py::array_t<uint8_t> out({h, w, 4});
    uint8_t* dst = out.mutable_data();
    for (const rk::Color& c : buf.pixels()) {
        const rk::Rgba32 p = rk::pack(c);
        *dst++ = p.r;
        *dst++ = p.g;
        *dst++ = p.b;
        *dst++ = p.a;
    }
    return out;
}

// numpy.ndarray -> Color 陣列（3 通道時 alpha = 255）
static std::vector<rk::Color> numpy_to_pixels(const py::array& array, ShapeInfo& shape) {
    py::buffer_info info = array.request();
    shape = check_uint8_hwc(info);

    const auto* src = static_cast<const uint8_t*>(info.ptr);
    std::vector<rk::Color> pixels(static_cast<std::size_t>(shape.h) * shape.w);
    for (rk::Color& c : pixels) {
        const uint8_t a = shape.c == 4 ? src[3] : 255;
        c = rk::unpack(rk::Rgba32{src[0], src[1], src[2], a});
        src += shape.c;
    }
    return pixels;
}

// ------------------------------------------------------------
// 文字參數 → enum
// ------------------------------------------------------------
static Backend parse_backend(const std::string& s) {
    if (s == "auto") return rk::normalize_backend(Backend::Auto);
    if (s == "single") return Backend::Single;
    if (s == "openmp" || s == "omp") return rk::normalize_backend(Backend::OpenMP);
    throw rk::ArgumentError("backend must be one of: auto, single, openmp");
}

static const rk::ImageFormat& parse_format(const std::string& name) {
    auto format = rk::default_registry().find(name);
    if (!format) {
        throw rk::ArgumentError("unknown format '" + name + "' (use " +
                                rk::default_registry().describe() + ")");
    }
    return *format;
}

static py::bytes encode_py(const Image& image, const std::string& format) {
    std::vector<uint8_t> data;
    if (format.empty()) {
        if (!image.format()) throw rk::ArgumentError("encode: image has no format, pass one explicitly");
        data = rk::encode_to_memory(image, *image.format());
    } else {
        data = rk::encode_to_memory(image, parse_format(format));
    }
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

static Image decode_py(const py::bytes& data) {
    const std::string s = data;
    return rk::decode(std::vector<uint8_t>(s.begin(), s.end()));
}

static Image process_py(const Image& image,
                        const std::string& name,
                        const std::map<std::string, std::string>& params,
                        const std::string& backend,
                        int threads)
{
    rk::ProcessOptions options;
    options.backend = parse_backend(backend);
    options.threads = threads;

    // 計算期間釋放 GIL
    py::gil_scoped_release release;
    return rk::process(image, name, params, options);
}

} // namespace rkpy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace rkpy;

    m.doc() = "RasterKit core (decode / process / encode)";

    py::class_<Image>(m, "Image")
        .def(py::init<int, int>(), py::arg("width"), py::arg("height"),
             "Create a transparent image.")
        .def(py::init([](const py::array& array) {
                 ShapeInfo shape{};
                 std::vector<rk::Color> pixels = numpy_to_pixels(array, shape);
                 Image image;
                 image.set_pixels(shape.w, shape.h, std::move(pixels));
                 return image;
             }),
             py::arg("pixels"),
             "Create an image from a HxWx3 or HxWx4 uint8 array.")
        .def_property_readonly("width", &Image::width)
        .def_property_readonly("height", &Image::height)
        .def_property_readonly("frame_count", &Image::frame_count)
        .def_property_readonly("is_animated", &Image::is_animated)
        .def_property_readonly("repeat_count", &Image::repeat_count)
        .def_property_readonly("format",
             [](const Image& image) -> py::object {
                 if (!image.format()) return py::none();
                 return py::str(image.format()->name());
             })
        .def_property_readonly("pixels",
             [](const Image& image) { return buffer_to_numpy(image); },
             "Primary frame as HxWx4 uint8 RGBA (copy).")
        .def("frame",
             [](const Image& image, int index) { return buffer_to_numpy(image.frame(index)); },
             py::arg("index"),
             "Frame index as HxWx4 uint8 RGBA (copy); 0 is the primary frame.")
        .def("frame_delay",
             [](const Image& image, int index) { return image.frame(index).delay(); },
             py::arg("index"))
        .def("properties",
             [](const Image& image) {
                 std::vector<std::pair<std::string, std::string>> out;
                 for (const auto& p : image.properties()) out.emplace_back(p.name, p.value);
                 return out;
             })
        .def("save",
             [](const Image& image, const std::string& path, const std::string& format) {
                 if (format.empty()) image.save(path);
                 else image.save(path, parse_format(format));
             },
             py::arg("path"), py::arg("format") = "",
             "Save to a file; format defaults to the extension, then the decoded format.")
        .def("encode", &encode_py, py::arg("format") = "",
             "Encode to bytes.")
        .def("process", &process_py,
             py::arg("name"),
             py::arg("params") = std::map<std::string, std::string>{},
             py::arg("backend") = "auto",
             py::arg("threads") = 0,
             "Return a copy with the named processor applied.");

    m.def("load", &Image::load, py::arg("path"),
          "Load an image file, detecting its format from the header.");

    m.def("decode", &decode_py, py::arg("data"),
          "Decode an image from bytes.");

    m.def("list_processors", &rk::list_processors,
          "Names accepted by Image.process().");

    m.def("formats",
          []() {
              std::vector<std::string> names;
              for (const auto& f : rk::default_registry().formats()) names.push_back(f->name());
              return names;
          },
          "Registered formats in detection order.");
}
