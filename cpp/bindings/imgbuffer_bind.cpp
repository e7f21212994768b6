#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <buffer.hpp>

namespace py = pybind11;

void bind_imgbuffer(py::module_ &m)
{
    py::enum_<IMGBuffer::PixelFormat>(m, "PixelFormat")
        .value("BGRA8", IMGBuffer::PixelFormat::BGRA8)
        .value("RGBA8", IMGBuffer::PixelFormat::RGBA8);

    py::class_<IMGBuffer::Buffer>(m, "Buffer", py::buffer_protocol(), R"doc(
        A captured frame: packed 32-bit pixels, one row after another.
        memoryview(buffer) has shape (height, width, 4).
    )doc")
        .def(py::init<>())
        .def(py::init<std::size_t, std::size_t>(), py::arg("width"), py::arg("height"))
        .def("resize", &IMGBuffer::Buffer::resize, py::arg("width"), py::arg("height"),
             "Resizes the frame. Pixel contents are not preserved.")

        // Same contract as a provider delivery: rows of `stride` bytes, padding dropped on copy
        .def("assign", [](IMGBuffer::Buffer &b, py::buffer pixels, std::size_t width, std::size_t height,
                          std::size_t stride, IMGBuffer::PixelFormat format, std::uint64_t sequence) {
            const py::buffer_info info = pixels.request();
            py::ssize_t expected = info.itemsize;
            for (py::ssize_t i = info.ndim - 1; i >= 0; --i) {
                if (info.shape[i] > 1 && info.strides[i] != expected) {
                    throw py::value_error("pixel data must be C-contiguous");
                }
                expected *= info.shape[i];
            }
            if (stride == 0) {
                stride = width * 4;
            }
            const auto available = static_cast<std::size_t>(info.size * info.itemsize);
            if (height > 0 && available < stride * (height - 1) + width * 4) {
                throw py::value_error("pixel data is shorter than height rows of stride bytes");
            }
            IMGBuffer::FrameView view;
            view.data = static_cast<const std::uint8_t*>(info.ptr);
            view.width = width;
            view.height = height;
            view.stride = stride;
            view.format = format;
            b.assign(view, sequence);
        }, py::arg("pixels"), py::arg("width"), py::arg("height"), py::arg("stride") = 0,
           py::arg("format") = IMGBuffer::PixelFormat::BGRA8, py::arg("sequence") = 0)

        .def("pixel", [](const IMGBuffer::Buffer &b, std::size_t x, std::size_t y) {
            if (x >= b.width() || y >= b.height()) {
                throw py::index_error("pixel outside the frame");
            }
            const std::uint8_t* p = b.data() + y * b.stride() + x * 4;
            if (b.format() == IMGBuffer::PixelFormat::BGRA8) {
                return py::make_tuple(p[2], p[1], p[0], p[3]);
            }
            return py::make_tuple(p[0], p[1], p[2], p[3]);
        }, py::arg("x"), py::arg("y"), "(r, g, b, a) of one pixel whatever the frame's channel order.")

        .def_property_readonly("width", &IMGBuffer::Buffer::width)
        .def_property_readonly("height", &IMGBuffer::Buffer::height)
        .def_property_readonly("stride", &IMGBuffer::Buffer::stride, "Bytes per row (width * 4).")
        .def_property_readonly("format", &IMGBuffer::Buffer::format)
        .def_property_readonly("sequence", &IMGBuffer::Buffer::sequence)

        .def_buffer([](IMGBuffer::Buffer &b) -> py::buffer_info {
            return py::buffer_info(
                b.data(),
                sizeof(std::uint8_t),
                py::format_descriptor<std::uint8_t>::format(),
                3,
                { b.height(), b.width(), std::size_t(4) },
                { b.stride(), std::size_t(4), std::size_t(1) }
            );
        });
}
