#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <PixelMath.hpp>

namespace py = pybind11;

void bind_pixelmath(py::module_ &m)
{
    using namespace PixelMath;

    py::enum_<CoordSpace>(m, "CoordSpace")
        .value("ScreenLocal", CoordSpace::ScreenLocal)
        .value("Global", CoordSpace::Global);

    py::class_<Scale>(m, "Scale")
        .def(py::init<>())
        .def(py::init([](double x, double y) { return Scale{x, y}; }), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &Scale::x)
        .def_readwrite("y", &Scale::y)
        .def("is_high_density", &Scale::isHighDensity);

    py::class_<LogicalPoint>(m, "LogicalPoint")
        .def(py::init([](double x, double y) { return LogicalPoint{x, y}; }), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &LogicalPoint::x)
        .def_readwrite("y", &LogicalPoint::y);

    py::class_<LogicalRect>(m, "LogicalRect")
        .def(py::init([](double x, double y, double w, double h, CoordSpace space) {
            return LogicalRect{x, y, w, h, space};
        }), py::arg("x"), py::arg("y"), py::arg("width"), py::arg("height"),
            py::arg("space") = CoordSpace::ScreenLocal)
        .def_readwrite("x", &LogicalRect::x)
        .def_readwrite("y", &LogicalRect::y)
        .def_readwrite("width", &LogicalRect::width)
        .def_readwrite("height", &LogicalRect::height)
        .def_readwrite("space", &LogicalRect::space)
        .def("__eq__", [](const LogicalRect &a, const LogicalRect &b) { return a == b; })
        .def("__repr__", [](const LogicalRect &r) { return toString(r); });

    py::class_<PixelRect>(m, "PixelRect")
        .def(py::init([](int x, int y, int w, int h) { return PixelRect{x, y, w, h}; }),
             py::arg("x"), py::arg("y"), py::arg("width"), py::arg("height"))
        .def_readwrite("x", &PixelRect::x)
        .def_readwrite("y", &PixelRect::y)
        .def_readwrite("width", &PixelRect::width)
        .def_readwrite("height", &PixelRect::height)
        .def("__eq__", [](const PixelRect &a, const PixelRect &b) { return a == b; })
        .def("__repr__", [](const PixelRect &r) { return toString(r); });

    py::class_<Display>(m, "Display")
        .def(py::init<>())
        .def_readwrite("id", &Display::id)
        .def_readwrite("name", &Display::name)
        .def_readwrite("frame", &Display::frame)
        .def_readwrite("pixel_width", &Display::pixelWidth)
        .def_readwrite("pixel_height", &Display::pixelHeight)
        .def_readwrite("scale", &Display::scale);

    m.attr("MIN_CAPTURE_PIXELS") = kMinCapturePixels;

    // std::invalid_argument surfaces as ValueError
    m.def("to_pixel_rect", &toPixelRect, py::arg("local"), py::arg("scale"), py::arg("display_height"));
    m.def("to_pixel_rect_aligned", &toPixelRectAligned, py::arg("local"), py::arg("scale"),
          py::arg("display_height"));
    m.def("to_top_left_logical", &toTopLeftLogical, py::arg("px"), py::arg("scale"));
    m.def("snap_to_pixel_grid", &snapToPixelGrid, py::arg("rect"), py::arg("scale"));
    m.def("is_on_pixel_grid", &isOnPixelGrid, py::arg("value"), py::arg("scale"));
    m.def("to_global", &toGlobal, py::arg("local"), py::arg("display"));
    m.def("to_local", &toLocal, py::arg("global_rect"), py::arg("display"));
    m.def("spanning", &spanning, py::arg("a"), py::arg("b"));
}
