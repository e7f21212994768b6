#include <pybind11/pybind11.h>

namespace py = pybind11;

void bind_pixelmath(py::module_&);
void bind_imgbuffer(py::module_&);

PYBIND11_MODULE(regionmirror, m) {
    m.doc() = "RegionMirror pixel math and frame buffers";
    bind_pixelmath(m);
    bind_imgbuffer(m);
}
