#pragma once
#include <pybind11/pybind11.h>

namespace adbandit {
namespace driver {

namespace py = pybind11;

void add_to_module(py::module_& m);

}  // namespace driver
}  // namespace adbandit
