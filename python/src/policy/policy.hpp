#pragma once
#include <pybind11/pybind11.h>

namespace adbandit {
namespace policy {

namespace py = pybind11;

void add_to_module(py::module_& m);

}  // namespace policy
}  // namespace adbandit
