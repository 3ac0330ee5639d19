#pragma once
#include <cstdint>

namespace adbandit {

// default typedefs for pybind exports
using py_double_t = double;
using py_uint_t = uint32_t;

}  // namespace adbandit
