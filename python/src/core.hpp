#pragma once
#include <random>

namespace adbandit {

// RNG used by every export
using py_gen_t = std::mt19937;

}  // namespace adbandit
