#pragma once
#include <gtest/gtest.h>

#include <cstdint>
#include <random>

namespace adbandit {

struct base_fixture : ::testing::Test {
   protected:
    using value_t = double;
    using uint_t = uint32_t;
    using gen_t = std::mt19937;
};

}  // namespace adbandit
