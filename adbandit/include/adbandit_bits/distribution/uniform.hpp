#pragma once
#include <adbandit_bits/util/macros.hpp>
#include <random>

namespace adbandit {
namespace distribution {

template <class ValueType>
struct Uniform {
    using value_t = ValueType;

   private:
    std::uniform_real_distribution<value_t> unif_;

   public:
    Uniform(value_t min = 0., value_t max = 1.) : unif_(min, max) {}

    /*
     * Samples a single uniform random variable on [min, max)
     * given an RNG gen.
     */
    template <class GenType>
    ADBANDIT_STRONG_INLINE value_t sample(GenType&& gen) {
        return unif_(gen);
    }
};

}  // namespace distribution
}  // namespace adbandit
