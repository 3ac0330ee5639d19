#pragma once
#include <adbandit_bits/util/macros.hpp>
#include <random>

namespace adbandit {
namespace distribution {

template <class ValueType>
struct Beta {
    using value_t = ValueType;

   private:
    using gamma_t = std::gamma_distribution<value_t>;
    using param_t = typename gamma_t::param_type;

    gamma_t gamma_;

   public:
    /*
     * Clears any state cached by the underlying gamma sampler
     * so that the next sample depends only on the RNG.
     */
    void reset() { gamma_.reset(); }

    /*
     * Samples a single Beta(alpha, beta) random variable
     * given an RNG gen. It uses the representation
     *
     *      X / (X + Y),  X ~ Gamma(alpha, 1), Y ~ Gamma(beta, 1)
     *
     * so that exactly two gamma variates are drawn per sample,
     * X first, then Y.
     * alpha and beta must be positive.
     */
    template <class GenType>
    ADBANDIT_STRONG_INLINE value_t sample(value_t alpha, value_t beta,
                                         GenType&& gen) {
        value_t x = gamma_(gen, param_t(alpha, 1.));
        value_t y = gamma_(gen, param_t(beta, 1.));
        value_t s = x + y;
        // both gammas underflowed: fall back to the prior mean.
        return (s > 0) ? x / s : alpha / (alpha + beta);
    }

    /*
     * Computes the mean of Beta(alpha, beta).
     */
    ADBANDIT_STRONG_INLINE
    static value_t mean(value_t alpha, value_t beta) {
        return alpha / (alpha + beta);
    }
};

}  // namespace distribution
}  // namespace adbandit
