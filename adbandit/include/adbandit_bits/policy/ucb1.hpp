#pragma once
#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cmath>

namespace adbandit {
namespace policy {

/*
 * UCB1 policy.
 * At step t (0-indexed) it pulls the arm maximizing
 *
 *      values[a] + \sqrt{2 \log(t+1) / counts[a]}
 *
 * with the lowest index winning ties.
 * counts start at 1 (not 0) so the bound is finite for unpulled arms,
 * and every later update divides by the incremented count.
 * No randomness is consumed by selection.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct UCB1 {
    using value_t = ValueType;

   private:
    colvec_type<value_t> counts_;
    colvec_type<value_t> values_;
    colvec_type<value_t> bounds_;  // buffer for the upper confidence bounds

   public:
    void reset(size_t n_arms) {
        counts_.setOnes(n_arms);
        values_.setZero(n_arms);
        bounds_.setZero(n_arms);
    }

    template <class GenType>
    size_t select(size_t t, GenType&&) {
        const value_t log_t = std::log(static_cast<value_t>(t + 1));
        bounds_.array() =
            values_.array() + (2 * log_t / counts_.array()).sqrt();
        return argmax(bounds_);
    }

    ADBANDIT_STRONG_INLINE
    void update(size_t arm, value_t reward) {
        counts_[arm] += 1;
        values_[arm] += (reward - values_[arm]) / counts_[arm];
    }

    const auto& counts() const { return counts_; }
    const auto& values() const { return values_; }
    const auto& bounds() const { return bounds_; }
};

}  // namespace policy
}  // namespace adbandit
