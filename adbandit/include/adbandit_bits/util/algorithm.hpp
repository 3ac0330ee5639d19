#pragma once
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cstddef>
#include <type_traits>

namespace adbandit {

/*
 * Returns the index of the maximum entry of v.
 * Ties are broken by the lowest index, i.e. the first maximum wins.
 * v must be non-empty.
 */
template <class VecType>
ADBANDIT_STRONG_INLINE size_t argmax(const VecType& v) {
    size_t idx = 0;
    for (int i = 1; i < v.size(); ++i) {
        if (v[i] > v[idx]) idx = i;
    }
    return idx;
}

/*
 * Computes the running sum of x into out, i.e.
 *
 *      out[t] = \sum_{s \leq t} x[s]
 *
 * The sum is carried in out's value type.
 */
template <class XType, class OutType>
inline void cumsum(const XType& x, OutType&& out) {
    using value_t = typename std::decay_t<OutType>::Scalar;
    out.resize(x.size());
    value_t sum = 0;
    for (int t = 0; t < x.size(); ++t) {
        sum += static_cast<value_t>(x[t]);
        out[t] = sum;
    }
}

/*
 * Computes the cumulative regret of a reward trace
 * against a fixed optimal expected reward:
 *
 *      out[t] = \sum_{s \leq t} (optimal - rewards[s])
 *
 * Note that this compares the expected optimum with the realized reward,
 * so a single increment may be negative.
 */
template <class ValueType, class RewardsType, class OutType>
inline void cumsum_regret(ValueType optimal, const RewardsType& rewards,
                          OutType&& out) {
    using value_t = typename std::decay_t<OutType>::Scalar;
    out.resize(rewards.size());
    value_t sum = 0;
    for (int t = 0; t < rewards.size(); ++t) {
        sum += optimal - static_cast<value_t>(rewards[t]);
        out[t] = sum;
    }
}

}  // namespace adbandit
