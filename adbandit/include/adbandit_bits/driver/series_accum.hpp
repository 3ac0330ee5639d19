#pragma once
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

namespace adbandit {
namespace driver {

/*
 * Accumulates cumulative-reward and cumulative-regret series
 * over many independent simulations.
 * Column j of each sum corresponds to the jth policy in simulation order
 * and row t to step t.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct SeriesAccum {
    using value_t = ValueType;

   private:
    mat_type<value_t> reward_sum_;  // (horizon x n_policies)
    mat_type<value_t> regret_sum_;  // (horizon x n_policies)
    std::vector<std::string> names_;
    size_t n_updates_ = 0;

   public:
    SeriesAccum() = default;
    SeriesAccum(size_t horizon, size_t n_policies) {
        reset(horizon, n_policies);
    }

    void reset(size_t horizon, size_t n_policies) {
        reward_sum_.setZero(horizon, n_policies);
        regret_sum_.setZero(horizon, n_policies);
        names_.clear();
        n_updates_ = 0;
    }

    /*
     * Adds the series of one simulation.
     * results must be in the same policy order for every update.
     */
    template <class ResultsType>
    void update(const ResultsType& results) {
        assert(static_cast<size_t>(results.size()) == n_policies());
        if (names_.empty()) {
            for (const auto& r : results) names_.push_back(r.name);
        }
        for (size_t j = 0; j < results.size(); ++j) {
            reward_sum_.col(j) += results[j].cum_reward;
            regret_sum_.col(j) += results[j].cum_regret;
        }
        ++n_updates_;
    }

    /*
     * Pools the sums of other into this accumulator.
     */
    void pool(const SeriesAccum& other) {
        if (other.n_updates_ == 0) return;
        if (names_.empty()) names_ = other.names_;
        reward_sum_ += other.reward_sum_;
        regret_sum_ += other.regret_sum_;
        n_updates_ += other.n_updates_;
    }

    ADBANDIT_STRONG_INLINE
    size_t horizon() const { return reward_sum_.rows(); }

    ADBANDIT_STRONG_INLINE
    size_t n_policies() const { return reward_sum_.cols(); }

    ADBANDIT_STRONG_INLINE
    size_t n_updates() const { return n_updates_; }

    const auto& names() const { return names_; }
    const auto& reward_sum() const { return reward_sum_; }
    const auto& regret_sum() const { return regret_sum_; }

    mat_type<value_t> mean_cum_reward() const {
        return reward_sum_ / static_cast<value_t>(n_updates_);
    }

    mat_type<value_t> mean_cum_regret() const {
        return regret_sum_ / static_cast<value_t>(n_updates_);
    }
};

}  // namespace driver
}  // namespace adbandit
