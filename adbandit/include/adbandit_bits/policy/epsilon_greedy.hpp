#pragma once
#include <adbandit_bits/distribution/uniform.hpp>
#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <random>

namespace adbandit {
namespace policy {

/*
 * Epsilon-greedy policy.
 * With probability epsilon it explores a uniformly random arm,
 * otherwise it exploits the arm with the largest running mean reward
 * (lowest index on ties).
 * Before any pull all means are 0, so exploitation picks arm 0.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct EpsilonGreedy {
    using value_t = ValueType;

   private:
    using uniform_t = distribution::Uniform<value_t>;

    value_t epsilon_;
    colvec_type<value_t> counts_;  // counts_[i] = number of pulls of arm i
    colvec_type<value_t> values_;  // values_[i] = mean reward of arm i
    uniform_t uniform_;

   public:
    explicit EpsilonGreedy(value_t epsilon = 0.1)
        : epsilon_(epsilon), uniform_(0., 1.) {
        if (!(epsilon >= 0 && epsilon <= 1)) {
            throw configuration_error("epsilon", epsilon, "in [0, 1]");
        }
    }

    void reset(size_t n_arms) {
        counts_.setZero(n_arms);
        values_.setZero(n_arms);
    }

    /*
     * Selects the arm to pull at step t.
     * Draws one uniform to decide whether to explore and,
     * only when exploring, one more integer to pick the arm.
     */
    template <class GenType>
    size_t select(size_t, GenType&& gen) {
        if (uniform_.sample(gen) < epsilon_) {
            std::uniform_int_distribution<size_t> arm_dist(0,
                                                           values_.size() - 1);
            return arm_dist(gen);
        }
        return argmax(values_);
    }

    ADBANDIT_STRONG_INLINE
    void update(size_t arm, value_t reward) {
        counts_[arm] += 1;
        values_[arm] += (reward - values_[arm]) / counts_[arm];
    }

    value_t epsilon() const { return epsilon_; }
    const auto& counts() const { return counts_; }
    const auto& values() const { return values_; }
};

}  // namespace policy
}  // namespace adbandit
