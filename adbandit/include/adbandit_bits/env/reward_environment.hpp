#pragma once
#include <adbandit_bits/distribution/uniform.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace adbandit {
namespace env {

/*
 * A single selectable option with a true (hidden) success probability.
 */
template <class ValueType>
struct Arm {
    using value_t = ValueType;

    std::string label;
    value_t prob;
};

/*
 * Stochastic Bernoulli reward environment.
 * Arm i pays reward 1 with probability expected_rewards()[i] and 0 otherwise.
 * The arm configuration is immutable after construction.
 * The environment owns no random state;
 * the caller passes the RNG to every pull.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct RewardEnvironment {
    using value_t = ValueType;
    using arm_t = Arm<value_t>;

   private:
    using uniform_t = distribution::Uniform<value_t>;

    std::vector<std::string> labels_;
    colvec_type<value_t> probs_;
    uniform_t uniform_;

    void validate() const {
        if (labels_.size() != static_cast<size_t>(probs_.size())) {
            throw data_error("Number of labels (" +
                             std::to_string(labels_.size()) +
                             ") does not match number of probabilities (" +
                             std::to_string(probs_.size()) + ").");
        }
        if (probs_.size() < 1) {
            throw configuration_error("number of arms", probs_.size(),
                                      ">= 1");
        }
        for (int i = 0; i < probs_.size(); ++i) {
            const auto p = probs_[i];
            if (!(p >= 0 && p <= 1)) {
                throw configuration_error(
                    "probability of arm " + std::to_string(i), p, "in [0, 1]");
            }
        }
    }

   public:
    RewardEnvironment(std::vector<std::string> labels,
                      const Eigen::Ref<const colvec_type<value_t>>& probs)
        : labels_(std::move(labels)), probs_(probs), uniform_(0., 1.) {
        validate();
    }

    RewardEnvironment(std::vector<std::string> labels,
                      const std::vector<value_t>& probs)
        : labels_(std::move(labels)),
          probs_(Eigen::Map<const colvec_type<value_t>>(probs.data(),
                                                        probs.size())),
          uniform_(0., 1.) {
        validate();
    }

    /*
     * Simulates one pull of arm idx.
     * Draws exactly one uniform u in [0, 1) from gen
     * and returns 1 if u < p[idx] and 0 otherwise.
     * Throws index_error if idx is not in [0, n_arms()).
     */
    template <class GenType>
    ADBANDIT_STRONG_INLINE int pull(size_t idx, GenType&& gen) {
        if (idx >= n_arms()) {
            throw index_error(idx, n_arms());
        }
        return uniform_.sample(gen) < probs_[idx];
    }

    ADBANDIT_STRONG_INLINE
    size_t n_arms() const { return probs_.size(); }

    /*
     * Returns the true success probabilities.
     * This is the evaluation oracle.
     * Policies under test must never read it.
     */
    ADBANDIT_STRONG_INLINE
    const auto& expected_rewards() const { return probs_; }

    const auto& labels() const { return labels_; }
    const std::string& label(size_t i) const { return labels_[i]; }

    arm_t arm(size_t i) const { return {labels_[i], probs_[i]}; }
};

}  // namespace env
}  // namespace adbandit
