#pragma once
#include <adbandit_bits/distribution/beta.hpp>
#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>

namespace adbandit {
namespace policy {

/*
 * Thompson Sampling for Bernoulli rewards with a conjugate Beta(1, 1) prior.
 * Each step samples theta[a] ~ Beta(alpha[a], beta[a]) for every arm
 * (in arm order) and pulls the arm with the largest sample.
 * The posterior mean alpha / (alpha + beta) is never stored.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct Thompson {
    using value_t = ValueType;

   private:
    using beta_dist_t = distribution::Beta<value_t>;

    colvec_type<value_t> alpha_;
    colvec_type<value_t> beta_;
    colvec_type<value_t> theta_;  // last posterior sample
    beta_dist_t beta_dist_;

   public:
    void reset(size_t n_arms) {
        alpha_.setOnes(n_arms);
        beta_.setOnes(n_arms);
        theta_.setZero(n_arms);
        beta_dist_.reset();
    }

    template <class GenType>
    size_t select(size_t, GenType&& gen) {
        for (int i = 0; i < theta_.size(); ++i) {
            theta_[i] = beta_dist_.sample(alpha_[i], beta_[i], gen);
        }
        return argmax(theta_);
    }

    ADBANDIT_STRONG_INLINE
    void update(size_t arm, value_t reward) {
        alpha_[arm] += reward;
        beta_[arm] += (1 - reward);
    }

    const auto& alpha() const { return alpha_; }
    const auto& beta() const { return beta_; }
    const auto& theta() const { return theta_; }
};

}  // namespace policy
}  // namespace adbandit
