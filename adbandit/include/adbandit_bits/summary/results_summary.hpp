#pragma once
#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace adbandit {
namespace summary {

/*
 * Returns the index of the arm with the largest true probability.
 * Ties go to the lowest index.
 */
template <class ProbsType>
ADBANDIT_STRONG_INLINE size_t best_arm(const ProbsType& probs) {
    return argmax(probs);
}

/*
 * Read-only view of a finished simulation for a presentation layer.
 * It copies the cumulative series of every policy
 * and the arm configuration, and derives the best arm.
 * Nothing is recomputed from the traces.
 *
 * @param   ValueType       underlying value type (usually double).
 */
template <class ValueType>
struct ResultsSummary {
    using value_t = ValueType;

   private:
    std::vector<std::string> names_;
    std::vector<colvec_type<value_t>> cum_rewards_;
    std::vector<colvec_type<value_t>> cum_regrets_;
    std::vector<std::string> labels_;
    colvec_type<value_t> expected_;
    size_t best_idx_ = 0;

   public:
    /*
     * Builds the summary from env (labels, expected_rewards)
     * and results, a sequence of driver::PolicyResult.
     */
    template <class EnvType, class ResultsType>
    ResultsSummary(const EnvType& env, const ResultsType& results)
        : labels_(env.labels()), expected_(env.expected_rewards()) {
        best_idx_ = best_arm(expected_);
        names_.reserve(results.size());
        cum_rewards_.reserve(results.size());
        cum_regrets_.reserve(results.size());
        for (const auto& r : results) {
            names_.push_back(r.name);
            cum_rewards_.push_back(r.cum_reward);
            cum_regrets_.push_back(r.cum_regret);
        }
    }

    ADBANDIT_STRONG_INLINE
    size_t n_policies() const { return names_.size(); }

    ADBANDIT_STRONG_INLINE
    size_t horizon() const {
        return cum_rewards_.empty() ? 0 : cum_rewards_[0].size();
    }

    const auto& names() const { return names_; }
    const auto& labels() const { return labels_; }
    const auto& expected_rewards() const { return expected_; }

    const auto& cum_reward(size_t j) const { return cum_rewards_[j]; }
    const auto& cum_regret(size_t j) const { return cum_regrets_[j]; }

    /*
     * Returns the position of the policy named name.
     * Throws adbandit_error if no such policy was simulated.
     */
    size_t find(const std::string& name) const {
        for (size_t j = 0; j < names_.size(); ++j) {
            if (names_[j] == name) return j;
        }
        throw adbandit_error("No policy named " + name + " in summary.");
    }

    ADBANDIT_STRONG_INLINE
    size_t best_arm_idx() const { return best_idx_; }
    const std::string& best_arm_label() const { return labels_[best_idx_]; }
    value_t best_arm_value() const { return expected_[best_idx_]; }
};

}  // namespace summary
}  // namespace adbandit
