#pragma once
#include <adbandit_bits/util/macros.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cstddef>

namespace adbandit {
namespace driver {

/*
 * Per-step record of a single policy run of horizon T.
 * rewards()[t] in {0, 1} is the reward observed at step t
 * and arms()[t] is the arm pulled at step t.
 */
template <class UIntType>
struct StepTrace {
    using uint_t = UIntType;

   private:
    colvec_type<uint_t> rewards_;
    colvec_type<uint_t> arms_;

   public:
    StepTrace() = default;
    explicit StepTrace(size_t horizon) : rewards_(horizon), arms_(horizon) {}

    ADBANDIT_STRONG_INLINE
    void record(size_t t, uint_t reward, uint_t arm) {
        rewards_[t] = reward;
        arms_[t] = arm;
    }

    ADBANDIT_STRONG_INLINE
    size_t size() const { return rewards_.size(); }

    const auto& rewards() const { return rewards_; }
    const auto& arms() const { return arms_; }
};

}  // namespace driver
}  // namespace adbandit
