#pragma once
#include <adbandit_bits/driver/config.hpp>
#include <adbandit_bits/driver/step_trace.hpp>
#include <adbandit_bits/policy/policy.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <cstddef>
#include <variant>

namespace adbandit {
namespace driver {

/*
 * Runs policy for horizon steps against env using the RNG gen.
 * The policy is reset to env.n_arms() arms before the first step.
 * Each step t:
 *  - selects an arm from the policy's own state
 *  - pulls it from env
 *  - updates the policy with the observed reward
 *  - records (reward, arm) at position t of the returned trace.
 *
 * EnvType only needs n_arms() and pull(arm, gen).
 * Throws configuration_error if horizon is not in [1, max_horizon()].
 */
template <class UIntType, class PolicyType, class EnvType, class GenType>
inline StepTrace<UIntType> run(PolicyType& policy, EnvType& env,
                               size_t horizon, GenType&& gen) {
    using uint_t = UIntType;
    using value_t = typename PolicyType::value_t;

    check_horizon(horizon);

    policy.reset(env.n_arms());

    StepTrace<uint_t> trace(horizon);
    for (size_t t = 0; t < horizon; ++t) {
        const size_t arm = policy.select(t, gen);
        const auto reward = env.pull(arm, gen);
        policy.update(arm, static_cast<value_t>(reward));
        trace.record(t, static_cast<uint_t>(reward), static_cast<uint_t>(arm));
    }
    return trace;
}

/*
 * Overload of run for the closed set of policies.
 */
template <class UIntType, class ValueType, class EnvType, class GenType>
inline StepTrace<UIntType> run(policy::Policy<ValueType>& policy, EnvType& env,
                               size_t horizon, GenType&& gen) {
    return std::visit(
        [&](auto& p) { return run<UIntType>(p, env, horizon, gen); }, policy);
}

}  // namespace driver
}  // namespace adbandit
