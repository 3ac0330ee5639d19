#pragma once
#include <adbandit_bits/driver/config.hpp>
#include <adbandit_bits/driver/run.hpp>
#include <adbandit_bits/driver/step_trace.hpp>
#include <adbandit_bits/policy/policy.hpp>
#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/types.hpp>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace adbandit {
namespace driver {

/*
 * Outcome of one policy in a simulation:
 * the raw trace and the two cumulative series derived from it.
 */
template <class ValueType, class UIntType>
struct PolicyResult {
    using value_t = ValueType;
    using uint_t = UIntType;

    std::string name;
    StepTrace<uint_t> trace;
    colvec_type<value_t> cum_reward;  // cum_reward[t] = total reward up to t
    colvec_type<value_t> cum_regret;  // cum_regret[t] = (t+1) * optimal -
                                      //                 cum_reward[t]
};

/*
 * Runs every policy in policies, in order, for config.horizon steps
 * against env, consuming the single RNG gen sequentially:
 * all steps of policies[0], then all steps of policies[1], and so on.
 * The optimal expected reward used for regret is max_i env.expected_rewards()[i]
 * and stays fixed across all steps.
 */
template <class UIntType, class ValueType, class EnvType, class GenType>
inline auto simulate(std::vector<policy::Policy<ValueType>>& policies,
                     EnvType& env, size_t horizon, GenType&& gen) {
    using value_t = ValueType;
    using uint_t = UIntType;
    using result_t = PolicyResult<value_t, uint_t>;

    const auto& probs = env.expected_rewards();
    const value_t optimal = probs[argmax(probs)];

    std::vector<result_t> results;
    results.reserve(policies.size());
    for (auto& p : policies) {
        result_t res;
        res.name = policy::policy_name(p);
        res.trace = run<uint_t>(p, env, horizon, gen);
        cumsum(res.trace.rewards(), res.cum_reward);
        cumsum_regret(optimal, res.trace.rewards(), res.cum_regret);
        results.emplace_back(std::move(res));
    }
    return results;
}

/*
 * Runs epsilon-greedy, UCB1 and Thompson Sampling (in that order)
 * with a fresh GenType seeded by config.seed.
 * A fixed seed reproduces the run exactly.
 */
template <class UIntType, class GenType = std::mt19937, class ValueType,
          class EnvType>
inline auto simulate(EnvType& env, const SimulationConfig<ValueType>& config) {
    config.validate();
    auto policies = policy::make_default_policies<ValueType>(config.epsilon);
    GenType gen(config.seed);
    return simulate<UIntType>(policies, env, config.horizon, gen);
}

}  // namespace driver
}  // namespace adbandit
