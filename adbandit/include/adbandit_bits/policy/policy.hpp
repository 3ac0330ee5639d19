#pragma once
#include <adbandit_bits/policy/epsilon_greedy.hpp>
#include <adbandit_bits/policy/thompson.hpp>
#include <adbandit_bits/policy/ucb1.hpp>
#include <string>
#include <variant>
#include <vector>

namespace adbandit {
namespace policy {

/*
 * Closed set of policies.
 * All alternatives share reset/select/update,
 * so callers dispatch with std::visit instead of a virtual interface.
 */
template <class ValueType>
using Policy =
    std::variant<EpsilonGreedy<ValueType>, UCB1<ValueType>, Thompson<ValueType>>;

template <class ValueType>
inline std::string policy_name(const EpsilonGreedy<ValueType>&) {
    return "epsilon_greedy";
}

template <class ValueType>
inline std::string policy_name(const UCB1<ValueType>&) {
    return "ucb1";
}

template <class ValueType>
inline std::string policy_name(const Thompson<ValueType>&) {
    return "thompson";
}

template <class ValueType>
inline std::string policy_name(const Policy<ValueType>& p) {
    return std::visit([](const auto& q) { return policy_name(q); }, p);
}

/*
 * Creates the three policies in simulation order:
 * epsilon-greedy, UCB1, Thompson Sampling.
 */
template <class ValueType>
inline auto make_default_policies(ValueType epsilon) {
    std::vector<Policy<ValueType>> out;
    out.reserve(3);
    out.emplace_back(EpsilonGreedy<ValueType>(epsilon));
    out.emplace_back(UCB1<ValueType>());
    out.emplace_back(Thompson<ValueType>());
    return out;
}

}  // namespace policy
}  // namespace adbandit
