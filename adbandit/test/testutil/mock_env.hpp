#pragma once
#include <cstddef>
#include <utility>
#include <vector>

namespace adbandit {

/*
 * Environment that ignores the RNG and replays a fixed reward script.
 * The kth pull returns rewards[k % rewards.size()] regardless of the arm,
 * and every pulled arm is logged.
 */
struct ScriptedEnv {
    size_t n_arms_;
    std::vector<int> rewards_;
    std::vector<size_t> pulled_;
    size_t k_ = 0;

    ScriptedEnv(size_t n_arms, std::vector<int> rewards)
        : n_arms_(n_arms), rewards_(std::move(rewards)) {}

    size_t n_arms() const { return n_arms_; }

    template <class GenType>
    int pull(size_t arm, GenType&&) {
        pulled_.push_back(arm);
        return rewards_[k_++ % rewards_.size()];
    }
};

}  // namespace adbandit
