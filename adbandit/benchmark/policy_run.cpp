#include <benchmark/benchmark.h>

#include <adbandit_bits/driver/accumulate.hpp>
#include <adbandit_bits/driver/run.hpp>
#include <adbandit_bits/env/reward_environment.hpp>
#include <adbandit_bits/policy/policy.hpp>
#include <random>
#include <string>
#include <vector>

namespace adbandit {
namespace {

using value_t = double;
using uint_t = uint32_t;
using env_t = env::RewardEnvironment<value_t>;

env_t make_env(size_t n_arms) {
    std::vector<std::string> labels;
    std::vector<value_t> probs;
    for (size_t i = 0; i < n_arms; ++i) {
        labels.push_back("ad_" + std::to_string(i));
        probs.push_back(0.01 + 0.1 * static_cast<value_t>(i) / n_arms);
    }
    return env_t(labels, probs);
}

template <class PolicyType>
static void BM_run(benchmark::State& state) {
    size_t n_arms = state.range(0);
    size_t horizon = 5000;
    auto env = make_env(n_arms);
    PolicyType p;
    std::mt19937 gen(0);

    for (auto _ : state) {
        auto trace = driver::run<uint_t>(p, env, horizon, gen);
        benchmark::DoNotOptimize(trace.rewards().data());
    }
    state.SetItemsProcessed(state.iterations() * horizon);
}

BENCHMARK_TEMPLATE(BM_run, policy::EpsilonGreedy<value_t>)
    ->Arg(3)
    ->Arg(10)
    ->Arg(100);
BENCHMARK_TEMPLATE(BM_run, policy::UCB1<value_t>)->Arg(3)->Arg(10)->Arg(100);
BENCHMARK_TEMPLATE(BM_run, policy::Thompson<value_t>)
    ->Arg(3)
    ->Arg(10)
    ->Arg(100);

static void BM_accumulate(benchmark::State& state) {
    auto env = make_env(10);
    driver::SimulationConfig<value_t> config;
    config.horizon = 1000;
    size_t n_sims = 64;
    size_t n_threads = state.range(0);

    for (auto _ : state) {
        auto acc = driver::accumulate<uint_t>(env, config, n_sims, n_threads);
        benchmark::DoNotOptimize(acc.regret_sum().data());
    }
}

BENCHMARK(BM_accumulate)->Arg(1)->Arg(2)->Arg(4);

}  // namespace
}  // namespace adbandit
