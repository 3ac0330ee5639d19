#pragma once
#include <omp.h>

#include <adbandit_bits/driver/config.hpp>
#include <adbandit_bits/driver/series_accum.hpp>
#include <adbandit_bits/driver/simulate.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <cstddef>
#include <random>
#include <thread>
#include <type_traits>
#include <vector>

namespace adbandit {
namespace driver {

template <class UIntType, class GenType, class EnvType, class AccumType,
          class ValueType>
inline void accumulate_(const EnvType& env,
                        const SimulationConfig<ValueType>& config,
                        AccumType& acc_o, size_t n_sims, size_t n_threads) {
    using acc_t = std::decay_t<AccumType>;

    std::vector<acc_t> acc_os(n_threads, acc_o);

#pragma omp parallel num_threads(n_threads)
    {
        const size_t t = omp_get_thread_num();
        auto env_copy = env;  // pulls are not const
        auto cfg_t = config;

#pragma omp for schedule(static)
        for (size_t i = 0; i < n_sims; ++i) {
            cfg_t.seed = config.seed + i;
            auto results = simulate<UIntType, GenType>(env_copy, cfg_t);
            acc_os[t].update(results);
        }
    }

    for (size_t j = 0; j < acc_os.size(); ++j) {
        acc_o.pool(acc_os[j]);
    }
}

/*
 * Runs n_sims independent simulations of env with the configuration config,
 * where simulation i is seeded with config.seed + i,
 * and returns the accumulated cumulative series of every policy.
 * The simulations are split statically over n_threads OpenMP threads.
 * n_threads is capped at the hardware concurrency.
 */
template <class UIntType, class GenType = std::mt19937, class ValueType,
          class EnvType>
inline auto accumulate(const EnvType& env,
                       const SimulationConfig<ValueType>& config,
                       size_t n_sims, size_t n_threads) {
    config.validate();

    if (n_sims < 1) {
        throw configuration_error("n_sims", n_sims, ">= 1");
    }
    if (n_threads < 1) {
        throw configuration_error("n_threads", n_threads, ">= 1");
    }

    size_t max_threads = std::thread::hardware_concurrency();
    if (max_threads > 0 && n_threads > max_threads) {
        n_threads = max_threads;
    }

    SeriesAccum<ValueType> acc_o(config.horizon, 3);
    accumulate_<UIntType, GenType>(env, config, acc_o, n_sims, n_threads);
    return acc_o;
}

}  // namespace driver
}  // namespace adbandit
