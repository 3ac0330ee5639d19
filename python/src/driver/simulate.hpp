#pragma once
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <adbandit_bits/driver/accumulate.hpp>
#include <adbandit_bits/driver/config.hpp>
#include <adbandit_bits/driver/series_accum.hpp>
#include <adbandit_bits/driver/simulate.hpp>
#include <adbandit_bits/summary/results_summary.hpp>

namespace adbandit {
namespace driver {

namespace py = pybind11;

template <class SummaryType>
void add_results_summary(py::module_& m) {
    using summary_t = SummaryType;
    py::class_<summary_t>(m, "ResultsSummary")
        .def("n_policies", &summary_t::n_policies)
        .def("horizon", &summary_t::horizon)
        .def("names", &summary_t::names)
        .def("labels", &summary_t::labels)
        .def("expected_rewards", &summary_t::expected_rewards,
             py::return_value_policy::reference_internal)
        .def("cum_reward", &summary_t::cum_reward, py::arg("j"),
             py::return_value_policy::reference_internal)
        .def("cum_regret", &summary_t::cum_regret, py::arg("j"),
             py::return_value_policy::reference_internal)
        .def("find", &summary_t::find, py::arg("name"))
        .def("best_arm_idx", &summary_t::best_arm_idx)
        .def("best_arm_label", &summary_t::best_arm_label)
        .def("best_arm_value", &summary_t::best_arm_value);
}

template <class AccumType>
void add_series_accum(py::module_& m) {
    using acc_t = AccumType;
    py::class_<acc_t>(m, "SeriesAccum")
        .def(py::init<size_t, size_t>(), py::arg("horizon"),
             py::arg("n_policies"))
        .def("horizon", &acc_t::horizon)
        .def("n_policies", &acc_t::n_policies)
        .def("n_updates", &acc_t::n_updates)
        .def("names", &acc_t::names)
        .def("mean_cum_reward", &acc_t::mean_cum_reward)
        .def("mean_cum_regret", &acc_t::mean_cum_regret);
}

template <class EnvType, class GenType, class UIntType>
void add_simulate(py::module_& m) {
    using env_t = EnvType;
    using value_t = typename env_t::value_t;
    using uint_t = UIntType;
    using gen_t = GenType;
    using config_t = SimulationConfig<value_t>;
    using summary_t = summary::ResultsSummary<value_t>;

    m.def(
        "simulate",
        [](env_t& env, size_t horizon, value_t epsilon, size_t seed) {
            config_t config;
            config.horizon = horizon;
            config.epsilon = epsilon;
            config.seed = seed;
            auto results = simulate<uint_t, gen_t>(env, config);
            return summary_t(env, results);
        },
        py::arg("env"), py::arg("horizon") = 5000, py::arg("epsilon") = 0.1,
        py::arg("seed") = 0);

    m.def(
        "accumulate",
        [](const env_t& env, size_t horizon, value_t epsilon, size_t seed,
           size_t n_sims, size_t n_threads) {
            config_t config;
            config.horizon = horizon;
            config.epsilon = epsilon;
            config.seed = seed;
            // release GIL before running long C++ function
            py::gil_scoped_release release;
            return accumulate<uint_t, gen_t>(env, config, n_sims, n_threads);
        },
        py::arg("env"), py::arg("horizon") = 5000, py::arg("epsilon") = 0.1,
        py::arg("seed") = 0, py::arg("n_sims") = 100,
        py::arg("n_threads") = 1);
}

}  // namespace driver
}  // namespace adbandit
