#pragma once
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <adbandit_bits/util/types.hpp>
#include <string>
#include <vector>

namespace adbandit {
namespace env {

namespace py = pybind11;

template <class EnvType, class GenType>
void add_reward_environment(py::module_& m) {
    using env_t = EnvType;
    using value_t = typename env_t::value_t;
    using gen_t = GenType;

    py::class_<env_t>(m, "RewardEnvironment")
        .def(py::init<std::vector<std::string>,
                      const Eigen::Ref<const colvec_type<value_t>>&>(),
             py::arg("labels"), py::arg("probs"))
        .def("n_arms", &env_t::n_arms)
        .def("labels", &env_t::labels)
        .def("expected_rewards", &env_t::expected_rewards,
             py::return_value_policy::reference_internal)
        .def(
            "pull",
            [](env_t& e, size_t arm, gen_t& gen) { return e.pull(arm, gen); },
            py::arg("arm"), py::arg("gen"));
}

}  // namespace env
}  // namespace adbandit
