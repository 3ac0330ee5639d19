#pragma once
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>

#include <adbandit_bits/policy/policy.hpp>

namespace adbandit {
namespace policy {

namespace py = pybind11;

/*
 * Exports reset/select/update which every policy shares.
 */
template <class PolicyType, class GenType, class ClassType>
void add_policy_common(ClassType& c) {
    using policy_t = PolicyType;
    using gen_t = GenType;

    c.def("reset", &policy_t::reset, py::arg("n_arms"))
        .def(
            "select",
            [](policy_t& p, size_t t, gen_t& gen) { return p.select(t, gen); },
            py::arg("t"), py::arg("gen"))
        .def("update", &policy_t::update, py::arg("arm"), py::arg("reward"))
        .def("name", [](const policy_t& p) { return policy_name(p); });
}

template <class ValueType, class GenType>
void add_epsilon_greedy(py::module_& m) {
    using policy_t = EpsilonGreedy<ValueType>;
    py::class_<policy_t> c(m, "EpsilonGreedy");
    c.def(py::init<ValueType>(), py::arg("epsilon") = 0.1)
        .def("epsilon", &policy_t::epsilon)
        .def("counts", &policy_t::counts,
             py::return_value_policy::reference_internal)
        .def("values", &policy_t::values,
             py::return_value_policy::reference_internal);
    add_policy_common<policy_t, GenType>(c);
}

template <class ValueType, class GenType>
void add_ucb1(py::module_& m) {
    using policy_t = UCB1<ValueType>;
    py::class_<policy_t> c(m, "UCB1");
    c.def(py::init<>())
        .def("counts", &policy_t::counts,
             py::return_value_policy::reference_internal)
        .def("values", &policy_t::values,
             py::return_value_policy::reference_internal);
    add_policy_common<policy_t, GenType>(c);
}

template <class ValueType, class GenType>
void add_thompson(py::module_& m) {
    using policy_t = Thompson<ValueType>;
    py::class_<policy_t> c(m, "Thompson");
    c.def(py::init<>())
        .def("alpha", &policy_t::alpha,
             py::return_value_policy::reference_internal)
        .def("beta", &policy_t::beta,
             py::return_value_policy::reference_internal);
    add_policy_common<policy_t, GenType>(c);
}

}  // namespace policy
}  // namespace adbandit
