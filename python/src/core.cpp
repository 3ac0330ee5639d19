#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <adbandit_bits/io/dataset.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <core.hpp>
#include <driver/driver.hpp>
#include <env/env.hpp>
#include <export_utils/types.hpp>
#include <policy/policy.hpp>

namespace py = pybind11;

PYBIND11_MODULE(core, m) {
    using namespace adbandit;

    /* Map the error taxonomy onto Python exceptions */
    auto base_exc =
        py::register_exception<adbandit_error>(m, "AdBanditError");
    py::register_exception<configuration_error>(m, "ConfigurationError",
                                                base_exc.ptr());
    py::register_exception<data_error>(m, "DataError", base_exc.ptr());
    py::register_exception<index_error>(m, "IndexError", base_exc.ptr());

    /* Call each adder function from each subdirectory */
    py::module_ env_m = m.def_submodule("env", "Environment submodule.");
    env::add_to_module(env_m);

    py::module_ policy_m = m.def_submodule("policy", "Policy submodule.");
    policy::add_to_module(policy_m);

    py::module_ driver_m = m.def_submodule("driver", "Driver submodule.");
    driver::add_to_module(driver_m);

    /* Rest of the dependencies */

    m.def(
        "load_arms",
        [](const std::string& path, const std::string& label_column,
           const std::string& prob_column) {
            auto data = io::load_arms<py_double_t>(path, label_column,
                                                   prob_column);
            return py::make_tuple(data.labels, data.probs);
        },
        py::arg("path"), py::arg("label_column") = "Ad",
        py::arg("prob_column") = "CTR");

    py::class_<py_gen_t>(m, "mt19937").def(py::init<uint32_t>());
}
