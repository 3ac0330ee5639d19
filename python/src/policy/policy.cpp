#include <core.hpp>
#include <export_utils/types.hpp>
#include <policy/policies.hpp>
#include <policy/policy.hpp>

namespace adbandit {
namespace policy {

namespace py = pybind11;

void add_to_module(py::module_& m) {
    add_epsilon_greedy<py_double_t, py_gen_t>(m);
    add_ucb1<py_double_t, py_gen_t>(m);
    add_thompson<py_double_t, py_gen_t>(m);
}

}  // namespace policy
}  // namespace adbandit
