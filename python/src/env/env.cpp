#include <adbandit_bits/env/reward_environment.hpp>
#include <core.hpp>
#include <env/env.hpp>
#include <env/reward_environment.hpp>
#include <export_utils/types.hpp>

namespace adbandit {
namespace env {

namespace py = pybind11;

void add_to_module(py::module_& m) {
    using env_t = RewardEnvironment<py_double_t>;
    add_reward_environment<env_t, py_gen_t>(m);
}

}  // namespace env
}  // namespace adbandit
