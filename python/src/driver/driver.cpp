#include <adbandit_bits/driver/series_accum.hpp>
#include <adbandit_bits/env/reward_environment.hpp>
#include <adbandit_bits/summary/results_summary.hpp>
#include <core.hpp>
#include <driver/driver.hpp>
#include <driver/simulate.hpp>
#include <export_utils/types.hpp>

namespace adbandit {
namespace driver {

namespace py = pybind11;

void add_to_module(py::module_& m) {
    using env_t = env::RewardEnvironment<py_double_t>;
    using summary_t = summary::ResultsSummary<py_double_t>;
    using acc_t = SeriesAccum<py_double_t>;

    add_results_summary<summary_t>(m);
    add_series_accum<acc_t>(m);
    add_simulate<env_t, py_gen_t, py_uint_t>(m);
}

}  // namespace driver
}  // namespace adbandit
