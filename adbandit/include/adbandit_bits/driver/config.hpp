#pragma once
#include <adbandit_bits/util/exceptions.hpp>
#include <adbandit_bits/util/types.hpp>
#include <cstddef>
#include <limits>
#include <string>

namespace adbandit {
namespace driver {

/*
 * Largest horizon a StepTrace can hold.
 */
inline constexpr size_t max_horizon() {
    return static_cast<size_t>(std::numeric_limits<Eigen::Index>::max());
}

/*
 * Throws configuration_error unless 1 <= horizon <= max_horizon().
 */
inline void check_horizon(size_t horizon) {
    if (horizon < 1 || horizon > max_horizon()) {
        throw configuration_error("horizon", horizon,
                                  "in [1, " + std::to_string(max_horizon()) +
                                      "]");
    }
}

/*
 * Caller-supplied simulation parameters.
 * Defaults match the ad-banner study: 5000 steps, epsilon = 0.1.
 */
template <class ValueType>
struct SimulationConfig {
    using value_t = ValueType;

    size_t horizon = 5000;
    value_t epsilon = 0.1;
    size_t seed = 0;

    /*
     * Throws configuration_error on the first invalid field.
     */
    void validate() const {
        check_horizon(horizon);
        if (!(epsilon >= 0 && epsilon <= 1)) {
            throw configuration_error("epsilon", epsilon, "in [0, 1]");
        }
    }
};

}  // namespace driver
}  // namespace adbandit
