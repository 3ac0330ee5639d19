#pragma once
#include <Eigen/Core>

namespace adbandit {

template <class ValueType>
using colvec_type = Eigen::Matrix<ValueType, Eigen::Dynamic, 1>;

template <class ValueType>
using mat_type = Eigen::Matrix<ValueType, Eigen::Dynamic, Eigen::Dynamic>;

}  // namespace adbandit
