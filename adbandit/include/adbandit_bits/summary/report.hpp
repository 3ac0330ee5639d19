#pragma once
#include <adbandit_bits/summary/results_summary.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <ios>
#include <ostream>

namespace adbandit {
namespace summary {
namespace internal {

/*
 * Restores the format flags and precision of a stream on scope exit.
 */
struct stream_state_guard {
    explicit stream_state_guard(std::ostream& os)
        : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~stream_state_guard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

   private:
    std::ostream& os_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

}  // namespace internal

/*
 * Writes the cumulative reward (".clk") and regret (".reg") series
 * of every policy in s, one row every stride steps, starting at step 0.
 * Every column is wide enough for the longest header
 * plus a two-space gap.
 */
template <class ValueType>
inline void write_series(std::ostream& os, const ResultsSummary<ValueType>& s,
                         size_t stride) {
    internal::stream_state_guard guard(os);

    const int step_w = 8;
    size_t name_len = 0;
    for (const auto& name : s.names()) {
        name_len = std::max(name_len, name.size());
    }
    const int col_w = static_cast<int>(std::max<size_t>(name_len + 6, 12));

    os << std::setw(step_w) << "step";
    for (const auto& name : s.names()) {
        os << std::setw(col_w) << (name + ".clk") << std::setw(col_w)
           << (name + ".reg");
    }
    os << '\n' << std::fixed << std::setprecision(2);
    if (stride < 1) stride = 1;
    for (size_t t = 0; t < s.horizon(); t += stride) {
        os << std::setw(step_w) << t;
        for (size_t j = 0; j < s.n_policies(); ++j) {
            os << std::setw(col_w) << s.cum_reward(j)[t] << std::setw(col_w)
               << s.cum_regret(j)[t];
        }
        os << '\n';
    }
}

/*
 * Writes "BEST AD -> <label> (CTR = <p>)" for the best arm of s,
 * with p rounded to 3 decimal places and printed without trailing zeros.
 */
template <class ValueType>
inline void write_best_arm(std::ostream& os,
                           const ResultsSummary<ValueType>& s) {
    internal::stream_state_guard guard(os);
    const auto v = static_cast<double>(s.best_arm_value());
    const double p = std::round(v * 1000.) / 1000.;
    os << std::defaultfloat << std::setprecision(6) << "BEST AD -> "
       << s.best_arm_label() << " (CTR = " << p << ")\n";
}

}  // namespace summary
}  // namespace adbandit
