#include <adbandit_bits/util/algorithm.hpp>
#include <adbandit_bits/util/types.hpp>
#include <testutil/base_fixture.hpp>
#include <testutil/eigen_ext.hpp>

namespace adbandit {

struct algorithm_fixture : base_fixture {};

// ==============================================
// TEST argmax
// ==============================================

using argmax_input_t = std::tuple<colvec_type<double>, size_t>;

struct argmax_fixture : algorithm_fixture,
                        ::testing::WithParamInterface<argmax_input_t> {};

TEST_P(argmax_fixture, argmax_test) {
    auto [v, e] = GetParam();
    EXPECT_EQ(argmax(v), e);
}

INSTANTIATE_TEST_SUITE_P(
    ArgmaxTest, argmax_fixture,
    testing::Values(argmax_input_t(make_colvec({0.2, 0.9, 0.5}), 1),
                    argmax_input_t(make_colvec({0., 0., 0.}), 0),
                    argmax_input_t(make_colvec({0.1, 0.7, 0.7}), 1),
                    argmax_input_t(make_colvec({-1.}), 0),
                    argmax_input_t(make_colvec({0.3, 0.1, 0.3, 0.4}), 3)));

// ==============================================
// TEST cumulative sums
// ==============================================

TEST_F(algorithm_fixture, cumsum_test) {
    colvec_type<uint_t> x(5);
    x << 0, 1, 1, 0, 1;
    colvec_type<value_t> actual;
    cumsum(x, actual);
    expect_double_eq_vec(actual, make_colvec<value_t>({0, 1, 2, 2, 3}));
}

TEST_F(algorithm_fixture, cumsum_regret_test) {
    colvec_type<uint_t> x(4);
    x << 0, 1, 1, 0;
    colvec_type<value_t> actual;
    cumsum_regret(0.9, x, actual);
    expect_near_vec(actual, make_colvec<value_t>({0.9, 0.8, 0.7, 1.6}),
                    1e-12);
}

TEST_F(algorithm_fixture, cumsum_regret_identity) {
    colvec_type<uint_t> x(100);
    for (int i = 0; i < x.size(); ++i) x[i] = (i % 3 == 0);
    colvec_type<value_t> rew, reg;
    cumsum(x, rew);
    cumsum_regret(0.42, x, reg);
    for (int t = 0; t < x.size(); ++t) {
        EXPECT_NEAR(reg[t], (t + 1) * 0.42 - rew[t], 1e-10);
    }
}

}  // namespace adbandit
