#include <adbandit_bits/driver/simulate.hpp>
#include <adbandit_bits/env/reward_environment.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <limits>
#include <string>
#include <testutil/base_fixture.hpp>

namespace adbandit {
namespace driver {

struct simulate_fixture : base_fixture {
   protected:
    using env_t = env::RewardEnvironment<value_t>;
    using config_t = SimulationConfig<value_t>;

    env_t env{{"a", "b", "c"}, std::vector<value_t>{0.2, 0.9, 0.5}};
    config_t config;

    simulate_fixture() {
        config.horizon = 1000;
        config.epsilon = 0.1;
        config.seed = 314;
    }
};

TEST_F(simulate_fixture, default_config) {
    config_t c;
    EXPECT_EQ(c.horizon, 5000);
    EXPECT_DOUBLE_EQ(c.epsilon, 0.1);
    EXPECT_NO_THROW(c.validate());
}

TEST_F(simulate_fixture, invalid_config) {
    config.horizon = 0;
    EXPECT_THROW(simulate<uint_t>(env, config), configuration_error);
    config.horizon = std::numeric_limits<size_t>::max();
    EXPECT_THROW(config.validate(), configuration_error);
    EXPECT_THROW(simulate<uint_t>(env, config), configuration_error);
    config.horizon = max_horizon() + 1;
    EXPECT_THROW(simulate<uint_t>(env, config), configuration_error);
    config.horizon = 10;
    config.epsilon = 1.5;
    EXPECT_THROW(simulate<uint_t>(env, config), configuration_error);
}

TEST_F(simulate_fixture, horizon_error_names_value) {
    config.horizon = std::numeric_limits<size_t>::max();
    try {
        config.validate();
        FAIL() << "expected configuration_error";
    } catch (const configuration_error& e) {
        EXPECT_NE(std::string(e.what()).find(
                      std::to_string(std::numeric_limits<size_t>::max())),
                  std::string::npos);
    }
}

TEST_F(simulate_fixture, policy_order) {
    auto results = simulate<uint_t>(env, config);
    ASSERT_EQ(results.size(), 3);
    EXPECT_EQ(results[0].name, "epsilon_greedy");
    EXPECT_EQ(results[1].name, "ucb1");
    EXPECT_EQ(results[2].name, "thompson");
}

TEST_F(simulate_fixture, series_shape) {
    auto results = simulate<uint_t>(env, config);
    for (const auto& r : results) {
        ASSERT_EQ(r.trace.size(), config.horizon);
        ASSERT_EQ(r.cum_reward.size(), config.horizon);
        ASSERT_EQ(r.cum_regret.size(), config.horizon);
        for (size_t t = 1; t < config.horizon; ++t) {
            EXPECT_GE(r.cum_reward[t], r.cum_reward[t - 1]);
        }
    }
}

TEST_F(simulate_fixture, regret_identity) {
    auto results = simulate<uint_t>(env, config);
    const value_t optimal = 0.9;
    for (const auto& r : results) {
        for (size_t t = 0; t < config.horizon; ++t) {
            EXPECT_NEAR(r.cum_regret[t], (t + 1) * optimal - r.cum_reward[t],
                        1e-9);
        }
        EXPECT_DOUBLE_EQ(r.cum_reward[config.horizon - 1],
                         r.trace.rewards().sum());
    }
}

TEST_F(simulate_fixture, deterministic_given_seed) {
    auto r1 = simulate<uint_t>(env, config);
    auto r2 = simulate<uint_t>(env, config);
    for (size_t j = 0; j < r1.size(); ++j) {
        EXPECT_EQ(r1[j].trace.rewards(), r2[j].trace.rewards());
        EXPECT_EQ(r1[j].trace.arms(), r2[j].trace.arms());
        EXPECT_EQ(r1[j].cum_regret, r2[j].cum_regret);
    }
}

TEST_F(simulate_fixture, seed_changes_run) {
    auto r1 = simulate<uint_t>(env, config);
    config.seed += 1;
    auto r2 = simulate<uint_t>(env, config);
    EXPECT_NE(r1[0].trace.rewards(), r2[0].trace.rewards());
}

TEST_F(simulate_fixture, shared_stream_order) {
    // one stream consumed by epsilon-greedy, then UCB1, then Thompson.
    gen_t gen(config.seed);
    policy::EpsilonGreedy<value_t> eg(config.epsilon);
    policy::UCB1<value_t> ucb;
    policy::Thompson<value_t> ts;
    auto t_eg = run<uint_t>(eg, env, config.horizon, gen);
    auto t_ucb = run<uint_t>(ucb, env, config.horizon, gen);
    auto t_ts = run<uint_t>(ts, env, config.horizon, gen);

    auto results = simulate<uint_t>(env, config);
    EXPECT_EQ(results[0].trace.arms(), t_eg.arms());
    EXPECT_EQ(results[1].trace.rewards(), t_ucb.rewards());
    EXPECT_EQ(results[2].trace.arms(), t_ts.arms());
    EXPECT_EQ(results[2].trace.rewards(), t_ts.rewards());
}

TEST_F(simulate_fixture, custom_policies) {
    std::vector<policy::Policy<value_t>> policies;
    policies.emplace_back(policy::UCB1<value_t>());
    policies.emplace_back(policy::EpsilonGreedy<value_t>(0.));
    gen_t gen(1);
    auto results = simulate<uint_t>(policies, env, 50, gen);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].name, "ucb1");
    EXPECT_EQ(results[1].name, "epsilon_greedy");
}

}  // namespace driver
}  // namespace adbandit
