#include <adbandit_bits/driver/simulate.hpp>
#include <adbandit_bits/env/reward_environment.hpp>
#include <adbandit_bits/summary/report.hpp>
#include <adbandit_bits/summary/results_summary.hpp>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <testutil/base_fixture.hpp>
#include <vector>

namespace adbandit {
namespace summary {

struct report_fixture : base_fixture {
   protected:
    using env_t = env::RewardEnvironment<value_t>;
    using summary_t = ResultsSummary<value_t>;

    env_t env{{"Ad 1", "Ad 2", "Ad 3", "Ad 4", "Ad 5"},
              std::vector<value_t>{0.05, 0.13, 0.09, 0.16, 0.11}};
    driver::SimulationConfig<value_t> config;

    report_fixture() {
        config.horizon = 300;
        config.seed = 11;
    }

    summary_t make_summary(env_t& e) {
        auto results = driver::simulate<uint_t>(e, config);
        return summary_t(e, results);
    }

    static std::vector<std::string> split_lines(const std::string& s) {
        std::vector<std::string> out;
        std::istringstream in(s);
        std::string line;
        while (std::getline(in, line)) out.push_back(line);
        return out;
    }

    static std::vector<std::string> split_words(const std::string& s) {
        std::vector<std::string> out;
        std::istringstream in(s);
        std::string w;
        while (in >> w) out.push_back(w);
        return out;
    }
};

// ==============================================
// TEST write_series
// ==============================================

TEST_F(report_fixture, series_header_columns_separated) {
    auto s = make_summary(env);
    std::ostringstream os;
    write_series(os, s, 200);

    auto lines = split_lines(os.str());
    ASSERT_EQ(lines.size(), 3);

    std::vector<std::string> expected = {
        "step",     "epsilon_greedy.clk", "epsilon_greedy.reg",
        "ucb1.clk", "ucb1.reg",           "thompson.clk",
        "thompson.reg"};
    EXPECT_EQ(split_words(lines[0]), expected);
    // "epsilon_greedy.clk" plus a two-space gap
    EXPECT_EQ(lines[0].find("  epsilon_greedy.clk  "), 8);
}

TEST_F(report_fixture, series_rows_every_stride) {
    auto s = make_summary(env);
    std::ostringstream os;
    write_series(os, s, 200);

    auto lines = split_lines(os.str());
    ASSERT_EQ(lines.size(), 3);
    auto r0 = split_words(lines[1]);
    auto r1 = split_words(lines[2]);
    ASSERT_EQ(r0.size(), 7);
    ASSERT_EQ(r1.size(), 7);
    EXPECT_EQ(r0[0], "0");
    EXPECT_EQ(r1[0], "200");
    // all rows share the header's width
    EXPECT_EQ(lines[1].size(), lines[0].size());
    EXPECT_EQ(lines[2].size(), lines[0].size());

    std::ostringstream cell;
    cell << std::fixed << std::setprecision(2) << s.cum_reward(1)[200];
    EXPECT_EQ(r1[3], cell.str());
}

TEST_F(report_fixture, series_restores_stream_format) {
    auto s = make_summary(env);
    std::ostringstream os;
    write_series(os, s, 200);
    os.str("");
    os << 0.5;
    EXPECT_EQ(os.str(), "0.5");
}

// ==============================================
// TEST write_best_arm
// ==============================================

TEST_F(report_fixture, best_arm_line) {
    auto s = make_summary(env);
    std::ostringstream os;
    write_best_arm(os, s);
    EXPECT_EQ(os.str(), "BEST AD -> Ad 4 (CTR = 0.16)\n");
}

TEST_F(report_fixture, best_arm_rounds_to_three_places) {
    env_t e{{"x", "y"}, std::vector<value_t>{0.12345, 0.0}};
    auto s = make_summary(e);
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    write_best_arm(os, s);
    EXPECT_EQ(os.str(), "BEST AD -> x (CTR = 0.123)\n");
    EXPECT_TRUE(os.flags() & std::ios_base::fixed);
    EXPECT_EQ(os.precision(), 2);
}

TEST_F(report_fixture, best_arm_whole_number) {
    env_t e{{"only"}, std::vector<value_t>{1.0}};
    auto s = make_summary(e);
    std::ostringstream os;
    write_best_arm(os, s);
    EXPECT_EQ(os.str(), "BEST AD -> only (CTR = 1)\n");
}

}  // namespace summary
}  // namespace adbandit
