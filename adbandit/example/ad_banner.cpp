#include <adbandit>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace adbandit;
    using value_t = double;
    using uint_t = uint32_t;
    using env_t = env::RewardEnvironment<value_t>;

    if (argc < 2 || argc > 5) {
        std::cerr << "usage: " << argv[0]
                  << " <dataset.csv> [horizon=5000] [epsilon=0.1] [seed=0]"
                  << std::endl;
        return 2;
    }

    // configuration setting
    driver::SimulationConfig<value_t> config;
    size_t stride = 200;  // print every stride steps

    try {
        if (argc > 2) config.horizon = io::parse_size("horizon", argv[2]);
        if (argc > 3) {
            config.epsilon = io::parse_value<value_t>("epsilon", argv[3]);
        }
        if (argc > 4) config.seed = io::parse_size("seed", argv[4]);
        config.validate();
    } catch (const configuration_error& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    try {
        // load arms and create the environment
        auto data = io::load_arms<value_t>(std::string(argv[1]));
        env_t env(data.labels, data.probs);
        std::cout << "n_arms: " << env.n_arms()
                  << ", horizon: " << config.horizon
                  << ", epsilon: " << config.epsilon
                  << ", seed: " << config.seed << std::endl;

        auto results = driver::simulate<uint_t>(env, config);
        summary::ResultsSummary<value_t> s(env, results);

        // cumulative series, sampled
        summary::write_series(std::cout, s, stride);
        summary::write_best_arm(std::cout, s);
    } catch (const adbandit_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
