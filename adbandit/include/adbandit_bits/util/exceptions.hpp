#pragma once
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace adbandit {

struct adbandit_error : std::exception {
    adbandit_error() = default;
    explicit adbandit_error(std::string msg) : msg_(std::move(msg)) {}

    const char* what() const noexcept override { return msg_.data(); }

   private:
    std::string msg_;
};

/*
 * Thrown when a simulation is configured with invalid values,
 * e.g. an empty arm set, a non-positive horizon,
 * or a probability outside [0, 1].
 * The message always contains the offending value.
 */
struct configuration_error : adbandit_error {
    template <class T>
    configuration_error(const std::string& name, const T& value,
                        const std::string& expected)
        : adbandit_error(make_msg(name, value, expected)) {}

   private:
    template <class T>
    static std::string make_msg(const std::string& name, const T& value,
                                const std::string& expected) {
        std::stringstream ss;
        ss << "Invalid " << name << ": " << value << " (expected " << expected
           << ").";
        return ss.str();
    }
};

/*
 * Thrown when an arm dataset cannot be turned into
 * a list of (label, probability) pairs.
 */
struct data_error : adbandit_error {
    using adbandit_error::adbandit_error;
};

/*
 * Thrown when an arm index outside [0, n_arms) is pulled.
 * This always indicates a bug in the caller.
 */
struct index_error : adbandit_error {
    index_error(size_t idx, size_t n_arms)
        : adbandit_error("Arm index " + std::to_string(idx) +
                         " out of range [0, " + std::to_string(n_arms) +
                         ").") {}
};

}  // namespace adbandit
