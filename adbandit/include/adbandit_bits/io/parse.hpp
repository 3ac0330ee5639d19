#pragma once
#include <adbandit_bits/util/exceptions.hpp>
#include <cctype>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace adbandit {
namespace io {
namespace internal {

/*
 * Parses all of s as a floating-point number into out.
 * Returns false on an empty string, trailing characters,
 * or a value out of range for double.
 */
inline bool to_double(const std::string& s, double& out) {
    size_t pos = 0;
    try {
        out = std::stod(s, &pos);
    } catch (const std::logic_error&) {
        return false;
    }
    return pos != 0 && pos == s.size();
}

/*
 * Parses all of s as a non-negative decimal integer into out.
 * Signs, whitespace and exponents are rejected.
 */
inline bool to_size(const std::string& s, size_t& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    unsigned long long v = 0;
    try {
        v = std::stoull(s);
    } catch (const std::logic_error&) {
        return false;
    }
    if (v > std::numeric_limits<size_t>::max()) return false;
    out = static_cast<size_t>(v);
    return true;
}

}  // namespace internal

/*
 * Reads the command-line value s of the setting name as a count.
 * Throws configuration_error unless s is entirely a non-negative integer.
 */
inline size_t parse_size(const std::string& name, const std::string& s) {
    size_t out = 0;
    if (!internal::to_size(s, out)) {
        throw configuration_error(name, "'" + s + "'",
                                  "a non-negative integer");
    }
    return out;
}

/*
 * Reads the command-line value s of the setting name as a real number.
 * Throws configuration_error unless s is entirely a number.
 */
template <class ValueType = double>
inline ValueType parse_value(const std::string& name, const std::string& s) {
    double out = 0;
    if (!internal::to_double(s, out)) {
        throw configuration_error(name, "'" + s + "'", "a number");
    }
    return static_cast<ValueType>(out);
}

}  // namespace io
}  // namespace adbandit
