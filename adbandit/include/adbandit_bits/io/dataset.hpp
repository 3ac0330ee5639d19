#pragma once
#include <adbandit_bits/io/parse.hpp>
#include <adbandit_bits/util/exceptions.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace adbandit {
namespace io {

/*
 * Arm configuration read from a dataset.
 * labels[i] and probs[i] describe arm i.
 */
template <class ValueType>
struct ArmData {
    using value_t = ValueType;

    std::vector<std::string> labels;
    std::vector<value_t> probs;

    size_t size() const { return labels.size(); }
};

namespace internal {

inline std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    if (b - a >= 2 && s[a] == '"' && s[b - 1] == '"') {
        ++a;
        --b;
    }
    return s.substr(a, b - a);
}

/*
 * Splits a comma-separated line into trimmed fields.
 * Commas inside double quotes do not split.
 */
inline std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> out;
    std::string field;
    bool quoted = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            field.push_back(c);
        } else if (c == ',' && !quoted) {
            out.push_back(trim(field));
            field.clear();
        } else if (c != '\r') {
            field.push_back(c);
        }
    }
    out.push_back(trim(field));
    return out;
}

inline size_t find_column(const std::vector<std::string>& header,
                          const std::string& name) {
    for (size_t j = 0; j < header.size(); ++j) {
        if (header[j] == name) return j;
    }
    throw data_error("Missing required column '" + name + "'.");
}

}  // namespace internal

/*
 * Reads a comma-separated table with a header row from in.
 * Columns label_column and prob_column give the arm label
 * and its true success probability; other columns are ignored.
 * Blank lines are skipped.
 * Throws data_error on a missing column, a short row,
 * or a probability that does not parse as a number.
 * Range checks on the probabilities are left to the environment.
 */
template <class ValueType = double>
inline ArmData<ValueType> load_arms(std::istream& in,
                                    const std::string& label_column = "Ad",
                                    const std::string& prob_column = "CTR") {
    std::string line;
    if (!std::getline(in, line)) {
        throw data_error("Dataset is empty.");
    }
    const auto header = internal::split_row(line);
    const auto label_j = internal::find_column(header, label_column);
    const auto prob_j = internal::find_column(header, prob_column);
    const auto n_required = std::max(label_j, prob_j) + 1;

    ArmData<ValueType> out;
    size_t row = 1;
    while (std::getline(in, line)) {
        ++row;
        if (internal::trim(line).empty()) continue;
        const auto fields = internal::split_row(line);
        if (fields.size() < n_required) {
            throw data_error("Row " + std::to_string(row) + " has " +
                             std::to_string(fields.size()) +
                             " fields, expected at least " +
                             std::to_string(n_required) + ".");
        }
        const auto& p_str = fields[prob_j];
        double p = 0;
        if (!internal::to_double(p_str, p)) {
            throw data_error("Row " + std::to_string(row) + ": '" + p_str +
                             "' in column '" + prob_column +
                             "' is not a number.");
        }
        out.labels.push_back(fields[label_j]);
        out.probs.push_back(static_cast<ValueType>(p));
    }
    return out;
}

/*
 * Reads the dataset stored at path.
 * Throws data_error if the file cannot be opened.
 */
template <class ValueType = double>
inline ArmData<ValueType> load_arms(const std::string& path,
                                    const std::string& label_column = "Ad",
                                    const std::string& prob_column = "CTR") {
    std::ifstream fin(path);
    if (!fin) {
        throw data_error("Cannot open dataset " + path + ".");
    }
    return load_arms<ValueType>(fin, label_column, prob_column);
}

}  // namespace io
}  // namespace adbandit
