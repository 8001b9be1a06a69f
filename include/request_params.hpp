#pragma once
#include <stdexcept>
#include <string>

namespace feed_sync {

// Parses a positive integer query parameter. Any bad input, including
// values that do not fit an int, throws std::invalid_argument.
inline int parse_positive_int(const std::string& raw, const std::string& name) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(name + " must be a number");
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " out of range");
    }
    if (consumed != raw.size()) throw std::invalid_argument(name + " must be a number");
    if (value <= 0) throw std::invalid_argument(name + " must be positive");
    return value;
}

} // namespace feed_sync
