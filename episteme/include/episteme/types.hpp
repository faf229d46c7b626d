#pragma once
// Core types shared by every component
//
// Reading: a channel value that is either known or explicitly unknown.
// There is no implicit conversion to double and no "value or default"
// accessor. A masked reading stays masked through every aggregation;
// callers must branch on get() to use the number.

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

using json = nlohmann::json;

// Non-finite doubles are written as null so every record stays valid JSON
inline json finite_or_null(double v) {
    if (!std::isfinite(v)) return nullptr;
    return v;
}

inline json finite_or_null(std::optional<double> v) {
    if (!v) return nullptr;
    return finite_or_null(*v);
}

inline std::optional<double> optional_double(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

class Reading {
public:
    Reading() = default;  // unknown

    static Reading known(double value) {
        if (!std::isfinite(value)) return Reading{};
        return Reading(value);
    }
    static Reading unknown() { return Reading{}; }

    bool is_known() const { return value_.has_value(); }
    std::optional<double> get() const { return value_; }

    json to_json() const { return finite_or_null(value_); }

    static Reading from_json(const json& j) {
        if (j.is_null()) return Reading{};
        return known(j.get<double>());
    }

    bool operator==(const Reading& other) const { return value_ == other.value_; }
    bool operator!=(const Reading& other) const { return !(*this == other); }

private:
    explicit Reading(double value) : value_(value) {}

    std::optional<double> value_;
};

// Aggregations: unknown if any input is unknown or there is nothing to aggregate

inline Reading mean_of(const std::vector<Reading>& values) {
    if (values.empty()) return Reading::unknown();
    double sum = 0.0;
    for (const auto& r : values) {
        auto v = r.get();
        if (!v) return Reading::unknown();
        sum += *v;
    }
    return Reading::known(sum / static_cast<double>(values.size()));
}

// Sample standard deviation (n-1). Needs at least two known values.
inline Reading stddev_of(const std::vector<Reading>& values) {
    if (values.size() < 2) return Reading::unknown();
    auto mean = mean_of(values).get();
    if (!mean) return Reading::unknown();
    double ss = 0.0;
    for (const auto& r : values) {
        double d = *r.get() - *mean;
        ss += d * d;
    }
    return Reading::known(std::sqrt(ss / static_cast<double>(values.size() - 1)));
}

inline Reading difference(const Reading& a, const Reading& b) {
    auto va = a.get();
    auto vb = b.get();
    if (!va || !vb) return Reading::unknown();
    return Reading::known(*va - *vb);
}

// FNV-1a: stable across platforms, used to derive deterministic seeds
inline uint64_t fnv1a(const std::string& s, uint64_t h = 0xcbf29ce484222325ULL) {
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

inline uint64_t mix_seed(uint64_t seed, const std::string& a, uint64_t index) {
    uint64_t h = fnv1a(a, seed ^ 0x9e3779b97f4a7c15ULL);
    h ^= index + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

} // namespace episteme
