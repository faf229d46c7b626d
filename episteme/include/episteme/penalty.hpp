#pragma once
// Reward shaping from uncertainty
//
// Entropy penalty: an action that widened uncertainty pays
//   weight * (posterior - prior); narrowing pays nothing.
// Horizon shrinkage: while current uncertainty is above the recorded
// baseline, the planning horizon is scaled by
//   clamp(baseline / current, min_multiplier, 1)
// No baseline, no shrinkage.

#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace episteme {

inline double entropy_penalty(double prior_bits, double posterior_bits, double weight = 1.0) {
    return weight * std::max(0.0, posterior_bits - prior_bits);
}

struct HorizonConfig {
    double min_multiplier = 0.2;     // Never shrink below this fraction
    int base_horizon = 3;            // Cycles the planner may commit to
};

class HorizonPolicy {
public:
    explicit HorizonPolicy(HorizonConfig config = {}) : config_(config) {
        if (!(config_.min_multiplier > 0.0 && config_.min_multiplier <= 1.0)) {
            throw ConfigError("horizon.min_multiplier", "must be in (0, 1]");
        }
    }

    const std::optional<double>& baseline() const { return baseline_; }

    // Replaces any earlier baseline
    void set_baseline(double bits) { baseline_ = bits; }

    double multiplier(double current_bits) const {
        if (!baseline_ || *baseline_ <= 0.0 || !(current_bits > *baseline_)) return 1.0;
        return std::clamp(*baseline_ / current_bits, config_.min_multiplier, 1.0);
    }

    // Cycles ahead the agent may commit to; at least one
    int horizon(double current_bits) const {
        double h = std::floor(config_.base_horizon * multiplier(current_bits));
        return std::max(1, static_cast<int>(h));
    }

private:
    std::optional<double> baseline_;
    HorizonConfig config_;
};

} // namespace episteme
