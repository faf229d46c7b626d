#pragma once
// Stability gate: hysteresis state machine over pooled statistics
//
//   not_observed -> unstable -> stable -> revoked -> stable ...
//
// Enter (unstable/revoked -> stable), all at once, for sustain_cycles
// consecutive evaluations:
//   rel_width < enter  AND  df >= df_min  AND  drift < drift_threshold
// An unknown drift (too little history) does not block entry.
//
// Exit (stable -> revoked): rel_width > exit, with exit > enter.
// Between the two thresholds nothing changes, so a statistic hovering
// near one boundary cannot make the gate flap.

#include "errors.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace episteme {

enum class GateState : uint8_t {
    NotObserved = 0,
    Unstable = 1,
    Stable = 2,
    Revoked = 3,
};

inline const char* gate_state_name(GateState s) {
    switch (s) {
        case GateState::NotObserved: return "not_observed";
        case GateState::Unstable:    return "unstable";
        case GateState::Stable:      return "stable";
        case GateState::Revoked:     return "revoked";
    }
    return "unknown";
}

inline GateState gate_state_from_name(const std::string& s) {
    if (s == "unstable") return GateState::Unstable;
    if (s == "stable") return GateState::Stable;
    if (s == "revoked") return GateState::Revoked;
    return GateState::NotObserved;
}

// Decision regime derived from the noise gate
enum class Regime : uint8_t {
    PreGate = 0,      // Only calibration is proposable
    InGate = 1,       // Exploration unlocked
    GateRevoked = 2,  // Forced back toward calibration
};

inline const char* regime_name(Regime r) {
    switch (r) {
        case Regime::PreGate:     return "pre_gate";
        case Regime::InGate:      return "in_gate";
        case Regime::GateRevoked: return "gate_revoked";
    }
    return "unknown";
}

inline Regime regime_for(GateState s) {
    switch (s) {
        case GateState::Stable:  return Regime::InGate;
        case GateState::Revoked: return Regime::GateRevoked;
        default:                 return Regime::PreGate;
    }
}

struct GateThresholds {
    double enter = 0.25;        // rel_width below this to enter
    double exit = 0.40;         // rel_width above this to revoke
    double df_min = 40.0;       // Pooled df needed before entering
    double drift = 0.20;        // Drift metric must stay below this
    int sustain_cycles = 3;     // Consecutive qualifying evaluations

    void validate() const {
        if (!(enter > 0.0)) throw ConfigError("gate.enter", "must be > 0");
        if (!(exit > enter)) {
            throw ConfigError("gate.exit", "must be greater than gate.enter (hysteresis band)");
        }
        if (df_min < 1.0) throw ConfigError("gate.df_min", "must be >= 1");
        if (!(drift > 0.0)) throw ConfigError("gate.drift", "must be > 0");
        if (sustain_cycles < 1) throw ConfigError("gate.sustain_cycles", "must be >= 1");
    }

    json to_json() const {
        return {
            {"enter", enter},
            {"exit", exit},
            {"df_min", df_min},
            {"drift", drift},
            {"sustain_cycles", sustain_cycles},
        };
    }
};

struct GateInputs {
    std::optional<double> rel_width;
    double df = 0.0;
    std::optional<double> drift;
};

enum class GateTransition : uint8_t {
    None = 0,
    Observed = 1,   // not_observed -> unstable
    Entered = 2,    // -> stable
    Exited = 3,     // stable -> revoked
};

class Gate {
public:
    Gate() = default;
    Gate(std::string name, GateThresholds thresholds)
        : name_(std::move(name)), thresholds_(thresholds) {}

    const std::string& name() const { return name_; }
    GateState state() const { return state_; }
    int streak() const { return streak_; }
    const GateThresholds& thresholds() const { return thresholds_; }
    bool stable() const { return state_ == GateState::Stable; }

    bool entry_criteria_met(const GateInputs& in) const {
        if (!in.rel_width) return false;
        bool drift_ok = !in.drift || *in.drift < thresholds_.drift;
        return *in.rel_width < thresholds_.enter && in.df >= thresholds_.df_min && drift_ok;
    }

    bool exit_criteria_met(const GateInputs& in) const {
        return in.rel_width && *in.rel_width > thresholds_.exit;
    }

    // One evaluation per update. Returns the strongest transition taken.
    GateTransition evaluate(const GateInputs& in) {
        GateTransition result = GateTransition::None;

        if (state_ == GateState::NotObserved) {
            if (!in.rel_width) return result;
            state_ = GateState::Unstable;
            result = GateTransition::Observed;
        }

        if (state_ == GateState::Stable) {
            if (exit_criteria_met(in)) {
                state_ = GateState::Revoked;
                streak_ = 0;
                return GateTransition::Exited;
            }
            return result;
        }

        // Unstable or revoked: accumulate a streak of qualifying evaluations
        if (entry_criteria_met(in)) {
            if (++streak_ >= thresholds_.sustain_cycles) {
                state_ = GateState::Stable;
                streak_ = 0;
                return GateTransition::Entered;
            }
        } else {
            streak_ = 0;
        }
        return result;
    }

    json to_json() const {
        return {
            {"name", name_},
            {"state", gate_state_name(state_)},
            {"streak", streak_},
            {"thresholds", thresholds_.to_json()},
        };
    }

private:
    std::string name_;
    GateThresholds thresholds_;
    GateState state_ = GateState::NotObserved;
    int streak_ = 0;
};

} // namespace episteme
