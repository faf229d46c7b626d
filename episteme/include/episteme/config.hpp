#pragma once
// Run configuration
//
// One struct with defaults for every knob of a run. Loaded from JSON:
// unknown keys are ignored, present keys must have the right type.
// CLI flags are applied on top by the driver, then validate() runs.
//
//   {
//     "seed": 42, "budget_wells": 768, "max_cycles": 30,
//     "gate":   {"enter": 0.25, "exit": 0.40, "df_min": 40, "drift": 0.2, "sustain_cycles": 3},
//     "debt":   {"sensitivity": 0.15, "hard_threshold": 2.0, "calibration_templates": [...]},
//     "snr":    {"k_sigma": 5.0, "strict": false, "tie_lsb": 2.0},
//     "spatial_qc": {"flag_threshold": 0.3, "severe_threshold": 0.5, "proceed_penalty": 0.5},
//     "policy": {"compounds": [...], "expected_gain_bits": {...}},
//     "reward": {"gain_weight": 1.0, "cost_weight": 1.0, "entropy_weight": 1.0},
//     "world":  {"workers": 4, "artifact_probability": 0.05},
//     "calibration_path": "floors.json"
//   }

#include "belief_state.hpp"
#include "debt.hpp"
#include "errors.hpp"
#include "mitigation.hpp"
#include "penalty.hpp"
#include "policy.hpp"
#include "snr_filter.hpp"
#include "types.hpp"
#include "world.hpp"
#include <fstream>
#include <string>

namespace episteme {

struct RewardConfig {
    double gain_weight = 1.0;
    double cost_weight = 1.0;       // Per fraction of the total budget
    double entropy_weight = 1.0;

    json to_json() const {
        return {{"gain_weight", gain_weight}, {"cost_weight", cost_weight},
                {"entropy_weight", entropy_weight}};
    }
};

namespace detail {

// Reads j[key] into out when present; wrong types are configuration errors
template<typename T>
inline void read_param(const json& j, const char* key, T& out, const std::string& section) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        std::string name = section.empty() ? key : section + "." + key;
        throw ConfigError(name, std::string("wrong type: ") + e.what());
    }
}

inline const json& section(const json& j, const char* key) {
    static const json empty = json::object();
    auto it = j.find(key);
    if (it == j.end()) return empty;
    if (!it->is_object()) throw ConfigError(key, "must be an object");
    return *it;
}

inline void read_gate(const json& j, GateThresholds& g, const std::string& name) {
    read_param(j, "enter", g.enter, name);
    read_param(j, "exit", g.exit, name);
    read_param(j, "df_min", g.df_min, name);
    read_param(j, "drift", g.drift, name);
    read_param(j, "sustain_cycles", g.sustain_cycles, name);
}

} // namespace detail

struct RunConfig {
    std::string run_id;                    // Defaults to run-seed<seed>
    uint64_t seed = 42;
    double budget_wells = 768.0;           // Eight plates
    int max_cycles = 30;
    std::string log_dir = "runs";
    int max_consecutive_refusals = 3;
    std::string calibration_path;          // Empty: built-in floors

    BeliefConfig beliefs;
    DebtConfig debt;
    SnrConfig snr;
    SpatialQcConfig spatial_qc;
    HorizonConfig horizon;
    RewardConfig reward;
    PolicyConfig policy;
    SimulatedWorldConfig world;

    std::string effective_run_id() const {
        return run_id.empty() ? "run-seed" + std::to_string(seed) : run_id;
    }

    void validate() const {
        if (!(budget_wells > 0.0)) throw ConfigError("budget_wells", "must be > 0");
        if (max_cycles <= 0) throw ConfigError("max_cycles", "must be > 0");
        if (max_consecutive_refusals < 1) throw ConfigError("max_consecutive_refusals", "must be >= 1");
        if (log_dir.empty()) throw ConfigError("log_dir", "must not be empty");
        if (world.workers < 1) throw ConfigError("world.workers", "must be >= 1");
        if (!(snr.k_sigma > 0.0)) throw ConfigError("snr.k_sigma", "must be > 0");
        if (snr.tie_lsb < 0.0) throw ConfigError("snr.tie_lsb", "must be >= 0");
        beliefs.validate();
        debt.validate();
        spatial_qc.validate();
        policy.validate();
        if (!debt.is_calibration(policy.calibration_template)) {
            throw ConfigError("policy.calibration_template",
                              policy.calibration_template + " is not in debt.calibration_templates");
        }
        if (!(horizon.min_multiplier > 0.0 && horizon.min_multiplier <= 1.0)) {
            throw ConfigError("horizon.min_multiplier", "must be in (0, 1]");
        }
        if (horizon.base_horizon < 1) throw ConfigError("horizon.base_horizon", "must be >= 1");
    }

    static RunConfig from_json(const json& j) {
        using detail::read_param;
        if (!j.is_object()) throw ConfigError("config", "top level must be an object");

        RunConfig c;
        read_param(j, "run_id", c.run_id, "");
        read_param(j, "seed", c.seed, "");
        read_param(j, "budget_wells", c.budget_wells, "");
        read_param(j, "max_cycles", c.max_cycles, "");
        read_param(j, "log_dir", c.log_dir, "");
        read_param(j, "max_consecutive_refusals", c.max_consecutive_refusals, "");
        read_param(j, "calibration_path", c.calibration_path, "");

        detail::read_gate(detail::section(j, "gate"), c.beliefs.gate, "gate");
        detail::read_gate(detail::section(j, "assay_gate"), c.beliefs.assay_gate, "assay_gate");

        const json& b = detail::section(j, "beliefs");
        read_param(b, "assay_gates", c.beliefs.assay_gates, "beliefs");
        read_param(b, "calibration_assay", c.beliefs.calibration_assay, "beliefs");
        read_param(b, "drift_window", c.beliefs.drift_window, "beliefs");
        read_param(b, "drift_k", c.beliefs.drift_k, "beliefs");
        read_param(b, "edge_ema_alpha", c.beliefs.edge_ema_alpha, "beliefs");
        read_param(b, "edge_effect_min", c.beliefs.edge_effect_min, "beliefs");
        read_param(b, "edge_min_tests", c.beliefs.edge_min_tests, "beliefs");
        read_param(b, "response_sigma_mult", c.beliefs.response_sigma_mult, "beliefs");

        const json& d = detail::section(j, "debt");
        read_param(d, "sensitivity", c.debt.sensitivity, "debt");
        read_param(d, "hard_threshold", c.debt.hard_threshold, "debt");
        read_param(d, "calibration_templates", c.debt.calibration_templates, "debt");
        read_param(d, "repayment_enabled", c.debt.repayment_enabled, "debt");
        read_param(d, "repay_base", c.debt.repay_base, "debt");
        read_param(d, "repay_bonus_scale", c.debt.repay_bonus_scale, "debt");
        read_param(d, "repay_bonus_cap", c.debt.repay_bonus_cap, "debt");
        read_param(d, "repay_cap", c.debt.repay_cap, "debt");

        const json& s = detail::section(j, "snr");
        read_param(s, "k_sigma", c.snr.k_sigma, "snr");
        read_param(s, "strict", c.snr.strict, "snr");
        read_param(s, "quant_multiplier", c.snr.quant_multiplier, "snr");
        read_param(s, "tie_lsb", c.snr.tie_lsb, "snr");

        const json& q = detail::section(j, "spatial_qc");
        read_param(q, "flag_threshold", c.spatial_qc.flag_threshold, "spatial_qc");
        read_param(q, "severe_threshold", c.spatial_qc.severe_threshold, "spatial_qc");
        read_param(q, "proceed_penalty", c.spatial_qc.proceed_penalty, "spatial_qc");
        read_param(q, "min_budget_wells", c.spatial_qc.min_budget_wells, "spatial_qc");
        read_param(q, "min_wells", c.spatial_qc.min_wells, "spatial_qc");

        const json& h = detail::section(j, "horizon");
        read_param(h, "min_multiplier", c.horizon.min_multiplier, "horizon");
        read_param(h, "base_horizon", c.horizon.base_horizon, "horizon");

        const json& r = detail::section(j, "reward");
        read_param(r, "gain_weight", c.reward.gain_weight, "reward");
        read_param(r, "cost_weight", c.reward.cost_weight, "reward");
        read_param(r, "entropy_weight", c.reward.entropy_weight, "reward");

        const json& p = detail::section(j, "policy");
        read_param(p, "cell_line", c.policy.cell_line, "policy");
        read_param(p, "calibration_template", c.policy.calibration_template, "policy");
        read_param(p, "compounds", c.policy.compounds, "policy");
        read_param(p, "replicates", c.policy.replicates, "policy");
        read_param(p, "baseline_wells", c.policy.baseline_wells, "policy");
        if (p.contains("expected_gain_bits")) {
            std::map<std::string, double> gains;
            read_param(p, "expected_gain_bits", gains, "policy");
            for (const auto& [name, bits] : gains) c.policy.expected_gain_bits[name] = bits;
        }

        const json& w = detail::section(j, "world");
        read_param(w, "workers", c.world.workers, "world");
        read_param(w, "well_cv", c.world.well_cv, "world");
        read_param(w, "channel_cv", c.world.channel_cv, "world");
        read_param(w, "edge_effect", c.world.edge_effect, "world");
        read_param(w, "artifact_probability", c.world.artifact_probability, "world");
        read_param(w, "artifact_gradient", c.world.artifact_gradient, "world");
        c.world.seed = c.seed;
        return c;
    }

    static RunConfig load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ConfigError("config", "cannot open " + path);
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) throw ConfigError("config", "not valid JSON: " + path);
        return from_json(j);
    }

    json to_json() const {
        return {
            {"run_id", effective_run_id()},
            {"seed", seed},
            {"budget_wells", budget_wells},
            {"max_cycles", max_cycles},
            {"log_dir", log_dir},
            {"max_consecutive_refusals", max_consecutive_refusals},
            {"calibration_path", calibration_path},
            {"gate", beliefs.gate.to_json()},
            {"assay_gate", beliefs.assay_gate.to_json()},
            {"debt", {
                {"sensitivity", debt.sensitivity},
                {"hard_threshold", debt.hard_threshold},
                {"calibration_templates", debt.calibration_templates},
                {"repayment_enabled", debt.repayment_enabled},
            }},
            {"snr", {{"k_sigma", snr.k_sigma}, {"strict", snr.strict}, {"tie_lsb", snr.tie_lsb}}},
            {"spatial_qc", spatial_qc.to_json()},
            {"horizon", {{"min_multiplier", horizon.min_multiplier},
                         {"base_horizon", horizon.base_horizon}}},
            {"reward", reward.to_json()},
            {"policy", {{"compounds", policy.compounds},
                        {"calibration_template", policy.calibration_template},
                        {"expected_gain_bits", policy.expected_gain_bits}}},
            {"world", world.to_json()},
        };
    }
};

} // namespace episteme
