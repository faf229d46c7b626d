#pragma once
// Belief state and evidence ledger
//
// Beliefs are a plain struct that only the BeliefState can hand out, and
// only as const. Every write goes through a BeliefTransaction, which
// exists for the duration of one update() or one auxiliary record_*()
// call. A write that changes a value appends an EvidenceEvent to the
// cycle buffer; the event is validated for temporal provenance at the
// moment it is written.
//
// Cycle contract:
//   begin_cycle(k)   k == last + 1 (first cycle is 1), no cycle open
//   update(obs, k)   at most once per cycle, k == current
//   end_cycle()      returns and clears the buffer
//
// Updaters run in the order they were registered. The standard order is
// Noise -> Edge -> Response -> AssayGate (updaters/standard.hpp).

#include "errors.hpp"
#include "evidence.hpp"
#include "gate.hpp"
#include "log.hpp"
#include "observation.hpp"
#include "statistics.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

constexpr const char* NOISE_GATE = "noise_sigma";

inline std::string assay_gate_name(const std::string& assay) {
    return "assay:" + assay;
}

struct BeliefConfig {
    GateThresholds gate;                                   // noise_sigma gate
    GateThresholds assay_gate = {0.25, 0.40, 20.0, 0.20, 2};
    std::vector<std::string> assay_gates = {"cell_painting", "ldh"};
    std::string calibration_assay = "cell_painting";
    std::string vehicle = "DMSO";

    size_t drift_window = 20;         // Per-cycle sigmas kept
    size_t drift_k = 5;               // Half-window compared

    double edge_ema_alpha = 0.7;      // Weight of the newest edge test
    double edge_effect_min = 0.05;    // |relative effect| counted as real
    int edge_min_tests = 2;

    double response_sigma_default = 0.05;  // Before a pooled sigma exists
    double response_sigma_mult = 3.0;

    double noise_bits_cap = 2.0;      // Uncertainty from an unknown noise model
    double unresolved_bits = 1.0;     // Per open boolean question
    double assay_gate_bits = 0.5;     // Per assay gate not yet stable
    double drift_bits = 1.0;          // While the noise sigma is drifting

    void validate() const {
        gate.validate();
        assay_gate.validate();
        if (drift_k < 1 || drift_window < 2 * drift_k) {
            throw ConfigError("beliefs.drift_window", "must hold at least 2 * drift_k samples");
        }
        if (!(edge_ema_alpha > 0.0 && edge_ema_alpha <= 1.0)) {
            throw ConfigError("beliefs.edge_ema_alpha", "must be in (0, 1]");
        }
    }
};

// Everything the agent currently believes
struct Beliefs {
    // Noise model (pooled over vehicle center wells)
    double noise_df = 0.0;
    double noise_sse = 0.0;
    std::optional<double> noise_sigma;
    std::optional<double> noise_ci_low;
    std::optional<double> noise_ci_high;
    std::optional<double> noise_rel_width;
    std::optional<double> noise_drift;
    std::vector<double> noise_sigma_history;
    int64_t calibration_wells = 0;
    std::map<std::string, double> baseline_cv_by_channel;

    // Edge effects
    std::map<std::string, double> edge_effect_by_channel;
    int edge_tests = 0;
    bool edge_effect_resolved = false;
    bool edge_effect_confident = false;

    // Response shape, keyed "compound@<time>h" / "compound@<dose>uM"
    std::map<std::string, bool> dose_curvature;
    std::map<std::string, bool> time_dependence;
    bool dose_response_characterized = false;
    bool time_response_characterized = false;
    std::vector<std::string> tested_compounds;   // Sorted, unique

    // Per-assay pooled statistics
    std::map<std::string, double> assay_df;
    std::map<std::string, double> assay_sse;
    std::map<std::string, double> assay_rel_width;

    // Gates
    std::map<std::string, Gate> gates;

    // Accounting
    double debt_bits = 0.0;
    bool epistemic_insolvent = false;
    int consecutive_refusals = 0;
    int refusals_total = 0;
    int actions_executed = 0;
    int64_t wells_spent = 0;

    // Channels whose noise floor cannot be enforced -> reason
    std::map<std::string, std::string> snr_unobservable;

    json to_json() const {
        json gates_j = json::object();
        for (const auto& [name, g] : gates) gates_j[name] = g.to_json();
        return {
            {"noise_df", noise_df},
            {"noise_sse", finite_or_null(noise_sse)},
            {"noise_sigma", finite_or_null(noise_sigma)},
            {"noise_ci_low", finite_or_null(noise_ci_low)},
            {"noise_ci_high", finite_or_null(noise_ci_high)},
            {"noise_rel_width", finite_or_null(noise_rel_width)},
            {"noise_drift", finite_or_null(noise_drift)},
            {"calibration_wells", calibration_wells},
            {"baseline_cv_by_channel", baseline_cv_by_channel},
            {"edge_effect_by_channel", edge_effect_by_channel},
            {"edge_tests", edge_tests},
            {"edge_effect_resolved", edge_effect_resolved},
            {"edge_effect_confident", edge_effect_confident},
            {"dose_curvature", dose_curvature},
            {"time_dependence", time_dependence},
            {"dose_response_characterized", dose_response_characterized},
            {"time_response_characterized", time_response_characterized},
            {"tested_compounds", tested_compounds},
            {"assay_rel_width", assay_rel_width},
            {"gates", gates_j},
            {"debt_bits", finite_or_null(debt_bits)},
            {"epistemic_insolvent", epistemic_insolvent},
            {"consecutive_refusals", consecutive_refusals},
            {"refusals_total", refusals_total},
            {"actions_executed", actions_executed},
            {"wells_spent", wells_spent},
            {"snr_unobservable", snr_unobservable},
        };
    }
};

// Supporting data attached to a belief change
struct Support {
    json evidence = json::object();
    std::vector<std::string> conditions;
    std::string note;
    std::optional<double> claim_time_h;   // Timepoint the belief is about
};

namespace detail {

// Keeps the value parameter of set() out of template deduction
template <class T>
struct non_deduced { using type = T; };

template <class T>
json belief_value(const T& v) { return json(v); }
inline json belief_value(double v) { return finite_or_null(v); }
inline json belief_value(const std::optional<double>& v) { return finite_or_null(v); }

} // namespace detail

class BeliefState;

// Write lens over Beliefs, valid for one update or record call
class BeliefTransaction {
public:
    BeliefTransaction(const BeliefTransaction&) = delete;
    BeliefTransaction& operator=(const BeliefTransaction&) = delete;

    Cycle cycle() const;
    CycleKind cycle_kind() const { return kind_; }
    std::optional<double> evidence_time_h() const { return evidence_time_h_; }
    const Beliefs& beliefs() const;
    const BeliefConfig& config() const;

    // Sets a field; records evidence only when the value changes.
    // Returns true if the value changed.
    template <class T>
    bool set(T Beliefs::*field, const std::string& belief,
             typename detail::non_deduced<T>::type value, Support support = {});

    // Evaluates a named gate, creating it on first use. Emits the state
    // change plus gate_event:/gate_loss: records on entry/exit.
    GateTransition evaluate_gate(const std::string& name, const GateThresholds& thresholds,
                                 const GateInputs& inputs, Support support = {});

    void diagnostic(std::string type, json payload);

private:
    friend class BeliefState;

    BeliefTransaction(BeliefState& state, uint64_t id, std::optional<double> evidence_time_h,
                      CycleKind kind, std::vector<DiagnosticEvent>* diagnostics)
        : state_(state), id_(id), evidence_time_h_(evidence_time_h), kind_(kind),
          diagnostics_(diagnostics) {}

    void check_open(const std::string& belief) const;
    void emit(const std::string& belief, json prev, json next, Support support);

    BeliefState& state_;
    uint64_t id_;
    std::optional<double> evidence_time_h_;
    CycleKind kind_;
    std::vector<DiagnosticEvent>* diagnostics_;
};

// Shared capability of the ordered updater list
class BeliefUpdater {
public:
    virtual ~BeliefUpdater() = default;
    virtual const char* name() const = 0;
    virtual void update(BeliefTransaction& txn, const Observation& obs) = 0;
};

struct UpdateResult {
    size_t events = 0;                        // Evidence events added this update
    std::vector<DiagnosticEvent> diagnostics;
};

class BeliefState {
public:
    explicit BeliefState(BeliefConfig config = {},
                         std::vector<std::unique_ptr<BeliefUpdater>> updaters = {})
        : config_(std::move(config)), updaters_(std::move(updaters)) {
        config_.validate();
    }

    BeliefState(const BeliefState&) = delete;
    BeliefState& operator=(const BeliefState&) = delete;

    const Beliefs& beliefs() const { return beliefs_; }
    const BeliefConfig& config() const { return config_; }

    Cycle current_cycle() const { return current_; }
    Cycle last_cycle() const { return last_; }
    bool in_cycle() const { return in_cycle_; }
    CycleKind cycle_kind() const { return kind_; }
    const std::vector<EvidenceEvent>& pending() const { return pending_; }

    std::vector<std::string> updater_names() const {
        std::vector<std::string> out;
        for (const auto& u : updaters_) out.push_back(u->name());
        return out;
    }

    void begin_cycle(Cycle k, CycleKind kind = CycleKind::Science) {
        if (in_cycle_) {
            throw IntegrityViolation(k, "cycle", std::to_string(k),
                                     "cycle " + std::to_string(current_) + " was never ended");
        }
        if (k != last_ + 1) {
            throw IntegrityViolation(k, "cycle", std::to_string(k),
                                     "expected cycle " + std::to_string(last_ + 1));
        }
        current_ = k;
        last_ = k;
        kind_ = kind;
        in_cycle_ = true;
        updated_ = false;
        pending_.clear();
    }

    UpdateResult update(const Observation& obs, Cycle k) {
        require_cycle(k, "update");
        if (updated_) {
            throw IntegrityViolation(k, "update", obs.design_id, "cycle already updated");
        }
        updated_ = true;

        UpdateResult result;
        size_t before = pending_.size();
        agent_time_h_ = std::max(agent_time_h_, obs.evidence_time_h);

        BeliefTransaction txn(*this, ++txn_seq_, obs.evidence_time_h, obs.kind, &result.diagnostics);
        active_txn_ = txn.id_;

        record_unobservable_floors(txn, obs);
        for (const auto& d : obs.dropped) {
            txn.diagnostic("condition_dropped", {
                {"condition", d.condition}, {"n_wells", d.n_wells}, {"reason", d.reason}});
        }
        for (const auto& updater : updaters_) {
            log_debug("beliefs", "cycle %lld: %s", static_cast<long long>(k), updater->name());
            updater->update(txn, obs);
        }
        active_txn_ = 0;

        result.events = pending_.size() - before;
        return result;
    }

    std::vector<EvidenceEvent> end_cycle() {
        if (!in_cycle_) {
            throw IntegrityViolation(current_, "cycle", std::to_string(current_),
                                     "end_cycle without begin_cycle");
        }
        in_cycle_ = false;
        active_txn_ = 0;
        std::vector<EvidenceEvent> out;
        out.swap(pending_);
        return out;
    }

    void record_refusal(const std::string& reason, json context = json::object()) {
        auto txn = auxiliary("record_refusal");
        Support s;
        s.evidence = std::move(context);
        s.evidence["reason"] = reason;
        s.note = "action refused: " + reason;
        txn.set(&Beliefs::consecutive_refusals, "consecutive_refusals",
                beliefs_.consecutive_refusals + 1, s);
        txn.set(&Beliefs::refusals_total, "refusals_total", beliefs_.refusals_total + 1, s);
        active_txn_ = 0;
    }

    void record_action_executed(const std::string& template_name, size_t wells) {
        auto txn = auxiliary("record_action_executed");
        Support s;
        s.evidence = {{"template", template_name}, {"wells", wells}};
        s.note = "executed " + template_name;
        txn.set(&Beliefs::consecutive_refusals, "consecutive_refusals", 0, s);
        txn.set(&Beliefs::actions_executed, "actions_executed", beliefs_.actions_executed + 1, s);
        txn.set(&Beliefs::wells_spent, "wells_spent",
                beliefs_.wells_spent + static_cast<int64_t>(wells), s);
        active_txn_ = 0;
    }

    void update_debt_level(double debt_bits, double hard_threshold) {
        auto txn = auxiliary("update_debt_level");
        Support s;
        s.evidence = {{"debt_bits", finite_or_null(debt_bits)},
                      {"hard_threshold", hard_threshold}};
        txn.set(&Beliefs::debt_bits, "debt_bits", debt_bits, s);
        bool insolvent = debt_bits > hard_threshold;
        s.note = insolvent ? "debt above hard threshold" : "debt within threshold";
        txn.set(&Beliefs::epistemic_insolvent, "epistemic_insolvent", insolvent, s);
        active_txn_ = 0;
    }

    const Gate* gate(const std::string& name) const {
        auto it = beliefs_.gates.find(name);
        return it == beliefs_.gates.end() ? nullptr : &it->second;
    }

    GateState gate_state(const std::string& name) const {
        const Gate* g = gate(name);
        return g ? g->state() : GateState::NotObserved;
    }

    Regime regime() const { return regime_for(gate_state(NOISE_GATE)); }

    // Bits of open uncertainty:
    //   noise model: min(cap, log2(1 + rel_width / enter)), cap when unknown
    //   +unresolved_bits per open question (edge, dose shape, time shape)
    //   +assay_gate_bits per configured assay gate not stable
    //   +drift_bits while the drift metric is at or above the gate's drift limit
    double uncertainty_bits() const {
        double bits = config_.noise_bits_cap;
        if (beliefs_.noise_rel_width) {
            bits = std::min(config_.noise_bits_cap,
                            std::log2(1.0 + *beliefs_.noise_rel_width / config_.gate.enter));
        }
        if (beliefs_.noise_drift && *beliefs_.noise_drift >= config_.gate.drift) {
            bits += config_.drift_bits;
        }
        if (!beliefs_.edge_effect_resolved) bits += config_.unresolved_bits;
        if (!beliefs_.dose_response_characterized) bits += config_.unresolved_bits;
        if (!beliefs_.time_response_characterized) bits += config_.unresolved_bits;
        for (const auto& assay : config_.assay_gates) {
            if (gate_state(assay_gate_name(assay)) != GateState::Stable) {
                bits += config_.assay_gate_bits;
            }
        }
        return bits;
    }

    json to_json() const {
        json j = beliefs_.to_json();
        j["regime"] = regime_name(regime());
        j["uncertainty_bits"] = uncertainty_bits();
        j["last_cycle"] = last_;
        return j;
    }

private:
    friend class BeliefTransaction;

    void require_cycle(Cycle k, const char* op) const {
        if (!in_cycle_) {
            throw IntegrityViolation(k, op, std::to_string(k), "no cycle is open");
        }
        if (k != current_) {
            throw IntegrityViolation(k, op, std::to_string(k),
                                     "current cycle is " + std::to_string(current_));
        }
    }

    // Auxiliary records are dated at the latest measurement seen
    BeliefTransaction auxiliary(const char* op) {
        require_cycle(current_, op);
        uint64_t id = ++txn_seq_;
        active_txn_ = id;
        return BeliefTransaction(*this, id, agent_time_h_, kind_, nullptr);
    }

    void record_unobservable_floors(BeliefTransaction& txn, const Observation& obs) {
        auto it = obs.snr_summary.find("disabled_channels");
        if (it == obs.snr_summary.end() || !it->is_array()) return;
        auto next = beliefs_.snr_unobservable;
        std::vector<std::string> added;
        for (const auto& ch : *it) {
            auto name = ch.get<std::string>();
            if (next.count(name)) continue;
            std::string reason = "floor not observable";
            auto reasons = obs.snr_summary.find("disabled_reasons");
            if (reasons != obs.snr_summary.end() && reasons->contains(name)) {
                reason = (*reasons)[name].get<std::string>();
            }
            next[name] = reason;
            added.push_back(name);
        }
        if (added.empty()) return;
        for (const auto& ch : added) {
            Support s;
            s.evidence = {{"channel", ch}, {"reason", next[ch]}};
            s.note = "SNR filter disabled for " + ch;
            txn.emit("snr_floor_unobservable:" + ch, false, true, s);
        }
        beliefs_.snr_unobservable = std::move(next);
    }

    BeliefConfig config_;
    std::vector<std::unique_ptr<BeliefUpdater>> updaters_;
    Beliefs beliefs_;

    Cycle current_ = 0;
    Cycle last_ = 0;
    CycleKind kind_ = CycleKind::Science;
    bool in_cycle_ = false;
    bool updated_ = false;
    double agent_time_h_ = 0.0;
    uint64_t txn_seq_ = 0;
    uint64_t active_txn_ = 0;
    std::vector<EvidenceEvent> pending_;
};

// ============================================================================
// BeliefTransaction
// ============================================================================

inline Cycle BeliefTransaction::cycle() const { return state_.current_; }
inline const Beliefs& BeliefTransaction::beliefs() const { return state_.beliefs_; }
inline const BeliefConfig& BeliefTransaction::config() const { return state_.config_; }

inline void BeliefTransaction::check_open(const std::string& belief) const {
    if (!state_.in_cycle_ || state_.active_txn_ != id_) {
        throw IntegrityViolation(state_.current_, belief, "",
                                 "belief written outside its update transaction");
    }
}

inline void BeliefTransaction::emit(const std::string& belief, json prev, json next,
                                    Support support) {
    check_open(belief);
    EvidenceEvent e;
    e.cycle = state_.current_;
    e.belief = belief;
    e.prev = std::move(prev);
    e.next = std::move(next);
    e.evidence = std::move(support.evidence);
    e.supporting_conditions = std::move(support.conditions);
    e.note = std::move(support.note);
    e.evidence_time_h = evidence_time_h_;
    e.claim_time_h = support.claim_time_h;
    e.cycle_kind = kind_;
    validate_temporal_provenance(e);
    state_.pending_.push_back(std::move(e));
}

template <class T>
bool BeliefTransaction::set(T Beliefs::*field, const std::string& belief,
                            typename detail::non_deduced<T>::type value, Support support) {
    check_open(belief);
    T& slot = state_.beliefs_.*field;
    if (slot == value) return false;
    json prev = detail::belief_value(slot);
    json next = detail::belief_value(value);
    // Validate before the write so a rejected event leaves the field untouched
    emit(belief, std::move(prev), std::move(next), std::move(support));
    slot = std::move(value);
    return true;
}

inline GateTransition BeliefTransaction::evaluate_gate(const std::string& name,
                                                       const GateThresholds& thresholds,
                                                       const GateInputs& inputs,
                                                       Support support) {
    check_open("gate:" + name);
    auto& gates = state_.beliefs_.gates;
    auto it = gates.find(name);
    Gate candidate = it == gates.end() ? Gate(name, thresholds) : it->second;
    GateState before = candidate.state();
    GateTransition t = candidate.evaluate(inputs);

    support.evidence["rel_width"] = finite_or_null(inputs.rel_width);
    support.evidence["df"] = inputs.df;
    support.evidence["drift"] = finite_or_null(inputs.drift);
    support.evidence["streak"] = candidate.streak();
    support.evidence["thresholds"] = thresholds.to_json();

    if (candidate.state() != before) {
        Support state_support = support;
        state_support.note = std::string(gate_state_name(before)) + " -> " +
                             gate_state_name(candidate.state());
        emit("gate:" + name, gate_state_name(before), gate_state_name(candidate.state()),
             state_support);
    }
    if (t == GateTransition::Entered) {
        Support s = support;
        s.claim_time_h.reset();
        s.note = "gate earned: " + name;
        emit("gate_event:" + name, false, true, s);
        log_info("gate", "cycle %lld: %s stable", static_cast<long long>(state_.current_),
                 name.c_str());
    } else if (t == GateTransition::Exited) {
        Support s = support;
        s.claim_time_h.reset();
        s.note = "gate lost: " + name;
        emit("gate_loss:" + name, true, false, s);
        log_warn("gate", "cycle %lld: %s revoked", static_cast<long long>(state_.current_),
                 name.c_str());
    }
    gates[name] = candidate;
    return t;
}

inline void BeliefTransaction::diagnostic(std::string type, json payload) {
    check_open("diagnostic:" + type);
    if (!diagnostics_) return;
    diagnostics_->push_back(DiagnosticEvent{state_.current_, std::move(type), std::move(payload)});
}

} // namespace episteme
