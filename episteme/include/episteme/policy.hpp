#pragma once
// Template policy: which experiment to propose next
//
//   pre_gate / gate_revoked     calibration (baseline replicates)
//   hard block last cycle       calibration, forced
//   budget refusal last cycle   calibration, forced
//   in_gate                     first open question, in order:
//                                 edge_center_test   edge effect unresolved
//                                 ldh_baseline       LDH assay gate not stable
//                                 dose_ladder        dose shape unknown
//                                 time_course        time shape unknown
//                                 dose_ladder        next untested compound
//                               with a calibration recheck after `horizon`
//                               exploration cycles in a row
//
// The policy never decides refusal; that is the debt ledger's job.

#include "belief_state.hpp"
#include "errors.hpp"
#include "observation.hpp"
#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace episteme {

struct PolicyConfig {
    std::string cell_line = "A549";
    std::string calibration_template = "baseline_replicates";
    std::vector<std::string> compounds = {"tunicamycin", "staurosporine", "nocodazole"};
    std::vector<double> ladder_doses_uM = {0.1, 0.3, 1.0, 3.0, 10.0};
    double ladder_time_h = 24.0;
    std::vector<double> course_times_h = {6.0, 12.0, 24.0, 48.0};
    double course_dose_uM = 1.0;
    int replicates = 3;
    int baseline_wells = 12;
    double baseline_time_h = 12.0;

    // Bits each template claims it will teach
    std::map<std::string, double> expected_gain_bits = {
        {"baseline_replicates", 0.3},
        {"edge_center_test", 0.8},
        {"ldh_baseline", 0.5},
        {"dose_ladder", 1.0},
        {"time_course", 0.8},
    };

    void validate() const {
        if (compounds.empty()) throw ConfigError("policy.compounds", "at least one compound is required");
        if (replicates < 2) throw ConfigError("policy.replicates", "must be >= 2");
        if (baseline_wells < 2) throw ConfigError("policy.baseline_wells", "must be >= 2");
        if (ladder_doses_uM.size() < 3) throw ConfigError("policy.ladder_doses_uM", "need at least 3 doses");
        if (course_times_h.size() < 3) throw ConfigError("policy.course_times_h", "need at least 3 timepoints");
        for (const auto& [name, bits] : expected_gain_bits) {
            if (bits < 0.0) throw ConfigError("policy.expected_gain_bits." + name, "must be >= 0");
        }
    }

    double expected_gain(const std::string& template_name) const {
        auto it = expected_gain_bits.find(template_name);
        return it == expected_gain_bits.end() ? 0.0 : it->second;
    }
};

// What the policy knows about recent history
struct PolicyContext {
    Cycle cycle = 0;
    std::string last_refusal_reason;     // Empty if the last cycle was not refused
    int exploration_streak = 0;          // Exploration cycles since last calibration
    int horizon = 3;                     // From the horizon policy
    uint64_t layout_seed = 0;
};

struct PolicyDecision {
    Proposal proposal;
    std::string reason;
    json candidates = json::array();
};

// What the loop asks of a policy
class Proposer {
public:
    virtual ~Proposer() = default;
    virtual const char* name() const = 0;
    virtual PolicyDecision propose(const BeliefState& state, const PolicyContext& ctx) const = 0;
    virtual double expected_gain(const std::string& template_name) const = 0;
    // Wells of the smallest proposal this policy can make
    virtual size_t cheapest_wells() const = 0;
};

class TemplatePolicy : public Proposer {
public:
    explicit TemplatePolicy(PolicyConfig config = {}) : config_(std::move(config)) {
        config_.validate();
    }

    const char* name() const override { return "template"; }
    const PolicyConfig& config() const { return config_; }

    double expected_gain(const std::string& template_name) const override {
        return config_.expected_gain(template_name);
    }

    size_t cheapest_wells() const override {
        static const char* templates[] = {"baseline_replicates", "ldh_baseline", "edge_center_test",
                                          "dose_ladder", "time_course"};
        size_t cheapest = wells_for(config_.calibration_template, config_.compounds.front()).size();
        for (const char* t : templates) {
            cheapest = std::min(cheapest, wells_for(t, config_.compounds.front()).size());
        }
        return cheapest;
    }

    // Wells of a template; compound is ignored by the vehicle-only templates
    std::vector<WellSpec> wells_for(const std::string& template_name,
                                    const std::string& compound) const {
        std::vector<WellSpec> wells;
        auto vehicle = [&](Position pos, const std::string& assay) {
            WellSpec w;
            w.cell_line = config_.cell_line;
            w.compound = "DMSO";
            w.dose_uM = 0.0;
            w.time_h = config_.baseline_time_h;
            w.assay = assay;
            w.position = pos;
            return w;
        };

        if (template_name == config_.calibration_template || template_name == "baseline_replicates") {
            for (int i = 0; i < config_.baseline_wells; ++i) {
                wells.push_back(vehicle(Position::Center, "cell_painting"));
            }
        } else if (template_name == "ldh_baseline") {
            for (int i = 0; i < config_.baseline_wells; ++i) {
                wells.push_back(vehicle(Position::Center, "ldh"));
            }
        } else if (template_name == "edge_center_test") {
            int half = config_.baseline_wells / 2;
            for (int i = 0; i < half; ++i) wells.push_back(vehicle(Position::Edge, "cell_painting"));
            for (int i = 0; i < half; ++i) wells.push_back(vehicle(Position::Center, "cell_painting"));
        } else if (template_name == "dose_ladder") {
            for (double dose : config_.ladder_doses_uM) {
                for (int r = 0; r < config_.replicates; ++r) {
                    WellSpec w;
                    w.cell_line = config_.cell_line;
                    w.compound = compound;
                    w.dose_uM = dose;
                    w.time_h = config_.ladder_time_h;
                    wells.push_back(w);
                }
            }
        } else if (template_name == "time_course") {
            for (double t : config_.course_times_h) {
                for (int r = 0; r < config_.replicates; ++r) {
                    WellSpec w;
                    w.cell_line = config_.cell_line;
                    w.compound = compound;
                    w.dose_uM = config_.course_dose_uM;
                    w.time_h = t;
                    wells.push_back(w);
                }
            }
        } else {
            throw ConfigError("policy.template", "unknown template " + template_name);
        }
        return wells;
    }

    std::string next_compound(const Beliefs& b) const {
        for (const auto& c : config_.compounds) {
            if (!std::binary_search(b.tested_compounds.begin(), b.tested_compounds.end(), c)) {
                return c;
            }
        }
        return config_.compounds.front();
    }

    bool has_untested_compound(const Beliefs& b) const {
        return std::any_of(config_.compounds.begin(), config_.compounds.end(), [&](const std::string& c) {
            return !std::binary_search(b.tested_compounds.begin(), b.tested_compounds.end(), c);
        });
    }

    PolicyDecision propose(const BeliefState& state, const PolicyContext& ctx) const override {
        const Beliefs& b = state.beliefs();
        Regime regime = state.regime();
        PolicyDecision d;

        auto calibrate = [&](const std::string& why, bool forced) {
            d.reason = why;
            d.proposal = build(config_.calibration_template, next_compound(b), regime, ctx);
            d.proposal.forced = forced;
            d.candidates.push_back({{"template", config_.calibration_template}, {"why", why}});
            return d;
        };

        if (regime != Regime::InGate) {
            return calibrate(regime == Regime::GateRevoked ? "noise gate revoked"
                                                           : "noise gate not yet stable",
                             regime == Regime::GateRevoked);
        }
        if (ctx.last_refusal_reason == "epistemic_debt_action_blocked") {
            return calibrate("recover from epistemic debt", true);
        }
        if (ctx.last_refusal_reason == "epistemic_debt_budget_exceeded") {
            return calibrate("last proposal unaffordable", true);
        }
        if (ctx.exploration_streak >= ctx.horizon) {
            return calibrate("horizon reached, recheck noise model", false);
        }

        std::vector<std::pair<std::string, std::string>> open;
        if (!b.edge_effect_resolved) open.emplace_back("edge_center_test", "edge effect unresolved");
        if (state.gate_state(assay_gate_name("ldh")) != GateState::Stable &&
            std::find(state.config().assay_gates.begin(), state.config().assay_gates.end(), "ldh") !=
                state.config().assay_gates.end()) {
            open.emplace_back("ldh_baseline", "LDH assay gate not stable");
        }
        if (!b.dose_response_characterized) open.emplace_back("dose_ladder", "dose response unknown");
        if (!b.time_response_characterized) open.emplace_back("time_course", "time response unknown");
        if (has_untested_compound(b)) open.emplace_back("dose_ladder", "untested compound");

        for (const auto& [tmpl, why] : open) {
            d.candidates.push_back({{"template", tmpl}, {"why", why},
                                    {"expected_gain_bits", config_.expected_gain(tmpl)}});
        }
        if (open.empty()) {
            return calibrate("no open questions", false);
        }

        d.reason = open.front().second;
        d.proposal = build(open.front().first, next_compound(b), regime, ctx);
        return d;
    }

    Proposal build(const std::string& template_name, const std::string& compound, Regime regime,
                   const PolicyContext& ctx) const {
        Proposal p;
        p.template_name = template_name;
        p.wells = wells_for(template_name, compound);
        p.regime = regime_name(regime);
        p.layout_seed = ctx.layout_seed;
        p.kind = CycleKind::Science;
        bool uses_compound = template_name == "dose_ladder" || template_name == "time_course";
        p.hypothesis = uses_compound ? compound + " " + template_name : template_name;
        p.design_id = "c" + std::to_string(ctx.cycle) + "-" + template_name +
                      (uses_compound ? "-" + compound : std::string());
        return p;
    }

private:
    PolicyConfig config_;
};

} // namespace episteme
