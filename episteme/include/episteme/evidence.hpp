#pragma once
// Durable records: evidence, refusals, decisions, diagnostics
//
// Every record serializes to one JSON object carrying:
//   kind            discriminator ("evidence", "refusal", "decision", "diagnostic")
//   schema_version  EPISTEME_SCHEMA_VERSION
//   cycle           integer cycle the record belongs to
//
// Evidence records also carry the temporal provenance pair:
//   evidence_time_h  when the supporting measurement was taken (required)
//   claim_time_h     which timepoint the belief is about (null = atemporal)
// Admissibility: evidence_time_h present, and >= claim_time_h when both set.
// Exempt beliefs (state-transition facts) need no evidence time.

#include "errors.hpp"
#include "observation.hpp"
#include "types.hpp"
#include "version.hpp"
#include <optional>
#include <string>
#include <vector>

namespace episteme {

// Prefixes of beliefs that record a fact about the agent, not a measurement
inline const std::vector<std::string>& exempt_belief_prefixes() {
    static const std::vector<std::string> prefixes = {
        "gate_event:",
        "gate_loss:",
        "snr_floor_unobservable:",
    };
    return prefixes;
}

inline bool is_exempt_belief(const std::string& belief) {
    if (belief == "epistemic_insolvent") return true;
    for (const auto& prefix : exempt_belief_prefixes()) {
        if (belief.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

struct EvidenceEvent {
    Cycle cycle = 0;
    std::string belief;
    json prev;
    json next;
    json evidence = json::object();
    std::vector<std::string> supporting_conditions;
    std::string note;
    std::optional<double> evidence_time_h;
    std::optional<double> claim_time_h;
    CycleKind cycle_kind = CycleKind::Science;

    json to_json() const {
        return {
            {"kind", "evidence"},
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"cycle", cycle},
            {"belief", belief},
            {"prev", prev},
            {"new", next},
            {"evidence", evidence},
            {"supporting_conditions", supporting_conditions},
            {"note", note.empty() ? json(nullptr) : json(note)},
            {"evidence_time_h", finite_or_null(evidence_time_h)},
            {"claim_time_h", finite_or_null(claim_time_h)},
            {"cycle_kind", cycle_kind_name(cycle_kind)},
        };
    }

    static EvidenceEvent from_json(const json& j) {
        EvidenceEvent e;
        e.cycle = j.value("cycle", Cycle{0});
        e.belief = j.value("belief", "");
        e.prev = j.value("prev", json());
        e.next = j.value("new", json());
        e.evidence = j.value("evidence", json::object());
        if (j.contains("supporting_conditions") && j["supporting_conditions"].is_array()) {
            e.supporting_conditions = j["supporting_conditions"].get<std::vector<std::string>>();
        }
        if (j.contains("note") && j["note"].is_string()) e.note = j["note"].get<std::string>();
        e.evidence_time_h = optional_double(j, "evidence_time_h");
        e.claim_time_h = optional_double(j, "claim_time_h");
        e.cycle_kind = j.value("cycle_kind", std::string("science")) == "mitigation"
                           ? CycleKind::Mitigation : CycleKind::Science;
        return e;
    }
};

// Throws TemporalProvenanceError; never repairs the record
inline void validate_temporal_provenance(const EvidenceEvent& e) {
    if (is_exempt_belief(e.belief)) return;
    if (!e.evidence_time_h) {
        throw TemporalProvenanceError(e.cycle, e.belief, "evidence_time_h is required",
                                      e.evidence_time_h, e.claim_time_h);
    }
    if (e.claim_time_h && *e.evidence_time_h < *e.claim_time_h) {
        throw TemporalProvenanceError(e.cycle, e.belief,
                                      "evidence predates the timepoint it claims about",
                                      e.evidence_time_h, e.claim_time_h);
    }
}

struct RefusalEvent {
    Cycle cycle = 0;
    CycleKind cycle_kind = CycleKind::Science;
    std::string reason;               // epistemic_debt_action_blocked, ...
    std::string proposed_template;
    std::string proposed_hypothesis;
    size_t proposed_wells = 0;
    std::string regime;
    double debt_bits = 0.0;
    double base_cost = 0.0;
    double inflated_cost = 0.0;
    double budget_remaining = 0.0;
    double debt_threshold = 0.0;
    bool blocked_by_cost = false;     // Soft rule fired
    bool blocked_by_threshold = false;// Hard rule fired
    bool is_calibration = false;
    int consecutive_refusals = 0;

    json to_json() const {
        return {
            {"kind", "refusal"},
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"cycle", cycle},
            {"cycle_kind", cycle_kind_name(cycle_kind)},
            {"refusal_reason", reason},
            {"proposed_template", proposed_template},
            {"proposed_hypothesis", proposed_hypothesis},
            {"proposed_wells", proposed_wells},
            {"regime", regime},
            {"debt_bits", finite_or_null(debt_bits)},
            {"base_cost", finite_or_null(base_cost)},
            {"inflated_cost", finite_or_null(inflated_cost)},
            {"budget_remaining", finite_or_null(budget_remaining)},
            {"debt_threshold", finite_or_null(debt_threshold)},
            {"blocked_by_cost", blocked_by_cost},
            {"blocked_by_threshold", blocked_by_threshold},
            {"is_calibration", is_calibration},
            {"consecutive_refusals", consecutive_refusals},
        };
    }
};

// What the loop did with a cycle, refused or not
struct DecisionEvent {
    Cycle cycle = 0;
    CycleKind cycle_kind = CycleKind::Science;
    std::string outcome;              // executed, refused, mitigation
    std::string template_name;
    std::string design_id;
    std::string action_id;
    std::string regime;
    std::string reason;
    bool forced = false;
    json candidates = json::array();
    double base_cost = 0.0;
    double inflated_cost = 0.0;
    double budget_before = 0.0;
    double budget_after = 0.0;
    double debt_bits = 0.0;
    json reward = nullptr;            // Breakdown for executed cycles

    json to_json() const {
        return {
            {"kind", "decision"},
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"cycle", cycle},
            {"cycle_kind", cycle_kind_name(cycle_kind)},
            {"outcome", outcome},
            {"template", template_name},
            {"design_id", design_id},
            {"action_id", action_id},
            {"regime", regime},
            {"reason", reason},
            {"forced", forced},
            {"candidates", candidates},
            {"base_cost", finite_or_null(base_cost)},
            {"inflated_cost", finite_or_null(inflated_cost)},
            {"budget_before", finite_or_null(budget_before)},
            {"budget_after", finite_or_null(budget_after)},
            {"debt_bits", finite_or_null(debt_bits)},
            {"reward", reward},
        };
    }
};

// Free-form operational record: noise diagnostics, SNR summaries,
// spatial QC outcomes, debt repayment, run lifecycle
struct DiagnosticEvent {
    Cycle cycle = 0;
    std::string type;
    json payload = json::object();

    json to_json() const {
        json j = {
            {"kind", "diagnostic"},
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"cycle", cycle},
            {"type", type},
        };
        for (const auto& [k, v] : payload.items()) {
            if (!j.contains(k)) j[k] = v;
        }
        return j;
    }
};

} // namespace episteme
