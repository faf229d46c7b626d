#pragma once
// Spatial QC and mitigation
//
// After each science cycle the plate layout is checked for spatial
// autocorrelation (Moran's I, rook adjacency, per plate, max over
// plates). Wells whose reading is unknown are left out.
//
// If I exceeds flag_threshold the agent picks one of:
//   replate    same wells, new deterministic layout seed
//   replicate  the same design with every well doubled
//   proceed    keep the data, pay an explicit reward penalty
// The corrective choice is deferred as a MitigationContext and runs as
// the whole of the next integer cycle. Mitigation cycles never schedule
// further mitigation.

#include "errors.hpp"
#include "observation.hpp"
#include "statistics.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

enum class MitigationAction : uint8_t {
    None = 0,
    Replate = 1,
    Replicate = 2,
    Proceed = 3,
};

inline const char* mitigation_action_name(MitigationAction a) {
    switch (a) {
        case MitigationAction::None:      return "none";
        case MitigationAction::Replate:   return "replate";
        case MitigationAction::Replicate: return "replicate";
        case MitigationAction::Proceed:   return "proceed";
    }
    return "unknown";
}

inline MitigationAction mitigation_action_from_name(const std::string& s) {
    if (s == "replate") return MitigationAction::Replate;
    if (s == "replicate") return MitigationAction::Replicate;
    if (s == "proceed") return MitigationAction::Proceed;
    return MitigationAction::None;
}

struct SpatialQcConfig {
    double flag_threshold = 0.3;          // Moran's I above this flags the plate
    double severe_threshold = 0.5;        // Above this, replate instead of replicate
    double proceed_penalty = 0.5;         // Reward penalty for keeping flagged data
    double min_budget_wells = 48.0;       // Half a plate; below this no correction
    size_t min_wells = 8;                 // Fewer known wells: not assessable
    double replate_reduction = 0.8;       // Expected fraction of I removed
    double replicate_reduction = 0.4;

    void validate() const {
        if (!(severe_threshold >= flag_threshold)) {
            throw ConfigError("spatial_qc.severe_threshold", "must be >= flag_threshold");
        }
        if (proceed_penalty < 0.0) throw ConfigError("spatial_qc.proceed_penalty", "must be >= 0");
    }

    json to_json() const {
        return {
            {"flag_threshold", flag_threshold},
            {"severe_threshold", severe_threshold},
            {"proceed_penalty", proceed_penalty},
            {"min_budget_wells", min_budget_wells},
            {"min_wells", min_wells},
        };
    }
};

struct SpatialQcResult {
    std::optional<double> morans_i;       // Max over plates
    int worst_plate = -1;
    size_t wells_used = 0;
    size_t wells_unknown = 0;
    bool flagged = false;

    json to_json() const {
        return {
            {"morans_i", finite_or_null(morans_i)},
            {"worst_plate", worst_plate},
            {"wells_used", wells_used},
            {"wells_unknown", wells_unknown},
            {"flagged", flagged},
        };
    }
};

inline SpatialQcResult run_spatial_qc(const Observation& obs, const SpatialQcConfig& cfg) {
    SpatialQcResult r;
    std::map<int, std::vector<stats::GridPoint>> plates;
    for (const auto& w : obs.layout) {
        auto v = w.value.get();
        if (!v) {
            ++r.wells_unknown;
            continue;
        }
        plates[w.plate].push_back({w.row, w.col, *v});
        ++r.wells_used;
    }
    for (const auto& [plate, points] : plates) {
        if (points.size() < cfg.min_wells) continue;
        auto i = stats::morans_i(points);
        if (!i) continue;
        if (!r.morans_i || *i > *r.morans_i) {
            r.morans_i = i;
            r.worst_plate = plate;
        }
    }
    r.flagged = r.morans_i && *r.morans_i > cfg.flag_threshold;
    return r;
}

struct MitigationCandidate {
    MitigationAction action = MitigationAction::None;
    double cost_wells = 0.0;
    double inflated_cost = 0.0;                 // What the budget is charged
    std::optional<double> expected_statistic;   // Moran's I expected afterwards
    double penalty = 0.0;
    bool affordable = true;

    json to_json() const {
        return {
            {"action", mitigation_action_name(action)},
            {"cost_wells", cost_wells},
            {"inflated_cost", inflated_cost},
            {"expected_statistic", finite_or_null(expected_statistic)},
            {"penalty", penalty},
            {"affordable", affordable},
        };
    }
};

struct MitigationChoice {
    MitigationAction action = MitigationAction::None;
    std::string rationale;
    double penalty = 0.0;                 // Applied now, only for proceed
    std::vector<MitigationCandidate> candidates;

    bool corrective() const {
        return action == MitigationAction::Replate || action == MitigationAction::Replicate;
    }

    json to_json() const {
        json c = json::array();
        for (const auto& m : candidates) c.push_back(m.to_json());
        return {
            {"action", mitigation_action_name(action)},
            {"rationale", rationale},
            {"penalty", penalty},
            {"candidates", c},
        };
    }
};

// cost_multiplier is the debt ledger's current inflation, get_inflated_cost(1)
inline std::vector<MitigationCandidate> mitigation_candidates(const SpatialQcResult& qc,
                                                              const Proposal& previous,
                                                              double budget_remaining,
                                                              const SpatialQcConfig& cfg,
                                                              double cost_multiplier = 1.0) {
    double i = qc.morans_i ? *qc.morans_i : 0.0;
    double wells = static_cast<double>(previous.cost_wells());

    MitigationCandidate replate;
    replate.action = MitigationAction::Replate;
    replate.cost_wells = wells;
    replate.inflated_cost = wells * cost_multiplier;
    replate.expected_statistic = i * (1.0 - cfg.replate_reduction);
    replate.affordable = replate.inflated_cost <= budget_remaining;

    MitigationCandidate replicate;
    replicate.action = MitigationAction::Replicate;
    replicate.cost_wells = 2.0 * wells;
    replicate.inflated_cost = replicate.cost_wells * cost_multiplier;
    replicate.expected_statistic = i * (1.0 - cfg.replicate_reduction);
    replicate.affordable = replicate.inflated_cost <= budget_remaining;

    MitigationCandidate proceed;
    proceed.action = MitigationAction::Proceed;
    proceed.expected_statistic = i;
    proceed.penalty = cfg.proceed_penalty;

    return {replate, replicate, proceed};
}

inline MitigationChoice choose_mitigation(const SpatialQcResult& qc, const Proposal& previous,
                                          double budget_remaining, const SpatialQcConfig& cfg,
                                          double cost_multiplier = 1.0) {
    MitigationChoice choice;
    char buf[160];
    if (!qc.flagged) {
        choice.rationale = "no spatial QC flag";
        return choice;
    }

    choice.candidates = mitigation_candidates(qc, previous, budget_remaining, cfg, cost_multiplier);
    const auto& replate = choice.candidates[0];
    const auto& replicate = choice.candidates[1];
    double i = *qc.morans_i;

    auto proceed = [&](const char* why) {
        choice.action = MitigationAction::Proceed;
        choice.penalty = cfg.proceed_penalty;
        std::snprintf(buf, sizeof(buf), "%s (I=%.3f, budget=%.1f wells)", why, i, budget_remaining);
        choice.rationale = buf;
    };

    if (budget_remaining < cfg.min_budget_wells) {
        proceed("insufficient budget for correction");
        return choice;
    }

    bool severe = i > cfg.severe_threshold;
    if (severe && replate.affordable) {
        choice.action = MitigationAction::Replate;
        std::snprintf(buf, sizeof(buf), "severe spatial correlation (I=%.3f)", i);
    } else if (!severe && replicate.affordable) {
        choice.action = MitigationAction::Replicate;
        std::snprintf(buf, sizeof(buf), "moderate spatial correlation (I=%.3f)", i);
    } else if (replate.affordable) {
        choice.action = MitigationAction::Replate;
        std::snprintf(buf, sizeof(buf), "spatial correlation (I=%.3f), replicate unaffordable", i);
    } else {
        proceed("corrective actions unaffordable");
        return choice;
    }
    choice.rationale = buf;
    return choice;
}

// Deferred corrective action; consumed at exactly cycle_flagged + 1
struct MitigationContext {
    Cycle cycle_flagged = 0;
    double statistic_before = 0.0;
    MitigationAction action = MitigationAction::None;
    std::string rationale;
    Proposal previous_proposal;

    json to_json() const {
        return {
            {"cycle_flagged", cycle_flagged},
            {"statistic_before", statistic_before},
            {"action", mitigation_action_name(action)},
            {"rationale", rationale},
            {"previous_proposal", previous_proposal.to_json()},
        };
    }

    static MitigationContext from_json(const json& j) {
        MitigationContext m;
        m.cycle_flagged = j.at("cycle_flagged").get<Cycle>();
        m.statistic_before = j.value("statistic_before", 0.0);
        m.action = mitigation_action_from_name(j.value("action", ""));
        m.rationale = j.value("rationale", "");
        m.previous_proposal = Proposal::from_json(j.at("previous_proposal"));
        return m;
    }
};

inline std::string mitigation_template(MitigationAction a) {
    return std::string("mitigation_") + mitigation_action_name(a);
}

// Builds the corrective proposal for cycle `executing`
inline Proposal make_mitigation_proposal(const MitigationContext& ctx, Cycle executing,
                                         uint64_t layout_seed) {
    if (!(ctx.cycle_flagged < executing)) {
        throw IntegrityViolation(executing, "mitigation.cycle_flagged",
                                 std::to_string(ctx.cycle_flagged),
                                 "mitigation must execute after the cycle that flagged it");
    }
    Proposal p;
    p.kind = CycleKind::Mitigation;
    p.template_name = mitigation_template(ctx.action);
    p.hypothesis = "spatial artifact in " + ctx.previous_proposal.design_id;
    p.regime = ctx.previous_proposal.regime;
    p.design_id = "c" + std::to_string(executing) + "-" + mitigation_action_name(ctx.action) +
                  "-" + ctx.previous_proposal.design_id;

    switch (ctx.action) {
        case MitigationAction::Replate:
            p.wells = ctx.previous_proposal.wells;
            p.layout_seed = layout_seed;
            break;
        case MitigationAction::Replicate:
            p.wells = ctx.previous_proposal.wells;
            p.wells.insert(p.wells.end(), ctx.previous_proposal.wells.begin(),
                           ctx.previous_proposal.wells.end());
            p.layout_seed = ctx.previous_proposal.layout_seed;
            break;
        default:
            throw IntegrityViolation(executing, "mitigation.action",
                                     mitigation_action_name(ctx.action),
                                     "only replate or replicate can be deferred");
    }
    return p;
}

} // namespace episteme
