#pragma once
// Proposals, raw well results and aggregated observations
//
// A Proposal is what the loop asks the world to run. The world answers
// with one RawWellResult per requested well, in request order. The
// aggregator folds those into an Observation: one ConditionSummary per
// canonical condition (first-appearance order) plus the plate layout
// used by spatial QC.
//
// Condition key: cell_line/compound@<dose>uM/<time>h/assay/position

#include "types.hpp"
#include <cstdio>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace episteme {

enum class Position : uint8_t {
    Center = 0,
    Edge = 1,
};

inline const char* position_name(Position p) {
    return p == Position::Edge ? "edge" : "center";
}

inline Position position_from_name(const std::string& s) {
    return s == "edge" ? Position::Edge : Position::Center;
}

// Science cycles run the policy's proposal; mitigation cycles run the
// corrective action deferred from the previous cycle
enum class CycleKind : uint8_t {
    Science = 0,
    Mitigation = 1,
};

inline const char* cycle_kind_name(CycleKind k) {
    return k == CycleKind::Mitigation ? "mitigation" : "science";
}

// Compact decimal for keys: 0, 0.1, 10, 12.5
inline std::string format_number(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

struct WellSpec {
    std::string cell_line = "A549";
    std::string compound = "DMSO";
    double dose_uM = 0.0;
    double time_h = 12.0;
    std::string assay = "cell_painting";
    Position position = Position::Center;

    bool is_vehicle() const { return compound == "DMSO" && dose_uM == 0.0; }

    json to_json() const {
        return {
            {"cell_line", cell_line},
            {"compound", compound},
            {"dose_uM", dose_uM},
            {"time_h", time_h},
            {"assay", assay},
            {"position", position_name(position)},
        };
    }

    static WellSpec from_json(const json& j) {
        WellSpec w;
        w.cell_line = j.value("cell_line", w.cell_line);
        w.compound = j.value("compound", w.compound);
        w.dose_uM = j.value("dose_uM", w.dose_uM);
        w.time_h = j.value("time_h", w.time_h);
        w.assay = j.value("assay", w.assay);
        w.position = position_from_name(j.value("position", std::string("center")));
        return w;
    }
};

struct ConditionKey {
    std::string cell_line;
    std::string compound;
    double dose_uM = 0.0;
    double time_h = 0.0;
    std::string assay;
    Position position = Position::Center;

    static ConditionKey of(const WellSpec& w) {
        return {w.cell_line, w.compound, w.dose_uM, w.time_h, w.assay, w.position};
    }

    std::string str() const {
        return cell_line + "/" + compound + "@" + format_number(dose_uM) + "uM/" +
               format_number(time_h) + "h/" + assay + "/" + position_name(position);
    }

    bool operator<(const ConditionKey& o) const {
        return std::tie(cell_line, compound, dose_uM, time_h, assay, position) <
               std::tie(o.cell_line, o.compound, o.dose_uM, o.time_h, o.assay, o.position);
    }
    bool operator==(const ConditionKey& o) const {
        return !(*this < o) && !(o < *this);
    }
};

struct Proposal {
    std::string design_id;
    std::string template_name;
    std::string hypothesis;
    std::vector<WellSpec> wells;
    uint64_t layout_seed = 0;
    bool forced = false;           // Chosen because nothing else was allowed
    std::string regime;            // Gate regime at proposal time
    CycleKind kind = CycleKind::Science;

    size_t cost_wells() const { return wells.size(); }

    json to_json() const {
        json wells_j = json::array();
        for (const auto& w : wells) wells_j.push_back(w.to_json());
        return {
            {"design_id", design_id},
            {"template", template_name},
            {"hypothesis", hypothesis},
            {"wells", wells_j},
            {"layout_seed", layout_seed},
            {"forced", forced},
            {"regime", regime},
            {"cycle_kind", cycle_kind_name(kind)},
        };
    }

    static Proposal from_json(const json& j) {
        Proposal p;
        p.design_id = j.value("design_id", "");
        p.template_name = j.value("template", "");
        p.hypothesis = j.value("hypothesis", "");
        if (j.contains("wells")) {
            for (const auto& w : j["wells"]) p.wells.push_back(WellSpec::from_json(w));
        }
        p.layout_seed = j.value("layout_seed", uint64_t{0});
        p.forced = j.value("forced", false);
        p.regime = j.value("regime", "");
        p.kind = j.value("cycle_kind", std::string("science")) == "mitigation"
                     ? CycleKind::Mitigation : CycleKind::Science;
        return p;
    }
};

// One measured well, as returned by the world
struct RawWellResult {
    size_t index = 0;                         // Position in the proposal's well list
    std::string well_id;                      // e.g. "C05"
    int plate = 0;                            // Designs larger than one plate spill over
    int row = 0;                              // 0-based (A=0)
    int col = 0;                              // 0-based (01=0)
    WellSpec spec;
    std::map<std::string, double> channels;   // Channel name -> intensity (AU)
};

struct ConditionSummary {
    ConditionKey key;
    size_t n_wells = 0;
    std::map<std::string, Reading> channel_means;
    std::map<std::string, Reading> channel_stds;
    Reading mean;                             // Scalar: mean over channels per well, then over wells
    Reading stddev;
    std::vector<std::string> masked_channels; // Set by the SNR filter in lenient mode
    std::vector<std::string> snr_warnings;

    bool fully_known() const { return mean.is_known() && stddev.is_known(); }

    json to_json() const {
        json means = json::object();
        json stds = json::object();
        for (const auto& [ch, r] : channel_means) means[ch] = r.to_json();
        for (const auto& [ch, r] : channel_stds) stds[ch] = r.to_json();
        return {
            {"condition", key.str()},
            {"n_wells", n_wells},
            {"channel_means", means},
            {"channel_stds", stds},
            {"mean", mean.to_json()},
            {"std", stddev.to_json()},
            {"masked_channels", masked_channels},
            {"snr_warnings", snr_warnings},
        };
    }
};

struct WellReading {
    std::string well_id;
    int plate = 0;
    int row = 0;
    int col = 0;
    std::string condition;
    Reading value;
};

struct DroppedCondition {
    std::string condition;
    size_t n_wells = 0;
    std::string reason;
};

struct Observation {
    std::string design_id;
    std::string template_name;
    CycleKind kind = CycleKind::Science;
    std::vector<ConditionSummary> conditions;   // First-appearance order
    std::vector<DroppedCondition> dropped;
    std::vector<WellReading> layout;            // Proposal order
    size_t wells_spent = 0;
    double evidence_time_h = 0.0;               // Latest assay timepoint measured
    json snr_summary = json::object();

    json to_json() const {
        json conds = json::array();
        for (const auto& c : conditions) conds.push_back(c.to_json());
        json drops = json::array();
        for (const auto& d : dropped) {
            drops.push_back({{"condition", d.condition}, {"n_wells", d.n_wells}, {"reason", d.reason}});
        }
        return {
            {"design_id", design_id},
            {"template", template_name},
            {"cycle_kind", cycle_kind_name(kind)},
            {"conditions", conds},
            {"dropped", drops},
            {"wells_spent", wells_spent},
            {"evidence_time_h", evidence_time_h},
            {"snr", snr_summary},
        };
    }
};

} // namespace episteme
