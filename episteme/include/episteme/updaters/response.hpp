#pragma once
// Response updater: dose curvature and time dependence
//
// Dose: conditions sharing cell line, compound, time and assay, with at
// least three doses of known mean. Curvature when the largest jump
// between adjacent doses exceeds k*sigma and is more than twice the
// smallest jump.
// Time: conditions sharing cell line, compound, dose and assay, with at
// least three timepoints. Time dependence when the range exceeds k*sigma.
//
// sigma is the pooled noise sigma, or a default before one exists.

#include "../belief_state.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace episteme {

class ResponseUpdater : public BeliefUpdater {
public:
    const char* name() const override { return "response"; }

    void update(BeliefTransaction& txn, const Observation& obs) override {
        const auto& cfg = txn.config();
        double sigma = txn.beliefs().noise_sigma ? *txn.beliefs().noise_sigma
                                                 : cfg.response_sigma_default;
        double bar = cfg.response_sigma_mult * sigma;

        record_tested(txn, obs);

        using DoseKey = std::tuple<std::string, std::string, double, std::string>;
        std::map<DoseKey, std::vector<const ConditionSummary*>> by_time;
        std::map<DoseKey, std::vector<const ConditionSummary*>> by_dose;
        for (const auto& c : obs.conditions) {
            if (c.key.compound == cfg.vehicle || !c.mean.is_known()) continue;
            by_time[{c.key.cell_line, c.key.compound, c.key.time_h, c.key.assay}].push_back(&c);
            by_dose[{c.key.cell_line, c.key.compound, c.key.dose_uM, c.key.assay}].push_back(&c);
        }

        for (const auto& [key, conds] : by_time) {
            auto points = collapse(conds, [](const ConditionSummary& c) { return c.key.dose_uM; });
            if (points.size() < 3) continue;

            double max_jump = 0.0;
            double min_jump = 0.0;
            for (size_t i = 1; i < points.size(); ++i) {
                double jump = std::fabs(points[i].second - points[i - 1].second);
                if (i == 1 || jump < min_jump) min_jump = jump;
                max_jump = std::max(max_jump, jump);
            }
            bool curved = max_jump > bar && max_jump > 2.0 * min_jump;

            std::string belief_key = std::get<1>(key) + "@" + format_number(std::get<2>(key)) + "h";
            auto curv = txn.beliefs().dose_curvature;
            curv[belief_key] = curved;

            Support s;
            s.evidence = {{"doses", points.size()}, {"max_jump", max_jump},
                          {"min_jump", min_jump}, {"sigma", sigma}, {"bar", bar}};
            s.conditions = condition_keys(conds);
            s.claim_time_h = std::get<2>(key);
            s.note = belief_key + (curved ? ": curvature" : ": no curvature");
            txn.set(&Beliefs::dose_curvature, "dose_curvature", curv, s);
            txn.set(&Beliefs::dose_response_characterized, "dose_response_characterized", true, s);
        }

        for (const auto& [key, conds] : by_dose) {
            auto points = collapse(conds, [](const ConditionSummary& c) { return c.key.time_h; });
            if (points.size() < 3) continue;

            double lo = points.front().second, hi = points.front().second;
            for (const auto& p : points) {
                lo = std::min(lo, p.second);
                hi = std::max(hi, p.second);
            }
            bool dependent = (hi - lo) > bar;

            std::string belief_key = std::get<1>(key) + "@" + format_number(std::get<2>(key)) + "uM";
            auto dep = txn.beliefs().time_dependence;
            dep[belief_key] = dependent;

            Support s;
            s.evidence = {{"timepoints", points.size()}, {"range", hi - lo},
                          {"sigma", sigma}, {"bar", bar}};
            s.conditions = condition_keys(conds);
            s.claim_time_h = points.back().first;
            s.note = belief_key + (dependent ? ": time dependent" : ": flat over time");
            txn.set(&Beliefs::time_dependence, "time_dependence", dep, s);
            txn.set(&Beliefs::time_response_characterized, "time_response_characterized", true, s);
        }
    }

private:
    // (x, mean) sorted by x; conditions at the same x (edge and center) are averaged
    template <class XFn>
    static std::vector<std::pair<double, double>> collapse(
            const std::vector<const ConditionSummary*>& conds, XFn x_of) {
        std::map<double, std::vector<Reading>> grouped;
        for (const auto* c : conds) grouped[x_of(*c)].push_back(c->mean);
        std::vector<std::pair<double, double>> out;
        for (const auto& [x, readings] : grouped) {
            auto m = mean_of(readings).get();
            if (m) out.emplace_back(x, *m);
        }
        return out;
    }

    static std::vector<std::string> condition_keys(const std::vector<const ConditionSummary*>& conds) {
        std::vector<std::string> out;
        for (const auto* c : conds) out.push_back(c->key.str());
        return out;
    }

    static void record_tested(BeliefTransaction& txn, const Observation& obs) {
        auto tested = txn.beliefs().tested_compounds;
        for (const auto& c : obs.conditions) {
            if (c.key.compound == txn.config().vehicle) continue;
            if (!std::binary_search(tested.begin(), tested.end(), c.key.compound)) {
                tested.insert(std::lower_bound(tested.begin(), tested.end(), c.key.compound),
                              c.key.compound);
            }
        }
        Support s;
        s.evidence = {{"design_id", obs.design_id}};
        txn.set(&Beliefs::tested_compounds, "tested_compounds", tested, s);
    }
};

} // namespace episteme
