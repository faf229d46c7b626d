#pragma once
// Assay gate updater: one pooled-noise gate per configured assay
//
// Same pooling as the noise updater, restricted to vehicle center wells
// of a single assay. Gates are named "assay:<assay>" and use the assay
// gate thresholds; drift is not tracked per assay.

#include "../belief_state.hpp"

namespace episteme {

class AssayGateUpdater : public BeliefUpdater {
public:
    const char* name() const override { return "assay_gate"; }

    void update(BeliefTransaction& txn, const Observation& obs) override {
        const auto& cfg = txn.config();
        for (const auto& assay : cfg.assay_gates) {
            update_assay(txn, obs, assay);
        }
    }

private:
    static void update_assay(BeliefTransaction& txn, const Observation& obs,
                             const std::string& assay) {
        const auto& cfg = txn.config();
        auto df_map = txn.beliefs().assay_df;
        auto sse_map = txn.beliefs().assay_sse;

        stats::PooledVariance pooled;
        pooled.restore(df_map[assay], sse_map[assay]);

        std::vector<std::string> used;
        for (const auto& c : obs.conditions) {
            if (c.key.assay != assay || c.key.compound != cfg.vehicle ||
                c.key.position != Position::Center) {
                continue;
            }
            auto sd = c.stddev.get();
            if (!sd) continue;
            if (pooled.add_group(c.n_wells, *sd)) used.push_back(c.key.str());
        }
        if (used.empty()) return;

        df_map[assay] = pooled.df();
        sse_map[assay] = pooled.sse();

        Support s;
        s.evidence = {{"assay", assay}, {"pooled_df", pooled.df()},
                      {"pooled_sigma", finite_or_null(pooled.sigma())}};
        s.conditions = used;
        txn.set(&Beliefs::assay_df, "assay_df", df_map, s);
        txn.set(&Beliefs::assay_sse, "assay_sse", sse_map, s);

        auto rel = pooled.relative_width();
        if (rel) {
            auto rel_map = txn.beliefs().assay_rel_width;
            rel_map[assay] = *rel;
            txn.set(&Beliefs::assay_rel_width, "assay_rel_width", rel_map, s);
        }

        txn.evaluate_gate(assay_gate_name(assay), cfg.assay_gate,
                          {rel, pooled.df(), std::nullopt}, s);
    }
};

} // namespace episteme
