#pragma once
// Edge updater: edge vs center wells of otherwise identical conditions
//
// For each matched pair, per channel: effect = (edge - center) / center.
// A delta the detector cannot resolve (within 2 LSB) counts as zero.
// Effects are folded into an exponential moving average; after
// edge_min_tests pairs the question is resolved, and the effect is
// confident when any channel exceeds edge_effect_min in magnitude.

#include "../belief_state.hpp"
#include "../snr_filter.hpp"
#include <cmath>

namespace episteme {

class EdgeUpdater : public BeliefUpdater {
public:
    // filter may be null: then any nonzero delta counts
    explicit EdgeUpdater(const SnrFilter* filter = nullptr) : filter_(filter) {}

    const char* name() const override { return "edge"; }

    void update(BeliefTransaction& txn, const Observation& obs) override {
        const auto& cfg = txn.config();

        for (const auto& edge : obs.conditions) {
            if (edge.key.position != Position::Edge) continue;
            const ConditionSummary* center = find_center(obs, edge.key);
            if (!center) continue;

            auto effects = txn.beliefs().edge_effect_by_channel;
            bool first = txn.beliefs().edge_tests == 0;
            json per_channel = json::object();
            size_t used = 0;

            for (const auto& [ch, em] : edge.channel_means) {
                auto it = center->channel_means.find(ch);
                if (it == center->channel_means.end()) continue;
                auto e = em.get();
                auto c = it->second.get();
                // Masked channels carry no evidence either way
                if (!e || !c || *c <= 0.0) {
                    per_channel[ch] = nullptr;
                    continue;
                }
                double delta = *e - *c;
                double effect = significant(delta, ch) ? delta / *c : 0.0;
                per_channel[ch] = effect;
                auto prev = effects.find(ch);
                if (first || prev == effects.end()) {
                    effects[ch] = effect;
                } else {
                    effects[ch] = cfg.edge_ema_alpha * effect +
                                  (1.0 - cfg.edge_ema_alpha) * prev->second;
                }
                ++used;
            }
            if (used == 0) continue;

            std::string ek = edge.key.str();
            std::string ck = center->key.str();
            Support s;
            s.evidence = {{"edge", ek}, {"center", ck}, {"effect", per_channel}};
            s.conditions = {ek, ck};
            s.claim_time_h = edge.key.time_h;
            txn.set(&Beliefs::edge_effect_by_channel, "edge_effect_by_channel", effects, s);

            int tests = txn.beliefs().edge_tests + 1;
            txn.set(&Beliefs::edge_tests, "edge_tests", tests, s);

            double max_abs = 0.0;
            for (const auto& [_, v] : effects) max_abs = std::max(max_abs, std::fabs(v));
            bool resolved = tests >= cfg.edge_min_tests;
            bool confident = resolved && max_abs > cfg.edge_effect_min;

            s.evidence["max_abs_effect"] = max_abs;
            s.note = confident ? "edge effect present" : (resolved ? "no edge effect" : "edge test pending");
            txn.set(&Beliefs::edge_effect_resolved, "edge_effect_resolved", resolved, s);
            txn.set(&Beliefs::edge_effect_confident, "edge_effect_confident", confident, s);
        }
    }

private:
    static const ConditionSummary* find_center(const Observation& obs, const ConditionKey& edge) {
        ConditionKey want = edge;
        want.position = Position::Center;
        for (const auto& c : obs.conditions) {
            if (c.key == want) return &c;
        }
        return nullptr;
    }

    bool significant(double delta, const std::string& channel) const {
        if (filter_) return filter_->is_significant_difference(delta, channel);
        return delta != 0.0;
    }

    const SnrFilter* filter_;
};

} // namespace episteme
