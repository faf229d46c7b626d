#pragma once
// Noise updater: pooled sigma from vehicle center wells
//
// Each vehicle (DMSO, center, calibration assay) condition with a known
// scalar std contributes df = n-1 and SSE = df * s^2. After pooling, the
// updater refreshes sigma, its 95% CI, the relative CI width and the
// drift metric, then evaluates the noise_sigma gate once for the cycle.
// Conditions whose readings were masked by the SNR filter are skipped,
// never counted as zero variance.

#include "../belief_state.hpp"

namespace episteme {

class NoiseUpdater : public BeliefUpdater {
public:
    const char* name() const override { return "noise"; }

    void update(BeliefTransaction& txn, const Observation& obs) override {
        const auto& cfg = txn.config();
        bool contributed = false;

        for (const auto& cond : obs.conditions) {
            if (!is_baseline(cond, cfg)) continue;

            auto mean = cond.mean.get();
            auto sd = cond.stddev.get();
            std::string key = cond.key.str();
            if (!mean || !sd || cond.n_wells < 2) {
                txn.diagnostic("noise_skipped", {
                    {"condition", key},
                    {"n_wells", cond.n_wells},
                    {"reason", (!mean || !sd) ? "unknown_readings" : "too_few_wells"},
                });
                continue;
            }

            update_channel_cvs(txn, cond);
            pool(txn, cond, *sd);
            push_sigma(txn, cond, *sd);
            contributed = true;

            const auto& b = txn.beliefs();
            txn.diagnostic("noise", {
                {"condition", key},
                {"n_wells", cond.n_wells},
                {"std_cycle", *sd},
                {"mean_cycle", *mean},
                {"pooled_df", b.noise_df},
                {"pooled_sigma", finite_or_null(b.noise_sigma)},
                {"ci_low", finite_or_null(b.noise_ci_low)},
                {"ci_high", finite_or_null(b.noise_ci_high)},
                {"rel_width", finite_or_null(b.noise_rel_width)},
                {"drift_metric", finite_or_null(b.noise_drift)},
            });
        }

        if (!contributed) return;

        const auto& b = txn.beliefs();
        Support s;
        s.evidence = {{"sigma", finite_or_null(b.noise_sigma)}};
        txn.evaluate_gate(NOISE_GATE, cfg.gate, {b.noise_rel_width, b.noise_df, b.noise_drift}, s);
    }

private:
    static bool is_baseline(const ConditionSummary& c, const BeliefConfig& cfg) {
        return c.key.compound == cfg.vehicle && c.key.position == Position::Center &&
               c.key.assay == cfg.calibration_assay;
    }

    void update_channel_cvs(BeliefTransaction& txn, const ConditionSummary& cond) {
        auto cvs = txn.beliefs().baseline_cv_by_channel;
        for (const auto& [ch, m] : cond.channel_means) {
            auto mv = m.get();
            auto it = cond.channel_stds.find(ch);
            if (!mv || *mv <= 0.0 || it == cond.channel_stds.end()) continue;
            auto sv = it->second.get();
            if (!sv) continue;
            cvs[ch] = *sv / *mv;
        }
        Support s;
        s.evidence = {{"n_wells", cond.n_wells}, {"condition", cond.key.str()}};
        s.conditions = {cond.key.str()};
        txn.set(&Beliefs::baseline_cv_by_channel, "baseline_cv_by_channel", cvs, s);
        s.note = "added " + std::to_string(cond.n_wells) + " calibration replicates";
        txn.set(&Beliefs::calibration_wells, "calibration_wells",
                txn.beliefs().calibration_wells + static_cast<int64_t>(cond.n_wells), s);
    }

    void pool(BeliefTransaction& txn, const ConditionSummary& cond, double sd) {
        const auto& b = txn.beliefs();
        stats::PooledVariance pooled;
        pooled.restore(b.noise_df, b.noise_sse);
        pooled.add_group(cond.n_wells, sd);

        double df = static_cast<double>(cond.n_wells - 1);
        Support s;
        s.evidence = {{"df", df}, {"sse", df * sd * sd}, {"condition", cond.key.str()}};
        s.conditions = {cond.key.str()};
        txn.set(&Beliefs::noise_df, "noise_df", pooled.df(), s);
        txn.set(&Beliefs::noise_sse, "noise_sse", pooled.sse(), s);

        auto sigma = pooled.sigma();
        auto ci = pooled.interval();
        auto rel = pooled.relative_width();
        s.evidence = {
            {"sigma", finite_or_null(sigma)},
            {"df", pooled.df()},
            {"ci_low", ci ? json(ci->low) : json(nullptr)},
            {"ci_high", ci ? json(ci->high) : json(nullptr)},
        };
        txn.set(&Beliefs::noise_sigma, "noise_sigma", sigma, s);
        txn.set(&Beliefs::noise_ci_low, "noise_ci_low",
                ci ? std::optional<double>(ci->low) : std::nullopt, s);
        txn.set(&Beliefs::noise_ci_high, "noise_ci_high",
                ci ? std::optional<double>(ci->high) : std::nullopt, s);
        char note[64];
        std::snprintf(note, sizeof(note), "noise CI width: %.3f", rel ? *rel : -1.0);
        s.note = rel ? note : "noise CI width: unknown";
        txn.set(&Beliefs::noise_rel_width, "noise_rel_width", rel, s);
    }

    void push_sigma(BeliefTransaction& txn, const ConditionSummary& cond, double sd) {
        const auto& cfg = txn.config();
        const auto& b = txn.beliefs();

        stats::DriftTracker tracker(cfg.drift_window, cfg.drift_k);
        for (double v : b.noise_sigma_history) tracker.push(v);
        tracker.push(sd);

        Support s;
        s.evidence = {{"sigma_cycle", sd}, {"condition", cond.key.str()}};
        s.conditions = {cond.key.str()};
        txn.set(&Beliefs::noise_sigma_history, "noise_sigma_history", tracker.history(), s);

        auto drift = tracker.metric(txn.beliefs().noise_sigma);
        s.evidence["window"] = tracker.size();
        txn.set(&Beliefs::noise_drift, "noise_drift", drift, s);
    }
};

} // namespace episteme
