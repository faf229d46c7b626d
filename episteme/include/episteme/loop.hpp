#pragma once
// Decision loop: one integer cycle at a time
//
// Per cycle k:
//   1. begin_cycle(k)
//   2. pending mitigation from k-1?  execute it as all of cycle k
//   3. otherwise propose from regime, debt and horizon
//   4. should_refuse_action; refused => refusal record, nothing executed
//   5. execute against the world
//   6. aggregate + SNR filter
//   7. claim, update(observation, k), resolve, repay, charge budget
//   8. spatial QC; corrective choice deferred to k+1, proceed penalized now
//      (first stable noise gate records the horizon baseline)
//   9. reward
//  10. end_cycle, flush evidence/refusals/decisions/diagnostics
//
// The loop is the only writer of BeliefState, the ledger and the budget.
// Everything is per instance; two loops never share state.

#include "aggregator.hpp"
#include "belief_state.hpp"
#include "calibration.hpp"
#include "config.hpp"
#include "debt.hpp"
#include "event_log.hpp"
#include "evidence.hpp"
#include "log.hpp"
#include "mitigation.hpp"
#include "penalty.hpp"
#include "policy.hpp"
#include "snr_filter.hpp"
#include "updaters/standard.hpp"
#include "world.hpp"
#include <atomic>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

// Records produced during one cycle, written at end_cycle
struct CycleBuffer {
    std::vector<RefusalEvent> refusals;
    std::vector<DecisionEvent> decisions;
    std::vector<DiagnosticEvent> diagnostics;
};

// Guarantees end_cycle and a flush for every begin_cycle, including
// when the cycle unwinds with an exception.
class CycleGuard {
public:
    CycleGuard(BeliefState& state, EventLog& log, CycleBuffer& buffer, Cycle k, CycleKind kind)
        : state_(state), log_(log), buffer_(buffer), cycle_(k) {
        state_.begin_cycle(k, kind);
    }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

    ~CycleGuard() {
        if (closed_ || !state_.in_cycle()) return;
        try {
            flush();
        } catch (const std::exception& e) {
            log_error("loop", "cycle %lld flush during unwind failed: %s",
                      static_cast<long long>(cycle_), e.what());
        }
    }

    void close() {
        closed_ = true;
        flush();
    }

private:
    void flush() {
        auto evidence = state_.end_cycle();
        log_.append_evidence(evidence);
        for (const auto& r : buffer_.refusals) log_.append_refusal(r);
        for (const auto& d : buffer_.decisions) log_.append_decision(d);
        log_.append_diagnostics(buffer_.diagnostics);
    }

    BeliefState& state_;
    EventLog& log_;
    CycleBuffer& buffer_;
    Cycle cycle_;
    bool closed_ = false;
};

// One line of run history
struct CycleRecord {
    Cycle cycle = 0;
    std::string kind;
    std::string outcome;          // executed, refused, mitigation
    std::string template_name;
    std::string regime;
    double reward = 0.0;
    double budget_after = 0.0;
    double debt_bits = 0.0;
    double uncertainty_bits = 0.0;

    json to_json() const {
        return {
            {"cycle", cycle},
            {"kind", kind},
            {"outcome", outcome},
            {"template", template_name},
            {"regime", regime},
            {"reward", finite_or_null(reward)},
            {"budget_after", finite_or_null(budget_after)},
            {"debt_bits", finite_or_null(debt_bits)},
            {"uncertainty_bits", finite_or_null(uncertainty_bits)},
        };
    }
};

struct RunSummary {
    std::string run_id;
    uint64_t seed = 0;
    double budget_total = 0.0;
    double budget_remaining = 0.0;
    int max_cycles = 0;
    Cycle cycles_completed = 0;
    std::string stop_reason;      // max_cycles, budget_exhausted, epistemic_bankruptcy, stop_requested, aborted
    std::string error;            // Set when aborted
    size_t refusals = 0;
    size_t mitigations = 0;
    double total_reward = 0.0;
    std::vector<CycleRecord> history;
    json beliefs_final = json::object();
    json debt = json::object();
    json streams = json::object();

    json to_json() const {
        json h = json::array();
        for (const auto& r : history) h.push_back(r.to_json());
        return {
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"run_id", run_id},
            {"seed", seed},
            {"budget_total", budget_total},
            {"budget_remaining", finite_or_null(budget_remaining)},
            {"max_cycles", max_cycles},
            {"cycles_completed", cycles_completed},
            {"stop_reason", stop_reason},
            {"error", error.empty() ? json(nullptr) : json(error)},
            {"refusals", refusals},
            {"mitigations", mitigations},
            {"total_reward", finite_or_null(total_reward)},
            {"history", h},
            {"beliefs_final", beliefs_final},
            {"debt", debt},
            {"streams", streams},
        };
    }

    bool save(const std::string& path) const {
        std::ofstream out(path);
        if (!out) return false;
        out << to_json().dump(2) << "\n";
        return static_cast<bool>(out);
    }
};

inline std::string summary_path(const std::string& dir, const std::string& run_id) {
    return dir + "/" + run_id + ".summary.json";
}

class DecisionLoop {
public:
    DecisionLoop(RunConfig config, World& world,
                 CalibrationProfile profile = CalibrationProfile::default_profile(),
                 std::unique_ptr<Proposer> proposer = nullptr)
        : config_(validated(std::move(config)))
        , world_(world)
        , filter_(std::move(profile), config_.snr)
        , state_(config_.beliefs, standard_updaters(&filter_))
        , ledger_(config_.debt.sensitivity)
        , policy_(proposer ? std::move(proposer) : default_policy(config_.policy))
        , horizon_(config_.horizon)
        , log_(config_.log_dir, config_.effective_run_id())
        , budget_(config_.budget_wells) {}

    DecisionLoop(const DecisionLoop&) = delete;
    DecisionLoop& operator=(const DecisionLoop&) = delete;

    const RunConfig& config() const { return config_; }
    const BeliefState& state() const { return state_; }
    const EpistemicDebtLedger& ledger() const { return ledger_; }
    const EventLog& event_log() const { return log_; }
    const std::optional<MitigationContext>& pending_mitigation() const { return pending_; }
    double budget_remaining() const { return budget_; }
    const std::vector<CycleRecord>& history() const { return history_; }
    const HorizonPolicy& horizon() const { return horizon_; }

    // Checked between cycles; never interrupts a cycle
    void request_stop() { stop_.store(true); }

    // Runs until a stop condition. Fatal errors are recorded, summarized
    // and rethrown.
    RunSummary run() {
        log_.open();
        log_info("loop", "run %s: seed=%llu budget=%.0f max_cycles=%d world=%s",
                 log_.run_id().c_str(), static_cast<unsigned long long>(config_.seed),
                 budget_, config_.max_cycles, world_.name());
        log_.append_diagnostics({run_started()});

        std::string reason;
        try {
            while ((reason = stop_reason()).empty()) {
                run_cycle(state_.last_cycle() + 1);
            }
        } catch (const std::exception& e) {
            log_error("loop", "run aborted at cycle %lld: %s",
                      static_cast<long long>(state_.last_cycle()), e.what());
            record_abort(e);
            RunSummary s = summarize("aborted");
            s.error = e.what();
            write_summary(s);
            throw;
        }

        if (pending_) {
            log_warn("loop", "run ended with %s pending from cycle %lld",
                     mitigation_action_name(pending_->action),
                     static_cast<long long>(pending_->cycle_flagged));
        }
        RunSummary s = summarize(reason);
        DiagnosticEvent done;
        done.cycle = state_.last_cycle();
        done.type = "run_finished";
        done.payload = {{"stop_reason", reason},
                        {"budget_remaining", budget_},
                        {"debt_bits", ledger_.total_debt()},
                        {"pending_mitigation_dropped", pending_.has_value()}};
        log_.append_diagnostics({done});
        write_summary(s);
        log_info("loop", "run %s finished after %lld cycles: %s", log_.run_id().c_str(),
                 static_cast<long long>(state_.last_cycle()), reason.c_str());
        return s;
    }

    // Runs exactly one integer cycle k (must be last + 1)
    void run_cycle(Cycle k) {
        CycleBuffer buffer;
        CycleGuard guard(state_, log_, buffer, k,
                         pending_ ? CycleKind::Mitigation : CycleKind::Science);
        if (pending_) {
            run_mitigation(k, buffer);
        } else {
            run_science(k, buffer);
        }
        guard.close();
    }

    // Smallest proposal the policy can make, at current inflation
    double cheapest_action_cost() const {
        return ledger_.get_inflated_cost(static_cast<double>(policy_->cheapest_wells()));
    }

private:
    static std::unique_ptr<Proposer> default_policy(const PolicyConfig& config) {
        return std::make_unique<TemplatePolicy>(config);
    }

    static RunConfig validated(RunConfig c) {
        c.world.seed = c.seed;
        c.validate();
        return c;
    }

    std::string stop_reason() const {
        if (stop_.load()) return "stop_requested";
        if (state_.last_cycle() >= config_.max_cycles) return "max_cycles";
        if (state_.beliefs().consecutive_refusals >= config_.max_consecutive_refusals) {
            return "epistemic_bankruptcy";
        }
        if (!pending_ && cheapest_action_cost() > budget_) return "budget_exhausted";
        return {};
    }

    DiagnosticEvent run_started() const {
        json cfg = config_.to_json();
        cfg.erase("log_dir");
        cfg["world"].erase("workers");
        DiagnosticEvent d;
        d.cycle = 0;
        d.type = "run_started";
        d.payload = {{"config", cfg},
                     {"world", world_.name()},
                     {"updaters", state_.updater_names()},
                     {"policy", policy_->name()},
                     {"initial_uncertainty_bits", state_.uncertainty_bits()},
                     {"calibration", filter_.profile().to_json()}};
        return d;
    }

    void run_science(Cycle k, CycleBuffer& buffer) {
        PolicyContext ctx;
        ctx.cycle = k;
        ctx.last_refusal_reason = last_refusal_reason_;
        ctx.exploration_streak = exploration_streak_;
        ctx.horizon = horizon_.horizon(state_.uncertainty_bits());
        ctx.layout_seed = mix_seed(config_.seed, "layout", static_cast<uint64_t>(k));

        PolicyDecision decision = policy_->propose(state_, ctx);
        const Proposal& p = decision.proposal;
        double base_cost = static_cast<double>(p.cost_wells());
        RefusalDecision check = ledger_.should_refuse_action(
            p.template_name, base_cost, budget_, config_.debt.hard_threshold,
            config_.debt.calibration_templates);

        DecisionEvent d;
        d.cycle = k;
        d.cycle_kind = CycleKind::Science;
        d.template_name = p.template_name;
        d.design_id = p.design_id;
        d.regime = p.regime;
        d.reason = decision.reason;
        d.forced = p.forced;
        d.candidates = decision.candidates;
        d.base_cost = base_cost;
        d.inflated_cost = check.inflated_cost;
        d.budget_before = budget_;
        d.debt_bits = ledger_.total_debt();

        if (check.refuse) {
            refuse(k, CycleKind::Science, p, check, d, buffer);
            return;
        }
        last_refusal_reason_.clear();

        d.outcome = "executed";
        d.action_id = "c" + std::to_string(k) + ":" + p.template_name;
        double expected = policy_->expected_gain(p.template_name);
        double reward = execute(k, p, d.action_id, expected, check.inflated_cost, d, buffer);

        if (config_.debt.is_calibration(p.template_name)) {
            exploration_streak_ = 0;
        } else {
            ++exploration_streak_;
        }
        record(k, CycleKind::Science, "executed", p, reward);
    }

    void refuse(Cycle k, CycleKind kind, const Proposal& p, const RefusalDecision& check,
                DecisionEvent& d, CycleBuffer& buffer) {
        const char* reason = refusal_reason_name(check.reason);
        state_.record_refusal(reason, check.to_json());

        RefusalEvent r;
        r.cycle = k;
        r.cycle_kind = kind;
        r.reason = reason;
        r.proposed_template = p.template_name;
        r.proposed_hypothesis = p.hypothesis;
        r.proposed_wells = p.cost_wells();
        r.regime = p.regime;
        r.debt_bits = check.debt_bits;
        r.base_cost = check.base_cost;
        r.inflated_cost = check.inflated_cost;
        r.budget_remaining = check.budget_remaining;
        r.debt_threshold = check.hard_threshold;
        r.blocked_by_cost = check.blocked_by_cost;
        r.blocked_by_threshold = check.blocked_by_threshold;
        r.is_calibration = check.is_calibration;
        r.consecutive_refusals = state_.beliefs().consecutive_refusals;
        buffer.refusals.push_back(r);

        d.outcome = "refused";
        d.budget_after = budget_;
        buffer.decisions.push_back(d);

        last_refusal_reason_ = reason;
        log_warn("loop", "cycle %lld: refused %s (%s, debt=%.2f, cost=%.1f/%.1f)",
                 static_cast<long long>(k), p.template_name.c_str(), reason,
                 check.debt_bits, check.inflated_cost, budget_);
        record(k, kind, "refused", p, 0.0);
    }

    void run_mitigation(Cycle k, CycleBuffer& buffer) {
        MitigationContext ctx = *pending_;
        pending_.reset();
        if (ctx.cycle_flagged != k - 1) {
            throw IntegrityViolation(k, "mitigation.cycle_flagged", std::to_string(ctx.cycle_flagged),
                                     "pending mitigation must execute at cycle_flagged + 1");
        }

        Proposal p = make_mitigation_proposal(
            ctx, k, mix_seed(config_.seed, "replate", ++layout_epoch_));
        p.forced = true;

        // Corrective actions are never hard-blocked by debt
        auto calibration_set = config_.debt.calibration_templates;
        calibration_set.insert(p.template_name);
        double base_cost = static_cast<double>(p.cost_wells());
        RefusalDecision check = ledger_.should_refuse_action(
            p.template_name, base_cost, budget_, config_.debt.hard_threshold, calibration_set);

        DecisionEvent d;
        d.cycle = k;
        d.cycle_kind = CycleKind::Mitigation;
        d.template_name = p.template_name;
        d.design_id = p.design_id;
        d.regime = regime_name(state_.regime());
        d.reason = ctx.rationale;
        d.forced = true;
        d.candidates = json::array({{{"action", mitigation_action_name(ctx.action)}, {"why", ctx.rationale}}});
        d.base_cost = base_cost;
        d.inflated_cost = check.inflated_cost;
        d.budget_before = budget_;
        d.debt_bits = ledger_.total_debt();

        if (check.refuse) {
            refuse(k, CycleKind::Mitigation, p, check, d, buffer);
            return;
        }
        last_refusal_reason_.clear();

        d.outcome = "mitigation";
        d.action_id = "c" + std::to_string(k) + ":" + p.template_name;
        std::optional<double> after;
        double reward = execute(k, p, d.action_id, 0.0, check.inflated_cost, d, buffer, &after);

        DiagnosticEvent outcome;
        outcome.cycle = k;
        outcome.type = "mitigation_outcome";
        outcome.payload = {
            {"action", mitigation_action_name(ctx.action)},
            {"cycle_flagged", ctx.cycle_flagged},
            {"cycle_executed", k},
            {"statistic_before", ctx.statistic_before},
            {"statistic_after", finite_or_null(after)},
            {"resolved", after ? *after <= config_.spatial_qc.flag_threshold : false},
            {"previous_design", ctx.previous_proposal.design_id},
        };
        buffer.diagnostics.push_back(outcome);
        ++mitigations_;
        log_info("loop", "cycle %lld: %s for cycle %lld, I %.3f -> %s",
                 static_cast<long long>(k), mitigation_action_name(ctx.action),
                 static_cast<long long>(ctx.cycle_flagged), ctx.statistic_before,
                 after ? format_number(*after).c_str() : "unknown");
        record(k, CycleKind::Mitigation, "mitigation", p, reward);
    }

    // Steps 5-9 for an accepted proposal. Returns the reward.
    double execute(Cycle k, const Proposal& p, const std::string& action_id,
                   double expected_gain, double inflated_cost, DecisionEvent& d,
                   CycleBuffer& buffer, std::optional<double>* qc_after = nullptr) {
        std::vector<RawWellResult> raw = world_.execute(p);
        Observation obs = aggregate(k, p, raw, filter_);

        ledger_.claim(action_id, p.template_name, expected_gain, k);
        double prior = state_.uncertainty_bits();
        double df_before = state_.beliefs().noise_df;
        std::optional<double> rel_before = state_.beliefs().noise_rel_width;

        UpdateResult update = state_.update(obs, k);
        for (auto& diag : update.diagnostics) buffer.diagnostics.push_back(std::move(diag));

        double posterior = state_.uncertainty_bits();
        double gain = information_gain_bits(prior, posterior);
        if (!horizon_.baseline() && state_.regime() == Regime::InGate) {
            horizon_.set_baseline(posterior);
            DiagnosticEvent b;
            b.cycle = k;
            b.type = "horizon_baseline";
            b.payload = {{"baseline_bits", posterior}, {"base_horizon", config_.horizon.base_horizon}};
            buffer.diagnostics.push_back(b);
            log_info("loop", "cycle %lld: noise gate stable, horizon baseline %.3f bits",
                     static_cast<long long>(k), posterior);
        }
        double debt_added = ledger_.resolve(action_id, gain);

        double repaid = 0.0;
        if (config_.debt.is_calibration(p.template_name)) {
            bool added = state_.beliefs().noise_df > df_before;
            double owed = calibration_repayment(config_.debt, added, rel_before,
                                                state_.beliefs().noise_rel_width);
            if (owed > 0.0 && ledger_.total_debt() > 0.0) {
                json evidence = {{"noise_df_before", df_before},
                                 {"noise_df_after", state_.beliefs().noise_df},
                                 {"rel_width_before", finite_or_null(rel_before)},
                                 {"rel_width_after", finite_or_null(state_.beliefs().noise_rel_width)}};
                repaid = ledger_.apply_repayment(action_id, p.template_name, owed,
                                                 "calibration_evidence", evidence, k);
                DiagnosticEvent r;
                r.cycle = k;
                r.type = "debt_repayment";
                r.payload = {{"action_id", action_id}, {"repaid_bits", repaid},
                             {"debt_after", ledger_.total_debt()}, {"evidence", evidence}};
                buffer.diagnostics.push_back(r);
            }
        }

        state_.update_debt_level(ledger_.total_debt(), config_.debt.hard_threshold);
        state_.record_action_executed(p.template_name, p.cost_wells());
        budget_ -= inflated_cost;

        SpatialQcResult qc = run_spatial_qc(obs, config_.spatial_qc);
        DiagnosticEvent qc_diag;
        qc_diag.cycle = k;
        qc_diag.type = "spatial_qc";
        qc_diag.payload = qc.to_json();
        qc_diag.payload["design_id"] = p.design_id;
        buffer.diagnostics.push_back(qc_diag);

        double qc_penalty = 0.0;
        if (qc_after) {
            *qc_after = qc.morans_i;
        } else if (qc.flagged) {
            MitigationChoice choice = choose_mitigation(qc, p, budget_, config_.spatial_qc,
                                                        ledger_.get_inflated_cost(1.0));
            DiagnosticEvent c;
            c.cycle = k;
            c.type = "mitigation_choice";
            c.payload = choice.to_json();
            c.payload["cycle_flagged"] = k;
            buffer.diagnostics.push_back(c);
            if (choice.corrective()) {
                MitigationContext ctx;
                ctx.cycle_flagged = k;
                ctx.statistic_before = *qc.morans_i;
                ctx.action = choice.action;
                ctx.rationale = choice.rationale;
                ctx.previous_proposal = p;
                pending_ = std::move(ctx);
                log_info("loop", "cycle %lld: spatial QC flagged (I=%.3f), %s scheduled for cycle %lld",
                         static_cast<long long>(k), *qc.morans_i,
                         mitigation_action_name(choice.action), static_cast<long long>(k + 1));
            } else {
                qc_penalty = choice.penalty;
                log_info("loop", "cycle %lld: spatial QC flagged, proceeding (%s)",
                         static_cast<long long>(k), choice.rationale.c_str());
            }
        }

        double cost_term = config_.reward.cost_weight * inflated_cost / config_.budget_wells;
        double entropy = entropy_penalty(prior, posterior, config_.reward.entropy_weight);
        double reward = config_.reward.gain_weight * gain - cost_term - entropy - qc_penalty;

        d.budget_after = budget_;
        d.reward = {
            {"total", finite_or_null(reward)},
            {"gain_bits", finite_or_null(gain)},
            {"expected_gain_bits", expected_gain},
            {"prior_bits", finite_or_null(prior)},
            {"posterior_bits", finite_or_null(posterior)},
            {"cost_term", finite_or_null(cost_term)},
            {"entropy_penalty", finite_or_null(entropy)},
            {"qc_penalty", qc_penalty},
            {"debt_added", debt_added},
            {"debt_repaid", repaid},
        };
        buffer.decisions.push_back(d);

        log_debug("loop", "cycle %lld: %s gain=%.3f/%.3f debt=%.3f budget=%.1f reward=%.3f",
                  static_cast<long long>(k), p.template_name.c_str(), gain, expected_gain,
                  ledger_.total_debt(), budget_, reward);
        total_reward_ += reward;
        return reward;
    }

    void record(Cycle k, CycleKind kind, const char* outcome, const Proposal& p, double reward) {
        CycleRecord r;
        r.cycle = k;
        r.kind = cycle_kind_name(kind);
        r.outcome = outcome;
        r.template_name = p.template_name;
        r.regime = p.regime;
        r.reward = reward;
        r.budget_after = budget_;
        r.debt_bits = ledger_.total_debt();
        r.uncertainty_bits = state_.uncertainty_bits();
        history_.push_back(std::move(r));
    }

    void record_abort(const std::exception& e) {
        DiagnosticEvent d;
        d.cycle = state_.last_cycle();
        d.type = "run_aborted";
        d.payload = {{"error", e.what()}, {"budget_remaining", budget_},
                     {"debt_bits", ledger_.total_debt()}};
        if (auto* iv = dynamic_cast<const IntegrityViolation*>(&e)) {
            d.payload["error_type"] = "integrity_violation";
            d.payload["field"] = iv->field();
            d.payload["value"] = iv->value();
        } else if (auto* tp = dynamic_cast<const TemporalProvenanceError*>(&e)) {
            d.payload["error_type"] = "temporal_provenance";
            d.payload["belief"] = tp->belief();
            d.payload["evidence_time_h"] = finite_or_null(tp->evidence_time_h());
            d.payload["claim_time_h"] = finite_or_null(tp->claim_time_h());
        } else {
            d.payload["error_type"] = "error";
        }
        try {
            log_.append_diagnostics({d});
        } catch (const std::exception& write_error) {
            log_error("loop", "could not record abort: %s", write_error.what());
        }
    }

    RunSummary summarize(const std::string& reason) const {
        RunSummary s;
        s.run_id = log_.run_id();
        s.seed = config_.seed;
        s.budget_total = config_.budget_wells;
        s.budget_remaining = budget_;
        s.max_cycles = config_.max_cycles;
        s.cycles_completed = state_.last_cycle();
        s.stop_reason = reason;
        s.refusals = static_cast<size_t>(state_.beliefs().refusals_total);
        s.mitigations = mitigations_;
        s.total_reward = total_reward_;
        s.history = history_;
        s.beliefs_final = state_.to_json();
        s.debt = ledger_.statistics();
        for (Stream st : all_streams()) {
            s.streams[stream_name(st)] = {{"path", log_.path(st)}, {"records", log_.count(st)}};
        }
        return s;
    }

    void write_summary(const RunSummary& s) const {
        auto path = summary_path(log_.dir(), log_.run_id());
        if (!s.save(path)) {
            log_error("loop", "could not write %s", path.c_str());
        }
    }

    RunConfig config_;
    World& world_;
    SnrFilter filter_;
    BeliefState state_;
    EpistemicDebtLedger ledger_;
    std::unique_ptr<Proposer> policy_;
    HorizonPolicy horizon_;
    EventLog log_;

    double budget_;
    std::optional<MitigationContext> pending_;
    std::string last_refusal_reason_;
    int exploration_streak_ = 0;
    uint64_t layout_epoch_ = 0;
    size_t mitigations_ = 0;
    double total_reward_ = 0.0;
    std::vector<CycleRecord> history_;
    std::atomic<bool> stop_{false};
};

} // namespace episteme
