#pragma once
// Epistemic debt: the gap between claimed and realized information gain
//
// Every executed action first claims how many bits it expects to learn.
// When the outcome is known the claim is resolved and the overclaim
// max(0, claimed - realized) is added to the running total. Underclaiming
// never reduces debt. Open claims contribute nothing.
//
// Debt inflates cost:   inflated = base * (1 + sensitivity * debt)
// and blocks actions:
//   soft (cost):        inflated > budget_remaining
//   hard (threshold):   debt > hard_threshold and template not calibration
// Calibration templates are never hard-blocked, so there is always a way
// out of debt.
//
// Debt has no time decay. The only way down is repayment earned by
// calibration work that measurably tightened the noise model.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "version.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace episteme {

struct EpistemicClaim {
    std::string action_id;
    std::string action_type;
    double claimed_gain_bits = 0.0;
    std::optional<double> realized_gain_bits;
    Cycle cycle = 0;

    bool is_resolved() const { return realized_gain_bits.has_value(); }

    // Positive = overpromised
    double overclaim() const {
        if (!realized_gain_bits) return 0.0;
        return claimed_gain_bits - *realized_gain_bits;
    }

    double overclaim_penalty() const { return std::max(0.0, overclaim()); }

    json to_json() const {
        return {
            {"action_id", action_id},
            {"action_type", action_type},
            {"claimed_gain_bits", claimed_gain_bits},
            {"realized_gain_bits", finite_or_null(realized_gain_bits)},
            {"cycle", cycle},
        };
    }

    static EpistemicClaim from_json(const json& j) {
        EpistemicClaim c;
        c.action_id = j.at("action_id").get<std::string>();
        c.action_type = j.value("action_type", "");
        c.claimed_gain_bits = j.at("claimed_gain_bits").get<double>();
        c.realized_gain_bits = optional_double(j, "realized_gain_bits");
        c.cycle = j.value("cycle", Cycle{0});
        return c;
    }
};

// Debt reduction earned by calibration work, with its evidence
struct Repayment {
    std::string action_id;
    std::string action_type;
    double repay_bits = 0.0;
    std::string reason;
    json evidence = json::object();
    Cycle cycle = 0;

    json to_json() const {
        return {
            {"action_id", action_id},
            {"action_type", action_type},
            {"repay_bits", repay_bits},
            {"reason", reason},
            {"evidence", evidence},
            {"cycle", cycle},
        };
    }

    static Repayment from_json(const json& j) {
        Repayment r;
        r.action_id = j.value("action_id", "");
        r.action_type = j.value("action_type", "");
        r.repay_bits = j.value("repay_bits", 0.0);
        r.reason = j.value("reason", "");
        r.evidence = j.value("evidence", json::object());
        r.cycle = j.value("cycle", Cycle{0});
        return r;
    }
};

struct DebtConfig {
    double sensitivity = 0.15;        // Cost inflation per bit
    double hard_threshold = 2.0;      // Bits above which exploration is blocked
    std::set<std::string> calibration_templates = {
        "baseline", "calibration", "dmso_replicates", "baseline_replicates"};

    bool repayment_enabled = true;
    double repay_base = 0.25;         // Bits for any calibration that added evidence
    double repay_bonus_scale = 7.5;   // Bits per unit of rel_width tightened
    double repay_bonus_cap = 0.75;
    double repay_cap = 1.0;           // Per action

    void validate() const {
        if (sensitivity < 0.0) throw ConfigError("debt.sensitivity", "must be >= 0");
        if (hard_threshold < 0.0) throw ConfigError("debt.hard_threshold", "must be >= 0");
        if (calibration_templates.empty()) {
            throw ConfigError("debt.calibration_templates", "at least one calibration template is required");
        }
        if (repay_base < 0.0 || repay_bonus_scale < 0.0 || repay_bonus_cap < 0.0 || repay_cap < 0.0) {
            throw ConfigError("debt.repayment", "repayment parameters must be >= 0");
        }
    }

    bool is_calibration(const std::string& template_name) const {
        return calibration_templates.count(template_name) > 0;
    }
};

enum class RefusalReason : uint8_t {
    None = 0,
    ActionBlocked = 1,       // Hard threshold
    BudgetExceeded = 2,      // Inflated cost beyond budget
};

inline const char* refusal_reason_name(RefusalReason r) {
    switch (r) {
        case RefusalReason::None:           return "none";
        case RefusalReason::ActionBlocked:  return "epistemic_debt_action_blocked";
        case RefusalReason::BudgetExceeded: return "epistemic_debt_budget_exceeded";
    }
    return "unknown";
}

struct RefusalDecision {
    bool refuse = false;
    RefusalReason reason = RefusalReason::None;
    bool blocked_by_cost = false;
    bool blocked_by_threshold = false;
    bool is_calibration = false;
    double debt_bits = 0.0;
    double base_cost = 0.0;
    double inflated_cost = 0.0;
    double budget_remaining = 0.0;
    double hard_threshold = 0.0;

    json to_json() const {
        return {
            {"refuse", refuse},
            {"reason", refusal_reason_name(reason)},
            {"blocked_by_cost", blocked_by_cost},
            {"blocked_by_threshold", blocked_by_threshold},
            {"is_calibration", is_calibration},
            {"debt_bits", debt_bits},
            {"base_cost", base_cost},
            {"inflated_cost", inflated_cost},
            {"budget_remaining", budget_remaining},
            {"hard_threshold", hard_threshold},
        };
    }
};

class EpistemicDebtLedger {
public:
    explicit EpistemicDebtLedger(double sensitivity = 0.15)
        : sensitivity_(sensitivity) {}

    double total_debt() const { return total_debt_; }
    double sensitivity() const { return sensitivity_; }
    const std::vector<EpistemicClaim>& claims() const { return claims_; }
    const std::vector<Repayment>& repayments() const { return repayments_; }

    // Records an open claim. Returns false if the id already has one open.
    bool claim(const std::string& action_id, const std::string& action_type,
               double expected_gain_bits, Cycle cycle = 0) {
        if (find_open(action_id)) {
            log_warn("debt", "claim %s already open", action_id.c_str());
            return false;
        }
        EpistemicClaim c;
        c.action_id = action_id;
        c.action_type = action_type;
        c.claimed_gain_bits = expected_gain_bits;
        c.cycle = cycle;
        claims_.push_back(std::move(c));
        log_debug("debt", "claim %s expects %.3f bits", action_id.c_str(), expected_gain_bits);
        return true;
    }

    // Closes the open claim and returns the debt added (0 if none open)
    double resolve(const std::string& action_id, double actual_gain_bits) {
        EpistemicClaim* c = find_open(action_id);
        if (!c) {
            log_warn("debt", "no open claim for %s", action_id.c_str());
            return 0.0;
        }
        c->realized_gain_bits = actual_gain_bits;
        double penalty = c->overclaim_penalty();
        total_debt_ += penalty;
        log_debug("debt", "resolved %s claimed=%.3f realized=%.3f penalty=%.3f total=%.3f",
                  action_id.c_str(), c->claimed_gain_bits, actual_gain_bits, penalty, total_debt_);
        return penalty;
    }

    bool has_open_claim(const std::string& action_id) const {
        return std::any_of(claims_.begin(), claims_.end(), [&](const EpistemicClaim& c) {
            return c.action_id == action_id && !c.is_resolved();
        });
    }

    size_t open_claims() const {
        return static_cast<size_t>(std::count_if(claims_.begin(), claims_.end(),
            [](const EpistemicClaim& c) { return !c.is_resolved(); }));
    }

    double get_inflated_cost(double base_cost) const {
        return base_cost * (1.0 + sensitivity_ * total_debt_);
    }

    RefusalDecision should_refuse_action(const std::string& template_name, double base_cost,
                                         double budget_remaining, double hard_threshold,
                                         const std::set<std::string>& calibration_set) const {
        RefusalDecision d;
        d.debt_bits = total_debt_;
        d.base_cost = base_cost;
        d.inflated_cost = get_inflated_cost(base_cost);
        d.budget_remaining = budget_remaining;
        d.hard_threshold = hard_threshold;
        d.is_calibration = calibration_set.count(template_name) > 0;
        d.blocked_by_cost = d.inflated_cost > budget_remaining;
        d.blocked_by_threshold = total_debt_ > hard_threshold && !d.is_calibration;
        d.refuse = d.blocked_by_cost || d.blocked_by_threshold;
        if (d.blocked_by_threshold) {
            d.reason = RefusalReason::ActionBlocked;
        } else if (d.blocked_by_cost) {
            d.reason = RefusalReason::BudgetExceeded;
        }
        return d;
    }

    // Applies a non-negative repayment, capped at the remaining debt.
    // Returns the bits actually repaid.
    double apply_repayment(const std::string& action_id, const std::string& action_type,
                           double repay_bits, const std::string& reason, json evidence,
                           Cycle cycle = 0) {
        if (repay_bits < 0.0 || !std::isfinite(repay_bits)) {
            throw Error("repayment must be a non-negative number of bits");
        }
        double actual = std::min(repay_bits, total_debt_);
        if (actual <= 0.0) return 0.0;
        double before = total_debt_;
        total_debt_ = std::max(0.0, total_debt_ - actual);
        repayments_.push_back({action_id, action_type, actual, reason, std::move(evidence), cycle});
        log_info("debt", "repaid %.3f bits (%s): %.3f -> %.3f", actual, reason.c_str(),
                 before, total_debt_);
        return actual;
    }

    json statistics() const {
        size_t resolved = 0;
        size_t over = 0;
        double sum = 0.0;
        for (const auto& c : claims_) {
            if (!c.is_resolved()) continue;
            ++resolved;
            sum += c.overclaim();
            if (c.overclaim() > 0.0) ++over;
        }
        double repaid = 0.0;
        for (const auto& r : repayments_) repaid += r.repay_bits;
        return {
            {"total_claims", claims_.size()},
            {"resolved_claims", resolved},
            {"open_claims", claims_.size() - resolved},
            {"mean_overclaim", resolved ? sum / static_cast<double>(resolved) : 0.0},
            {"overclaim_rate", resolved ? static_cast<double>(over) / static_cast<double>(resolved) : 0.0},
            {"total_repaid", repaid},
            {"total_debt", total_debt_},
        };
    }

    json to_json() const {
        json claims = json::array();
        for (const auto& c : claims_) claims.push_back(c.to_json());
        json repayments = json::array();
        for (const auto& r : repayments_) repayments.push_back(r.to_json());
        return {
            {"schema_version", EPISTEME_SCHEMA_VERSION},
            {"total_debt", total_debt_},
            {"sensitivity", sensitivity_},
            {"claims", claims},
            {"repayments", repayments},
            {"statistics", statistics()},
        };
    }

    static EpistemicDebtLedger from_json(const json& j) {
        EpistemicDebtLedger ledger(j.value("sensitivity", 0.15));
        ledger.total_debt_ = j.at("total_debt").get<double>();
        for (const auto& c : j.value("claims", json::array())) {
            ledger.claims_.push_back(EpistemicClaim::from_json(c));
        }
        for (const auto& r : j.value("repayments", json::array())) {
            ledger.repayments_.push_back(Repayment::from_json(r));
        }
        return ledger;
    }

    bool save(const std::string& path) const {
        std::ofstream out(path);
        if (!out) return false;
        out << to_json().dump(2) << "\n";
        return static_cast<bool>(out);
    }

    static EpistemicDebtLedger load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw Error("cannot open debt ledger " + path);
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) throw Error("debt ledger is not valid JSON: " + path);
        return from_json(j);
    }

private:
    EpistemicClaim* find_open(const std::string& action_id) {
        for (auto& c : claims_) {
            if (c.action_id == action_id && !c.is_resolved()) return &c;
        }
        return nullptr;
    }

    double sensitivity_;
    double total_debt_ = 0.0;
    std::vector<EpistemicClaim> claims_;
    std::vector<Repayment> repayments_;
};

// I(data) = H(prior) - H(posterior); negative when the posterior widened
inline double information_gain_bits(double prior_bits, double posterior_bits) {
    return prior_bits - posterior_bits;
}

// Repayment earned by one calibration action. Requires that the action
// added pooled evidence; the bonus scales with how much the relative CI
// width tightened.
inline double calibration_repayment(const DebtConfig& cfg, bool added_evidence,
                                    std::optional<double> rel_width_before,
                                    std::optional<double> rel_width_after) {
    if (!cfg.repayment_enabled || !added_evidence) return 0.0;
    double bonus = 0.0;
    if (rel_width_before && rel_width_after) {
        double improvement = std::max(0.0, *rel_width_before - *rel_width_after);
        bonus = std::min(cfg.repay_bonus_cap, improvement * cfg.repay_bonus_scale);
    }
    return std::min(cfg.repay_cap, cfg.repay_base + bonus);
}

} // namespace episteme
