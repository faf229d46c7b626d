// End-to-end tests of the decision loop against simulated worlds
//
// Each test runs a full loop into its own temporary log directory and
// checks the streams it leaves behind.

#include <episteme/episteme.hpp>
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

using namespace episteme;

static std::string temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("episteme_loop_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    return dir.string();
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static RunConfig base_config(const std::string& dir, const std::string& run_id) {
    RunConfig c;
    c.run_id = run_id;
    c.log_dir = dir;
    c.seed = 11;
    c.max_cycles = 12;
    return c;
}

static std::vector<json> records(const std::string& dir, const std::string& run_id, Stream s) {
    auto streams = read_run(dir, run_id);
    return streams[static_cast<size_t>(s)].records;
}

// Scales every channel of one design by (1 + slope * column)
class GradientWorld : public World {
public:
    GradientWorld(SimulatedWorldConfig config, std::string target, double slope)
        : inner_(std::move(config)), target_(std::move(target)), slope_(slope) {}

    const char* name() const override { return "gradient"; }

    std::vector<RawWellResult> execute(const Proposal& proposal) override {
        auto raw = inner_.execute(proposal);
        if (proposal.design_id != target_) return raw;
        for (auto& r : raw) {
            for (auto& [ch, v] : r.channels) {
                (void)ch;
                v *= 1.0 + slope_ * r.col;
            }
        }
        return raw;
    }

private:
    SimulatedWorld inner_;
    std::string target_;
    double slope_;
};

// Returns one well short from the given call onwards
class ShortWorld : public World {
public:
    explicit ShortWorld(int fail_at) : fail_at_(fail_at) {}

    const char* name() const override { return "short"; }

    std::vector<RawWellResult> execute(const Proposal& proposal) override {
        auto raw = inner_.execute(proposal);
        if (++calls_ >= fail_at_) raw.pop_back();
        return raw;
    }

private:
    SimulatedWorld inner_;
    int fail_at_;
    int calls_ = 0;
};

class CountingWorld : public World {
public:
    explicit CountingWorld(SimulatedWorldConfig config) : inner(std::move(config)) {}

    const char* name() const override { return "counting"; }

    std::vector<RawWellResult> execute(const Proposal& proposal) override {
        ++calls;
        return inner.execute(proposal);
    }

    SimulatedWorld inner;
    int calls = 0;
};

// From the given call onwards, every other vehicle center well reads
// (1 + spread) times brighter, so the per-cycle noise sigma jumps
class DriftingWorld : public World {
public:
    DriftingWorld(SimulatedWorldConfig config, int from_call, double spread)
        : inner_(std::move(config)), from_call_(from_call), spread_(spread) {}

    const char* name() const override { return "drifting"; }

    std::vector<RawWellResult> execute(const Proposal& proposal) override {
        auto raw = inner_.execute(proposal);
        if (++calls_ < from_call_) return raw;
        for (auto& r : raw) {
            if (r.spec.compound != "DMSO" || r.spec.position != Position::Center) continue;
            if (r.index % 2 == 0) continue;
            for (auto& [ch, v] : r.channels) {
                (void)ch;
                v *= 1.0 + spread_;
            }
        }
        return raw;
    }

private:
    SimulatedWorld inner_;
    int from_call_;
    double spread_;
    int calls_ = 0;
};

// The default policy, remembering the horizon it was offered each cycle
class HorizonRecordingPolicy : public Proposer {
public:
    explicit HorizonRecordingPolicy(std::vector<int>* seen) : seen_(seen) {}

    const char* name() const override { return "horizon_recording"; }

    PolicyDecision propose(const BeliefState& state, const PolicyContext& ctx) const override {
        seen_->push_back(ctx.horizon);
        return inner_.propose(state, ctx);
    }

    double expected_gain(const std::string& t) const override { return inner_.expected_gain(t); }
    size_t cheapest_wells() const override { return inner_.cheapest_wells(); }

private:
    TemplatePolicy inner_;
    std::vector<int>* seen_;
};

// Always asks for a dose ladder and promises far more than it can teach
class OverclaimingPolicy : public Proposer {
public:
    const char* name() const override { return "overclaiming"; }

    PolicyDecision propose(const BeliefState& state, const PolicyContext& ctx) const override {
        PolicyDecision d;
        d.reason = "always explore";
        d.proposal = templates_.build("dose_ladder", "tunicamycin", state.regime(), ctx);
        return d;
    }

    double expected_gain(const std::string&) const override { return 10.0; }
    size_t cheapest_wells() const override { return 15; }

private:
    TemplatePolicy templates_;
};

void test_repeatable_runs() {
    std::cout << "Testing repeated runs are byte-identical..." << std::endl;

    auto a = temp_dir("repeat_a");
    auto b = temp_dir("repeat_b");
    auto c = temp_dir("repeat_c");

    auto run_in = [](const std::string& dir, int workers) {
        RunConfig cfg = base_config(dir, "det");
        cfg.world.workers = workers;
        SimulatedWorld world(cfg.world);
        DecisionLoop loop(cfg, world);
        return loop.run();
    };
    auto sa = run_in(a, 1);
    auto sb = run_in(b, 1);
    auto sc = run_in(c, 4);
    assert(sa.cycles_completed == sb.cycles_completed);
    assert(sa.cycles_completed == sc.cycles_completed);

    for (Stream s : all_streams()) {
        auto ref = slurp(stream_path(a, "det", s));
        assert(!ref.empty() || s == Stream::Refusals);
        assert(ref == slurp(stream_path(b, "det", s)));
        // Worker count is not part of the record
        assert(ref == slurp(stream_path(c, "det", s)));
    }

    for (const auto& d : {a, b, c}) std::filesystem::remove_all(d);
    std::cout << "  PASS" << std::endl;
}

void test_cycles_are_contiguous() {
    std::cout << "Testing one decision per integer cycle..." << std::endl;

    auto dir = temp_dir("contiguous");
    RunConfig cfg = base_config(dir, "seq");
    cfg.max_cycles = 15;
    SimulatedWorld world(cfg.world);
    DecisionLoop loop(cfg, world);
    auto summary = loop.run();
    assert(summary.stop_reason == "max_cycles");
    assert(summary.cycles_completed == 15);

    auto decisions = records(dir, "seq", Stream::Decisions);
    assert(decisions.size() == 15);
    for (size_t i = 0; i < decisions.size(); ++i) {
        assert(decisions[i]["cycle"] == static_cast<Cycle>(i + 1));
    }

    // Evidence never names a cycle that did not happen, and never goes backwards
    Cycle last = 0;
    for (const auto& e : records(dir, "seq", Stream::Evidence)) {
        Cycle k = e["cycle"].get<Cycle>();
        assert(k >= last && k >= 1 && k <= 15);
        last = k;
        validate_temporal_provenance(EvidenceEvent::from_json(e));
    }

    // The calibration phase comes first
    assert(decisions[0]["template"] == "baseline_replicates");
    assert(decisions[0]["regime"] == "pre_gate");

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_bankruptcy() {
    std::cout << "Testing refusals end in epistemic bankruptcy..." << std::endl;

    auto dir = temp_dir("bankrupt");
    RunConfig cfg = base_config(dir, "broke");
    cfg.world.artifact_probability = 0.0;
    cfg.spatial_qc.flag_threshold = 0.99;
    cfg.spatial_qc.severe_threshold = 0.99;
    CountingWorld world(cfg.world);
    DecisionLoop loop(cfg, world, CalibrationProfile::default_profile(),
                      std::make_unique<OverclaimingPolicy>());
    auto summary = loop.run();

    assert(summary.stop_reason == "epistemic_bankruptcy");
    assert(summary.cycles_completed == 4);
    assert(summary.refusals == 3);
    assert(world.calls == 1);
    assert(loop.state().beliefs().epistemic_insolvent);

    auto refusals = records(dir, "broke", Stream::Refusals);
    assert(refusals.size() == 3);
    for (size_t i = 0; i < refusals.size(); ++i) {
        assert(refusals[i]["cycle"] == static_cast<Cycle>(i + 2));
        assert(refusals[i]["refusal_reason"] == "epistemic_debt_action_blocked");
        assert(refusals[i]["blocked_by_threshold"] == true);
        assert(refusals[i]["consecutive_refusals"] == static_cast<int>(i + 1));
    }

    // A refused cycle spends nothing and changes no debt
    auto decisions = records(dir, "broke", Stream::Decisions);
    assert(decisions.size() == 4);
    assert(decisions[0]["outcome"] == "executed");
    double budget_after_first = decisions[0]["budget_after"].get<double>();
    double debt_after_first = loop.ledger().total_debt();
    assert(debt_after_first > cfg.debt.hard_threshold);
    for (size_t i = 1; i < decisions.size(); ++i) {
        assert(decisions[i]["outcome"] == "refused");
        assert(decisions[i]["budget_before"].get<double>() == budget_after_first);
        assert(decisions[i]["budget_after"].get<double>() == budget_after_first);
        assert(decisions[i]["debt_bits"].get<double>() == debt_after_first);
        assert(decisions[i]["reward"].is_null());
    }
    assert(loop.budget_remaining() == budget_after_first);

    // Only the refusal counters moved on refused cycles
    for (const auto& e : records(dir, "broke", Stream::Evidence)) {
        if (e["cycle"].get<Cycle>() < 2) continue;
        std::string belief = e["belief"];
        assert(belief == "consecutive_refusals" || belief == "refusals_total");
    }

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_mitigation_next_cycle() {
    std::cout << "Testing spatial mitigation runs as the next cycle..." << std::endl;

    auto dir = temp_dir("mitigation");
    RunConfig cfg = base_config(dir, "qc");
    cfg.max_cycles = 2;
    cfg.world.artifact_probability = 0.0;
    GradientWorld world(cfg.world, "c1-baseline_replicates", 0.1);
    DecisionLoop loop(cfg, world);
    auto summary = loop.run();
    assert(summary.stop_reason == "max_cycles");
    assert(summary.mitigations == 1);
    assert(!loop.pending_mitigation());

    auto decisions = records(dir, "qc", Stream::Decisions);
    assert(decisions.size() == 2);
    assert(decisions[0]["cycle_kind"] == "science");
    assert(decisions[1]["cycle"] == 2);
    assert(decisions[1]["cycle_kind"] == "mitigation");
    assert(decisions[1]["outcome"] == "mitigation");
    assert(decisions[1]["template"] == "mitigation_replate");
    assert(decisions[1]["forced"] == true);

    bool saw_choice = false, saw_outcome = false;
    for (const auto& d : records(dir, "qc", Stream::Diagnostics)) {
        if (d["type"] == "mitigation_choice") {
            saw_choice = true;
            assert(d["cycle"] == 1);
            assert(d["action"] == "replate");
        }
        if (d["type"] == "mitigation_outcome") {
            saw_outcome = true;
            assert(d["cycle_flagged"] == 1);
            assert(d["cycle_executed"] == 2);
            assert(d["statistic_before"].get<double>() > cfg.spatial_qc.severe_threshold);
            assert(d["statistic_after"].is_number());
            assert(d["statistic_after"].get<double>() < d["statistic_before"].get<double>());
        }
    }
    assert(saw_choice && saw_outcome);

    // Evidence from the mitigation cycle is tagged as such
    bool tagged = false;
    for (const auto& e : records(dir, "qc", Stream::Evidence)) {
        if (e["cycle"] == 2 && e["belief"] == "noise_df") {
            tagged = true;
            assert(e["cycle_kind"] == "mitigation");
        }
    }
    assert(tagged);

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_budget_exhaustion_summary() {
    std::cout << "Testing budget exhaustion and run summary..." << std::endl;

    auto dir = temp_dir("budget");
    RunConfig cfg = base_config(dir, "tight");
    cfg.budget_wells = 40;
    cfg.world.artifact_probability = 0.0;
    SimulatedWorld world(cfg.world);
    DecisionLoop loop(cfg, world);
    auto summary = loop.run();

    assert(summary.stop_reason == "budget_exhausted");
    assert(summary.cycles_completed >= 2);
    assert(loop.cheapest_action_cost() > loop.budget_remaining());
    assert(loop.budget_remaining() >= 0.0);

    auto path = summary_path(dir, "tight");
    assert(std::filesystem::exists(path));
    std::ifstream in(path);
    json saved = json::parse(in);
    assert(saved["stop_reason"] == "budget_exhausted");
    assert(saved["run_id"] == "tight");
    assert(saved["cycles_completed"] == summary.cycles_completed);
    assert(saved["error"].is_null());
    assert(saved["history"].size() == static_cast<size_t>(summary.cycles_completed));
    assert(saved["streams"]["decisions"]["records"] == static_cast<uint64_t>(summary.cycles_completed));

    auto diags = records(dir, "tight", Stream::Diagnostics);
    assert(diags.front()["type"] == "run_started");
    assert(diags.front()["cycle"] == 0);
    assert(diags.back()["type"] == "run_finished");
    assert(diags.back()["stop_reason"] == "budget_exhausted");

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_abort_is_recorded() {
    std::cout << "Testing fatal errors abort with a record..." << std::endl;

    auto dir = temp_dir("abort");
    RunConfig cfg = base_config(dir, "bad");
    ShortWorld world(2);
    DecisionLoop loop(cfg, world);

    bool threw = false;
    try {
        loop.run();
    } catch (const IntegrityViolation& e) {
        threw = true;
        assert(e.cycle() == 2);
        assert(e.field() == "world_results");
    }
    assert(threw);

    // Cycle 2 was closed on the way out, cycle 3 never began
    assert(!loop.state().in_cycle());
    assert(loop.state().last_cycle() == 2);

    auto diags = records(dir, "bad", Stream::Diagnostics);
    assert(diags.back()["type"] == "run_aborted");
    assert(diags.back()["error_type"] == "integrity_violation");
    assert(diags.back()["field"] == "world_results");

    auto decisions = records(dir, "bad", Stream::Decisions);
    assert(decisions.size() == 1);

    std::ifstream in(summary_path(dir, "bad"));
    json saved = json::parse(in);
    assert(saved["stop_reason"] == "aborted");
    assert(saved["error"].is_string());

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_horizon_shrinks_on_drift() {
    std::cout << "Testing horizon shrinks when noise drifts after the gate..." << std::endl;

    auto dir = temp_dir("horizon");
    RunConfig cfg = base_config(dir, "drift");
    cfg.max_cycles = 3;
    cfg.world.artifact_probability = 0.0;
    cfg.spatial_qc.flag_threshold = 0.99;
    cfg.spatial_qc.severe_threshold = 0.99;
    // One baseline plate is enough to stabilize the noise gate
    cfg.beliefs.gate = {1.5, 2.0, 10.0, 0.2, 1};
    cfg.beliefs.drift_window = 2;
    cfg.beliefs.drift_k = 1;

    std::vector<int> horizons;
    DriftingWorld world(cfg.world, 2, 0.5);
    DecisionLoop loop(cfg, world, CalibrationProfile::default_profile(),
                      std::make_unique<HorizonRecordingPolicy>(&horizons));
    auto summary = loop.run();
    assert(summary.stop_reason == "max_cycles");
    assert(horizons.size() == 3);

    // Baseline is taken when the gate first holds, not at run start
    const auto& history = loop.history();
    assert(history[0].template_name == "baseline_replicates");
    assert(loop.state().gate_state(NOISE_GATE) == GateState::Stable);
    assert(loop.horizon().baseline());
    double baseline = *loop.horizon().baseline();
    assert(baseline == history[0].uncertainty_bits);

    bool saw_baseline = false;
    for (const auto& d : records(dir, "drift", Stream::Diagnostics)) {
        if (d["type"] == "horizon_baseline") {
            assert(!saw_baseline);
            saw_baseline = true;
            assert(d["cycle"] == 1);
            assert(d["baseline_bits"].get<double>() == baseline);
        }
    }
    assert(saw_baseline);

    // Cycle 2 ran in the gate and its noisy center wells pushed drift up
    assert(history[1].regime == "in_gate");
    bool drifted = false;
    for (const auto& e : records(dir, "drift", Stream::Evidence)) {
        if (e["cycle"] == 2 && e["belief"] == "noise_drift") {
            drifted = e["new"].is_number() && e["new"].get<double>() >= cfg.beliefs.gate.drift;
        }
    }
    assert(drifted);
    assert(history[1].uncertainty_bits > baseline);

    assert(horizons[0] == cfg.horizon.base_horizon);
    assert(horizons[1] == cfg.horizon.base_horizon);
    assert(horizons[2] < cfg.horizon.base_horizon);
    assert(horizons[2] == loop.horizon().horizon(history[1].uncertainty_bits));

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_run_id_single_use() {
    std::cout << "Testing a run id cannot be reused in one log directory..." << std::endl;

    auto dir = temp_dir("reuse");
    RunConfig cfg = base_config(dir, "");
    cfg.max_cycles = 3;
    std::string run_id = cfg.effective_run_id();
    {
        SimulatedWorld world(cfg.world);
        DecisionLoop first(cfg, world);
        auto s = first.run();
        assert(s.cycles_completed == 3);
    }

    std::map<Stream, std::string> before;
    for (Stream s : all_streams()) before[s] = slurp(stream_path(dir, run_id, s));
    std::string summary_before = slurp(summary_path(dir, run_id));

    SimulatedWorld world(cfg.world);
    DecisionLoop second(cfg, world);
    bool threw = false;
    try {
        second.run();
    } catch (const Error& e) {
        threw = true;
        assert(std::string(e.what()).find(run_id) != std::string::npos);
    }
    assert(threw);
    assert(second.state().last_cycle() == 0);

    // The first run's record is untouched
    for (Stream s : all_streams()) assert(slurp(stream_path(dir, run_id, s)) == before[s]);
    assert(slurp(summary_path(dir, run_id)) == summary_before);
    auto decisions = records(dir, run_id, Stream::Decisions);
    assert(decisions.size() == 3);
    assert(decisions.back()["cycle"] == 3);

    // A fresh run id in the same directory is fine
    RunConfig other = cfg;
    other.run_id = "second";
    SimulatedWorld world2(other.world);
    DecisionLoop third(other, world2);
    assert(third.run().cycles_completed == 3);

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_stop_request() {
    std::cout << "Testing stop request between cycles..." << std::endl;

    auto dir = temp_dir("stop");
    RunConfig cfg = base_config(dir, "halt");
    SimulatedWorld world(cfg.world);
    DecisionLoop loop(cfg, world);
    loop.request_stop();
    auto summary = loop.run();
    assert(summary.stop_reason == "stop_requested");
    assert(summary.cycles_completed == 0);
    assert(records(dir, "halt", Stream::Decisions).empty());

    std::filesystem::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

void test_invalid_config_rejected() {
    std::cout << "Testing loop rejects invalid config..." << std::endl;

    RunConfig cfg = base_config(temp_dir("invalid"), "x");
    cfg.debt.calibration_templates = {"ldh_baseline"};
    SimulatedWorld world;
    bool threw = false;
    try {
        DecisionLoop loop(cfg, world);
    } catch (const ConfigError& e) {
        threw = true;
        assert(e.key() == "policy.calibration_template");
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Episteme Loop Tests ===" << std::endl;
    log::set_quiet(true);

    test_repeatable_runs();
    test_cycles_are_contiguous();
    test_bankruptcy();
    test_mitigation_next_cycle();
    test_budget_exhaustion_summary();
    test_abort_is_recorded();
    test_horizon_shrinks_on_drift();
    test_run_id_single_use();
    test_stop_request();
    test_invalid_config_rejected();

    std::cout << "\nAll loop tests passed!" << std::endl;
    return 0;
}
