#pragma once
// World: whatever executes a proposal and measures wells
//
// The loop only sees the abstract World. SimulatedWorld is a
// deterministic stand-in used by the CLI and tests:
// - 96-well plates (rows A-H, columns 01-12); edge = outer ring
// - well placement shuffled by the proposal's layout seed
// - per-well noise seeded from (seed, design id, well index) only
// - optional worker threads; results are stored by input index, so the
//   worker count never changes the output
// - optional spatial artifact: a column gradient on some plates, drawn
//   per (design id, plate), so a replate draws again

#include "errors.hpp"
#include "log.hpp"
#include "observation.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace episteme {

class World {
public:
    virtual ~World() = default;
    virtual const char* name() const = 0;

    // One result per proposal well, each tagged with its input index.
    // Throws on failure; a partial result is never returned.
    virtual std::vector<RawWellResult> execute(const Proposal& proposal) = 0;
};

constexpr int PLATE_ROWS = 8;
constexpr int PLATE_COLS = 12;

inline bool is_edge_well(int row, int col) {
    return row == 0 || row == PLATE_ROWS - 1 || col == 0 || col == PLATE_COLS - 1;
}

inline std::string well_name(int row, int col) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02d", 'A' + row, col + 1);
    return buf;
}

constexpr double PI = 3.14159265358979323846;

// splitmix64: tiny, fast, identical on every platform
class SplitMix64 {
public:
    explicit SplitMix64(uint64_t seed) : state_(seed) {}

    uint64_t next() {
        uint64_t z = (state_ += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    // Uniform in (0, 1)
    double uniform() {
        return (static_cast<double>(next() >> 11) + 0.5) * (1.0 / 9007199254740992.0);
    }

    // Standard normal (Box-Muller)
    double normal() {
        double u1 = uniform();
        double u2 = uniform();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * PI * u2);
    }

    uint64_t below(uint64_t n) { return n == 0 ? 0 : next() % n; }

private:
    uint64_t state_;
};

struct PlateSlot {
    int plate;
    int row;
    int col;
};

// Wells of each position class fill the plate in row-major order; the
// layout seed permutes which well lands in which slot. When a plate runs
// out the next plate is opened.
inline std::vector<PlateSlot> place_wells(const Proposal& proposal) {
    std::vector<std::pair<int, int>> center_slots, edge_slots;
    for (int r = 0; r < PLATE_ROWS; ++r) {
        for (int c = 0; c < PLATE_COLS; ++c) {
            (is_edge_well(r, c) ? edge_slots : center_slots).emplace_back(r, c);
        }
    }

    std::vector<PlateSlot> out;
    out.reserve(proposal.wells.size());
    std::vector<size_t> center_idx, edge_idx;
    for (size_t i = 0; i < proposal.wells.size(); ++i) {
        const auto& w = proposal.wells[i];
        size_t k = w.position == Position::Edge ? edge_idx.size() : center_idx.size();
        const auto& pool = w.position == Position::Edge ? edge_slots : center_slots;
        const auto& s = pool[k % pool.size()];
        out.push_back({static_cast<int>(k / pool.size()), s.first, s.second});
        (w.position == Position::Edge ? edge_idx : center_idx).push_back(i);
    }

    // Permute slots among wells of the same class (Fisher-Yates)
    SplitMix64 rng(proposal.layout_seed ^ 0x5bd1e995ULL);
    auto permute = [&rng, &out](const std::vector<size_t>& idx) {
        for (size_t i = idx.size(); i > 1; --i) {
            std::swap(out[idx[i - 1]], out[idx[rng.below(i)]]);
        }
    };
    permute(center_idx);
    permute(edge_idx);
    return out;
}

struct CompoundModel {
    double ec50_uM = 1.0;
    double emax = 0.4;        // Max fractional drop in signal
    double hill = 1.0;
    double tau_h = 24.0;      // Time constant of onset
};

struct SimulatedWorldConfig {
    uint64_t seed = 42;
    int workers = 1;
    double well_cv = 0.05;            // Shared by all channels of a well
    double channel_cv = 0.02;         // Independent per channel
    double edge_effect = 0.08;        // Fractional signal loss at the edge
    double artifact_probability = 0.05;
    double artifact_gradient = 0.35;  // Left-to-right fractional swing
    std::map<std::string, double> channel_base = {
        {"er", 1.00}, {"mito", 1.20}, {"nucleus", 0.90}, {"actin", 1.10}, {"rna", 0.80}};
    double ldh_base = 0.60;
    std::map<std::string, CompoundModel> compounds = {
        {"tunicamycin", {1.0, 0.6, 1.5, 24.0}},
        {"staurosporine", {0.1, 0.8, 1.2, 12.0}},
        {"nocodazole", {0.5, 0.5, 1.0, 18.0}},
    };

    json to_json() const {
        return {
            {"seed", seed},
            {"workers", workers},
            {"well_cv", well_cv},
            {"channel_cv", channel_cv},
            {"edge_effect", edge_effect},
            {"artifact_probability", artifact_probability},
            {"artifact_gradient", artifact_gradient},
        };
    }
};

class SimulatedWorld : public World {
public:
    explicit SimulatedWorld(SimulatedWorldConfig config = {})
        : config_(std::move(config)) {
        if (config_.workers < 1) config_.workers = 1;
    }

    const char* name() const override { return "simulated"; }
    const SimulatedWorldConfig& config() const { return config_; }

    std::vector<RawWellResult> execute(const Proposal& proposal) override {
        auto slots = place_wells(proposal);
        std::vector<RawWellResult> results(proposal.wells.size());

        size_t n = proposal.wells.size();
        size_t workers = std::min<size_t>(static_cast<size_t>(config_.workers), std::max<size_t>(n, 1));
        if (workers <= 1) {
            for (size_t i = 0; i < n; ++i) results[i] = measure(proposal, slots, i);
        } else {
            // Strided partition; each slot is written by exactly one thread
            std::vector<std::thread> threads;
            threads.reserve(workers);
            for (size_t t = 0; t < workers; ++t) {
                threads.emplace_back([&, t]() {
                    for (size_t i = t; i < n; i += workers) {
                        results[i] = measure(proposal, slots, i);
                    }
                });
            }
            for (auto& th : threads) th.join();
        }
        log_debug("world", "%s: %zu wells on %d workers", proposal.design_id.c_str(), n,
                  static_cast<int>(workers));
        return results;
    }

    // Whether this plate of this design carries a column gradient
    bool has_artifact(const std::string& design_id, int plate) const {
        if (config_.artifact_probability <= 0.0) return false;
        SplitMix64 rng(mix_seed(config_.seed, "artifact:" + design_id, static_cast<uint64_t>(plate)));
        return rng.uniform() < config_.artifact_probability;
    }

private:
    RawWellResult measure(const Proposal& proposal, const std::vector<PlateSlot>& slots,
                          size_t index) const {
        const WellSpec& spec = proposal.wells[index];
        const PlateSlot& slot = slots[index];

        RawWellResult r;
        r.index = index;
        r.plate = slot.plate;
        r.row = slot.row;
        r.col = slot.col;
        r.well_id = well_name(slot.row, slot.col);
        r.spec = spec;

        SplitMix64 rng(mix_seed(config_.seed, proposal.design_id, index));
        double well_factor = 1.0 + config_.well_cv * rng.normal();
        double response = 1.0 - drop(spec);
        double position = spec.position == Position::Edge ? 1.0 - config_.edge_effect : 1.0;
        double artifact = 1.0;
        if (has_artifact(proposal.design_id, slot.plate)) {
            double centered = (slot.col - (PLATE_COLS - 1) / 2.0) / ((PLATE_COLS - 1) / 2.0);
            artifact = 1.0 + 0.5 * config_.artifact_gradient * centered;
        }

        if (spec.assay == "ldh") {
            // LDH release rises as cells die
            double v = config_.ldh_base * (1.0 + 2.0 * (1.0 - response)) * well_factor *
                       artifact * (1.0 + config_.channel_cv * rng.normal());
            r.channels["ldh"] = std::max(0.0, v);
            return r;
        }

        for (const auto& [ch, base] : config_.channel_base) {
            double v = base * response * position * artifact * well_factor *
                       (1.0 + config_.channel_cv * rng.normal());
            r.channels[ch] = std::max(0.0, v);
        }
        return r;
    }

    double drop(const WellSpec& spec) const {
        if (spec.is_vehicle() || spec.dose_uM <= 0.0) return 0.0;
        CompoundModel m;
        auto it = config_.compounds.find(spec.compound);
        if (it != config_.compounds.end()) m = it->second;
        double dh = std::pow(spec.dose_uM, m.hill);
        double occupancy = dh / (dh + std::pow(m.ec50_uM, m.hill));
        double onset = 1.0 - std::exp(-spec.time_h / m.tau_h);
        return m.emax * occupancy * onset;
    }

    SimulatedWorldConfig config_;
};

} // namespace episteme
