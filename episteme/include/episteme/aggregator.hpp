#pragma once
// Observation aggregator
//
// Folds raw well results into condition summaries. Results are consumed
// in proposal order (by index, not by arrival), so the output does not
// depend on how the world parallelized the work. The SNR filter runs on
// the summaries and its masks flow back into the per-well layout.

#include "errors.hpp"
#include "observation.hpp"
#include "snr_filter.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <vector>

namespace episteme {

namespace detail {

// Per-well scalar: mean over the given channels, unknown if any is masked
inline Reading well_scalar(const RawWellResult& r, const std::set<std::string>& masked) {
    std::vector<Reading> values;
    for (const auto& [ch, v] : r.channels) {
        values.push_back(masked.count(ch) ? Reading::unknown() : Reading::known(v));
    }
    return mean_of(values);
}

} // namespace detail

inline Observation aggregate(Cycle cycle, const Proposal& proposal,
                             const std::vector<RawWellResult>& raw,
                             const SnrFilter& filter) {
    if (raw.size() != proposal.wells.size()) {
        throw IntegrityViolation(cycle, "world_results", std::to_string(raw.size()),
                                 "expected " + std::to_string(proposal.wells.size()) +
                                 " results for design " + proposal.design_id);
    }

    // Place each result at its proposal index
    std::vector<const RawWellResult*> ordered(raw.size(), nullptr);
    for (const auto& r : raw) {
        if (r.index >= ordered.size() || ordered[r.index] != nullptr) {
            throw IntegrityViolation(cycle, "world_results.index", std::to_string(r.index),
                                     "duplicate or out-of-range well index");
        }
        ordered[r.index] = &r;
    }

    std::vector<ConditionKey> order;
    std::map<ConditionKey, std::vector<const RawWellResult*>> groups;
    for (const auto* r : ordered) {
        auto key = ConditionKey::of(r->spec);
        auto it = groups.find(key);
        if (it == groups.end()) {
            order.push_back(key);
            groups[key].push_back(r);
        } else {
            it->second.push_back(r);
        }
    }

    std::vector<ConditionSummary> summaries;
    summaries.reserve(order.size());
    for (const auto& key : order) {
        const auto& wells = groups[key];
        ConditionSummary s;
        s.key = key;
        s.n_wells = wells.size();

        std::map<std::string, std::vector<Reading>> per_channel;
        std::vector<Reading> scalars;
        for (const auto* w : wells) {
            for (const auto& [ch, v] : w->channels) per_channel[ch].push_back(Reading::known(v));
            scalars.push_back(detail::well_scalar(*w, {}));
        }
        for (const auto& [ch, values] : per_channel) {
            // A channel missing from some wells cannot be summarized honestly
            if (values.size() != wells.size()) {
                s.channel_means[ch] = Reading::unknown();
                s.channel_stds[ch] = Reading::unknown();
                continue;
            }
            s.channel_means[ch] = mean_of(values);
            s.channel_stds[ch] = stddev_of(values);
        }
        s.mean = mean_of(scalars);
        s.stddev = stddev_of(scalars);
        summaries.push_back(std::move(s));
    }

    auto disabled = filter.disabled_channels(summaries);
    auto filtered = filter.apply(std::move(summaries));

    std::map<std::string, std::set<std::string>> masked_by_condition;
    for (const auto& c : filtered.kept) {
        masked_by_condition[c.key.str()].insert(c.masked_channels.begin(), c.masked_channels.end());
    }
    std::set<std::string> dropped_keys;
    for (const auto& d : filtered.dropped) dropped_keys.insert(d.condition);

    Observation obs;
    obs.design_id = proposal.design_id;
    obs.template_name = proposal.template_name;
    obs.kind = proposal.kind;
    obs.conditions = std::move(filtered.kept);
    obs.dropped = std::move(filtered.dropped);
    obs.wells_spent = raw.size();
    obs.snr_summary = std::move(filtered.summary);
    obs.snr_summary["disabled_channels"] = disabled;
    json reasons = json::object();
    for (const auto& ch : disabled) reasons[ch] = filter.profile().unobservable_reason(ch);
    obs.snr_summary["disabled_reasons"] = reasons;

    for (const auto* w : ordered) {
        std::string cond = ConditionKey::of(w->spec).str();
        WellReading wr;
        wr.well_id = w->well_id;
        wr.plate = w->plate;
        wr.row = w->row;
        wr.col = w->col;
        wr.condition = cond;
        if (dropped_keys.count(cond)) {
            wr.value = Reading::unknown();
        } else {
            wr.value = detail::well_scalar(*w, masked_by_condition[cond]);
        }
        obs.layout.push_back(std::move(wr));
        obs.evidence_time_h = std::max(obs.evidence_time_h, w->spec.time_h);
    }
    return obs;
}

} // namespace episteme
