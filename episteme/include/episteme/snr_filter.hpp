#pragma once
// Noise-floor / SNR filter
//
// Minimum detectable signal per channel:
//   mds = floor_mean + max(k_sigma * floor_sigma, 3 * quant_step)
//
// Strict mode: a condition with any channel mean below its mds is dropped
// before belief update.
// Lenient mode: the condition is kept, dim channels are masked to unknown
// (never zeroed), and the condition carries warnings.
//
// Channels whose floor is not observable are not filtered; the loop
// records that fact as an exempt belief so the gap is visible.

#include "calibration.hpp"
#include "log.hpp"
#include "observation.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

struct SnrConfig {
    double k_sigma = 5.0;             // Threshold in units of floor sigma
    bool strict = false;              // Drop whole condition on any dim channel
    double quant_multiplier = 3.0;    // Quantization term: 3 LSB
    double tie_lsb = 2.0;             // Deltas within 2 LSB are ties
};

enum class ChannelCheck : uint8_t {
    Above,
    Below,
    Disabled,     // Floor not observable for this channel
};

class SnrFilter {
public:
    struct Result {
        std::vector<ConditionSummary> kept;
        std::vector<DroppedCondition> dropped;
        json summary;
    };

    explicit SnrFilter(CalibrationProfile profile, SnrConfig config = {})
        : profile_(std::move(profile)), config_(config) {}

    const SnrConfig& config() const { return config_; }
    const CalibrationProfile& profile() const { return profile_; }

    bool enabled_for(const std::string& channel) const {
        return profile_.channel_observable(channel);
    }

    std::optional<double> minimum_detectable_signal(const std::string& channel) const {
        if (!enabled_for(channel)) return std::nullopt;
        const ChannelFloor* f = profile_.channel(channel);
        double gaussian = config_.k_sigma * f->floor_sigma;
        double quant = f->quant_step ? config_.quant_multiplier * *f->quant_step : 0.0;
        return f->floor_mean + std::max(gaussian, quant);
    }

    ChannelCheck check(const std::string& channel, double signal) const {
        auto mds = minimum_detectable_signal(channel);
        if (!mds) return ChannelCheck::Disabled;
        return signal >= *mds ? ChannelCheck::Above : ChannelCheck::Below;
    }

    // Quantization-aware comparison: |delta| <= tie_lsb * LSB is a tie.
    // Without a known LSB any nonzero delta counts.
    bool is_significant_difference(double delta, const std::string& channel) const {
        const ChannelFloor* f = profile_.channel(channel);
        if (!f || !f->quant_step) return delta != 0.0;
        return std::fabs(delta) > config_.tie_lsb * *f->quant_step;
    }

    bool is_significant_difference(const Reading& delta, const std::string& channel) const {
        auto d = delta.get();
        return d && is_significant_difference(*d, channel);
    }

    // Channels present in the data whose floor cannot be enforced
    std::vector<std::string> disabled_channels(const std::vector<ConditionSummary>& conditions) const {
        std::vector<std::string> out;
        for (const auto& c : conditions) {
            for (const auto& [ch, _] : c.channel_means) {
                if (!enabled_for(ch) && std::find(out.begin(), out.end(), ch) == out.end()) {
                    out.push_back(ch);
                }
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    Result apply(std::vector<ConditionSummary> conditions) const {
        Result result;
        size_t n_total = conditions.size();
        size_t n_masked = 0;

        for (auto& cond : conditions) {
            std::vector<std::string> dim;
            for (const auto& [ch, reading] : cond.channel_means) {
                if (!enabled_for(ch)) continue;
                auto v = reading.get();
                if (!v) {
                    dim.push_back(ch);
                    cond.snr_warnings.push_back(ch + ": already unknown");
                    continue;
                }
                if (check(ch, *v) == ChannelCheck::Below) {
                    dim.push_back(ch);
                    char buf[160];
                    std::snprintf(buf, sizeof(buf), "%s: signal %.4f below minimum detectable %.4f",
                                  ch.c_str(), *v, *minimum_detectable_signal(ch));
                    cond.snr_warnings.push_back(buf);
                }
            }

            if (dim.empty()) {
                result.kept.push_back(std::move(cond));
                continue;
            }

            if (config_.strict) {
                log_warn("snr", "rejected %s (%zu dim channels)", cond.key.str().c_str(), dim.size());
                std::string reason = "snr_below_floor:";
                for (size_t i = 0; i < dim.size(); ++i) {
                    reason += (i ? "," : "") + dim[i];
                }
                result.dropped.push_back({cond.key.str(), cond.n_wells, reason});
                continue;
            }

            for (const auto& ch : dim) {
                cond.channel_means[ch] = Reading::unknown();
                cond.channel_stds[ch] = Reading::unknown();
            }
            cond.masked_channels = dim;
            // Scalar summaries are built from every channel
            cond.mean = Reading::unknown();
            cond.stddev = Reading::unknown();
            ++n_masked;
            log_debug("snr", "masked %zu channels in %s", dim.size(), cond.key.str().c_str());
            result.kept.push_back(std::move(cond));
        }

        json mds = json::object();
        for (const auto& ch : profile_.channel_names()) {
            mds[ch] = finite_or_null(minimum_detectable_signal(ch));
        }
        result.summary = {
            {"enabled", profile_.floor_observable()},
            {"strict", config_.strict},
            {"k_sigma", config_.k_sigma},
            {"n_conditions", n_total},
            {"n_rejected", result.dropped.size()},
            {"n_masked", n_masked},
            {"minimum_detectable", mds},
        };
        return result;
    }

private:
    CalibrationProfile profile_;
    SnrConfig config_;
};

} // namespace episteme
