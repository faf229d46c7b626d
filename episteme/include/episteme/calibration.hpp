#pragma once
// Calibration profile: per-channel detector noise floor
//
// Read-only input produced by a separate calibration run. Per channel it
// carries the floor mean/sigma measured on blank wells, the quantization
// step of the detector (if known), and the safe dynamic range. A channel
// whose floor could not be observed carries observable=false and a reason.
//
// JSON layout:
//   {
//     "floor_observable": true,
//     "floor_reason": "",
//     "channels": {
//       "er": {"floor_mean": 0.2645, "floor_sigma": 0.0285,
//              "quant_step": 0.005, "safe_min": 0.0, "safe_max": 4.0,
//              "observable": true, "reason": ""}
//     }
//   }

#include "types.hpp"
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace episteme {

struct ChannelFloor {
    double floor_mean = 0.0;
    double floor_sigma = 0.0;
    std::optional<double> quant_step;     // Detector LSB in AU
    std::optional<double> safe_min;       // Dynamic range bounds
    std::optional<double> safe_max;
    bool observable = true;
    std::string reason;                   // Why not observable
};

class CalibrationProfile {
public:
    CalibrationProfile() = default;

    // Cell Painting channels plus the LDH readout, all observable
    static CalibrationProfile default_profile() {
        CalibrationProfile p;
        p.floor_observable_ = true;
        for (const char* ch : {"er", "mito", "nucleus", "actin", "rna"}) {
            ChannelFloor f;
            f.floor_mean = 0.2645;
            f.floor_sigma = 0.0285;
            f.quant_step = 0.005;
            f.safe_min = 0.0;
            f.safe_max = 4.0;
            p.channels_[ch] = f;
        }
        ChannelFloor ldh;
        ldh.floor_mean = 0.05;
        ldh.floor_sigma = 0.01;
        ldh.quant_step = 0.001;
        ldh.safe_min = 0.0;
        ldh.safe_max = 3.0;
        p.channels_["ldh"] = ldh;
        return p;
    }

    static CalibrationProfile from_json(const json& j) {
        CalibrationProfile p;
        p.floor_observable_ = j.value("floor_observable", true);
        p.floor_reason_ = j.value("floor_reason", "");
        if (j.contains("channels")) {
            if (!j["channels"].is_object()) {
                throw ConfigError("channels", "calibration channels must be an object");
            }
            for (const auto& [name, cj] : j["channels"].items()) {
                ChannelFloor f;
                f.observable = cj.value("observable", true);
                f.reason = cj.value("reason", "");
                auto mean = optional_double(cj, "floor_mean");
                auto sigma = optional_double(cj, "floor_sigma");
                if (!mean || !sigma) {
                    // A floor without numbers cannot be enforced
                    f.observable = false;
                    if (f.reason.empty()) f.reason = "floor_mean/floor_sigma missing";
                } else {
                    if (*sigma < 0.0) {
                        throw ConfigError("channels." + name + ".floor_sigma", "must be >= 0");
                    }
                    f.floor_mean = *mean;
                    f.floor_sigma = *sigma;
                }
                f.quant_step = optional_double(cj, "quant_step");
                if (f.quant_step && *f.quant_step <= 0.0) f.quant_step.reset();
                f.safe_min = optional_double(cj, "safe_min");
                f.safe_max = optional_double(cj, "safe_max");
                p.channels_[name] = f;
            }
        }
        return p;
    }

    static CalibrationProfile load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ConfigError("calibration", "cannot open " + path);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw ConfigError("calibration", path + ": " + e.what());
        }
        return from_json(j);
    }

    json to_json() const {
        json chans = json::object();
        for (const auto& [name, f] : channels_) {
            chans[name] = {
                {"floor_mean", f.floor_mean},
                {"floor_sigma", f.floor_sigma},
                {"quant_step", finite_or_null(f.quant_step)},
                {"safe_min", finite_or_null(f.safe_min)},
                {"safe_max", finite_or_null(f.safe_max)},
                {"observable", f.observable},
                {"reason", f.reason},
            };
        }
        return {
            {"floor_observable", floor_observable_},
            {"floor_reason", floor_reason_},
            {"channels", chans},
        };
    }

    bool floor_observable() const { return floor_observable_; }
    const std::string& floor_reason() const { return floor_reason_; }

    // Per-channel observability (profile-level flag wins)
    bool channel_observable(const std::string& channel) const {
        if (!floor_observable_) return false;
        auto it = channels_.find(channel);
        return it != channels_.end() && it->second.observable;
    }

    std::string unobservable_reason(const std::string& channel) const {
        if (!floor_observable_) {
            return floor_reason_.empty() ? "floor not observable" : floor_reason_;
        }
        auto it = channels_.find(channel);
        if (it == channels_.end()) return "channel not in calibration profile";
        return it->second.reason.empty() ? "floor not observable" : it->second.reason;
    }

    const ChannelFloor* channel(const std::string& name) const {
        auto it = channels_.find(name);
        return it == channels_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> channel_names() const {
        std::vector<std::string> out;
        for (const auto& [name, _] : channels_) out.push_back(name);
        return out;
    }

    void set_channel(const std::string& name, ChannelFloor floor) { channels_[name] = floor; }
    void set_floor_observable(bool observable, std::string reason = {}) {
        floor_observable_ = observable;
        floor_reason_ = std::move(reason);
    }

private:
    bool floor_observable_ = true;
    std::string floor_reason_;
    std::map<std::string, ChannelFloor> channels_;
};

} // namespace episteme
