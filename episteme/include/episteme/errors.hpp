#pragma once
// Fatal error taxonomy
//
// TemporalProvenanceError: an evidence record lacks a required evidence
//   time, or its evidence predates the timepoint it makes a claim about.
// IntegrityViolation: cycle counter reused/skipped/out of order, a belief
//   written outside an update transaction, mitigation timing broken.
// ConfigError: invalid run configuration or calibration profile.
//
// All three abort the run. Refusals and mitigation deferrals are not
// errors and never travel through here.

#include <optional>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace episteme {

using Cycle = int64_t;

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class TemporalProvenanceError : public Error {
public:
    TemporalProvenanceError(Cycle cycle, std::string belief, std::string detail,
                            std::optional<double> evidence_time_h = std::nullopt,
                            std::optional<double> claim_time_h = std::nullopt)
        : Error(format(cycle, belief, detail, evidence_time_h, claim_time_h))
        , cycle_(cycle)
        , belief_(std::move(belief))
        , evidence_time_h_(evidence_time_h)
        , claim_time_h_(claim_time_h) {}

    Cycle cycle() const { return cycle_; }
    const std::string& belief() const { return belief_; }
    std::optional<double> evidence_time_h() const { return evidence_time_h_; }
    std::optional<double> claim_time_h() const { return claim_time_h_; }

private:
    static std::string fmt_time(std::optional<double> t) {
        return t ? std::to_string(*t) + "h" : std::string("null");
    }

    static std::string format(Cycle cycle, const std::string& belief,
                              const std::string& detail,
                              std::optional<double> evidence_time_h,
                              std::optional<double> claim_time_h) {
        return "temporal provenance violation at cycle " + std::to_string(cycle) +
               " belief '" + belief + "': " + detail +
               " (evidence_time=" + fmt_time(evidence_time_h) +
               ", claim_time=" + fmt_time(claim_time_h) + ")";
    }

    Cycle cycle_;
    std::string belief_;
    std::optional<double> evidence_time_h_;
    std::optional<double> claim_time_h_;
};

class IntegrityViolation : public Error {
public:
    IntegrityViolation(Cycle cycle, std::string field, std::string value,
                       const std::string& detail)
        : Error("integrity violation at cycle " + std::to_string(cycle) +
                " field '" + field + "' value '" + value + "': " + detail)
        , cycle_(cycle)
        , field_(std::move(field))
        , value_(std::move(value)) {}

    Cycle cycle() const { return cycle_; }
    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    Cycle cycle_;
    std::string field_;
    std::string value_;
};

class ConfigError : public Error {
public:
    ConfigError(std::string key, const std::string& detail)
        : Error("config error '" + key + "': " + detail)
        , key_(std::move(key)) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace episteme
