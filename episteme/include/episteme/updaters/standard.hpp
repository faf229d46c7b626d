#pragma once
// Standard updater order: Noise -> Edge -> Response -> AssayGate
//
// The order is part of the contract: the response updater reads the
// sigma the noise updater just pooled, and event sequences must be
// reproducible across runs.

#include "assay_gate.hpp"
#include "edge.hpp"
#include "noise.hpp"
#include "response.hpp"
#include <memory>
#include <vector>

namespace episteme {

inline std::vector<std::unique_ptr<BeliefUpdater>> standard_updaters(const SnrFilter* filter) {
    std::vector<std::unique_ptr<BeliefUpdater>> updaters;
    updaters.push_back(std::make_unique<NoiseUpdater>());
    updaters.push_back(std::make_unique<EdgeUpdater>(filter));
    updaters.push_back(std::make_unique<ResponseUpdater>());
    updaters.push_back(std::make_unique<AssayGateUpdater>());
    return updaters;
}

} // namespace episteme
