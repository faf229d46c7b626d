#pragma once
// Episteme: decision and accounting core of an autonomous experimenter
//
// - Types: Reading (known value or explicit unknown), conditions, proposals
// - Evidence: belief ledger with temporal provenance, updater transactions
// - Gates: hysteresis state machine over pooled noise statistics
// - Debt: claims vs realized information gain, cost inflation, refusals
// - Filters: SNR noise floor, spatial QC with deferred mitigation
// - Loop: one integer cycle at a time against an external World

#include "version.hpp"
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "statistics.hpp"
#include "observation.hpp"
#include "calibration.hpp"
#include "snr_filter.hpp"
#include "aggregator.hpp"
#include "evidence.hpp"
#include "event_log.hpp"
#include "gate.hpp"
#include "belief_state.hpp"
#include "updaters/standard.hpp"
#include "debt.hpp"
#include "penalty.hpp"
#include "mitigation.hpp"
#include "world.hpp"
#include "policy.hpp"
#include "config.hpp"
#include "loop.hpp"
