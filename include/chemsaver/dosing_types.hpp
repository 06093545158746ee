#pragma once

// Shared record types for the Chemical Saver dosage engine.
//
// All rates are canonical: gross fluid in barrels/day (BPD), chemical in
// gallons/day (GPD). Display units are a consumer concern.

#include <cstdint>
#include <limits>

namespace chemsaver {

// One production telemetry tick, as delivered by the external source.
// Missing numeric fields are NaN. A missing timestamp is has_timestamp=false.
struct ProductionSample final {
  bool    has_timestamp = false;
  int64_t timestamp = 0;  // unix seconds, expected non-decreasing per well

  double gross_fluid_rate = std::numeric_limits<double>::quiet_NaN();       // BPD, >= 0
  double water_cut = std::numeric_limits<double>::quiet_NaN();              // percent, [0, 100]
  double current_injection_rate = std::numeric_limits<double>::quiet_NaN(); // GPD, >= 0, required
};

// Dosing status of an emitted result.
// ERROR and NO_DATA are never produced by the classifier; the orchestrator
// uses them to tag ticks that produced no recommendation.
enum class StatusFlag : uint8_t {
  OPTIMAL = 0,
  OVER_DOSING = 1,
  UNDER_DOSING = 2,
  PUMP_OFF = 3,
  ERROR = 4,
  NO_DATA = 5
};

// What the pipeline did with a tick.
enum class Outcome : uint8_t {
  EMITTED = 0,            // result produced (possibly from substituted values)
  REJECTED = 1,           // invalid input, nothing recoverable
  SUPPRESSED_STALE = 2,   // nothing trustworthy within the silence window
  CONFIGURATION_ERROR = 3 // settings make the arithmetic undefined
};

// Bit flags for explainability (OR together).
enum DosingFlags : uint32_t {
  FLAG_NONE                  = 0,
  FLAG_TIMESTAMP_MISSING     = 1u << 0,
  FLAG_FLOW_NEGATIVE         = 1u << 1,
  FLAG_INJECTION_INVALID     = 1u << 2,  // negative or missing pump rate
  FLAG_FLOW_MISSING          = 1u << 3,  // substituted with 0
  FLAG_WATER_CUT_SUBSTITUTED = 1u << 4,  // carried forward from history
  FLAG_WATER_CUT_NO_HISTORY  = 1u << 5,  // invalid and nothing to carry forward
  FLAG_NON_MONOTONIC         = 1u << 6,  // timestamp older than last accepted
  FLAG_SPIKE_REJECTED        = 1u << 7,  // implausible flow rate-of-change
  FLAG_PRIOR_SUBSTITUTED     = 1u << 8,  // downstream math used last accepted values
  FLAG_STALE                 = 1u << 9,
  FLAG_CONFIG_INVALID        = 1u << 10,
  FLAG_CLAMPED_MIN           = 1u << 11,
  FLAG_CLAMPED_MAX           = 1u << 12
};

// One recommendation, echoed to the external results store.
struct OptimizationResult final {
  int64_t timestamp = 0;
  double recommended_rate_gpd = 0.0;    // after the pump envelope clamp
  double unconstrained_rate_gpd = 0.0;  // calculator output before the clamp
  double actual_rate_gpd = 0.0;         // telemetry, never clamped
  double savings_opportunity_usd = 0.0; // + = over-dosing waste, - = under-dosing risk
  StatusFlag status_flag = StatusFlag::NO_DATA;

  double water_bpd = 0.0;
  double current_ppm = 0.0;  // concentration delivered by the actual rate
  int    target_ppm = 0;
  uint32_t flags = FLAG_NONE;
};

} // namespace chemsaver
