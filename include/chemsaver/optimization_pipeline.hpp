#pragma once

// Dosage optimization pipeline for one well's telemetry stream.
//
// Per tick: validate -> spike filter -> staleness gate -> compute -> clamp ->
// classify -> evaluate money -> advance StreamState.
//
// The pipeline object holds configuration only. All history lives in the
// StreamState the caller passes in, so one pipeline may serve many wells as
// long as each well has its own state.

#include "chemsaver/dosage_model.hpp"
#include "chemsaver/dosing_types.hpp"
#include "chemsaver/record_validator.hpp"
#include "chemsaver/stream_state.hpp"
#include "chemsaver/well_settings.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chemsaver {

// Engine-wide policy parameters. Explicit and auditable.
struct PipelineConfig final {
  double  spike_threshold_percent = kDefaultSpikeThresholdPercent;
  int64_t spike_window_s = kDefaultSpikeWindowSeconds;
  int64_t staleness_window_s = kDefaultStalenessWindowSeconds;
  double  status_tolerance = kDefaultStatusTolerance;
  UnderDosingPolicy under_dosing_policy = UnderDosingPolicy::SIGNED_RISK_COST;
};

// Everything the pipeline decided for one tick.
struct PipelineOutput final {
  Outcome outcome = Outcome::REJECTED;
  bool emitted = false;          // result is meaningful only when true
  OptimizationResult result;
  ValidationStatus validation = ValidationStatus::REJECTED;
  uint32_t flags = FLAG_NONE;    // union of every reason seen on this tick
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  // Tag used for non-emitted ticks in an audit trail.
  StatusFlag audit_tag() const;
};

class OptimizationPipeline final {
public:
  explicit OptimizationPipeline(PipelineConfig cfg = PipelineConfig{});

  // Process one sample. `state` is read and advanced in place.
  PipelineOutput process(const ProductionSample& in, const WellSettings& settings,
                         StreamState& state) const;

  const PipelineConfig& config() const { return cfg_; }

private:
  PipelineConfig cfg_;
  SpikeFilter spike_;
  StalenessGate staleness_;
  StatusClassifier classifier_;
  FinancialEvaluator financial_;
};

const char* outcome_to_string(Outcome o);

} // namespace chemsaver
