#include "chemsaver/optimization_pipeline.hpp"

namespace chemsaver {

StatusFlag PipelineOutput::audit_tag() const {
  switch (outcome) {
    case Outcome::EMITTED: return result.status_flag;
    case Outcome::SUPPRESSED_STALE: return StatusFlag::NO_DATA;
    case Outcome::REJECTED:
    case Outcome::CONFIGURATION_ERROR:
    default: return StatusFlag::ERROR;
  }
}

OptimizationPipeline::OptimizationPipeline(PipelineConfig cfg)
    : cfg_(cfg)
    , spike_(cfg.spike_threshold_percent, cfg.spike_window_s)
    , staleness_(cfg.staleness_window_s)
    , classifier_(cfg.status_tolerance)
    , financial_(cfg.under_dosing_policy)
{}

// ============================================================================
// Core evaluation
// ============================================================================
PipelineOutput OptimizationPipeline::process(const ProductionSample& in,
                                             const WellSettings& settings,
                                             StreamState& state) const {
  PipelineOutput out;

  // --------------------------------------------------------------------------
  // No-result helper: explicit outcome + trace flags, no recommendation
  // --------------------------------------------------------------------------
  auto no_result = [&](Outcome outcome, uint32_t reason_flag) -> PipelineOutput {
    out.outcome = outcome;
    out.emitted = false;
    out.flags |= reason_flag;
    out.result = OptimizationResult{};
    out.result.timestamp = in.timestamp;
    out.result.target_ppm = settings.target_ppm;
    out.result.actual_rate_gpd = in.current_injection_rate;
    out.result.status_flag = out.audit_tag();
    out.result.flags = out.flags;
    return out;
  };

  // --------------------------------------------------------------------------
  // Step 1: Structural validation
  // --------------------------------------------------------------------------
  const ValidationReport report =
      RecordValidator::validate(in, state.last_accepted_water_cut);
  out.validation = report.status;
  out.flags |= report.flags;
  out.errors = report.errors;
  out.warnings = report.warnings;

  // Without a timestamp there is nothing to anchor a result or the state on
  if (!in.has_timestamp) {
    return no_result(Outcome::REJECTED, FLAG_NONE);
  }

  // Out-of-order tick: refuse it and leave the state untouched so spike
  // timing and the silence window stay anchored on real history
  if (state.has_emission && in.timestamp < state.last_emission_timestamp) {
    out.validation = ValidationStatus::REJECTED;
    out.errors.push_back("timestamp precedes last emitted result");
    return no_result(Outcome::REJECTED, FLAG_NON_MONOTONIC);
  }

  const int64_t now = in.timestamp;
  state.has_attempt = true;
  state.last_attempt_timestamp = now;

  // --------------------------------------------------------------------------
  // Step 2: Recover rejected samples / spike filter
  // --------------------------------------------------------------------------
  ProductionSample effective = report.sample;
  bool advance_accepted = true;

  if (report.status == ValidationStatus::REJECTED) {
    if (!state.has_accepted_sample) {
      return no_result(Outcome::REJECTED, FLAG_NONE);
    }
    // Step 3 (rejected path): only recent history may stand in for this tick
    if (staleness_.should_suppress(now, state, false)) {
      return no_result(Outcome::SUPPRESSED_STALE, FLAG_STALE);
    }
    // Replace only the readings that failed; valid pump telemetry stays live
    const ProductionSample& prior = state.last_accepted_sample;
    if (report.flags & FLAG_FLOW_NEGATIVE) {
      effective.gross_fluid_rate = prior.gross_fluid_rate;
    }
    if (report.flags & FLAG_INJECTION_INVALID) {
      effective.current_injection_rate = prior.current_injection_rate;
    }
    if (report.flags & FLAG_WATER_CUT_NO_HISTORY) {
      effective.water_cut = prior.water_cut;
    }
    out.flags |= FLAG_PRIOR_SUBSTITUTED;
    advance_accepted = false;
  } else if (!spike_.accept(effective, state)) {
    out.warnings.push_back("gross_fluid_rate spike rejected - using last accepted values");
    out.flags |= FLAG_SPIKE_REJECTED;
    if (staleness_.should_suppress(now, state, false)) {
      return no_result(Outcome::SUPPRESSED_STALE, FLAG_STALE);
    }
    // The artifact is in the flow reading; pump telemetry passes through
    effective.gross_fluid_rate = state.last_accepted_sample.gross_fluid_rate;
    effective.water_cut = state.last_accepted_sample.water_cut;
    out.flags |= FLAG_PRIOR_SUBSTITUTED;
    advance_accepted = false;
  }
  // A sample that survived validation and the spike filter is trustworthy:
  // the silence window never blocks it.

  // --------------------------------------------------------------------------
  // Step 4: Recommended rate and pump envelope
  // --------------------------------------------------------------------------
  const DosageComputation dosage = DosageCalculator::compute(effective, settings);
  if (!dosage.ok) {
    out.errors.push_back("active_intensity and chemical_density must be positive");
    return no_result(Outcome::CONFIGURATION_ERROR, FLAG_CONFIG_INVALID);
  }
  if (!ConstraintEnforcer::envelope_valid(settings)) {
    out.errors.push_back("min_pump_rate must be less than max_pump_rate");
    return no_result(Outcome::CONFIGURATION_ERROR, FLAG_CONFIG_INVALID);
  }

  const double recommended = ConstraintEnforcer::clamp(dosage.recommended_rate_gpd, settings);
  if (dosage.recommended_rate_gpd < settings.min_pump_rate) {
    out.flags |= FLAG_CLAMPED_MIN;
  } else if (dosage.recommended_rate_gpd > settings.max_pump_rate) {
    out.flags |= FLAG_CLAMPED_MAX;
  }

  // --------------------------------------------------------------------------
  // Step 5: Status and financial gap
  // --------------------------------------------------------------------------
  const double actual = effective.current_injection_rate;
  const StatusFlag status = classifier_.classify(effective.gross_fluid_rate, actual, recommended);
  const double savings = financial_.evaluate(actual, recommended, settings.cost_per_gallon);

  // --------------------------------------------------------------------------
  // Step 6: Advance stream state (only after everything above succeeded)
  // --------------------------------------------------------------------------
  if (advance_accepted) {
    // A flow assumed to be 0 is no reference for the spike filter: keep the
    // last measured reading as the anchor and carry only the water cut
    if (!(report.flags & FLAG_FLOW_MISSING) || !state.has_accepted_sample) {
      state.has_accepted_sample = true;
      state.last_accepted_sample = effective;
    }
    state.last_accepted_water_cut = effective.water_cut;
    state.has_trusted_emission = true;
    state.last_trusted_emission_timestamp = now;
  }
  state.has_emission = true;
  state.last_emission_timestamp = now;

  // --------------------------------------------------------------------------
  // Step 7: Result
  // --------------------------------------------------------------------------
  out.outcome = Outcome::EMITTED;
  out.emitted = true;
  out.result.timestamp = now;
  out.result.recommended_rate_gpd = recommended;
  out.result.unconstrained_rate_gpd = dosage.recommended_rate_gpd;
  out.result.actual_rate_gpd = actual;
  out.result.savings_opportunity_usd = savings;
  out.result.status_flag = status;
  out.result.water_bpd = dosage.water_bpd;
  out.result.current_ppm = DosageCalculator::delivered_ppm(actual, dosage.water_bpd, settings);
  out.result.target_ppm = settings.target_ppm;
  out.result.flags = out.flags;
  return out;
}

const char* outcome_to_string(Outcome o) {
  switch (o) {
    case Outcome::EMITTED: return "EMITTED";
    case Outcome::REJECTED: return "REJECTED";
    case Outcome::SUPPRESSED_STALE: return "SUPPRESSED_STALE";
    case Outcome::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
    default: return "UNKNOWN";
  }
}

} // namespace chemsaver
