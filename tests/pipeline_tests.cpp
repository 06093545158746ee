#include "chemsaver/optimization_pipeline.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace chemsaver;

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

// -----------------------------------------------------------------------------
// Helper: build a complete sample
// -----------------------------------------------------------------------------
static ProductionSample make_sample(int64_t t, double fluid, double water_cut, double injection) {
  ProductionSample s;
  s.has_timestamp = true;
  s.timestamp = t;
  s.gross_fluid_rate = fluid;
  s.water_cut = water_cut;
  s.current_injection_rate = injection;
  return s;
}

// -----------------------------------------------------------------------------
// Test 1: Reference well, over-dosing
// -----------------------------------------------------------------------------
static void test_reference_well_over_dosing() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  auto out = p.process(make_sample(1000, 1000.0, 50.0, 5.0), settings, state);

  assert(out.outcome == Outcome::EMITTED);
  assert(out.emitted);
  assert(out.validation == ValidationStatus::USABLE);
  assert(out.result.timestamp == 1000);
  assert(std::fabs(out.result.recommended_rate_gpd - 4.196) < 1e-3);
  assert(out.result.actual_rate_gpd == 5.0);
  assert(std::fabs(out.result.savings_opportunity_usd - 8.04) < 0.01);
  assert(out.result.status_flag == StatusFlag::OVER_DOSING);
  assert(out.result.water_bpd == 500.0);
  assert(out.result.target_ppm == 200);
  assert(out.result.current_ppm > 200.0);
  assert(!(out.flags & (FLAG_CLAMPED_MIN | FLAG_CLAMPED_MAX)));

  // State advanced
  assert(state.has_accepted_sample);
  assert(state.last_accepted_sample.gross_fluid_rate == 1000.0);
  assert(state.last_accepted_water_cut == 50.0);
  assert(state.has_emission);
  assert(state.last_emission_timestamp == 1000);
}

// -----------------------------------------------------------------------------
// Test 2: Well not producing => PUMP_OFF whatever the pump does
// -----------------------------------------------------------------------------
static void test_pump_off() {
  OptimizationPipeline p;
  WellSettings settings;

  for (double injection : {0.0, 2.0, 80.0}) {
    StreamState state;
    auto out = p.process(make_sample(10, 0.0, 50.0, injection), settings, state);
    assert(out.emitted);
    assert(out.result.status_flag == StatusFlag::PUMP_OFF);
    assert(out.result.unconstrained_rate_gpd == 0.0);
    assert(out.result.recommended_rate_gpd == settings.min_pump_rate);
    assert(out.flags & FLAG_CLAMPED_MIN);
    assert(out.result.actual_rate_gpd == injection);  // telemetry never clamped
  }
}

// -----------------------------------------------------------------------------
// Test 3: Spike rejected, prior flow reused, state anchor kept
// -----------------------------------------------------------------------------
static void test_spike_reuses_prior_values() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 100.0, 50.0, 4.0), settings, state);
  auto out = p.process(make_sample(30, 700.0, 50.0, 4.0), settings, state);

  assert(out.outcome == Outcome::EMITTED);
  assert(out.flags & FLAG_SPIKE_REJECTED);
  assert(out.flags & FLAG_PRIOR_SUBSTITUTED);
  assert(out.result.water_bpd == 50.0);  // 100 BPD * 50 %
  assert(out.result.timestamp == 30);

  assert(state.last_accepted_sample.gross_fluid_rate == 100.0);
  assert(state.last_accepted_sample.timestamp == 0);
  assert(state.last_emission_timestamp == 30);
}

// -----------------------------------------------------------------------------
// Test 4: Silence window: rejected tick after 301 s suppressed, valid tick emitted
// -----------------------------------------------------------------------------
static void test_staleness_suppression_and_recovery() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);

  auto stale = p.process(make_sample(301, 1000.0, 50.0, -1.0), settings, state);
  assert(stale.outcome == Outcome::SUPPRESSED_STALE);
  assert(!stale.emitted);
  assert(stale.flags & FLAG_STALE);
  assert(stale.audit_tag() == StatusFlag::NO_DATA);

  // Only the attempt is recorded
  assert(state.last_attempt_timestamp == 301);
  assert(state.last_emission_timestamp == 0);
  assert(state.last_accepted_sample.timestamp == 0);

  auto fresh = p.process(make_sample(305, 1000.0, 50.0, 4.0), settings, state);
  assert(fresh.outcome == Outcome::EMITTED);
  assert(fresh.result.timestamp == 305);
  assert(!(fresh.flags & FLAG_PRIOR_SUBSTITUTED));
  assert(state.last_emission_timestamp == 305);
}

// -----------------------------------------------------------------------------
// Test 5: Long gap alone never suppresses a valid sample
// -----------------------------------------------------------------------------
static void test_gap_does_not_block_valid_sample() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);
  auto out = p.process(make_sample(7200, 6000.0, 50.0, 4.0), settings, state);

  assert(out.outcome == Outcome::EMITTED);
  assert(!(out.flags & FLAG_SPIKE_REJECTED));
  assert(out.result.water_bpd == 3000.0);
}

// -----------------------------------------------------------------------------
// Test 6: Rejected tick inside the window reuses the last accepted sample
// -----------------------------------------------------------------------------
static void test_rejected_tick_recovered_from_history() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);
  auto out = p.process(make_sample(60, -20.0, 50.0, 4.0), settings, state);

  assert(out.validation == ValidationStatus::REJECTED);
  assert(out.outcome == Outcome::EMITTED);
  assert(out.flags & FLAG_FLOW_NEGATIVE);
  assert(out.flags & FLAG_PRIOR_SUBSTITUTED);
  assert(out.result.water_bpd == 500.0);
  assert(out.result.actual_rate_gpd == 4.0);
  assert(out.result.timestamp == 60);
  assert(state.last_accepted_sample.timestamp == 0);
}

// -----------------------------------------------------------------------------
// Test 6b: Only the failed reading is replaced; live pump telemetry is kept
// -----------------------------------------------------------------------------
static void test_rejected_flow_keeps_live_injection() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);
  auto out = p.process(make_sample(30, -5.0, 50.0, 9.0), settings, state);

  assert(out.outcome == Outcome::EMITTED);
  assert(out.flags & FLAG_PRIOR_SUBSTITUTED);
  assert(out.result.water_bpd == 500.0);          // prior flow
  assert(out.result.actual_rate_gpd == 9.0);      // measured pump rate
  assert(out.result.status_flag == StatusFlag::OVER_DOSING);
  assert(std::fabs(out.result.savings_opportunity_usd - 48.03) < 0.01);

  // Broken pump meter: the prior injection rate stands in, flow stays live
  auto meter = p.process(make_sample(60, 800.0, 50.0, -1.0), settings, state);
  assert(meter.outcome == Outcome::EMITTED);
  assert(meter.flags & FLAG_INJECTION_INVALID);
  assert(meter.result.actual_rate_gpd == 4.0);
  assert(meter.result.water_bpd == 400.0);
}

// -----------------------------------------------------------------------------
// Test 6c: A steady stream of bad ticks cannot keep the silence window open
// -----------------------------------------------------------------------------
static void test_bad_stream_goes_stale() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);

  int emitted = 0;
  int suppressed = 0;
  for (int64_t t = 60; t <= 3600; t += 60) {
    auto out = p.process(make_sample(t, -1.0, 50.0, 4.0), settings, state);
    if (out.outcome == Outcome::EMITTED) {
      assert(t <= 300);
      ++emitted;
    } else {
      assert(out.outcome == Outcome::SUPPRESSED_STALE);
      assert(t > 300);
      ++suppressed;
    }
  }
  assert(emitted == 5);
  assert(suppressed == 55);
  assert(state.last_trusted_emission_timestamp == 0);
  assert(state.last_emission_timestamp == 300);
  assert(state.last_attempt_timestamp == 3600);

  // Fresh valid data reopens the stream
  auto fresh = p.process(make_sample(3660, 1000.0, 50.0, 4.0), settings, state);
  assert(fresh.outcome == Outcome::EMITTED);
  assert(state.last_trusted_emission_timestamp == 3660);

  // Spike substitutions do not refresh the trusted clock either
  p.process(make_sample(3700, 9000.0, 50.0, 4.0), settings, state);
  assert(state.last_emission_timestamp == 3700);
  assert(state.last_trusted_emission_timestamp == 3660);
}

// -----------------------------------------------------------------------------
// Test 7: Nothing recoverable => REJECTED, attempt recorded
// -----------------------------------------------------------------------------
static void test_first_sample_unrecoverable() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  auto out = p.process(make_sample(50, 1000.0, 140.0, 4.0), settings, state);

  assert(out.outcome == Outcome::REJECTED);
  assert(!out.emitted);
  assert(out.flags & FLAG_WATER_CUT_NO_HISTORY);
  assert(out.audit_tag() == StatusFlag::ERROR);
  assert(!state.has_accepted_sample);
  assert(!state.has_emission);
  assert(state.has_attempt);
  assert(state.last_attempt_timestamp == 50);
}

// -----------------------------------------------------------------------------
// Test 8: Missing timestamp leaves the state untouched
// -----------------------------------------------------------------------------
static void test_missing_timestamp() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;
  p.process(make_sample(0, 1000.0, 50.0, 4.0), settings, state);

  ProductionSample s = make_sample(0, 1000.0, 50.0, 4.0);
  s.has_timestamp = false;
  auto out = p.process(s, settings, state);

  assert(out.outcome == Outcome::REJECTED);
  assert(out.flags & FLAG_TIMESTAMP_MISSING);
  assert(state.last_attempt_timestamp == 0);
  assert(state.last_emission_timestamp == 0);
}

// -----------------------------------------------------------------------------
// Test 9: Configuration errors block emission
// -----------------------------------------------------------------------------
static void test_configuration_error() {
  OptimizationPipeline p;
  StreamState state;

  WellSettings zero_intensity;
  zero_intensity.active_intensity = 0.0;
  auto out = p.process(make_sample(10, 1000.0, 50.0, 4.0), zero_intensity, state);
  assert(out.outcome == Outcome::CONFIGURATION_ERROR);
  assert(!out.emitted);
  assert(out.flags & FLAG_CONFIG_INVALID);
  assert(!out.errors.empty());
  assert(!state.has_accepted_sample);
  assert(!state.has_emission);

  WellSettings inverted;
  inverted.min_pump_rate = 60.0;
  inverted.max_pump_rate = 50.0;
  out = p.process(make_sample(20, 1000.0, 50.0, 4.0), inverted, state);
  assert(out.outcome == Outcome::CONFIGURATION_ERROR);
  assert(!state.has_emission);
}

// -----------------------------------------------------------------------------
// Test 10: Out-of-order tick refused, state untouched
// -----------------------------------------------------------------------------
static void test_non_monotonic_timestamp() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(100, 1000.0, 50.0, 4.0), settings, state);
  auto out = p.process(make_sample(50, 1000.0, 50.0, 4.0), settings, state);

  assert(out.outcome == Outcome::REJECTED);
  assert(out.flags & FLAG_NON_MONOTONIC);
  assert(state.last_emission_timestamp == 100);
  assert(state.last_attempt_timestamp == 100);

  // Equal timestamps are allowed (non-decreasing)
  auto same = p.process(make_sample(100, 1000.0, 50.0, 4.0), settings, state);
  assert(same.outcome == Outcome::EMITTED);
}

// -----------------------------------------------------------------------------
// Test 11: Invalid water cut carried forward
// -----------------------------------------------------------------------------
static void test_water_cut_carried_forward() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 1000.0, 40.0, 4.0), settings, state);
  auto out = p.process(make_sample(10, 1000.0, 150.0, 4.0), settings, state);

  assert(out.validation == ValidationStatus::DEGRADED);
  assert(out.outcome == Outcome::EMITTED);
  assert(out.flags & FLAG_WATER_CUT_SUBSTITUTED);
  assert(out.result.water_bpd == 400.0);
  assert(state.last_accepted_water_cut == 40.0);
  assert(state.last_accepted_sample.timestamp == 10);
}

// -----------------------------------------------------------------------------
// Test 12: Missing flow => zero, PUMP_OFF, warning
// -----------------------------------------------------------------------------
static void test_missing_flow() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  auto out = p.process(make_sample(0, kNaN, 50.0, 3.0), settings, state);
  assert(out.validation == ValidationStatus::DEGRADED);
  assert(out.emitted);
  assert(out.result.status_flag == StatusFlag::PUMP_OFF);
  assert(!out.warnings.empty());
}

// -----------------------------------------------------------------------------
// Test 12b: An assumed zero flow does not become the spike reference
// -----------------------------------------------------------------------------
static void test_missing_flow_keeps_spike_reference() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState state;

  p.process(make_sample(0, 100.0, 50.0, 4.0), settings, state);

  auto gap = p.process(make_sample(10, kNaN, 60.0, 4.0), settings, state);
  assert(gap.emitted);
  assert(gap.result.status_flag == StatusFlag::PUMP_OFF);
  assert(state.last_accepted_sample.gross_fluid_rate == 100.0);
  assert(state.last_accepted_sample.timestamp == 0);
  assert(state.last_accepted_water_cut == 60.0);
  assert(state.last_trusted_emission_timestamp == 10);

  // 100 -> 900 BPD 20 s after the last measured reading is still a spike
  auto out = p.process(make_sample(20, 900.0, 60.0, 4.0), settings, state);
  assert(out.flags & FLAG_SPIKE_REJECTED);
  assert(out.result.water_bpd == 50.0);
}

// -----------------------------------------------------------------------------
// Test 13: Upper pump limit
// -----------------------------------------------------------------------------
static void test_clamped_to_max() {
  OptimizationPipeline p;
  WellSettings settings;
  settings.target_ppm = 5000;
  StreamState state;

  auto out = p.process(make_sample(0, 20000.0, 90.0, 50.0), settings, state);
  assert(out.emitted);
  assert(out.result.unconstrained_rate_gpd > settings.max_pump_rate);
  assert(out.result.recommended_rate_gpd == settings.max_pump_rate);
  assert(out.flags & FLAG_CLAMPED_MAX);
  assert(out.result.status_flag == StatusFlag::OPTIMAL);
}

// -----------------------------------------------------------------------------
// Test 14: Under-dosing, both savings policies
// -----------------------------------------------------------------------------
static void test_under_dosing_policies() {
  WellSettings settings;
  StreamState s1, s2;

  OptimizationPipeline signed_pipeline;
  auto a = signed_pipeline.process(make_sample(0, 1000.0, 50.0, 2.0), settings, s1);
  assert(a.result.status_flag == StatusFlag::UNDER_DOSING);
  assert(a.result.savings_opportunity_usd < 0.0);

  PipelineConfig cfg;
  cfg.under_dosing_policy = UnderDosingPolicy::ZERO;
  OptimizationPipeline zero_pipeline(cfg);
  auto b = zero_pipeline.process(make_sample(0, 1000.0, 50.0, 2.0), settings, s2);
  assert(b.result.status_flag == StatusFlag::UNDER_DOSING);
  assert(b.result.savings_opportunity_usd == 0.0);
}

// -----------------------------------------------------------------------------
// Test 15: Wells are isolated by their state objects
// -----------------------------------------------------------------------------
static void test_per_well_isolation() {
  OptimizationPipeline p;
  WellSettings settings;
  StreamState well_a, well_b;

  p.process(make_sample(0, 100.0, 50.0, 4.0), settings, well_a);

  // Same jump that would be a spike for well A is a first sample for well B
  auto b = p.process(make_sample(10, 900.0, 50.0, 4.0), settings, well_b);
  assert(!(b.flags & FLAG_SPIKE_REJECTED));
  assert(b.result.water_bpd == 450.0);

  auto a = p.process(make_sample(10, 900.0, 50.0, 4.0), settings, well_a);
  assert(a.flags & FLAG_SPIKE_REJECTED);
}

// -----------------------------------------------------------------------------
// Test 16: Determinism
// -----------------------------------------------------------------------------
static void test_determinism() {
  OptimizationPipeline p;
  assert(p.config().spike_threshold_percent == kDefaultSpikeThresholdPercent);
  assert(p.config().staleness_window_s == kDefaultStalenessWindowSeconds);
  assert(p.config().under_dosing_policy == UnderDosingPolicy::SIGNED_RISK_COST);
  WellSettings settings;
  StreamState s1, s2;

  auto o1 = p.process(make_sample(0, 850.0, 63.0, 3.3), settings, s1);
  auto o2 = p.process(make_sample(0, 850.0, 63.0, 3.3), settings, s2);

  assert(o1.outcome == o2.outcome);
  assert(o1.flags == o2.flags);
  assert(o1.result.recommended_rate_gpd == o2.result.recommended_rate_gpd);
  assert(o1.result.savings_opportunity_usd == o2.result.savings_opportunity_usd);
}

int main() {
  std::cout << "Running optimization pipeline tests...\n";

  test_reference_well_over_dosing();
  test_pump_off();
  test_spike_reuses_prior_values();
  test_staleness_suppression_and_recovery();
  test_gap_does_not_block_valid_sample();
  test_rejected_tick_recovered_from_history();
  test_rejected_flow_keeps_live_injection();
  test_bad_stream_goes_stale();
  test_first_sample_unrecoverable();
  test_missing_timestamp();
  test_configuration_error();
  test_non_monotonic_timestamp();
  test_water_cut_carried_forward();
  test_missing_flow();
  test_missing_flow_keeps_spike_reference();
  test_clamped_to_max();
  test_under_dosing_policies();
  test_per_well_isolation();
  test_determinism();

  std::cout << "[PASS] All optimization pipeline tests passed!\n";
  return 0;
}
