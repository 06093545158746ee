#include "chemsaver/record_validator.hpp"
#include "chemsaver/stream_state.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace chemsaver;

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

static ProductionSample make_sample(int64_t t, double fluid, double water_cut, double injection) {
  ProductionSample s;
  s.has_timestamp = true;
  s.timestamp = t;
  s.gross_fluid_rate = fluid;
  s.water_cut = water_cut;
  s.current_injection_rate = injection;
  return s;
}

// State with one accepted sample at time t
static StreamState primed_state(int64_t t, double fluid) {
  StreamState st;
  st.has_accepted_sample = true;
  st.last_accepted_sample = make_sample(t, fluid, 50.0, 4.0);
  st.last_accepted_water_cut = 50.0;
  st.has_emission = true;
  st.last_emission_timestamp = t;
  st.has_trusted_emission = true;
  st.last_trusted_emission_timestamp = t;
  return st;
}

// -----------------------------------------------------------------------------
// RecordValidator
// -----------------------------------------------------------------------------
static void test_valid_sample_usable() {
  auto r = RecordValidator::validate(make_sample(10, 1000.0, 50.0, 5.0), kNaN);
  assert(r.status == ValidationStatus::USABLE);
  assert(r.errors.empty());
  assert(r.warnings.empty());
  assert(r.flags == FLAG_NONE);
}

static void test_missing_timestamp_rejected() {
  ProductionSample s = make_sample(10, 1000.0, 50.0, 5.0);
  s.has_timestamp = false;
  auto r = RecordValidator::validate(s, 50.0);
  assert(r.status == ValidationStatus::REJECTED);
  assert(r.flags & FLAG_TIMESTAMP_MISSING);
  assert(!r.errors.empty());
}

static void test_negative_rates_rejected() {
  auto r1 = RecordValidator::validate(make_sample(10, -1.0, 50.0, 5.0), 50.0);
  assert(r1.status == ValidationStatus::REJECTED);
  assert(r1.flags & FLAG_FLOW_NEGATIVE);

  auto r2 = RecordValidator::validate(make_sample(10, 1000.0, 50.0, -0.1), 50.0);
  assert(r2.status == ValidationStatus::REJECTED);
  assert(r2.flags & FLAG_INJECTION_INVALID);

  // Injection rate is required
  auto r3 = RecordValidator::validate(make_sample(10, 1000.0, 50.0, kNaN), 50.0);
  assert(r3.status == ValidationStatus::REJECTED);
  assert(r3.flags & FLAG_INJECTION_INVALID);
}

static void test_missing_flow_degraded_to_zero() {
  auto r = RecordValidator::validate(make_sample(10, kNaN, 50.0, 5.0), kNaN);
  assert(r.status == ValidationStatus::DEGRADED);
  assert(r.sample.gross_fluid_rate == 0.0);
  assert(r.flags & FLAG_FLOW_MISSING);
  assert(r.warnings.size() == 1);
}

static void test_water_cut_substitution() {
  auto r = RecordValidator::validate(make_sample(10, 1000.0, 130.0, 5.0), 42.0);
  assert(r.status == ValidationStatus::DEGRADED);
  assert(r.sample.water_cut == 42.0);
  assert(r.flags & FLAG_WATER_CUT_SUBSTITUTED);

  auto missing = RecordValidator::validate(make_sample(10, 1000.0, kNaN, 5.0), 42.0);
  assert(missing.status == ValidationStatus::DEGRADED);
  assert(missing.sample.water_cut == 42.0);

  // Boundaries are valid
  assert(RecordValidator::validate(make_sample(10, 1000.0, 0.0, 5.0), kNaN).status ==
         ValidationStatus::USABLE);
  assert(RecordValidator::validate(make_sample(10, 1000.0, 100.0, 5.0), kNaN).status ==
         ValidationStatus::USABLE);
}

static void test_water_cut_without_history_rejected() {
  auto r = RecordValidator::validate(make_sample(10, 1000.0, -5.0, 5.0), kNaN);
  assert(r.status == ValidationStatus::REJECTED);
  assert(r.flags & FLAG_WATER_CUT_NO_HISTORY);
}

static void test_status_names() {
  assert(std::string(validation_status_to_string(ValidationStatus::USABLE)) == "USABLE");
  assert(std::string(validation_status_to_string(ValidationStatus::DEGRADED)) == "DEGRADED");
  assert(std::string(validation_status_to_string(ValidationStatus::REJECTED)) == "REJECTED");
}

static void test_validator_is_pure() {
  const ProductionSample s = make_sample(10, 1000.0, 150.0, 5.0);
  auto a = RecordValidator::validate(s, 30.0);
  auto b = RecordValidator::validate(s, 30.0);
  assert(a.status == b.status);
  assert(a.flags == b.flags);
  assert(a.sample.water_cut == b.sample.water_cut);
  assert(s.water_cut == 150.0);
}

// -----------------------------------------------------------------------------
// SpikeFilter
// -----------------------------------------------------------------------------
static void test_first_sample_always_accepted() {
  SpikeFilter f;
  StreamState empty;
  assert(f.accept(make_sample(0, 1e6, 50.0, 1.0), empty));
}

static void test_spike_within_window_rejected() {
  SpikeFilter f;
  StreamState st = primed_state(100, 100.0);

  // 100 -> 700 BPD in 30 s is a 600 % change
  assert(!f.accept(make_sample(130, 700.0, 50.0, 4.0), st));
  assert(std::fabs(SpikeFilter::change_percent(100.0, 700.0) - 600.0) < 1e-9);
}

static void test_spike_threshold_boundary() {
  SpikeFilter f;  // 500 %, 60 s
  StreamState st = primed_state(100, 100.0);

  assert(!f.accept(make_sample(110, 600.0, 50.0, 4.0), st));   // exactly 500 %
  assert(f.accept(make_sample(110, 599.0, 50.0, 4.0), st));    // 499 %
  assert(f.accept(make_sample(110, 0.0, 50.0, 4.0), st));      // shut-in is -100 %
}

static void test_spike_window_boundary() {
  SpikeFilter f;
  StreamState st = primed_state(100, 100.0);

  assert(!f.accept(make_sample(160, 900.0, 50.0, 4.0), st));   // 60 s: still inside
  assert(f.accept(make_sample(161, 900.0, 50.0, 4.0), st));    // 61 s: level shift
}

static void test_spike_from_zero_prior_accepted() {
  SpikeFilter f;
  StreamState st = primed_state(100, 0.0);
  assert(f.accept(make_sample(105, 1000.0, 50.0, 4.0), st));
}

static void test_spike_custom_thresholds() {
  SpikeFilter f(100.0, 10);
  StreamState st = primed_state(100, 100.0);
  assert(!f.accept(make_sample(105, 250.0, 50.0, 4.0), st));
  assert(f.accept(make_sample(111, 250.0, 50.0, 4.0), st));
}

// -----------------------------------------------------------------------------
// StalenessGate
// -----------------------------------------------------------------------------
static void test_staleness_window() {
  StalenessGate g;  // 300 s
  StreamState st = primed_state(1000, 100.0);

  assert(!g.should_suppress(1300, st, false));  // exactly 300 s
  assert(g.should_suppress(1301, st, false));
}

static void test_trustworthy_sample_never_suppressed() {
  StalenessGate g;
  StreamState st = primed_state(1000, 100.0);
  assert(!g.should_suppress(1000 + 86400, st, true));

  StreamState empty;
  assert(!g.should_suppress(5, empty, true));
}

static void test_no_emission_history_suppresses_untrusted() {
  StalenessGate g;
  StreamState empty;
  assert(g.should_suppress(5, empty, false));
}

static void test_reused_emissions_do_not_refresh_window() {
  StalenessGate g;
  StreamState st = primed_state(1000, 100.0);
  st.last_emission_timestamp = 1290;  // emitted from prior values

  assert(g.should_suppress(1301, st, false));

  StreamState reuse_only;
  reuse_only.has_emission = true;
  reuse_only.last_emission_timestamp = 5;
  assert(g.should_suppress(6, reuse_only, false));
}

static void test_state_reset_keeps_version() {
  StreamState st = primed_state(1000, 100.0);
  st.version = 7;
  st.reset();
  assert(!st.has_accepted_sample);
  assert(!st.has_emission);
  assert(!st.has_trusted_emission);
  assert(std::isnan(st.last_accepted_water_cut));
  assert(st.version == 7);
}

int main() {
  std::cout << "Running stream filter tests...\n";

  test_valid_sample_usable();
  test_missing_timestamp_rejected();
  test_negative_rates_rejected();
  test_missing_flow_degraded_to_zero();
  test_water_cut_substitution();
  test_water_cut_without_history_rejected();
  test_validator_is_pure();
  test_status_names();
  std::cout << "[PASS] Record validator\n";

  test_first_sample_always_accepted();
  test_spike_within_window_rejected();
  test_spike_threshold_boundary();
  test_spike_window_boundary();
  test_spike_from_zero_prior_accepted();
  test_spike_custom_thresholds();
  std::cout << "[PASS] Spike filter\n";

  test_staleness_window();
  test_trustworthy_sample_never_suppressed();
  test_no_emission_history_suppresses_untrusted();
  test_reused_emissions_do_not_refresh_window();
  test_state_reset_keeps_version();
  std::cout << "[PASS] Staleness gate\n";

  std::cout << "\n[PASS] All stream filter tests passed!\n";
  return 0;
}
