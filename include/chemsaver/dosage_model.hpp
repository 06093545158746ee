#pragma once

// Pure dosing arithmetic: recommended rate, pump envelope, status, money.
//
// None of these hold state. Identical inputs always yield identical outputs.

#include "chemsaver/dosing_types.hpp"
#include "chemsaver/well_settings.hpp"

#include <cstdint>

namespace chemsaver {

// Physical constants
constexpr double kWaterLbsPerBarrel = 350.0;  // produced water as fresh-water equivalent
constexpr double kLbsPerGallonWater = 8.34;   // unit-density liquid, lbs/gal
constexpr double kPpmDivisor = 1000000.0;

// Classifier default: +-10 % around the recommendation counts as OPTIMAL
constexpr double kDefaultStatusTolerance = 0.10;

// Intermediate quantities are kept for inspectability.
struct DosageComputation final {
  bool ok = false;                  // false => settings make the math undefined
  double water_bpd = 0.0;
  double water_mass_lbs_per_day = 0.0;
  double pure_chemical_lbs = 0.0;
  double gross_chemical_lbs = 0.0;
  double recommended_rate_gpd = 0.0;  // unconstrained
};

class DosageCalculator final {
public:
  // Fails (ok=false) instead of dividing by zero when active_intensity or
  // chemical_density is not positive. Settings validation should prevent
  // this, but the calculator does not rely on it.
  static DosageComputation compute(const ProductionSample& sample, const WellSettings& settings);

  // PPM delivered into the water phase by a given pump rate (inverse of compute).
  // 0 when there is no water or no injection.
  static double delivered_ppm(double injection_gpd, double water_bpd, const WellSettings& settings);
};

class ConstraintEnforcer final {
public:
  // max(min_pump_rate, min(rate, max_pump_rate)). Idempotent.
  static double clamp(double rate_gpd, const WellSettings& settings);

  // The clamp is only meaningful when min < max.
  static bool envelope_valid(const WellSettings& settings);
};

class StatusClassifier final {
public:
  explicit StatusClassifier(double tolerance = kDefaultStatusTolerance)
      : tolerance_(tolerance) {}

  // Returns OPTIMAL, OVER_DOSING, UNDER_DOSING or PUMP_OFF; never ERROR/NO_DATA.
  StatusFlag classify(double gross_fluid_rate, double actual_gpd, double recommended_gpd) const;

  double tolerance() const { return tolerance_; }

private:
  double tolerance_;
};

// How a negative gap (under-dosing) is reported.
enum class UnderDosingPolicy : uint8_t {
  SIGNED_RISK_COST = 0,  // keep the negative figure as a corrosion-risk placeholder
  ZERO = 1               // report 0; only over-dosing waste is counted
};

class FinancialEvaluator final {
public:
  explicit FinancialEvaluator(UnderDosingPolicy policy = UnderDosingPolicy::SIGNED_RISK_COST)
      : policy_(policy) {}

  // (actual - recommended) * cost_per_gallon. Positive = recoverable waste.
  double evaluate(double actual_gpd, double recommended_gpd, double cost_per_gallon) const;

private:
  UnderDosingPolicy policy_;
};

} // namespace chemsaver
