#include "chemsaver/dosage_model.hpp"

#include <algorithm>
#include <cmath>

namespace chemsaver {

// ============================================================================
// DosageCalculator
// ============================================================================
DosageComputation DosageCalculator::compute(const ProductionSample& sample,
                                            const WellSettings& settings) {
  DosageComputation out;

  // Arithmetic guards (the divisions below)
  if (!(settings.active_intensity > 0.0) || !std::isfinite(settings.active_intensity) ||
      !(settings.chemical_density > 0.0) || !std::isfinite(settings.chemical_density)) {
    return out;
  }

  const double fluid = std::max(0.0, sample.gross_fluid_rate);
  const double cut = std::max(0.0, sample.water_cut);

  // Step 1: water phase volume
  out.water_bpd = fluid * (cut / 100.0);

  // Step 2: water mass
  out.water_mass_lbs_per_day = out.water_bpd * kWaterLbsPerBarrel;

  // Step 3: active chemical mass for the target concentration
  out.pure_chemical_lbs = out.water_mass_lbs_per_day *
                          (static_cast<double>(settings.target_ppm) / kPpmDivisor);

  // Step 4: product mass, diluted by the active fraction
  out.gross_chemical_lbs = out.pure_chemical_lbs / (settings.active_intensity / 100.0);

  // Step 5: product volume (density is relative to water)
  out.recommended_rate_gpd = out.gross_chemical_lbs /
                             (settings.chemical_density * kLbsPerGallonWater);

  out.ok = true;
  return out;
}

double DosageCalculator::delivered_ppm(double injection_gpd, double water_bpd,
                                       const WellSettings& settings) {
  if (!(water_bpd > 0.0) || !(injection_gpd > 0.0)) {
    return 0.0;
  }
  const double gross_lbs = injection_gpd * settings.chemical_density * kLbsPerGallonWater;
  const double pure_lbs = gross_lbs * (settings.active_intensity / 100.0);
  const double water_lbs = water_bpd * kWaterLbsPerBarrel;
  return pure_lbs / water_lbs * kPpmDivisor;
}

// ============================================================================
// ConstraintEnforcer
// ============================================================================
double ConstraintEnforcer::clamp(double rate_gpd, const WellSettings& settings) {
  return std::max(settings.min_pump_rate, std::min(rate_gpd, settings.max_pump_rate));
}

bool ConstraintEnforcer::envelope_valid(const WellSettings& settings) {
  return std::isfinite(settings.min_pump_rate) &&
         std::isfinite(settings.max_pump_rate) &&
         settings.min_pump_rate < settings.max_pump_rate;
}

// ============================================================================
// StatusClassifier
// ============================================================================
StatusFlag StatusClassifier::classify(double gross_fluid_rate, double actual_gpd,
                                      double recommended_gpd) const {
  // Well not producing: nothing to protect, whatever the pump does
  if (gross_fluid_rate == 0.0) {
    return StatusFlag::PUMP_OFF;
  }

  if (actual_gpd > recommended_gpd * (1.0 + tolerance_)) {
    return StatusFlag::OVER_DOSING;
  }
  if (actual_gpd < recommended_gpd * (1.0 - tolerance_)) {
    return StatusFlag::UNDER_DOSING;
  }
  return StatusFlag::OPTIMAL;
}

// ============================================================================
// FinancialEvaluator
// ============================================================================
double FinancialEvaluator::evaluate(double actual_gpd, double recommended_gpd,
                                    double cost_per_gallon) const {
  const double gap_usd = (actual_gpd - recommended_gpd) * cost_per_gallon;
  if (gap_usd < 0.0 && policy_ == UnderDosingPolicy::ZERO) {
    return 0.0;
  }
  return gap_usd;
}

} // namespace chemsaver
