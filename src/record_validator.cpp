#include "chemsaver/record_validator.hpp"

#include <cmath>

namespace chemsaver {

ValidationReport RecordValidator::validate(const ProductionSample& in,
                                           double last_accepted_water_cut) {
  ValidationReport out;
  out.sample = in;

  // --------------------------------------------------------------------------
  // Hard errors: nothing downstream may be computed from this sample
  // --------------------------------------------------------------------------
  if (!in.has_timestamp) {
    out.errors.push_back("Missing timestamp");
    out.flags |= FLAG_TIMESTAMP_MISSING;
  }

  // +inf is as unusable as a negative rate
  if (!std::isnan(in.gross_fluid_rate) &&
      (in.gross_fluid_rate < 0.0 || !std::isfinite(in.gross_fluid_rate))) {
    out.errors.push_back("Invalid gross_fluid_rate - cannot be negative");
    out.flags |= FLAG_FLOW_NEGATIVE;
  }

  if (std::isnan(in.current_injection_rate)) {
    out.errors.push_back("Missing current_injection_rate");
    out.flags |= FLAG_INJECTION_INVALID;
  } else if (in.current_injection_rate < 0.0 || !std::isfinite(in.current_injection_rate)) {
    out.errors.push_back("Invalid current_injection_rate - cannot be negative");
    out.flags |= FLAG_INJECTION_INVALID;
  }

  // --------------------------------------------------------------------------
  // Recoverable problems: substitute and downgrade to DEGRADED
  // --------------------------------------------------------------------------
  bool degraded = false;

  if (std::isnan(in.gross_fluid_rate)) {
    out.warnings.push_back("Missing gross_fluid_rate - assuming 0");
    out.sample.gross_fluid_rate = 0.0;
    out.flags |= FLAG_FLOW_MISSING;
    degraded = true;
  }

  const bool water_cut_ok = std::isfinite(in.water_cut) &&
                            in.water_cut >= 0.0 && in.water_cut <= 100.0;
  if (!water_cut_ok) {
    if (std::isfinite(last_accepted_water_cut)) {
      out.warnings.push_back("water_cut out of range (0-100) - using last valid value");
      out.sample.water_cut = last_accepted_water_cut;
      out.flags |= FLAG_WATER_CUT_SUBSTITUTED;
      degraded = true;
    } else {
      out.errors.push_back("water_cut out of range (0-100) and no valid history");
      out.flags |= FLAG_WATER_CUT_NO_HISTORY;
    }
  }

  if (!out.errors.empty()) {
    out.status = ValidationStatus::REJECTED;
  } else if (degraded) {
    out.status = ValidationStatus::DEGRADED;
  } else {
    out.status = ValidationStatus::USABLE;
  }
  return out;
}

const char* validation_status_to_string(ValidationStatus s) {
  switch (s) {
    case ValidationStatus::USABLE: return "USABLE";
    case ValidationStatus::DEGRADED: return "DEGRADED";
    case ValidationStatus::REJECTED: return "REJECTED";
    default: return "UNKNOWN";
  }
}

} // namespace chemsaver
