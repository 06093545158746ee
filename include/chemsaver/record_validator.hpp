#pragma once

// Structural validation of a single production sample.
//
// Pure: no history is read except the carried-forward water cut passed in by
// the caller, and nothing is written. Callers decide what to do with state.

#include "chemsaver/dosing_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chemsaver {

enum class ValidationStatus : uint8_t {
  USABLE = 0,    // sample taken as-is
  DEGRADED = 1,  // usable after substitutions (see warnings)
  REJECTED = 2   // structurally invalid, do not compute from it
};

struct ValidationReport final {
  ValidationStatus status = ValidationStatus::REJECTED;
  ProductionSample sample;  // cleaned copy (substitutions applied)
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  uint32_t flags = FLAG_NONE;
};

class RecordValidator final {
public:
  // last_accepted_water_cut: NaN when the well has no valid water-cut history.
  static ValidationReport validate(const ProductionSample& in,
                                   double last_accepted_water_cut);
};

const char* validation_status_to_string(ValidationStatus s);

} // namespace chemsaver
