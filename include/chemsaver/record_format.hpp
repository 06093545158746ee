#pragma once

// Text forms of engine records: status strings and JSON documents for the
// external results store and the observability API.

#include "chemsaver/dosing_types.hpp"
#include "chemsaver/well_settings.hpp"

#include <string>

namespace chemsaver {

const char* status_flag_to_string(StatusFlag s);
bool parse_status_flag(const std::string& text, StatusFlag& out);

// Output record: timestamp, rates, savings, status plus the extended fields.
// Non-finite numbers are written as null.
std::string result_to_json(const OptimizationResult& r, int indent = 0);

// Settings record. Numbers use round-trip precision.
std::string settings_to_json(const WellSettings& s, int indent = 0);

// Quote and escape a string for embedding in JSON.
std::string json_string(const std::string& s);

// Finite doubles in fixed notation, null otherwise.
std::string json_number(double v, int precision = 6);

} // namespace chemsaver
