#pragma once

// Per-well dosing settings: defaults, bounds and the shared validation rules.
//
// A well with no stored record behaves exactly as if the defaults were saved.
// All pump rates are gallons/day; unit_preference only affects display.

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace chemsaver {

enum class UnitPreference : uint8_t { GALLONS = 0, LITERS = 1 };

// Complete settings record consumed by the engine.
struct WellSettings final {
  int    target_ppm = 200;          // [1, 10000]
  double chemical_density = 1.0;    // relative to water, [0.1, 5.0]
  double active_intensity = 100.0;  // percent active ingredient, [1, 100]
  double cost_per_gallon = 10.0;    // USD, [0, 1000]
  double min_pump_rate = 0.5;       // GPD, [0, 100]
  double max_pump_rate = 50.0;      // GPD, [0.1, 1000]
  UnitPreference unit_preference = UnitPreference::GALLONS;
};

// Partial record as read from the external settings store.
// Missing numeric fields are NaN, a missing unit preference is empty.
struct SettingsRecord final {
  double target_ppm = std::numeric_limits<double>::quiet_NaN();
  double chemical_density = std::numeric_limits<double>::quiet_NaN();
  double active_intensity = std::numeric_limits<double>::quiet_NaN();
  double cost_per_gallon = std::numeric_limits<double>::quiet_NaN();
  double min_pump_rate = std::numeric_limits<double>::quiet_NaN();
  double max_pump_rate = std::numeric_limits<double>::quiet_NaN();
  std::string unit_preference;
};

struct FieldBounds final {
  double min;
  double max;
};

namespace bounds {
constexpr FieldBounds kTargetPpm       {1.0, 10000.0};
constexpr FieldBounds kChemicalDensity {0.1, 5.0};
constexpr FieldBounds kActiveIntensity {1.0, 100.0};
constexpr FieldBounds kCostPerGallon   {0.0, 1000.0};
constexpr FieldBounds kMinPumpRate     {0.0, 100.0};
constexpr FieldBounds kMaxPumpRate     {0.1, 1000.0};
} // namespace bounds

constexpr double kLitersPerGallon = 3.78541;
constexpr double kGallonsPerLiter = 0.264172;

struct SettingsIssue final {
  std::string field;
  std::string message;
};

// Bounds and cross-field checks. Empty result means the settings are valid.
std::vector<SettingsIssue> validate_settings(const WellSettings& s);

// Outcome of resolving a partial record into complete settings.
struct ResolvedSettings final {
  WellSettings settings;
  std::vector<SettingsIssue> issues;  // fields replaced because they were out of bounds
  bool used_defaults_only = false;    // record carried no usable field at all
};

// Fill missing fields with defaults, replace out-of-bound fields with their
// default and restore the default pump envelope if min >= max.
// The returned settings always satisfy validate_settings().
ResolvedSettings resolve_settings(const SettingsRecord& record);

// Inverse of resolve_settings for a complete record.
SettingsRecord to_record(const WellSettings& s);

const char* unit_preference_to_string(UnitPreference u);
bool parse_unit_preference(const std::string& text, UnitPreference& out);

// Canonical gallons/day to the operator's display unit.
double to_display_rate(double gpd, UnitPreference unit);
double from_display_rate(double value, UnitPreference unit);

} // namespace chemsaver
