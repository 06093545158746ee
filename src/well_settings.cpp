#include "chemsaver/well_settings.hpp"

#include <cmath>
#include <sstream>

namespace chemsaver {

namespace {

std::string fmt(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

// Returns true and leaves `issues` untouched when value is inside bounds.
bool check_field(const char* field, double value, const FieldBounds& b,
                 std::vector<SettingsIssue>& issues) {
  if (!std::isfinite(value)) {
    issues.push_back({field, "Must be a valid number"});
    return false;
  }
  if (value < b.min) {
    issues.push_back({field, "Must be at least " + fmt(b.min)});
    return false;
  }
  if (value > b.max) {
    issues.push_back({field, "Must be at most " + fmt(b.max)});
    return false;
  }
  return true;
}

// Missing -> default silently; out of bounds -> default with an issue.
double resolve_field(const char* field, double raw, double fallback,
                     const FieldBounds& b, std::vector<SettingsIssue>& issues,
                     bool& present) {
  if (std::isnan(raw)) {
    return fallback;
  }
  present = true;
  if (!check_field(field, raw, b, issues)) {
    return fallback;
  }
  return raw;
}

} // namespace

std::vector<SettingsIssue> validate_settings(const WellSettings& s) {
  std::vector<SettingsIssue> issues;

  check_field("target_ppm", static_cast<double>(s.target_ppm), bounds::kTargetPpm, issues);
  check_field("chemical_density", s.chemical_density, bounds::kChemicalDensity, issues);
  check_field("active_intensity", s.active_intensity, bounds::kActiveIntensity, issues);
  check_field("cost_per_gallon", s.cost_per_gallon, bounds::kCostPerGallon, issues);

  const bool min_ok = check_field("min_pump_rate", s.min_pump_rate, bounds::kMinPumpRate, issues);
  const bool max_ok = check_field("max_pump_rate", s.max_pump_rate, bounds::kMaxPumpRate, issues);

  // Cross-field check only once both sides are individually valid
  if (min_ok && max_ok && s.min_pump_rate >= s.max_pump_rate) {
    issues.push_back({"min_pump_rate", "Minimum must be less than maximum"});
    issues.push_back({"max_pump_rate", "Maximum must be greater than minimum"});
  }

  return issues;
}

ResolvedSettings resolve_settings(const SettingsRecord& record) {
  const WellSettings defaults{};
  ResolvedSettings out;
  WellSettings& s = out.settings;
  bool any_present = false;

  // target_ppm is an integer concentration; fractional input is truncated
  double ppm = record.target_ppm;
  if (std::isfinite(ppm)) {
    ppm = std::trunc(ppm);
  }
  s.target_ppm = static_cast<int>(resolve_field("target_ppm", ppm, defaults.target_ppm,
                                                bounds::kTargetPpm, out.issues, any_present));

  s.chemical_density = resolve_field("chemical_density", record.chemical_density,
                                     defaults.chemical_density, bounds::kChemicalDensity,
                                     out.issues, any_present);
  s.active_intensity = resolve_field("active_intensity", record.active_intensity,
                                     defaults.active_intensity, bounds::kActiveIntensity,
                                     out.issues, any_present);
  s.cost_per_gallon = resolve_field("cost_per_gallon", record.cost_per_gallon,
                                    defaults.cost_per_gallon, bounds::kCostPerGallon,
                                    out.issues, any_present);
  s.min_pump_rate = resolve_field("min_pump_rate", record.min_pump_rate,
                                  defaults.min_pump_rate, bounds::kMinPumpRate,
                                  out.issues, any_present);
  s.max_pump_rate = resolve_field("max_pump_rate", record.max_pump_rate,
                                  defaults.max_pump_rate, bounds::kMaxPumpRate,
                                  out.issues, any_present);

  // Inverted envelope: neither side can be trusted, fall back to both defaults
  if (s.min_pump_rate >= s.max_pump_rate) {
    out.issues.push_back({"min_pump_rate", "Minimum must be less than maximum"});
    out.issues.push_back({"max_pump_rate", "Maximum must be greater than minimum"});
    s.min_pump_rate = defaults.min_pump_rate;
    s.max_pump_rate = defaults.max_pump_rate;
  }

  if (!record.unit_preference.empty()) {
    any_present = true;
    if (!parse_unit_preference(record.unit_preference, s.unit_preference)) {
      out.issues.push_back({"unit_preference", "Must be 'gallons' or 'liters'"});
      s.unit_preference = defaults.unit_preference;
    }
  }

  out.used_defaults_only = !any_present;
  return out;
}

SettingsRecord to_record(const WellSettings& s) {
  SettingsRecord r;
  r.target_ppm = static_cast<double>(s.target_ppm);
  r.chemical_density = s.chemical_density;
  r.active_intensity = s.active_intensity;
  r.cost_per_gallon = s.cost_per_gallon;
  r.min_pump_rate = s.min_pump_rate;
  r.max_pump_rate = s.max_pump_rate;
  r.unit_preference = unit_preference_to_string(s.unit_preference);
  return r;
}

const char* unit_preference_to_string(UnitPreference u) {
  switch (u) {
    case UnitPreference::GALLONS: return "gallons";
    case UnitPreference::LITERS: return "liters";
    default: return "gallons";
  }
}

bool parse_unit_preference(const std::string& text, UnitPreference& out) {
  if (text == "gallons") {
    out = UnitPreference::GALLONS;
    return true;
  }
  if (text == "liters") {
    out = UnitPreference::LITERS;
    return true;
  }
  return false;
}

double to_display_rate(double gpd, UnitPreference unit) {
  return unit == UnitPreference::LITERS ? gpd * kLitersPerGallon : gpd;
}

double from_display_rate(double value, UnitPreference unit) {
  return unit == UnitPreference::LITERS ? value * kGallonsPerLiter : value;
}

} // namespace chemsaver
