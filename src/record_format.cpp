#include "chemsaver/record_format.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace chemsaver {

const char* status_flag_to_string(StatusFlag s) {
  switch (s) {
    case StatusFlag::OPTIMAL: return "OPTIMAL";
    case StatusFlag::OVER_DOSING: return "OVER_DOSING";
    case StatusFlag::UNDER_DOSING: return "UNDER_DOSING";
    case StatusFlag::PUMP_OFF: return "PUMP_OFF";
    case StatusFlag::ERROR: return "ERROR";
    case StatusFlag::NO_DATA: return "NO_DATA";
    default: return "UNKNOWN";
  }
}

bool parse_status_flag(const std::string& text, StatusFlag& out) {
  static const StatusFlag all[] = {
    StatusFlag::OPTIMAL, StatusFlag::OVER_DOSING, StatusFlag::UNDER_DOSING,
    StatusFlag::PUMP_OFF, StatusFlag::ERROR, StatusFlag::NO_DATA
  };
  for (StatusFlag s : all) {
    if (text == status_flag_to_string(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

std::string json_string(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

std::string json_number(double v, int precision) {
  if (!std::isfinite(v)) {
    return "null";
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << v;
  return oss.str();
}

std::string result_to_json(const OptimizationResult& r, int indent) {
  const std::string pad(static_cast<size_t>(indent), ' ');
  std::ostringstream json;
  json << "{\n";
  json << pad << "  \"timestamp\": " << r.timestamp << ",\n";
  json << pad << "  \"recommended_rate_gpd\": " << json_number(r.recommended_rate_gpd) << ",\n";
  json << pad << "  \"unconstrained_rate_gpd\": " << json_number(r.unconstrained_rate_gpd) << ",\n";
  json << pad << "  \"actual_rate_gpd\": " << json_number(r.actual_rate_gpd) << ",\n";
  json << pad << "  \"savings_opportunity_usd\": " << json_number(r.savings_opportunity_usd) << ",\n";
  json << pad << "  \"status_flag\": \"" << status_flag_to_string(r.status_flag) << "\",\n";
  json << pad << "  \"water_bpd\": " << json_number(r.water_bpd) << ",\n";
  json << pad << "  \"current_ppm\": " << json_number(r.current_ppm) << ",\n";
  json << pad << "  \"target_ppm\": " << r.target_ppm << ",\n";
  json << pad << "  \"flags\": " << r.flags << "\n";
  json << pad << "}";
  return json.str();
}

std::string settings_to_json(const WellSettings& s, int indent) {
  const std::string pad(static_cast<size_t>(indent), ' ');
  std::ostringstream json;
  json << std::setprecision(std::numeric_limits<double>::max_digits10);
  json << "{\n";
  json << pad << "  \"target_ppm\": " << s.target_ppm << ",\n";
  json << pad << "  \"chemical_density\": " << s.chemical_density << ",\n";
  json << pad << "  \"active_intensity\": " << s.active_intensity << ",\n";
  json << pad << "  \"cost_per_gallon\": " << s.cost_per_gallon << ",\n";
  json << pad << "  \"min_pump_rate\": " << s.min_pump_rate << ",\n";
  json << pad << "  \"max_pump_rate\": " << s.max_pump_rate << ",\n";
  json << pad << "  \"unit_preference\": \"" << unit_preference_to_string(s.unit_preference) << "\"\n";
  json << pad << "}";
  return json.str();
}

} // namespace chemsaver
