// Example server demonstrating the Chemical Saver dosage engine
// This example simulates a well's production telemetry, runs each trigger
// through DosingService and exposes the results via the read-only REST API

#include "chemsaver/dosing_service.hpp"
#include "chemsaver/record_format.hpp"
#include "chemsaver/record_validator.hpp"
#include "chemsaver/rest_api_server.hpp"
#include "chemsaver/result_history.hpp"
#include "chemsaver/well_store.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

using namespace chemsaver;

int main() {
  std::cout << "Chemical Saver Dosage Engine Example\n";
  std::cout << "====================================\n\n";

  const std::string well_id = "well-001";

  // Collaborators (in-memory stand-ins for the platform stores)
  InMemorySettingsStore settings_store;
  InMemoryStreamStateStore state_store;
  ResultHistory results(500);

  WellSettings settings;
  settings.target_ppm = 250;
  settings.active_intensity = 60.0;
  settings.chemical_density = 1.05;
  settings.cost_per_gallon = 12.0;

  std::vector<SettingsIssue> issues;
  if (settings_store.save(well_id, settings, issues) != StoreStatus::OK) {
    std::cerr << "Settings refused:\n";
    for (const auto& i : issues) {
      std::cerr << "  " << i.field << ": " << i.message << "\n";
    }
    return 1;
  }

  DosingService service(settings_store, state_store, results);

  // Create and start REST API server
  RestAPIConfig api_config;
  api_config.bind_address = "0.0.0.0";
  api_config.port = 8080;

  RestAPIServer api_server(results, &settings_store, api_config);

  std::cout << "Starting REST API server on " << api_config.bind_address
            << ":" << api_config.port << "...\n";

  if (!api_server.start()) {
    std::cerr << "Failed to start REST API server!\n";
    std::cerr << "Make sure port " << api_config.port << " is not already in use.\n";
    return 1;
  }

  std::cout << "REST API server started successfully!\n\n";
  std::cout << "Available endpoints:\n";
  std::cout << "  GET http://localhost:8080/health\n";
  std::cout << "  GET http://localhost:8080/api/wells\n";
  std::cout << "  GET http://localhost:8080/api/wells/" << well_id << "/latest\n";
  std::cout << "  GET http://localhost:8080/api/wells/" << well_id << "/history\n";
  std::cout << "  GET http://localhost:8080/api/wells/" << well_id << "/summary\n";
  std::cout << "  GET http://localhost:8080/api/wells/" << well_id << "/audit\n";
  std::cout << "  GET http://localhost:8080/api/wells/" << well_id << "/settings\n";
  std::cout << "\nPress Ctrl+C to stop.\n\n";

  // Simulated telemetry: one trigger every 100 ms wall time, 30 s well time
  int64_t t = 1700000000;
  int cycle = 0;

  while (true) {
    ProductionSample s;
    s.has_timestamp = true;
    s.timestamp = t;
    s.gross_fluid_rate = 1000.0 + 150.0 * std::sin(cycle * 0.05);
    s.water_cut = 75.0 + 5.0 * std::sin(cycle * 0.02);
    s.current_injection_rate = 14.0 + 3.0 * std::sin(cycle * 0.03);

    // Inject sensor trouble now and then
    if (cycle % 37 == 5) s.gross_fluid_rate *= 8.0;   // flow spike
    if (cycle % 23 == 7) s.water_cut = 140.0;         // bad water cut
    if (cycle % 61 == 11) {
      s.current_injection_rate = -1.0;                // broken pump meter
      t += 400;                                       // after a long silence
      s.timestamp = t;
    }
    if (cycle % 97 == 13) {
      s.gross_fluid_rate = std::numeric_limits<double>::quiet_NaN();
    }

    BatchReport report = service.process_batch(well_id, {s});

    if (report.persistence != StoreStatus::OK) {
      std::cerr << "[t=" << t << "] persistence failure: " << report.persistence_detail << "\n";
    } else {
      for (const auto& out : report.outputs) {
        std::cout << "[t=" << t << "] ";
        if (out.emitted) {
          std::cout << std::fixed << std::setprecision(3)
                    << "rec=" << out.result.recommended_rate_gpd << " GPD, "
                    << "actual=" << out.result.actual_rate_gpd << " GPD, "
                    << std::setprecision(2)
                    << "gap=$" << out.result.savings_opportunity_usd << "/day, "
                    << status_flag_to_string(out.result.status_flag);
        } else {
          std::cout << outcome_to_string(out.outcome)
                    << " (" << status_flag_to_string(out.audit_tag()) << ", input "
                    << validation_status_to_string(out.validation) << ")";
        }
        if (out.flags != FLAG_NONE) {
          std::cout << " [flags=" << out.flags << "]";
        }
        for (const auto& w : out.warnings) {
          std::cout << "\n    warning: " << w;
        }
        for (const auto& e : out.errors) {
          std::cout << "\n    error: " << e;
        }
        std::cout << "\n";
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    t += 30;
    cycle++;
  }

  // Cleanup (unreachable in this example)
  api_server.stop();

  return 0;
}
