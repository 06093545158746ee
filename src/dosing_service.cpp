#include "chemsaver/dosing_service.hpp"

namespace chemsaver {

DosingService::DosingService(SettingsStore& settings, StreamStateStore& states,
                             ResultSink& sink, PipelineConfig cfg)
    : settings_(settings)
    , states_(states)
    , sink_(sink)
    , pipeline_(cfg)
{}

std::mutex& DosingService::lock_for(const std::string& well_id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& slot = well_locks_[well_id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

BatchReport DosingService::process_batch(const std::string& well_id,
                                         const std::vector<ProductionSample>& samples) {
  std::lock_guard<std::mutex> well_lock(lock_for(well_id));

  BatchReport report;
  auto fail = [&](StoreStatus st, const char* what) {
    if (report.persistence == StoreStatus::OK) {
      report.persistence = st;
      report.persistence_detail = std::string(what) + ": " + store_status_to_string(st);
    }
  };

  // ------------------------------------------------------------------------
  // Load: settings (defaults when absent) and stream state (fresh when absent)
  // ------------------------------------------------------------------------
  StoreStatus st = load_well_settings(settings_, well_id, report.settings);
  if (st != StoreStatus::OK) {
    fail(st, "settings load");
    return report;
  }

  StreamState state;
  st = states_.load(well_id, state);
  if (st != StoreStatus::OK && st != StoreStatus::NOT_FOUND) {
    fail(st, "state load");
    return report;
  }

  // ------------------------------------------------------------------------
  // Compute
  // ------------------------------------------------------------------------
  report.outputs.reserve(samples.size());

  for (const auto& sample : samples) {
    PipelineOutput out = pipeline_.process(sample, report.settings.settings, state);

    switch (out.outcome) {
      case Outcome::EMITTED: ++report.emitted; break;
      case Outcome::REJECTED: ++report.rejected; break;
      case Outcome::SUPPRESSED_STALE: ++report.suppressed; break;
      case Outcome::CONFIGURATION_ERROR: ++report.configuration_errors; break;
    }

    if (out.emitted) {
      st = sink_.append(well_id, out.result);
    } else {
      AuditEntry entry;
      entry.timestamp = sample.timestamp;
      entry.outcome = out.outcome;
      entry.tag = out.audit_tag();
      entry.flags = out.flags;
      entry.reason = !out.errors.empty() ? out.errors.front()
                                         : std::string(outcome_to_string(out.outcome));
      st = sink_.append_audit(well_id, entry);
    }
    report.outputs.push_back(out);

    // The sink is behind; stop here and leave the stored state where it was
    // so the caller can replay the batch.
    if (st != StoreStatus::OK) {
      fail(st, "result append");
      return report;
    }
  }

  // ------------------------------------------------------------------------
  // Store state back (optimistic version check)
  // ------------------------------------------------------------------------
  st = states_.store(well_id, state);
  if (st != StoreStatus::OK) {
    fail(st, "state store");
  }
  return report;
}

} // namespace chemsaver
