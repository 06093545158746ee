#include "chemsaver/well_store.hpp"

namespace chemsaver {

const char* store_status_to_string(StoreStatus s) {
  switch (s) {
    case StoreStatus::OK: return "OK";
    case StoreStatus::NOT_FOUND: return "NOT_FOUND";
    case StoreStatus::VERSION_CONFLICT: return "VERSION_CONFLICT";
    case StoreStatus::IO_ERROR: return "IO_ERROR";
    case StoreStatus::INVALID: return "INVALID";
    default: return "UNKNOWN";
  }
}

// -----------------------------------------------------------------------------
// InMemorySettingsStore
// -----------------------------------------------------------------------------

StoreStatus InMemorySettingsStore::load(const std::string& well_id, SettingsRecord& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(well_id);
  if (it == records_.end()) {
    return StoreStatus::NOT_FOUND;
  }
  out = it->second;
  return StoreStatus::OK;
}

StoreStatus InMemorySettingsStore::save(const std::string& well_id, const WellSettings& settings,
                                        std::vector<SettingsIssue>& issues) {
  issues = validate_settings(settings);
  if (!issues.empty()) {
    return StoreStatus::INVALID;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  records_[well_id] = to_record(settings);
  return StoreStatus::OK;
}

void InMemorySettingsStore::put_raw(const std::string& well_id, const SettingsRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[well_id] = record;
}

StoreStatus load_well_settings(SettingsStore& store, const std::string& well_id,
                               ResolvedSettings& out) {
  SettingsRecord record;
  const StoreStatus st = store.load(well_id, record);

  if (st == StoreStatus::NOT_FOUND) {
    // Absence of a stored record is equivalent to defaults
    out = ResolvedSettings{};
    out.used_defaults_only = true;
    return StoreStatus::OK;
  }
  if (st != StoreStatus::OK) {
    out = ResolvedSettings{};
    return st;
  }

  out = resolve_settings(record);
  return StoreStatus::OK;
}

// -----------------------------------------------------------------------------
// InMemoryStreamStateStore
// -----------------------------------------------------------------------------

StoreStatus InMemoryStreamStateStore::load(const std::string& well_id, StreamState& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(well_id);
  if (it == states_.end()) {
    out = StreamState{};
    return StoreStatus::NOT_FOUND;
  }
  out = it->second;
  return StoreStatus::OK;
}

StoreStatus InMemoryStreamStateStore::store(const std::string& well_id, StreamState& state) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(well_id);
  const uint64_t stored_version = (it == states_.end()) ? 0 : it->second.version;

  if (stored_version != state.version) {
    return StoreStatus::VERSION_CONFLICT;
  }

  state.version = stored_version + 1;
  states_[well_id] = state;
  return StoreStatus::OK;
}

} // namespace chemsaver
