#pragma once

// Persistence seams for the engine's external collaborators.
//
// The engine never talks to a real database. Settings, stream state and
// results go through these interfaces; the in-memory implementations back the
// examples and tests. Failures come back as StoreStatus and are never retried
// here.

#include "chemsaver/dosing_types.hpp"
#include "chemsaver/stream_state.hpp"
#include "chemsaver/well_settings.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chemsaver {

enum class StoreStatus : uint8_t {
  OK = 0,
  NOT_FOUND = 1,         // no record; callers fall back to defaults / fresh state
  VERSION_CONFLICT = 2,  // optimistic check failed, another writer got there first
  IO_ERROR = 3,
  INVALID = 4            // record refused by validation
};

const char* store_status_to_string(StoreStatus s);

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------
class SettingsStore {
public:
  virtual ~SettingsStore() = default;

  virtual StoreStatus load(const std::string& well_id, SettingsRecord& out) = 0;

  // Wholesale replacement. Invalid settings are refused (INVALID) and the
  // reasons are written to `issues`.
  virtual StoreStatus save(const std::string& well_id, const WellSettings& settings,
                           std::vector<SettingsIssue>& issues) = 0;
};

class InMemorySettingsStore final : public SettingsStore {
public:
  StoreStatus load(const std::string& well_id, SettingsRecord& out) override;
  StoreStatus save(const std::string& well_id, const WellSettings& settings,
                   std::vector<SettingsIssue>& issues) override;

  // Store a raw (possibly partial or out-of-bounds) record, bypassing save()
  // validation, as an external writer could.
  void put_raw(const std::string& well_id, const SettingsRecord& record);

private:
  mutable std::mutex mutex_;
  std::map<std::string, SettingsRecord> records_;
};

// Settings for a well: defaults when absent, resolved otherwise.
// Store failures other than NOT_FOUND are returned and `out` is left at defaults.
StoreStatus load_well_settings(SettingsStore& store, const std::string& well_id,
                               ResolvedSettings& out);

// ---------------------------------------------------------------------------
// Stream state
// ---------------------------------------------------------------------------
class StreamStateStore {
public:
  virtual ~StreamStateStore() = default;

  virtual StoreStatus load(const std::string& well_id, StreamState& out) = 0;

  // Succeeds only if the stored version still equals state.version; on
  // success state.version is advanced.
  virtual StoreStatus store(const std::string& well_id, StreamState& state) = 0;
};

class InMemoryStreamStateStore final : public StreamStateStore {
public:
  StoreStatus load(const std::string& well_id, StreamState& out) override;
  StoreStatus store(const std::string& well_id, StreamState& state) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, StreamState> states_;
};

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------
struct AuditEntry final {
  int64_t timestamp = 0;
  Outcome outcome = Outcome::REJECTED;
  StatusFlag tag = StatusFlag::ERROR;  // ERROR or NO_DATA
  uint32_t flags = FLAG_NONE;
  std::string reason;
};

class ResultSink {
public:
  virtual ~ResultSink() = default;
  virtual StoreStatus append(const std::string& well_id, const OptimizationResult& r) = 0;

  // Ticks that produced no recommendation, tagged so they are not mistaken
  // for "not yet computed".
  virtual StoreStatus append_audit(const std::string& well_id, const AuditEntry& e) = 0;
};

} // namespace chemsaver
