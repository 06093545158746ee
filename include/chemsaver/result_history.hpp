#pragma once

// Thread-safe, bounded per-well result history and the aggregate view that
// consumers of the result stream compute from it.

#include "chemsaver/dosing_types.hpp"
#include "chemsaver/well_store.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chemsaver {

// Qualitative signal derived from the latest status (not computed by the engine).
enum class CorrosionRisk : uint8_t { UNKNOWN = 0, LOW = 1, HIGH = 2 };

const char* corrosion_risk_to_string(CorrosionRisk r);
CorrosionRisk corrosion_risk_for(StatusFlag latest);

struct ResultSummary final {
  size_t count = 0;
  double cumulative_savings_usd = 0.0;  // positive entries only
  double net_gap_usd = 0.0;             // all entries, signed
  size_t optimal = 0;
  size_t over_dosing = 0;
  size_t under_dosing = 0;
  size_t pump_off = 0;
  StatusFlag latest_status = StatusFlag::NO_DATA;
  CorrosionRisk corrosion_risk = CorrosionRisk::UNKNOWN;
  double avg_recommended_gpd = 0.0;
  double avg_actual_gpd = 0.0;
};

ResultSummary summarize(const std::vector<OptimizationResult>& results);

// Results store used by the service layer and read by the API server.
class ResultHistory final : public ResultSink {
public:
  explicit ResultHistory(size_t max_history_size = 100);

  StoreStatus append(const std::string& well_id, const OptimizationResult& r) override;
  StoreStatus append_audit(const std::string& well_id, const AuditEntry& e) override;

  // Read-only access (called by API endpoints)
  bool getLatest(const std::string& well_id, OptimizationResult& out) const;
  std::vector<OptimizationResult> getHistory(const std::string& well_id, size_t max_count) const;
  std::vector<AuditEntry> getAudit(const std::string& well_id, size_t max_count) const;
  std::vector<std::string> getWells() const;

  // Applies to results and audit entries of every well
  void setMaxHistorySize(size_t size);

private:
  struct WellHistory {
    std::deque<OptimizationResult> results;
    std::deque<AuditEntry> audit;
  };

  mutable std::mutex mutex_;
  std::map<std::string, WellHistory> wells_;
  size_t max_history_size_;

  void trim(WellHistory& h);
};

} // namespace chemsaver
