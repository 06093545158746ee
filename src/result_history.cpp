#include "chemsaver/result_history.hpp"

#include <algorithm>

namespace chemsaver {

const char* corrosion_risk_to_string(CorrosionRisk r) {
  switch (r) {
    case CorrosionRisk::LOW: return "LOW";
    case CorrosionRisk::HIGH: return "HIGH";
    case CorrosionRisk::UNKNOWN:
    default: return "UNKNOWN";
  }
}

CorrosionRisk corrosion_risk_for(StatusFlag latest) {
  switch (latest) {
    case StatusFlag::UNDER_DOSING: return CorrosionRisk::HIGH;
    case StatusFlag::OPTIMAL:
    case StatusFlag::OVER_DOSING:
    case StatusFlag::PUMP_OFF: return CorrosionRisk::LOW;
    default: return CorrosionRisk::UNKNOWN;
  }
}

ResultSummary summarize(const std::vector<OptimizationResult>& results) {
  ResultSummary s;
  if (results.empty()) {
    return s;
  }

  double sum_recommended = 0.0;
  double sum_actual = 0.0;

  for (const auto& r : results) {
    if (r.savings_opportunity_usd > 0.0) {
      s.cumulative_savings_usd += r.savings_opportunity_usd;
    }
    s.net_gap_usd += r.savings_opportunity_usd;
    sum_recommended += r.recommended_rate_gpd;
    sum_actual += r.actual_rate_gpd;

    switch (r.status_flag) {
      case StatusFlag::OPTIMAL: ++s.optimal; break;
      case StatusFlag::OVER_DOSING: ++s.over_dosing; break;
      case StatusFlag::UNDER_DOSING: ++s.under_dosing; break;
      case StatusFlag::PUMP_OFF: ++s.pump_off; break;
      default: break;
    }
  }

  s.count = results.size();
  s.latest_status = results.back().status_flag;
  s.corrosion_risk = corrosion_risk_for(s.latest_status);
  s.avg_recommended_gpd = sum_recommended / static_cast<double>(s.count);
  s.avg_actual_gpd = sum_actual / static_cast<double>(s.count);
  return s;
}

// -----------------------------------------------------------------------------
// ResultHistory
// -----------------------------------------------------------------------------

ResultHistory::ResultHistory(size_t max_history_size)
    : max_history_size_(max_history_size)
{}

void ResultHistory::trim(WellHistory& h) {
  while (h.results.size() > max_history_size_) {
    h.results.pop_front();
  }
  while (h.audit.size() > max_history_size_) {
    h.audit.pop_front();
  }
}

StoreStatus ResultHistory::append(const std::string& well_id, const OptimizationResult& r) {
  std::lock_guard<std::mutex> lock(mutex_);
  WellHistory& h = wells_[well_id];
  h.results.push_back(r);
  trim(h);
  return StoreStatus::OK;
}

StoreStatus ResultHistory::append_audit(const std::string& well_id, const AuditEntry& e) {
  std::lock_guard<std::mutex> lock(mutex_);
  WellHistory& h = wells_[well_id];
  h.audit.push_back(e);
  trim(h);
  return StoreStatus::OK;
}

bool ResultHistory::getLatest(const std::string& well_id, OptimizationResult& out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = wells_.find(well_id);
  if (it == wells_.end() || it->second.results.empty()) {
    return false;
  }
  out = it->second.results.back();
  return true;
}

std::vector<OptimizationResult> ResultHistory::getHistory(const std::string& well_id,
                                                          size_t max_count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<OptimizationResult> result;
  auto it = wells_.find(well_id);
  if (it == wells_.end()) {
    return result;
  }

  const auto& src = it->second.results;
  size_t count = std::min(max_count, src.size());
  result.reserve(count);

  // Last N entries, oldest first
  for (auto r = src.end() - static_cast<std::ptrdiff_t>(count); r != src.end(); ++r) {
    result.push_back(*r);
  }
  return result;
}

std::vector<AuditEntry> ResultHistory::getAudit(const std::string& well_id,
                                                size_t max_count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AuditEntry> result;
  auto it = wells_.find(well_id);
  if (it == wells_.end()) {
    return result;
  }

  const auto& src = it->second.audit;
  size_t count = std::min(max_count, src.size());
  result.reserve(count);
  for (auto e = src.end() - static_cast<std::ptrdiff_t>(count); e != src.end(); ++e) {
    result.push_back(*e);
  }
  return result;
}

std::vector<std::string> ResultHistory::getWells() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(wells_.size());
  for (const auto& kv : wells_) {
    ids.push_back(kv.first);
  }
  return ids;
}

void ResultHistory::setMaxHistorySize(size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_history_size_ = size;
  for (auto& kv : wells_) {
    trim(kv.second);
  }
}

} // namespace chemsaver
