#pragma once

// Per-well invocation wrapper around OptimizationPipeline.
//
// One call = one trigger for one well: load settings and stream state, run
// each sample through the pipeline, hand results and audit entries to the
// sink, store the state back. The whole sequence runs inside a per-well lock,
// so overlapping triggers for the same well cannot interleave state updates.
// Wells never share a lock.

#include "chemsaver/optimization_pipeline.hpp"
#include "chemsaver/well_store.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chemsaver {

struct BatchReport final {
  StoreStatus persistence = StoreStatus::OK;  // first collaborator failure, if any
  std::string persistence_detail;

  size_t emitted = 0;
  size_t rejected = 0;
  size_t suppressed = 0;
  size_t configuration_errors = 0;

  ResolvedSettings settings;           // what the batch actually ran with
  std::vector<PipelineOutput> outputs; // one per input sample, in order
};

class DosingService final {
public:
  DosingService(SettingsStore& settings, StreamStateStore& states, ResultSink& sink,
                PipelineConfig cfg = PipelineConfig{});

  BatchReport process_batch(const std::string& well_id,
                            const std::vector<ProductionSample>& samples);

  const OptimizationPipeline& pipeline() const { return pipeline_; }

private:
  SettingsStore& settings_;
  StreamStateStore& states_;
  ResultSink& sink_;
  OptimizationPipeline pipeline_;

  std::mutex locks_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> well_locks_;

  std::mutex& lock_for(const std::string& well_id);
};

} // namespace chemsaver
