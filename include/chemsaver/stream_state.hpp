#pragma once

// Per-well stream memory and the two filters that consult it.
//
// StreamState is the only carrier of history in the engine. It is an explicit
// value: loaded by the caller before a tick, passed into the pipeline, and
// stored back afterwards. Nothing here is global.

#include "chemsaver/dosing_types.hpp"

#include <cstdint>
#include <limits>

namespace chemsaver {

// Sensor artifact policy (engine-wide, not per-well settings)
constexpr double  kDefaultSpikeThresholdPercent = 500.0; // |change| >= this => artifact
constexpr int64_t kDefaultSpikeWindowSeconds = 60;       // only within this interval
constexpr int64_t kDefaultStalenessWindowSeconds = 300;  // silence window

struct StreamState final {
  bool has_accepted_sample = false;
  ProductionSample last_accepted_sample;  // passed validation and spike filtering

  // Carried forward across samples whose water cut is unusable
  double last_accepted_water_cut = std::numeric_limits<double>::quiet_NaN();

  bool    has_emission = false;
  int64_t last_emission_timestamp = 0;

  // Last emission computed from the tick's own readings. Emissions that
  // reuse prior values do not move it, so the silence window keeps growing
  // while only bad data arrives.
  bool    has_trusted_emission = false;
  int64_t last_trusted_emission_timestamp = 0;

  // Most recent tick seen, including suppressed ones
  bool    has_attempt = false;
  int64_t last_attempt_timestamp = 0;

  // Optimistic concurrency token, owned by the state store
  uint64_t version = 0;

  // Back to "never seen this well"; keeps the store version.
  void reset();
};

// Rejects a flow reading implying an implausible rate of change.
class SpikeFilter final {
public:
  SpikeFilter(double threshold_percent = kDefaultSpikeThresholdPercent,
              int64_t window_s = kDefaultSpikeWindowSeconds)
      : threshold_percent_(threshold_percent), window_s_(window_s) {}

  // True when the sample may be used. The first sample of a well, a sample
  // arriving after the window, and any change relative to a zero prior
  // reading are always accepted.
  bool accept(const ProductionSample& sample, const StreamState& state) const;

  // |new - prev| / prev in percent, or 0 when prev is not positive.
  static double change_percent(double prev, double next);

private:
  double  threshold_percent_;
  int64_t window_s_;
};

// Blocks emission when nothing trustworthy has been emitted within the window.
//
// The silence is measured from the last trusted emission, not from results
// that reused prior values. A trustworthy sample is never suppressed, however
// long the gap.
class StalenessGate final {
public:
  explicit StalenessGate(int64_t window_s = kDefaultStalenessWindowSeconds)
      : window_s_(window_s) {}

  bool should_suppress(int64_t now, const StreamState& state,
                       bool sample_trustworthy) const;

  int64_t window_s() const { return window_s_; }

private:
  int64_t window_s_;
};

} // namespace chemsaver
