#include "chemsaver/stream_state.hpp"

#include <cmath>

namespace chemsaver {

void StreamState::reset() {
  const uint64_t keep_version = version;
  *this = StreamState{};
  version = keep_version;
}

double SpikeFilter::change_percent(double prev, double next) {
  if (!(prev > 0.0)) {
    return 0.0;
  }
  return std::fabs(next - prev) / prev * 100.0;
}

bool SpikeFilter::accept(const ProductionSample& sample, const StreamState& state) const {
  // Bootstrap: no reference reading yet
  if (!state.has_accepted_sample) {
    return true;
  }

  const ProductionSample& prev = state.last_accepted_sample;
  const int64_t elapsed = sample.timestamp - prev.timestamp;

  // A large change spread over a long interval is a real level shift
  if (elapsed > window_s_) {
    return true;
  }

  return change_percent(prev.gross_fluid_rate, sample.gross_fluid_rate) < threshold_percent_;
}

bool StalenessGate::should_suppress(int64_t now, const StreamState& state,
                                    bool sample_trustworthy) const {
  if (sample_trustworthy) {
    return false;
  }
  // Nothing trustworthy has ever been emitted: there is nothing to fall back to
  if (!state.has_trusted_emission) {
    return true;
  }
  return (now - state.last_trusted_emission_timestamp) > window_s_;
}

} // namespace chemsaver
