#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "dupscan/core/cancellation.hpp"
#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"
#include "dupscan/sink/event_sink.hpp"
#include "dupscan/walk/tree_walker.hpp"

namespace dupscan {

using Clock = std::chrono::steady_clock;
using NowFn = std::function<Clock::time_point()>;

// Windowed throughput. A sample is produced when more than `interval` has
// passed since the previous one; the window then restarts.
class ThroughputMeter {
 public:
  ThroughputMeter(Clock::duration interval, Clock::time_point start);

  std::optional<ProgressSample> observe(uint64_t bytes, Clock::time_point now);

  uint64_t ticks() const { return ticks_; }

 private:
  Clock::duration interval_;
  Clock::time_point window_start_;
  uint64_t window_bytes_{0};
  uint64_t window_files_{0};
  uint64_t ticks_{0};
  double avg_mib_per_sec_{0.0};
};

struct AggregatorOptions {
  std::chrono::milliseconds progress_interval{1000};
  NowFn now{};  // defaults to Clock::now
};

class Aggregator {
 public:
  Aggregator(IEventSink& sink, AggregatorOptions opts);

  // Drains `results` until it closes. The first record carrying an error
  // cancels `token` and is returned as the scan failure; nothing after it is
  // consumed.
  Expected<OrderedResultSet> consume(ResultChannel& results, CancellationToken& token);

 private:
  IEventSink& sink_;
  AggregatorOptions opts_;
};

}  // namespace dupscan
