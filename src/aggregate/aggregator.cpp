#include "dupscan/aggregate/aggregator.hpp"

#include <utility>

#include "app/math_utils.hpp"

namespace dupscan {

ThroughputMeter::ThroughputMeter(Clock::duration interval, Clock::time_point start)
    : interval_(interval), window_start_(start) {}

std::optional<ProgressSample> ThroughputMeter::observe(uint64_t bytes, Clock::time_point now) {
  window_bytes_ += bytes;
  ++window_files_;

  const auto elapsed = now - window_start_;
  if (elapsed <= interval_) {
    return std::nullopt;
  }

  const double sec = std::chrono::duration<double>(elapsed).count();
  ++ticks_;
  ProgressSample sample{};
  sample.mib_per_sec = app::to_mib_per_sec(window_bytes_, sec);
  sample.files = window_files_;
  avg_mib_per_sec_ = app::update_running_mean(avg_mib_per_sec_, sample.mib_per_sec, ticks_);
  sample.avg_mib_per_sec = avg_mib_per_sec_;

  window_start_ = now;
  window_bytes_ = 0;
  window_files_ = 0;
  return sample;
}

Aggregator::Aggregator(IEventSink& sink, AggregatorOptions opts) : sink_(sink), opts_(std::move(opts)) {
  if (!opts_.now) {
    opts_.now = []() { return Clock::now(); };
  }
}

Expected<OrderedResultSet> Aggregator::consume(ResultChannel& results, CancellationToken& token) {
  ThroughputMeter meter(opts_.progress_interval, opts_.now());
  OrderedResultSet buffered;

  for (;;) {
    auto rec = results.pop();
    if (!rec) {
      break;
    }
    if (rec->error) {
      token.cancel();
      return unexpected<Error>(std::move(*rec->error));
    }
    if (auto sample = meter.observe(rec->size, opts_.now())) {
      sink_.on_progress(*sample);
    }
    buffered.push_back(std::move(*rec));
  }
  return buffered;
}

}  // namespace dupscan
