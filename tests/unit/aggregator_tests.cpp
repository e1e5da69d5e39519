#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dupscan/aggregate/aggregator.hpp"
#include "dupscan/core/error.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using dupscan::Clock;

constexpr uint64_t kMiB = 1024 * 1024;

bool close_to(double a, double b) { return std::fabs(a - b) < 1e-9; }

// Hands out the given instants in order, one per now() call.
dupscan::NowFn scripted_clock(std::vector<Clock::time_point> instants) {
  auto state = std::make_shared<std::pair<std::vector<Clock::time_point>, size_t>>(std::move(instants), 0);
  return [state]() {
    auto& [times, idx] = *state;
    const auto t = times[std::min(idx, times.size() - 1)];
    ++idx;
    return t;
  };
}

dupscan::FileRecord ok_record(const std::string& path, uint64_t size) {
  dupscan::FileRecord r{};
  r.path = path;
  r.size = size;
  r.digest = dupscan::Digest(dupscan::kDigestSize, 0xab);
  return r;
}

bool test_meter_running_average() {
  const auto t0 = Clock::time_point{} + 100s;
  dupscan::ThroughputMeter meter(1s, t0);

  if (meter.observe(kMiB, t0 + 500ms)) {
    std::cerr << "no sample expected inside the first interval\n";
    return false;
  }
  auto s1 = meter.observe(kMiB, t0 + 2s);
  if (!s1 || !close_to(s1->mib_per_sec, 1.0) || s1->files != 2 || !close_to(s1->avg_mib_per_sec, 1.0)) {
    std::cerr << "first tick wrong\n";
    return false;
  }
  auto s2 = meter.observe(3 * kMiB, t0 + 3500ms);
  if (!s2 || !close_to(s2->mib_per_sec, 2.0) || s2->files != 1 || !close_to(s2->avg_mib_per_sec, 1.5)) {
    std::cerr << "second tick wrong: " << (s2 ? s2->avg_mib_per_sec : -1.0) << "\n";
    return false;
  }
  // Exactly one interval is not "more than" one interval.
  if (meter.observe(kMiB, t0 + 4500ms)) {
    std::cerr << "tick must require strictly more than the interval\n";
    return false;
  }
  auto s3 = meter.observe(0, t0 + 5500ms);
  if (!s3 || !close_to(s3->mib_per_sec, 0.5) || s3->files != 2 ||
      !close_to(s3->avg_mib_per_sec, 1.5 + (0.5 - 1.5) / 3.0)) {
    std::cerr << "third tick wrong\n";
    return false;
  }
  if (meter.ticks() != 3) {
    std::cerr << "tick count mismatch\n";
    return false;
  }
  return true;
}

bool test_consume_buffers_and_reports_progress() {
  const auto t0 = Clock::time_point{} + 10s;
  dupscan::testing::RecordingSink sink;
  dupscan::AggregatorOptions opts{};
  opts.progress_interval = 1000ms;
  opts.now = scripted_clock({t0, t0 + 100ms, t0 + 1500ms, t0 + 1600ms});
  dupscan::Aggregator agg(sink, opts);

  dupscan::ResultChannel results;
  results.push(ok_record("r/a", kMiB));
  results.push(ok_record("r/b", kMiB));
  results.push(ok_record("r/c", 7));
  results.close();

  dupscan::CancellationToken token;
  auto out = agg.consume(results, token);
  if (!out || out->size() != 3) {
    std::cerr << "expected all three records buffered\n";
    return false;
  }
  if (token.cancelled()) {
    std::cerr << "successful consume must not cancel\n";
    return false;
  }
  if (sink.progress.size() != 1 || sink.progress[0].files != 2) {
    std::cerr << "expected exactly one progress sample covering two files\n";
    return false;
  }
  return true;
}

bool test_first_error_short_circuits() {
  dupscan::testing::RecordingSink sink;
  dupscan::Aggregator agg(sink, dupscan::AggregatorOptions{});

  dupscan::ResultChannel results;
  results.push(ok_record("r/a", 1));
  dupscan::FileRecord bad{};
  bad.path = "r/b";
  bad.error = dupscan::Error{dupscan::ErrorCode::ReadError, "permission denied"};
  results.push(std::move(bad));
  results.push(ok_record("r/c", 1));
  results.close();

  dupscan::CancellationToken token;
  auto out = agg.consume(results, token);
  if (out || out.error().code() != dupscan::ErrorCode::ReadError) {
    std::cerr << "expected ReadError from consume\n";
    return false;
  }
  if (!token.cancelled()) {
    std::cerr << "error must cancel the scan\n";
    return false;
  }
  if (results.size() != 1) {
    std::cerr << "records after the error must be left unconsumed\n";
    return false;
  }
  return true;
}

bool test_traversal_sentinel_short_circuits() {
  dupscan::testing::RecordingSink sink;
  dupscan::Aggregator agg(sink, dupscan::AggregatorOptions{});

  dupscan::ResultChannel results;
  dupscan::FileRecord sentinel{};
  sentinel.error = dupscan::Error{dupscan::ErrorCode::TraversalError, "cannot list"};
  results.push(std::move(sentinel));
  results.close();

  dupscan::CancellationToken token;
  auto out = agg.consume(results, token);
  if (out || out.error().code() != dupscan::ErrorCode::TraversalError) {
    std::cerr << "expected TraversalError from sentinel\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_meter_running_average()) {
    return 1;
  }
  if (!test_consume_buffers_and_reports_progress()) {
    return 1;
  }
  if (!test_first_error_short_circuits()) {
    return 1;
  }
  if (!test_traversal_sentinel_short_circuits()) {
    return 1;
  }
  return 0;
}
