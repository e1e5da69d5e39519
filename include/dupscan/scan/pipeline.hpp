#pragma once

#include "dupscan/aggregate/aggregator.hpp"
#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"
#include "dupscan/report/reporter.hpp"
#include "dupscan/scheduler/worker_pool.hpp"
#include "dupscan/sink/event_sink.hpp"

namespace dupscan {

// Test seams; empty members fall back to the real file digest and clock.
struct PipelineHooks {
  DigestFn digest{};
  NowFn now{};
};

Expected<void> validate_config(const ScanConfig& cfg) noexcept;

// Walks, hashes and aggregates. Every thread started here has been joined
// by the time this returns, on success and on failure.
Expected<OrderedResultSet> collect_results(const ScanConfig& cfg,
                                           IEventSink& sink,
                                           const PipelineHooks& hooks = {});

// collect_results + build_report + emit_report.
Expected<ReportSummary> run_scan(const ScanConfig& cfg, IEventSink& sink, const PipelineHooks& hooks = {});

}  // namespace dupscan
