#include "dupscan/scan/pipeline.hpp"

#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "dupscan/core/cancellation.hpp"
#include "dupscan/walk/tree_walker.hpp"

namespace dupscan {

Expected<void> validate_config(const ScanConfig& cfg) noexcept {
  if (cfg.root.empty()) {
    return fail(ErrorCode::UsageError, "root directory missing");
  }
  if (cfg.worker_threads == 0) {
    return fail(ErrorCode::InvalidArgument, "worker_threads must be > 0");
  }
  if (cfg.progress_interval.count() <= 0) {
    return fail(ErrorCode::InvalidArgument, "progress_interval must be > 0");
  }
  return {};
}

Expected<OrderedResultSet> collect_results(const ScanConfig& cfg, IEventSink& sink, const PipelineHooks& hooks) {
  auto valid = validate_config(cfg);
  if (!valid) {
    return unexpected<Error>(valid.error());
  }

  JobChannel jobs;
  ResultChannel results;
  CancellationToken token;

  WorkerPoolConfig pool_cfg{};
  pool_cfg.worker_threads = cfg.worker_threads;
  pool_cfg.digest = hooks.digest;
  auto pool = make_worker_pool(pool_cfg, jobs, results, token);
  if (!pool) {
    return unexpected<Error>(pool.error());
  }
  auto started = (*pool)->start();
  if (!started) {
    return unexpected<Error>(started.error());
  }

  std::thread walker;
  try {
    walker = std::thread([&]() { produce_jobs(cfg.root, jobs, results, token); });
  } catch (const std::system_error& e) {
    token.cancel();
    jobs.abort();
    (*pool)->join();
    return fail(ErrorCode::Internal, std::string("spawning tree walker failed: ") + e.what());
  }

  AggregatorOptions agg_opts{};
  agg_opts.progress_interval = cfg.progress_interval;
  agg_opts.now = hooks.now;
  Aggregator aggregator(sink, std::move(agg_opts));
  auto collected = aggregator.consume(results, token);

  if (!collected) {
    // Unblock the walker and any worker still holding a job, then wait for
    // them so no thread or descriptor outlives the scan.
    jobs.abort();
    results.abort();
    sink.log(LogLevel::Warn, std::string("scan aborted (") + error_code_name(collected.error().code()) +
                                 "), waiting for in-flight work to stop");
  }
  walker.join();
  (*pool)->join();
  return collected;
}

Expected<ReportSummary> run_scan(const ScanConfig& cfg, IEventSink& sink, const PipelineHooks& hooks) {
  auto collected = collect_results(cfg, sink, hooks);
  if (!collected) {
    return unexpected<Error>(collected.error());
  }
  auto report = build_report(std::move(*collected), cfg.root);
  if (!report) {
    return unexpected<Error>(report.error());
  }
  emit_report(*report, sink);
  return report->summary;
}

}  // namespace dupscan
