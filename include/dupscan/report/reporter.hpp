#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"
#include "dupscan/sink/event_sink.hpp"

namespace dupscan {

struct ReportLine {
  std::string hex_digest{};
  std::string relative_path{};
  bool duplicate{false};
};

struct Report {
  std::vector<ReportLine> lines{};
  ReportSummary summary{};
};

// Orders by digest bytes, then by path. Equal digests end up adjacent.
void sort_results(OrderedResultSet& results);

// Sorts `results` and counts every record whose non-empty digest equals the
// one before it as a duplicate. Fails with PathError when a path cannot be
// expressed relative to `root`.
Expected<Report> build_report(OrderedResultSet results, const std::filesystem::path& root);

void emit_report(const Report& report, IEventSink& sink);

std::filesystem::path normalize_root(const std::filesystem::path& root);

}  // namespace dupscan
