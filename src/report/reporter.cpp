#include "dupscan/report/reporter.hpp"

#include <algorithm>
#include <utility>

#include "app/math_utils.hpp"
#include "dupscan/digest/digest.hpp"

namespace dupscan {
namespace {

namespace fs = std::filesystem;

Expected<std::string> relative_to(const std::string& path, const fs::path& root) {
  const fs::path rel = fs::path(path).lexically_normal().lexically_relative(root);
  if (rel.empty()) {
    return fail(ErrorCode::PathError,
                "cannot make " + (path.empty() ? std::string("<empty path>") : path) + " relative to " +
                    root.string());
  }
  return rel.string();
}

}  // namespace

double ReportSummary::duplicate_mib() const { return app::bytes_to_mib(duplicate_bytes); }

double ReportSummary::total_mib() const { return app::bytes_to_mib(total_bytes); }

fs::path normalize_root(const fs::path& root) {
  fs::path p = root.lexically_normal();
  if (!p.has_filename() && p.has_relative_path()) {
    p = p.parent_path();
  }
  return p;
}

void sort_results(OrderedResultSet& results) {
  std::sort(results.begin(), results.end(), [](const FileRecord& a, const FileRecord& b) {
    if (a.digest != b.digest) {
      return a.digest < b.digest;
    }
    return a.path < b.path;
  });
}

Expected<Report> build_report(OrderedResultSet results, const fs::path& root) {
  sort_results(results);
  const fs::path base = normalize_root(root);

  Report report{};
  report.lines.reserve(results.size());
  const Digest* prev = nullptr;
  for (const auto& r : results) {
    auto rel = relative_to(r.path, base);
    if (!rel) {
      return unexpected<Error>(rel.error());
    }

    ReportLine line{};
    line.hex_digest = to_hex(r.digest);
    line.relative_path = std::move(*rel);
    line.duplicate = !r.digest.empty() && prev != nullptr && *prev == r.digest;

    report.summary.total_bytes += r.size;
    ++report.summary.files;
    if (line.duplicate) {
      ++report.summary.duplicates;
      report.summary.duplicate_bytes += r.size;
    }
    prev = &r.digest;
    report.lines.push_back(std::move(line));
  }
  return report;
}

void emit_report(const Report& report, IEventSink& sink) {
  for (const auto& line : report.lines) {
    sink.on_file(line.hex_digest, line.relative_path);
  }
  sink.on_summary(report.summary);
}

}  // namespace dupscan
