#pragma once

#include <iosfwd>
#include <memory>
#include <string_view>

#include "dupscan/core/types.hpp"

namespace dupscan {

// Receives everything the scan reports. Calls arrive from the thread that
// runs the scan, never from workers.
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  virtual void on_progress(const ProgressSample& sample) = 0;
  virtual void on_file(std::string_view hex_digest, std::string_view relative_path) = 0;
  virtual void on_summary(const ReportSummary& summary) = 0;
  virtual void log(LogLevel level, std::string_view message) = 0;
};

// File lines go to `out`; progress, summary and log lines go to `err`.
// `quiet` drops progress and info-level log lines.
std::unique_ptr<IEventSink> make_stream_sink(std::ostream& out, std::ostream& err, bool quiet);

}  // namespace dupscan
