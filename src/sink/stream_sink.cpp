#include "dupscan/sink/event_sink.hpp"

#include <iomanip>
#include <ios>
#include <ostream>

#include "app/math_utils.hpp"

namespace dupscan {
namespace {

const char* level_prefix(LogLevel level) {
  switch (level) {
    case LogLevel::Info:
      return "[info] ";
    case LogLevel::Warn:
      return "[warn] ";
    case LogLevel::Error:
      return "error: ";
  }
  return "";
}

class StreamSink final : public IEventSink {
 public:
  StreamSink(std::ostream& out, std::ostream& err, bool quiet) : out_(out), err_(err), quiet_(quiet) {}

  void on_progress(const ProgressSample& s) override {
    if (quiet_) {
      return;
    }
    const auto flags = err_.flags();
    const auto prec = err_.precision();
    err_ << std::fixed << std::setprecision(2) << "MB/s: " << s.mib_per_sec << "\tfiles: " << s.files
         << "\tMB/s (total): " << s.avg_mib_per_sec << "\n";
    err_.flags(flags);
    err_.precision(prec);
  }

  void on_file(std::string_view hex_digest, std::string_view relative_path) override {
    out_ << hex_digest << '\t' << relative_path << '\n';
  }

  void on_summary(const ReportSummary& s) override {
    out_.flush();
    err_ << "Duplicates   : " << s.duplicates << "\n";
    err_ << "Duplicate MB : " << app::format_shortest(s.duplicate_mib()) << "\n";
    err_ << "Total MB     : " << app::format_shortest(s.total_mib()) << "\n";
  }

  void log(LogLevel level, std::string_view message) override {
    if (quiet_ && level == LogLevel::Info) {
      return;
    }
    err_ << level_prefix(level) << message << "\n";
  }

 private:
  std::ostream& out_;
  std::ostream& err_;
  bool quiet_{false};
};

}  // namespace

std::unique_ptr<IEventSink> make_stream_sink(std::ostream& out, std::ostream& err, bool quiet) {
  return std::make_unique<StreamSink>(out, err, quiet);
}

}  // namespace dupscan
