#include "app/cli_runner.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <argparse/argparse.hpp>

#include "dupscan/core/error.hpp"
#include "dupscan/scan/pipeline.hpp"
#include "dupscan/sink/event_sink.hpp"

namespace dupscan::app {

dupscan::Expected<ScanConfig> parse_args(const std::vector<std::string>& args) {
  argparse::ArgumentParser program("dupscan");
  program.add_description("Hash every regular file under a directory and report duplicates.");
  program.add_argument("root").help("directory to scan").default_value(std::string(""));
  program.add_argument("--threads")
      .help("hash worker count")
      .scan<'u', uint32_t>()
      .default_value(std::max(1u, std::thread::hardware_concurrency()));
  program.add_argument("--quiet").help("suppress progress lines").default_value(false).implicit_value(true);

  try {
    program.parse_args(args);
  } catch (const std::exception& ex) {
    std::ostringstream msg;
    msg << ex.what() << "\n" << program;
    return fail(ErrorCode::UsageError, msg.str());
  }

  ScanConfig cfg{};
  cfg.root = program.get<std::string>("root");
  cfg.worker_threads = program.get<uint32_t>("--threads");
  cfg.quiet = program.get<bool>("--quiet");

  if (cfg.root.empty()) {
    std::ostringstream msg;
    msg << "Arg 0 (root directory) missing.\n" << program;
    return fail(ErrorCode::UsageError, msg.str());
  }
  auto valid = validate_config(cfg);
  if (!valid) {
    return unexpected<Error>(valid.error());
  }
  return cfg;
}

}  // namespace dupscan::app

int run_cli_impl(int argc, char** argv) {
  const std::vector<std::string> args(argv, argv + argc);

  auto cfg = dupscan::app::parse_args(args);
  if (!cfg) {
    // Any rejected command line, including an invalid --threads value, is a usage error.
    std::cerr << "error: " << cfg.error().message() << "\n";
    return dupscan::app::kExitUsage;
  }

  auto sink = dupscan::make_stream_sink(std::cout, std::cerr, cfg->quiet);
  auto run = dupscan::run_scan(*cfg, *sink);
  if (!run) {
    sink->log(dupscan::LogLevel::Error, run.error().message());
    return dupscan::app::kExitScanError;
  }
  return dupscan::app::kExitOk;
}
