#include <iostream>
#include <string>
#include <vector>

#include "app/cli_runner.hpp"
#include "dupscan/core/error.hpp"

namespace {

bool test_missing_root_is_usage_error() {
  auto cfg = dupscan::app::parse_args({"dupscan"});
  if (cfg || cfg.error().code() != dupscan::ErrorCode::UsageError) {
    std::cerr << "expected usage error without a root argument\n";
    return false;
  }
  return true;
}

bool test_options() {
  auto cfg = dupscan::app::parse_args({"dupscan", "--threads", "3", "--quiet", "/data"});
  if (!cfg) {
    std::cerr << "parse_args failed: " << cfg.error().message() << "\n";
    return false;
  }
  if (cfg->root != "/data" || cfg->worker_threads != 3 || !cfg->quiet) {
    std::cerr << "parsed values mismatch\n";
    return false;
  }

  auto defaults = dupscan::app::parse_args({"dupscan", "some/dir"});
  if (!defaults || defaults->worker_threads == 0 || defaults->quiet) {
    std::cerr << "default values mismatch\n";
    return false;
  }
  return true;
}

bool test_zero_threads_rejected() {
  auto cfg = dupscan::app::parse_args({"dupscan", "--threads", "0", "/data"});
  if (cfg || cfg.error().code() != dupscan::ErrorCode::InvalidArgument) {
    std::cerr << "expected invalid argument for --threads 0\n";
    return false;
  }
  return true;
}

int run_with(std::vector<std::string> args) {
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  return run_cli_impl(static_cast<int>(argv.size()), argv.data());
}

bool test_bad_arguments_exit_with_usage_code() {
  const int zero_threads = run_with({"dupscan", "--threads", "0", "/data"});
  if (zero_threads != dupscan::app::kExitUsage) {
    std::cerr << "--threads 0 should exit " << dupscan::app::kExitUsage << ", got " << zero_threads << "\n";
    return false;
  }
  const int no_root = run_with({"dupscan", "--quiet"});
  if (no_root != dupscan::app::kExitUsage) {
    std::cerr << "missing root should exit " << dupscan::app::kExitUsage << ", got " << no_root << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_missing_root_is_usage_error()) {
    return 1;
  }
  if (!test_options()) {
    return 1;
  }
  if (!test_zero_threads_rejected()) {
    return 1;
  }
  if (!test_bad_arguments_exit_with_usage_code()) {
    return 1;
  }
  return 0;
}
