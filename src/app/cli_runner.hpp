#pragma once

#include <string>
#include <vector>

#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"

int run_cli_impl(int argc, char** argv);

namespace dupscan::app {

constexpr int kExitOk = 0;
constexpr int kExitScanError = 1;
constexpr int kExitUsage = 2;

dupscan::Expected<ScanConfig> parse_args(const std::vector<std::string>& args);

}  // namespace dupscan::app
