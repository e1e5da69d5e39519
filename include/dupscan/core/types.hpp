#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "dupscan/core/error.hpp"

namespace dupscan {

constexpr size_t kDigestSize = 20;  // SHA-1

// Empty until computed.
using Digest = std::vector<uint8_t>;

struct FileRecord {
  std::string path{};
  Digest digest{};
  uint64_t size{0};
  std::optional<Error> error{};

  bool ok() const noexcept { return !error.has_value(); }
};

using OrderedResultSet = std::vector<FileRecord>;

struct DigestResult {
  Digest digest{};
  uint64_t size{0};
};

struct ScanConfig {
  std::filesystem::path root{};
  uint32_t worker_threads{std::max(1u, std::thread::hardware_concurrency())};
  std::chrono::milliseconds progress_interval{1000};
  bool quiet{false};
};

struct ProgressSample {
  double mib_per_sec{0.0};
  uint64_t files{0};
  double avg_mib_per_sec{0.0};
};

struct ReportSummary {
  uint64_t files{0};
  uint64_t duplicates{0};
  uint64_t duplicate_bytes{0};
  uint64_t total_bytes{0};

  double duplicate_mib() const;
  double total_mib() const;
};

enum class LogLevel { Info, Warn, Error };

}  // namespace dupscan
