#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

#include "dupscan/core/cancellation.hpp"
#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"
#include "dupscan/walk/tree_walker.hpp"

namespace dupscan {

using DigestFn = std::function<Expected<DigestResult>(const std::filesystem::path&)>;

struct WorkerPoolConfig {
  uint32_t worker_threads{};
  DigestFn digest{};  // defaults to compute_file_digest
};

class IWorkerPool {
 public:
  virtual ~IWorkerPool() = default;

  // Spawns the workers. `results` is closed once every worker has left its
  // receive loop.
  virtual Expected<void> start() noexcept = 0;
  virtual void join() noexcept = 0;
  virtual uint32_t size() const noexcept = 0;
  virtual uint64_t processed() const noexcept = 0;
};

Expected<std::unique_ptr<IWorkerPool>> make_worker_pool(const WorkerPoolConfig& cfg,
                                                        JobChannel& jobs,
                                                        ResultChannel& results,
                                                        const CancellationToken& token) noexcept;

}  // namespace dupscan
