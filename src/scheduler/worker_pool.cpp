#include "dupscan/scheduler/worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "dupscan/digest/digest.hpp"

namespace dupscan {
namespace {

class HashWorkerPool final : public IWorkerPool {
 public:
  HashWorkerPool(uint32_t worker_threads,
                 DigestFn digest,
                 JobChannel& jobs,
                 ResultChannel& results,
                 const CancellationToken& token)
      : worker_threads_(worker_threads),
        digest_(std::move(digest)),
        jobs_(jobs),
        results_(results),
        token_(token) {}

  ~HashWorkerPool() override { join(); }

  Expected<void> start() noexcept override {
    std::scoped_lock lock(mu_);
    if (started_) {
      return {};
    }

    struct ThreadJoinGuard {
      explicit ThreadJoinGuard(std::vector<std::thread>& workers) : workers_(workers) {}

      ~ThreadJoinGuard() {
        if (!active_) {
          return;
        }
        for (auto& thread : workers_) {
          if (thread.joinable()) {
            thread.join();
          }
        }
      }

      void release() noexcept { active_ = false; }

     private:
      std::vector<std::thread>& workers_;
      bool active_{true};
    };

    std::vector<std::thread> local_workers;
    ThreadJoinGuard join_guard{local_workers};
    try {
      local_workers.reserve(worker_threads_);
      for (uint32_t i = 0; i < worker_threads_; ++i) {
        local_workers.emplace_back([this]() { this->worker_loop(); });
      }
    } catch (const std::system_error& e) {
      // Workers already running must be able to drain before the guard joins them.
      jobs_.abort();
      results_.close();
      return fail(ErrorCode::Internal, std::string("spawning hash worker failed: ") + e.what());
    }

    // Fan-in: the result stream closes only after every worker has exited.
    workers_ = std::move(local_workers);
    join_guard.release();
    try {
      closer_ = std::thread([this]() {
        for (auto& t : workers_) {
          t.join();
        }
        results_.close();
      });
    } catch (const std::system_error& e) {
      jobs_.abort();
      for (auto& t : workers_) {
        t.join();
      }
      workers_.clear();
      results_.close();
      return fail(ErrorCode::Internal, std::string("spawning result closer failed: ") + e.what());
    }
    started_ = true;
    return {};
  }

  void join() noexcept override {
    std::scoped_lock lock(mu_);
    if (closer_.joinable()) {
      closer_.join();
    }
    workers_.clear();
  }

  uint32_t size() const noexcept override { return worker_threads_; }

  uint64_t processed() const noexcept override { return processed_.load(std::memory_order_relaxed); }

 private:
  void worker_loop() {
    while (!token_.cancelled()) {
      auto job = jobs_.pop();
      if (!job || token_.cancelled()) {
        return;
      }

      FileRecord rec{};
      rec.path = std::move(*job);
      auto d = digest_(rec.path);
      if (d) {
        rec.digest = std::move(d->digest);
        rec.size = d->size;
      } else {
        rec.error = std::move(d.error());
      }
      processed_.fetch_add(1, std::memory_order_relaxed);

      if (!results_.push(std::move(rec))) {
        return;
      }
    }
  }

  uint32_t worker_threads_{1};
  DigestFn digest_;
  JobChannel& jobs_;
  ResultChannel& results_;
  const CancellationToken& token_;

  std::mutex mu_;
  std::vector<std::thread> workers_;
  std::thread closer_;
  std::atomic<uint64_t> processed_{0};
  bool started_{false};
};

}  // namespace

Expected<std::unique_ptr<IWorkerPool>> make_worker_pool(const WorkerPoolConfig& cfg,
                                                        JobChannel& jobs,
                                                        ResultChannel& results,
                                                        const CancellationToken& token) noexcept {
  if (cfg.worker_threads == 0) {
    return fail(ErrorCode::InvalidArgument, "worker_threads must be > 0");
  }
  DigestFn digest = cfg.digest;
  if (!digest) {
    digest = [](const std::filesystem::path& p) { return compute_file_digest(p); };
  }
  return std::unique_ptr<IWorkerPool>(
      std::make_unique<HashWorkerPool>(cfg.worker_threads, std::move(digest), jobs, results, token));
}

}  // namespace dupscan
