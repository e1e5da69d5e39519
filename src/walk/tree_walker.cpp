#include "dupscan/walk/tree_walker.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace dupscan {
namespace {

namespace fs = std::filesystem;

Expected<void> walk_dir(const fs::path& dir,
                        JobChannel& jobs,
                        const CancellationToken& token,
                        const DirLister& lister) {
  if (is_hidden_name(base_name(dir))) {
    return {};
  }

  // The listing is taken in full first so no directory handle stays open
  // while descending.
  auto entries = lister(dir);
  if (!entries) {
    return unexpected<Error>(entries.error());
  }

  for (auto& e : *entries) {
    if (token.cancelled()) {
      return {};
    }
    switch (e.type) {
      case fs::file_type::regular:
        if (is_hidden_name(base_name(e.path))) {
          break;
        }
        if (!jobs.push(e.path.string())) {
          return {};
        }
        break;
      case fs::file_type::directory: {
        auto r = walk_dir(e.path, jobs, token, lister);
        if (!r) {
          return r;
        }
        break;
      }
      default:
        break;
    }
  }
  return {};
}

}  // namespace

bool is_hidden_name(std::string_view name) noexcept {
  return name.size() > 1 && name.front() == '.' && name != "..";
}

std::string base_name(const fs::path& p) {
  fs::path name = p.filename();
  if (name.empty() && p.has_parent_path()) {
    name = p.parent_path().filename();
  }
  return name.string();
}

Expected<std::vector<DirEntry>> list_directory(const fs::path& dir) {
  std::vector<DirEntry> entries;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return fail(ErrorCode::TraversalError, "open directory failed: " + dir.string() + ": " + ec.message());
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code st_ec;
    const auto st = it->symlink_status(st_ec);
    if (st_ec) {
      return fail(ErrorCode::TraversalError,
                  "stat failed: " + it->path().string() + ": " + st_ec.message());
    }
    entries.push_back(DirEntry{it->path(), st.type()});
  }
  if (ec) {
    return fail(ErrorCode::TraversalError, "list directory failed: " + dir.string() + ": " + ec.message());
  }
  return entries;
}

Expected<void> walk_tree(const fs::path& root,
                         JobChannel& jobs,
                         const CancellationToken& token,
                         const DirLister& lister) noexcept {
  if (root.empty()) {
    return fail(ErrorCode::InvalidArgument, "root path is empty");
  }
  if (!lister) {
    return walk_dir(root, jobs, token, list_directory);
  }
  return walk_dir(root, jobs, token, lister);
}

void produce_jobs(const fs::path& root,
                  JobChannel& jobs,
                  ResultChannel& results,
                  const CancellationToken& token) noexcept {
  auto walked = walk_tree(root, jobs, token);
  if (!walked) {
    FileRecord sentinel{};
    sentinel.error = walked.error();
    // Rejected only when the consumer has already aborted the scan.
    static_cast<void>(results.push(std::move(sentinel)));
  }
  jobs.close();
}

}  // namespace dupscan
