#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "dupscan/core/cancellation.hpp"
#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"
#include "dupscan/scheduler/channel.hpp"

namespace dupscan {

using JobChannel = Channel<std::string>;
using ResultChannel = Channel<FileRecord>;

// True for names like ".git" or ".hidden"; "." and ".." are not hidden.
bool is_hidden_name(std::string_view name) noexcept;

std::string base_name(const std::filesystem::path& p);

struct DirEntry {
  std::filesystem::path path;
  std::filesystem::file_type type{std::filesystem::file_type::none};
};

using DirLister = std::function<Expected<std::vector<DirEntry>>(const std::filesystem::path&)>;

// Lists one directory without following symlinks. Open, read and stat
// failures are TraversalError.
Expected<std::vector<DirEntry>> list_directory(const std::filesystem::path& dir);

// Depth-first walk submitting every visible regular file to `jobs` in
// directory-listing order. Stops without error once `token` is cancelled or
// `jobs` is closed; the first directory open/list failure aborts the walk.
// An empty `lister` means list_directory.
Expected<void> walk_tree(const std::filesystem::path& root,
                         JobChannel& jobs,
                         const CancellationToken& token,
                         const DirLister& lister = {}) noexcept;

// Runs walk_tree, forwards a failure to `results` as an empty-path record
// and then closes `jobs`.
void produce_jobs(const std::filesystem::path& root,
                  JobChannel& jobs,
                  ResultChannel& results,
                  const CancellationToken& token) noexcept;

}  // namespace dupscan
