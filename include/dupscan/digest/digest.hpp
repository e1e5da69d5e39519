#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

#include "dupscan/core/expected.hpp"
#include "dupscan/core/types.hpp"

namespace dupscan {

// Streams the whole file through SHA-1. The descriptor is released on every
// return path; a failed read never yields a partial digest.
Expected<DigestResult> compute_file_digest(const std::filesystem::path& path) noexcept;

Expected<Digest> compute_buffer_digest(std::span<const uint8_t> data) noexcept;

std::string to_hex(const Digest& digest);

}  // namespace dupscan
