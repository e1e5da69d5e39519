#include "dupscan/digest/digest.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace dupscan {
namespace {

constexpr size_t kReadBufferSize = 4096 * 16;

struct FdGuard {
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const noexcept { return fd_; }

 private:
  int fd_{-1};
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Expected<MdCtxPtr> new_sha1_context() {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return fail(ErrorCode::Internal, "EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    return fail(ErrorCode::Internal, "EVP_DigestInit_ex(sha1) failed");
  }
  return std::move(ctx);
}

Expected<Digest> finish(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(ctx, md.data(), &md_len) != 1) {
    return fail(ErrorCode::Internal, "EVP_DigestFinal_ex failed");
  }
  return Digest(md.begin(), md.begin() + md_len);
}

}  // namespace

Expected<DigestResult> compute_file_digest(const std::filesystem::path& path) noexcept {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return fail(ErrorCode::ReadError,
                "open for read failed: " + path.string() + ": " + std::strerror(errno));
  }
  FdGuard guard{fd};

  auto ctx = new_sha1_context();
  if (!ctx) {
    return unexpected<Error>(ctx.error());
  }

  std::array<uint8_t, kReadBufferSize> buf{};
  uint64_t written = 0;
  for (;;) {
    const ssize_t n = ::read(guard.get(), buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return fail(ErrorCode::ReadError,
                  "read failed: " + path.string() + ": " + std::strerror(errno));
    }
    if (n == 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx->get(), buf.data(), static_cast<size_t>(n)) != 1) {
      return fail(ErrorCode::Internal, "EVP_DigestUpdate failed: " + path.string());
    }
    written += static_cast<uint64_t>(n);
  }

  auto digest = finish(ctx->get());
  if (!digest) {
    return unexpected<Error>(digest.error());
  }
  return DigestResult{std::move(*digest), written};
}

Expected<Digest> compute_buffer_digest(std::span<const uint8_t> data) noexcept {
  auto ctx = new_sha1_context();
  if (!ctx) {
    return unexpected<Error>(ctx.error());
  }
  if (!data.empty() && EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1) {
    return fail(ErrorCode::Internal, "EVP_DigestUpdate failed");
  }
  return finish(ctx->get());
}

std::string to_hex(const Digest& digest) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2);
  for (const uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

}  // namespace dupscan
