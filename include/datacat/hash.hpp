#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "datacat/consts.hpp"

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace datacat {

// Raw 16-byte MD5 digest (binary, not hex)
using digest = std::array<std::uint8_t, consts::kDigestRawLen>;

/**
 * Incremental MD5 over the OpenSSL EVP API.
 *   Md5 h;
 *   h.update(a);
 *   h.update(b);
 *   auto d = h.finish();   // h is spent afterwards
 */
class Md5 {
public:
  Md5();
  ~Md5();
  Md5(Md5 &&) noexcept;
  Md5 &operator=(Md5 &&) noexcept;
  Md5(const Md5 &) = delete;
  Md5 &operator=(const Md5 &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }
  void update(const digest &d) { update(std::span<const std::uint8_t>(d)); }

  digest finish();

private:
  struct CtxFree {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
  bool finished_ = false;
};

// One-shot digest of a buffer.
digest md5(std::span<const std::uint8_t> data);

inline digest md5(std::string_view s) {
  return md5(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Digest of a file's bytes, read in `chunk_size` pieces so memory stays
 * bounded. Throws IoError if the file cannot be opened or read.
 */
digest md5_file(const std::filesystem::path &p, std::size_t chunk_size = consts::kChunkSize);

/** Convert binary digest to 32-char lowercase hex. */
std::string to_hex(const digest &d);

} // namespace datacat
