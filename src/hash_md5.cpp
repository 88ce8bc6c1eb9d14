#include "datacat/hash.hpp"

#include "datacat/consts.hpp"
#include "datacat/errors.hpp"

#include <fstream>
#include <openssl/evp.h> // EVP_* digest API
#include <vector>

namespace datacat {

void Md5::CtxFree::operator()(evp_md_ctx_st *ctx) const { EVP_MD_CTX_free(ctx); }

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_md5) failed");
  }
}

Md5::~Md5() = default;
Md5::Md5(Md5 &&) noexcept = default;
Md5 &Md5::operator=(Md5 &&) noexcept = default;

void Md5::update(std::span<const std::uint8_t> data) {
  if (!ctx_ || finished_) {
    throw std::logic_error("Md5::update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest Md5::finish() {
  if (!ctx_ || finished_) {
    throw std::logic_error("Md5::finish called twice");
  }
  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finished_ = true;
  if (len != out.size()) {
    throw std::runtime_error("MD5 produced unexpected length");
  }
  return out;
}

digest md5(std::span<const std::uint8_t> data) {
  Md5 h;
  h.update(data);
  return h.finish();
}

digest md5_file(const std::filesystem::path &p, std::size_t chunk_size) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }

  Md5 h;
  std::vector<char> buf(chunk_size == 0 ? consts::kChunkSize : chunk_size);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = ifs.gcount();
    if (got > 0) {
      h.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()),
                                             static_cast<std::size_t>(got)));
    }
  }
  if (ifs.bad()) {
    throw IoError("read failed: " + p.string());
  }
  return h.finish();
}

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kDigestHexLen);
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace datacat
