#include "drover/common/hash.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

namespace drover::common {

namespace {

std::string to_hex(const unsigned char *data, std::size_t len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string sha256_hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }
  return to_hex(digest, digest_len);
}

std::string random_id(std::string_view prefix, std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes == 0 ? 1 : bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    // RAND_bytes only fails when the RNG is unseeded; fall back to a counter.
    static std::atomic<std::uint64_t> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::uint64_t mixed = static_cast<std::uint64_t>(now) ^ (++counter << 32);
    for (std::size_t i = 0; i < buffer.size(); ++i) {
      buffer[i] = static_cast<unsigned char>((mixed >> ((i % 8) * 8)) & 0xFF);
    }
  }
  return std::string(prefix) + to_hex(buffer.data(), buffer.size());
}

} // namespace drover::common
