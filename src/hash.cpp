#include "launchpad/hash.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace launchpad {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Length prefix keeps ("ab","c") and ("a","bc") apart.
void update_framed(blake3_hasher& hasher, std::string_view part) {
  const std::uint64_t n = part.size();
  unsigned char len[8];
  for (int i = 0; i < 8; ++i) len[i] = static_cast<unsigned char>((n >> (8 * i)) & 0xff);
  blake3_hasher_update(&hasher, len, sizeof(len));
  blake3_hasher_update(&hasher, part.data(), part.size());
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string package_digest(const std::map<std::string, std::string>& files) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  constexpr std::string_view kDomain = "pkg:";
  blake3_hasher_update(&hasher, kDomain.data(), kDomain.size());
  // std::map iteration is sorted by path, so the digest is order-independent.
  for (const auto& [path, content] : files) {
    update_framed(hasher, path);
    update_framed(hasher, content);
  }
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string short_id(const std::string& digest, std::size_t len) {
  return digest.substr(0, std::min(len, digest.size()));
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace launchpad
