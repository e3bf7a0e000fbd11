#include "h5gate/hash.hpp"

// BLAKE3 is the only hash primitive. Every digest is domain-separated by a
// short prefix fed to the hasher ahead of the payload; the prefixes are part
// of the fingerprint format and must not change without bumping
// FINGERPRINT_VERSION (version.hpp).

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace fs = std::filesystem;

namespace h5gate {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  const char* ver = blake3_version();
  info.version = ver ? ver : "unknown";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_fixture_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return {};

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  constexpr std::string_view kDomain = "fixture:";
  blake3_hasher_update(&hasher, kDomain.data(), kDomain.size());

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0) blake3_hasher_update(&hasher, buffer.data(), static_cast<std::size_t>(count));
  }
  if (file.bad()) return {};
  return finalize_hex(hasher);
}

std::string allowlist_fingerprint(std::string_view canonical_json) {
  return hash_domain("allowlist:", canonical_json);
}

std::string corpus_fingerprint(const std::string& base, std::vector<std::string> paths) {
  std::sort(paths.begin(), paths.end());
  std::string manifest;
  for (const auto& p : paths) {
    const std::string rel = fs::path(p).lexically_relative(fs::path(base)).generic_string();
    manifest += rel.empty() ? p : rel;
    manifest.push_back(' ');
    manifest += hash_fixture_file(p);
    manifest.push_back('\n');
  }
  return hash_domain("corpus:", manifest);
}

}  // namespace h5gate
