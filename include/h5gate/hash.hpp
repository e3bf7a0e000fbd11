#pragma once

// h5gate/hash.hpp — BLAKE3 fingerprints for allowlists and fixture corpora.
//
// Fingerprints let two coverage reports be tied to identical inputs. They are
// informational only; nothing in the harness gates on them.
//
// DOMAINS:
//   "allowlist:"  canonical (compact, key-sorted) allowlist JSON
//   "fixture:"    raw bytes of one fixture file
//   "corpus:"     newline-joined "<relpath> <fixture digest>" lines

#include <string>
#include <string_view>
#include <vector>

namespace h5gate {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

std::string hash_domain(std::string_view domain, std::string_view payload);

// Stream-hashes a file under the "fixture:" domain. Empty string when the file
// cannot be read.
std::string hash_fixture_file(const std::string& path);

std::string allowlist_fingerprint(std::string_view canonical_json);

// Digest over the given fixture paths, keyed by their path relative to base.
// Paths are sorted before hashing, so discovery order does not matter.
std::string corpus_fingerprint(const std::string& base, std::vector<std::string> paths);

}  // namespace h5gate
