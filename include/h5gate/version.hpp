#pragma once

// h5gate/version.hpp — Version constants for every format the harness reads or
// writes.
//
// INVARIANT:
//   All constants are compile-time. The allowlist loader rejects any document
//   whose "version" differs from ALLOWLIST_FORMAT_VERSION; there is no
//   migration path and no silent acceptance of newer documents.

#include <cstdint>
#include <string>

namespace h5gate {
namespace version {

constexpr const char* H5GATE_SEMVER = "0.3.0";

// ---------------------------------------------------------------------------
// ALLOWLIST_FORMAT_VERSION
// Schema of data/html5lib_allowlists.json:
//   {version, tree:{doc:{fixture:[int]}, frag:{...}}, tokenizer:{fixture:[int]}}
// ---------------------------------------------------------------------------
constexpr std::uint32_t ALLOWLIST_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// BATCH_PROTOCOL_VERSION
// Request grammar written to the engine runner's stdin: count line, one
// tab-separated header per case, base64 payload lines.
// ---------------------------------------------------------------------------
constexpr std::uint32_t BATCH_PROTOCOL_VERSION = 1;

// Base64 payload line width. The runner's line reader is bounded; longer lines
// are rejected on its side.
constexpr std::size_t PAYLOAD_LINE_WIDTH = 900;

// Domain prefixes of hash.hpp.
constexpr std::uint32_t FINGERPRINT_VERSION = 1;

struct VersionManifest {
  std::string semver;
  std::uint32_t allowlist_format{ALLOWLIST_FORMAT_VERSION};
  std::uint32_t batch_protocol{BATCH_PROTOCOL_VERSION};
  std::uint32_t payload_line_width{static_cast<std::uint32_t>(PAYLOAD_LINE_WIDTH)};
  std::uint32_t fingerprint{FINGERPRINT_VERSION};
  std::string hash_primitive;
  std::string hash_version;
  std::string build_timestamp;
};

VersionManifest current_manifest();

// Compact JSON, keys sorted.
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string description;
};

// Checks an allowlist document's declared version.
CompatibilityResult check_allowlist_version(std::uint64_t declared);

}  // namespace version
}  // namespace h5gate
