#include "h5gate/version.hpp"

#include "h5gate/hash.hpp"
#include "h5gate/jsonlite.hpp"

namespace h5gate {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = H5GATE_SEMVER;
  const HashRuntimeInfo info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_version = info.version;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["allowlist_format"] = jsonlite::Value(static_cast<std::uint64_t>(m.allowlist_format));
  o["batch_protocol"] = jsonlite::Value(static_cast<std::uint64_t>(m.batch_protocol));
  o["payload_line_width"] = jsonlite::Value(static_cast<std::uint64_t>(m.payload_line_width));
  o["fingerprint"] = jsonlite::Value(static_cast<std::uint64_t>(m.fingerprint));
  o["semver"] = jsonlite::Value(m.semver);
  o["hash_primitive"] = jsonlite::Value(m.hash_primitive);
  o["hash_version"] = jsonlite::Value(m.hash_version);
  o["build_timestamp"] = jsonlite::Value(m.build_timestamp);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

CompatibilityResult check_allowlist_version(std::uint64_t declared) {
  CompatibilityResult r;
  if (declared != ALLOWLIST_FORMAT_VERSION) {
    r.ok = false;
    r.description = "unsupported allowlist version " + std::to_string(declared) +
                    " (expected " + std::to_string(ALLOWLIST_FORMAT_VERSION) + ")";
  }
  return r;
}

}  // namespace version
}  // namespace h5gate
