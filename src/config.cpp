#include "h5gate/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace h5gate {

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string word;
  while (iss >> word) out.push_back(word);
  return out;
}

}  // namespace

std::string HarnessConfig::tokenizer_dir() const {
  return (fs::path(corpus_root) / "tokenizer").string();
}

std::string HarnessConfig::tree_dir() const {
  return (fs::path(corpus_root) / "tree-construction").string();
}

std::string HarnessConfig::encoding_dir() const {
  return (fs::path(corpus_root) / "encoding").string();
}

std::string HarnessConfig::allowlist_relpath() const {
  std::error_code ec;
  const fs::path root = fs::weakly_canonical(fs::path(repo_root), ec);
  if (ec) return allowlist_path;
  const fs::path file = fs::weakly_canonical(fs::path(allowlist_path), ec);
  if (ec) return allowlist_path;
  const fs::path rel = file.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..") return file.string();
  return rel.generic_string();
}

std::uint64_t parse_timeout_seconds(const std::string& text) {
  if (text.empty()) return 0;
  char* end = nullptr;
  const double seconds = std::strtod(text.c_str(), &end);
  if (!end || *end != '\0' || !(seconds > 0.0)) return 0;
  return static_cast<std::uint64_t>(seconds * 1000.0 + 0.5);
}

HarnessConfig HarnessConfig::from_env(const std::string& root) {
  HarnessConfig c;
  std::string base = root.empty() ? env_or("H5GATE_ROOT", "") : root;
  if (base.empty()) {
    std::error_code ec;
    base = fs::current_path(ec).string();
    if (ec) base = ".";
  }
  c.repo_root = base;

  const fs::path r(base);
  c.allowlist_path = env_or("H5GATE_ALLOWLIST", (r / "data" / "html5lib_allowlists.json").string());
  c.corpus_root = env_or("H5GATE_CORPUS", (r / "html5lib-tests").string());
  c.runner_path = env_or("H5GATE_RUNNER", (r / ".build" / "html5_runner").string());
  c.build_source_dir = (r / "src").string();

  const std::string build = env_or("H5GATE_BUILD_COMMAND", "");
  if (!build.empty()) {
    c.build_command = split_words(build);
  } else {
    c.build_command = {"koka", "--include=src", "-O2", "-o", c.runner_path, "src/cli.kk"};
  }

  const std::string timeout = env_or("H5GATE_RUNNER_TIMEOUT_S", "");
  if (!timeout.empty()) {
    // An unparsable value yields 0 and is reported by validate_config.
    c.timeout_ms = parse_timeout_seconds(timeout);
  }

  c.git_command = env_or("H5GATE_GIT", "git");
  c.event_log_path = env_or("H5GATE_EVENT_LOG", "");
  return c;
}

ConfigValidationResult validate_config(const HarnessConfig& config) {
  ConfigValidationResult r;
  if (config.timeout_ms == 0) {
    r.errors.push_back("runner timeout must be a positive number of seconds");
  }
  if (config.runner_path.empty()) {
    r.errors.push_back("runner path is empty");
  }
  if (config.allowlist_path.empty()) {
    r.errors.push_back("allowlist path is empty");
  }
  if (config.git_command.empty()) {
    r.errors.push_back("git command is empty");
  }
  std::error_code ec;
  if (!fs::is_directory(config.corpus_root, ec)) {
    r.warnings.push_back("corpus directory not found: " + config.corpus_root);
  }
  r.ok = r.errors.empty();
  return r;
}

}  // namespace h5gate
