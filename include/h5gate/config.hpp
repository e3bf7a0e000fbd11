#pragma once

// h5gate/config.hpp — Harness configuration.
//
// A HarnessConfig is built once at startup (from_env + CLI overrides) and
// passed by const reference to every component that needs a path, a timeout
// or an external command. No component reads the environment on its own.
//
// ENVIRONMENT (all optional):
//   H5GATE_ROOT              repository root (default: current directory)
//   H5GATE_ALLOWLIST         allowlist JSON (default: <root>/data/html5lib_allowlists.json)
//   H5GATE_CORPUS            html5lib-tests checkout (default: <root>/html5lib-tests)
//   H5GATE_RUNNER            engine runner executable (default: <root>/.build/html5_runner)
//   H5GATE_BUILD_COMMAND     runner build command, space separated
//   H5GATE_RUNNER_TIMEOUT_S  per-batch wall-clock limit in seconds (default: 30)
//   H5GATE_GIT               git executable (default: git)
//   H5GATE_EVENT_LOG         append per-batch events as JSONL to this file

#include <cstdint>
#include <string>
#include <vector>

namespace h5gate {

struct HarnessConfig {
  std::string repo_root;
  std::string allowlist_path;
  std::string corpus_root;
  std::string runner_path;
  // argv of the runner build step; argv[0] is the program.
  std::vector<std::string> build_command;
  std::string build_source_dir;
  std::string build_source_ext{".kk"};
  std::uint64_t timeout_ms{30000};
  std::string git_command{"git"};
  std::size_t failure_preview_limit{50};
  std::size_t encoding_preview_limit{20};
  std::string event_log_path;

  std::string tokenizer_dir() const;
  std::string tree_dir() const;
  std::string encoding_dir() const;

  // allowlist_path relative to repo_root when it lies inside it, for
  // `git show <rev>:<path>` and for display.
  std::string allowlist_relpath() const;

  // Paths derived from root; env overrides applied. An empty root means the
  // current working directory (or H5GATE_ROOT when set).
  static HarnessConfig from_env(const std::string& root = "");
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

ConfigValidationResult validate_config(const HarnessConfig& config);

// Parses a positive number of seconds ("30", "2.5"). Returns 0 when invalid.
std::uint64_t parse_timeout_seconds(const std::string& text);

}  // namespace h5gate
