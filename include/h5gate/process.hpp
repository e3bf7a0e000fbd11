#pragma once

// h5gate/process.hpp — Child process execution with a wall-clock deadline.
//
// Used for the three external programs the harness talks to: the engine
// runner (batch protocol on stdin, JSON on stdout), the runner's build step,
// and git (historical allowlist snapshots).
//
// SEMANTICS:
//   - command without '/' is resolved through PATH (execvp); otherwise it is
//     executed as given.
//   - stdin_text is written to the child's stdin, which is then closed. Writes
//     and reads are multiplexed with poll(), so a child that produces output
//     before consuming all of its input cannot deadlock the harness.
//   - The child runs in its own process group. On deadline expiry the whole
//     group is killed, the result is marked timed_out and exit_code is 124.
//   - exit_code is the child's exit status, or 128 + signal number.
//   - A fork/exec failure sets error_message; an exec failure in the child
//     surfaces as exit code 127.

#include <cstdint>
#include <string>
#include <vector>

namespace h5gate {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;
  // The child inherits the harness environment unchanged.
  std::string cwd;
  std::string stdin_text;
  std::uint64_t timeout_ms{30000};
  // 0 = unlimited.
  std::size_t max_output_bytes{0};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
  std::uint64_t duration_ns{0};

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace h5gate
