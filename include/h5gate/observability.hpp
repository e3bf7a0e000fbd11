#pragma once

// h5gate/observability.hpp — Per-batch events and run statistics.
//
// DESIGN:
//   BatchEvent is the observable unit: every engine submission produces exactly
//   one, successful or not. Events are folded into a RunStats owned by the
//   command being executed and, when HarnessConfig::event_log_path is set,
//   appended to that file as one compact JSON object per line.
//
//   Event content is metadata only (sizes, durations, error codes). Case
//   inputs and engine output never appear in the log.

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "h5gate/types.hpp"

namespace h5gate {

struct BatchEvent {
  std::string fixture;
  std::string mode;
  std::string engine;
  std::size_t case_count{0};
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::uint64_t duration_ns{0};
  std::size_t bytes_in{0};
  std::size_t bytes_out{0};
};

std::string batch_event_to_json(const BatchEvent& ev);

class RunStats {
 public:
  void record(const BatchEvent& ev);

  std::uint64_t batches() const { return batches_; }
  std::uint64_t failed_batches() const { return failed_batches_; }
  std::uint64_t cases_submitted() const { return cases_submitted_; }
  std::uint64_t total_duration_ns() const { return total_duration_ns_; }
  const std::map<ErrorCode, std::uint64_t>& failures_by_code() const { return failures_by_code_; }

  // "batches=N failed=N cases=N engine_ms=N"
  std::string summary_line() const;
  std::string to_json() const;

 private:
  std::uint64_t batches_{0};
  std::uint64_t failed_batches_{0};
  std::uint64_t cases_submitted_{0};
  std::uint64_t total_duration_ns_{0};
  std::map<ErrorCode, std::uint64_t> failures_by_code_;
};

// JSONL sink. An empty path disables writing; events are still counted.
class EventLog {
 public:
  explicit EventLog(std::string path) : path_(std::move(path)) {}

  void emit(const BatchEvent& ev);

  const RunStats& stats() const { return stats_; }
  bool enabled() const { return !path_.empty(); }

 private:
  std::string path_;
  RunStats stats_;
  bool write_failed_{false};
};

struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace h5gate
