#pragma once

// h5gate/types.hpp — Core vocabulary shared by every h5gate module.
//
// ERROR MODEL:
//   No exceptions cross module boundaries. Fallible operations return
//   Outcome<T>, which carries one of three dispositions:
//     ok     value is valid.
//     skip   this item cannot be processed, but the caller may continue with
//            the next one (e.g. an unsupported tokenizer initial state).
//     fatal  the enclosing unit of work (fixture, batch, document) is lost.
//
// SUITE KINDS:
//   The allowlist is keyed by SuiteKind. Its textual names ("tokenizer",
//   "tree-doc", "tree-frag") appear on the CLI and in report output and must
//   not change.

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace h5gate {

enum class ErrorCode {
  none,
  io_error,
  json_parse_error,
  json_duplicate_key,
  fixture_malformed,
  unsupported_state,
  allowlist_invalid,
  range_invalid,
  spawn_failed,
  timeout,
  runner_exit_nonzero,
  runner_output_invalid,
  runner_output_length,
  runner_missing,
  build_failed,
  history_unavailable,
  config_invalid,
};

std::string to_string(ErrorCode code);

enum class SuiteKind {
  tokenizer,
  tree_doc,
  tree_frag,
};

std::string to_string(SuiteKind kind);
std::optional<SuiteKind> parse_suite_kind(std::string_view name);

// Reporting order used by show/stats/diff-prev.
constexpr std::array<SuiteKind, 3> kAllSuiteKinds = {
    SuiteKind::tree_doc, SuiteKind::tree_frag, SuiteKind::tokenizer};

using CaseIndex = std::size_t;

enum class Disposition {
  ok,
  skip,
  fatal,
};

template <typename T>
struct Outcome {
  Disposition disposition{Disposition::fatal};
  T value{};
  ErrorCode error_code{ErrorCode::none};
  std::string detail;

  bool ok() const { return disposition == Disposition::ok; }
  bool skipped() const { return disposition == Disposition::skip; }
  bool fatal() const { return disposition == Disposition::fatal; }

  static Outcome success(T v) {
    Outcome o;
    o.disposition = Disposition::ok;
    o.value = std::move(v);
    return o;
  }
  static Outcome skip(ErrorCode code, std::string why) {
    Outcome o;
    o.disposition = Disposition::skip;
    o.error_code = code;
    o.detail = std::move(why);
    return o;
  }
  static Outcome failure(ErrorCode code, std::string why) {
    Outcome o;
    o.disposition = Disposition::fatal;
    o.error_code = code;
    o.detail = std::move(why);
    return o;
  }

  // Re-tag a non-ok outcome for a different value type, keeping its
  // disposition and diagnostics.
  template <typename U>
  Outcome<U> forward() const {
    Outcome<U> o;
    o.disposition = disposition;
    o.error_code = error_code;
    o.detail = detail;
    return o;
  }

  // "<error_code>: <detail>" for user-facing messages.
  std::string message() const {
    if (detail.empty()) return to_string(error_code);
    return to_string(error_code) + ": " + detail;
  }
};

}  // namespace h5gate
